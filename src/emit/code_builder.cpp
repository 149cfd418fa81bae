#include <scribe/emit.hpp>

namespace scribe {

CodeBuilder& CodeBuilder::add(Fragment fragment) {
    parts_.push_back(std::move(fragment));
    return *this;
}

CodeBuilder& CodeBuilder::add_if(bool condition, Fragment fragment) {
    if (condition) parts_.push_back(std::move(fragment));
    return *this;
}

CodeBuilder& CodeBuilder::add_either(bool condition, Fragment first,
                                     Fragment second) {
    parts_.push_back(condition ? std::move(first) : std::move(second));
    return *this;
}

CodeBuilder& CodeBuilder::add_each(const std::vector<Fragment>& fragments) {
    parts_.insert(parts_.end(), fragments.begin(), fragments.end());
    return *this;
}

Fragment CodeBuilder::build() const {
    Fragment out;
    for (size_t i = 0; i < parts_.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out += parts_[i];
    }
    return out;
}

} // namespace scribe
