#include <scribe/emit.hpp>

namespace scribe {

Fragment indent(const Fragment& text, const std::string& unit) {
    Fragment out;
    out.reserve(text.size() + unit.size());
    out += unit;
    for (char c : text) {
        out.push_back(c);
        if (c == '\n') out += unit;
    }
    return out;
}

} // namespace scribe
