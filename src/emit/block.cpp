#include <scribe/emit.hpp>

namespace scribe {

Fragment block(const std::optional<std::string>& header,
               const Fragment& body,
               const std::string& unit) {
    CodeBuilder b;
    b.add_either(header.has_value(), header.value_or("") + " {", "{")
     .add(indent(body, unit))
     .add("}");
    return b.build();
}

Fragment block(const std::optional<std::string>& header,
               const std::function<void(CodeBuilder&)>& fill,
               const std::string& unit) {
    CodeBuilder body;
    fill(body);
    return block(header, body.build(), unit);
}

} // namespace scribe
