#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace scribe {

// Zero or more lines of generated source, joined by '\n' with no trailing newline
using Fragment = std::string;

inline const std::string default_indent_unit = "    ";

// Prefix every line with one indent unit. Empty lines are indented too,
// so "a\n\nb" -> "    a\n    \n    b" and "" -> "    ".
Fragment indent(const Fragment& text,
                const std::string& unit = default_indent_unit);

// Accumulates sibling fragments in order and joins them with '\n'.
//
//     CodeBuilder b;
//     b.add("let x = 1")
//      .add_if(has_y, "let y = 2")
//      .add_each(fields, [](const Field& f) { return "var " + f.name; });
//     Fragment body = b.build();
//
// Skipped conditionals and empty collections contribute no line at all.
class CodeBuilder {
public:
    CodeBuilder& add(Fragment fragment);

    CodeBuilder& add_if(bool condition, Fragment fragment);

    // Exactly one of the two branches
    CodeBuilder& add_either(bool condition, Fragment first, Fragment second);

    CodeBuilder& add_each(const std::vector<Fragment>& fragments);

    template<typename Range, typename F>
    CodeBuilder& add_each(const Range& items, F&& fn) {
        for (const auto& item : items) {
            parts_.push_back(Fragment(fn(item)));
        }
        return *this;
    }

    Fragment build() const;

    size_t size() const { return parts_.size(); }
    bool empty() const { return parts_.empty(); }

private:
    std::vector<Fragment> parts_;
};

// "header {" (or "{"), the indented body, then "}"
Fragment block(const std::optional<std::string>& header,
               const Fragment& body,
               const std::string& unit = default_indent_unit);

// Same, with the body filled into a fresh CodeBuilder
Fragment block(const std::optional<std::string>& header,
               const std::function<void(CodeBuilder&)>& fill,
               const std::string& unit = default_indent_unit);

} // namespace scribe
