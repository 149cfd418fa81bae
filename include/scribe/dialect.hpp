#pragma once

#include <scribe/emit.hpp>
#include <scribe/result.hpp>
#include <set>
#include <string>
#include <vector>

namespace scribe {

// Per-target-language emission settings: indent unit, reserved words and
// the delimiters used to quote a reserved word as a plain identifier.
// Default-constructed values are the Swift dialect.
struct Dialect {
    std::string name = "swift";
    std::string indent_unit = default_indent_unit;
    std::string escape_open = "`";
    std::string escape_close = "`";
    std::set<std::string> reserved_words = {"repeat", "internal"};

    // Words from `extra-reserved`, appended to an inherited set on merge
    std::vector<std::string> extra_reserved;

    // Track which fields were explicitly set (for merge)
    bool name_set = false;
    bool indent_set = false;
    bool escape_open_set = false;
    bool escape_close_set = false;
    bool reserved_set = false;

    static Dialect swift();

    // Parse a [dialect] table from a TOML string; absent keys keep defaults
    static Result<Dialect> parse(const std::string& toml_str);

    static Result<Dialect> load(const std::string& path);

    // Layer other on top: explicitly-set fields win, extra-reserved extends
    void merge(const Dialect& other);

    bool is_reserved(const std::string& identifier) const;

    // `repeat` -> "`repeat`", anything not reserved is returned unchanged
    std::string sanitize(const std::string& identifier) const;
};

} // namespace scribe
