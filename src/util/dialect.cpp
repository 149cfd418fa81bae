#include <scribe/dialect.hpp>
#include <scribe/log.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

namespace fs = std::filesystem;

namespace scribe {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Result<std::optional<std::string>> read_string(const toml::table& tbl,
                                                      const char* key) {
    const toml::node* node = tbl.get(key);
    if (!node) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    auto s = node->value<std::string>();
    if (!s) {
        return ScribeError{ScribeError::Config,
            std::string("dialect key '") + key + "' must be a string"};
    }
    return Result<std::optional<std::string>>::ok(std::move(*s));
}

static Result<std::optional<std::vector<std::string>>> read_words(
    const toml::table& tbl, const char* key)
{
    const toml::node* node = tbl.get(key);
    if (!node) {
        return Result<std::optional<std::vector<std::string>>>::ok(std::nullopt);
    }
    const toml::array* arr = node->as_array();
    if (!arr) {
        return ScribeError{ScribeError::Config,
            std::string("dialect key '") + key + "' must be an array of strings"};
    }

    std::vector<std::string> words;
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return ScribeError{ScribeError::Config,
                std::string("dialect key '") + key + "' must only contain strings"};
        }
        if (s->empty()) {
            return ScribeError{ScribeError::Config,
                std::string("dialect key '") + key + "' contains an empty word"};
        }
        words.push_back(std::move(*s));
    }
    return Result<std::optional<std::vector<std::string>>>::ok(std::move(words));
}

static Status validate(const Dialect& d) {
    if (d.indent_unit.empty()) {
        return ScribeError{ScribeError::Config,
            "dialect '" + d.name + "' has an empty indent unit"};
    }
    if (d.indent_unit.find('\n') != std::string::npos) {
        return ScribeError{ScribeError::Config,
            "dialect '" + d.name + "' indent unit contains a newline",
            "the indent unit prefixes a single line"};
    }
    if (d.escape_open.empty() || d.escape_close.empty()) {
        return ScribeError{ScribeError::Config,
            "dialect '" + d.name + "' has an empty escape delimiter"};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Dialect
// ---------------------------------------------------------------------------

Dialect Dialect::swift() {
    return Dialect{};
}

Result<Dialect> Dialect::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ScribeError{ScribeError::Parse,
            std::string("dialect TOML parse error: ") + e.what()};
    }

    Dialect d;

    const toml::node* section = doc.get("dialect");
    if (!section) {
        return Result<Dialect>::ok(std::move(d));
    }
    const toml::table* tbl = section->as_table();
    if (!tbl) {
        return ScribeError{ScribeError::Config, "[dialect] must be a table"};
    }

    auto name = read_string(*tbl, "name");
    if (name.is_err()) return std::move(name).error();
    if (name.value()) {
        d.name = *name.value();
        d.name_set = true;
    }

    auto indent = read_string(*tbl, "indent");
    if (indent.is_err()) return std::move(indent).error();
    if (indent.value()) {
        d.indent_unit = *indent.value();
        d.indent_set = true;
    }

    // escape sets both sides; escape-open / escape-close override it
    auto escape = read_string(*tbl, "escape");
    if (escape.is_err()) return std::move(escape).error();
    if (escape.value()) {
        d.escape_open = d.escape_close = *escape.value();
        d.escape_open_set = d.escape_close_set = true;
    }
    auto open = read_string(*tbl, "escape-open");
    if (open.is_err()) return std::move(open).error();
    if (open.value()) {
        d.escape_open = *open.value();
        d.escape_open_set = true;
    }
    auto close = read_string(*tbl, "escape-close");
    if (close.is_err()) return std::move(close).error();
    if (close.value()) {
        d.escape_close = *close.value();
        d.escape_close_set = true;
    }

    auto reserved = read_words(*tbl, "reserved");
    if (reserved.is_err()) return std::move(reserved).error();
    if (reserved.value()) {
        const auto& words = *reserved.value();
        d.reserved_words = std::set<std::string>(words.begin(), words.end());
        d.reserved_set = true;
    }

    auto extra = read_words(*tbl, "extra-reserved");
    if (extra.is_err()) return std::move(extra).error();
    if (extra.value()) {
        d.extra_reserved = *extra.value();
        d.reserved_words.insert(d.extra_reserved.begin(), d.extra_reserved.end());
    }

    SCRIBE_TRY(validate(d));
    return Result<Dialect>::ok(std::move(d));
}

Result<Dialect> Dialect::load(const std::string& path) {
    // A directory opens fine as an ifstream and reads as an empty document
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return ScribeError{ScribeError::IO,
            "dialect path is not a regular file: " + path, "", path, 0};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return ScribeError{ScribeError::IO,
            "cannot open dialect file: " + path, "", path, 0};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return ScribeError{ScribeError::IO,
            "cannot read dialect file: " + path, "", path, 0};
    }

    auto d = Dialect::parse(ss.str());
    if (d.is_err()) {
        auto err = std::move(d).error();
        err.file = path;
        return err;
    }

    log::debug("loaded dialect '%s' from %s (%zu reserved words)",
               d.value().name.c_str(), path.c_str(),
               d.value().reserved_words.size());
    return d;
}

void Dialect::merge(const Dialect& other) {
    if (other.name_set) {
        name = other.name;
        name_set = true;
    }
    if (other.indent_set) {
        indent_unit = other.indent_unit;
        indent_set = true;
    }
    if (other.escape_open_set) {
        escape_open = other.escape_open;
        escape_open_set = true;
    }
    if (other.escape_close_set) {
        escape_close = other.escape_close;
        escape_close_set = true;
    }

    // An explicit set replaces ours (it already carries its own extras)
    if (other.reserved_set) {
        reserved_words = other.reserved_words;
        reserved_set = true;
    } else {
        reserved_words.insert(other.extra_reserved.begin(),
                              other.extra_reserved.end());
    }
    extra_reserved.insert(extra_reserved.end(),
                          other.extra_reserved.begin(),
                          other.extra_reserved.end());

    log::debug("merged dialect layer, now '%s' with %zu reserved words",
               name.c_str(), reserved_words.size());
}

bool Dialect::is_reserved(const std::string& identifier) const {
    return reserved_words.count(identifier) > 0;
}

std::string Dialect::sanitize(const std::string& identifier) const {
    if (!is_reserved(identifier)) return identifier;
    return escape_open + identifier + escape_close;
}

} // namespace scribe
