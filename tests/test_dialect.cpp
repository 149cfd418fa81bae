#include <catch2/catch.hpp>
#include <scribe/dialect.hpp>
#include <scribe/emit.hpp>
#include <cstdlib>

using namespace scribe;

// Resolve fixture paths relative to the source tree.
static std::string fixture_dir() {
    const char* src = std::getenv("SCRIBE_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

// ===== Sanitize =====

TEST_CASE("swift dialect escapes repeat and internal", "[dialect]") {
    auto d = Dialect::swift();
    REQUIRE(d.sanitize("repeat") == "`repeat`");
    REQUIRE(d.sanitize("internal") == "`internal`");
}

TEST_CASE("non-reserved identifiers are unchanged", "[dialect]") {
    auto d = Dialect::swift();
    REQUIRE(d.sanitize("foo") == "foo");
    REQUIRE(d.sanitize("Repeat") == "Repeat");
    REQUIRE(d.sanitize("repeated") == "repeated");
    REQUIRE(d.sanitize("") == "");
}

TEST_CASE("default dialect is swift", "[dialect]") {
    Dialect d;
    REQUIRE(d.name == "swift");
    REQUIRE(d.indent_unit == default_indent_unit);
    REQUIRE(d.reserved_words.size() == 2);
    REQUIRE(d.is_reserved("repeat"));
    REQUIRE_FALSE(d.is_reserved("func"));
}

TEST_CASE("custom escape delimiters", "[dialect]") {
    Dialect d;
    d.escape_open = "@\"";
    d.escape_close = "\"";
    d.reserved_words = {"class"};
    REQUIRE(d.sanitize("class") == "@\"class\"");
    REQUIRE(d.sanitize("repeat") == "repeat");
}

// ===== Parsing =====

TEST_CASE("parse empty document keeps swift defaults", "[dialect]") {
    auto r = Dialect::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().name == "swift");
    REQUIRE(r.value().sanitize("repeat") == "`repeat`");
    REQUIRE_FALSE(r.value().reserved_set);
}

TEST_CASE("empty escape delimiter is rejected", "[dialect]") {
    auto r = Dialect::parse(R"(
[dialect]
name = "csharp"
indent = "\t"
escape-open = "@"
escape-close = ""
reserved = ["class", "internal"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::Config);
}

TEST_CASE("parse dialect with separate delimiters", "[dialect]") {
    auto r = Dialect::parse(R"(
[dialect]
name = "sql"
indent = "\t"
escape-open = "["
escape-close = "]"
reserved = ["select", "order"]
)");
    REQUIRE(r.is_ok());
    const auto& d = r.value();
    REQUIRE(d.name == "sql");
    REQUIRE(d.indent_unit == "\t");
    REQUIRE(d.sanitize("order") == "[order]");
    REQUIRE(d.sanitize("repeat") == "repeat");
}

TEST_CASE("escape-open overrides escape", "[dialect]") {
    auto r = Dialect::parse(R"(
[dialect]
escape = "`"
escape-open = "<"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().sanitize("repeat") == "<repeat`");
}

TEST_CASE("extra-reserved extends the default set", "[dialect]") {
    auto r = Dialect::parse(R"(
[dialect]
extra-reserved = ["func", "protocol"]
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_reserved("repeat"));
    REQUIRE(r.value().is_reserved("func"));
    REQUIRE(r.value().sanitize("protocol") == "`protocol`");
}

TEST_CASE("parse invalid TOML dialect", "[dialect]") {
    auto r = Dialect::parse("[dialect\nname = ");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::Parse);
}

TEST_CASE("indent unit with a newline is rejected", "[dialect]") {
    auto r = Dialect::parse(R"(
[dialect]
indent = "  \n"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::Config);
}

TEST_CASE("empty indent unit is rejected", "[dialect]") {
    auto r = Dialect::parse("[dialect]\nindent = \"\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::Config);
}

TEST_CASE("reserved must be an array of non-empty strings", "[dialect]") {
    auto wrong_type = Dialect::parse("[dialect]\nreserved = \"repeat\"\n");
    REQUIRE(wrong_type.is_err());
    REQUIRE(wrong_type.error().code == ScribeError::Config);

    auto mixed = Dialect::parse("[dialect]\nreserved = [\"a\", 1]\n");
    REQUIRE(mixed.is_err());

    auto blank = Dialect::parse("[dialect]\nreserved = [\"\"]\n");
    REQUIRE(blank.is_err());
}

TEST_CASE("dialect must be a table", "[dialect]") {
    auto r = Dialect::parse("dialect = \"swift\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::Config);
}

// ===== Loading =====

TEST_CASE("load dialect from file", "[dialect]") {
    auto r = Dialect::load(fixture_dir() + "/kotlin.toml");
    REQUIRE(r.is_ok());
    const auto& d = r.value();
    REQUIRE(d.name == "kotlin");
    REQUIRE(d.sanitize("fun") == "`fun`");
    REQUIRE(d.sanitize("repeat") == "repeat");
    REQUIRE(block("class A", "val x = 1", d.indent_unit) ==
            "class A {\n  val x = 1\n}");
}

TEST_CASE("load missing dialect file", "[dialect]") {
    auto r = Dialect::load(fixture_dir() + "/does_not_exist.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::IO);
    REQUIRE(r.error().file.find("does_not_exist.toml") != std::string::npos);
}

TEST_CASE("load rejects a directory", "[dialect]") {
    auto r = Dialect::load(fixture_dir());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::IO);
    REQUIRE(r.error().file == fixture_dir());
}

TEST_CASE("load reports the file on config errors", "[dialect]") {
    auto r = Dialect::load(fixture_dir() + "/bad_indent.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::Config);
    REQUIRE(r.error().file.find("bad_indent.toml") != std::string::npos);
    REQUIRE(r.error().format().find("bad_indent.toml") != std::string::npos);
}

// ===== Merge =====

TEST_CASE("merge overrides only explicitly-set fields", "[dialect]") {
    auto base = Dialect::parse(R"(
[dialect]
name = "base"
indent = "\t"
)").value();
    auto top = Dialect::parse(R"(
[dialect]
name = "top"
)").value();

    base.merge(top);
    REQUIRE(base.name == "top");
    REQUIRE(base.indent_unit == "\t");
    REQUIRE(base.escape_open == "`");
}

TEST_CASE("merge replaces reserved words when set", "[dialect]") {
    Dialect d;
    auto top = Dialect::parse("[dialect]\nreserved = [\"when\"]\n").value();
    d.merge(top);
    REQUIRE(d.is_reserved("when"));
    REQUIRE_FALSE(d.is_reserved("repeat"));
}

TEST_CASE("merge with extra-reserved extends the inherited set", "[dialect]") {
    auto base = Dialect::parse("[dialect]\nreserved = [\"when\"]\n").value();
    auto top = Dialect::parse("[dialect]\nextra-reserved = [\"is\"]\n").value();
    base.merge(top);
    REQUIRE(base.is_reserved("when"));
    REQUIRE(base.is_reserved("is"));
    REQUIRE_FALSE(base.is_reserved("repeat"));
}

TEST_CASE("merge of an empty layer changes nothing", "[dialect]") {
    auto d = Dialect::load(fixture_dir() + "/kotlin.toml").value();
    auto before = d.reserved_words;
    d.merge(Dialect::parse("").value());
    REQUIRE(d.name == "kotlin");
    REQUIRE(d.indent_unit == "  ");
    REQUIRE(d.reserved_words == before);
}
