// demo_emit.cpp
//
// A small standalone program that drives the emission core end to end: it
// names a handful of interface entries, escapes reserved words and lays the
// result out as nested blocks.  Run it with:
//
//     ./demo_emit                        # built-in Swift dialect
//     ./demo_emit my_dialect.toml        # dialect loaded from TOML
//     ./demo_emit missing.toml           # bad path -> IO error
//
// The generated text goes to stdout, log records and errors to stderr.

#include <scribe/case.hpp>
#include <scribe/dialect.hpp>
#include <scribe/emit.hpp>
#include <scribe/log.hpp>
#include <scribe/result.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace scribe;

// ---------------------------------------------------------------------------
// Hard-coded slice of an interface description
// ---------------------------------------------------------------------------

struct EnumEntry {
    std::string name;
    int value;
};

struct Field {
    std::string name;
    std::string type;
    bool optional;
};

static const std::vector<EnumEntry> kAddressModes = {
    {"repeat", 0},
    {"mirror repeat", 1},
    {"clamp to edge", 2},
};

static const std::vector<Field> kSamplerFields = {
    {"address mode u", "AddressMode", false},
    {"lod min clamp", "Float", false},
    {"internal", "Bool", false},
    {"label", "String", true},
};

// ---------------------------------------------------------------------------
// Emission
// ---------------------------------------------------------------------------

static Result<Fragment> emit_enum(const Dialect& d, const std::string& name,
                                  const std::vector<EnumEntry>& entries) {
    auto type_name = to_pascal_case(name);
    if (type_name.is_err()) return std::move(type_name).error();

    CodeBuilder cases;
    for (const auto& e : entries) {
        auto id = to_camel_case(e.name);
        if (id.is_err()) return std::move(id).error();
        cases.add("case " + d.sanitize(id.value()) + " = " +
                  std::to_string(e.value));
    }

    return Result<Fragment>::ok(
        block("public enum " + type_name.value() + ": UInt32",
              cases.build(), d.indent_unit));
}

static Result<Fragment> emit_struct(const Dialect& d, const std::string& name,
                                    const std::vector<Field>& fields) {
    auto type_name = to_pascal_case(name);
    if (type_name.is_err()) return std::move(type_name).error();

    std::vector<std::string> ids;
    for (const auto& f : fields) {
        auto id = to_camel_case(f.name);
        if (id.is_err()) return std::move(id).error();
        ids.push_back(d.sanitize(id.value()));
    }

    auto init = block("public init()", [&](CodeBuilder& b) {
        for (size_t i = 0; i < fields.size(); ++i) {
            b.add_either(fields[i].optional,
                         "self." + ids[i] + " = nil",
                         "self." + ids[i] + " = " + fields[i].type + "()");
        }
    }, d.indent_unit);

    return Result<Fragment>::ok(
        block("public struct " + type_name.value(), [&](CodeBuilder& b) {
            for (size_t i = 0; i < fields.size(); ++i) {
                b.add("public var " + ids[i] + ": " + fields[i].type +
                      (fields[i].optional ? "?" : ""));
            }
            b.add("")
             .add(init);
        }, d.indent_unit));
}

int main(int argc, char** argv) {
    log::set_level(log::Debug);

    Dialect dialect = Dialect::swift();
    if (argc >= 2) {
        auto loaded = Dialect::load(argv[1]);
        if (loaded.is_err()) {
            log::error("%s", loaded.error().format().c_str());
            return 1;
        }
        dialect.merge(loaded.value());
    }

    auto address_mode = emit_enum(dialect, "address mode", kAddressModes);
    if (address_mode.is_err()) {
        log::error("%s", address_mode.error().format().c_str());
        return 1;
    }

    auto sampler = emit_struct(dialect, "sampler descriptor", kSamplerFields);
    if (sampler.is_err()) {
        log::error("%s", sampler.error().format().c_str());
        return 1;
    }

    // A deliberately malformed phrase, to show the precondition error
    auto bad = to_camel_case("trailing space ");
    if (bad.is_err()) {
        log::warn("%s", bad.error().format().c_str());
    }

    CodeBuilder file;
    file.add("// Generated by scribe. Do not edit.")
        .add("")
        .add(address_mode.value())
        .add("")
        .add(sampler.value());
    std::cout << file.build() << "\n";

    log::info("emitted %zu enum cases and %zu fields with dialect '%s'",
              kAddressModes.size(), kSamplerFields.size(),
              dialect.name.c_str());
    return 0;
}
