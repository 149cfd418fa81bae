#pragma once

#include <string>

namespace scribe {

struct ScribeError {
    enum Code {
        InvalidArg,
        Parse,
        Config,
        IO
    };

    Code code = InvalidArg;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    ScribeError() = default;
    ScribeError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ScribeError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    ScribeError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Renders "error[Code]: message" with optional hint and location lines
    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace scribe
