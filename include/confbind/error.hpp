#pragma once

#include <string>

namespace confbind {

struct BindError {
    enum Code {
        IO,
        Parse,
        InvalidArg,
        Coercion,
        SourceRead,
        NotFound,
        MandatoryMissing,
        Help
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    BindError() = default;
    BindError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    BindError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    BindError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace confbind
