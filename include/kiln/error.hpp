#pragma once

#include <string>

namespace kiln {

struct KilnError {
    enum Code {
        IO,
        Parse,
        Config,
        KeyGeneration,
        Database,
        NotFound,
        Duplicate,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    KilnError() = default;
    KilnError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    KilnError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    KilnError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace kiln
