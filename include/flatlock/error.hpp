#pragma once

#include <string>

namespace flatlock {

struct FlatlockError {
    enum Code {
        IO,
        Detection,
        Parse,
        Traversal,
        Manifest,
        Config,
        InvalidArg,
        NotFound
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    FlatlockError() = default;
    FlatlockError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    FlatlockError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    FlatlockError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);

    // Pipeline stage that produced the error ("detect", "parse", "resolve", ...)
    static const char* stage_name(Code c);
};

} // namespace flatlock
