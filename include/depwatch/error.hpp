#pragma once

#include <string>

namespace depwatch {

struct DepwatchError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        InvalidInput,
        ScanFailure,
        Cycle
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    DepwatchError() = default;
    DepwatchError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    DepwatchError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    DepwatchError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace depwatch
