#pragma once

#include <string>

namespace lockscan {

struct ScanError {
    enum Code {
        IO,
        Parse,
        Format,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    ScanError() = default;
    ScanError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ScanError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    ScanError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Attach a source label (file path) to an error raised on in-memory text
    ScanError& in_file(const std::string& f) {
        file = f;
        return *this;
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace lockscan
