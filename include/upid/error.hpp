#pragma once

#include <string>

namespace upid {

struct UpidError {
    enum Code {
        InvalidInput,
        Parse,
        Config,
        IO,
        Database
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    UpidError() = default;
    UpidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    UpidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    UpidError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Codec and parsing failures all share the InvalidInput code; the cause
    // lives in message, the offending detail in hint.
    static UpidError invalid_input(std::string msg, std::string h = "") {
        return UpidError(InvalidInput, std::move(msg), std::move(h));
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace upid
