#pragma once

#include <stdexcept>
#include <string>

namespace kspver {

struct KspVerError {
    enum Code {
        BadVersion,
        Incomparable,
        Parse,
        IO,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    KspVerError() = default;
    KspVerError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    KspVerError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    KspVerError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

// Thrown only by the ordering operators, which cannot return a Result
class VersionException : public std::runtime_error {
public:
    explicit VersionException(KspVerError err)
        : std::runtime_error(err.format()), error_(std::move(err)) {}

    const KspVerError& error() const { return error_; }

private:
    KspVerError error_;
};

} // namespace kspver
