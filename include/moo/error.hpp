#pragma once

#include <string>
#include <system_error>

namespace moo {

struct MooError {
    enum Code {
        IO,
        Parse,
        Config,
        Manifest,
        NotFound,
        InvalidArg,
        Command,
        Process
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    MooError() = default;
    MooError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    MooError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    MooError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

// IO error naming the failed action and path, with the system reason appended
MooError io_error(const std::string& action, const std::string& path,
                  const std::error_code& ec);

} // namespace moo
