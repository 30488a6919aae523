#pragma once

#include <string>

namespace ferry {

struct FerryError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg,
        NotFound,
        UnresolvedSpecifier,
        UnmappedSpecifier,
        VersionNotFound,
        NotCached,
        IntegrityMismatch,
        UntrackedDependency,
        FetchTimeout,
        Network,
        Cancelled
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    FerryError() = default;
    FerryError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    FerryError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    FerryError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Integrity failures abort the whole run
    bool is_fatal() const { return code == IntegrityMismatch; }

    // Transport failures that may succeed on a second attempt
    bool is_retryable() const { return code == Network || code == FetchTimeout; }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace ferry
