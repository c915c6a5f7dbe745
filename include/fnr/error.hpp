#pragma once

#include <string>
#include <utility>

namespace fnr {

struct FnrError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg,
        InvalidPattern,
        WalkWarning,
        InvalidName,
        Collision,
        RenameFailed
    };

    Code code;
    std::string message;
    std::string hint;
    std::string path;         // entry or file the error refers to
    std::string destination;  // rename target, RenameFailed/Collision only

    FnrError() = default;
    FnrError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    FnrError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    FnrError(Code c, std::string msg, std::string h, std::string p)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          path(std::move(p)) {}

    // RenameFailed{source, destination, cause}
    static FnrError rename_failed(const std::string& source,
                                  const std::string& dest,
                                  const std::string& cause);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace fnr
