#pragma once
#include <string>
#include <utility>

namespace arcnav {

enum class ErrorCode : int {
    None = 0,
    ValidationError,
    NotFound,
    NotADirectory,
    IsADirectory,
    StateConflict,
    InsufficientSpace,
    UnsafeMember,
    ExtractionFailure,
    IoError,
    ArchiveError,
};

const char* ErrorCodeName(ErrorCode code);

struct Result {
    bool ok{true};
    ErrorCode code{ErrorCode::None};
    int sys_errno{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorCode c, std::string m) {
        return {.ok = false, .code = c, .sys_errno = 0, .msg = std::move(m)};
    }
    static Result Fail(ErrorCode c, int e, std::string m) {
        return {.ok = false, .code = c, .sys_errno = e, .msg = std::move(m)};
    }
};

} // namespace arcnav
