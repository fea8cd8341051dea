#include "util/result.hpp"

namespace arcnav {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:              return "ok";
        case ErrorCode::ValidationError:   return "validation error";
        case ErrorCode::NotFound:          return "not found";
        case ErrorCode::NotADirectory:     return "not a directory";
        case ErrorCode::IsADirectory:      return "is a directory";
        case ErrorCode::StateConflict:     return "state conflict";
        case ErrorCode::InsufficientSpace: return "insufficient space";
        case ErrorCode::UnsafeMember:      return "unsafe member";
        case ErrorCode::ExtractionFailure: return "extraction failure";
        case ErrorCode::IoError:           return "i/o error";
        case ErrorCode::ArchiveError:      return "archive error";
    }
    return "error";
}

} // namespace arcnav
