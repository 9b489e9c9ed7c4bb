#include "Result.hpp"

namespace ossim {

const char* toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::NONE:
        return "ok";
    case ErrorCode::INVALID_ARGUMENT:
        return "invalid argument";
    case ErrorCode::INSUFFICIENT_MEMORY:
        return "insufficient memory";
    case ErrorCode::NOT_FOUND:
        return "not found";
    case ErrorCode::EMPTY_RESULT:
        return "empty result";
    case ErrorCode::ALREADY_EXISTS:
        return "already exists";
    }
    return "unknown error";
}

} // namespace ossim
