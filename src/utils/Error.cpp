#include "utils/Error.hpp"

namespace DryDock {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::Initialization: return "InitializationError";
        case ErrorCode::PoolExhausted: return "PoolExhausted";
        case ErrorCode::NotInitialized: return "NotInitialized";
        case ErrorCode::Fetch: return "FetchError";
        case ErrorCode::Parse: return "ParseError";
        case ErrorCode::Database: return "DatabaseError";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::Assistant: return "AssistantError";
        case ErrorCode::Internal: return "InternalError";
    }
    return "Unknown";
}

std::string Error::describe() const {
    if (ok()) return "ok";
    return std::string(errorCodeName(code)) + ": " + message;
}

}
