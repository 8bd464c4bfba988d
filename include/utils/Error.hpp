#pragma once
#include <string>
#include <utility>

namespace DryDock {

enum class ErrorCode {
    None,
    Initialization,
    PoolExhausted,
    NotInitialized,
    Fetch,
    Parse,
    Database,
    InvalidArgument,
    Assistant,
    Internal
};

const char* errorCodeName(ErrorCode code);

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool ok() const { return code == ErrorCode::None; }
    std::string describe() const;
};

// Value plus error. `value` is only meaningful when ok().
template <typename T>
struct Result {
    T value{};
    Error error;

    Result() = default;
    Result(T v) : value(std::move(v)) {}
    Result(Error e) : error(std::move(e)) {}

    bool ok() const { return error.ok(); }
};

}
