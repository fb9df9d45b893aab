#pragma once

#include <optional>
#include <string>
#include <variant>

namespace rsim {

enum class ErrorCode {
    Generic,
    OutOfBounds,      // coordinate outside the grid
    UnknownAlgorithm, // unrecognized planner name
    InvalidArgument,
    IoError,
    ParseError,
    ScriptError,      // Lua config failed to load or run
};

inline const char* error_code_name(ErrorCode code);

struct Error {
    ErrorCode code = ErrorCode::Generic;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    /// "<CodeName>: message", for log lines.
    std::string describe() const {
        return std::string(error_code_name(code)) + ": " + message;
    }
};

/// Simple Result type: holds either a value of type T or an Error.
/// For void results, use Result<void>.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

/// Specialization for void results.
template <>
class Result<void> {
public:
    Result() : err_(std::nullopt) {}
    Result(Error err) : err_(std::move(err)) {}

    bool ok() const { return !err_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return err_.value(); }

private:
    std::optional<Error> err_;
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::Generic: return "Generic";
    case ErrorCode::OutOfBounds: return "OutOfBounds";
    case ErrorCode::UnknownAlgorithm: return "UnknownAlgorithm";
    case ErrorCode::InvalidArgument: return "InvalidArgument";
    case ErrorCode::IoError: return "IoError";
    case ErrorCode::ParseError: return "ParseError";
    case ErrorCode::ScriptError: return "ScriptError";
    }
    return "Unknown";
}

} // namespace rsim
