/**
 * @file result.hpp
 * @brief Result type for error handling
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef ONCALL_RESULT_HPP
#define ONCALL_RESULT_HPP

#include <string>
#include <variant>
#include <optional>
#include <sstream>
#include <type_traits>
#include <utility>

namespace oncall {

enum class ErrorCode {
    SUCCESS = 0,
    UNKNOWN_ERROR = 1, INVALID_ARGUMENT = 3, INTERNAL_ERROR = 4,
    MALFORMED_TIMESTAMP = 100, EMPTY_USER_SET = 101, NON_POSITIVE_INTERVAL = 102,
    INVALID_INTERVAL = 103, OVERLAPPING_OVERRIDES = 104,
    IO_ERROR = 200,
    CONFIG_INVALID = 400, CONFIG_MISSING = 401, CONFIG_PARSE_ERROR = 402,
    FIXTURE_MISMATCH = 500
};

inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::MALFORMED_TIMESTAMP: return "MALFORMED_TIMESTAMP";
        case ErrorCode::EMPTY_USER_SET: return "EMPTY_USER_SET";
        case ErrorCode::NON_POSITIVE_INTERVAL: return "NON_POSITIVE_INTERVAL";
        case ErrorCode::INVALID_INTERVAL: return "INVALID_INTERVAL";
        case ErrorCode::OVERLAPPING_OVERRIDES: return "OVERLAPPING_OVERRIDES";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::CONFIG_INVALID: return "CONFIG_INVALID";
        case ErrorCode::CONFIG_MISSING: return "CONFIG_MISSING";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::FIXTURE_MISMATCH: return "FIXTURE_MISMATCH";
        default: return "UNKNOWN(" + std::to_string(static_cast<int>(code)) + ")";
    }
}

inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
    return os << errorCodeToString(code);
}

struct Error {
    ErrorCode code = ErrorCode::UNKNOWN_ERROR;
    std::string message;
    std::string context;

    Error() = default;
    Error(ErrorCode c, std::string msg = "") : code(c), message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    [[nodiscard]] std::string toString() const {
        std::ostringstream oss;
        oss << "[" << errorCodeToString(code) << "]";
        if (!message.empty()) oss << " " << message;
        if (!context.empty()) oss << " (context: " << context << ")";
        return oss.str();
    }

    [[nodiscard]] bool is(ErrorCode c) const { return code == c; }
    // Errors raised by the schedule computation itself, as opposed to loading
    [[nodiscard]] bool isScheduleError() const {
        return static_cast<int>(code) >= 100 && static_cast<int>(code) < 200;
    }
};

template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const Error& err) : data_(err) {}
    Result(Error&& err) : data_(std::move(err)) {}
    Result(ErrorCode code, const std::string& msg = "") : data_(Error{code, msg}) {}

    [[nodiscard]] bool isOk() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool isError() const { return std::holds_alternative<Error>(data_); }
    [[nodiscard]] explicit operator bool() const { return isOk(); }

    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T valueOr(const T& defaultValue) const {
        return isOk() ? std::get<T>(data_) : defaultValue;
    }

    [[nodiscard]] const Error& error() const { return std::get<Error>(data_); }
    [[nodiscard]] ErrorCode errorCode() const {
        return isError() ? std::get<Error>(data_).code : ErrorCode::SUCCESS;
    }

    [[nodiscard]] const T* operator->() const { return &std::get<T>(data_); }
    [[nodiscard]] T* operator->() { return &std::get<T>(data_); }
    [[nodiscard]] const T& operator*() const& { return std::get<T>(data_); }
    [[nodiscard]] T& operator*() & { return std::get<T>(data_); }

    [[nodiscard]] Result withContext(const std::string& ctx) const {
        if (isError()) {
            Error err = std::get<Error>(data_);
            err.context = err.context.empty() ? ctx : ctx + ": " + err.context;
            return Result(err);
        }
        return *this;
    }

private:
    std::variant<T, Error> data_;
};

template<>
class Result<void> {
public:
    Result() : error_(std::nullopt) {}
    Result(const Error& err) : error_(err) {}
    Result(Error&& err) : error_(std::move(err)) {}
    Result(ErrorCode code, const std::string& msg = "") : error_(Error{code, msg}) {}

    [[nodiscard]] bool isOk() const { return !error_.has_value(); }
    [[nodiscard]] bool isError() const { return error_.has_value(); }
    [[nodiscard]] explicit operator bool() const { return isOk(); }

    [[nodiscard]] const Error& error() const { return *error_; }
    [[nodiscard]] ErrorCode errorCode() const {
        return isError() ? error_->code : ErrorCode::SUCCESS;
    }

private:
    std::optional<Error> error_;
};

// Helper functions
template<typename T>
Result<std::decay_t<T>> Ok(T&& value) { return Result<std::decay_t<T>>(std::forward<T>(value)); }

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<T> Err(ErrorCode code, const std::string& msg = "") {
    return Result<T>(code, msg);
}

template<typename T>
Result<T> Err(const Error& err) { return Result<T>(err); }

inline Result<void> Err(ErrorCode code, const std::string& msg = "") {
    return Result<void>(code, msg);
}

} // namespace oncall

#endif // ONCALL_RESULT_HPP
