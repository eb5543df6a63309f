// include/signal_ngin/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace signal_ngin {

/**
 * @brief Error codes for the prediction engine
 * Covers both generic failures and the per-tick recoverable conditions
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    INVALID_DATA = 4,
    CONVERSION_ERROR = 5,

    // Pipeline conditions (recovered inside a tick)
    DATA_UNAVAILABLE = 6,
    INSUFFICIENT_HISTORY = 7,
    MODEL_UNAVAILABLE = 8,
    ENSEMBLE_UNRESOLVABLE = 9,
    RESOLUTION_GAP = 10,
    NUMERICAL_ERROR = 11,

    // System errors
    CONNECTION_ERROR = 12,
    TIMEOUT_ERROR = 13,
    API_ERROR = 14,

    // File and I/O errors
    FILE_NOT_FOUND = 15,
    FILE_IO_ERROR = 16,
    DUPLICATE_RECORD = 17,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 18,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Readable name for an error code, used in log lines
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::DATA_UNAVAILABLE:
            return "DATA_UNAVAILABLE";
        case ErrorCode::INSUFFICIENT_HISTORY:
            return "INSUFFICIENT_HISTORY";
        case ErrorCode::MODEL_UNAVAILABLE:
            return "MODEL_UNAVAILABLE";
        case ErrorCode::ENSEMBLE_UNRESOLVABLE:
            return "ENSEMBLE_UNRESOLVABLE";
        case ErrorCode::RESOLUTION_GAP:
            return "RESOLUTION_GAP";
        case ErrorCode::NUMERICAL_ERROR:
            return "NUMERICAL_ERROR";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::API_ERROR:
            return "API_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::DUPLICATE_RECORD:
            return "DUPLICATE_RECORD";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "CUSTOM_ERROR";
    }
}

/**
 * @brief Error raised or carried by engine components
 */
class EngineError : public std::runtime_error {
public:
    /**
     * @brief Constructor for EngineError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    EngineError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "[" + error_code_to_string(code_) + "] " + component_ + ": " + what();
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    /**
     * @brief Constructor for success case
     * @param value The successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<EngineError> error) : value_(), error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws EngineError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws EngineError if result represents an error
     */
    T take() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const EngineError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<EngineError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<EngineError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const EngineError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<EngineError> error_;
};

/**
 * @brief Helper for creating error results
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<EngineError>(code, message, component));
}

/**
 * @brief Re-wrap an error from one result type into another, keeping code and message
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& from, const std::string& component) {
    return make_error<T>(from.error()->code(), from.error()->what(), component);
}

}  // namespace signal_ngin
