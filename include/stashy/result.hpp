#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace stashy {

// Error codes for the snippet client
enum class ErrorCode {
    OK = 0,
    CONFIG_ERROR,       // Config file I/O or parse failure
    CREDENTIAL_ERROR,   // Secure storage store/retrieve/delete failure
    NOT_FOUND,          // HTTP 404, or no credential for a server
    AUTH_REQUIRED,      // Operation needs an authenticated session
    UNAUTHORIZED,       // HTTP 401 - token rejected by the server
    RATE_LIMITED,       // HTTP 429 - too many requests
    SERVER_ERROR,       // HTTP 5xx
    API_ERROR,          // Any other non-success HTTP status
    NETWORK_ERROR,      // Connection failures
    TIMEOUT,            // Request deadline exceeded
    INVALID_RESPONSE,   // Malformed response body
    VALIDATION_ERROR,   // Missing or invalid input before submission
    IO_ERROR,           // Local file write failure
    INTERNAL_ERROR
};

// Error with code, message and optional HTTP details
class Error {
public:
    Error() : code_(ErrorCode::OK) {}
    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }

    // HTTP status of the failed response, if any
    std::optional<long> http_status() const { return http_status_; }
    // Raw response body of the failed response
    const std::string& body() const { return body_; }
    // Retry hint from a 429 response, verbatim
    const std::optional<std::string>& retry_after() const { return retry_after_; }
    // Last page fetched before a multi-page listing failed (0 = none)
    const std::optional<uint32_t>& last_page() const { return last_page_; }

    Error& with_status(long status) {
        http_status_ = status;
        return *this;
    }
    Error& with_body(std::string body) {
        body_ = std::move(body);
        return *this;
    }
    Error& with_retry_after(std::string hint) {
        retry_after_ = std::move(hint);
        return *this;
    }
    Error& with_last_page(uint32_t page) {
        last_page_ = page;
        return *this;
    }

    bool is_network() const {
        return code_ == ErrorCode::NETWORK_ERROR || code_ == ErrorCode::TIMEOUT;
    }

    std::string to_string() const {
        std::string out = error_code_name(code_);
        if (http_status_) {
            out += " (HTTP " + std::to_string(*http_status_) + ")";
        }
        if (!message_.empty()) {
            out += ": " + message_;
        }
        return out;
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::CONFIG_ERROR: return "CONFIG_ERROR";
            case ErrorCode::CREDENTIAL_ERROR: return "CREDENTIAL_ERROR";
            case ErrorCode::NOT_FOUND: return "NOT_FOUND";
            case ErrorCode::AUTH_REQUIRED: return "AUTH_REQUIRED";
            case ErrorCode::UNAUTHORIZED: return "UNAUTHORIZED";
            case ErrorCode::RATE_LIMITED: return "RATE_LIMITED";
            case ErrorCode::SERVER_ERROR: return "SERVER_ERROR";
            case ErrorCode::API_ERROR: return "API_ERROR";
            case ErrorCode::NETWORK_ERROR: return "NETWORK_ERROR";
            case ErrorCode::TIMEOUT: return "TIMEOUT";
            case ErrorCode::INVALID_RESPONSE: return "INVALID_RESPONSE";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::VALIDATION_ERROR: return "VALIDATION_ERROR";
            case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
            default: return "UNKNOWN";
        }
    }

private:
    ErrorCode code_;
    std::string message_;
    std::optional<long> http_status_;
    std::string body_;
    std::optional<std::string> retry_after_;
    std::optional<uint32_t> last_page_;
};

// Result type for operations that can fail
// Similar to Rust's Result<T, E> or C++23's std::expected
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::move(value)) {}

    // Error constructors
    Result(Error error) : data_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : data_(Error(code, std::move(message))) {}

    // Check if result is successful
    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() & {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::move(std::get<T>(data_));
    }

    // Access value with default
    T value_or(T default_value) const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return default_value;
    }

    // Access error (throws if success)
    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result has no error");
        }
        return std::get<Error>(data_);
    }

    ErrorCode error_code() const {
        if (ok()) {
            return ErrorCode::OK;
        }
        return error().code();
    }

    // Pointer-like access
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

private:
    std::variant<T, Error> data_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() : error_() {}
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : error_(Error(code, std::move(message))) {}

    bool ok() const { return error_.ok(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code(); }

    void value() const {
        if (!ok()) {
            throw std::runtime_error(error_.to_string());
        }
    }

private:
    Error error_;
};

// Helper for creating successful void results
inline Result<void> Ok() { return Result<void>(); }

// Helper for creating errors
inline Error Err(ErrorCode code, std::string message = "") {
    return Error(code, std::move(message));
}

}  // namespace stashy
