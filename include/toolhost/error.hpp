#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolhost {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ParseError : public Error {
public:
    using Error::Error;
};

/// Raised by handlers (or internal code) to surface a specific protocol code.
class ProtocolError : public Error {
public:
    int code;
    std::optional<nlohmann::json> detail;

    ProtocolError(int code, const std::string& msg,
                  std::optional<nlohmann::json> detail = std::nullopt)
        : Error(msg), code(code), detail(std::move(detail)) {}
};

class TransportError : public Error {
public:
    using Error::Error;
};

class TimeoutError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

class DuplicateNameError : public Error {
public:
    using Error::Error;
};

class NotFoundError : public Error {
public:
    using Error::Error;
};

/// Thrown from a handler that observed its cancellation token.
class CancelledError : public Error {
public:
    using Error::Error;
};

struct FieldError {
    std::string field;
    std::string message;

    bool operator==(const FieldError& o) const {
        return field == o.field && message == o.message;
    }
};

class ValidationError : public Error {
public:
    explicit ValidationError(std::vector<FieldError> errors);

    const std::vector<FieldError>& errors() const noexcept { return errors_; }

private:
    std::vector<FieldError> errors_;
};

namespace error {
    constexpr int ParseError        = -32700;
    constexpr int InvalidRequest    = -32600;
    constexpr int MethodNotFound    = -32601;
    constexpr int InvalidParams     = -32602;
    constexpr int InternalError     = -32603;
    constexpr int ResourceExhausted = -32000;
    constexpr int RequestTimeout    = -32001;
    constexpr int ResourceNotFound  = -32002;
    constexpr int RequestCancelled  = -32800;

    /// Codes a client may retry after backing off.
    constexpr bool is_retryable(int code) noexcept {
        return code == ResourceExhausted || code == RequestTimeout;
    }
} // namespace error

} // namespace toolhost
