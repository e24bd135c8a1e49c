#pragma once

#include <string>
#include <stdexcept>

/// @brief Classified failure kinds shared by providers, orchestrator and dispatcher
enum class ErrorKind {
    CONFIGURATION,        // Missing credential at construction; never retried
    CONNECTIVITY,         // Connection refused / unreachable; retryable
    TIMEOUT,              // Deadline exceeded; retryable
    UPSTREAM_AUTH,        // 401/403 from the backend; surfaced immediately
    UPSTREAM_RATE_LIMIT,  // 429; retried with backoff
    UPSTREAM_SERVER,      // 5xx; retried with backoff
    UPSTREAM,             // Any other backend failure (malformed response, 4xx)
    VALIDATION            // Request rejected before reaching a provider
};

/// @brief Stable wire name for an error kind ("configuration", "timeout", ...)
std::string error_kind_name(ErrorKind kind);

/// @brief True for kinds the dispatcher retries with backoff
bool is_retryable(ErrorKind kind);

/// @brief HTTP status the responder uses when reporting a failure of this kind
int http_status_for(ErrorKind kind);

/// @brief Base class of every error raised by the core
class CourierError : public std::runtime_error {
public:
    CourierError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ConfigurationError : public CourierError {
public:
    explicit ConfigurationError(const std::string& message)
        : CourierError(ErrorKind::CONFIGURATION, message) {}
};

class ConnectivityError : public CourierError {
public:
    explicit ConnectivityError(const std::string& message)
        : CourierError(ErrorKind::CONNECTIVITY, message) {}
};

class TimeoutError : public CourierError {
public:
    explicit TimeoutError(const std::string& message)
        : CourierError(ErrorKind::TIMEOUT, message) {}
};

/// @brief Request rejected before it reached a provider
class ValidationError : public CourierError {
public:
    explicit ValidationError(const std::string& message)
        : CourierError(ErrorKind::VALIDATION, message) {}
};

/// @brief Backend answered, but with a failure (HTTP status or malformed body)
class UpstreamError : public CourierError {
public:
    UpstreamError(long status, const std::string& message)
        : CourierError(ErrorKind::UPSTREAM, message), status_(status) {}

    long status() const { return status_; }

protected:
    UpstreamError(ErrorKind kind, long status, const std::string& message)
        : CourierError(kind, message), status_(status) {}

private:
    long status_;
};

class UpstreamAuthError : public UpstreamError {
public:
    UpstreamAuthError(long status, const std::string& message)
        : UpstreamError(ErrorKind::UPSTREAM_AUTH, status, message) {}
};

class UpstreamRateLimitError : public UpstreamError {
public:
    UpstreamRateLimitError(long status, const std::string& message)
        : UpstreamError(ErrorKind::UPSTREAM_RATE_LIMIT, status, message) {}
};

class UpstreamServerError : public UpstreamError {
public:
    UpstreamServerError(long status, const std::string& message)
        : UpstreamError(ErrorKind::UPSTREAM_SERVER, status, message) {}
};

/// @brief Throw the UpstreamError subclass matching an HTTP status
/// 401/403 -> auth, 429 -> rate limit, 5xx -> server, anything else -> UpstreamError
[[noreturn]] void throw_for_http_status(long status, const std::string& message);
