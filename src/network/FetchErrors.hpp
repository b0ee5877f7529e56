#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace BioVerify {

enum class FetchErrorKind {
    NotFound,
    Blocked,
    HttpStatus,
    Network
};

// Stable category name used in failure responses ("not_found", "blocked", ...).
const char* ToString(FetchErrorKind kind);

class FetchError : public std::runtime_error {
public:
    FetchError(FetchErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    FetchErrorKind Kind() const noexcept { return kind_; }

private:
    FetchErrorKind kind_;
};

// Profile does not exist (HTTP 404).
class NotFoundError : public FetchError {
public:
    explicit NotFoundError(const std::string& username)
        : FetchError(FetchErrorKind::NotFound, "user @" + username + " not found") {}
};

// Request rejected by the platform, usually bot detection (HTTP 403).
class BlockedError : public FetchError {
public:
    BlockedError()
        : FetchError(FetchErrorKind::Blocked, "request blocked (403 Forbidden)") {}
};

class HttpStatusError : public FetchError {
public:
    HttpStatusError(long status, const std::string& status_text)
        : FetchError(FetchErrorKind::HttpStatus, "HTTP " + std::to_string(status) + ": " + status_text),
          status_(status), status_text_(status_text) {}

    long Status() const noexcept { return status_; }
    const std::string& StatusText() const noexcept { return status_text_; }

private:
    long status_;
    std::string status_text_;
};

// DNS, connection, TLS or timeout failure below HTTP.
class NetworkError : public FetchError {
public:
    explicit NetworkError(const std::string& cause)
        : FetchError(FetchErrorKind::Network, "network error: " + cause), cause_(cause) {}

    const std::string& Cause() const noexcept { return cause_; }

private:
    std::string cause_;
};

// Category for any exception reaching the request boundary; "internal"
// for everything that is not a FetchError.
std::string ErrorCategory(const std::exception& e);

}
