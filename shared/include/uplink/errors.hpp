#pragma once

#include <stdexcept>
#include <string>

namespace uplink {

enum class ErrorClass {
    Validation,
    Authorization,      // authorization rejected, never retried
    TransientNetwork,   // timeout, reset, dns, 5xx, 429
    AuthRefresh,        // expired/invalid token, re-authorize then retry
    NonRetryableClient, // bad request, not found, too large, unsupported type
    Offline,
    Cancelled
};

const char *to_string(ErrorClass error_class);

// every error carries "code: Message" in what(), like the rest of the wire protocol
class UploadError : public std::runtime_error {
public:
    UploadError(ErrorClass error_class, const std::string &msg, int status = 0);

    ErrorClass errorClass() const noexcept { return error_class; }
    int status() const noexcept { return status_code; }
    bool retryable() const noexcept;

private:
    ErrorClass error_class;
    int status_code;
};

class ValidationError : public UploadError {
public:
    explicit ValidationError(const std::string &msg) : UploadError(ErrorClass::Validation, msg) {}
};

class AuthorizationError : public UploadError {
public:
    explicit AuthorizationError(const std::string &msg, int status = 403) : UploadError(ErrorClass::Authorization, msg, status) {}
};

class TransientNetworkError : public UploadError {
public:
    explicit TransientNetworkError(const std::string &msg, int status = 0) : UploadError(ErrorClass::TransientNetwork, msg, status) {}
};

class AuthRefreshError : public UploadError {
public:
    explicit AuthRefreshError(const std::string &msg, int status = 401) : UploadError(ErrorClass::AuthRefresh, msg, status) {}
};

class NonRetryableClientError : public UploadError {
public:
    explicit NonRetryableClientError(const std::string &msg, int status = 400) : UploadError(ErrorClass::NonRetryableClient, msg, status) {}
};

class OfflineError : public UploadError {
public:
    explicit OfflineError(const std::string &msg = "offline: Network is offline") : UploadError(ErrorClass::Offline, msg) {}
};

class CancelledError : public UploadError {
public:
    explicit CancelledError(const std::string &msg = "aborted: Upload aborted") : UploadError(ErrorClass::Cancelled, msg) {}
};

// maps an HTTP-equivalent status code to its error class; only meaningful for status >= 400
ErrorClass classify_status(int status);

// throws the UploadError subclass matching the status
[[noreturn]] void throw_for_status(int status, const std::string &msg);

} // namespace uplink
