#include "uplink/errors.hpp"

namespace uplink {

const char *to_string(ErrorClass error_class) {
    switch (error_class) {
        case ErrorClass::Validation:
            return "validation";
        case ErrorClass::Authorization:
            return "authorization";
        case ErrorClass::TransientNetwork:
            return "transient_network";
        case ErrorClass::AuthRefresh:
            return "auth_refresh";
        case ErrorClass::NonRetryableClient:
            return "non_retryable_client";
        case ErrorClass::Offline:
            return "offline";
        case ErrorClass::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

UploadError::UploadError(ErrorClass error_class, const std::string &msg, int status)
    : std::runtime_error(msg), error_class(error_class), status_code(status) {
}

bool UploadError::retryable() const noexcept {
    return this->error_class == ErrorClass::TransientNetwork || this->error_class == ErrorClass::AuthRefresh;
}

ErrorClass classify_status(int status) {
    if (status == 401) {
        return ErrorClass::AuthRefresh;
    }
    if (status == 403) {
        return ErrorClass::Authorization;
    }
    if (status == 408 || status == 429 || status >= 500) {
        return ErrorClass::TransientNetwork;
    }
    return ErrorClass::NonRetryableClient;
}

void throw_for_status(int status, const std::string &msg) {
    switch (classify_status(status)) {
        case ErrorClass::AuthRefresh:
            throw AuthRefreshError(msg, status);
        case ErrorClass::Authorization:
            throw AuthorizationError(msg, status);
        case ErrorClass::TransientNetwork:
            throw TransientNetworkError(msg, status);
        default:
            throw NonRetryableClientError(msg, status);
    }
}

} // namespace uplink
