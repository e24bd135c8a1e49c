#include "errors.h"

std::string error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIGURATION:       return "configuration";
        case ErrorKind::CONNECTIVITY:        return "connectivity";
        case ErrorKind::TIMEOUT:             return "timeout";
        case ErrorKind::UPSTREAM_AUTH:       return "upstream_auth";
        case ErrorKind::UPSTREAM_RATE_LIMIT: return "upstream_rate_limit";
        case ErrorKind::UPSTREAM_SERVER:     return "upstream_server";
        case ErrorKind::UPSTREAM:            return "upstream";
        case ErrorKind::VALIDATION:          return "validation";
    }
    return "upstream";
}

bool is_retryable(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONNECTIVITY:
        case ErrorKind::TIMEOUT:
        case ErrorKind::UPSTREAM_RATE_LIMIT:
        case ErrorKind::UPSTREAM_SERVER:
        case ErrorKind::UPSTREAM:
            return true;
        case ErrorKind::CONFIGURATION:
        case ErrorKind::UPSTREAM_AUTH:
        case ErrorKind::VALIDATION:
            return false;
    }
    return false;
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIGURATION:       return 500;
        case ErrorKind::CONNECTIVITY:        return 502;
        case ErrorKind::TIMEOUT:             return 504;
        case ErrorKind::UPSTREAM_AUTH:       return 401;
        case ErrorKind::UPSTREAM_RATE_LIMIT: return 429;
        case ErrorKind::UPSTREAM_SERVER:     return 502;
        case ErrorKind::UPSTREAM:            return 500;
        case ErrorKind::VALIDATION:          return 422;
    }
    return 500;
}

void throw_for_http_status(long status, const std::string& message) {
    if (status == 401 || status == 403) {
        throw UpstreamAuthError(status, message);
    }
    if (status == 429) {
        throw UpstreamRateLimitError(status, message);
    }
    if (status >= 500) {
        throw UpstreamServerError(status, message);
    }
    throw UpstreamError(status, message);
}
