#include "storify/core/error.hpp"
#include "storify/core/constants.hpp"

#include <cerrno>
#include <cstring>

namespace storify {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::AlreadyExists: return "AlreadyExists";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::SizeLimitExceeded: return "SizeLimitExceeded";
        case ErrorKind::ConfigError: return "ConfigError";
        case ErrorKind::ProviderError: return "ProviderError";
        case ErrorKind::Interrupted: return "Interrupted";
    }
    return "Unknown";
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ProviderError: return 1;
        case ErrorKind::InvalidArgument: return 2;
        case ErrorKind::NotFound: return 3;
        case ErrorKind::PermissionDenied: return 4;
        case ErrorKind::AlreadyExists: return 5;
        case ErrorKind::SizeLimitExceeded: return 6;
        case ErrorKind::ConfigError: return 7;
        case ErrorKind::Interrupted: return constants::EXIT_INTERRUPTED;
    }
    return 1;
}

StorageError::StorageError(ErrorKind kind, const std::string& message, std::string subject)
    : std::runtime_error(message)
    , kind_(kind)
    , subject_(std::move(subject)) {}

std::string StorageError::describe() const {
    std::string out = std::string(error_kind_name(kind_)) + ": " + what();
    if (!subject_.empty()) {
        out += " (" + subject_ + ")";
    }
    return out;
}

ErrorKind error_kind_from_http_status(int status) {
    switch (status) {
        case 404:
            return ErrorKind::NotFound;
        case 401:
        case 403:
            return ErrorKind::PermissionDenied;
        case 409:
        case 412:
            return ErrorKind::AlreadyExists;
        case 400:
        case 416:
            return ErrorKind::InvalidArgument;
        case 413:
            return ErrorKind::SizeLimitExceeded;
        default:
            return ErrorKind::ProviderError;
    }
}

ErrorKind error_kind_from_errno(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return ErrorKind::NotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorKind::PermissionDenied;
        case EEXIST:
        case ENOTEMPTY:
            return ErrorKind::AlreadyExists;
        case EINVAL:
        case EISDIR:
        case ENAMETOOLONG:
            return ErrorKind::InvalidArgument;
        case EFBIG:
            return ErrorKind::SizeLimitExceeded;
        case EINTR:
            return ErrorKind::Interrupted;
        default:
            return ErrorKind::ProviderError;
    }
}

void throw_http_error(int status, const std::string& provider_code,
                      const std::string& transport_error,
                      const std::string& operation,
                      const std::string& path) {
    if (status == 0) {
        // Transport-level failure: no status from the server
        throw StorageError(ErrorKind::ProviderError,
                           operation + " failed: " +
                               (transport_error.empty() ? "network error" : transport_error),
                           path);
    }
    std::string message = operation + " failed: HTTP " + std::to_string(status);
    if (!provider_code.empty()) {
        message += " " + provider_code;
    }
    throw StorageError(error_kind_from_http_status(status), message, path);
}

void throw_errno_error(int err, const std::string& operation, const std::string& path) {
    throw StorageError(error_kind_from_errno(err),
                       operation + " failed: " + std::strerror(err), path);
}

} // namespace storify
