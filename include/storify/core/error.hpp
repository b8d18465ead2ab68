#pragma once

#include <stdexcept>
#include <string>

namespace storify {

/// Failure categories shared by every connector and command.
enum class ErrorKind {
    NotFound,
    PermissionDenied,
    AlreadyExists,
    InvalidArgument,
    SizeLimitExceeded,
    ConfigError,
    ProviderError,
    Interrupted,
};

const char* error_kind_name(ErrorKind kind);

/// Process exit code for an invocation that failed with `kind`.
int exit_code_for(ErrorKind kind);

/// The one exception type that leaves the storage and config layers.
///
/// `subject` is the offending path or profile name. Messages never carry
/// credentials; connectors build them from status codes and provider error
/// codes only.
class StorageError : public std::runtime_error {
public:
    StorageError(ErrorKind kind, const std::string& message, std::string subject = {});

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& subject() const noexcept { return subject_; }

    /// "NotFound: <message> (<subject>)"
    std::string describe() const;

private:
    ErrorKind kind_;
    std::string subject_;
};

/// Map an HTTP status from a provider into the taxonomy.
ErrorKind error_kind_from_http_status(int status);

/// Map an errno value from a local syscall into the taxonomy.
ErrorKind error_kind_from_errno(int err);

/// Throw the StorageError matching a failed HTTP exchange.
[[noreturn]] void throw_http_error(int status, const std::string& provider_code,
                                   const std::string& transport_error,
                                   const std::string& operation,
                                   const std::string& path);

/// Throw the StorageError matching a failed local syscall.
[[noreturn]] void throw_errno_error(int err, const std::string& operation,
                                    const std::string& path);

} // namespace storify
