#ifndef QRDROP_BASE_ERROR_CODE_H
#define QRDROP_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace qrdrop {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    InvalidState = 1002,
    Cancelled = 1003,
    InternalError = 1004,

    // Network errors (2000-2999)
    ConnectionTimeout = 2001,
    ConnectionRefused = 2002,
    NoNetwork = 2003,
    ServerUnavailable = 2004,
    ProtocolError = 2005,

    // File system errors (3000-3999)
    InsufficientStorage = 3001,
    PermissionDenied = 3002,
    FileNotFound = 3003,
    CorruptedFile = 3004,

    // QR code errors (4000-4999)
    QrInvalidFormat = 4001,
    QrUnsupportedVersion = 4002,
    CameraPermissionDenied = 4003,
    CameraUnavailable = 4004,

    // Server errors (5000-5999)
    PortUnavailable = 5001,
    AuthenticationFailed = 5002,
    SessionExpired = 5003,

    // Permission errors (6000-6999)
    CameraPermission = 6001,
    StoragePermission = 6002,
    NetworkPermission = 6003
};

enum class ErrorKind {
    General,
    Network,
    FileSystem,
    QrFormat,
    ServerAuth,
    Permission
};

// What the user can do about an error
enum class RecoveryAction {
    None,
    Retry,
    GrantPermission,
    RestartFlow
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);
std::string to_string(ErrorKind kind);

ErrorKind kind_of(ErrorCode code);
bool is_retryable(ErrorCode code);
RecoveryAction recovery_action_for(ErrorCode code);
std::string default_user_message(ErrorCode code);

class QrDropError : public std::exception {
public:
    QrDropError(ErrorCode code, const std::string& message);
    QrDropError(ErrorCode code, const std::string& message, const std::string& user_message);

    ErrorCode code() const { return code_; }
    ErrorKind kind() const { return kind_of(code_); }
    bool retryable() const { return is_retryable(code_); }
    RecoveryAction recovery_action() const { return recovery_action_for(code_); }

    // Short text suitable for showing to the person operating the device
    const std::string& user_message() const { return user_message_; }
    const std::string& detail() const { return detail_; }

    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string detail_;
    std::string message_;
    std::string user_message_;
};

} // namespace qrdrop

namespace std {
template<>
struct is_error_code_enum<qrdrop::ErrorCode> : true_type {};
} // namespace std

#endif // QRDROP_BASE_ERROR_CODE_H
