#include "qrdrop/base/error_code.h"

namespace qrdrop {

namespace {

class QrDropCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "qrdrop";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const QrDropCategory& get_category() {
    static QrDropCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::ConnectionTimeout: return "Connection timed out";
        case ErrorCode::ConnectionRefused: return "Connection refused";
        case ErrorCode::NoNetwork: return "No network";
        case ErrorCode::ServerUnavailable: return "Server unavailable";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::InsufficientStorage: return "Insufficient storage";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::CorruptedFile: return "Corrupted file";
        case ErrorCode::QrInvalidFormat: return "Invalid QR format";
        case ErrorCode::QrUnsupportedVersion: return "Unsupported QR version";
        case ErrorCode::CameraPermissionDenied: return "Camera permission denied";
        case ErrorCode::CameraUnavailable: return "Camera unavailable";
        case ErrorCode::PortUnavailable: return "Port unavailable";
        case ErrorCode::AuthenticationFailed: return "Authentication failed";
        case ErrorCode::SessionExpired: return "Session expired";
        case ErrorCode::CameraPermission: return "Camera permission required";
        case ErrorCode::StoragePermission: return "Storage permission required";
        case ErrorCode::NetworkPermission: return "Network permission required";
        default: return "Unknown error";
    }
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::General: return "general";
        case ErrorKind::Network: return "network";
        case ErrorKind::FileSystem: return "filesystem";
        case ErrorKind::QrFormat: return "qr";
        case ErrorKind::ServerAuth: return "server";
        case ErrorKind::Permission: return "permission";
        default: return "unknown";
    }
}

ErrorKind kind_of(ErrorCode code) {
    int value = static_cast<int>(code);
    if (value >= 2000 && value < 3000) return ErrorKind::Network;
    if (value >= 3000 && value < 4000) return ErrorKind::FileSystem;
    if (value >= 4000 && value < 5000) return ErrorKind::QrFormat;
    if (value >= 5000 && value < 6000) return ErrorKind::ServerAuth;
    if (value >= 6000 && value < 7000) return ErrorKind::Permission;
    return ErrorKind::General;
}

bool is_retryable(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionTimeout:
        case ErrorCode::ConnectionRefused:
        case ErrorCode::ServerUnavailable:
        case ErrorCode::ProtocolError:
        case ErrorCode::FileNotFound:
        case ErrorCode::CorruptedFile:
        case ErrorCode::QrInvalidFormat:
        case ErrorCode::QrUnsupportedVersion:
        case ErrorCode::CameraUnavailable:
        case ErrorCode::PortUnavailable:
        case ErrorCode::AuthenticationFailed:
            return true;
        default:
            return false;
    }
}

RecoveryAction recovery_action_for(ErrorCode code) {
    switch (kind_of(code)) {
        case ErrorKind::Permission:
            return RecoveryAction::GrantPermission;
        case ErrorKind::General:
            return RecoveryAction::None;
        default:
            break;
    }
    if (code == ErrorCode::CameraPermissionDenied || code == ErrorCode::PermissionDenied) {
        return RecoveryAction::GrantPermission;
    }
    if (code == ErrorCode::SessionExpired) {
        return RecoveryAction::RestartFlow;
    }
    return is_retryable(code) ? RecoveryAction::Retry : RecoveryAction::None;
}

std::string default_user_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionTimeout:
            return "Connection timed out. Please check your network and try again.";
        case ErrorCode::ConnectionRefused:
            return "Could not connect to the sender. Make sure both devices are on the same network.";
        case ErrorCode::NoNetwork:
            return "No network connection found. Please connect to Wi-Fi.";
        case ErrorCode::ServerUnavailable:
            return "The sender is not available. Ask them to share the file again.";
        case ErrorCode::ProtocolError:
            return "Unexpected response from the sender.";
        case ErrorCode::InsufficientStorage:
            return "Not enough storage space to save this file.";
        case ErrorCode::PermissionDenied:
            return "Permission denied while accessing the file.";
        case ErrorCode::FileNotFound:
            return "The file could not be found.";
        case ErrorCode::CorruptedFile:
            return "The received file is incomplete or corrupted.";
        case ErrorCode::QrInvalidFormat:
            return "This QR code is not a valid file share code.";
        case ErrorCode::QrUnsupportedVersion:
            return "This QR code was created by an incompatible version.";
        case ErrorCode::CameraPermissionDenied:
        case ErrorCode::CameraPermission:
            return "Camera access is required to scan QR codes.";
        case ErrorCode::CameraUnavailable:
            return "The camera is not available right now.";
        case ErrorCode::PortUnavailable:
            return "No free port is available to share the file.";
        case ErrorCode::AuthenticationFailed:
            return "The share code was rejected by the sender.";
        case ErrorCode::SessionExpired:
            return "This share has expired. Ask the sender for a new QR code.";
        case ErrorCode::StoragePermission:
            return "Storage access is required to save files.";
        case ErrorCode::NetworkPermission:
            return "Network access is required to transfer files.";
        case ErrorCode::Cancelled:
            return "The transfer was cancelled.";
        default:
            return "Something went wrong. Please try again.";
    }
}

QrDropError::QrDropError(ErrorCode code, const std::string& message)
    : QrDropError(code, message, default_user_message(code)) {}

QrDropError::QrDropError(ErrorCode code, const std::string& message, const std::string& user_message)
    : code_(code),
      detail_(message),
      message_(to_string(code) + ": " + message),
      user_message_(user_message) {}

const char* QrDropError::what() const noexcept {
    return message_.c_str();
}

} // namespace qrdrop
