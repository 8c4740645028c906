#include "qrdrop/base/error_translate.h"
#include <cerrno>
#include <cstring>

namespace qrdrop {

ErrorCode code_from_errno(int err, ErrorCode fallback) {
    switch (err) {
        case ECONNREFUSED:
        case ECONNRESET:
            return ErrorCode::ConnectionRefused;
        case ETIMEDOUT:
        case EAGAIN:
        case EINPROGRESS:
            return ErrorCode::ConnectionTimeout;
        case ENETUNREACH:
        case ENETDOWN:
            return ErrorCode::NoNetwork;
        case EHOSTUNREACH:
        case EPIPE:
            return ErrorCode::ServerUnavailable;
        case EADDRINUSE:
        case EADDRNOTAVAIL:
            return ErrorCode::PortUnavailable;
        case ENOSPC:
        case EDQUOT:
            return ErrorCode::InsufficientStorage;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        case ENOENT:
            return ErrorCode::FileNotFound;
        default:
            return fallback;
    }
}

QrDropError from_errno(int err, const std::string& context, ErrorCode fallback) {
    return QrDropError(code_from_errno(err, fallback),
                       context + " (" + std::strerror(err) + ")");
}

QrDropError from_filesystem_error(const std::filesystem::filesystem_error& e) {
    ErrorCode code = code_from_errno(e.code().value(), ErrorCode::InternalError);
    if (e.code().category() != std::generic_category() &&
        e.code().category() != std::system_category()) {
        code = ErrorCode::InternalError;
    }
    return QrDropError(code, e.what());
}

QrDropError from_http_status(int status, const std::string& context) {
    std::string message = context + " returned HTTP " + std::to_string(status);
    if (status == 401 || status == 403) {
        return QrDropError(ErrorCode::AuthenticationFailed, message);
    }
    if (status == 404 || status >= 500) {
        return QrDropError(ErrorCode::ServerUnavailable, message);
    }
    return QrDropError(ErrorCode::ProtocolError, message);
}

} // namespace qrdrop
