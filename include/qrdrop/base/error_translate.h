#ifndef QRDROP_BASE_ERROR_TRANSLATE_H
#define QRDROP_BASE_ERROR_TRANSLATE_H

#include "qrdrop/base/error_code.h"
#include <filesystem>
#include <string>

namespace qrdrop {

// Boundary translation from platform failures into QrDropError.
// Each returns the error instead of throwing it so callers write `throw from_errno(...)`.

ErrorCode code_from_errno(int err, ErrorCode fallback);
QrDropError from_errno(int err, const std::string& context,
                       ErrorCode fallback = ErrorCode::ServerUnavailable);
QrDropError from_filesystem_error(const std::filesystem::filesystem_error& e);
QrDropError from_http_status(int status, const std::string& context);

} // namespace qrdrop

#endif // QRDROP_BASE_ERROR_TRANSLATE_H
