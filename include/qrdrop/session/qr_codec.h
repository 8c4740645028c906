#ifndef QRDROP_SESSION_QR_CODEC_H
#define QRDROP_SESSION_QR_CODEC_H

#include "qrdrop/session/transfer_session.h"
#include <string>

namespace qrdrop {

// Versioned JSON payload carried by the QR code:
// {"version":"1.0","ip":...,"port":...,"token":...,"fileName":...,"fileSize":...,"sessionId":...}
class QrCodec {
public:
    static constexpr const char* kVersion = "1.0";

    // Throws QrDropError(InvalidArgument) when the session is not valid
    static std::string encode(const TransferSession& session);

    // Throws QrDropError(QrUnsupportedVersion) on a version mismatch and
    // QrDropError(QrInvalidFormat) for every other problem. The returned session
    // has an empty file_path and created_at set to the time of decoding.
    static TransferSession decode(const std::string& payload);

    // Non-empty, at least 16 characters, [a-zA-Z0-9] only
    static bool validate_security_token(const std::string& token);

    static std::string current_version() { return kVersion; }
};

} // namespace qrdrop

#endif // QRDROP_SESSION_QR_CODEC_H
