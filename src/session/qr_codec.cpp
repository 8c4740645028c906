#include "qrdrop/session/qr_codec.h"
#include "qrdrop/base/error_code.h"
#include "qrdrop/base/logger.h"
#include <nlohmann/json.hpp>
#include <regex>

using json = nlohmann::json;

namespace qrdrop {

namespace {

const char* const kRequiredFields[] = {
    "ip", "port", "token", "fileName", "fileSize", "sessionId"
};

[[noreturn]] void format_error(const std::string& message) {
    throw QrDropError(ErrorCode::QrInvalidFormat, message);
}

bool is_ipv4_shape(const std::string& ip) {
    static const std::regex pattern(R"(^\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}$)");
    return std::regex_match(ip, pattern);
}

void check_version(const json& data) {
    if (!data.contains("version")) {
        format_error("Missing version field in QR data");
    }
    const auto& version = data["version"];
    if (!version.is_string() || version.get<std::string>() != QrCodec::kVersion) {
        std::string shown = version.is_string() ? version.get<std::string>() : version.dump();
        throw QrDropError(ErrorCode::QrUnsupportedVersion,
                          "Unsupported QR data version: " + shown +
                          ". Expected: " + QrCodec::kVersion);
    }
}

void check_fields(const json& data) {
    for (const char* field : kRequiredFields) {
        if (!data.contains(field) || data[field].is_null()) {
            format_error(std::string("Missing required field: ") + field);
        }
    }

    const auto& ip = data["ip"];
    if (!ip.is_string() || ip.get<std::string>().empty() || !is_ipv4_shape(ip.get<std::string>())) {
        format_error("Invalid IP address format");
    }

    const auto& port = data["port"];
    if (!port.is_number_integer() || port.get<int64_t>() <= 0 || port.get<int64_t>() > 65535) {
        format_error("Invalid port number");
    }

    const auto& token = data["token"];
    if (!token.is_string() || !QrCodec::validate_security_token(token.get<std::string>())) {
        format_error("Invalid security token");
    }

    const auto& file_name = data["fileName"];
    if (!file_name.is_string() || file_name.get<std::string>().empty()) {
        format_error("Invalid file name");
    }

    const auto& file_size = data["fileSize"];
    if (!file_size.is_number_integer() ||
        (!file_size.is_number_unsigned() && file_size.get<int64_t>() < 0)) {
        format_error("Invalid file size");
    }

    const auto& session_id = data["sessionId"];
    if (!session_id.is_string() || session_id.get<std::string>().empty()) {
        format_error("Invalid session ID");
    }
}

} // anonymous namespace

std::string QrCodec::encode(const TransferSession& session) {
    if (!session.is_valid()) {
        throw QrDropError(ErrorCode::InvalidArgument, "Invalid session provided for QR generation");
    }

    json payload = {
        {"version", kVersion},
        {"ip", session.ip_address()},
        {"port", session.port()},
        {"token", session.security_token()},
        {"fileName", session.file_name()},
        {"fileSize", session.file_size()},
        {"sessionId", session.session_id()}
    };
    return payload.dump();
}

TransferSession QrCodec::decode(const std::string& payload) {
    if (payload.empty()) {
        format_error("QR data string cannot be empty");
    }

    json data;
    try {
        data = json::parse(payload);
    } catch (const json::parse_error& e) {
        format_error(std::string("Failed to parse QR code data: ") + e.what());
    }

    if (!data.is_object()) {
        format_error("QR data must be a JSON object");
    }

    check_version(data);
    check_fields(data);

    TransferSession session(data["sessionId"].get<std::string>(),
                            "",
                            data["fileName"].get<std::string>(),
                            data["fileSize"].get<uint64_t>(),
                            data["ip"].get<std::string>(),
                            static_cast<uint16_t>(data["port"].get<int64_t>()),
                            data["token"].get<std::string>());

    Logger::instance().debug("Decoded QR payload for " + session.to_string());
    return session;
}

bool QrCodec::validate_security_token(const std::string& token) {
    if (token.size() < kMinSecurityTokenLength) {
        return false;
    }
    for (unsigned char c : token) {
        bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        if (!alnum) return false;
    }
    return true;
}

} // namespace qrdrop
