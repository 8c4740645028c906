#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include "qrdrop/base/error_code.h"
#include "qrdrop/session/transfer_session.h"

using namespace qrdrop;
namespace fs = std::filesystem;

namespace {

fs::path write_temp_file(const std::string& name, size_t size) {
    fs::path dir = fs::temp_directory_path() / "qrdrop_test_session";
    fs::create_directories(dir);
    fs::path path = dir / name;
    std::ofstream out(path, std::ios::binary);
    std::string data(size, 'x');
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    return path;
}

TransferSession make_session(TransferSession::Clock::time_point created_at,
                             std::chrono::seconds timeout = TransferSession::kDefaultTimeout) {
    return TransferSession("sid1", "/tmp/a.pdf", "a.pdf", 1024, "192.168.1.50", 8080,
                           std::string(32, 'A'), created_at, timeout);
}

} // anonymous namespace

TEST_CASE("Security token shape", "[session][token]") {
    std::string token = generate_security_token();
    REQUIRE(token.size() == kSecurityTokenLength);
    REQUIRE(std::all_of(token.begin(), token.end(),
                        [](unsigned char c) { return std::isalnum(c) != 0; }));

    REQUIRE(generate_security_token(16).size() == 16);
}

TEST_CASE("Security tokens are not repeated", "[session][token]") {
    std::set<std::string> tokens;
    for (int i = 0; i < 200; ++i) {
        tokens.insert(generate_security_token());
    }
    REQUIRE(tokens.size() == 200);
}

TEST_CASE("Session id format", "[session][id]") {
    std::string id = generate_session_id();
    REQUIRE(id.rfind("session_", 0) == 0);

    auto last = id.rfind('_');
    REQUIRE(last != std::string::npos);
    std::string suffix = id.substr(last + 1);
    REQUIRE(suffix.size() == 8);
    REQUIRE(std::all_of(suffix.begin(), suffix.end(),
                        [](unsigned char c) { return std::isalnum(c) != 0; }));

    std::string millis = id.substr(8, last - 8);
    REQUIRE_FALSE(millis.empty());
    REQUIRE(std::all_of(millis.begin(), millis.end(),
                        [](unsigned char c) { return std::isdigit(c) != 0; }));
}

TEST_CASE("Create session for a local file", "[session][create]") {
    fs::path path = write_temp_file("report.pdf", 4096);

    auto session = TransferSession::create(path.string(), "192.168.1.50", 8080);
    REQUIRE(session.file_name() == "report.pdf");
    REQUIRE(session.file_size() == 4096);
    REQUIRE(session.file_path() == path.string());
    REQUIRE(session.ip_address() == "192.168.1.50");
    REQUIRE(session.port() == 8080);
    REQUIRE(session.security_token().size() == kSecurityTokenLength);
    REQUIRE(session.session_timeout() == std::chrono::seconds(3600));
    REQUIRE(session.is_valid());
    REQUIRE(session.base_url() == "http://192.168.1.50:8080");

    auto other = TransferSession::create(path.string(), "192.168.1.50", 8080);
    REQUIRE(other.session_id() != session.session_id());
    REQUIRE(other.security_token() != session.security_token());
}

TEST_CASE("Create session rejects bad input", "[session][create][error]") {
    fs::path path = write_temp_file("ok.txt", 10);

    SECTION("Missing file") {
        try {
            TransferSession::create("/nonexistent/qrdrop/missing.bin", "192.168.1.50", 8080);
            FAIL("expected FileNotFound");
        } catch (const QrDropError& e) {
            REQUIRE(e.code() == ErrorCode::FileNotFound);
        }
    }

    SECTION("Directory instead of file") {
        try {
            TransferSession::create(path.parent_path().string(), "192.168.1.50", 8080);
            FAIL("expected InvalidArgument");
        } catch (const QrDropError& e) {
            REQUIRE(e.code() == ErrorCode::InvalidArgument);
        }
    }

    SECTION("No network address") {
        try {
            TransferSession::create(path.string(), "", 8080);
            FAIL("expected NoNetwork");
        } catch (const QrDropError& e) {
            REQUIRE(e.code() == ErrorCode::NoNetwork);
        }
    }

    SECTION("Port zero") {
        try {
            TransferSession::create(path.string(), "192.168.1.50", 0);
            FAIL("expected PortUnavailable");
        } catch (const QrDropError& e) {
            REQUIRE(e.code() == ErrorCode::PortUnavailable);
        }
    }
}

TEST_CASE("Session expiry boundary", "[session][expiry]") {
    using namespace std::chrono;
    auto created = TransferSession::Clock::now() - hours(2);
    auto session = make_session(created);

    REQUIRE_FALSE(session.is_expired_at(created + seconds(3599)));
    REQUIRE_FALSE(session.is_expired_at(created + seconds(3600)));
    REQUIRE(session.is_expired_at(created + seconds(3601)));

    REQUIRE(session.is_expired());
    REQUIRE_FALSE(session.is_valid());
}

TEST_CASE("Session validity", "[session][valid]") {
    auto now = TransferSession::Clock::now();
    REQUIRE(make_session(now).is_valid());

    TransferSession short_token("sid1", "", "a.pdf", 10, "192.168.1.50", 8080, "short", now);
    REQUIRE_FALSE(short_token.is_valid());

    TransferSession no_ip("sid1", "", "a.pdf", 10, "", 8080, std::string(32, 'A'), now);
    REQUIRE_FALSE(no_ip.is_valid());

    TransferSession no_port("sid1", "", "a.pdf", 10, "192.168.1.50", 0, std::string(32, 'A'), now);
    REQUIRE_FALSE(no_port.is_valid());

    TransferSession min_token("sid1", "", "a.pdf", 10, "192.168.1.50", 8080, std::string(16, 'z'), now);
    REQUIRE(min_token.is_valid());
}

TEST_CASE("Session rendering hides the token", "[session]") {
    auto session = make_session(TransferSession::Clock::now());
    std::string text = session.to_string();
    REQUIRE(text.find("sid1") != std::string::npos);
    REQUIRE(text.find(session.security_token()) == std::string::npos);
}
