#include <catch2/catch_test_macros.hpp>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>
#include "qrdrop/base/error_code.h"
#include "qrdrop/base/error_translate.h"
#include "qrdrop/base/retry.h"

using namespace qrdrop;
using namespace std::chrono_literals;

TEST_CASE("Error code numeric values", "[error][code]") {
    REQUIRE(static_cast<int>(ErrorCode::Success) == 0);
    REQUIRE(static_cast<int>(ErrorCode::InvalidArgument) == 1001);
    REQUIRE(static_cast<int>(ErrorCode::ConnectionTimeout) == 2001);
    REQUIRE(static_cast<int>(ErrorCode::InsufficientStorage) == 3001);
    REQUIRE(static_cast<int>(ErrorCode::QrInvalidFormat) == 4001);
    REQUIRE(static_cast<int>(ErrorCode::PortUnavailable) == 5001);
    REQUIRE(static_cast<int>(ErrorCode::CameraPermission) == 6001);
}

TEST_CASE("Error kinds follow code ranges", "[error][kind]") {
    REQUIRE(kind_of(ErrorCode::InvalidState) == ErrorKind::General);
    REQUIRE(kind_of(ErrorCode::ServerUnavailable) == ErrorKind::Network);
    REQUIRE(kind_of(ErrorCode::CorruptedFile) == ErrorKind::FileSystem);
    REQUIRE(kind_of(ErrorCode::QrUnsupportedVersion) == ErrorKind::QrFormat);
    REQUIRE(kind_of(ErrorCode::SessionExpired) == ErrorKind::ServerAuth);
    REQUIRE(kind_of(ErrorCode::StoragePermission) == ErrorKind::Permission);
}

TEST_CASE("Retryable table", "[error][retry]") {
    const std::vector<ErrorCode> retryable = {
        ErrorCode::ConnectionTimeout, ErrorCode::ConnectionRefused, ErrorCode::ServerUnavailable,
        ErrorCode::ProtocolError, ErrorCode::FileNotFound, ErrorCode::CorruptedFile,
        ErrorCode::QrInvalidFormat, ErrorCode::QrUnsupportedVersion, ErrorCode::CameraUnavailable,
        ErrorCode::PortUnavailable, ErrorCode::AuthenticationFailed
    };
    for (auto code : retryable) {
        REQUIRE(is_retryable(code));
    }

    const std::vector<ErrorCode> fatal = {
        ErrorCode::InvalidArgument, ErrorCode::InvalidState, ErrorCode::Cancelled,
        ErrorCode::NoNetwork, ErrorCode::InsufficientStorage, ErrorCode::PermissionDenied,
        ErrorCode::CameraPermissionDenied, ErrorCode::SessionExpired,
        ErrorCode::CameraPermission, ErrorCode::StoragePermission, ErrorCode::NetworkPermission
    };
    for (auto code : fatal) {
        REQUIRE_FALSE(is_retryable(code));
    }
}

TEST_CASE("Recovery actions", "[error][recovery]") {
    REQUIRE(recovery_action_for(ErrorCode::ConnectionTimeout) == RecoveryAction::Retry);
    REQUIRE(recovery_action_for(ErrorCode::SessionExpired) == RecoveryAction::RestartFlow);
    REQUIRE(recovery_action_for(ErrorCode::StoragePermission) == RecoveryAction::GrantPermission);
    REQUIRE(recovery_action_for(ErrorCode::PermissionDenied) == RecoveryAction::GrantPermission);
    REQUIRE(recovery_action_for(ErrorCode::InsufficientStorage) == RecoveryAction::None);
    REQUIRE(recovery_action_for(ErrorCode::InvalidArgument) == RecoveryAction::None);
}

TEST_CASE("QrDropError carries code and messages", "[error]") {
    QrDropError error(ErrorCode::InsufficientStorage, "need 2 GB");
    REQUIRE(error.code() == ErrorCode::InsufficientStorage);
    REQUIRE(error.kind() == ErrorKind::FileSystem);
    REQUIRE_FALSE(error.retryable());
    REQUIRE(error.detail() == "need 2 GB");
    REQUIRE(std::string(error.what()) == "Insufficient storage: need 2 GB");
    REQUIRE_FALSE(error.user_message().empty());

    QrDropError custom(ErrorCode::Cancelled, "user pressed stop", "Stopped.");
    REQUIRE(custom.user_message() == "Stopped.");
}

TEST_CASE("Error codes integrate with std::error_code", "[error][category]") {
    std::error_code ec = ErrorCode::SessionExpired;
    REQUIRE(ec.value() == 5003);
    REQUIRE(std::string(ec.category().name()) == "qrdrop");
    REQUIRE(ec.message() == "Session expired");
}

TEST_CASE("errno translation", "[error][translate]") {
    REQUIRE(code_from_errno(ECONNREFUSED, ErrorCode::InternalError) == ErrorCode::ConnectionRefused);
    REQUIRE(code_from_errno(ETIMEDOUT, ErrorCode::InternalError) == ErrorCode::ConnectionTimeout);
    REQUIRE(code_from_errno(ENETUNREACH, ErrorCode::InternalError) == ErrorCode::NoNetwork);
    REQUIRE(code_from_errno(EADDRINUSE, ErrorCode::InternalError) == ErrorCode::PortUnavailable);
    REQUIRE(code_from_errno(ENOSPC, ErrorCode::InternalError) == ErrorCode::InsufficientStorage);
    REQUIRE(code_from_errno(EACCES, ErrorCode::InternalError) == ErrorCode::PermissionDenied);
    REQUIRE(code_from_errno(ENOENT, ErrorCode::InternalError) == ErrorCode::FileNotFound);
    REQUIRE(code_from_errno(EBADF, ErrorCode::ProtocolError) == ErrorCode::ProtocolError);

    auto error = from_errno(ECONNRESET, "read from peer");
    REQUIRE(error.code() == ErrorCode::ConnectionRefused);
    REQUIRE(error.detail().find("read from peer") == 0);
}

TEST_CASE("HTTP status translation", "[error][translate]") {
    REQUIRE(from_http_status(403, "GET /file").code() == ErrorCode::AuthenticationFailed);
    REQUIRE(from_http_status(401, "GET /file").code() == ErrorCode::AuthenticationFailed);
    REQUIRE(from_http_status(404, "GET /info").code() == ErrorCode::ServerUnavailable);
    REQUIRE(from_http_status(503, "GET /info").code() == ErrorCode::ServerUnavailable);
    REQUIRE(from_http_status(400, "GET /info").code() == ErrorCode::ProtocolError);
    REQUIRE(from_http_status(403, "GET /file").detail() == "GET /file returned HTTP 403");
}

TEST_CASE("Filesystem error translation", "[error][translate]") {
    std::filesystem::filesystem_error fs_error(
        "create_directories", std::make_error_code(std::errc::permission_denied));
    REQUIRE(from_filesystem_error(fs_error).code() == ErrorCode::PermissionDenied);
}

TEST_CASE("Retry presets", "[retry][config]") {
    auto network = RetryConfig::network();
    REQUIRE(network.max_retries == 3);
    REQUIRE(network.initial_delay == 2000ms);
    REQUIRE(network.max_delay == 15000ms);

    auto fs = RetryConfig::file_system();
    REQUIRE(fs.max_retries == 2);
    REQUIRE_FALSE(fs.use_jitter);

    auto qr = RetryConfig::qr_code();
    REQUIRE(qr.max_retries == 5);
    REQUIRE(qr.initial_delay == 500ms);

    auto fixed = RetryConfig::fixed(4, 250ms);
    REQUIRE(fixed.max_retries == 4);
    REQUIRE(fixed.backoff_multiplier == 1.0);
    REQUIRE_FALSE(fixed.use_jitter);
}

TEST_CASE("Retry delay computation", "[retry][delay]") {
    RetryConfig config;
    config.use_jitter = false;
    config.max_delay = 5000ms;
    REQUIRE(compute_retry_delay(1000ms, config, 0.9) == 1000ms);
    REQUIRE(compute_retry_delay(8000ms, config, 0.0) == 5000ms);

    config.use_jitter = true;
    REQUIRE(compute_retry_delay(1000ms, config, 0.0) == 1000ms);
    REQUIRE(compute_retry_delay(1000ms, config, 0.5) == 1050ms);
    REQUIRE(compute_retry_delay(1000ms, config, 1.0) == 1100ms);
}

TEST_CASE("retry_execute sleeps between attempts only", "[retry][execute]") {
    std::vector<std::chrono::milliseconds> sleeps;
    auto record_sleep = [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); };
    int calls = 0;

    SECTION("Success on the third attempt") {
        int result = retry_execute(
            [&calls]() {
                if (++calls < 3) {
                    throw QrDropError(ErrorCode::ConnectionRefused, "refused");
                }
                return 42;
            },
            RetryConfig::fixed(3, 100ms), default_should_retry, {}, record_sleep);

        REQUIRE(result == 42);
        REQUIRE(calls == 3);
        REQUIRE(sleeps == std::vector<std::chrono::milliseconds>{100ms, 100ms});
    }

    SECTION("All attempts fail") {
        REQUIRE_THROWS_AS(retry_execute(
            [&calls]() -> int {
                ++calls;
                throw QrDropError(ErrorCode::ConnectionTimeout, "timeout");
            },
            RetryConfig::fixed(4, 10ms), default_should_retry, {}, record_sleep),
            QrDropError);

        REQUIRE(calls == 4);
        REQUIRE(sleeps.size() == 3);
    }

    SECTION("Non-retryable error stops immediately") {
        REQUIRE_THROWS_AS(retry_execute(
            [&calls]() -> int {
                ++calls;
                throw QrDropError(ErrorCode::InsufficientStorage, "full");
            },
            RetryConfig::fixed(5, 10ms), default_should_retry, {}, record_sleep),
            QrDropError);

        REQUIRE(calls == 1);
        REQUIRE(sleeps.empty());
    }

    SECTION("Exponential backoff capped by max delay") {
        RetryConfig config;
        config.max_retries = 4;
        config.initial_delay = 100ms;
        config.max_delay = 300ms;
        config.backoff_multiplier = 2.0;
        config.use_jitter = false;

        std::vector<uint32_t> attempts_seen;
        REQUIRE_THROWS(retry_execute(
            [&calls]() -> int {
                ++calls;
                throw QrDropError(ErrorCode::ServerUnavailable, "down");
            },
            config, default_should_retry,
            [&attempts_seen](uint32_t attempt, const QrDropError&) { attempts_seen.push_back(attempt); },
            record_sleep));

        REQUIRE(sleeps == std::vector<std::chrono::milliseconds>{100ms, 200ms, 300ms});
        REQUIRE(attempts_seen == std::vector<uint32_t>{1, 2, 3});
    }
}
