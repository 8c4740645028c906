#include "qrdrop/server/transfer_server.h"
#include "qrdrop/server/http_pipeline.h"
#include "qrdrop/base/error_code.h"
#include "qrdrop/base/logger.h"
#include <elio/elio.hpp>
#include <elio/net/tcp.hpp>
#include <elio/time/timer.hpp>
#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace qrdrop {

namespace {

std::string lower_extension(const std::string& file_name) {
    std::string ext = std::filesystem::path(file_name).extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // anonymous namespace

std::string to_string(ServerState state) {
    switch (state) {
        case ServerState::Stopped: return "stopped";
        case ServerState::Starting: return "starting";
        case ServerState::Running: return "running";
        default: return "unknown";
    }
}

struct TransferServer::Impl {
    ServerConfig config;
    NetworkDiscovery discovery;
    ProgressChannel progress;

    mutable std::mutex mutex;
    mutable std::condition_variable state_cv;
    ServerState state = ServerState::Stopped;
    std::optional<TransferSession> session;
    TransferProgress start_frame;

    std::atomic<bool> stop_requested{false};
    std::atomic<bool> transfer_completed{false};
    std::atomic<bool> terminal_published{false};
    std::atomic<int> active_connections{0};

    std::thread server_thread;
    std::shared_ptr<elio::runtime::scheduler> scheduler;
    std::optional<elio::net::tcp_listener> tcp_listener;
    Handler pipeline;

    Impl(const ServerConfig& cfg, NetworkDiscovery disc)
        : config(cfg), discovery(std::move(disc)) {
        pipeline = build_pipeline(
            [this](const HttpRequest& request) { return route(request); },
            {cors_middleware(), access_log_middleware()});
    }

    std::optional<TransferSession> session_snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return session;
    }

    bool validate_token(const std::string& session_id, const std::string& token) const {
        std::lock_guard<std::mutex> lock(mutex);
        if (state != ServerState::Running || !session) {
            return false;
        }
        if (session_id != session->session_id()) {
            return false;
        }
        const std::string& expected = session->security_token();
        if (token.size() != expected.size() ||
            CRYPTO_memcmp(token.data(), expected.data(), expected.size()) != 0) {
            return false;
        }
        return !session->is_expired();
    }

    bool authorized(const HttpRequest& request) const {
        return validate_token(request.query_param("sessionId"), request.query_param("token"));
    }

    HttpResponse route(const HttpRequest& request) {
        if (request.method == "OPTIONS") {
            return HttpResponse();
        }

        std::string path = request.path;
        if (!path.empty() && path.front() == '/') path.erase(0, 1);

        auto current = session_snapshot();

        if (path == "health") {
            json body = {
                {"status", "healthy"},
                {"sessionId", current ? current->session_id() : std::string()}
            };
            return HttpResponse::json(200, body.dump());
        }

        bool is_info = path.rfind("info/", 0) == 0;
        bool is_file = path.rfind("file/", 0) == 0;
        if (!is_info && !is_file) {
            return HttpResponse::error(404, "Endpoint not found");
        }

        // The path id must name the live session as well as the query
        std::string path_id = path.substr(5);
        if (!current || path_id != current->session_id() || !authorized(request)) {
            return HttpResponse::error(403, "Invalid or expired token");
        }
        return is_info ? handle_info(*current) : handle_file(*current);
    }

    HttpResponse handle_info(const TransferSession& current) {
        json body = {
            {"sessionId", current.session_id()},
            {"fileName", current.file_name()},
            {"fileSize", current.file_size()},
            {"contentType", TransferServer::content_type_for(current.file_name())}
        };
        return HttpResponse::json(200, body.dump());
    }

    HttpResponse handle_file(const TransferSession& current) {
        auto file = std::make_shared<std::ifstream>(current.file_path(), std::ios::binary);
        if (!file->is_open()) {
            Logger::instance().error("Failed to open " + current.file_path() + ": " + std::strerror(errno));
            return HttpResponse::error(500, "Failed to serve file: cannot open " + current.file_name() +
                                            " (" + std::strerror(errno) + ")");
        }

        HttpResponse response;
        response.set_header("Content-Type", TransferServer::content_type_for(current.file_name()));
        response.set_header("Content-Disposition", "attachment; filename=\"" + current.file_name() + "\"");
        response.set_header("Accept-Ranges", "bytes");
        response.body_stream = file;
        response.body_length = current.file_size();
        return response;
    }

    elio::coro::task<bool> write_all(elio::net::tcp_stream& stream, const char* data, size_t size) {
        size_t written = 0;
        while (written < size) {
            auto write_result = co_await stream.write(data + written, size - written);
            if (write_result.result <= 0) {
                co_return false;
            }
            written += static_cast<size_t>(write_result.result);
        }
        co_return true;
    }

    // Streams the file body chunk by chunk, publishing progress after each write.
    // Returns true only if every byte was sent.
    elio::coro::task<bool> stream_body(elio::net::tcp_stream& stream, const HttpResponse& response) {
        TransferProgress base;
        {
            std::lock_guard<std::mutex> lock(mutex);
            base = start_frame;
        }

        const size_t chunk_size = static_cast<size_t>(std::max<uint32_t>(config.chunk_size_kb, 1)) * 1024;
        std::vector<char> buffer(chunk_size);
        uint64_t sent = 0;

        while (sent < response.body_length) {
            if (stop_requested.load()) {
                Logger::instance().warning("Server stopping, aborting transfer after " +
                                           std::to_string(sent) + " bytes");
                co_return false;
            }

            size_t want = static_cast<size_t>(std::min<uint64_t>(chunk_size, response.body_length - sent));
            response.body_stream->read(buffer.data(), static_cast<std::streamsize>(want));
            auto got = response.body_stream->gcount();
            if (got <= 0) {
                Logger::instance().error("File ended after " + std::to_string(sent) + " of " +
                                         std::to_string(response.body_length) + " bytes");
                co_return false;
            }

            if (!co_await write_all(stream, buffer.data(), static_cast<size_t>(got))) {
                Logger::instance().warning("Client disconnected after " + std::to_string(sent) + " bytes");
                co_return false;
            }

            sent += static_cast<uint64_t>(got);
            progress.publish(base.update_progress(sent));
        }

        co_return true;
    }

    void on_transfer_complete() {
        transfer_completed = true;
        if (!terminal_published.exchange(true)) {
            TransferProgress base;
            {
                std::lock_guard<std::mutex> lock(mutex);
                base = start_frame;
            }
            progress.publish(base.complete());
        }
        Logger::instance().info("Transfer complete, stopping in " +
                                std::to_string(config.shutdown_grace_ms) + "ms");
        auto grace = shutdown_after_grace();
        scheduler->spawn(grace.release());
    }

    elio::coro::task<void> shutdown_after_grace() {
        co_await elio::time::sleep_for(std::chrono::milliseconds(config.shutdown_grace_ms));
        stop_requested = true;
    }

    elio::coro::task<void> handle_connection(elio::net::tcp_stream stream) {
        ++active_connections;
        auto peer = stream.peer_address();
        std::string peer_name = peer ? peer->to_string() : "unknown";

        try {
            std::string data;
            char buffer[4096];
            size_t head_end = std::string::npos;
            while (head_end == std::string::npos && data.size() <= kMaxHeadSize) {
                auto read_result = co_await stream.read(buffer, sizeof(buffer));
                if (read_result.result <= 0) {
                    break;
                }
                data.append(buffer, static_cast<size_t>(read_result.result));
                head_end = data.find("\r\n\r\n");
            }

            if (!data.empty()) {
                std::optional<HttpRequest> request;
                if (head_end != std::string::npos) {
                    request = parse_http_request(data.substr(0, head_end));
                }

                HttpResponse response;
                if (!request) {
                    Logger::instance().warning("Malformed request from " + peer_name);
                    response = HttpResponse::error(400, "Bad request");
                    add_cors_headers(response);
                } else {
                    try {
                        response = pipeline(*request);
                    } catch (const std::exception& e) {
                        Logger::instance().error("Handler failed for " + request->path + ": " + e.what());
                        response = HttpResponse::error(500, std::string("Internal error: ") + e.what());
                        add_cors_headers(response);
                    }
                }
                response.set_header("Connection", "close");

                std::string head = response.serialize_head();
                if (co_await write_all(stream, head.data(), head.size())) {
                    if (response.body_stream) {
                        if (co_await stream_body(stream, response)) {
                            on_transfer_complete();
                        }
                    } else if (!response.body.empty()) {
                        if (!co_await write_all(stream, response.body.data(), response.body.size())) {
                            Logger::instance().debug("Failed to send response body to " + peer_name);
                        }
                    }
                }
            }
        } catch (const std::exception& e) {
            Logger::instance().error("Error handling connection from " + peer_name + ": " + e.what());
        }

        co_await stream.close();
        --active_connections;
    }

    elio::coro::task<void> accept_loop() {
        while (!stop_requested.load()) {
            auto stream_result = co_await tcp_listener->accept();

            if (!stream_result) {
                if (!stop_requested.load()) {
                    Logger::instance().error("Accept error: " + std::string(std::strerror(errno)));
                    co_await elio::time::sleep_for(std::chrono::milliseconds(10));
                }
                continue;
            }

            auto handler = handle_connection(std::move(*stream_result));
            scheduler->spawn(handler.release());
        }
    }

    // Server thread body
    void run(uint16_t port, std::promise<bool> bound) {
        scheduler = std::make_shared<elio::runtime::scheduler>(std::max<uint32_t>(config.worker_threads, 1));
        scheduler->start();

        elio::net::tcp_options opts;
        opts.reuse_addr = true;
        opts.no_delay = true;
        opts.backlog = 16;

        auto bind_addr = elio::net::socket_address(elio::net::ipv4_address(config.bind_address, port));
        auto listener_result = elio::net::tcp_listener::bind(bind_addr, opts);

        if (!listener_result) {
            Logger::instance().error("Failed to bind " + config.bind_address + ":" + std::to_string(port) +
                                     ": " + std::strerror(errno));
            scheduler->shutdown();
            scheduler.reset();
            bound.set_value(false);
            return;
        }

        tcp_listener = std::move(*listener_result);

        {
            std::lock_guard<std::mutex> lock(mutex);
            progress.publish(start_frame);
            state = ServerState::Running;
        }
        state_cv.notify_all();
        bound.set_value(true);

        auto accept = accept_loop();
        scheduler->spawn(accept.release());

        while (!stop_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        tcp_listener->close();

        // In-flight streams see stop_requested at their next chunk
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (active_connections.load() > 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        scheduler->shutdown();
        scheduler.reset();
        tcp_listener.reset();

        finish_run();
    }

    void finish_run() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (session && !terminal_published.exchange(true)) {
                TransferProgress last = progress.latest().value_or(start_frame);
                progress.publish(transfer_completed.load() ? last.complete() : last.abort());
            }
            session.reset();
            state = ServerState::Stopped;
        }
        state_cv.notify_all();
        Logger::instance().info("Transfer server stopped");
    }

    void join_thread() {
        if (server_thread.joinable() && server_thread.get_id() != std::this_thread::get_id()) {
            server_thread.join();
        }
    }
};

TransferServer::TransferServer(const ServerConfig& config)
    : TransferServer(config, NetworkDiscovery()) {}

TransferServer::TransferServer(const ServerConfig& config, NetworkDiscovery discovery)
    : impl_(std::make_unique<Impl>(config, std::move(discovery))) {}

TransferServer::~TransferServer() {
    stop();
}

TransferSession TransferServer::start(const std::string& file_path) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->state != ServerState::Stopped) {
            throw QrDropError(ErrorCode::InvalidState,
                              "Cannot start server while " + to_string(impl_->state));
        }
        impl_->state = ServerState::Starting;
    }

    // Reap a previous run that stopped on its own
    impl_->join_thread();

    try {
        std::error_code ec;
        if (!std::filesystem::exists(file_path, ec)) {
            throw QrDropError(ErrorCode::FileNotFound, "File does not exist: " + file_path);
        }

        std::string ip = impl_->config.advertise_address;
        if (ip.empty()) {
            auto discovered = impl_->discovery.get_local_ip_address();
            if (!discovered) {
                throw QrDropError(ErrorCode::NoNetwork, "No local network address available");
            }
            ip = *discovered;
        }

        auto port = NetworkDiscovery::find_available_port(impl_->config.port_range_start,
                                                          impl_->config.port_range_end,
                                                          impl_->config.bind_address);
        if (!port) {
            throw QrDropError(ErrorCode::PortUnavailable,
                              "No available port in range " + std::to_string(impl_->config.port_range_start) +
                              "-" + std::to_string(impl_->config.port_range_end));
        }

        TransferSession session = TransferSession::create(
            file_path, ip, *port, std::chrono::seconds(impl_->config.session_timeout_sec));

        impl_->stop_requested = false;
        impl_->transfer_completed = false;
        impl_->terminal_published = false;
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            impl_->session = session;
            impl_->start_frame = TransferProgress::start(session.file_size());
        }

        std::promise<bool> bound;
        auto bound_future = bound.get_future();
        Impl* impl = impl_.get();
        uint16_t listen_port = *port;
        impl_->server_thread = std::thread([impl, listen_port, bound = std::move(bound)]() mutable {
            impl->run(listen_port, std::move(bound));
        });

        if (!bound_future.get()) {
            impl_->join_thread();
            throw QrDropError(ErrorCode::PortUnavailable,
                              "Failed to bind " + impl_->config.bind_address + ":" + std::to_string(listen_port));
        }

        Logger::instance().info("Serving " + session.file_name() + " (" + std::to_string(session.file_size()) +
                                " bytes) at " + session.base_url() + ", session " + session.session_id());
        return session;
    } catch (...) {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->session.reset();
        impl_->state = ServerState::Stopped;
        throw;
    }
}

void TransferServer::stop() {
    impl_->stop_requested = true;
    impl_->join_thread();
}

bool TransferServer::validate_token(const std::string& session_id, const std::string& token) const {
    return impl_->validate_token(session_id, token);
}

ServerState TransferServer::state() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->state;
}

std::optional<TransferSession> TransferServer::current_session() const {
    return impl_->session_snapshot();
}

ProgressChannel& TransferServer::progress() {
    return impl_->progress;
}

bool TransferServer::wait_until_stopped(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    return impl_->state_cv.wait_for(lock, timeout, [this] { return impl_->state == ServerState::Stopped; });
}

std::string TransferServer::content_type_for(const std::string& file_name) {
    std::string ext = lower_extension(file_name);
    if (ext == "pdf") return "application/pdf";
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "png") return "image/png";
    if (ext == "gif") return "image/gif";
    if (ext == "txt") return "text/plain";
    if (ext == "json") return "application/json";
    if (ext == "zip") return "application/zip";
    if (ext == "mp4") return "video/mp4";
    if (ext == "mp3") return "audio/mpeg";
    return "application/octet-stream";
}

} // namespace qrdrop
