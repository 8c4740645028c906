#ifndef QRDROP_SERVER_TRANSFER_SERVER_H
#define QRDROP_SERVER_TRANSFER_SERVER_H

#include "qrdrop/base/config.h"
#include "qrdrop/net/network_discovery.h"
#include "qrdrop/session/transfer_session.h"
#include "qrdrop/transfer/progress_channel.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace qrdrop {

enum class ServerState {
    Stopped,
    Starting,
    Running
};

std::string to_string(ServerState state);

// Serves one file per run over HTTP, gated by the session token:
//   GET /health
//   GET /info/{sessionId}?sessionId=..&token=..
//   GET /file/{sessionId}?sessionId=..&token=..
// After the file has been streamed completely the server stops on its own
// once ServerConfig::shutdown_grace_ms has elapsed.
class TransferServer {
public:
    explicit TransferServer(const ServerConfig& config);
    TransferServer(const ServerConfig& config, NetworkDiscovery discovery);
    ~TransferServer();

    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    // Stopped -> Starting -> Running. Throws QrDropError: InvalidState when not
    // stopped, FileNotFound, NoNetwork, PortUnavailable.
    TransferSession start(const std::string& file_path);

    // Closes the listener, aborts in-flight streams at the next chunk and clears
    // the session. Publishes a terminal frame if one was not published yet.
    void stop();

    // Running, exact session id, exact token and not expired
    bool validate_token(const std::string& session_id, const std::string& token) const;

    ServerState state() const;
    bool is_running() const { return state() == ServerState::Running; }
    std::optional<TransferSession> current_session() const;

    ProgressChannel& progress();

    // Returns true if the server reached Stopped within timeout
    bool wait_until_stopped(std::chrono::milliseconds timeout) const;

    static std::string content_type_for(const std::string& file_name);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace qrdrop

#endif // QRDROP_SERVER_TRANSFER_SERVER_H
