#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <csignal>
#include <thread>
#include <chrono>
#include <future>
#include <optional>
#include <sstream>

#include "CLI/CLI.hpp"
#include "qrdrop/base/logger.h"
#include "qrdrop/base/config.h"
#include "qrdrop/base/error_code.h"
#include "qrdrop/client/transfer_client.h"
#include "qrdrop/server/transfer_server.h"
#include "qrdrop/session/qr_codec.h"

using namespace qrdrop;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

namespace {

constexpr const char* kVersion = "0.1.0";

void print_progress_line(const TransferProgress& frame) {
    std::cout << "\r" << frame.formatted_progress()
              << "  " << frame.formatted_speed()
              << "  ETA " << frame.formatted_eta() << "      " << std::flush;
}

std::string read_payload_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw QrDropError(ErrorCode::FileNotFound, "Cannot open QR payload file " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    std::string payload = buffer.str();
    while (!payload.empty() && (payload.back() == '\n' || payload.back() == '\r')) {
        payload.pop_back();
    }
    return payload;
}

} // anonymous namespace

class QrDropApplication {
public:
    QrDropApplication() = default;
    ~QrDropApplication() {
        if (server_) {
            server_->stop();
        }
        if (client_) {
            client_->cancel_download();
        }
    }

    int run(int argc, char* argv[]) {
        // The config file must be applied before the command line, so find it first
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_.load_from_file(argv[i + 1]);
            } else if (arg.rfind("--config=", 0) == 0) {
                config_.load_from_file(arg.substr(9));
            }
        }
        config_.load_from_env();

        CLI::App app{"qrdrop - offline file transfer over the local network"};
        std::string config_file;
        app.add_option("-c,--config", config_file, "Path to configuration file (INI or .json)");
        app.set_version_flag("-v,--version", kVersion);
        config_.register_options(app);
        app.require_subcommand(1);

        std::string send_file;
        auto* send = app.add_subcommand("send", "Share a file and print its QR payload");
        send->add_option("file", send_file, "File to share")->required()->check(CLI::ExistingFile);

        std::string payload;
        std::string payload_file;
        std::string save_as;
        auto* receive = app.add_subcommand("receive", "Download a file from a QR payload");
        auto* payload_opt = receive->add_option("payload", payload, "QR payload JSON text");
        receive->add_option("--qr-file", payload_file, "Read the QR payload from a file")
            ->excludes(payload_opt);
        receive->add_option("--save-as", save_as, "Exact path for the received file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app.exit(e);
        }

        config_.apply_log_settings();
        if (!config_.validate()) {
            std::cerr << "Invalid configuration" << std::endl;
            return 1;
        }
        config_.print();

        try {
            if (*send) {
                return run_send(send_file);
            }
            if (payload.empty() && !payload_file.empty()) {
                payload = read_payload_file(payload_file);
            }
            if (payload.empty()) {
                std::cerr << "receive needs a payload or --qr-file" << std::endl;
                return 2;
            }
            return run_receive(payload, save_as);
        } catch (const QrDropError& e) {
            Logger::instance().error(e.what());
            std::cerr << e.user_message() << std::endl;
            return 1;
        }
    }

private:
    int run_send(const std::string& file_path) {
        server_ = std::make_unique<TransferServer>(config_.get().server);
        auto subscription = server_->progress().subscribe();

        TransferSession session = server_->start(file_path);

        std::cout << "Scan this payload on the receiving device:" << std::endl;
        std::cout << QrCodec::encode(session) << std::endl;
        std::cout << "Serving " << session.file_name() << " at " << session.base_url() << std::endl;

        std::optional<TransferProgress> last;
        while (g_running && server_->state() != ServerState::Stopped) {
            if (auto frame = subscription->wait_for_update(std::chrono::milliseconds(200))) {
                if (frame->has_started() || frame->is_terminal()) {
                    print_progress_line(*frame);
                }
                last = frame;
            }
        }

        if (!g_running) {
            Logger::instance().info("Interrupted, stopping server");
        }
        server_->stop();

        if (auto frame = subscription->poll()) {
            last = frame;
        }
        std::cout << std::endl;

        if (last && last->state() == TransferState::Completed) {
            std::cout << "Transfer complete" << std::endl;
            return 0;
        }
        std::cout << "Transfer did not complete" << std::endl;
        return 1;
    }

    int run_receive(const std::string& payload, const std::string& save_as) {
        TransferSession session = QrCodec::decode(payload);
        Logger::instance().info("Receiving " + session.to_string());

        client_ = std::make_unique<TransferClient>(config_.get().client);
        auto subscription = client_->progress().subscribe();

        std::optional<std::filesystem::path> custom_path;
        if (!save_as.empty()) {
            custom_path = save_as;
        }

        auto result = std::async(std::launch::async, [this, &session, &custom_path]() {
            return client_->download_file_with_retry(session, custom_path);
        });

        bool cancel_sent = false;
        while (result.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
            if (!g_running && !cancel_sent) {
                Logger::instance().info("Interrupted, cancelling download");
                client_->cancel_download();
                cancel_sent = true;
            }
            if (auto frame = subscription->poll()) {
                print_progress_line(*frame);
            }
        }

        std::filesystem::path saved = result.get();
        if (auto frame = subscription->poll()) {
            print_progress_line(*frame);
        }
        std::cout << std::endl << "Saved to " << saved.string() << std::endl;
        return 0;
    }

    Config config_;
    std::unique_ptr<TransferServer> server_;
    std::unique_ptr<TransferClient> client_;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // A receiver that hangs up mid-stream must not kill the sender
    std::signal(SIGPIPE, SIG_IGN);

    try {
        QrDropApplication app;
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
