#ifndef QRDROP_BASE_CONFIG_H
#define QRDROP_BASE_CONFIG_H

#include <cstdint>
#include <string>

namespace CLI {
class App;
}

namespace qrdrop {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stdout";  // stdout, stderr, file
    std::string file_path = "";
};

// Sending side
struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    std::string advertise_address = "";  // empty means discover from interfaces
    uint16_t port_range_start = 8080;
    uint16_t port_range_end = 8090;
    uint32_t session_timeout_sec = 3600;
    uint32_t shutdown_grace_ms = 2000;
    uint32_t chunk_size_kb = 64;
    uint32_t worker_threads = 2;
};

// Receiving side
struct ClientConfig {
    uint32_t connect_timeout_sec = 30;
    uint32_t read_timeout_sec = 60;
    std::string download_dir = "";  // empty means default_download_directory()
    uint32_t max_retries = 3;
    uint32_t retry_delay_ms = 2000;
    uint64_t storage_buffer_mb = 10;
};

struct GlobalConfig {
    LogConfig log;
    ServerConfig server;
    ClientConfig client;
};

class Config {
public:
    Config() = default;

    // Load configuration from file (INI, or JSON by extension)
    bool load_from_file(const std::string& path);

    // Override from QRDROP_* environment variables
    bool load_from_env();

    // Bind command line options onto the configuration; values land when app.parse() runs
    void register_options(CLI::App& app);

    // Push the [log] section into the Logger singleton
    void apply_log_settings() const;

    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    const std::string& get_config_file() const { return config_file_; }

    bool validate() const;

    void print() const;

private:
    bool load_ini(const std::string& path);
    bool load_json(const std::string& path);

    GlobalConfig config_;
    std::string config_file_;
};

} // namespace qrdrop

#endif // QRDROP_BASE_CONFIG_H
