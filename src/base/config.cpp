#include "qrdrop/base/config.h"
#include "qrdrop/base/logger.h"
#include "CLI/CLI.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>

using json = nlohmann::json;

namespace qrdrop {

namespace {

using IniSections = std::map<std::string, std::map<std::string, std::string>>;

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

// Simple INI-style parser for config files
bool parse_ini_file(const std::string& path, IniSections& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section];
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // Remove quotes
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
    return true;
}

template<typename T>
void read_json(const json& section, const char* key, T& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<T>();
    }
}

} // anonymous namespace

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: " + path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    config_file_ = path;

    bool ok = false;
    if (std::filesystem::path(path).extension() == ".json") {
        ok = load_json(path);
    } else {
        ok = load_ini(path);
    }

    if (ok) {
        Logger::instance().info("Config loaded successfully from: " + path);
    }
    return ok;
}

bool Config::load_ini(const std::string& path) {
    IniSections sections;
    if (!parse_ini_file(path, sections)) {
        Logger::instance().error("Failed to open config file: " + path);
        return false;
    }

    try {
        if (sections.count("log")) {
            auto& s = sections["log"];
            if (s.count("level")) config_.log.level = s["level"];
            if (s.count("output")) config_.log.output = s["output"];
            if (s.count("file_path")) config_.log.file_path = s["file_path"];
        }

        if (sections.count("server")) {
            auto& s = sections["server"];
            if (s.count("bind_address")) config_.server.bind_address = s["bind_address"];
            if (s.count("advertise_address")) config_.server.advertise_address = s["advertise_address"];
            if (s.count("port_range_start")) config_.server.port_range_start = static_cast<uint16_t>(std::stoi(s["port_range_start"]));
            if (s.count("port_range_end")) config_.server.port_range_end = static_cast<uint16_t>(std::stoi(s["port_range_end"]));
            if (s.count("session_timeout_sec")) config_.server.session_timeout_sec = std::stoul(s["session_timeout_sec"]);
            if (s.count("shutdown_grace_ms")) config_.server.shutdown_grace_ms = std::stoul(s["shutdown_grace_ms"]);
            if (s.count("chunk_size_kb")) config_.server.chunk_size_kb = std::stoul(s["chunk_size_kb"]);
            if (s.count("worker_threads")) config_.server.worker_threads = std::stoul(s["worker_threads"]);
        }

        if (sections.count("client")) {
            auto& s = sections["client"];
            if (s.count("connect_timeout_sec")) config_.client.connect_timeout_sec = std::stoul(s["connect_timeout_sec"]);
            if (s.count("read_timeout_sec")) config_.client.read_timeout_sec = std::stoul(s["read_timeout_sec"]);
            if (s.count("download_dir")) config_.client.download_dir = s["download_dir"];
            if (s.count("max_retries")) config_.client.max_retries = std::stoul(s["max_retries"]);
            if (s.count("retry_delay_ms")) config_.client.retry_delay_ms = std::stoul(s["retry_delay_ms"]);
            if (s.count("storage_buffer_mb")) config_.client.storage_buffer_mb = std::stoull(s["storage_buffer_mb"]);
        }
    } catch (const std::logic_error& e) {
        Logger::instance().error("Invalid value in config file " + path + ": " + e.what());
        return false;
    }

    return true;
}

bool Config::load_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::instance().error("Failed to open config file: " + path);
        return false;
    }

    try {
        json j = json::parse(file);

        if (j.contains("log")) {
            const auto& s = j["log"];
            read_json(s, "level", config_.log.level);
            read_json(s, "output", config_.log.output);
            read_json(s, "file_path", config_.log.file_path);
        }

        if (j.contains("server")) {
            const auto& s = j["server"];
            read_json(s, "bind_address", config_.server.bind_address);
            read_json(s, "advertise_address", config_.server.advertise_address);
            read_json(s, "port_range_start", config_.server.port_range_start);
            read_json(s, "port_range_end", config_.server.port_range_end);
            read_json(s, "session_timeout_sec", config_.server.session_timeout_sec);
            read_json(s, "shutdown_grace_ms", config_.server.shutdown_grace_ms);
            read_json(s, "chunk_size_kb", config_.server.chunk_size_kb);
            read_json(s, "worker_threads", config_.server.worker_threads);
        }

        if (j.contains("client")) {
            const auto& s = j["client"];
            read_json(s, "connect_timeout_sec", config_.client.connect_timeout_sec);
            read_json(s, "read_timeout_sec", config_.client.read_timeout_sec);
            read_json(s, "download_dir", config_.client.download_dir);
            read_json(s, "max_retries", config_.client.max_retries);
            read_json(s, "retry_delay_ms", config_.client.retry_delay_ms);
            read_json(s, "storage_buffer_mb", config_.client.storage_buffer_mb);
        }
    } catch (const json::exception& e) {
        Logger::instance().error("Failed to parse JSON config " + path + ": " + e.what());
        return false;
    }

    return true;
}

bool Config::load_from_env() {
    Logger::instance().debug("Loading config from environment variables");

    try {
        if (const char* val = std::getenv("QRDROP_LOG_LEVEL")) {
            config_.log.level = val;
        }
        if (const char* val = std::getenv("QRDROP_BIND_ADDRESS")) {
            config_.server.bind_address = val;
        }
        if (const char* val = std::getenv("QRDROP_ADVERTISE_ADDRESS")) {
            config_.server.advertise_address = val;
        }
        if (const char* val = std::getenv("QRDROP_PORT_RANGE_START")) {
            config_.server.port_range_start = static_cast<uint16_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("QRDROP_PORT_RANGE_END")) {
            config_.server.port_range_end = static_cast<uint16_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("QRDROP_SESSION_TIMEOUT")) {
            config_.server.session_timeout_sec = std::stoul(val);
        }
        if (const char* val = std::getenv("QRDROP_DOWNLOAD_DIR")) {
            config_.client.download_dir = val;
        }
        if (const char* val = std::getenv("QRDROP_MAX_RETRIES")) {
            config_.client.max_retries = std::stoul(val);
        }
    } catch (const std::logic_error& e) {
        Logger::instance().error("Invalid QRDROP_* environment value: " + std::string(e.what()));
        return false;
    }
    return true;
}

void Config::register_options(CLI::App& app) {
    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Server options
    app.add_option("--bind-address", config_.server.bind_address, "Address the file server listens on");
    app.add_option("--advertise-address", config_.server.advertise_address,
                   "Address placed in the QR payload (default: detected LAN address)");
    app.add_option("--port-start", config_.server.port_range_start, "First port to try");
    app.add_option("--port-end", config_.server.port_range_end, "Last port to try");
    app.add_option("--session-timeout", config_.server.session_timeout_sec, "Session lifetime (seconds)");
    app.add_option("--shutdown-grace", config_.server.shutdown_grace_ms,
                   "Delay before the server stops after a completed transfer (ms)");
    app.add_option("--chunk-size", config_.server.chunk_size_kb, "Streaming chunk size (KB)");

    // Client options
    app.add_option("--connect-timeout", config_.client.connect_timeout_sec, "Connect timeout (seconds)");
    app.add_option("--read-timeout", config_.client.read_timeout_sec, "Read timeout (seconds)");
    app.add_option("-o,--download-dir", config_.client.download_dir, "Directory for received files");
    app.add_option("--max-retries", config_.client.max_retries, "Download attempts before giving up");
    app.add_option("--retry-delay", config_.client.retry_delay_ms, "Delay between download attempts (ms)");
}

void Config::apply_log_settings() const {
    auto& logger = Logger::instance();
    logger.set_level(parse_log_level(config_.log.level));

    if (config_.log.output == "stderr") {
        logger.set_output(LogOutput::Stderr);
    } else if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        if (!logger.set_file_output(config_.log.file_path)) {
            logger.set_output(LogOutput::Stderr);
        }
    } else {
        logger.set_output(LogOutput::Stdout);
    }
}

bool Config::validate() const {
    if (config_.server.port_range_start == 0 ||
        config_.server.port_range_start > config_.server.port_range_end) {
        Logger::instance().error("server port range is invalid: " +
                                 std::to_string(config_.server.port_range_start) + "-" +
                                 std::to_string(config_.server.port_range_end));
        return false;
    }
    if (config_.server.session_timeout_sec == 0) {
        Logger::instance().error("server.session_timeout_sec must be positive");
        return false;
    }
    if (config_.server.chunk_size_kb == 0) {
        Logger::instance().error("server.chunk_size_kb must be positive");
        return false;
    }
    if (config_.client.connect_timeout_sec == 0 || config_.client.read_timeout_sec == 0) {
        Logger::instance().error("client timeouts must be positive");
        return false;
    }
    if (config_.client.max_retries == 0) {
        Logger::instance().error("client.max_retries must be at least 1");
        return false;
    }
    return true;
}

void Config::print() const {
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Log Level: " + config_.log.level);
    Logger::instance().info("Bind Address: " + config_.server.bind_address);
    Logger::instance().info("Port Range: " + std::to_string(config_.server.port_range_start) + "-" +
                            std::to_string(config_.server.port_range_end));
    Logger::instance().info("Session Timeout: " + std::to_string(config_.server.session_timeout_sec) + " s");
    Logger::instance().info("Download Dir: " +
                            (config_.client.download_dir.empty() ? std::string("(default)") : config_.client.download_dir));
    Logger::instance().info("Max Retries: " + std::to_string(config_.client.max_retries));
}

} // namespace qrdrop
