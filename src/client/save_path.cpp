#include "qrdrop/client/save_path.h"
#include <cstdlib>
#include <cstring>
#include <utility>

namespace qrdrop {

namespace {

constexpr const char* kSubfolder = "OfflineSharedData";

bool is_invalid_char(unsigned char c) {
    return c < 0x20 || std::strchr("<>:\"/\\|?*", c) != nullptr;
}

// Splits at the last dot; a leading dot (".bashrc") is part of the stem
std::pair<std::string, std::string> split_extension(const std::string& name) {
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return {name, ""};
    }
    return {name.substr(0, dot), name.substr(dot)};
}

} // anonymous namespace

std::string sanitize_file_name(const std::string& file_name) {
    std::string sanitized;
    sanitized.reserve(file_name.size());
    for (unsigned char c : file_name) {
        sanitized.push_back(is_invalid_char(c) ? '_' : static_cast<char>(c));
    }

    if (sanitized.empty() || sanitized == "." || sanitized == "..") {
        return "download";
    }

    if (sanitized.size() > kMaxFileNameLength) {
        auto [stem, ext] = split_extension(sanitized);
        if (ext.size() >= kMaxFileNameLength) {
            ext.clear();
        }
        sanitized = stem.substr(0, kMaxFileNameLength - ext.size()) + ext;
    }

    return sanitized;
}

std::filesystem::path unique_save_path(const std::filesystem::path& directory,
                                       const std::string& file_name) {
    std::string sanitized = sanitize_file_name(file_name);
    std::filesystem::path candidate = directory / sanitized;

    auto [stem, ext] = split_extension(sanitized);
    std::error_code ec;
    for (int counter = 1; std::filesystem::exists(candidate, ec); ++counter) {
        candidate = directory / (stem + "_" + std::to_string(counter) + ext);
    }
    return candidate;
}

std::filesystem::path default_download_directory() {
    if (const char* xdg = std::getenv("XDG_DOWNLOAD_DIR"); xdg && *xdg) {
        return std::filesystem::path(xdg) / kSubfolder;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / "Downloads" / kSubfolder;
    }
    return std::filesystem::current_path() / kSubfolder;
}

} // namespace qrdrop
