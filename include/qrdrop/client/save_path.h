#ifndef QRDROP_CLIENT_SAVE_PATH_H
#define QRDROP_CLIENT_SAVE_PATH_H

#include <filesystem>
#include <string>

namespace qrdrop {

constexpr size_t kMaxFileNameLength = 255;

// Replaces <>:"/\|?* and control characters with '_' and caps the result at
// 255 characters, keeping the extension. Empty, "." and ".." become "download".
std::string sanitize_file_name(const std::string& file_name);

// directory/name.ext, or name_1.ext, name_2.ext, ... for the first unused path
std::filesystem::path unique_save_path(const std::filesystem::path& directory,
                                       const std::string& file_name);

// $XDG_DOWNLOAD_DIR, else $HOME/Downloads, with an OfflineSharedData subfolder;
// the current directory when neither is set
std::filesystem::path default_download_directory();

} // namespace qrdrop

#endif // QRDROP_CLIENT_SAVE_PATH_H
