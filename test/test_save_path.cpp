#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include "qrdrop/client/save_path.h"

using namespace qrdrop;
namespace fs = std::filesystem;

namespace {

fs::path fresh_directory(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / "qrdrop_test_save_path" / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void touch(const fs::path& path) {
    std::ofstream out(path);
    out << "x";
}

} // anonymous namespace

TEST_CASE("Sanitize replaces reserved characters", "[save_path][sanitize]") {
    REQUIRE(sanitize_file_name("report.pdf") == "report.pdf");
    REQUIRE(sanitize_file_name("a/b\\c.txt") == "a_b_c.txt");
    REQUIRE(sanitize_file_name("what?<>:\"|*.txt") == "what_______.txt");
    REQUIRE(sanitize_file_name(std::string("tab\there.txt")) == "tab_here.txt");
    REQUIRE(sanitize_file_name("../../etc/passwd") == ".._.._etc_passwd");
}

TEST_CASE("Sanitize falls back for empty names", "[save_path][sanitize]") {
    REQUIRE(sanitize_file_name("") == "download");
    REQUIRE(sanitize_file_name(".") == "download");
    REQUIRE(sanitize_file_name("..") == "download");
}

TEST_CASE("Sanitize caps length and keeps the extension", "[save_path][sanitize]") {
    std::string name = std::string(300, 'a') + ".jpg";
    std::string sanitized = sanitize_file_name(name);
    REQUIRE(sanitized.size() == kMaxFileNameLength);
    REQUIRE(sanitized.substr(sanitized.size() - 4) == ".jpg");
}

TEST_CASE("Unused name is returned as is", "[save_path][unique]") {
    fs::path dir = fresh_directory("unused");
    REQUIRE(unique_save_path(dir, "photo.jpg") == dir / "photo.jpg");
}

TEST_CASE("Colliding names get a counter suffix", "[save_path][unique]") {
    fs::path dir = fresh_directory("collide");
    touch(dir / "photo.jpg");
    REQUIRE(unique_save_path(dir, "photo.jpg") == dir / "photo_1.jpg");

    touch(dir / "photo_1.jpg");
    REQUIRE(unique_save_path(dir, "photo.jpg") == dir / "photo_2.jpg");
}

TEST_CASE("Counter suffix for names without extension", "[save_path][unique]") {
    fs::path dir = fresh_directory("noext");
    touch(dir / "README");
    touch(dir / ".bashrc");
    REQUIRE(unique_save_path(dir, "README") == dir / "README_1");
    REQUIRE(unique_save_path(dir, ".bashrc") == dir / ".bashrc_1");
}

TEST_CASE("Default download directory", "[save_path][directory]") {
    const char* old_xdg = std::getenv("XDG_DOWNLOAD_DIR");
    std::string saved_xdg = old_xdg ? old_xdg : "";

    setenv("XDG_DOWNLOAD_DIR", "/tmp/qrdrop-xdg", 1);
    REQUIRE(default_download_directory() == fs::path("/tmp/qrdrop-xdg/OfflineSharedData"));

    unsetenv("XDG_DOWNLOAD_DIR");
    if (const char* home = std::getenv("HOME"); home && *home) {
        REQUIRE(default_download_directory() == fs::path(home) / "Downloads" / "OfflineSharedData");
    }

    if (old_xdg) {
        setenv("XDG_DOWNLOAD_DIR", saved_xdg.c_str(), 1);
    }
}
