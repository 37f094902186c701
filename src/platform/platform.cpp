#include "shkit/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace shkit {

namespace fs = std::filesystem;

namespace {

std::string parent_directory(const std::string& path) {
    auto parent = fs::path(path).parent_path();
    return parent.empty() ? "." : parent.string();
}

bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync(dir_fd) == 0;
    close(dir_fd);
    return result;
}

} // namespace

// ============================================================================
// File Operations
// ============================================================================

WriteResult write_file(const std::string& path, const std::string& content, unsigned mode) {
    WriteResult result;

    std::string temp_path = path + ".tmp." + generate_id();

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    std::size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            result.error = "failed to write content: " + std::string(strerror(errno));
            close(fd);
            unlink(temp_path.c_str());
            return result;
        }
        written += static_cast<std::size_t>(n);
    }

    if (fchmod(fd, static_cast<mode_t>(mode)) != 0) {
        result.error = "failed to set permissions: " + std::string(strerror(errno));
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }

    if (fsync(fd) != 0) {
        result.error = "failed to fsync temp file: " + std::string(strerror(errno));
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }
    close(fd);

    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        unlink(temp_path.c_str());
        return result;
    }

    // Durability of the directory entry is best effort.
    fsync_directory(parent_directory(path));

    result.ok = true;
    return result;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_executable(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool remove_directory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec) && !ec;
}

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

bool set_env(const std::string& name, const std::string& value) {
    return setenv(name.c_str(), value.c_str(), 1) == 0;
}

bool unset_env(const std::string& name) {
    return unsetenv(name.c_str()) == 0;
}

char get_path_separator() {
    return ':';
}

std::string generate_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned long long> dis;

    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", dis(gen));
    return buf;
}

} // namespace shkit
