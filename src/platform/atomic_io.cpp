#include "exampack/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace exampack {

namespace fs = std::filesystem;

namespace {

#ifndef _WIN32
// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

// Generate a temporary filename
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}
#endif

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    return atomic_write_file(path, std::vector<uint8_t>(content.begin(), content.end()));
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content) {
    AtomicWriteResult result;

#ifdef _WIN32
    std::string temp_path = path + ".tmp";

    std::ofstream temp_file(temp_path, std::ios::binary);
    if (!temp_file) {
        result.error = "failed to create temp file";
        return result;
    }

    temp_file.write(reinterpret_cast<const char*>(content.data()),
                    static_cast<std::streamsize>(content.size()));
    temp_file.flush();
    temp_file.close();

    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to rename temp file";
        return result;
    }

    result.ok = true;
#else
    // POSIX: temp + fsync(file) + rename + fsync(dir)
    std::string dir_path = get_parent_directory(path);
    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    ssize_t written = write(fd, content.data(), content.size());
    if (written < 0 || static_cast<size_t>(written) != content.size()) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to write content";
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
#endif

    return result;
}

AtomicWriteResult atomic_rename(const std::string& from, const std::string& to) {
    AtomicWriteResult result;

    std::error_code ec;
    if (fs::exists(to, ec)) {
        result.error = "rename target already exists: " + to;
        return result;
    }

    fs::rename(from, to, ec);
    if (ec) {
        result.error = "failed to rename " + from + " -> " + to + ": " + ec.message();
        return result;
    }

#ifndef _WIN32
    std::string from_parent = get_parent_directory(from);
    std::string to_parent = get_parent_directory(to);
    if (!to_parent.empty()) {
        fsync_directory(to_parent);
    }
    if (!from_parent.empty() && from_parent != to_parent) {
        fsync_directory(from_parent);
    }
#endif

    result.ok = true;
    return result;
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path().filename().string());
    }
    std::sort(entries.begin(), entries.end());

    return entries;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_directory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    return !ec;
}

ReadResult read_file_bytes(const std::string& path) {
    ReadResult result;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + path;
        return result;
    }

    result.data = std::vector<uint8_t>(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>());

    if (file.bad()) {
        result.data.clear();
        result.error = "failed to read file: " + path;
        return result;
    }

    result.ok = true;
    return result;
}

std::optional<std::string> read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;

    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

uint64_t directory_size(const std::string& path) {
    uint64_t total = 0;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return 0;

    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            auto size = it->file_size(entry_ec);
            if (!entry_ec) total += size;
        }
    }

    return total;
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

int64_t current_time_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace exampack
