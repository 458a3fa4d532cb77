#include "ocicfg/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ocicfg {

namespace fs = std::filesystem;

namespace {

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

// Generate a temporary filename next to the destination
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

// write(2) until everything is out or an error occurs
bool write_all(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;

    // temp + fsync(file) + rename + fsync(dir)
    std::string dir_path = get_parent_directory(path);
    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!write_all(fd, content.data(), content.size())) {
        result.error = "failed to write content: " + std::string(strerror(errno));
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    if (close(fd) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to close temp file: " + std::string(strerror(errno));
        return result;
    }

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        unlink(temp_path.c_str());
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
    return result;
}

ReadFileResult read_file(const std::string& path) {
    ReadFileResult result;

    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (ec) {
        result.error = "cannot stat " + path + ": " + ec.message();
        return result;
    }
    if (!exists) {
        result.not_found = true;
        result.error = "no such file: " + path;
        return result;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.error = "cannot open " + path + ": " + std::string(strerror(errno));
        return result;
    }

    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        result.error = "cannot read " + path;
        return result;
    }

    result.ok = true;
    result.content = ss.str();
    return result;
}

std::optional<FileOwnership> lstat_ownership(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }

    FileOwnership owner;
    owner.uid = static_cast<uint32_t>(st.st_uid);
    owner.gid = static_cast<uint32_t>(st.st_gid);
    owner.mode = static_cast<uint32_t>(st.st_mode & 07777);
    owner.is_directory = S_ISDIR(st.st_mode);
    owner.is_symlink = S_ISLNK(st.st_mode);
    return owner;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return p.string();
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_readable_directory(const std::string& path) {
    if (!is_directory(path)) return false;

    DIR* dir = opendir(path.c_str());
    if (!dir) return false;
    closedir(dir);
    return true;
}

} // namespace ocicfg
