#include "ocicfg/path_utils.hpp"
#include "ocicfg/platform.hpp"
#include "ocicfg/text_utils.hpp"

#include <cerrno>
#include <deque>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace ocicfg {

namespace {

// Links followed before the walk is treated as a loop
constexpr int kMaxSymlinkHops = 255;
constexpr size_t kMaxLinkTarget = 4096;

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::string join_components(const std::string& root, const std::vector<std::string>& comps) {
    std::string rel;
    for (const auto& c : comps) {
        if (!rel.empty()) rel += "/";
        rel += c;
    }
    return rel.empty() ? root : join_path(root, rel);
}

void push_front_components(std::deque<std::string>& pending, const std::string& path) {
    auto parts = split(path, '/');
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        if (!it->empty() && *it != ".") pending.push_front(*it);
    }
}

} // namespace

PathResult resolve_in_root(const std::string& root, const std::string& unsafe_path) {
    if (contains_nul(root) || contains_nul(unsafe_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::vector<std::string> resolved;
    std::deque<std::string> pending;
    push_front_components(pending, unsafe_path);

    int hops = 0;
    while (!pending.empty()) {
        std::string part = std::move(pending.front());
        pending.pop_front();

        if (part == "..") {
            if (!resolved.empty()) resolved.pop_back();
            continue;
        }
        resolved.push_back(part);

        std::string current = join_components(root, resolved);
        struct stat st;
        if (::lstat(current.c_str(), &st) != 0) {
            // Nothing on disk to follow; the rest is taken lexically
            if (errno == ENOENT || errno == ENOTDIR) continue;
            return {false, {}, PathError::LstatFailed};
        }
        if (!S_ISLNK(st.st_mode)) continue;

        if (++hops > kMaxSymlinkHops) {
            return {false, {}, PathError::TooManySymlinks};
        }

        std::vector<char> buf(kMaxLinkTarget);
        ssize_t len = ::readlink(current.c_str(), buf.data(), buf.size());
        if (len < 0 || static_cast<size_t>(len) >= buf.size()) {
            return {false, {}, PathError::LstatFailed};
        }
        std::string target(buf.data(), static_cast<size_t>(len));

        resolved.pop_back();
        if (!target.empty() && target[0] == '/') {
            resolved.clear();
        }
        push_front_components(pending, target);
    }

    return {true, join_components(root, resolved), PathError::None};
}

const char* path_error_to_string(PathError error) {
    switch (error) {
        case PathError::None: return "none";
        case PathError::ContainsNul: return "path contains a NUL byte";
        case PathError::TooManySymlinks: return "too many levels of symbolic links";
        case PathError::LstatFailed: return "cannot inspect path component";
    }
    return "unknown path error";
}

} // namespace ocicfg
