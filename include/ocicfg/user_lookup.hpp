#pragma once

#include "ocicfg/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ocicfg {

// ============================================================================
// passwd(5) / group(5)
// ============================================================================

struct PasswdEntry {
    std::string name;
    uint32_t uid = 0;
    uint32_t gid = 0;
    std::string home;
    std::string shell;
};

struct GroupEntry {
    std::string name;
    uint32_t gid = 0;
    std::vector<std::string> members;
};

// Lines that are blank, comments or malformed are skipped
std::vector<PasswdEntry> parse_passwd(const std::string& content);
std::vector<GroupEntry> parse_group(const std::string& content);

// ============================================================================
// Exec User Resolution
// ============================================================================

struct ExecUser {
    uint32_t uid = 0;
    uint32_t gid = 0;
    std::vector<uint32_t> additional_gids;
    std::string home;  // empty unless a passwd entry matched
};

// Resolve an image "User" value ("", "user", "uid", "user:group", "uid:gid", ...).
//
// A user that matches a passwd entry by name or uid takes its uid, gid and
// home from that entry. With no explicit group, every group listing the
// matched user name as a member becomes an additional gid. An explicit group
// is looked up by name or gid in the group file. Names that match nothing
// are errors; numbers that match nothing are used as-is.
//
// passwd/group are nullopt when the file is unavailable, in which case only
// numeric values can be resolved.
Result<ExecUser> get_exec_user(const std::string& user_spec,
                               const std::optional<std::string>& passwd,
                               const std::optional<std::string>& group);

} // namespace ocicfg
