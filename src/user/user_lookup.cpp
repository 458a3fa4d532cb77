#include "ocicfg/user_lookup.hpp"
#include "ocicfg/text_utils.hpp"

#include <cctype>

namespace ocicfg {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Iterate content line by line, skipping blanks and comments
template<typename F>
void for_each_line(const std::string& content, F func) {
    for (const auto& raw : split(content, '\n')) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;
        func(line);
    }
}

} // namespace

std::vector<PasswdEntry> parse_passwd(const std::string& content) {
    std::vector<PasswdEntry> entries;

    // name:password:uid:gid:gecos:home:shell
    for_each_line(content, [&entries](const std::string& line) {
        auto fields = split(line, ':');
        if (fields.size() < 4) return;

        auto uid = parse_id(fields[2]);
        auto gid = parse_id(fields[3]);
        if (!uid || !gid) return;

        PasswdEntry entry;
        entry.name = fields[0];
        entry.uid = *uid;
        entry.gid = *gid;
        if (fields.size() > 5) entry.home = fields[5];
        if (fields.size() > 6) entry.shell = fields[6];
        entries.push_back(std::move(entry));
    });

    return entries;
}

std::vector<GroupEntry> parse_group(const std::string& content) {
    std::vector<GroupEntry> entries;

    // name:password:gid:member,member,...
    for_each_line(content, [&entries](const std::string& line) {
        auto fields = split(line, ':');
        if (fields.size() < 3) return;

        auto gid = parse_id(fields[2]);
        if (!gid) return;

        GroupEntry entry;
        entry.name = fields[0];
        entry.gid = *gid;
        if (fields.size() > 3 && !fields[3].empty()) {
            for (const auto& member : split(fields[3], ',')) {
                std::string m = trim(member);
                if (!m.empty()) entry.members.push_back(m);
            }
        }
        entries.push_back(std::move(entry));
    });

    return entries;
}

Result<ExecUser> get_exec_user(const std::string& user_spec,
                               const std::optional<std::string>& passwd,
                               const std::optional<std::string>& group) {
    ExecUser user;

    std::string user_arg = user_spec;
    std::string group_arg;
    auto colon = user_spec.find(':');
    if (colon != std::string::npos) {
        user_arg = user_spec.substr(0, colon);
        group_arg = user_spec.substr(colon + 1);
    }

    auto users = passwd ? parse_passwd(*passwd) : std::vector<PasswdEntry>{};
    // No user means uid 0, looked up like any other numeric user
    auto numeric_user = user_arg.empty() ? std::optional<uint32_t>(0) : parse_id(user_arg);

    const PasswdEntry* matched = nullptr;
    for (const auto& entry : users) {
        bool by_name = !user_arg.empty() && entry.name == user_arg;
        if (by_name || (numeric_user && entry.uid == *numeric_user)) {
            matched = &entry;
            break;
        }
    }

    if (matched) {
        user.uid = matched->uid;
        user.gid = matched->gid;
        user.home = matched->home;
    } else if (!numeric_user) {
        return Result<ExecUser>::err(Error(ErrorCode::CORRUPT,
            "unable to find user " + user_arg + ": no matching entries in passwd file",
            user_arg));
    } else {
        user.uid = *numeric_user;
    }

    // Groups are needed for an explicit group, or for the supplementary
    // groups of a user found in passwd.
    if (!group_arg.empty() || matched) {
        auto groups = group ? parse_group(*group) : std::vector<GroupEntry>{};

        if (!group_arg.empty()) {
            auto numeric_group = parse_id(group_arg);
            const GroupEntry* found = nullptr;
            for (const auto& entry : groups) {
                if (entry.name == group_arg || (numeric_group && entry.gid == *numeric_group)) {
                    found = &entry;
                    break;
                }
            }
            if (found) {
                user.gid = found->gid;
            } else if (numeric_group) {
                user.gid = *numeric_group;
            } else {
                return Result<ExecUser>::err(Error(ErrorCode::CORRUPT,
                    "unable to find group " + group_arg + ": no matching entries in group file",
                    group_arg));
            }
        } else {
            for (const auto& entry : groups) {
                for (const auto& member : entry.members) {
                    if (member == matched->name) {
                        user.additional_gids.push_back(entry.gid);
                        break;
                    }
                }
            }
        }
    }

    return Result<ExecUser>::ok(std::move(user));
}

} // namespace ocicfg
