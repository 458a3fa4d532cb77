#pragma once

#include "ocicfg/idmap.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ocicfg {

// ============================================================================
// OCI Runtime Configuration (runtime-spec config.json)
// ============================================================================

constexpr char kRuntimeSpecVersion[] = "1.0.2";

struct RuntimeUser {
    uint32_t uid = 0;
    uint32_t gid = 0;
    std::vector<uint32_t> additional_gids;
};

struct Rlimit {
    std::string type;
    uint64_t hard = 0;
    uint64_t soft = 0;
};

struct Mount {
    std::string destination;
    std::string type;
    std::string source;
    std::vector<std::string> options;
};

struct Namespace {
    std::string type;
    std::string path;
};

struct DeviceRule {
    bool allow = false;
    std::string access;
};

struct RuntimeConfig {
    std::string oci_version = kRuntimeSpecVersion;

    struct {
        bool terminal = false;
        RuntimeUser user;
        std::vector<std::string> args;
        std::vector<std::string> env;
        std::string cwd = "/";
        struct {
            std::vector<std::string> bounding;
            std::vector<std::string> effective;
            std::vector<std::string> inheritable;
            std::vector<std::string> permitted;
            std::vector<std::string> ambient;
        } capabilities;
        std::vector<Rlimit> rlimits;
        bool no_new_privileges = false;
    } process;

    struct {
        std::string path = "rootfs";
        bool readonly = false;
    } root;

    std::string hostname;
    std::vector<Mount> mounts;
    std::map<std::string, std::string> annotations;

    // "linux" is a predefined macro under GNU dialects, hence the underscore
    struct {
        std::vector<IdMapping> uid_mappings;
        std::vector<IdMapping> gid_mappings;
        std::optional<std::vector<DeviceRule>> resources_devices;  // nullopt drops "resources"
        std::vector<Namespace> namespaces;
        std::vector<std::string> masked_paths;
        std::vector<std::string> readonly_paths;
    } linux_;
};

// The baseline document every image config is applied on top of
RuntimeConfig default_runtime_config();

// Replace or append a namespace of the given type
void add_or_replace_namespace(RuntimeConfig& config, const std::string& type,
                              const std::string& path = "");

// Set "KEY=value" in process.env, replacing an existing KEY
void set_process_env(RuntimeConfig& config, const std::string& key, const std::string& value);

// Rewrite a document so an unprivileged runtime can use it: no additional
// gids, a user namespace instead of network/user, no /sys mounts or uid=/gid=
// mount options, /sys as a read-only rbind, a read-only /etc/resolv.conf
// bind mount, and no cgroup resources.
void to_rootless(RuntimeConfig& config);

// LinuxIDMapping array: [{"containerID", "hostID", "size"}, ...]
nlohmann::ordered_json id_mappings_to_json(const std::vector<IdMapping>& mappings);

// Serialize with the runtime-spec field names, in a stable order
nlohmann::ordered_json runtime_config_to_json(const RuntimeConfig& config);

// The exact bytes written to a sink
std::string serialize_runtime_config(const RuntimeConfig& config);

} // namespace ocicfg
