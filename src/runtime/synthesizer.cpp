#include "ocicfg/synthesizer.hpp"
#include "ocicfg/layer_walk.hpp"
#include "ocicfg/path_utils.hpp"
#include "ocicfg/platform.hpp"
#include "ocicfg/text_utils.hpp"
#include "ocicfg/user_lookup.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

namespace ocicfg {

namespace {

const std::vector<std::string> kVolumeMountOptions = {"rw", "nosuid", "nodev", "noexec", "relatime"};

std::string join_strings(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string format_octal(uint32_t mode) {
    std::ostringstream out;
    out << std::oct << mode;
    std::string s = out.str();
    while (s.size() < 4) s = "0" + s;
    return s;
}

// Resolve an in-image path inside rootfs. Symlinks are followed as the
// container would see them, so none of them can point outside rootfs.
Result<std::string> path_in_rootfs(const std::string& rootfs, const std::string& image_path) {
    auto resolved = resolve_in_root(rootfs, image_path);
    if (!resolved.ok) {
        return Result<std::string>::err(Error(ErrorCode::SECONDARY_FS_UNAVAILABLE,
            "cannot resolve " + image_path + " in rootfs: " + path_error_to_string(resolved.error),
            image_path));
    }
    return Result<std::string>::ok(std::move(resolved.path));
}

// Read an optional file from the rootfs. Missing is fine; present but
// unreadable means the rootfs cannot be trusted.
Result<std::optional<std::string>> read_rootfs_file(const std::string& rootfs, const std::string& image_path) {
    using ReadResult = Result<std::optional<std::string>>;

    auto path = path_in_rootfs(rootfs, image_path);
    if (path.isErr()) return ReadResult::err(path.error());

    auto read = read_file(path.value());
    if (read.ok) return ReadResult::ok(std::optional<std::string>(std::move(read.content)));
    if (read.not_found) return ReadResult::ok(std::nullopt);

    return ReadResult::err(Error(ErrorCode::SECONDARY_FS_UNAVAILABLE,
        "rootfs file unreadable: " + read.error, path.value()));
}

Result<ExecUser> resolve_process_user(const ImageConfig& image,
                                      const std::optional<std::string>& rootfs) {
    const std::string& user_spec = image.config.user;

    if (!rootfs) {
        auto user = get_exec_user(user_spec, std::nullopt, std::nullopt);
        if (user.isErr()) {
            spdlog::warn("could not parse user spec '{}' without a rootfs -- defaulting to root:root", user_spec);
            return Result<ExecUser>::ok(ExecUser{});
        }
        return user;
    }

    auto passwd = read_rootfs_file(*rootfs, "/etc/passwd");
    if (passwd.isErr()) return Result<ExecUser>::err(passwd.error());
    auto group = read_rootfs_file(*rootfs, "/etc/group");
    if (group.isErr()) return Result<ExecUser>::err(group.error());

    auto user = get_exec_user(user_spec, passwd.value(), group.value());
    if (user.isErr()) {
        return Result<ExecUser>::err(user.error().withContext("cannot parse user spec '" + user_spec + "'"));
    }
    return user;
}

Error mapping_error(const std::string& what, uint32_t id, const std::string& kind) {
    return Error(ErrorCode::MAPPING_APPLICATION_ERROR,
                 what + " " + std::to_string(id) + " is outside every --" + kind + "-map range",
                 std::to_string(id));
}

// The process user is in container space; with a non-identity mapping every
// id must be reachable through the mapping or the runtime cannot honour it.
Result<void> check_user_mapped(const RuntimeUser& user, const MapOptions& options) {
    if (options.is_identity()) return Result<void>::ok();

    if (!container_to_host(options.uid_mappings, user.uid)) {
        return Result<void>::err(mapping_error("process uid", user.uid, "uid"));
    }
    if (!container_to_host(options.gid_mappings, user.gid)) {
        return Result<void>::err(mapping_error("process gid", user.gid, "gid"));
    }
    for (uint32_t gid : user.additional_gids) {
        if (!container_to_host(options.gid_mappings, gid)) {
            return Result<void>::err(mapping_error("additional gid", gid, "gid"));
        }
    }
    return Result<void>::ok();
}

// Volume directories that exist in the rootfs keep their on-disk ownership.
// On-disk ids are host ids and are translated into container space.
Result<void> apply_volume_ownership(RuntimeConfig& config, const ImageConfig& image,
                                    const std::string& rootfs, const MapOptions& options) {
    for (const auto& volume : image.config.volumes) {
        auto path = path_in_rootfs(rootfs, volume);
        if (path.isErr()) {
            spdlog::warn("{}, ignoring its ownership", path.error().message());
            continue;
        }

        auto owner = lstat_ownership(path.value());
        if (!owner || !owner->is_directory || owner->is_symlink) {
            spdlog::debug("volume {} is not a directory in the rootfs", volume);
            continue;
        }

        auto uid = host_to_container(options.uid_mappings, owner->uid);
        if (!uid) {
            return Result<void>::err(mapping_error("owner uid of " + volume, owner->uid, "uid"));
        }
        auto gid = host_to_container(options.gid_mappings, owner->gid);
        if (!gid) {
            return Result<void>::err(mapping_error("owner gid of " + volume, owner->gid, "gid"));
        }

        for (auto& mount : config.mounts) {
            if (mount.destination != volume) continue;
            mount.options.push_back("mode=" + format_octal(owner->mode));
            mount.options.push_back("uid=" + std::to_string(*uid));
            mount.options.push_back("gid=" + std::to_string(*gid));
        }
    }
    return Result<void>::ok();
}

// uid= and gid= mount options name container ids, as the process user does.
// Under a mapping each one needs a host id or the mount cannot be set up.
Result<void> check_mount_ownership(const RuntimeConfig& config, const MapOptions& options) {
    for (const auto& mount : config.mounts) {
        for (const auto& option : mount.options) {
            bool is_uid = option.compare(0, 4, "uid=") == 0;
            bool is_gid = option.compare(0, 4, "gid=") == 0;
            if (!is_uid && !is_gid) continue;

            auto id = parse_id(option.substr(4));
            if (!id) {
                return Result<void>::err(Error(ErrorCode::MAPPING_APPLICATION_ERROR,
                    "mount " + mount.destination + " has a malformed option " + option, option));
            }
            const auto& mappings = is_uid ? options.uid_mappings : options.gid_mappings;
            if (!container_to_host(mappings, *id)) {
                return Result<void>::err(Error(ErrorCode::MAPPING_APPLICATION_ERROR,
                    "mount " + mount.destination + " option " + option + " is outside every --" +
                        (is_uid ? "uid" : "gid") + "-map range",
                    std::to_string(*id)));
            }
        }
    }
    return Result<void>::ok();
}

} // namespace

void apply_image_config(RuntimeConfig& config, const ImageConfig& image) {
    const auto& c = image.config;

    config.root.path = "rootfs";
    config.root.readonly = false;

    config.process.terminal = true;
    config.process.cwd = c.working_dir.empty() ? "/" : c.working_dir;

    if (!c.env.empty()) {
        config.process.env.clear();
        for (const auto& entry : c.env) {
            auto eq = entry.find('=');
            if (eq == std::string::npos) {
                set_process_env(config, entry, "");
            } else {
                set_process_env(config, entry.substr(0, eq), entry.substr(eq + 1));
            }
        }
    }

    std::vector<std::string> args = c.entrypoint;
    args.insert(args.end(), c.cmd.begin(), c.cmd.end());
    if (!args.empty()) {
        config.process.args = std::move(args);
    }

    for (const auto& volume : c.volumes) {
        config.mounts.push_back({volume, "tmpfs", "none", kVolumeMountOptions});
    }

    // Labels override anything already annotated (e.g. manifest annotations)
    if (!image.os.empty()) config.annotations[annotation::kOS] = image.os;
    if (!image.architecture.empty()) config.annotations[annotation::kArchitecture] = image.architecture;
    if (!image.author.empty()) config.annotations[annotation::kAuthor] = image.author;
    if (!image.created.empty()) config.annotations[annotation::kCreated] = image.created;
    if (!c.stop_signal.empty()) config.annotations[annotation::kStopSignal] = c.stop_signal;
    if (!c.exposed_ports.empty()) {
        config.annotations[annotation::kExposedPorts] = join_strings(c.exposed_ports, ",");
    }
    for (const auto& [key, value] : c.labels) {
        config.annotations[key] = value;
    }
}

Result<RuntimeConfig> synthesize_runtime_config(CasEngine& engine,
                                                const Manifest& manifest,
                                                const Meta& meta,
                                                const std::optional<std::string>& rootfs) {
    using SynthResult = Result<RuntimeConfig>;

    auto version_ok = check_meta_version(meta);
    if (version_ok.isErr()) return SynthResult::err(version_ok.error());

    if (rootfs) {
        if (!is_readable_directory(*rootfs)) {
            return SynthResult::err(Error(ErrorCode::SECONDARY_FS_UNAVAILABLE,
                "rootfs is not a readable directory: " + *rootfs, *rootfs));
        }
        spdlog::warn("using {} as a secondary source of truth; the result may differ from "
                     "an unpack-based generation", *rootfs);
    }

    // Image config
    if (manifest.config.media_type != media_type::kConfig) {
        return SynthResult::err(Error(ErrorCode::UNSUPPORTED_MEDIA_TYPE,
            "config descriptor does not point to " + std::string(media_type::kConfig) +
                ": not implemented: " + manifest.config.media_type,
            manifest.config.media_type));
    }

    auto config_blob = engine.fetch_blob(manifest.config);
    if (config_blob.isErr()) {
        return SynthResult::err(config_blob.error().withContext("get config"));
    }

    auto image = parse_image_config(config_blob.value().data);
    if (image.isErr()) {
        return SynthResult::err(image.error().withContext("get config " + manifest.config.digest));
    }
    const ImageConfig& ic = image.value();

    auto layers = walk_layers(manifest, ic);
    if (layers.isErr()) return SynthResult::err(layers.error());
    spdlog::debug("image has {} layer(s) in overlay order", layers.value().size());

    spdlog::info("generating config.json");

    RuntimeConfig config = default_runtime_config();
    config.annotations = manifest.annotations;
    apply_image_config(config, ic);

    // Process user
    auto user = resolve_process_user(ic, rootfs);
    if (user.isErr()) return SynthResult::err(user.error());

    config.process.user.uid = user.value().uid;
    config.process.user.gid = user.value().gid;
    config.process.user.additional_gids = user.value().additional_gids;
    if (!user.value().home.empty()) {
        bool has_home = false;
        for (const auto& entry : config.process.env) {
            if (entry.compare(0, 5, "HOME=") == 0) has_home = true;
        }
        if (!has_home) set_process_env(config, "HOME", user.value().home);
    }

    // Mapping options
    const MapOptions& options = meta.map_options;

    auto mapped = check_user_mapped(config.process.user, options);
    if (mapped.isErr()) return SynthResult::err(mapped.error());

    if (rootfs) {
        auto owned = apply_volume_ownership(config, ic, *rootfs, options);
        if (owned.isErr()) return SynthResult::err(owned.error());
    }

    // Rootless drops these options altogether
    if (!options.is_identity() && !options.rootless) {
        auto mounts_ok = check_mount_ownership(config, options);
        if (mounts_ok.isErr()) return SynthResult::err(mounts_ok.error());
    }

    if (!options.is_identity()) {
        add_or_replace_namespace(config, "user");
        config.linux_.uid_mappings = options.uid_mappings;
        config.linux_.gid_mappings = options.gid_mappings;
    }

    if (options.rootless) {
        to_rootless(config);
    }

    return SynthResult::ok(std::move(config));
}

Result<void> write_runtime_config(const RuntimeConfig& config, std::ostream& sink) {
    // Fully serialized before the first byte goes out
    std::string data = serialize_runtime_config(config);

    sink.write(data.data(), static_cast<std::streamsize>(data.size()));
    sink.flush();
    if (!sink) {
        return Result<void>::err(Error(ErrorCode::SINK_ERROR, "failed to write runtime config"));
    }
    return Result<void>::ok();
}

Result<void> write_runtime_config_file(const RuntimeConfig& config, const std::string& path) {
    std::string data = serialize_runtime_config(config);

    auto written = atomic_write_file(path, data);
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::SINK_ERROR,
            "opening config path " + path + ": " + written.error, path));
    }
    return Result<void>::ok();
}

} // namespace ocicfg
