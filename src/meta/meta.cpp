#include "ocicfg/meta.hpp"
#include "ocicfg/runtime_spec.hpp"

#include <nlohmann/json.hpp>

namespace ocicfg {

namespace {

constexpr uint64_t kIdLimit = 1ULL << 32;

bool mappings_from_json(const nlohmann::json& j, const std::string& key,
                        std::vector<IdMapping>& out, std::string& error) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_array()) {
        error = key + " must be an array";
        return false;
    }
    for (const auto& entry : j[key]) {
        if (!entry.is_object() ||
            !entry.contains("containerID") || !entry["containerID"].is_number_unsigned() ||
            !entry.contains("hostID") || !entry["hostID"].is_number_unsigned() ||
            !entry.contains("size") || !entry["size"].is_number_unsigned()) {
            error = key + " entries need containerID, hostID and size";
            return false;
        }
        uint64_t container_id = entry["containerID"].get<uint64_t>();
        uint64_t host_id = entry["hostID"].get<uint64_t>();
        uint64_t size = entry["size"].get<uint64_t>();
        if (container_id >= kIdLimit || host_id >= kIdLimit || size >= kIdLimit) {
            error = key + " entry is outside the 32-bit id space";
            return false;
        }
        IdMapping m;
        m.container_id = static_cast<uint32_t>(container_id);
        m.host_id = static_cast<uint32_t>(host_id);
        m.size = static_cast<uint32_t>(size);
        out.push_back(m);
    }
    return true;
}

} // namespace

Meta make_meta(DescriptorPath from, MapOptions map_options) {
    Meta meta;
    meta.version = kMetaVersion;
    meta.from = std::move(from);
    meta.map_options = std::move(map_options);
    return meta;
}

Result<void> check_meta_version(const Meta& meta) {
    if (meta.version != kMetaVersion) {
        return Result<void>::err(Error(ErrorCode::META_VERSION_MISMATCH,
            "unsupported metadata version '" + meta.version + "' (expected " + kMetaVersion + ")",
            meta.version));
    }
    return Result<void>::ok();
}

std::string serialize_meta_json(const Meta& meta) {
    nlohmann::ordered_json j;
    j["version"] = meta.version;

    nlohmann::ordered_json walk = nlohmann::ordered_json::array();
    for (const auto& d : meta.from.walk) {
        walk.push_back(descriptor_to_json(d));
    }
    j["from_descriptor_path"]["walk"] = walk;

    j["map_options"]["uid_mappings"] = id_mappings_to_json(meta.map_options.uid_mappings);
    j["map_options"]["gid_mappings"] = id_mappings_to_json(meta.map_options.gid_mappings);
    j["map_options"]["rootless"] = meta.map_options.rootless;

    return j.dump(2);
}

Result<Meta> parse_meta_json(const std::string& json_str) {
    Meta meta;
    std::string error;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            return Result<Meta>::err(Error(ErrorCode::CORRUPT, "meta: JSON must be an object"));
        }

        // Version first: a newer envelope is refused, not half-parsed
        if (!j.contains("version") || !j["version"].is_string()) {
            return Result<Meta>::err(Error(ErrorCode::CORRUPT, "meta: version missing"));
        }
        meta.version = j["version"].get<std::string>();
        auto version_ok = check_meta_version(meta);
        if (version_ok.isErr()) {
            return Result<Meta>::err(version_ok.error());
        }

        if (j.contains("from_descriptor_path") && j["from_descriptor_path"].is_object()) {
            const auto& from = j["from_descriptor_path"];
            if (from.contains("walk") && from["walk"].is_array()) {
                for (const auto& elem : from["walk"]) {
                    Descriptor d;
                    if (!descriptor_from_json(elem, d, error)) {
                        return Result<Meta>::err(Error(ErrorCode::CORRUPT, "meta: " + error));
                    }
                    meta.from.walk.push_back(std::move(d));
                }
            }
        }
        if (meta.from.walk.empty()) {
            return Result<Meta>::err(Error(ErrorCode::CORRUPT, "meta: from_descriptor_path is empty"));
        }

        if (j.contains("map_options") && j["map_options"].is_object()) {
            const auto& opts = j["map_options"];
            if (!mappings_from_json(opts, "uid_mappings", meta.map_options.uid_mappings, error) ||
                !mappings_from_json(opts, "gid_mappings", meta.map_options.gid_mappings, error)) {
                return Result<Meta>::err(Error(ErrorCode::CORRUPT, "meta: " + error));
            }
            // Same rules as mappings parsed from directives
            auto uids = validate_mappings(meta.map_options.uid_mappings, "uid");
            if (uids.isErr()) return Result<Meta>::err(uids.error().withContext("meta"));
            auto gids = validate_mappings(meta.map_options.gid_mappings, "gid");
            if (gids.isErr()) return Result<Meta>::err(gids.error().withContext("meta"));

            if (opts.contains("rootless") && opts["rootless"].is_boolean()) {
                meta.map_options.rootless = opts["rootless"].get<bool>();
            }
        }
    } catch (const nlohmann::json::parse_error& e) {
        return Result<Meta>::err(Error(ErrorCode::CORRUPT, std::string("meta: parse error: ") + e.what()));
    } catch (const nlohmann::json::exception& e) {
        return Result<Meta>::err(Error(ErrorCode::CORRUPT, std::string("meta: JSON error: ") + e.what()));
    }

    return Result<Meta>::ok(std::move(meta));
}

} // namespace ocicfg
