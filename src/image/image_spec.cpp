#include "ocicfg/image_spec.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace ocicfg {

namespace {

using json = nlohmann::json;

Error corrupt(const std::string& what, const std::string& message) {
    return Error(ErrorCode::CORRUPT, what + ": " + message, what);
}

// Optional string field; present-but-wrong-type is an error
bool read_string(const json& j, const std::string& key, std::string& out, std::string& error) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_string()) {
        error = key + " must be a string";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

bool read_string_array(const json& j, const std::string& key,
                       std::vector<std::string>& out, std::string& error) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_array()) {
        error = key + " must be an array";
        return false;
    }
    for (const auto& elem : j[key]) {
        if (!elem.is_string()) {
            error = key + " must contain only strings";
            return false;
        }
        out.push_back(elem.get<std::string>());
    }
    return true;
}

bool read_string_map(const json& j, const std::string& key,
                     std::map<std::string, std::string>& out, std::string& error) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_object()) {
        error = key + " must be an object";
        return false;
    }
    for (auto& [k, v] : j[key].items()) {
        if (!v.is_string()) {
            error = key + "." + k + " must be a string";
            return false;
        }
        out[k] = v.get<std::string>();
    }
    return true;
}

// Keys of an object-valued set such as ExposedPorts or Volumes ({"80/tcp": {}})
bool read_key_set(const json& j, const std::string& key,
                  std::vector<std::string>& out, std::string& error) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_object()) {
        error = key + " must be an object";
        return false;
    }
    for (auto& [k, _] : j[key].items()) {
        out.push_back(k);
    }
    std::sort(out.begin(), out.end());
    return true;
}

} // namespace

bool descriptor_from_json(const json& j, Descriptor& out, std::string& error) {
    if (!j.is_object()) {
        error = "descriptor must be an object";
        return false;
    }

    if (!j.contains("mediaType") || !j["mediaType"].is_string()) {
        error = "descriptor mediaType missing";
        return false;
    }
    out.media_type = j["mediaType"].get<std::string>();

    if (!j.contains("digest") || !j["digest"].is_string()) {
        error = "descriptor digest missing";
        return false;
    }
    out.digest = j["digest"].get<std::string>();

    if (!j.contains("size") || !j["size"].is_number_integer()) {
        error = "descriptor size missing";
        return false;
    }
    out.size = j["size"].get<int64_t>();

    if (!read_string_map(j, "annotations", out.annotations, error)) return false;

    if (j.contains("platform") && j["platform"].is_object()) {
        const auto& p = j["platform"];
        Platform platform;
        if (!read_string(p, "architecture", platform.architecture, error)) return false;
        if (!read_string(p, "os", platform.os, error)) return false;
        if (!read_string(p, "variant", platform.variant, error)) return false;
        out.platform = platform;
    }

    return true;
}

nlohmann::ordered_json descriptor_to_json(const Descriptor& descriptor) {
    nlohmann::ordered_json j;
    j["mediaType"] = descriptor.media_type;
    j["digest"] = descriptor.digest;
    j["size"] = descriptor.size;
    if (!descriptor.annotations.empty()) {
        j["annotations"] = descriptor.annotations;
    }
    if (descriptor.platform) {
        j["platform"]["architecture"] = descriptor.platform->architecture;
        j["platform"]["os"] = descriptor.platform->os;
        if (!descriptor.platform->variant.empty()) {
            j["platform"]["variant"] = descriptor.platform->variant;
        }
    }
    return j;
}

namespace {

bool check_schema_version(const json& j, int& out, std::string& error) {
    if (!j.contains("schemaVersion") || !j["schemaVersion"].is_number_integer()) {
        error = "schemaVersion missing";
        return false;
    }
    out = j["schemaVersion"].get<int>();
    if (out != 2) {
        error = "unsupported schemaVersion " + std::to_string(out);
        return false;
    }
    return true;
}

} // namespace

namespace media_type {

bool is_layer(const std::string& media_type) {
    return media_type == kLayer ||
           media_type == kLayerGzip ||
           media_type == kLayerZstd ||
           media_type == kLayerNonDistributable ||
           media_type == kLayerNonDistributableGzip ||
           media_type == kLayerNonDistributableZstd;
}

} // namespace media_type

Result<Manifest> parse_manifest(const std::string& json_str) {
    Manifest manifest;
    std::string error;

    try {
        auto j = json::parse(json_str);

        if (!j.is_object()) {
            return Result<Manifest>::err(corrupt("manifest", "JSON must be an object"));
        }

        if (!check_schema_version(j, manifest.schema_version, error)) {
            return Result<Manifest>::err(corrupt("manifest", error));
        }

        // mediaType is optional, but must not contradict the descriptor
        std::string declared;
        if (!read_string(j, "mediaType", declared, error)) {
            return Result<Manifest>::err(corrupt("manifest", error));
        }
        if (!declared.empty() && declared != media_type::kManifest) {
            return Result<Manifest>::err(corrupt("manifest", "mediaType mismatch: " + declared));
        }

        if (!j.contains("config")) {
            return Result<Manifest>::err(corrupt("manifest", "config descriptor missing"));
        }
        if (!descriptor_from_json(j["config"], manifest.config, error)) {
            return Result<Manifest>::err(corrupt("manifest", "config: " + error));
        }

        if (j.contains("layers") && !j["layers"].is_null()) {
            if (!j["layers"].is_array()) {
                return Result<Manifest>::err(corrupt("manifest", "layers must be an array"));
            }
            size_t i = 0;
            for (const auto& elem : j["layers"]) {
                Descriptor layer;
                if (!descriptor_from_json(elem, layer, error)) {
                    return Result<Manifest>::err(
                        corrupt("manifest", "layers[" + std::to_string(i) + "]: " + error));
                }
                manifest.layers.push_back(std::move(layer));
                ++i;
            }
        }

        if (!read_string_map(j, "annotations", manifest.annotations, error)) {
            return Result<Manifest>::err(corrupt("manifest", error));
        }
    } catch (const json::parse_error& e) {
        return Result<Manifest>::err(corrupt("manifest", std::string("parse error: ") + e.what()));
    } catch (const json::exception& e) {
        return Result<Manifest>::err(corrupt("manifest", std::string("JSON error: ") + e.what()));
    }

    return Result<Manifest>::ok(std::move(manifest));
}

Result<Index> parse_index(const std::string& json_str) {
    Index index;
    std::string error;

    try {
        auto j = json::parse(json_str);

        if (!j.is_object()) {
            return Result<Index>::err(corrupt("index", "JSON must be an object"));
        }

        if (!check_schema_version(j, index.schema_version, error)) {
            return Result<Index>::err(corrupt("index", error));
        }

        if (j.contains("manifests") && !j["manifests"].is_null()) {
            if (!j["manifests"].is_array()) {
                return Result<Index>::err(corrupt("index", "manifests must be an array"));
            }
            size_t i = 0;
            for (const auto& elem : j["manifests"]) {
                Descriptor d;
                if (!descriptor_from_json(elem, d, error)) {
                    return Result<Index>::err(
                        corrupt("index", "manifests[" + std::to_string(i) + "]: " + error));
                }
                index.manifests.push_back(std::move(d));
                ++i;
            }
        }

        if (!read_string_map(j, "annotations", index.annotations, error)) {
            return Result<Index>::err(corrupt("index", error));
        }
    } catch (const json::parse_error& e) {
        return Result<Index>::err(corrupt("index", std::string("parse error: ") + e.what()));
    } catch (const json::exception& e) {
        return Result<Index>::err(corrupt("index", std::string("JSON error: ") + e.what()));
    }

    return Result<Index>::ok(std::move(index));
}

Result<ImageConfig> parse_image_config(const std::string& json_str) {
    ImageConfig image;
    std::string error;

    try {
        auto j = json::parse(json_str);

        if (!j.is_object()) {
            return Result<ImageConfig>::err(corrupt("image config", "JSON must be an object"));
        }

        bool ok = read_string(j, "created", image.created, error) &&
                  read_string(j, "author", image.author, error) &&
                  read_string(j, "architecture", image.architecture, error) &&
                  read_string(j, "os", image.os, error);

        if (ok && j.contains("config") && !j["config"].is_null()) {
            const auto& c = j["config"];
            if (!c.is_object()) {
                error = "config must be an object";
                ok = false;
            } else {
                ok = read_string(c, "User", image.config.user, error) &&
                     read_key_set(c, "ExposedPorts", image.config.exposed_ports, error) &&
                     read_string_array(c, "Env", image.config.env, error) &&
                     read_string_array(c, "Entrypoint", image.config.entrypoint, error) &&
                     read_string_array(c, "Cmd", image.config.cmd, error) &&
                     read_key_set(c, "Volumes", image.config.volumes, error) &&
                     read_string(c, "WorkingDir", image.config.working_dir, error) &&
                     read_string_map(c, "Labels", image.config.labels, error) &&
                     read_string(c, "StopSignal", image.config.stop_signal, error);
            }
        }

        if (ok && j.contains("rootfs") && !j["rootfs"].is_null()) {
            const auto& r = j["rootfs"];
            if (!r.is_object()) {
                error = "rootfs must be an object";
                ok = false;
            } else {
                ok = read_string(r, "type", image.rootfs.type, error) &&
                     read_string_array(r, "diff_ids", image.rootfs.diff_ids, error);
            }
        }

        if (!ok) {
            return Result<ImageConfig>::err(corrupt("image config", error));
        }
    } catch (const json::parse_error& e) {
        return Result<ImageConfig>::err(corrupt("image config", std::string("parse error: ") + e.what()));
    } catch (const json::exception& e) {
        return Result<ImageConfig>::err(corrupt("image config", std::string("JSON error: ") + e.what()));
    }

    return Result<ImageConfig>::ok(std::move(image));
}

Result<DecodedBlob> decode_blob(const std::string& media_type, const std::string& data) {
    if (media_type == media_type::kManifest) {
        auto manifest = parse_manifest(data);
        if (manifest.isErr()) return Result<DecodedBlob>::err(manifest.error());
        return Result<DecodedBlob>::ok(DecodedBlob(std::move(manifest.value())));
    }

    if (media_type == media_type::kIndex) {
        auto index = parse_index(data);
        if (index.isErr()) return Result<DecodedBlob>::err(index.error());
        return Result<DecodedBlob>::ok(DecodedBlob(std::move(index.value())));
    }

    return Result<DecodedBlob>::ok(DecodedBlob(UnsupportedBlob{media_type}));
}

} // namespace ocicfg
