#include "ocicfg/layer_walk.hpp"
#include "ocicfg/digest.hpp"

#include <spdlog/spdlog.h>

namespace ocicfg {

namespace {

Error layer_error(size_t position, const std::string& subject, const std::string& reason) {
    return Error(ErrorCode::LAYER_WALK_ERROR,
                 "layer " + std::to_string(position) + ": " + reason, subject);
}

} // namespace

Result<std::vector<LayerEntry>> walk_layers(const Manifest& manifest, const ImageConfig& image) {
    using WalkResult = Result<std::vector<LayerEntry>>;

    const auto& diff_ids = image.rootfs.diff_ids;
    if (diff_ids.size() != manifest.layers.size()) {
        return WalkResult::err(Error(ErrorCode::LAYER_WALK_ERROR,
            "manifest lists " + std::to_string(manifest.layers.size()) +
                " layers but the image config has " + std::to_string(diff_ids.size()) + " diff_ids"));
    }

    std::vector<LayerEntry> stack;
    stack.reserve(manifest.layers.size());

    for (size_t i = 0; i < manifest.layers.size(); ++i) {
        const auto& layer = manifest.layers[i];

        if (!media_type::is_layer(layer.media_type)) {
            return WalkResult::err(
                layer_error(i, layer.media_type, "unsupported layer media type " + layer.media_type));
        }
        if (!is_valid_digest(layer.digest)) {
            return WalkResult::err(
                layer_error(i, layer.digest, "malformed digest '" + layer.digest + "'"));
        }
        if (layer.size < 0) {
            return WalkResult::err(layer_error(i, layer.digest, "negative size"));
        }
        if (!is_valid_digest(diff_ids[i])) {
            return WalkResult::err(
                layer_error(i, diff_ids[i], "malformed diff_id '" + diff_ids[i] + "'"));
        }

        LayerEntry entry;
        entry.position = i;
        entry.digest = layer.digest;
        entry.diff_id = diff_ids[i];
        entry.media_type = layer.media_type;
        entry.size = layer.size;
        stack.push_back(std::move(entry));
    }

    for (const auto& entry : stack) {
        spdlog::debug("overlay layer {}: {} (diff_id {})", entry.position, entry.digest, entry.diff_id);
    }

    return WalkResult::ok(std::move(stack));
}

} // namespace ocicfg
