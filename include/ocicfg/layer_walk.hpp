#pragma once

#include "ocicfg/errors.hpp"
#include "ocicfg/image_spec.hpp"

#include <string>
#include <vector>

namespace ocicfg {

// One entry of the overlay stack. Position 0 is the bottom layer; a later
// layer overrides earlier ones for any path both contain.
struct LayerEntry {
    size_t position = 0;
    std::string digest;
    std::string diff_id;
    std::string media_type;
    int64_t size = 0;
};

// Validate the manifest's layer sequence against the image config and return
// it in overlay order. Layer content is never read.
//
// LAYER_WALK_ERROR when a layer has a malformed digest, a negative size or a
// non-layer media type, when a diff_id is malformed, or when the number of
// layers differs from the number of rootfs.diff_ids.
Result<std::vector<LayerEntry>> walk_layers(const Manifest& manifest, const ImageConfig& image);

} // namespace ocicfg
