#pragma once

/**
 * @file synthesizer.hpp
 * @brief Runtime configuration synthesis from a resolved image manifest
 *
 * The synthesizer reads the manifest's config blob, walks the layer list
 * (without reading layer content), and builds a RuntimeConfig in memory.
 * Writing is a separate step so a failed write can never leave a
 * half-synthesized document behind.
 *
 * When a root filesystem is supplied it is treated as the source of truth for
 * user resolution (/etc/passwd, /etc/group) and for the ownership of volume
 * mount points. Its values win over anything derived from the manifest, so
 * the result can differ from generating the config while unpacking the image.
 */

#include "ocicfg/cas_engine.hpp"
#include "ocicfg/errors.hpp"
#include "ocicfg/image_spec.hpp"
#include "ocicfg/meta.hpp"
#include "ocicfg/runtime_spec.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace ocicfg {

/**
 * @brief Build the runtime configuration for a manifest
 * @param engine Open store the manifest was resolved from (read only)
 * @param manifest The resolved image manifest
 * @param meta Envelope carrying the mapping options; must be kMetaVersion
 * @param rootfs Optional unpacked root filesystem used as source of truth
 *
 * Errors: META_VERSION_MISMATCH, SECONDARY_FS_UNAVAILABLE,
 * UNSUPPORTED_MEDIA_TYPE / CORRUPT for the config blob, LAYER_WALK_ERROR,
 * MAPPING_APPLICATION_ERROR, and STORE_ERROR passed through from the engine.
 */
Result<RuntimeConfig> synthesize_runtime_config(CasEngine& engine,
                                                const Manifest& manifest,
                                                const Meta& meta,
                                                const std::optional<std::string>& rootfs);

/// Apply an image config onto a runtime config (no rootfs, no mappings)
void apply_image_config(RuntimeConfig& config, const ImageConfig& image);

/// Serialize and write to a stream. A stream failure is SINK_ERROR; whatever
/// reached the stream must then be discarded by the caller.
Result<void> write_runtime_config(const RuntimeConfig& config, std::ostream& sink);

/// Serialize and write to a file through a temp file and rename. On failure
/// the destination is not created.
Result<void> write_runtime_config_file(const RuntimeConfig& config, const std::string& path);

} // namespace ocicfg
