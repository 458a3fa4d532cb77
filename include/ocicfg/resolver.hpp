#pragma once

#include "ocicfg/cas_engine.hpp"
#include "ocicfg/errors.hpp"
#include "ocicfg/image_spec.hpp"

#include <string>

namespace ocicfg {

// ============================================================================
// Reference Resolution
// ============================================================================

struct ResolvedManifest {
    DescriptorPath path;
    Manifest manifest;
};

// Resolve a tag to exactly one image manifest.
//
//   no matching path          -> NOT_FOUND (no blob is fetched)
//   more than one path        -> AMBIGUOUS (never picks one)
//   leaf is not a manifest    -> UNSUPPORTED_MEDIA_TYPE (subject is the media type)
//   manifest does not decode  -> CORRUPT
//
// Errors from the store itself are passed through as STORE_ERROR.
Result<ResolvedManifest> resolve_manifest(CasEngine& engine, const std::string& reference);

} // namespace ocicfg
