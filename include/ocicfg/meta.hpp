#pragma once

#include "ocicfg/errors.hpp"
#include "ocicfg/idmap.hpp"
#include "ocicfg/image_spec.hpp"

#include <string>

namespace ocicfg {

// ============================================================================
// Metadata Envelope
// ============================================================================

// Schema version of the envelope. Stages that consume a Meta refuse any other
// version; there is no forward compatibility.
constexpr char kMetaVersion[] = "2";

struct Meta {
    std::string version;
    DescriptorPath from;
    MapOptions map_options;
};

// A fresh envelope at the current version
Meta make_meta(DescriptorPath from, MapOptions map_options);

// META_VERSION_MISMATCH unless meta.version == kMetaVersion
Result<void> check_meta_version(const Meta& meta);

std::string serialize_meta_json(const Meta& meta);

// Parse an envelope. A version other than kMetaVersion is META_VERSION_MISMATCH;
// malformed JSON is CORRUPT.
Result<Meta> parse_meta_json(const std::string& json_str);

} // namespace ocicfg
