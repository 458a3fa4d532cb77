#pragma once

#include "ocicfg/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ocicfg {

// ============================================================================
// UID/GID Mapping
// ============================================================================

// One contiguous range: container_id..container_id+size maps onto
// host_id..host_id+size
struct IdMapping {
    uint32_t container_id = 0;
    uint32_t host_id = 0;
    uint32_t size = 0;
};

bool operator==(const IdMapping& a, const IdMapping& b);

// Normalized mapping options, immutable once parsed. No mappings at all is
// the identity mapping.
struct MapOptions {
    std::vector<IdMapping> uid_mappings;
    std::vector<IdMapping> gid_mappings;
    bool rootless = false;

    bool is_identity() const { return uid_mappings.empty() && gid_mappings.empty(); }
};

// Raw user directives as given on the command line
struct IdmapDirectives {
    std::vector<std::string> uid_maps;  // "container:host[:size]"
    std::vector<std::string> gid_maps;
    bool rootless = false;

    // Effective ids of the invoking user; used for the rootless defaults
    uint32_t euid = 0;
    uint32_t egid = 0;
};

// Parse one "container:host[:size]" directive. Size defaults to 1.
Result<IdMapping> parse_id_mapping(const std::string& directive);

// Parse and validate a full set of directives. Overlapping container or host
// ranges within the uid set (or within the gid set) are INVALID_MAPPING.
Result<MapOptions> parse_idmap_options(const IdmapDirectives& directives);

// Check an already-typed mapping set, e.g. one read back from a meta
// envelope: every size non-zero, every range inside the 32-bit id space, and
// no overlap on either side. kind is "uid" or "gid" for the messages.
Result<void> validate_mappings(const std::vector<IdMapping>& mappings, const std::string& kind);

// Translate through a mapping set. An empty set is the identity. Returns
// nullopt when the id falls outside every range.
std::optional<uint32_t> host_to_container(const std::vector<IdMapping>& mappings, uint32_t host_id);
std::optional<uint32_t> container_to_host(const std::vector<IdMapping>& mappings, uint32_t container_id);

// "container:host:size,..." for logging
std::string format_mappings(const std::vector<IdMapping>& mappings);

} // namespace ocicfg
