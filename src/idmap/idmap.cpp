#include "ocicfg/idmap.hpp"
#include "ocicfg/text_utils.hpp"

#include <spdlog/spdlog.h>

namespace ocicfg {

namespace {

constexpr uint64_t kIdLimit = 1ULL << 32;

Error invalid_mapping(const std::string& directive, const std::string& reason) {
    return Error(ErrorCode::INVALID_MAPPING,
                 "invalid mapping '" + directive + "': " + reason, directive);
}

bool ranges_overlap(uint32_t a_start, uint32_t b_start, uint32_t size_a, uint32_t size_b) {
    uint64_t a_end = static_cast<uint64_t>(a_start) + size_a;
    uint64_t b_end = static_cast<uint64_t>(b_start) + size_b;
    return a_start < b_end && b_start < a_end;
}

std::string format_mapping(const IdMapping& m) {
    return std::to_string(m.container_id) + ":" + std::to_string(m.host_id) + ":" + std::to_string(m.size);
}

// Reason a single range is unusable; empty when it is fine
std::string range_problem(const IdMapping& m) {
    if (m.size == 0) return "size must be greater than zero";
    if (static_cast<uint64_t>(m.container_id) + m.size > kIdLimit ||
        static_cast<uint64_t>(m.host_id) + m.size > kIdLimit) {
        return "range exceeds the 32-bit id space";
    }
    return {};
}

Result<std::vector<IdMapping>> parse_mapping_set(const std::vector<std::string>& directives,
                                                 const std::string& kind) {
    std::vector<IdMapping> mappings;

    for (const auto& directive : directives) {
        auto parsed = parse_id_mapping(directive);
        if (parsed.isErr()) {
            return Result<std::vector<IdMapping>>::err(
                parsed.error().withContext("failure parsing --" + kind + "-map"));
        }
        mappings.push_back(parsed.value());
    }

    auto valid = validate_mappings(mappings, kind);
    if (valid.isErr()) return Result<std::vector<IdMapping>>::err(valid.error());

    return Result<std::vector<IdMapping>>::ok(std::move(mappings));
}

} // namespace

bool operator==(const IdMapping& a, const IdMapping& b) {
    return a.container_id == b.container_id && a.host_id == b.host_id && a.size == b.size;
}

Result<IdMapping> parse_id_mapping(const std::string& directive) {
    auto parts = split(directive, ':');
    if (parts.size() != 2 && parts.size() != 3) {
        return Result<IdMapping>::err(
            invalid_mapping(directive, "expected <container>:<host>[:<size>]"));
    }

    auto container_id = parse_id(parts[0]);
    if (!container_id) {
        return Result<IdMapping>::err(invalid_mapping(directive, "invalid container id"));
    }

    auto host_id = parse_id(parts[1]);
    if (!host_id) {
        return Result<IdMapping>::err(invalid_mapping(directive, "invalid host id"));
    }

    uint32_t size = 1;
    if (parts.size() == 3) {
        auto parsed_size = parse_id(parts[2]);
        if (!parsed_size) {
            return Result<IdMapping>::err(invalid_mapping(directive, "invalid size"));
        }
        size = *parsed_size;
    }

    IdMapping mapping;
    mapping.container_id = *container_id;
    mapping.host_id = *host_id;
    mapping.size = size;

    auto problem = range_problem(mapping);
    if (!problem.empty()) {
        return Result<IdMapping>::err(invalid_mapping(directive, problem));
    }
    return Result<IdMapping>::ok(mapping);
}

Result<void> validate_mappings(const std::vector<IdMapping>& mappings, const std::string& kind) {
    for (size_t i = 0; i < mappings.size(); ++i) {
        const auto& m = mappings[i];

        auto problem = range_problem(m);
        if (!problem.empty()) {
            return Result<void>::err(invalid_mapping(format_mapping(m), problem)
                                         .withContext("invalid --" + kind + "-map"));
        }

        for (size_t j = 0; j < i; ++j) {
            const auto& other = mappings[j];
            if (ranges_overlap(m.container_id, other.container_id, m.size, other.size)) {
                return Result<void>::err(invalid_mapping(format_mapping(m),
                    "container range overlaps --" + kind + "-map " + format_mapping(other)));
            }
            if (ranges_overlap(m.host_id, other.host_id, m.size, other.size)) {
                return Result<void>::err(invalid_mapping(format_mapping(m),
                    "host range overlaps --" + kind + "-map " + format_mapping(other)));
            }
        }
    }
    return Result<void>::ok();
}

Result<MapOptions> parse_idmap_options(const IdmapDirectives& directives) {
    MapOptions options;
    options.rootless = directives.rootless;

    std::vector<std::string> uid_maps = directives.uid_maps;
    std::vector<std::string> gid_maps = directives.gid_maps;

    // Rootless containers need at least the invoking user mapped to root
    if (directives.rootless) {
        if (uid_maps.empty()) uid_maps.push_back("0:" + std::to_string(directives.euid) + ":1");
        if (gid_maps.empty()) gid_maps.push_back("0:" + std::to_string(directives.egid) + ":1");
    }

    auto uids = parse_mapping_set(uid_maps, "uid");
    if (uids.isErr()) return Result<MapOptions>::err(uids.error());
    options.uid_mappings = std::move(uids.value());

    auto gids = parse_mapping_set(gid_maps, "gid");
    if (gids.isErr()) return Result<MapOptions>::err(gids.error());
    options.gid_mappings = std::move(gids.value());

    spdlog::debug("parsed mappings: map.uid=[{}] map.gid=[{}] rootless={}",
                  format_mappings(options.uid_mappings),
                  format_mappings(options.gid_mappings),
                  options.rootless);

    return Result<MapOptions>::ok(std::move(options));
}

std::optional<uint32_t> host_to_container(const std::vector<IdMapping>& mappings, uint32_t host_id) {
    if (mappings.empty()) return host_id;
    for (const auto& m : mappings) {
        if (host_id >= m.host_id && static_cast<uint64_t>(host_id) < static_cast<uint64_t>(m.host_id) + m.size) {
            return m.container_id + (host_id - m.host_id);
        }
    }
    return std::nullopt;
}

std::optional<uint32_t> container_to_host(const std::vector<IdMapping>& mappings, uint32_t container_id) {
    if (mappings.empty()) return container_id;
    for (const auto& m : mappings) {
        if (container_id >= m.container_id &&
            static_cast<uint64_t>(container_id) < static_cast<uint64_t>(m.container_id) + m.size) {
            return m.host_id + (container_id - m.container_id);
        }
    }
    return std::nullopt;
}

std::string format_mappings(const std::vector<IdMapping>& mappings) {
    std::string out;
    for (size_t i = 0; i < mappings.size(); ++i) {
        if (i > 0) out += ",";
        out += format_mapping(mappings[i]);
    }
    return out;
}

} // namespace ocicfg
