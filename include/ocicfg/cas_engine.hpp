#pragma once

/**
 * @file cas_engine.hpp
 * @brief Read-only access to a content-addressable OCI image store
 *
 * CasEngine is the boundary the resolution and synthesis pipeline calls
 * into. The directory-backed implementation reads an OCI image layout:
 *
 *   <layout>/oci-layout          {"imageLayoutVersion": "1.0.0"}
 *   <layout>/index.json          top-level image index
 *   <layout>/blobs/<alg>/<hex>   content-addressed blobs
 *
 * Nothing here ever writes to the store.
 */

#include "ocicfg/errors.hpp"
#include "ocicfg/image_spec.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ocicfg {

// Raw blob content together with the descriptor it was fetched through
struct Blob {
    Descriptor descriptor;
    std::string data;

    const std::string& media_type() const { return descriptor.media_type; }
};

/**
 * @brief Store accessor interface
 *
 * Implementations release their resources in close(); destroying an engine
 * closes it, so holding it in a std::unique_ptr gives scoped release on every
 * exit path.
 */
class CasEngine {
public:
    virtual ~CasEngine() = default;

    /**
     * @brief Find every descriptor path tagged with a reference name
     * @param name Value of the org.opencontainers.image.ref.name annotation
     * @return Zero, one or many paths. Nested indexes are expanded, so a
     *         multi-platform tag yields one path per platform manifest.
     */
    virtual Result<std::vector<DescriptorPath>> resolve_reference(const std::string& name) = 0;

    /// Fetch a blob, verifying its size and digest
    virtual Result<Blob> fetch_blob(const Descriptor& descriptor) = 0;

    virtual void close() = 0;
};

// Open an OCI image layout directory
Result<std::unique_ptr<CasEngine>> open_dir_engine(const std::string& layout_path);

} // namespace ocicfg
