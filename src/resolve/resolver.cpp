#include "ocicfg/resolver.hpp"

#include <spdlog/spdlog.h>

namespace ocicfg {

Result<ResolvedManifest> resolve_manifest(CasEngine& engine, const std::string& reference) {
    using ResolveResult = Result<ResolvedManifest>;

    if (reference.empty()) {
        return ResolveResult::err(Error(ErrorCode::NOT_FOUND, "tag not found: (empty)", reference));
    }

    auto paths = engine.resolve_reference(reference);
    if (paths.isErr()) {
        return ResolveResult::err(paths.error().withContext("get descriptor"));
    }

    auto& candidates = paths.value();
    if (candidates.empty()) {
        return ResolveResult::err(
            Error(ErrorCode::NOT_FOUND, "tag not found: " + reference, reference));
    }
    if (candidates.size() != 1) {
        return ResolveResult::err(Error(ErrorCode::AMBIGUOUS,
            "tag is ambiguous: " + reference + " (" + std::to_string(candidates.size()) +
                " descriptor paths)",
            reference));
    }

    ResolvedManifest resolved;
    resolved.path = std::move(candidates.front());

    const auto& leaf = resolved.path.descriptor();
    spdlog::debug("resolved {} to {} ({})", reference, leaf.digest, leaf.media_type);

    auto blob = engine.fetch_blob(leaf);
    if (blob.isErr()) {
        return ResolveResult::err(blob.error().withContext("get manifest"));
    }

    auto decoded = decode_blob(blob.value().media_type(), blob.value().data);
    if (decoded.isErr()) {
        return ResolveResult::err(decoded.error().withContext("get manifest " + leaf.digest));
    }

    if (auto* manifest = std::get_if<Manifest>(&decoded.value())) {
        resolved.manifest = std::move(*manifest);
        return ResolveResult::ok(std::move(resolved));
    }

    // Index (only reachable through a store that does not expand indexes) or
    // anything else: only image manifests are supported here.
    const std::string& actual = blob.value().media_type();
    return ResolveResult::err(Error(ErrorCode::UNSUPPORTED_MEDIA_TYPE,
        "descriptor does not point to " + std::string(media_type::kManifest) +
            ": not implemented: " + actual,
        actual));
}

} // namespace ocicfg
