#include "ocicfg/cas_engine.hpp"
#include "ocicfg/digest.hpp"
#include "ocicfg/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ocicfg {

namespace {

constexpr char kLayoutFile[] = "oci-layout";
constexpr char kIndexFile[] = "index.json";
constexpr char kBlobDirectory[] = "blobs";
constexpr char kImageLayoutVersion[] = "1.0.0";

// Nested indexes deeper than this are treated as a cycle
constexpr size_t kMaxWalkDepth = 16;

Error store_error(const std::string& message, const std::string& subject) {
    return Error(ErrorCode::STORE_ERROR, message, subject);
}

class DirEngine : public CasEngine {
public:
    DirEngine(std::string root, Index index)
        : root_(std::move(root)), index_(std::move(index)) {}

    ~DirEngine() override { close(); }

    DirEngine(const DirEngine&) = delete;
    DirEngine& operator=(const DirEngine&) = delete;

    Result<std::vector<DescriptorPath>> resolve_reference(const std::string& name) override {
        std::vector<DescriptorPath> paths;
        if (closed_) {
            return Result<std::vector<DescriptorPath>>::err(store_error("engine is closed", root_));
        }

        for (const auto& d : index_.manifests) {
            auto it = d.annotations.find(annotation::kRefName);
            if (it == d.annotations.end() || it->second != name) continue;

            DescriptorPath prefix;
            auto walked = walk(d, prefix, paths);
            if (walked.isErr()) {
                return Result<std::vector<DescriptorPath>>::err(walked.error());
            }
        }

        spdlog::debug("reference {} matched {} descriptor path(s)", name, paths.size());
        return Result<std::vector<DescriptorPath>>::ok(std::move(paths));
    }

    Result<Blob> fetch_blob(const Descriptor& descriptor) override {
        if (closed_) {
            return Result<Blob>::err(store_error("engine is closed", root_));
        }

        auto parsed = parse_digest(descriptor.digest);
        if (!parsed) {
            return Result<Blob>::err(
                store_error("invalid digest: " + descriptor.digest, descriptor.digest));
        }

        std::string path = join_path(join_path(join_path(root_, kBlobDirectory), parsed->algorithm),
                                     parsed->encoded);
        auto read = read_file(path);
        if (!read.ok) {
            return Result<Blob>::err(
                store_error("read blob " + descriptor.digest + ": " + read.error, descriptor.digest));
        }

        if (static_cast<int64_t>(read.content.size()) != descriptor.size) {
            return Result<Blob>::err(store_error(
                "blob " + descriptor.digest + " size mismatch: expected " +
                    std::to_string(descriptor.size) + ", got " + std::to_string(read.content.size()),
                descriptor.digest));
        }

        auto hashed = compute_digest(parsed->algorithm, read.content);
        if (!hashed.ok) {
            return Result<Blob>::err(store_error(hashed.error, descriptor.digest));
        }
        if (hashed.hex_digest != parsed->encoded) {
            return Result<Blob>::err(store_error(
                "blob " + descriptor.digest + " digest mismatch: got " + parsed->algorithm + ":" +
                    hashed.hex_digest,
                descriptor.digest));
        }

        Blob blob;
        blob.descriptor = descriptor;
        blob.data = std::move(read.content);
        return Result<Blob>::ok(std::move(blob));
    }

    void close() override {
        if (!closed_) {
            spdlog::debug("closing image layout {}", root_);
            closed_ = true;
        }
    }

private:
    // Expand index descriptors; everything else terminates a path
    Result<void> walk(const Descriptor& d, DescriptorPath prefix, std::vector<DescriptorPath>& out) {
        prefix.walk.push_back(d);

        if (d.media_type != media_type::kIndex) {
            out.push_back(std::move(prefix));
            return Result<void>::ok();
        }

        if (prefix.walk.size() > kMaxWalkDepth) {
            return Result<void>::err(store_error("index nesting too deep at " + d.digest, d.digest));
        }

        auto blob = fetch_blob(d);
        if (blob.isErr()) return Result<void>::err(blob.error());

        auto child = parse_index(blob.value().data);
        if (child.isErr()) {
            return Result<void>::err(
                store_error("nested index " + d.digest + ": " + child.error().message(), d.digest));
        }

        for (const auto& m : child.value().manifests) {
            auto walked = walk(m, prefix, out);
            if (walked.isErr()) return walked;
        }
        return Result<void>::ok();
    }

    std::string root_;
    Index index_;
    bool closed_ = false;
};

} // namespace

Result<std::unique_ptr<CasEngine>> open_dir_engine(const std::string& layout_path) {
    using EngineResult = Result<std::unique_ptr<CasEngine>>;

    if (!is_directory(layout_path)) {
        return EngineResult::err(store_error("image layout not found: " + layout_path, layout_path));
    }

    auto layout = read_file(join_path(layout_path, kLayoutFile));
    if (!layout.ok) {
        return EngineResult::err(store_error("read oci-layout: " + layout.error, layout_path));
    }

    try {
        auto j = nlohmann::json::parse(layout.content);
        if (!j.is_object() || !j.contains("imageLayoutVersion") ||
            !j["imageLayoutVersion"].is_string()) {
            return EngineResult::err(store_error("oci-layout: imageLayoutVersion missing", layout_path));
        }
        auto version = j["imageLayoutVersion"].get<std::string>();
        if (version != kImageLayoutVersion) {
            return EngineResult::err(
                store_error("unsupported imageLayoutVersion: " + version, layout_path));
        }
    } catch (const nlohmann::json::exception& e) {
        return EngineResult::err(store_error(std::string("oci-layout: ") + e.what(), layout_path));
    }

    auto index_file = read_file(join_path(layout_path, kIndexFile));
    if (!index_file.ok) {
        return EngineResult::err(store_error("read index.json: " + index_file.error, layout_path));
    }

    auto index = parse_index(index_file.content);
    if (index.isErr()) {
        return EngineResult::err(store_error(index.error().message(), layout_path));
    }

    spdlog::debug("opened image layout {} ({} top-level descriptors)",
                  layout_path, index.value().manifests.size());

    std::unique_ptr<CasEngine> engine(new DirEngine(layout_path, std::move(index.value())));
    return EngineResult::ok(std::move(engine));
}

} // namespace ocicfg
