#include "ocicfg/digest.hpp"

#include <openssl/evp.h>

namespace ocicfg {

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

size_t expected_hex_length(const std::string& algorithm) {
    if (algorithm == "sha256") return 64;
    if (algorithm == "sha512") return 128;
    return 0;
}

const EVP_MD* digest_for(const std::string& algorithm) {
    if (algorithm == "sha256") return EVP_sha256();
    if (algorithm == "sha512") return EVP_sha512();
    return nullptr;
}

} // namespace

std::optional<ParsedDigest> parse_digest(const std::string& digest) {
    auto colon = digest.find(':');
    if (colon == std::string::npos) return std::nullopt;

    ParsedDigest parsed;
    parsed.algorithm = digest.substr(0, colon);
    parsed.encoded = digest.substr(colon + 1);

    size_t want = expected_hex_length(parsed.algorithm);
    if (want == 0 || parsed.encoded.size() != want) return std::nullopt;

    for (char c : parsed.encoded) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) return std::nullopt;
    }
    return parsed;
}

bool is_valid_digest(const std::string& digest) {
    return parse_digest(digest).has_value();
}

HashResult compute_digest(const std::string& algorithm, const std::string& data) {
    HashResult result;

    const EVP_MD* md = digest_for(algorithm);
    if (!md) {
        result.error = "unsupported digest algorithm: " + algorithm;
        return result;
    }

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "failed to create EVP context";
        return result;
    }

    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        result.error = "failed to initialize " + algorithm;
        return result;
    }

    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.error = "failed to update " + algorithm;
        return result;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "failed to finalize " + algorithm;
        return result;
    }

    result.ok = true;
    result.hex_digest = bytes_to_hex(hash, hash_len);
    return result;
}

std::string sha256_digest_of(const std::string& data) {
    auto hashed = compute_digest("sha256", data);
    if (!hashed.ok) return "";
    return "sha256:" + hashed.hex_digest;
}

} // namespace ocicfg
