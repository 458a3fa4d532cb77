#pragma once

#include <optional>
#include <string>

namespace ocicfg {

// ============================================================================
// Content Digests
// ============================================================================
//
// Blob digests have the form "<algorithm>:<hex>". Only sha256 and sha512 are
// accepted, and the encoded part must be lowercase hex of the right length.
// Anything else is rejected before it is ever used to build a blob path.

struct ParsedDigest {
    std::string algorithm;  // "sha256" | "sha512"
    std::string encoded;    // lowercase hex
};

std::optional<ParsedDigest> parse_digest(const std::string& digest);

bool is_valid_digest(const std::string& digest);

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;  // lowercase hex
};

// Hash data with the named algorithm ("sha256" or "sha512") using OpenSSL EVP
HashResult compute_digest(const std::string& algorithm, const std::string& data);

// Convenience: "sha256:<hex>" of data
std::string sha256_digest_of(const std::string& data);

} // namespace ocicfg
