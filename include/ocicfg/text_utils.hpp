#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ocicfg {

// Split on every occurrence of delim. Empty fields are kept, so "a::b"
// gives three parts and "" gives one empty part.
std::vector<std::string> split(const std::string& s, char delim);

// Parse a non-negative decimal id that fits in 32 bits. Signs, whitespace
// and trailing characters are rejected.
std::optional<uint32_t> parse_id(const std::string& s);

} // namespace ocicfg
