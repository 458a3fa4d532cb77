#include "ocicfg/text_utils.hpp"

#include <cctype>

namespace ocicfg {

namespace {

constexpr uint64_t kIdLimit = 1ULL << 32;

} // namespace

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == delim) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

std::optional<uint32_t> parse_id(const std::string& s) {
    if (s.empty() || s.size() > 10) return std::nullopt;
    uint64_t value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value >= kIdLimit) return std::nullopt;
    return static_cast<uint32_t>(value);
}

} // namespace ocicfg
