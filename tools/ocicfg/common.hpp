/**
 * ocicfg CLI - Common utilities and types
 */

#pragma once

#include <ocicfg/errors.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <iostream>
#include <string>

namespace ocicfg::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

inline void configure_logging(const GlobalOptions& opts) {
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet || opts.json) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_error(const Error& err, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = err.message();
        j["code"] = error_code_to_string(err.code());
        if (!err.subject().empty()) {
            j["subject"] = err.subject();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << err.message() << std::endl;
    }
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

/**
 * Parse an image argument into layout path and tag.
 * Format: "path" or "path:tag" (tag defaults to "latest")
 */
struct ImageRef {
    std::string layout;
    std::string tag;
};

/**
 * Tag grammar of an image layout ref name: alphanumeric runs joined by one
 * of "-._@+" or by "--". A tag cannot contain '/' or ':' here because the
 * argument is split on the last ':' after the last '/'.
 */
inline bool is_valid_tag(const std::string& tag) {
    auto alnum = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; };
    auto separator = [](char c) {
        return c == '-' || c == '.' || c == '_' || c == '@' || c == '+';
    };

    if (tag.empty() || !alnum(tag.front()) || !alnum(tag.back())) return false;
    for (size_t i = 0; i < tag.size(); ++i) {
        char c = tag[i];
        if (alnum(c)) continue;
        if (!separator(c)) return false;
        if (separator(tag[i - 1]) && !(c == '-' && tag[i - 1] == '-' &&
                                       (i < 2 || tag[i - 2] != '-'))) {
            return false;
        }
    }
    return true;
}

inline Result<ImageRef> parse_image_ref(const std::string& image) {
    ImageRef ref;

    // A colon inside a directory component belongs to the path
    auto colon = image.rfind(':');
    auto slash = image.rfind('/');
    if (colon != std::string::npos && colon > 0 &&
        (slash == std::string::npos || colon > slash)) {
        ref.layout = image.substr(0, colon);
        ref.tag = image.substr(colon + 1);
        if (!is_valid_tag(ref.tag)) {
            return Result<ImageRef>::err(Error(ErrorCode::NOT_FOUND,
                "invalid --image tag '" + ref.tag + "'", ref.tag));
        }
    } else {
        ref.layout = image;
        ref.tag = "latest";
    }

    if (ref.layout.empty()) {
        return Result<ImageRef>::err(Error(ErrorCode::NOT_FOUND, "--image path is empty", image));
    }
    return Result<ImageRef>::ok(std::move(ref));
}

} // namespace ocicfg::cli
