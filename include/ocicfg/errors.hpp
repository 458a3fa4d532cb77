#pragma once

/**
 * @file errors.hpp
 * @brief Error and Result types shared by every ocicfg operation
 *
 * Every fallible operation returns a Result<T>. On failure the Error carries
 * an ErrorCode from the pipeline taxonomy and a message that names the failing
 * reference or path. Callers wrap errors with the operation that produced them
 * (withContext) and surface them unmodified; nothing is retried.
 *
 * @example
 * ```cpp
 * auto resolved = ocicfg::resolve_manifest(*engine, "latest");
 * if (resolved.isErr()) {
 *     std::cerr << resolved.error().withContext("resolve").toString() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace ocicfg {

// ============================================================================
// Error Codes
// ============================================================================

/**
 * @brief Error codes for ocicfg operations
 */
enum class ErrorCode {
    // Reference resolution
    NOT_FOUND,
    AMBIGUOUS,
    UNSUPPORTED_MEDIA_TYPE,
    CORRUPT,

    // Mapping options
    INVALID_MAPPING,

    // Synthesis
    LAYER_WALK_ERROR,
    SECONDARY_FS_UNAVAILABLE,
    MAPPING_APPLICATION_ERROR,
    META_VERSION_MISMATCH,

    // Output
    SINK_ERROR,

    // Content-addressable store (layout unreadable, blob missing, digest mismatch)
    STORE_ERROR,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::AMBIGUOUS: return "AMBIGUOUS";
        case ErrorCode::UNSUPPORTED_MEDIA_TYPE: return "UNSUPPORTED_MEDIA_TYPE";
        case ErrorCode::CORRUPT: return "CORRUPT";
        case ErrorCode::INVALID_MAPPING: return "INVALID_MAPPING";
        case ErrorCode::LAYER_WALK_ERROR: return "LAYER_WALK_ERROR";
        case ErrorCode::SECONDARY_FS_UNAVAILABLE: return "SECONDARY_FS_UNAVAILABLE";
        case ErrorCode::MAPPING_APPLICATION_ERROR: return "MAPPING_APPLICATION_ERROR";
        case ErrorCode::META_VERSION_MISMATCH: return "META_VERSION_MISMATCH";
        case ErrorCode::SINK_ERROR: return "SINK_ERROR";
        case ErrorCode::STORE_ERROR: return "STORE_ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Error type with code and message
 *
 * The subject is the reference, path or media type the error is about. It is
 * kept separately so callers and tests can inspect it without parsing the
 * message.
 */
class Error {
public:
    Error(ErrorCode code, std::string message, std::string subject = "")
        : code_(code), message_(std::move(message)), subject_(std::move(subject)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& subject() const { return subject_; }
    std::string toString() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
    std::string subject_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    // Wrap the error (if any) with the name of the failing operation
    Result& withContext(const std::string& context) {
        if (error_) error_->withContext(context);
        return *this;
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    Result& withContext(const std::string& context) {
        if (error_) error_->withContext(context);
        return *this;
    }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace ocicfg
