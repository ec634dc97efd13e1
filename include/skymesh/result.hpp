/**
 * Sky Mesh Extractor - Result Type
 *
 * Provides a Result<T> type for consistent error handling.
 * Strategies return failures as values; nothing is thrown across
 * strategy boundaries.
 */

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>

namespace skymesh {

/**
 * Error information with code and message
 */
struct Error {
    enum class Code {
        None = 0,
        // Decode taxonomy
        UnsupportedHeader,
        DecompressionFailure,
        OffsetCandidateExhausted,
        IndexRegionNotFound,
        TruncatedInput,
        StrategiesExhausted,
        // I/O and configuration
        FileNotFound,
        IoError,
        ConfigError,
        InvalidArgument,
        Unknown
    };

    Code code = Code::None;
    std::string message;
    std::string context;  // Additional context (file path, strategy, etc.)

    Error() = default;
    Error(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(Code c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    bool ok() const { return code == Code::None; }

    std::string full_message() const {
        if (context.empty()) {
            return message;
        }
        return message + " [" + context + "]";
    }

    // Common error constructors
    static Error unsupported_header(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::UnsupportedHeader, msg, ctx);
    }

    static Error decompression_failure(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::DecompressionFailure, msg, ctx);
    }

    static Error offset_candidates_exhausted(const std::string& msg) {
        return Error(Code::OffsetCandidateExhausted, msg);
    }

    static Error index_region_not_found(const std::string& msg) {
        return Error(Code::IndexRegionNotFound, msg);
    }

    static Error truncated_input(const std::string& msg, const std::string& path = "") {
        return Error(Code::TruncatedInput, msg, path);
    }

    static Error file_not_found(const std::string& path) {
        return Error(Code::FileNotFound, "File not found", path);
    }

    static Error io_error(const std::string& msg, const std::string& path = "") {
        return Error(Code::IoError, msg, path);
    }

    static Error config_error(const std::string& msg, const std::string& path = "") {
        return Error(Code::ConfigError, msg, path);
    }
};

/**
 * Short name of an error code, used in logs and summaries.
 */
constexpr const char* error_code_string(Error::Code code) {
    switch (code) {
        case Error::Code::None:                     return "None";
        case Error::Code::UnsupportedHeader:        return "UnsupportedHeader";
        case Error::Code::DecompressionFailure:     return "DecompressionFailure";
        case Error::Code::OffsetCandidateExhausted: return "OffsetCandidateExhausted";
        case Error::Code::IndexRegionNotFound:      return "IndexRegionNotFound";
        case Error::Code::TruncatedInput:           return "TruncatedInput";
        case Error::Code::StrategiesExhausted:      return "StrategiesExhausted";
        case Error::Code::FileNotFound:             return "FileNotFound";
        case Error::Code::IoError:                  return "IoError";
        case Error::Code::ConfigError:              return "ConfigError";
        case Error::Code::InvalidArgument:          return "InvalidArgument";
        default:                                    return "Unknown";
    }
}

/**
 * Result type that holds either a value T or an Error
 *
 * Usage:
 *   Result<std::vector<uint8_t>> read_file(const std::string& path);
 *
 *   auto result = read_file("test.mesh");
 *   if (result) {
 *       auto& data = result.value();
 *       // use data...
 *   } else {
 *       LOG_ERROR(logger, "Read", result.error().message);
 *   }
 */
template<typename T>
class Result {
public:
    // Success construction
    Result(T value) : data_(std::move(value)) {}

    // Error construction
    Result(Error error) : data_(std::move(error)) {}

    // Check if result is successful
    bool ok() const { return std::holds_alternative<T>(data_); }
    bool has_value() const { return ok(); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }

    // Access error
    const Error& error() const {
        if (ok()) {
            static Error no_error;
            return no_error;
        }
        return std::get<Error>(data_);
    }

    // Pointer-like access
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

private:
    std::variant<T, Error> data_;
};

/**
 * Specialization for void results (just success/failure)
 */
template<>
class Result<void> {
public:
    Result() : error_(std::nullopt) {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const {
        static Error no_error;
        if (!error_) return no_error;
        return *error_;
    }

    static Result success() { return Result(); }

private:
    std::optional<Error> error_;
};

// Helper macros for early return on error
#define TRY(expr) \
    do { \
        auto _result = (expr); \
        if (!_result.ok()) { \
            return _result.error(); \
        } \
    } while(0)

#define TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (!_result_##var.ok()) { \
        return _result_##var.error(); \
    } \
    auto var = std::move(_result_##var.value())

} // namespace skymesh
