/**
 * Sky Mesh Extractor - Configuration
 *
 * Decoder limits and the ordered offset candidate lists, plus converter
 * settings. Everything here can be overridden from a JSON file.
 */

#pragma once

#include "result.hpp"
#include "logging.hpp"
#include "index_locator.hpp"
#include "mesh_format.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <filesystem>
#include <optional>
#include <string_view>

namespace skymesh {

/**
 * Which strategies a file may be decoded with.
 */
enum class DecodeMode {
    Auto,       // Full sniffed plan
    Container,  // fmt_mesh only
    Legacy      // Everything except fmt_mesh
};

constexpr const char* decode_mode_string(DecodeMode mode) {
    switch (mode) {
        case DecodeMode::Auto:      return "auto";
        case DecodeMode::Container: return "fmt";
        case DecodeMode::Legacy:    return "legacy";
        default:                    return "unknown";
    }
}

std::optional<DecodeMode> parse_decode_mode(std::string_view name);

/**
 * Where the compressed/uncompressed sizes and the payload start may live.
 */
struct CompressedCandidate {
    size_t compressed_offset = 0;
    size_t uncompressed_offset = 0;
    size_t data_offset = 0;
    unsigned width = 4;                 // Size field width in bytes: 4 or 2
};

/**
 * Where the shared/total counts and the vertex block may live in an
 * uncompressed file.
 */
struct HeuristicCandidate {
    size_t shared_offset = 0;
    size_t total_offset = 0;
    size_t data_offset = 0;
    size_t vertex_stride = 12;          // f32 xyz
    size_t uv_stride = 8;               // f32 uv
};

std::vector<CompressedCandidate> default_compressed_candidates();
std::vector<HeuristicCandidate> default_heuristic_candidates();

struct DecoderConfig {
    size_t min_header_size = format::MIN_HEADER_SIZE;
    uint32_t max_vertex_count = format::MAX_SANE_COUNT;
    uint32_t max_index_count = 3 * format::MAX_SANE_COUNT;
    uint32_t max_compressed_size = format::CMP_MAX_COMPRESSED;
    uint32_t max_uncompressed_size = format::CMP_MAX_UNCOMPRESSED;
    DecodeMode mode = DecodeMode::Auto;
    IndexScanOptions index_scan;
    std::vector<CompressedCandidate> compressed_candidates = default_compressed_candidates();
    std::vector<HeuristicCandidate> heuristic_candidates = default_heuristic_candidates();
    std::vector<std::string> compression_keywords = {
        "StripAnim", "CompOcc", "ZipPos", "ZipUvs", "StripNorm", "StripUv13", "CopyFrameDelay"
    };
};

struct ConverterConfig {
    std::filesystem::path output_dir = ".";
    bool export_uvs = true;
    bool write_summary = true;
    LogLevel log_level = LogLevel::Info;
    std::filesystem::path log_file;
    std::filesystem::path mesh_defs;
};

struct AppConfig {
    DecoderConfig decoder;
    ConverterConfig converter;
};

/**
 * Overlay keys present in the JSON text onto config.
 * Unknown keys are ignored; malformed JSON or wrong types are ConfigError.
 */
Result<void> apply_config_json(const std::string& text, AppConfig& config);

/**
 * Load a JSON config file over the defaults.
 */
Result<AppConfig> load_config(const std::filesystem::path& path);

/**
 * Serialize the full config (used for `--dump-config`).
 */
std::string config_to_json(const AppConfig& config);

} // namespace skymesh
