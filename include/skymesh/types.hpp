/**
 * Sky Mesh Extractor - Common types and definitions
 */

#pragma once

#include "result.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <variant>
#include <optional>
#include <filesystem>
#include <span>

namespace skymesh {

namespace fs = std::filesystem;

/**
 * Value of one entry of an external flag record (MeshDefs.lua).
 */
using FlagValue = std::variant<bool, int64_t, std::string>;

/**
 * Per-model compression flags.
 * Flags are advisory: they decide strategy admission, never the layout itself.
 */
struct MeshFlags {
    bool compress_positions = false;
    bool compress_uvs = false;
    bool zip_pos = false;                       // 8-bit tail positions
    std::map<std::string, FlagValue> extra;     // Remaining entries, kept verbatim

    bool compressed() const { return compress_positions || compress_uvs; }
};

/**
 * External flag table keyed by model name.
 */
using FlagTable = std::map<std::string, MeshFlags>;

/**
 * One input file. Immutable for the duration of a conversion.
 */
struct RawAsset {
    std::vector<uint8_t> data;
    std::string filename;                   // As given (may include directories)
    std::optional<MeshFlags> flags;         // From the external flag table, if any

    std::span<const uint8_t> bytes() const { return {data.data(), data.size()}; }

    /**
     * Model name: filename without directory and extension.
     */
    std::string model_name() const {
        return fs::path(filename).stem().string();
    }
};

/**
 * Candidate (compressed_size, uncompressed_size, data_start) triple.
 */
struct CompressionHeader {
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;
    size_t data_start_offset = 0;
};

/**
 * Affine dequantization parameters: value = min + raw / max_raw * range.
 */
struct QuantizationParams {
    glm::vec3 min{0.0f};
    glm::vec3 range{1.0f};
};

struct QuantizationParams2D {
    glm::vec2 min{0.0f};
    glm::vec2 range{1.0f};
};

/**
 * Decoded geometry. Every index is < vertices.size().
 */
struct DecodedMesh {
    std::vector<glm::vec3> vertices;
    std::vector<glm::vec2> uvs;
    std::vector<uint32_t> indices;          // Triangle list

    size_t triangle_count() const { return indices.size() / 3; }

    bool operator==(const DecodedMesh& other) const = default;
};

/**
 * Tagged outcome of one decode strategy.
 */
using ParseOutcome = Result<DecodedMesh>;

/**
 * Decode strategies, in default priority order.
 */
enum class StrategyKind {
    FmtMesh,
    CompressedModel,
    Heuristic,
    CompressedModelForced
};

constexpr const char* strategy_name(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::FmtMesh:               return "fmt_mesh";
        case StrategyKind::CompressedModel:       return "compressed";
        case StrategyKind::Heuristic:             return "heuristic";
        case StrategyKind::CompressedModelForced: return "compressed (fallback)";
        default:                                  return "unknown";
    }
}

/**
 * Result of format sniffing: which strategies to run and with which signals.
 */
struct SniffResult {
    bool signature_match = false;
    MeshFlags flags;
    bool flags_from_table = false;
    std::vector<std::string> keywords;      // Tokens found in the model name
    std::vector<StrategyKind> plan;         // Ordered strategy list
};

/**
 * Degenerate-triangle filtering summary.
 */
struct SanitizeReport {
    size_t total_triangles = 0;
    size_t valid_triangles = 0;
    size_t dropped_triangles = 0;
};

/**
 * A strategy that was tried and failed.
 */
struct StrategyAttempt {
    StrategyKind strategy = StrategyKind::FmtMesh;
    Error error;
};

/**
 * Full outcome of decoding one file.
 */
struct DecodeReport {
    DecodedMesh mesh;                       // Sanitized
    StrategyKind strategy = StrategyKind::FmtMesh;
    SanitizeReport sanitize;
    std::vector<StrategyAttempt> failed_attempts;
};

} // namespace skymesh
