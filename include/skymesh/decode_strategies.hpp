/**
 * Sky Mesh Extractor - Decode Strategies
 *
 * fmt_mesh (signature container), Compressed-Model (LZ4 payload with
 * quantized vertices) and Heuristic (uncompressed float streams).
 */

#pragma once

#include "mesh_strategy.hpp"
#include "mesh_format.hpp"
#include <optional>

namespace skymesh {

/**
 * Signature-prefixed container with an LZ4 payload and an optional bone block.
 */
class FmtMeshStrategy : public MeshStrategy {
public:
    StrategyKind kind() const override { return StrategyKind::FmtMesh; }
    ParseOutcome decode(const DecodeContext& ctx) const override;

private:
    ParseOutcome decode_classic(const DecodeContext& ctx, const format::ByteView& payload,
                                uint32_t vertex_count, uint32_t index_count, bool has_bones) const;
    ParseOutcome decode_zip_pos(const DecodeContext& ctx, const format::ByteView& payload,
                                uint32_t vertex_count, uint32_t index_count, bool has_bones) const;
};

/**
 * LZ4 payload located through the compressed-size candidate list.
 * The forced variant skips the compression-flag admission check.
 */
class CompressedModelStrategy : public MeshStrategy {
public:
    explicit CompressedModelStrategy(bool forced = false) : forced_(forced) {}

    StrategyKind kind() const override {
        return forced_ ? StrategyKind::CompressedModelForced : StrategyKind::CompressedModel;
    }
    ParseOutcome decode(const DecodeContext& ctx) const override;

    /**
     * First candidate whose sizes and data window validate.
     */
    static Result<CompressionHeader> select_header(const format::ByteView& file,
                                                   const DecoderConfig& config,
                                                   Logger& logger);

    /**
     * True if the payload carries plausible counts at the new-layout offsets.
     */
    static bool is_new_layout(const format::ByteView& payload);

private:
    ParseOutcome decode_new_layout(const DecodeContext& ctx, const format::ByteView& payload) const;
    ParseOutcome decode_old_layout(const DecodeContext& ctx, const format::ByteView& payload) const;
    ParseOutcome decode_zip_pos(const DecodeContext& ctx, const format::ByteView& payload) const;
    ParseOutcome decode_quantized(const DecodeContext& ctx, const format::ByteView& payload,
                                  size_t vertex_start, uint32_t vertex_count, uint32_t index_count,
                                  const QuantizationParams& params) const;

    bool forced_;
};

/**
 * Uncompressed f32 vertex and UV streams at fixed candidate offsets.
 */
class HeuristicStrategy : public MeshStrategy {
public:
    StrategyKind kind() const override { return StrategyKind::Heuristic; }
    ParseOutcome decode(const DecodeContext& ctx) const override;
};

} // namespace skymesh
