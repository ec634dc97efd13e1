/**
 * Sky Mesh Extractor - Compressed-Model Strategy
 *
 * File: (compressed, uncompressed) size pair at one of several candidate
 * offsets, LZ4 block at the candidate's data offset.
 *
 * Payload, new layout (counts at 0x34/0x38 look sane):
 * - 0x34: i32 vertex count, 0x38: i32 index count, 0x3C: i32 UV count
 * - 0x40: f32[3] min, 0x4C: f32[3] range
 * - 0x60: vertices (u16 xyz) -> UVs (u16 uv) -> indices
 *
 * Payload, old layout:
 * - 0x60: f32[3] min, 0x6C: f32 range x, 0x70: f32 range y (z reuses y)
 * - 0x74: i32 vertex count, 0x78: i32 index count
 * - 0x7C: vertices (u16 xyz) -> UVs (u16 uv) -> indices
 *
 * ZipPos payload: old-layout counts, UVs at 0x7C, indices after the UVs,
 * positions (u8 pad + u8 xyz) in the last vertex_count * 4 bytes.
 */

#include "skymesh/decode_strategies.hpp"
#include "skymesh/quantization.hpp"
#include "skymesh/logging.hpp"
#include <algorithm>

namespace skymesh {

using namespace format;

static constexpr const char* TAG = "Compressed";

static std::optional<uint32_t> read_size_field(const ByteView& file, size_t offset, unsigned width) {
    if (width == 2) {
        auto v = file.u16(offset);
        if (!v) return std::nullopt;
        return static_cast<uint32_t>(*v);
    }
    return file.u32(offset);
}

Result<CompressionHeader> CompressedModelStrategy::select_header(const ByteView& file,
                                                                 const DecoderConfig& config,
                                                                 Logger& logger) {
    for (const auto& candidate : config.compressed_candidates) {
        auto compressed = read_size_field(file, candidate.compressed_offset, candidate.width);
        auto uncompressed = read_size_field(file, candidate.uncompressed_offset, candidate.width);
        if (!compressed || !uncompressed) {
            continue;
        }

        const bool sizes_ok = *compressed > 0 &&
                              *compressed < config.max_compressed_size &&
                              *uncompressed > *compressed &&
                              *uncompressed < config.max_uncompressed_size;
        const bool window_ok = file.contains(candidate.data_offset, *compressed);

        LOG_DEBUG(logger, TAG, "Candidate 0x" << std::hex << candidate.compressed_offset
                  << "/0x" << candidate.uncompressed_offset << std::dec
                  << " (" << candidate.width * 8 << "-bit): " << *compressed << " -> "
                  << *uncompressed << (sizes_ok && window_ok ? " accepted" : " rejected"));

        if (sizes_ok && window_ok) {
            CompressionHeader header;
            header.compressed_size = *compressed;
            header.uncompressed_size = *uncompressed;
            header.data_start_offset = candidate.data_offset;
            return header;
        }
    }

    return Error::decompression_failure("No compressed-size candidate validated",
                                        std::to_string(config.compressed_candidates.size()) +
                                        " candidates");
}

bool CompressedModelStrategy::is_new_layout(const ByteView& payload) {
    auto vertices = payload.i32(CMP_NEW_OFF_VERTEX_COUNT);
    auto indices = payload.i32(CMP_NEW_OFF_INDEX_COUNT);
    if (!vertices || !indices) return false;

    return *vertices > 0 && *vertices < CMP_NEW_MAX_VERTICES &&
           *indices > 0 && *indices < CMP_NEW_MAX_INDICES &&
           *indices % 3 == 0;
}

ParseOutcome CompressedModelStrategy::decode(const DecodeContext& ctx) const {
    if (!forced_ && !ctx.sniff.flags.compressed()) {
        return Error::unsupported_header("Asset is not flagged as compressed");
    }

    const ByteView file(ctx.asset.bytes());
    TRY_ASSIGN(header, select_header(file, ctx.config, ctx.logger));

    auto packed = file.slice(header.data_start_offset, header.compressed_size);
    TRY_ASSIGN(payload_bytes, ctx.decompressor.decompress(packed->span(), header.compressed_size,
                                                          header.uncompressed_size));
    const ByteView payload(payload_bytes);

    LOG_DEBUG(ctx.logger, TAG, "Decompressed " << header.compressed_size << " -> "
              << payload.size() << " bytes");

    if (ctx.sniff.flags.zip_pos) {
        return decode_zip_pos(ctx, payload);
    }
    if (is_new_layout(payload)) {
        return decode_new_layout(ctx, payload);
    }
    return decode_old_layout(ctx, payload);
}

ParseOutcome CompressedModelStrategy::decode_new_layout(const DecodeContext& ctx,
                                                        const ByteView& payload) const {
    if (!payload.contains(0, CMP_NEW_VERTEX_DATA)) {
        return Error::unsupported_header("New-layout header truncated");
    }

    const int32_t vertex_count = *payload.i32(CMP_NEW_OFF_VERTEX_COUNT);
    const int32_t index_count = *payload.i32(CMP_NEW_OFF_INDEX_COUNT);
    const int32_t uv_count = *payload.i32(CMP_NEW_OFF_UV_COUNT);

    QuantizationParams params;
    params.min = glm::vec3(*payload.f32(CMP_NEW_OFF_MIN), *payload.f32(CMP_NEW_OFF_MIN + 4),
                           *payload.f32(CMP_NEW_OFF_MIN + 8));
    params.range = glm::vec3(*payload.f32(CMP_NEW_OFF_RANGE), *payload.f32(CMP_NEW_OFF_RANGE + 4),
                             *payload.f32(CMP_NEW_OFF_RANGE + 8));

    LOG_DEBUG(ctx.logger, TAG, "New layout: " << vertex_count << " vertices, " << index_count
              << " indices, " << uv_count << " UVs");

    return decode_quantized(ctx, payload, CMP_NEW_VERTEX_DATA, static_cast<uint32_t>(vertex_count),
                            static_cast<uint32_t>(index_count), params);
}

/**
 * Old-layout counts, shared with the ZipPos branch.
 */
static Result<std::pair<uint32_t, uint32_t>> old_layout_counts(const ByteView& payload,
                                                               const DecoderConfig& config) {
    auto vertex_count = payload.i32(CMP_OLD_OFF_VERTEX_COUNT);
    auto index_count = payload.i32(CMP_OLD_OFF_INDEX_COUNT);
    if (!vertex_count || !index_count || !payload.contains(0, CMP_OLD_VERTEX_DATA)) {
        return Error::unsupported_header("Old-layout header truncated",
                                         std::to_string(payload.size()) + " bytes");
    }

    if (*vertex_count <= 0 || static_cast<uint32_t>(*vertex_count) > config.max_vertex_count ||
        *index_count <= 0 || static_cast<uint32_t>(*index_count) > config.max_index_count ||
        *index_count % 3 != 0) {
        return Error::unsupported_header("Old-layout counts out of range",
                                         std::to_string(*vertex_count) + " vertices, " +
                                         std::to_string(*index_count) + " indices");
    }
    return std::make_pair(static_cast<uint32_t>(*vertex_count), static_cast<uint32_t>(*index_count));
}

ParseOutcome CompressedModelStrategy::decode_old_layout(const DecodeContext& ctx,
                                                        const ByteView& payload) const {
    TRY_ASSIGN(counts, old_layout_counts(payload, ctx.config));

    const float range_y = *payload.f32(CMP_OLD_OFF_RANGE_Y);
    QuantizationParams params;
    params.min = glm::vec3(*payload.f32(CMP_OLD_OFF_MIN), *payload.f32(CMP_OLD_OFF_MIN + 4),
                           *payload.f32(CMP_OLD_OFF_MIN + 8));
    params.range = glm::vec3(*payload.f32(CMP_OLD_OFF_RANGE_X), range_y, range_y);

    LOG_DEBUG(ctx.logger, TAG, "Old layout: " << counts.first << " vertices, "
              << counts.second << " indices");

    return decode_quantized(ctx, payload, CMP_OLD_VERTEX_DATA, counts.first, counts.second, params);
}

ParseOutcome CompressedModelStrategy::decode_quantized(const DecodeContext& ctx,
                                                       const ByteView& payload,
                                                       size_t vertex_start,
                                                       uint32_t vertex_count,
                                                       uint32_t index_count,
                                                       const QuantizationParams& params) const {
    const size_t vc = vertex_count;
    auto positions = payload.slice(vertex_start, vc * CMP_QUANT_VERTEX_STRIDE);
    if (!positions) {
        return Error::unsupported_header("Quantized vertex block exceeds payload",
                                         std::to_string(vertex_count) + " vertices");
    }

    DecodedMesh mesh;
    mesh.vertices.reserve(vc);
    for (size_t i = 0; i < vc; i++) {
        const size_t p = i * CMP_QUANT_VERTEX_STRIDE;
        mesh.vertices.push_back(quant::dequantize_u16(*positions->u16(p), *positions->u16(p + 2),
                                                      *positions->u16(p + 4), params));
    }

    // UV records past the end of the payload decode to (0, 0)
    const size_t uv_start = vertex_start + vc * CMP_QUANT_VERTEX_STRIDE;
    mesh.uvs.reserve(vc);
    for (size_t i = 0; i < vc; i++) {
        const size_t t = uv_start + i * CMP_QUANT_UV_STRIDE;
        if (payload.contains(t, CMP_QUANT_UV_STRIDE)) {
            mesh.uvs.emplace_back(quant::unorm16(*payload.u16(t)), quant::unorm16(*payload.u16(t + 2)));
        } else {
            mesh.uvs.emplace_back(0.0f, 0.0f);
        }
    }

    const size_t search_start = uv_start + vc * CMP_QUANT_UV_STRIDE;
    TRY_ASSIGN(region, ctx.locator.locate(payload.tail(search_start).span(), vertex_count,
                                          index_count, &ctx.logger));
    mesh.indices = std::move(region.indices);
    return mesh;
}

ParseOutcome CompressedModelStrategy::decode_zip_pos(const DecodeContext& ctx,
                                                     const ByteView& payload) const {
    TRY_ASSIGN(counts, old_layout_counts(payload, ctx.config));
    const uint32_t vertex_count = counts.first;
    const uint32_t index_count = counts.second;
    const size_t vc = vertex_count;

    const size_t position_bytes = vc * ZIP_POSITION_STRIDE;
    if (position_bytes > payload.size() - CMP_OLD_VERTEX_DATA) {
        return Error::unsupported_header("Tail position block overlaps payload header",
                                         std::to_string(vertex_count) + " vertices");
    }
    const size_t position_start = payload.size() - position_bytes;

    DecodedMesh mesh;
    mesh.vertices.reserve(vc);
    for (size_t i = 0; i < vc; i++) {
        const size_t p = position_start + i * ZIP_POSITION_STRIDE;
        mesh.vertices.push_back(quant::snorm8_symmetric(*payload.u8(p + 1), *payload.u8(p + 2),
                                                        *payload.u8(p + 3)));
    }

    // UVs stop where the tail positions begin
    mesh.uvs.reserve(vc);
    for (size_t i = 0; i < vc; i++) {
        const size_t t = CMP_OLD_VERTEX_DATA + i * CMP_QUANT_UV_STRIDE;
        if (t + CMP_QUANT_UV_STRIDE <= position_start) {
            mesh.uvs.emplace_back(quant::unorm16(*payload.u16(t)), quant::unorm16(*payload.u16(t + 2)));
        } else {
            mesh.uvs.emplace_back(0.0f, 0.0f);
        }
    }

    const size_t search_start = std::min(CMP_OLD_VERTEX_DATA + vc * CMP_QUANT_UV_STRIDE, position_start);
    auto index_window = payload.slice(search_start, position_start - search_start);
    TRY_ASSIGN(region, ctx.locator.locate(index_window->span(), vertex_count, index_count,
                                          &ctx.logger));
    mesh.indices = std::move(region.indices);

    LOG_DEBUG(ctx.logger, TAG, "ZipPos: " << vertex_count << " vertices from payload +0x"
              << std::hex << position_start << std::dec);
    return mesh;
}

} // namespace skymesh
