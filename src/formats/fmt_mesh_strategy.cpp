/**
 * Sky Mesh Extractor - fmt_mesh Strategy
 *
 * fmt_mesh container (little-endian):
 * - 0x00: signature 1F 00 00 00
 * - 0x04: u32[18] header words, [17] = sub-mesh count
 * - 0x4C: u16 has_bones, u32 reserved
 * - 0x52: u32 compressed size, 0x56: u32 uncompressed size
 * - 0x5A: LZ4 payload
 * - [has_bones] bone info block (85 bytes, bone count at +68) and
 *   bone_count * 132 bytes of bone records
 *
 * Payload: vertex count @116, index count @120, UV channels @128, data @179.
 * Classic data: positions (16B) -> 4B/vertex gap -> UV records (16B, half2 x4)
 *               -> [weights 8B/vertex] -> indices
 * ZipPos data:  [weights] -> indices ... positions (4B/vertex) at the tail
 */

#include "skymesh/decode_strategies.hpp"
#include "skymesh/quantization.hpp"
#include "skymesh/logging.hpp"

namespace skymesh {

using namespace format;

static constexpr const char* TAG = "FmtMesh";

/**
 * Bounds-check the bone block after the payload and return its bone count.
 * The records themselves are never read.
 */
static Result<uint32_t> skip_bone_block(const ByteView& file, size_t offset, uint32_t max_count) {
    auto info = file.slice(offset, FMT_BONE_INFO_SIZE);
    if (!info) {
        return Error::unsupported_header("Bone info block outside buffer",
                                         "offset " + std::to_string(offset));
    }

    uint32_t bone_count = *info->u32(FMT_BONE_COUNT_OFF);
    if (bone_count > max_count) {
        return Error::unsupported_header("Bone count " + std::to_string(bone_count) +
                                         " exceeds limit");
    }

    const size_t records = static_cast<size_t>(bone_count) * FMT_BONE_RECORD_SIZE;
    if (!file.contains(offset + FMT_BONE_INFO_SIZE, records)) {
        return Error::unsupported_header("Bone records outside buffer",
                                         std::to_string(bone_count) + " bones");
    }
    return bone_count;
}

ParseOutcome FmtMeshStrategy::decode(const DecodeContext& ctx) const {
    const ByteView file(ctx.asset.bytes());
    const DecoderConfig& config = ctx.config;

    if (!has_fmt_signature(file.span())) {
        return Error::unsupported_header("Missing fmt_mesh signature");
    }

    auto submeshes = file.u32(FMT_OFF_HEADER_WORDS + FMT_SUBMESH_WORD * 4);
    auto has_bones_raw = file.u16(FMT_OFF_HAS_BONES);
    auto compressed_size = file.u32(FMT_OFF_COMPRESSED);
    auto uncompressed_size = file.u32(FMT_OFF_UNCOMPRESSED);
    if (!submeshes || !has_bones_raw || !compressed_size || !uncompressed_size) {
        return Error::unsupported_header("fmt_mesh header truncated",
                                         std::to_string(file.size()) + " bytes");
    }

    if (*submeshes > config.max_vertex_count) {
        return Error::unsupported_header("Sub-mesh count " + std::to_string(*submeshes) +
                                         " exceeds limit");
    }
    if (*compressed_size == 0 || *compressed_size > config.max_compressed_size ||
        *uncompressed_size == 0 || *uncompressed_size > config.max_uncompressed_size) {
        return Error::unsupported_header("Implausible payload sizes",
                                         std::to_string(*compressed_size) + " -> " +
                                         std::to_string(*uncompressed_size));
    }

    auto packed = file.slice(FMT_OFF_PAYLOAD, *compressed_size);
    if (!packed) {
        return Error::unsupported_header("Compressed payload outside buffer",
                                         std::to_string(*compressed_size) + " bytes at 0x5A");
    }

    const bool has_bones = *has_bones_raw == 1;
    if (has_bones) {
        TRY_ASSIGN(bone_count, skip_bone_block(file, FMT_OFF_PAYLOAD + *compressed_size,
                                               config.max_vertex_count));
        LOG_DEBUG(ctx.logger, TAG, "Skipped " << bone_count << " bones");
    }

    LOG_DEBUG(ctx.logger, TAG, "Submeshes: " << *submeshes << ", payload "
              << *compressed_size << " -> " << *uncompressed_size << " bytes");

    TRY_ASSIGN(payload_bytes, ctx.decompressor.decompress(packed->span(), *compressed_size,
                                                          *uncompressed_size));
    const ByteView payload(payload_bytes);

    auto vertex_count = payload.u32(FMT_PAY_VERTEX_COUNT);
    auto index_count = payload.u32(FMT_PAY_INDEX_COUNT);
    auto uv_channels = payload.u32(FMT_PAY_UV_CHANNELS);
    if (!vertex_count || !index_count || !uv_channels ||
        !payload.contains(FMT_PAY_VERTEX_DATA, 0)) {
        return Error::unsupported_header("Payload header truncated",
                                         std::to_string(payload.size()) + " bytes");
    }

    if (*vertex_count == 0 || *vertex_count > config.max_vertex_count) {
        return Error::unsupported_header("Vertex count " + std::to_string(*vertex_count) +
                                         " out of range");
    }
    if (*index_count > config.max_index_count) {
        return Error::unsupported_header("Index count " + std::to_string(*index_count) +
                                         " out of range");
    }
    if (*uv_channels > FMT_MAX_UV_CHANNELS) {
        LOG_DEBUG(ctx.logger, TAG, "UV channel count " << *uv_channels << ", decoding channel 0");
    }

    LOG_DEBUG(ctx.logger, TAG, "Vertices: " << *vertex_count << ", indices: " << *index_count
              << ", UV channels: " << *uv_channels << (has_bones ? ", skinned" : ""));

    if (ctx.sniff.flags.zip_pos) {
        return decode_zip_pos(ctx, payload, *vertex_count, *index_count, has_bones);
    }
    return decode_classic(ctx, payload, *vertex_count, *index_count, has_bones);
}

ParseOutcome FmtMeshStrategy::decode_classic(const DecodeContext& ctx, const ByteView& payload,
                                             uint32_t vertex_count, uint32_t index_count,
                                             bool has_bones) const {
    const size_t vc = vertex_count;
    size_t cursor = FMT_PAY_VERTEX_DATA;

    auto positions = payload.slice(cursor, vc * FMT_POSITION_STRIDE);
    if (!positions) {
        return Error::unsupported_header("Position stream exceeds payload");
    }
    cursor += vc * (FMT_POSITION_STRIDE + FMT_POSITION_GAP);

    auto uv_records = payload.slice(cursor, vc * FMT_UV_RECORD_STRIDE);
    if (!uv_records) {
        return Error::unsupported_header("UV stream exceeds payload");
    }
    cursor += vc * FMT_UV_RECORD_STRIDE;

    if (has_bones) {
        cursor += vc * FMT_WEIGHT_STRIDE;
    }
    if (!payload.contains(cursor, 0)) {
        return Error::unsupported_header("Weight stream exceeds payload");
    }

    DecodedMesh mesh;
    mesh.vertices.reserve(vc);
    mesh.uvs.reserve(vc);

    for (size_t i = 0; i < vc; i++) {
        const size_t p = i * FMT_POSITION_STRIDE;
        mesh.vertices.emplace_back(*positions->f32(p), *positions->f32(p + 4), *positions->f32(p + 8));

        // Channel 0 only
        const size_t t = i * FMT_UV_RECORD_STRIDE;
        mesh.uvs.emplace_back(half_to_float(*uv_records->u16(t)),
                              half_to_float(*uv_records->u16(t + 2)));
    }

    auto tail = payload.tail(cursor);
    TRY_ASSIGN(region, ctx.locator.locate(tail.span(), vertex_count, index_count, &ctx.logger));
    mesh.indices = std::move(region.indices);

    LOG_DEBUG(ctx.logger, TAG, "Indices at payload +0x" << std::hex << cursor + region.offset
              << std::dec << " (" << region.width << "-bit)");
    return mesh;
}

ParseOutcome FmtMeshStrategy::decode_zip_pos(const DecodeContext& ctx, const ByteView& payload,
                                             uint32_t vertex_count, uint32_t index_count,
                                             bool has_bones) const {
    const size_t vc = vertex_count;
    size_t cursor = FMT_PAY_VERTEX_DATA;
    if (has_bones) {
        cursor += vc * FMT_WEIGHT_STRIDE;
    }

    const size_t position_bytes = vc * ZIP_POSITION_STRIDE;
    if (position_bytes > payload.size() || cursor > payload.size() - position_bytes) {
        return Error::unsupported_header("Tail position block overlaps payload header",
                                         std::to_string(vertex_count) + " vertices");
    }
    const size_t position_start = payload.size() - position_bytes;

    auto index_window = payload.slice(cursor, position_start - cursor);
    TRY_ASSIGN(region, ctx.locator.locate(index_window->span(), vertex_count, index_count,
                                          &ctx.logger));

    DecodedMesh mesh;
    mesh.vertices.reserve(vc);
    for (size_t i = 0; i < vc; i++) {
        // Byte 0 of each record is unused
        const size_t p = position_start + i * ZIP_POSITION_STRIDE;
        mesh.vertices.push_back(quant::snorm8_symmetric(*payload.u8(p + 1), *payload.u8(p + 2),
                                                        *payload.u8(p + 3)));
    }
    mesh.uvs.assign(vc, glm::vec2(0.0f));
    mesh.indices = std::move(region.indices);

    LOG_DEBUG(ctx.logger, TAG, "ZipPos positions at payload +0x" << std::hex << position_start
              << std::dec << ", " << region.width << "-bit indices");
    return mesh;
}

} // namespace skymesh
