/**
 * Sky Mesh Extractor - Heuristic Strategy
 *
 * Uncompressed files: (shared, total) counts at one of several candidate
 * offsets, then shared * f32 xyz, shared * f32 uv and the index array.
 */

#include "skymesh/decode_strategies.hpp"
#include "skymesh/logging.hpp"

namespace skymesh {

using namespace format;

static constexpr const char* TAG = "Heuristic";

ParseOutcome HeuristicStrategy::decode(const DecodeContext& ctx) const {
    const ByteView file(ctx.asset.bytes());
    const DecoderConfig& config = ctx.config;
    std::optional<Error> index_failure;

    for (size_t c = 0; c < config.heuristic_candidates.size(); c++) {
        const auto& candidate = config.heuristic_candidates[c];

        auto shared = file.i32(candidate.shared_offset);
        auto total = file.i32(candidate.total_offset);
        if (!shared || !total) {
            LOG_DEBUG(ctx.logger, TAG, "Candidate " << c << ": count fields outside buffer");
            continue;
        }

        if (*shared <= 0 || static_cast<uint32_t>(*shared) > config.max_vertex_count ||
            *total <= 0 || static_cast<uint32_t>(*total) > config.max_index_count ||
            *total % 3 != 0) {
            LOG_DEBUG(ctx.logger, TAG, "Candidate " << c << ": counts " << *shared << "/"
                      << *total << " rejected");
            continue;
        }

        const size_t vertex_count = static_cast<size_t>(*shared);
        const size_t index_count = static_cast<size_t>(*total);
        const size_t vertex_bytes = vertex_count * candidate.vertex_stride;
        const size_t uv_bytes = vertex_count * candidate.uv_stride;
        const size_t index_bytes = index_count * 2;

        // The declared layout must fit as shared * vertex_stride + total * uv_stride,
        // and the streams actually read (xyz, uv, smallest index array) must fit too.
        const size_t declared_bytes = vertex_bytes + index_count * candidate.uv_stride;
        if (!file.contains(candidate.data_offset, declared_bytes) ||
            !file.contains(candidate.data_offset, vertex_bytes + uv_bytes + index_bytes)) {
            LOG_DEBUG(ctx.logger, TAG, "Candidate " << c << ": " << vertex_count << " vertices, "
                      << index_count << " indices do not fit");
            continue;
        }

        const size_t uv_start = candidate.data_offset + vertex_bytes;
        DecodedMesh mesh;
        mesh.vertices.reserve(vertex_count);
        mesh.uvs.reserve(vertex_count);
        for (size_t i = 0; i < vertex_count; i++) {
            const size_t p = candidate.data_offset + i * candidate.vertex_stride;
            mesh.vertices.emplace_back(*file.f32(p), *file.f32(p + 4), *file.f32(p + 8));

            const size_t t = uv_start + i * candidate.uv_stride;
            mesh.uvs.emplace_back(*file.f32(t), *file.f32(t + 4));
        }

        auto region = ctx.locator.locate(file.tail(uv_start + uv_bytes).span(),
                                         static_cast<uint32_t>(vertex_count),
                                         static_cast<uint32_t>(index_count), &ctx.logger);
        if (!region) {
            LOG_DEBUG(ctx.logger, TAG, "Candidate " << c << ": " << region.error().message);
            index_failure = region.error();
            continue;
        }

        LOG_DEBUG(ctx.logger, TAG, "Candidate " << c << " accepted: " << vertex_count
                  << " vertices, " << index_count << " indices");
        mesh.indices = std::move(region->indices);
        return mesh;
    }

    if (index_failure) {
        return *index_failure;
    }
    return Error::offset_candidates_exhausted(
        "No heuristic offset candidate validated (" +
        std::to_string(config.heuristic_candidates.size()) + " tried)");
}

} // namespace skymesh
