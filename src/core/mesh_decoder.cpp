/**
 * Sky Mesh Extractor - Mesh Decoder Implementation
 */

#include "skymesh/mesh_decoder.hpp"
#include "skymesh/mesh_sanitizer.hpp"

namespace skymesh {

static constexpr const char* TAG = "Decoder";

MeshDecoder::MeshDecoder(const DecoderConfig& config, const Decompressor& decompressor, Logger& logger)
    : config_(config)
    , decompressor_(decompressor)
    , logger_(logger)
    , sniffer_(config)
    , locator_(config.index_scan) {
}

Result<DecodeReport> MeshDecoder::decode(const RawAsset& asset) const {
    if (asset.data.size() < config_.min_header_size) {
        return Error::truncated_input("Input of " + std::to_string(asset.data.size()) +
                                      " bytes is below the " +
                                      std::to_string(config_.min_header_size) + "-byte minimum",
                                      asset.filename);
    }

    SniffResult sniff = sniffer_.sniff(asset);

    if (logger_.is_enabled(LogLevel::Debug)) {
        std::ostringstream plan;
        for (size_t i = 0; i < sniff.plan.size(); i++) {
            plan << (i ? " -> " : "") << strategy_name(sniff.plan[i]);
        }
        LOG_DEBUG(logger_, TAG, asset.model_name() << ": " << asset.data.size() << " bytes"
                  << (sniff.signature_match ? ", fmt_mesh signature" : "")
                  << (sniff.flags_from_table ? ", flags from table" : "")
                  << ", compressed=" << (sniff.flags.compressed() ? "yes" : "no")
                  << (sniff.flags.zip_pos ? ", ZipPos" : "")
                  << ", plan: " << plan.str());
    }

    DecodeContext ctx{asset, sniff, config_, decompressor_, locator_, logger_};
    TRY_ASSIGN(chain, chain_.run(ctx, sniff.plan));

    SanitizedMesh sanitized = sanitize_mesh(chain.mesh);
    if (sanitized.report.dropped_triangles > 0) {
        LOG_DEBUG(logger_, TAG, "Dropped " << sanitized.report.dropped_triangles
                  << " degenerate triangles of " << sanitized.report.total_triangles);
    }

    DecodeReport report;
    report.mesh = std::move(sanitized.mesh);
    report.strategy = chain.strategy;
    report.sanitize = sanitized.report;
    report.failed_attempts = std::move(chain.failed_attempts);
    return report;
}

} // namespace skymesh
