/**
 * Sky Mesh Extractor - Format Sniffer Implementation
 */

#include "skymesh/format_sniffer.hpp"
#include "skymesh/mesh_format.hpp"

namespace skymesh {

static constexpr const char* ZIP_POS_TOKEN = "ZipPos";

std::vector<std::string> FormatSniffer::find_keywords(const std::string& model_name) const {
    std::vector<std::string> found;
    for (const auto& keyword : config_.compression_keywords) {
        if (!keyword.empty() && model_name.find(keyword) != std::string::npos) {
            found.push_back(keyword);
        }
    }
    return found;
}

SniffResult FormatSniffer::sniff(const RawAsset& asset) const {
    SniffResult result;
    const std::string name = asset.model_name();

    result.signature_match = format::has_fmt_signature(asset.bytes());
    result.keywords = find_keywords(name);

    if (asset.flags) {
        result.flags = *asset.flags;
        result.flags_from_table = true;
    } else if (!result.keywords.empty()) {
        result.flags.compress_positions = true;
    }
    result.flags.zip_pos = name.find(ZIP_POS_TOKEN) != std::string::npos;

    if (result.signature_match) {
        result.plan.push_back(StrategyKind::FmtMesh);
    }
    if (result.flags.compressed()) {
        result.plan.push_back(StrategyKind::CompressedModel);
        result.plan.push_back(StrategyKind::Heuristic);
    } else {
        result.plan.push_back(StrategyKind::Heuristic);
        result.plan.push_back(StrategyKind::CompressedModelForced);
    }

    switch (config_.mode) {
        case DecodeMode::Container:
            result.plan = {StrategyKind::FmtMesh};
            break;
        case DecodeMode::Legacy:
            std::erase(result.plan, StrategyKind::FmtMesh);
            break;
        case DecodeMode::Auto:
            break;
    }

    return result;
}

} // namespace skymesh
