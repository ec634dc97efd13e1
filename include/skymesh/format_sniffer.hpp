/**
 * Sky Mesh Extractor - Format Sniffer
 *
 * Pure classification of a raw asset into an ordered strategy plan.
 */

#pragma once

#include "types.hpp"
#include "config.hpp"
#include <string>
#include <vector>

namespace skymesh {

class FormatSniffer {
public:
    explicit FormatSniffer(const DecoderConfig& config) : config_(config) {}

    /**
     * Classify an asset. Uses asset.flags when present, otherwise the
     * filename keywords; the ZipPos signal always comes from the name.
     * The configured DecodeMode restricts the resulting plan.
     */
    SniffResult sniff(const RawAsset& asset) const;

    /**
     * Keyword tokens from the configured list that occur in a model name.
     */
    std::vector<std::string> find_keywords(const std::string& model_name) const;

private:
    const DecoderConfig& config_;
};

} // namespace skymesh
