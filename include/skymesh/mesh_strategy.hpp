/**
 * Sky Mesh Extractor - Decode Strategy Interface
 */

#pragma once

#include "types.hpp"
#include "config.hpp"
#include "compression.hpp"
#include "index_locator.hpp"
#include "logging.hpp"

namespace skymesh {

/**
 * Everything a strategy may read while decoding one asset. Nothing in here is
 * written by a strategy, so a failed attempt leaves no trace.
 */
struct DecodeContext {
    const RawAsset& asset;
    const SniffResult& sniff;
    const DecoderConfig& config;
    const Decompressor& decompressor;
    const IndexLocator& locator;
    Logger& logger;
};

class MeshStrategy {
public:
    virtual ~MeshStrategy() = default;

    virtual StrategyKind kind() const = 0;
    const char* name() const { return strategy_name(kind()); }

    virtual ParseOutcome decode(const DecodeContext& ctx) const = 0;
};

} // namespace skymesh
