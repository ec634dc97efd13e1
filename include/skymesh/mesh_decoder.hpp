/**
 * Sky Mesh Extractor - Mesh Decoder
 *
 * Per-file pipeline: size check, sniffing, strategy chain, sanitizing.
 *
 * Usage:
 *   skymesh::Logger logger(skymesh::LogLevel::Info, true);
 *   skymesh::DefaultDecompressor codec;
 *   skymesh::MeshDecoder decoder(config, codec, logger);
 *
 *   auto report = decoder.decode(asset);
 *   if (report) {
 *       // report->mesh, report->strategy
 *   }
 */

#pragma once

#include "types.hpp"
#include "config.hpp"
#include "compression.hpp"
#include "index_locator.hpp"
#include "format_sniffer.hpp"
#include "strategy_chain.hpp"
#include "logging.hpp"

namespace skymesh {

class MeshDecoder {
public:
    /**
     * config, decompressor and logger must outlive the decoder.
     */
    MeshDecoder(const DecoderConfig& config, const Decompressor& decompressor, Logger& logger);

    /**
     * Decode one asset. Inputs below the minimum header size fail with
     * TruncatedInput before any strategy runs.
     */
    Result<DecodeReport> decode(const RawAsset& asset) const;

    const FormatSniffer& sniffer() const { return sniffer_; }

private:
    const DecoderConfig& config_;
    const Decompressor& decompressor_;
    Logger& logger_;
    FormatSniffer sniffer_;
    IndexLocator locator_;
    StrategyChain chain_;
};

} // namespace skymesh
