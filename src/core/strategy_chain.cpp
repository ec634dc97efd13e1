/**
 * Sky Mesh Extractor - Strategy Chain Implementation
 */

#include "skymesh/strategy_chain.hpp"
#include "skymesh/decode_strategies.hpp"
#include "skymesh/logging.hpp"
#include <sstream>

namespace skymesh {

static constexpr const char* TAG = "Chain";

StrategyChain::StrategyChain() {
    strategies_.push_back(std::make_unique<FmtMeshStrategy>());
    strategies_.push_back(std::make_unique<CompressedModelStrategy>(false));
    strategies_.push_back(std::make_unique<HeuristicStrategy>());
    strategies_.push_back(std::make_unique<CompressedModelStrategy>(true));
}

const MeshStrategy* StrategyChain::find(StrategyKind kind) const {
    for (const auto& strategy : strategies_) {
        if (strategy->kind() == kind) {
            return strategy.get();
        }
    }
    return nullptr;
}

Result<void> StrategyChain::validate(const DecodedMesh& mesh) {
    if (mesh.vertices.empty()) {
        return Error::unsupported_header("Decoded mesh has no vertices");
    }
    if (mesh.indices.empty() || mesh.indices.size() % 3 != 0) {
        return Error::index_region_not_found("Index count " + std::to_string(mesh.indices.size()) +
                                             " is not a positive multiple of 3");
    }
    for (uint32_t index : mesh.indices) {
        if (index >= mesh.vertices.size()) {
            return Error::index_region_not_found("Index " + std::to_string(index) +
                                                 " out of range for " +
                                                 std::to_string(mesh.vertices.size()) + " vertices");
        }
    }
    return Result<void>::success();
}

Result<ChainResult> StrategyChain::run(const DecodeContext& ctx,
                                       const std::vector<StrategyKind>& plan) const {
    ChainResult result;

    for (StrategyKind kind : plan) {
        const MeshStrategy* strategy = find(kind);
        if (!strategy) {
            continue;
        }

        LOG_DEBUG(ctx.logger, TAG, "Trying " << strategy->name());
        ParseOutcome outcome = strategy->decode(ctx);

        Error failure;
        if (outcome) {
            auto valid = validate(outcome.value());
            if (valid) {
                result.mesh = std::move(outcome.value());
                result.strategy = kind;
                LOG_DEBUG(ctx.logger, TAG, strategy->name() << " succeeded: "
                          << result.mesh.vertices.size() << " vertices, "
                          << result.mesh.triangle_count() << " triangles");
                return result;
            }
            failure = valid.error();
        } else {
            failure = outcome.error();
        }

        LOG_DEBUG(ctx.logger, TAG, strategy->name() << " failed: "
                  << error_code_string(failure.code) << ": " << failure.full_message());
        result.failed_attempts.push_back({kind, std::move(failure)});
    }

    std::ostringstream ss;
    ss << "All strategies failed";
    for (const auto& attempt : result.failed_attempts) {
        ss << "; " << strategy_name(attempt.strategy) << ": "
           << error_code_string(attempt.error.code) << " (" << attempt.error.full_message() << ")";
    }
    return Error(Error::Code::StrategiesExhausted, ss.str(), ctx.asset.filename);
}

} // namespace skymesh
