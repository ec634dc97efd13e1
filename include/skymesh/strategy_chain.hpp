/**
 * Sky Mesh Extractor - Strategy Chain
 *
 * Runs the planned strategies in order; the first structurally valid mesh wins.
 */

#pragma once

#include "mesh_strategy.hpp"
#include <memory>
#include <vector>

namespace skymesh {

/**
 * Winning mesh plus everything that failed before it.
 */
struct ChainResult {
    DecodedMesh mesh;
    StrategyKind strategy = StrategyKind::FmtMesh;
    std::vector<StrategyAttempt> failed_attempts;
};

class StrategyChain {
public:
    /**
     * Chain holding one instance of each strategy kind.
     */
    StrategyChain();

    /**
     * Try each planned strategy in order. Fails with StrategiesExhausted,
     * listing every attempt, when none produced a valid mesh.
     */
    Result<ChainResult> run(const DecodeContext& ctx, const std::vector<StrategyKind>& plan) const;

    /**
     * Non-empty vertices, a whole number of triangles, every index in range.
     */
    static Result<void> validate(const DecodedMesh& mesh);

private:
    const MeshStrategy* find(StrategyKind kind) const;

    std::vector<std::unique_ptr<MeshStrategy>> strategies_;
};

} // namespace skymesh
