/**
 * Sky Mesh Extractor - Index Locator
 *
 * Finds the triangle index array inside the bytes that follow the vertex
 * streams when its exact offset is not known.
 */

#pragma once

#include "result.hpp"
#include <vector>
#include <cstdint>
#include <cstddef>
#include <span>

namespace skymesh {

class Logger;

struct IndexScanOptions {
    size_t step = 2;                    // Window alignment in bytes
    size_t max_windows = 1u << 20;      // Probed start offsets before giving up
};

/**
 * An accepted index array.
 */
struct IndexRegion {
    size_t offset = 0;                  // Relative to the scanned region
    unsigned width = 16;                // 16 or 32
    std::vector<uint32_t> indices;
};

class IndexLocator {
public:
    explicit IndexLocator(IndexScanOptions options = {}) : options_(options) {}

    /**
     * Scan region for index_count indices, all < vertex_count and not all zero.
     * At each window both widths are checked; 16-bit wins when both validate.
     */
    Result<IndexRegion> locate(std::span<const uint8_t> region,
                               uint32_t vertex_count,
                               uint32_t index_count,
                               Logger* logger = nullptr) const;

    /**
     * Validate one window at a fixed offset and width.
     */
    static bool window_valid(std::span<const uint8_t> region, size_t offset, unsigned width,
                             uint32_t vertex_count, uint32_t index_count);

    const IndexScanOptions& options() const { return options_; }

private:
    IndexScanOptions options_;
};

} // namespace skymesh
