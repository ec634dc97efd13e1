/**
 * Sky Mesh Extractor - Interactive file selection
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace skymesh {

struct Selection {
    bool quit = false;
    std::vector<size_t> indices;            // 0-based, sorted, unique
    std::vector<std::string> rejected;      // Tokens that were out of range or unparsable
};

/**
 * Parse a 1-based selection over count items: "1 2 3", "1-5", "1,2,3",
 * mixes of those, "all", or "q". Case-insensitive.
 */
Selection parse_selection(const std::string& input, size_t count);

} // namespace skymesh
