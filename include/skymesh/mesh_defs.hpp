/**
 * Sky Mesh Extractor - MeshDefs.lua Loader
 *
 * Reads the per-model flag table shipped next to the assets:
 *
 *   resource "Mesh" "BodyCape_ZipPos" { compressPositions = true, compressUvs = false }
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include <string>
#include <filesystem>

namespace skymesh {

/**
 * Parse MeshDefs.lua text into a flag table.
 */
FlagTable parse_mesh_defs(const std::string& text);

/**
 * Load a MeshDefs.lua file. A missing file yields an empty table.
 */
Result<FlagTable> load_mesh_defs(const std::filesystem::path& path);

} // namespace skymesh
