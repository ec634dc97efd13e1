/**
 * Sky Mesh Extractor - OBJ Exporter
 *
 * Writes decoded meshes as plain Wavefront OBJ geometry (no materials).
 */

#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>

namespace skymesh {

struct ExportOptions {
    bool export_uvs = true;
};

class ObjExporter {
public:
    explicit ObjExporter(ExportOptions options = {}) : options_(options) {}

    /**
     * OBJ text: "v" lines, then "vt" lines, then 1-based "f" lines.
     * UV lines and the "/vt" face references are omitted when UVs are
     * disabled or the mesh has none.
     */
    std::string generate_obj(const DecodedMesh& mesh) const;

    /**
     * Write <output_dir>/<name>.obj, creating output_dir if needed.
     * Returns the written path.
     */
    Result<std::filesystem::path> save(const DecodedMesh& mesh,
                                       const std::filesystem::path& output_dir,
                                       const std::string& name) const;

    const ExportOptions& options() const { return options_; }

private:
    ExportOptions options_;
};

} // namespace skymesh
