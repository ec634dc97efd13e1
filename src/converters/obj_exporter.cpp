/**
 * Sky Mesh Extractor - OBJ Exporter Implementation
 */

#include "skymesh/obj_exporter.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>

namespace skymesh {

std::string ObjExporter::generate_obj(const DecodedMesh& mesh) const {
    std::ostringstream obj;
    obj << std::fixed << std::setprecision(6);

    for (const auto& v : mesh.vertices) {
        obj << "v " << v.x << " " << v.y << " " << v.z << "\n";
    }

    const bool with_uvs = options_.export_uvs && !mesh.uvs.empty();
    if (with_uvs) {
        for (const auto& uv : mesh.uvs) {
            obj << "vt " << uv.x << " " << uv.y << "\n";
        }
    }

    // OBJ indices are 1-based
    for (size_t i = 0; i + 2 < mesh.indices.size(); i += 3) {
        uint32_t v1 = mesh.indices[i] + 1;
        uint32_t v2 = mesh.indices[i + 1] + 1;
        uint32_t v3 = mesh.indices[i + 2] + 1;

        if (with_uvs) {
            obj << "f " << v1 << "/" << v1
                << " " << v2 << "/" << v2
                << " " << v3 << "/" << v3 << "\n";
        } else {
            obj << "f " << v1 << " " << v2 << " " << v3 << "\n";
        }
    }

    return obj.str();
}

Result<std::filesystem::path> ObjExporter::save(const DecodedMesh& mesh,
                                                const std::filesystem::path& output_dir,
                                                const std::string& name) const {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        return Error::io_error("Cannot create output directory: " + ec.message(), output_dir.string());
    }

    const auto path = output_dir / (name + ".obj");
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return Error::io_error("Cannot open output file", path.string());
    }

    file << generate_obj(mesh);
    file.close();
    if (!file) {
        return Error::io_error("Failed to write output file", path.string());
    }
    return path;
}

} // namespace skymesh
