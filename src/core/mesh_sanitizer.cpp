/**
 * Sky Mesh Extractor - Mesh Sanitizer Implementation
 */

#include "skymesh/mesh_sanitizer.hpp"

namespace skymesh {

SanitizedMesh sanitize_mesh(const DecodedMesh& input) {
    SanitizedMesh out;
    out.mesh.vertices = input.vertices;
    out.mesh.uvs = input.uvs;
    out.mesh.indices.reserve(input.indices.size());

    const size_t triangles = input.indices.size() / 3;
    for (size_t t = 0; t < triangles; t++) {
        uint32_t a = input.indices[t * 3];
        uint32_t b = input.indices[t * 3 + 1];
        uint32_t c = input.indices[t * 3 + 2];

        if (a == b || b == c || a == c) {
            out.report.dropped_triangles++;
            continue;
        }

        out.mesh.indices.push_back(a);
        out.mesh.indices.push_back(b);
        out.mesh.indices.push_back(c);
        out.report.valid_triangles++;
    }

    out.report.total_triangles = triangles;
    return out;
}

} // namespace skymesh
