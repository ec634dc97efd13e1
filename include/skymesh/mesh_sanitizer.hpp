/**
 * Sky Mesh Extractor - Mesh Sanitizer
 */

#pragma once

#include "types.hpp"

namespace skymesh {

struct SanitizedMesh {
    DecodedMesh mesh;
    SanitizeReport report;
};

/**
 * Drop every triangle with two or more equal indices.
 * Vertices and UVs are copied unchanged. Never fails; zero faces is a valid result.
 */
SanitizedMesh sanitize_mesh(const DecodedMesh& input);

} // namespace skymesh
