#include <gtest/gtest.h>

#include "skymesh/mesh_sanitizer.hpp"

using namespace skymesh;

namespace {

DecodedMesh make_mesh(std::vector<uint32_t> indices) {
    DecodedMesh mesh;
    mesh.vertices = {glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f)};
    mesh.uvs = {glm::vec2(0.0f), glm::vec2(1.0f, 0.0f), glm::vec2(0.0f, 1.0f)};
    mesh.indices = std::move(indices);
    return mesh;
}

} // namespace

TEST(SanitizerTest, DropsTrianglesWithRepeatedIndices) {
    auto out = sanitize_mesh(make_mesh({0, 0, 1, 0, 1, 2}));

    EXPECT_EQ(out.mesh.indices, (std::vector<uint32_t>{0, 1, 2}));
    EXPECT_EQ(out.report.total_triangles, 2u);
    EXPECT_EQ(out.report.valid_triangles, 1u);
    EXPECT_EQ(out.report.dropped_triangles, 1u);
}

TEST(SanitizerTest, KeepsVerticesAndUvs) {
    auto input = make_mesh({1, 2, 1});
    auto out = sanitize_mesh(input);

    EXPECT_EQ(out.mesh.vertices, input.vertices);
    EXPECT_EQ(out.mesh.uvs, input.uvs);
    EXPECT_TRUE(out.mesh.indices.empty());
    EXPECT_EQ(out.report.dropped_triangles, 1u);
}

TEST(SanitizerTest, CleanMeshIsUnchanged) {
    auto input = make_mesh({0, 1, 2, 2, 1, 0});
    auto out = sanitize_mesh(input);

    EXPECT_TRUE(out.mesh == input);
    EXPECT_EQ(out.report.valid_triangles, 2u);
    EXPECT_EQ(out.report.dropped_triangles, 0u);
}

TEST(SanitizerTest, EmptyMeshIsValid) {
    auto out = sanitize_mesh(DecodedMesh{});
    EXPECT_EQ(out.report.total_triangles, 0u);
    EXPECT_TRUE(out.mesh.indices.empty());
}
