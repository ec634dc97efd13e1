#include <gtest/gtest.h>

#include "mesh_builders.hpp"
#include "skymesh/mesh_defs.hpp"
#include "skymesh/files.hpp"

using namespace skymesh;
using namespace skymesh::test;

namespace {

const char* kDefs = R"(
-- generated
resource "Mesh" "BodyCape_ZipPos" { compressPositions = true, compressUvs = false }
resource "Mesh" "Rock01" {
    compressPositions = false,
    compressUvs = true,
    lodCount = 3,
    material = "rock_mat"
}
resource "Texture" "Rock01_d" { format = "dxt5" }
)";

} // namespace

TEST(MeshDefsTest, ParsesMeshResources) {
    auto table = parse_mesh_defs(kDefs);
    ASSERT_EQ(table.size(), 2u);

    const auto& cape = table.at("BodyCape_ZipPos");
    EXPECT_TRUE(cape.compress_positions);
    EXPECT_FALSE(cape.compress_uvs);
    EXPECT_TRUE(cape.extra.empty());

    const auto& rock = table.at("Rock01");
    EXPECT_FALSE(rock.compress_positions);
    EXPECT_TRUE(rock.compress_uvs);
    EXPECT_TRUE(rock.compressed());
    EXPECT_EQ(std::get<int64_t>(rock.extra.at("lodCount")), 3);
    EXPECT_EQ(std::get<std::string>(rock.extra.at("material")), "rock_mat");
}

TEST(MeshDefsTest, NumericFlagsCountAsTrue) {
    auto table = parse_mesh_defs(R"(resource "Mesh" "Tree" { compressPositions = 1, compressUvs = 0 })");
    ASSERT_EQ(table.count("Tree"), 1u);
    EXPECT_TRUE(table["Tree"].compress_positions);
    EXPECT_FALSE(table["Tree"].compress_uvs);
}

TEST(MeshDefsTest, EmptyTextGivesEmptyTable) {
    EXPECT_TRUE(parse_mesh_defs("").empty());
    EXPECT_TRUE(parse_mesh_defs("return {}").empty());
}

TEST(MeshDefsTest, MissingFileGivesEmptyTable) {
    ScopedTempDir dir;
    auto table = load_mesh_defs(dir.path() / "MeshDefs.lua");
    ASSERT_TRUE(table) << table.error().full_message();
    EXPECT_TRUE(table->empty());
}

TEST(MeshDefsTest, LoadsFromFile) {
    ScopedTempDir dir;
    const auto path = dir.path() / "MeshDefs.lua";
    ASSERT_TRUE(write_text_file(path, kDefs));

    auto table = load_mesh_defs(path);
    ASSERT_TRUE(table) << table.error().full_message();
    EXPECT_EQ(table->size(), 2u);
    EXPECT_TRUE(table->at("BodyCape_ZipPos").compress_positions);
}
