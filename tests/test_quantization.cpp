#include <gtest/gtest.h>

#include "skymesh/quantization.hpp"
#include "skymesh/mesh_format.hpp"

#include <cmath>

using namespace skymesh;

TEST(QuantizationTest, U16EndpointsMapToRange) {
    EXPECT_FLOAT_EQ(quant::dequantize_u16(0, -3.0f, 6.0f), -3.0f);
    EXPECT_FLOAT_EQ(quant::dequantize_u16(65535, -3.0f, 6.0f), 3.0f);
    EXPECT_NEAR(quant::dequantize_u16(32768, 0.0f, 2.0f), 1.0f, 1e-4f);
}

TEST(QuantizationTest, VectorDequantizeUsesPerAxisParams) {
    QuantizationParams params{glm::vec3(1.0f, 2.0f, 3.0f), glm::vec3(10.0f, 20.0f, 30.0f)};
    glm::vec3 v = quant::dequantize_u16(65535, 0, 65535, params);
    EXPECT_FLOAT_EQ(v.x, 11.0f);
    EXPECT_FLOAT_EQ(v.y, 2.0f);
    EXPECT_FLOAT_EQ(v.z, 33.0f);
}

TEST(QuantizationTest, UnitUvParamsMatchUnorm16) {
    glm::vec2 uv = quant::dequantize_u16(65535, 16384, quant::unit_uv_params());
    EXPECT_FLOAT_EQ(uv.x, 1.0f);
    EXPECT_FLOAT_EQ(uv.y, quant::unorm16(16384));
}

TEST(QuantizationTest, Snorm8IsSymmetric) {
    EXPECT_FLOAT_EQ(quant::snorm8_symmetric(0), -1.0f);
    EXPECT_FLOAT_EQ(quant::snorm8_symmetric(255), 1.0f);
    EXPECT_NEAR(quant::snorm8_symmetric(128), 0.0039f, 1e-3f);

    glm::vec3 v = quant::snorm8_symmetric(0, 255, 0);
    EXPECT_EQ(v, glm::vec3(-1.0f, 1.0f, -1.0f));
}

TEST(QuantizationTest, HalfFloatDecode) {
    EXPECT_FLOAT_EQ(format::half_to_float(0x0000), 0.0f);
    EXPECT_FLOAT_EQ(format::half_to_float(0x3C00), 1.0f);
    EXPECT_FLOAT_EQ(format::half_to_float(0x3800), 0.5f);
    EXPECT_FLOAT_EQ(format::half_to_float(0xC000), -2.0f);
    EXPECT_FLOAT_EQ(format::half_to_float(0x0001), 1.0f / 16777216.0f);
    EXPECT_TRUE(std::isinf(format::half_to_float(0x7C00)));
}
