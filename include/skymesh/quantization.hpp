/**
 * Sky Mesh Extractor - Quantization Codec
 *
 * Fixed-point to float conversions used by the compressed layouts.
 */

#pragma once

#include "types.hpp"
#include <glm/glm.hpp>
#include <cstdint>

namespace skymesh {
namespace quant {

constexpr float U16_MAX = 65535.0f;
constexpr float U8_MAX = 255.0f;

/**
 * min + raw / 65535 * range. raw = 0 gives min, raw = 65535 gives min + range.
 */
inline float dequantize_u16(uint16_t raw, float min, float range) {
    return min + (static_cast<float>(raw) / U16_MAX) * range;
}

inline glm::vec3 dequantize_u16(uint16_t x, uint16_t y, uint16_t z, const QuantizationParams& params) {
    return glm::vec3(
        dequantize_u16(x, params.min.x, params.range.x),
        dequantize_u16(y, params.min.y, params.range.y),
        dequantize_u16(z, params.min.z, params.range.z)
    );
}

inline glm::vec2 dequantize_u16(uint16_t u, uint16_t v, const QuantizationParams2D& params) {
    return glm::vec2(
        dequantize_u16(u, params.min.x, params.range.x),
        dequantize_u16(v, params.min.y, params.range.y)
    );
}

/**
 * raw / 65535, the [0, 1] normalization used for quantized UVs.
 */
inline float unorm16(uint16_t raw) {
    return static_cast<float>(raw) / U16_MAX;
}

/**
 * Symmetric 8-bit normalization: 0 -> -1, 255 -> 1.
 */
inline float snorm8_symmetric(uint8_t raw) {
    return static_cast<float>(raw) / U8_MAX * 2.0f - 1.0f;
}

inline glm::vec3 snorm8_symmetric(uint8_t x, uint8_t y, uint8_t z) {
    return glm::vec3(snorm8_symmetric(x), snorm8_symmetric(y), snorm8_symmetric(z));
}

/**
 * UV params equivalent to unorm16 on both axes.
 */
inline QuantizationParams2D unit_uv_params() {
    return QuantizationParams2D{glm::vec2(0.0f), glm::vec2(1.0f)};
}

} // namespace quant
} // namespace skymesh
