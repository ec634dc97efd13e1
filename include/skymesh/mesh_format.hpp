/**
 * Sky .mesh Format Constants and Binary Helpers
 *
 * Shared definitions for the decode strategies. The format is undocumented;
 * every offset below was recovered by probing shipped assets.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <span>
#include <optional>

namespace skymesh {
namespace format {

// ============================================================================
// Signatures and global limits
// ============================================================================
constexpr uint8_t FMT_MESH_SIGNATURE[4] = {0x1F, 0x00, 0x00, 0x00};

constexpr size_t MIN_HEADER_SIZE = 16;              // Below this nothing is attempted
constexpr uint32_t MAX_SANE_COUNT = 1000000;        // Vertex/index/bone count ceiling

// ============================================================================
// fmt_mesh container (signature-prefixed)
// ============================================================================
constexpr size_t FMT_HEADER_WORDS = 18;             // u32[18] after the signature
constexpr size_t FMT_OFF_HEADER_WORDS = 0x04;
constexpr size_t FMT_SUBMESH_WORD = 17;             // header word holding sub-mesh count
constexpr size_t FMT_OFF_HAS_BONES = 0x4C;          // u16
constexpr size_t FMT_OFF_COMPRESSED = 0x52;         // u32
constexpr size_t FMT_OFF_UNCOMPRESSED = 0x56;       // u32
constexpr size_t FMT_OFF_PAYLOAD = 0x5A;            // compressed payload start (90)

// Bone info block, after the compressed payload
constexpr size_t FMT_BONE_INFO_SIZE = 20 * 4 + 1 + 4;
constexpr size_t FMT_BONE_COUNT_OFF = 17 * 4;       // u32[17] of the info block
constexpr size_t FMT_BONE_RECORD_SIZE = 64 + 64 + 4;

// Decompressed payload
constexpr size_t FMT_PAY_VERTEX_COUNT = 116;
constexpr size_t FMT_PAY_INDEX_COUNT = 120;
constexpr size_t FMT_PAY_UV_CHANNELS = 128;
constexpr size_t FMT_PAY_VERTEX_DATA = 179;
constexpr size_t FMT_POSITION_STRIDE = 16;          // f32 xyz + pad
constexpr size_t FMT_POSITION_GAP = 4;              // per-vertex bytes between positions and UVs
constexpr size_t FMT_UV_RECORD_STRIDE = 16;         // up to 4 half2 channels
constexpr size_t FMT_MAX_UV_CHANNELS = 4;
constexpr size_t FMT_WEIGHT_STRIDE = 8;             // per-vertex skinning bytes (skipped)

// ============================================================================
// Compressed-model payload
// ============================================================================
constexpr size_t CMP_NEW_OFF_VERTEX_COUNT = 0x34;
constexpr size_t CMP_NEW_OFF_INDEX_COUNT = 0x38;
constexpr size_t CMP_NEW_OFF_UV_COUNT = 0x3C;
constexpr size_t CMP_NEW_OFF_MIN = 0x40;            // f32[3]
constexpr size_t CMP_NEW_OFF_RANGE = 0x4C;          // f32[3]
constexpr size_t CMP_NEW_VERTEX_DATA = 0x60;
constexpr int32_t CMP_NEW_MAX_VERTICES = 100000;
constexpr int32_t CMP_NEW_MAX_INDICES = 300000;

constexpr size_t CMP_OLD_OFF_MIN = 0x60;            // f32[3]
constexpr size_t CMP_OLD_OFF_RANGE_X = 0x6C;
constexpr size_t CMP_OLD_OFF_RANGE_Y = 0x70;        // also used for z
constexpr size_t CMP_OLD_OFF_VERTEX_COUNT = 0x74;
constexpr size_t CMP_OLD_OFF_INDEX_COUNT = 0x78;
constexpr size_t CMP_OLD_VERTEX_DATA = 0x7C;

constexpr size_t CMP_QUANT_VERTEX_STRIDE = 6;       // u16 xyz
constexpr size_t CMP_QUANT_UV_STRIDE = 4;           // u16 uv
constexpr size_t ZIP_POSITION_STRIDE = 4;           // u8 pad + u8 xyz

constexpr uint32_t CMP_MAX_COMPRESSED = 10u * 1024u * 1024u;
constexpr uint32_t CMP_MAX_UNCOMPRESSED = 50u * 1024u * 1024u;

// ============================================================================
// Binary Read Helpers (little-endian)
// ============================================================================
inline uint32_t read_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline int32_t read_i32_le(const uint8_t* p) {
    return static_cast<int32_t>(read_u32_le(p));
}

inline uint16_t read_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8);
}

inline float read_f32_le(const uint8_t* p) {
    float f;
    std::memcpy(&f, p, sizeof(float));
    return f;
}

/**
 * Convert IEEE 754 half-float (16-bit) to single-precision (32-bit).
 */
inline float half_to_float(uint16_t h) {
    uint32_t sign = (h >> 15) & 0x1;
    uint32_t exp = (h >> 10) & 0x1F;
    uint32_t mant = h & 0x3FF;
    uint32_t bits;

    if (exp == 0) {
        if (mant == 0) {
            bits = sign << 31;
        } else {
            // Denormal: 2^-14 * mant / 1024
            float value = static_cast<float>(mant) / 1024.0f * (1.0f / 16384.0f);
            return sign ? -value : value;
        }
    } else if (exp == 31) {
        bits = (sign << 31) | (mant == 0 ? 0x7F800000u : 0x7FC00000u);
    } else {
        bits = (sign << 31) | ((exp + 112) << 23) | (mant << 13);
    }

    float f;
    std::memcpy(&f, &bits, sizeof(float));
    return f;
}

// ============================================================================
// Offset-addressed view
// ============================================================================

/**
 * Bounds-checked view over a flat buffer whose internal "pointers" are
 * byte offsets into the buffer itself. Reads outside the buffer yield
 * std::nullopt instead of touching memory.
 */
class ByteView {
public:
    ByteView() = default;
    explicit ByteView(std::span<const uint8_t> data) : data_(data) {}

    size_t size() const { return data_.size(); }
    const uint8_t* data() const { return data_.data(); }
    std::span<const uint8_t> span() const { return data_; }

    bool contains(size_t offset, size_t length) const {
        return offset <= data_.size() && length <= data_.size() - offset;
    }

    std::optional<uint8_t> u8(size_t offset) const {
        if (!contains(offset, 1)) return std::nullopt;
        return data_[offset];
    }

    std::optional<uint16_t> u16(size_t offset) const {
        if (!contains(offset, 2)) return std::nullopt;
        return read_u16_le(data_.data() + offset);
    }

    std::optional<uint32_t> u32(size_t offset) const {
        if (!contains(offset, 4)) return std::nullopt;
        return read_u32_le(data_.data() + offset);
    }

    std::optional<int32_t> i32(size_t offset) const {
        if (!contains(offset, 4)) return std::nullopt;
        return read_i32_le(data_.data() + offset);
    }

    std::optional<float> f32(size_t offset) const {
        if (!contains(offset, 4)) return std::nullopt;
        return read_f32_le(data_.data() + offset);
    }

    /**
     * Sub-view [offset, offset + length); empty optional when out of range.
     */
    std::optional<ByteView> slice(size_t offset, size_t length) const {
        if (!contains(offset, length)) return std::nullopt;
        return ByteView(data_.subspan(offset, length));
    }

    /**
     * Sub-view from offset to the end; empty view when past the end.
     */
    ByteView tail(size_t offset) const {
        if (offset >= data_.size()) return ByteView();
        return ByteView(data_.subspan(offset));
    }

private:
    std::span<const uint8_t> data_;
};

/**
 * True if the buffer starts with the fmt_mesh signature.
 */
inline bool has_fmt_signature(std::span<const uint8_t> data) {
    return data.size() >= sizeof(FMT_MESH_SIGNATURE) &&
           std::memcmp(data.data(), FMT_MESH_SIGNATURE, sizeof(FMT_MESH_SIGNATURE)) == 0;
}

} // namespace format
} // namespace skymesh
