/**
 * Synthetic .mesh buffers and test doubles shared by the unit tests.
 */

#pragma once

#include "skymesh/types.hpp"
#include "skymesh/compression.hpp"
#include "skymesh/mesh_format.hpp"
#include <glm/glm.hpp>
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace skymesh::test {

// ============================================================================
// Byte writer
// ============================================================================
class ByteWriter {
public:
    explicit ByteWriter(size_t size = 0) : data_(size, 0) {}

    void ensure(size_t end) {
        if (data_.size() < end) data_.resize(end, 0);
    }

    void u8(size_t offset, uint8_t v) {
        ensure(offset + 1);
        data_[offset] = v;
    }

    void u16(size_t offset, uint16_t v) {
        ensure(offset + 2);
        data_[offset] = static_cast<uint8_t>(v & 0xFF);
        data_[offset + 1] = static_cast<uint8_t>(v >> 8);
    }

    void u32(size_t offset, uint32_t v) {
        ensure(offset + 4);
        for (int i = 0; i < 4; i++) {
            data_[offset + i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
        }
    }

    void i32(size_t offset, int32_t v) { u32(offset, static_cast<uint32_t>(v)); }

    void f32(size_t offset, float v) {
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        u32(offset, bits);
    }

    void bytes(size_t offset, const std::vector<uint8_t>& src) {
        ensure(offset + src.size());
        std::memcpy(data_.data() + offset, src.data(), src.size());
    }

    void fill(size_t offset, size_t length, uint8_t v) {
        ensure(offset + length);
        std::memset(data_.data() + offset, v, length);
    }

    size_t size() const { return data_.size(); }
    std::vector<uint8_t> take() { return std::move(data_); }

private:
    std::vector<uint8_t> data_;
};

inline void patch_u32(std::vector<uint8_t>& data, size_t offset, uint32_t v) {
    for (int i = 0; i < 4; i++) {
        data.at(offset + i) = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
}

/**
 * float -> half for normal values (and zero); enough for test UVs.
 */
inline uint16_t to_half(float f) {
    if (f == 0.0f) return 0;
    uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    uint16_t sign = static_cast<uint16_t>((bits >> 16) & 0x8000);
    int exp = static_cast<int>((bits >> 23) & 0xFF) - 127 + 15;
    uint16_t mant = static_cast<uint16_t>((bits >> 13) & 0x3FF);
    return static_cast<uint16_t>(sign | (exp << 10) | mant);
}

// ============================================================================
// Reference geometry
// ============================================================================
struct TestMesh {
    std::vector<glm::vec3> positions;
    std::vector<glm::vec2> uvs;
    std::vector<uint32_t> indices;
};

inline TestMesh make_triangle() {
    TestMesh m;
    m.positions = {glm::vec3(0.0f, 0.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f)};
    m.uvs = {glm::vec2(0.0f, 0.0f), glm::vec2(1.0f, 0.0f), glm::vec2(0.0f, 1.0f)};
    m.indices = {0, 1, 2};
    return m;
}

/**
 * Quad split in two triangles plus one degenerate triangle in between.
 */
inline TestMesh make_quad_with_degenerate() {
    TestMesh m;
    m.positions = {glm::vec3(0.0f, 0.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f),
                   glm::vec3(1.0f, 1.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f)};
    m.uvs = {glm::vec2(0.0f, 0.0f), glm::vec2(1.0f, 0.0f), glm::vec2(1.0f, 1.0f), glm::vec2(0.0f, 1.0f)};
    m.indices = {0, 1, 2, 0, 0, 1, 0, 2, 3};
    return m;
}

// ============================================================================
// fmt_mesh
// ============================================================================

/**
 * Classic fmt_mesh payload: f32 positions, half-float UVs, 16-bit indices.
 */
inline std::vector<uint8_t> build_fmt_payload(const TestMesh& mesh, bool with_bones = false) {
    using namespace skymesh::format;
    const size_t vc = mesh.positions.size();
    const size_t ic = mesh.indices.size();

    ByteWriter w(FMT_PAY_VERTEX_DATA);
    w.u32(FMT_PAY_VERTEX_COUNT, static_cast<uint32_t>(vc));
    w.u32(FMT_PAY_INDEX_COUNT, static_cast<uint32_t>(ic));
    w.u32(FMT_PAY_UV_CHANNELS, 1);

    size_t cursor = FMT_PAY_VERTEX_DATA;
    for (size_t i = 0; i < vc; i++) {
        w.f32(cursor + i * 16, mesh.positions[i].x);
        w.f32(cursor + i * 16 + 4, mesh.positions[i].y);
        w.f32(cursor + i * 16 + 8, mesh.positions[i].z);
    }
    cursor += vc * (FMT_POSITION_STRIDE + FMT_POSITION_GAP);

    for (size_t i = 0; i < vc; i++) {
        w.u16(cursor + i * 16, to_half(mesh.uvs[i].x));
        w.u16(cursor + i * 16 + 2, to_half(mesh.uvs[i].y));
    }
    cursor += vc * FMT_UV_RECORD_STRIDE;

    if (with_bones) {
        cursor += vc * FMT_WEIGHT_STRIDE;
    }

    for (size_t i = 0; i < ic; i++) {
        w.u16(cursor + i * 2, static_cast<uint16_t>(mesh.indices[i]));
    }
    w.ensure(cursor + ic * 2);
    return w.take();
}

/**
 * ZipPos fmt_mesh payload: indices after the header, 8-bit positions at the tail.
 */
inline std::vector<uint8_t> build_fmt_zip_payload(const std::vector<std::array<uint8_t, 3>>& positions,
                                                  const std::vector<uint32_t>& indices) {
    using namespace skymesh::format;
    const size_t vc = positions.size();
    const size_t ic = indices.size();

    ByteWriter w(FMT_PAY_VERTEX_DATA);
    w.u32(FMT_PAY_VERTEX_COUNT, static_cast<uint32_t>(vc));
    w.u32(FMT_PAY_INDEX_COUNT, static_cast<uint32_t>(ic));
    w.u32(FMT_PAY_UV_CHANNELS, 0);

    size_t cursor = FMT_PAY_VERTEX_DATA;
    for (size_t i = 0; i < ic; i++) {
        w.u16(cursor + i * 2, static_cast<uint16_t>(indices[i]));
    }
    cursor += ic * 2;

    for (size_t i = 0; i < vc; i++) {
        w.u8(cursor + i * 4, 0x7F);
        w.u8(cursor + i * 4 + 1, positions[i][0]);
        w.u8(cursor + i * 4 + 2, positions[i][1]);
        w.u8(cursor + i * 4 + 3, positions[i][2]);
    }
    return w.take();
}

/**
 * fmt_mesh file around an already packed payload, optionally followed by a
 * bone block with bone_count records.
 */
inline std::vector<uint8_t> build_fmt_file(const std::vector<uint8_t>& packed, uint32_t uncompressed_size,
                                           bool with_bones = false, uint32_t bone_count = 0) {
    using namespace skymesh::format;
    ByteWriter w(FMT_OFF_PAYLOAD);
    for (size_t i = 0; i < sizeof(FMT_MESH_SIGNATURE); i++) {
        w.u8(i, FMT_MESH_SIGNATURE[i]);
    }
    w.u32(FMT_OFF_HEADER_WORDS + FMT_SUBMESH_WORD * 4, 1);
    w.u16(FMT_OFF_HAS_BONES, with_bones ? 1 : 0);
    w.u32(FMT_OFF_COMPRESSED, static_cast<uint32_t>(packed.size()));
    w.u32(FMT_OFF_UNCOMPRESSED, uncompressed_size);
    w.bytes(FMT_OFF_PAYLOAD, packed);

    if (with_bones) {
        const size_t info = FMT_OFF_PAYLOAD + packed.size();
        w.ensure(info + FMT_BONE_INFO_SIZE);
        w.u32(info + FMT_BONE_COUNT_OFF, bone_count);
        w.ensure(info + FMT_BONE_INFO_SIZE + bone_count * FMT_BONE_RECORD_SIZE);
    }
    return w.take();
}

// ============================================================================
// Compressed model
// ============================================================================
using QuantizedPosition = std::array<uint16_t, 3>;
using QuantizedUv = std::array<uint16_t, 2>;

inline void write_quantized_streams(ByteWriter& w, size_t vertex_start,
                                    const std::vector<QuantizedPosition>& positions,
                                    const std::vector<QuantizedUv>& uvs,
                                    const std::vector<uint32_t>& indices) {
    const size_t vc = positions.size();
    for (size_t i = 0; i < vc; i++) {
        for (size_t a = 0; a < 3; a++) {
            w.u16(vertex_start + i * 6 + a * 2, positions[i][a]);
        }
    }
    const size_t uv_start = vertex_start + vc * 6;
    for (size_t i = 0; i < uvs.size(); i++) {
        w.u16(uv_start + i * 4, uvs[i][0]);
        w.u16(uv_start + i * 4 + 2, uvs[i][1]);
    }
    const size_t index_start = uv_start + vc * 4;
    for (size_t i = 0; i < indices.size(); i++) {
        w.u16(index_start + i * 2, static_cast<uint16_t>(indices[i]));
    }
    w.ensure(index_start + indices.size() * 2);
}

inline std::vector<uint8_t> build_old_payload(const std::vector<QuantizedPosition>& positions,
                                              const std::vector<QuantizedUv>& uvs,
                                              const std::vector<uint32_t>& indices,
                                              glm::vec3 min, float range_x, float range_y) {
    using namespace skymesh::format;
    ByteWriter w(CMP_OLD_VERTEX_DATA);
    w.f32(CMP_OLD_OFF_MIN, min.x);
    w.f32(CMP_OLD_OFF_MIN + 4, min.y);
    w.f32(CMP_OLD_OFF_MIN + 8, min.z);
    w.f32(CMP_OLD_OFF_RANGE_X, range_x);
    w.f32(CMP_OLD_OFF_RANGE_Y, range_y);
    w.i32(CMP_OLD_OFF_VERTEX_COUNT, static_cast<int32_t>(positions.size()));
    w.i32(CMP_OLD_OFF_INDEX_COUNT, static_cast<int32_t>(indices.size()));
    write_quantized_streams(w, CMP_OLD_VERTEX_DATA, positions, uvs, indices);
    return w.take();
}

inline std::vector<uint8_t> build_new_payload(const std::vector<QuantizedPosition>& positions,
                                              const std::vector<QuantizedUv>& uvs,
                                              const std::vector<uint32_t>& indices,
                                              glm::vec3 min, glm::vec3 range) {
    using namespace skymesh::format;
    ByteWriter w(CMP_NEW_VERTEX_DATA);
    w.i32(CMP_NEW_OFF_VERTEX_COUNT, static_cast<int32_t>(positions.size()));
    w.i32(CMP_NEW_OFF_INDEX_COUNT, static_cast<int32_t>(indices.size()));
    w.i32(CMP_NEW_OFF_UV_COUNT, static_cast<int32_t>(uvs.size()));
    for (int a = 0; a < 3; a++) {
        w.f32(CMP_NEW_OFF_MIN + a * 4, min[a]);
        w.f32(CMP_NEW_OFF_RANGE + a * 4, range[a]);
    }
    write_quantized_streams(w, CMP_NEW_VERTEX_DATA, positions, uvs, indices);
    return w.take();
}

/**
 * ZipPos compressed payload: old-layout counts, UVs at 0x7C, indices, tail positions.
 */
inline std::vector<uint8_t> build_zip_payload(const std::vector<std::array<uint8_t, 3>>& positions,
                                              const std::vector<QuantizedUv>& uvs,
                                              const std::vector<uint32_t>& indices) {
    using namespace skymesh::format;
    const size_t vc = positions.size();
    ByteWriter w(CMP_OLD_VERTEX_DATA);
    w.i32(CMP_OLD_OFF_VERTEX_COUNT, static_cast<int32_t>(vc));
    w.i32(CMP_OLD_OFF_INDEX_COUNT, static_cast<int32_t>(indices.size()));

    for (size_t i = 0; i < uvs.size(); i++) {
        w.u16(CMP_OLD_VERTEX_DATA + i * 4, uvs[i][0]);
        w.u16(CMP_OLD_VERTEX_DATA + i * 4 + 2, uvs[i][1]);
    }
    const size_t index_start = CMP_OLD_VERTEX_DATA + vc * 4;
    for (size_t i = 0; i < indices.size(); i++) {
        w.u16(index_start + i * 2, static_cast<uint16_t>(indices[i]));
    }
    const size_t tail = index_start + indices.size() * 2;
    for (size_t i = 0; i < vc; i++) {
        w.u8(tail + i * 4, 0x00);
        w.u8(tail + i * 4 + 1, positions[i][0]);
        w.u8(tail + i * 4 + 2, positions[i][1]);
        w.u8(tail + i * 4 + 3, positions[i][2]);
    }
    return w.take();
}

/**
 * Compressed-model file using the first default size candidate (0x52/0x56, data at 0x5A).
 */
inline std::vector<uint8_t> build_compressed_file(const std::vector<uint8_t>& packed, uint32_t uncompressed_size) {
    ByteWriter w(0x5A);
    w.u32(0x52, static_cast<uint32_t>(packed.size()));
    w.u32(0x56, uncompressed_size);
    w.bytes(0x5A, packed);
    return w.take();
}

// ============================================================================
// Heuristic (uncompressed)
// ============================================================================
inline std::vector<uint8_t> build_heuristic_file(const TestMesh& mesh, size_t shared_offset = 0x74,
                                                 size_t total_offset = 0x78, size_t data_offset = 0xB3) {
    const size_t vc = mesh.positions.size();
    ByteWriter w(data_offset);
    w.i32(shared_offset, static_cast<int32_t>(vc));
    w.i32(total_offset, static_cast<int32_t>(mesh.indices.size()));

    for (size_t i = 0; i < vc; i++) {
        w.f32(data_offset + i * 12, mesh.positions[i].x);
        w.f32(data_offset + i * 12 + 4, mesh.positions[i].y);
        w.f32(data_offset + i * 12 + 8, mesh.positions[i].z);
    }
    const size_t uv_start = data_offset + vc * 12;
    for (size_t i = 0; i < vc; i++) {
        w.f32(uv_start + i * 8, mesh.uvs[i].x);
        w.f32(uv_start + i * 8 + 4, mesh.uvs[i].y);
    }
    const size_t index_start = uv_start + vc * 8;
    for (size_t i = 0; i < mesh.indices.size(); i++) {
        w.u16(index_start + i * 2, static_cast<uint16_t>(mesh.indices[i]));
    }
    // Room for the declared layout: shared * 12 + total * 8 bytes from data_offset
    w.ensure(std::max(index_start + mesh.indices.size() * 2,
                      data_offset + vc * 12 + mesh.indices.size() * 8));
    return w.take();
}

// ============================================================================
// Test doubles
// ============================================================================

/**
 * Returns a fixed payload whatever the input, as long as the declared size
 * matches it; otherwise a size-mismatch DecompressionFailure.
 */
class FakeDecompressor : public Decompressor {
public:
    explicit FakeDecompressor(std::vector<uint8_t> output = {}) : output_(std::move(output)) {}

    Result<std::vector<uint8_t>> decompress(std::span<const uint8_t> input,
                                            size_t compressed_size,
                                            size_t expected_size) const override {
        calls_++;
        if (compressed_size > input.size()) {
            return Error::decompression_failure("Window exceeds input", "fake");
        }
        if (expected_size != output_.size()) {
            return Error::decompression_failure("Size mismatch: produced " + std::to_string(output_.size()) +
                                                " bytes, expected " + std::to_string(expected_size), "fake");
        }
        return output_;
    }

    size_t calls() const { return calls_; }

private:
    std::vector<uint8_t> output_;
    mutable std::atomic<size_t> calls_{0};
};

inline RawAsset make_asset(std::vector<uint8_t> data, const std::string& filename,
                           std::optional<MeshFlags> flags = std::nullopt) {
    RawAsset asset;
    asset.data = std::move(data);
    asset.filename = filename;
    asset.flags = std::move(flags);
    return asset;
}

/**
 * Unique directory under the system temp dir, removed on destruction.
 */
class ScopedTempDir {
public:
    ScopedTempDir() {
        std::random_device rd;
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("skymesh_test_" + std::to_string(stamp) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace skymesh::test
