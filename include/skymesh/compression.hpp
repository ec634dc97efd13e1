/**
 * Sky Mesh Extractor - Compression utilities
 *
 * Raw codec helpers plus the Decompressor capability used by the decode
 * strategies. Strategies only ever see the Decompressor interface, so tests
 * can bind a deterministic fake.
 */

#pragma once

#include "result.hpp"
#include <vector>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <span>

namespace skymesh {

/**
 * Compression type enum.
 */
enum class CompressionType {
    None,
    Zlib
};

/**
 * Zlib when data starts with a zlib header, otherwise None (LZ4 blocks carry no magic).
 */
CompressionType detect_compression(const uint8_t* data, size_t size);

/**
 * Decompress zlib data. Throws std::runtime_error on codec failure.
 */
std::vector<uint8_t> decompress_zlib(const uint8_t* data, size_t size, size_t expected_size);

/**
 * Decompress an LZ4 block. Throws std::runtime_error on codec failure.
 * The result holds the bytes actually produced (at most expected_size).
 */
std::vector<uint8_t> decompress_lz4(const uint8_t* data, size_t size, size_t expected_size);

/**
 * Compress data with zlib.
 */
std::vector<uint8_t> compress_zlib(const uint8_t* data, size_t size, int level = 6);
std::vector<uint8_t> compress_zlib(const std::vector<uint8_t>& data, int level = 6);

/**
 * Compress data with LZ4 (single block).
 */
std::vector<uint8_t> compress_lz4(const uint8_t* data, size_t size);
std::vector<uint8_t> compress_lz4(const std::vector<uint8_t>& data);

/**
 * Decompression capability: returns exactly expected_size bytes or a
 * DecompressionFailure. Stateless; no handle survives a call.
 */
class Decompressor {
public:
    virtual ~Decompressor() = default;

    virtual Result<std::vector<uint8_t>> decompress(std::span<const uint8_t> input,
                                                    size_t compressed_size,
                                                    size_t expected_size) const = 0;
};

/**
 * LZ4 block decompression.
 */
class Lz4Decompressor : public Decompressor {
public:
    Result<std::vector<uint8_t>> decompress(std::span<const uint8_t> input,
                                            size_t compressed_size,
                                            size_t expected_size) const override;
};

/**
 * zlib stream decompression.
 */
class ZlibDecompressor : public Decompressor {
public:
    Result<std::vector<uint8_t>> decompress(std::span<const uint8_t> input,
                                            size_t compressed_size,
                                            size_t expected_size) const override;
};

/**
 * Production binding: LZ4 first, zlib when the block carries a zlib header
 * or LZ4 cannot produce the declared size.
 */
class DefaultDecompressor : public Decompressor {
public:
    Result<std::vector<uint8_t>> decompress(std::span<const uint8_t> input,
                                            size_t compressed_size,
                                            size_t expected_size) const override;

private:
    Lz4Decompressor lz4_;
    ZlibDecompressor zlib_;
};

} // namespace skymesh
