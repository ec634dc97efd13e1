#include <gtest/gtest.h>

#include "skymesh/compression.hpp"

#include <numeric>

using namespace skymesh;

namespace {

std::vector<uint8_t> sample_bytes(size_t n) {
    std::vector<uint8_t> data(n);
    for (size_t i = 0; i < n; i++) {
        data[i] = static_cast<uint8_t>((i * 7) % 13);
    }
    return data;
}

} // namespace

TEST(CompressionTest, Lz4BlockRoundTrip) {
    auto original = sample_bytes(1000);
    auto packed = compress_lz4(original);

    Lz4Decompressor codec;
    auto out = codec.decompress(packed, packed.size(), original.size());
    ASSERT_TRUE(out) << out.error().full_message();
    EXPECT_EQ(out.value(), original);
}

TEST(CompressionTest, Lz4ShortOutputIsSizeMismatch) {
    auto original = sample_bytes(100);
    auto packed = compress_lz4(original);

    Lz4Decompressor codec;
    auto out = codec.decompress(packed, packed.size(), 120);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().code, Error::Code::DecompressionFailure);
    EXPECT_NE(out.error().message.find("Size mismatch"), std::string::npos);
}

TEST(CompressionTest, DefaultBindingHandlesZlibStreams) {
    auto original = sample_bytes(512);
    auto packed = compress_zlib(original);
    ASSERT_EQ(detect_compression(packed.data(), packed.size()), CompressionType::Zlib);

    DefaultDecompressor codec;
    auto out = codec.decompress(packed, packed.size(), original.size());
    ASSERT_TRUE(out) << out.error().full_message();
    EXPECT_EQ(out.value(), original);
}

TEST(CompressionTest, DefaultBindingHandlesLz4Blocks) {
    auto original = sample_bytes(777);
    auto packed = compress_lz4(original);
    // No header: classified as plain data and left to the LZ4 path
    EXPECT_EQ(detect_compression(packed.data(), packed.size()), CompressionType::None);

    DefaultDecompressor codec;
    auto out = codec.decompress(packed, packed.size(), original.size());
    ASSERT_TRUE(out) << out.error().full_message();
    EXPECT_EQ(out.value(), original);
}

TEST(CompressionTest, GarbageIsDecompressionFailure) {
    std::vector<uint8_t> garbage(16, 0xFF);

    DefaultDecompressor codec;
    auto out = codec.decompress(garbage, garbage.size(), 64);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().code, Error::Code::DecompressionFailure);
}

TEST(CompressionTest, WindowLargerThanInputIsRejected) {
    auto packed = compress_lz4(sample_bytes(64));

    Lz4Decompressor lz4;
    auto out = lz4.decompress(packed, packed.size() + 1, 64);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().code, Error::Code::DecompressionFailure);
    EXPECT_EQ(out.error().context, "lz4");
}

TEST(CompressionTest, ZeroExpectedSizeIsRejected) {
    auto packed = compress_zlib(sample_bytes(64));

    ZlibDecompressor zlib;
    auto out = zlib.decompress(packed, packed.size(), 0);
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().code, Error::Code::DecompressionFailure);
}

TEST(CompressionTest, DetectCompression) {
    const uint8_t zlib_default[] = {0x78, 0x9C, 0x00};
    const uint8_t zlib_best[] = {0x78, 0xDA};
    const uint8_t other[] = {0x1F, 0x00, 0x00, 0x00};

    EXPECT_EQ(detect_compression(zlib_default, sizeof(zlib_default)), CompressionType::Zlib);
    EXPECT_EQ(detect_compression(zlib_best, sizeof(zlib_best)), CompressionType::Zlib);
    EXPECT_EQ(detect_compression(other, sizeof(other)), CompressionType::None);
    EXPECT_EQ(detect_compression(other, 1), CompressionType::None);
}
