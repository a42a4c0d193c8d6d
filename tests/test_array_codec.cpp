#include <cstdint>
#include <vector>

#include <resqx/array_codec.hpp>
#include <resqx/compression.hpp>
#include <resqx/endian.hpp>
#include <resqx/options.hpp>

#include <gtest/gtest.h>

namespace {

resqx::ArrayData rampArray(uint64_t rows, uint64_t cols) {
  std::vector<double> values(rows * cols);
  for (size_t i = 0; i < values.size(); ++i) {
    values[i] = static_cast<double>(i) * 0.5;
  }
  return resqx::ArrayData::from<double>({rows, cols}, values);
}

} // namespace

class ArrayCodecTest : public ::testing::Test {
protected:
  std::vector<uint8_t> encode(const resqx::ArrayData &data, resqx::Compression compression,
                              size_t chunkBytes = resqx::MiB) {
    resqx::Error error;
    auto payload = resqx::ArrayCodec::encode(data, compression, 6, chunkBytes, &error);
    EXPECT_TRUE(payload.has_value()) << error.describe();
    return payload.value_or(std::vector<uint8_t>{});
  }
};

TEST_F(ArrayCodecTest, UncompressedLayout) {
  auto data = resqx::ArrayData::from<int32_t>({2, 2}, std::vector<int32_t>{1, -2, 3, -4});
  auto payload = encode(data, resqx::Compression::None);

  // Fixed header, two dims, then 16 raw body bytes
  ASSERT_EQ(payload.size(), 32 + 16 + 16);
  EXPECT_EQ(payload[0], 'R');
  EXPECT_EQ(payload[3], 'A');
  EXPECT_EQ(payload[5], static_cast<uint8_t>(resqx::Dtype::Int32));
  EXPECT_EQ(payload[7], 2);
  EXPECT_EQ(static_cast<int32_t>(resqx::loadLE<uint32_t>(payload.data() + 48)), 1);
  EXPECT_EQ(static_cast<int32_t>(resqx::loadLE<uint32_t>(payload.data() + 52)), -2);

  resqx::Error error;
  auto info = resqx::ArrayCodec::decodeHeader(payload, &error);
  ASSERT_TRUE(info.has_value()) << error.describe();
  EXPECT_EQ(info->shape, (resqx::Shape{2, 2}));
  EXPECT_EQ(info->dtype, resqx::Dtype::Int32);
  EXPECT_EQ(info->compression, resqx::Compression::None);
  EXPECT_EQ(info->rawSize, 16);

  auto decoded = resqx::ArrayCodec::decode(payload, *info, &error);
  ASSERT_TRUE(decoded.has_value()) << error.describe();
  EXPECT_EQ(*decoded, data);
}

// Small chunks force a multi-chunk body; the decoded array is unchanged
TEST_F(ArrayCodecTest, ChunkedZlib) {
  auto data = rampArray(64, 33);
  auto payload = encode(data, resqx::Compression::Zlib, 1001);

  resqx::Error error;
  auto info = resqx::ArrayCodec::decodeHeader(payload, &error);
  ASSERT_TRUE(info.has_value()) << error.describe();
  EXPECT_EQ(info->compression, resqx::Compression::Zlib);
  EXPECT_EQ(info->chunkRawBytes, 1000);
  EXPECT_EQ(info->chunkSizes.size(), (data.bytes.size() + 999) / 1000);

  auto decoded = resqx::ArrayCodec::decode(payload, *info, &error);
  ASSERT_TRUE(decoded.has_value()) << error.describe();
  EXPECT_EQ(decoded->bytes, data.bytes);
}

// A slice straddling chunk boundaries matches the same elements of the full array
TEST_F(ArrayCodecTest, DecodeRangeAcrossChunks) {
  auto data = rampArray(100, 10);
  auto payload = encode(data, resqx::Compression::Zlib, 256);
  auto info = resqx::ArrayCodec::decodeHeader(payload);
  ASSERT_TRUE(info.has_value());

  resqx::Error error;
  auto bytes = resqx::ArrayCodec::decodeRange(payload, *info, 25, 90, &error);
  ASSERT_TRUE(bytes.has_value()) << error.describe();
  ASSERT_EQ(bytes->size(), 90 * sizeof(double));

  auto values = data.values<double>();
  const double *slice = reinterpret_cast<const double *>(bytes->data());
  for (size_t i = 0; i < 90; ++i) {
    EXPECT_EQ(slice[i], values[25 + i]) << "Mismatch at element " << 25 + i;
  }

  EXPECT_FALSE(resqx::ArrayCodec::decodeRange(payload, *info, 990, 11, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::ShapeMismatch);
}

TEST_F(ArrayCodecTest, RejectsInconsistentData) {
  resqx::ArrayData data;
  data.shape = {3};
  data.dtype = resqx::Dtype::Float32;
  data.bytes.resize(8);

  resqx::Error error;
  EXPECT_FALSE(resqx::ArrayCodec::encode(data, resqx::Compression::None, 6, 1024, &error));
  EXPECT_EQ(error.code, resqx::ErrorCode::ShapeMismatch);

  data.shape = {};
  data.bytes.clear();
  EXPECT_FALSE(resqx::ArrayCodec::encode(data, resqx::Compression::None, 6, 1024, &error));
}

TEST_F(ArrayCodecTest, CorruptBodyDetected) {
  auto data = rampArray(8, 8);
  auto payload = encode(data, resqx::Compression::None);
  payload.back() ^= 0x01;

  auto info = resqx::ArrayCodec::decodeHeader(payload);
  ASSERT_TRUE(info.has_value());

  resqx::Error error;
  EXPECT_FALSE(resqx::ArrayCodec::decode(payload, *info, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Corruption);
}

TEST_F(ArrayCodecTest, CorruptHeaderDetected) {
  auto payload = encode(rampArray(4, 4), resqx::Compression::Zlib);
  resqx::Error error;

  auto badMagic = payload;
  badMagic[0] = 'X';
  EXPECT_FALSE(resqx::ArrayCodec::decodeHeader(badMagic, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Corruption);

  auto truncated = payload;
  truncated.resize(truncated.size() - 1);
  EXPECT_FALSE(resqx::ArrayCodec::decodeHeader(truncated, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Corruption);

  auto zeroDim = payload;
  resqx::storeLE<uint64_t>(zeroDim.data() + 32, 0);
  EXPECT_FALSE(resqx::ArrayCodec::decodeHeader(zeroDim, &error).has_value());

  EXPECT_FALSE(resqx::ArrayCodec::decodeHeader(std::span<const uint8_t>(), &error).has_value());
}

// Chunk sizes whose sum wraps around to the real body size
TEST_F(ArrayCodecTest, WrappingChunkTableDetected) {
  auto payload = encode(rampArray(8, 8), resqx::Compression::Zlib, 200);
  auto info = resqx::ArrayCodec::decodeHeader(payload);
  ASSERT_TRUE(info.has_value());
  ASSERT_EQ(info->chunkSizes.size(), 3);

  // Chunk table follows the fixed header and two dims
  constexpr size_t tableOffset = 32 + 16;
  for (size_t i = 0; i < 2; ++i) {
    uint8_t *entry = payload.data() + tableOffset + 8 * i;
    resqx::storeLE<uint64_t>(entry, resqx::loadLE<uint64_t>(entry) + (uint64_t{1} << 63));
  }

  resqx::Error error;
  EXPECT_FALSE(resqx::ArrayCodec::decodeHeader(payload, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Corruption);
}

TEST_F(ArrayCodecTest, OverflowingShapeDetected) {
  auto payload = encode(rampArray(4, 4), resqx::Compression::None);
  resqx::storeLE<uint64_t>(payload.data() + 32, uint64_t{1} << 62);

  resqx::Error error;
  EXPECT_FALSE(resqx::ArrayCodec::decodeHeader(payload, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Corruption);
}

TEST(CompressionTest, ZlibRoundTrip) {
  std::vector<uint8_t> input(10000);
  for (size_t i = 0; i < input.size(); ++i) {
    input[i] = static_cast<uint8_t>(i % 17);
  }

  resqx::Error error;
  auto compressed = resqx::zlibCompress(input, 9, &error);
  ASSERT_TRUE(compressed.has_value()) << error.describe();
  EXPECT_LT(compressed->size(), input.size());

  auto output = resqx::zlibDecompress(*compressed, input.size(), &error);
  ASSERT_TRUE(output.has_value()) << error.describe();
  EXPECT_EQ(*output, input);

  // The caller's expected size must be exact
  EXPECT_FALSE(resqx::zlibDecompress(*compressed, input.size() - 1, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Corruption);
}

// Zip entries carry raw deflate streams with no zlib header or trailer
TEST(CompressionTest, RawDeflateRoundTrip) {
  std::vector<uint8_t> input(70000);
  for (size_t i = 0; i < input.size(); ++i) {
    input[i] = static_cast<uint8_t>((i * 7) % 23);
  }

  resqx::Error error;
  auto deflated = resqx::deflateRaw(input, 6, &error);
  ASSERT_TRUE(deflated.has_value()) << error.describe();
  EXPECT_LT(deflated->size(), input.size());

  auto inflated = resqx::inflateRaw(*deflated, input.size(), &error);
  ASSERT_TRUE(inflated.has_value()) << error.describe();
  EXPECT_EQ(*inflated, input);

  EXPECT_FALSE(resqx::inflateRaw(*deflated, input.size() - 1, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Corruption);
  EXPECT_FALSE(resqx::inflateRaw(*deflated, input.size() + 1, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Corruption);

  std::vector<uint8_t> truncated(deflated->begin(), deflated->begin() + deflated->size() / 2);
  EXPECT_FALSE(resqx::inflateRaw(truncated, input.size(), &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Corruption);

  auto empty = resqx::deflateRaw(std::span<const uint8_t>(), 6, &error);
  ASSERT_TRUE(empty.has_value()) << error.describe();
  auto none = resqx::inflateRaw(*empty, 0, &error);
  ASSERT_TRUE(none.has_value()) << error.describe();
  EXPECT_TRUE(none->empty());
}

// Running checksum over two pieces equals the checksum of the whole
TEST(CompressionTest, Crc32Seed) {
  std::vector<uint8_t> data = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
  EXPECT_EQ(resqx::crc32(data), 0xCBF43926u);

  std::span<const uint8_t> all(data);
  uint32_t partial = resqx::crc32(all.first(4));
  EXPECT_EQ(resqx::crc32(all.subspan(4), partial), 0xCBF43926u);
  EXPECT_EQ(resqx::crc32(std::span<const uint8_t>()), 0u);
}
