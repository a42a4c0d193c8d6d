#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace resqx {

// Decoded header of an array payload part
//
// Layout (little-endian):
//   0  magic "RQXA"
//   4  version u8, dtype u8, compression u8, rank u8
//   8  raw bytes per chunk u32 (0 when uncompressed), chunk count u32
//  16  raw body size u64
//  24  CRC-32 of the raw body u32, reserved u32
//  32  dims u64[rank], then compressed chunk sizes u64[chunk count]
//      body: raw little-endian elements, or zlib chunks back to back
struct ArrayPayloadInfo {
  Dtype dtype = Dtype::Float64;
  Shape shape;
  Compression compression = Compression::None;
  uint32_t chunkRawBytes = 0;
  uint64_t rawSize = 0;
  uint32_t rawCrc = 0;
  std::vector<uint64_t> chunkSizes;
  size_t bodyOffset = 0;
};

class ArrayCodec {
public:
  static constexpr uint8_t version = 1;

  // Encode a materialized array into payload bytes
  static std::optional<std::vector<uint8_t>> encode(const ArrayData &data, Compression compression,
                                                    int level, size_t chunkBytes,
                                                    Error *outError = nullptr);

  // Parse and bounds-check the header without touching the body
  static std::optional<ArrayPayloadInfo> decodeHeader(std::span<const uint8_t> payload,
                                                      Error *outError = nullptr);

  // Decode the whole array, verifying the body CRC
  static std::optional<ArrayData> decode(std::span<const uint8_t> payload,
                                         const ArrayPayloadInfo &info, Error *outError = nullptr);

  // Decode elements [first, first + count) into raw bytes; only overlapping chunks are inflated
  static std::optional<std::vector<uint8_t>> decodeRange(std::span<const uint8_t> payload,
                                                         const ArrayPayloadInfo &info,
                                                         uint64_t first, uint64_t count,
                                                         Error *outError = nullptr);
};

} // namespace resqx
