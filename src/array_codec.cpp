#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstring>

#include <fmt/format.h>

#include <resqx/array_codec.hpp>
#include <resqx/compression.hpp>
#include <resqx/endian.hpp>

namespace resqx {

namespace {

constexpr size_t kFixedHeaderSize = 32;
constexpr uint8_t kMaxRank = 16;

Error corruption(std::string message) {
  return Error(ErrorCode::Corruption, std::move(message));
}

// Raw body bytes in little-endian element order
std::vector<uint8_t> littleEndianBody(const ArrayData &data) {
  std::vector<uint8_t> body = data.bytes;
  swapElementsToLittle(body.data(), dtypeSize(data.dtype), body.size() / dtypeSize(data.dtype));
  return body;
}

} // namespace

std::optional<std::vector<uint8_t>> ArrayCodec::encode(const ArrayData &data,
                                                       Compression compression, int level,
                                                       size_t chunkBytes, Error *outError) {
  size_t elementSize = dtypeSize(data.dtype);
  if (data.shape.empty() || data.shape.size() > kMaxRank) {
    fail(outError, Error(ErrorCode::ShapeMismatch,
                         fmt::format("Unsupported array rank {}", data.shape.size())));
    return std::nullopt;
  }
  if (data.bytes.size() != elementCount(data.shape) * elementSize) {
    fail(outError, Error(ErrorCode::ShapeMismatch,
                         fmt::format("Array of shape {} and dtype {} needs {} bytes, got {}",
                                     shapeString(data.shape), toString(data.dtype),
                                     elementCount(data.shape) * elementSize, data.bytes.size())));
    return std::nullopt;
  }

  std::vector<uint8_t> body = littleEndianBody(data);
  uint32_t rawCrc = crc32(body);

  // Compress the body in independent chunks so that slices can be inflated selectively
  std::vector<std::vector<uint8_t>> chunks;
  uint32_t chunkRawBytes = 0;
  if (compression == Compression::Zlib) {
    size_t perChunk = std::max(elementSize, chunkBytes - chunkBytes % elementSize);
    perChunk = std::min<size_t>(perChunk, UINT32_MAX - UINT32_MAX % elementSize);
    chunkRawBytes = static_cast<uint32_t>(perChunk);
    for (size_t offset = 0; offset < body.size(); offset += perChunk) {
      size_t length = std::min(perChunk, body.size() - offset);
      auto compressed = zlibCompress(std::span<const uint8_t>(body.data() + offset, length),
                                     level, outError);
      if (!compressed) {
        return std::nullopt;
      }
      chunks.push_back(std::move(*compressed));
    }
  }

  size_t headerSize = kFixedHeaderSize + 8 * data.shape.size() + 8 * chunks.size();
  size_t bodySize = body.size();
  if (compression == Compression::Zlib) {
    bodySize = 0;
    for (const auto &chunk : chunks) {
      bodySize += chunk.size();
    }
  }

  std::vector<uint8_t> payload(headerSize + bodySize);
  uint8_t *p = payload.data();
  std::memcpy(p, "RQXA", 4);
  p[4] = version;
  p[5] = static_cast<uint8_t>(data.dtype);
  p[6] = static_cast<uint8_t>(compression);
  p[7] = static_cast<uint8_t>(data.shape.size());
  storeLE<uint32_t>(p + 8, chunkRawBytes);
  storeLE<uint32_t>(p + 12, static_cast<uint32_t>(chunks.size()));
  storeLE<uint64_t>(p + 16, body.size());
  storeLE<uint32_t>(p + 24, rawCrc);
  storeLE<uint32_t>(p + 28, 0);

  size_t pos = kFixedHeaderSize;
  for (uint64_t dim : data.shape) {
    storeLE<uint64_t>(p + pos, dim);
    pos += 8;
  }
  for (const auto &chunk : chunks) {
    storeLE<uint64_t>(p + pos, chunk.size());
    pos += 8;
  }

  if (compression == Compression::Zlib) {
    for (const auto &chunk : chunks) {
      std::memcpy(p + pos, chunk.data(), chunk.size());
      pos += chunk.size();
    }
  } else if (!body.empty()) {
    std::memcpy(p + pos, body.data(), body.size());
  }
  return payload;
}

std::optional<ArrayPayloadInfo> ArrayCodec::decodeHeader(std::span<const uint8_t> payload,
                                                         Error *outError) {
  if (payload.size() < kFixedHeaderSize) {
    fail(outError, corruption(fmt::format("Array payload too small ({} bytes)", payload.size())));
    return std::nullopt;
  }

  const uint8_t *p = payload.data();
  if (std::memcmp(p, "RQXA", 4) != 0) {
    fail(outError, corruption("Invalid array payload magic"));
    return std::nullopt;
  }
  if (p[4] != version) {
    fail(outError, corruption(fmt::format("Unsupported array payload version {}", p[4])));
    return std::nullopt;
  }

  ArrayPayloadInfo info;
  if (p[5] < static_cast<uint8_t>(Dtype::Int8) || p[5] > static_cast<uint8_t>(Dtype::Bool)) {
    fail(outError, corruption(fmt::format("Unknown array dtype code {}", p[5])));
    return std::nullopt;
  }
  info.dtype = static_cast<Dtype>(p[5]);
  if (p[6] > static_cast<uint8_t>(Compression::Zlib)) {
    fail(outError, corruption(fmt::format("Unknown array compression code {}", p[6])));
    return std::nullopt;
  }
  info.compression = static_cast<Compression>(p[6]);
  uint8_t rank = p[7];
  info.chunkRawBytes = loadLE<uint32_t>(p + 8);
  uint32_t chunkCount = loadLE<uint32_t>(p + 12);
  info.rawSize = loadLE<uint64_t>(p + 16);
  info.rawCrc = loadLE<uint32_t>(p + 24);

  if (rank == 0 || rank > kMaxRank) {
    fail(outError, corruption(fmt::format("Invalid array rank {}", rank)));
    return std::nullopt;
  }

  size_t headerSize = kFixedHeaderSize + 8 * static_cast<size_t>(rank);
  if (payload.size() < headerSize) {
    fail(outError, corruption("Array payload header truncated"));
    return std::nullopt;
  }
  uint64_t elements = 1;
  for (uint8_t i = 0; i < rank; ++i) {
    uint64_t dim = loadLE<uint64_t>(p + kFixedHeaderSize + 8 * i);
    if (dim == 0) {
      fail(outError, corruption("Array payload has a zero dimension"));
      return std::nullopt;
    }
    if (elements > UINT64_MAX / dtypeSize(info.dtype) / dim) {
      fail(outError, corruption("Array payload shape overflows"));
      return std::nullopt;
    }
    elements *= dim;
    info.shape.push_back(dim);
  }

  if (info.rawSize != elementCount(info.shape) * dtypeSize(info.dtype)) {
    fail(outError, corruption(fmt::format("Array payload size {} disagrees with shape {} of {}",
                                          info.rawSize, shapeString(info.shape),
                                          toString(info.dtype))));
    return std::nullopt;
  }

  if (info.compression == Compression::None) {
    if (chunkCount != 0 || payload.size() - headerSize != info.rawSize) {
      fail(outError, corruption("Uncompressed array body size mismatch"));
      return std::nullopt;
    }
    info.bodyOffset = headerSize;
    return info;
  }

  uint64_t expectedChunks =
      info.chunkRawBytes == 0 ? 0 : (info.rawSize + info.chunkRawBytes - 1) / info.chunkRawBytes;
  if (info.chunkRawBytes == 0 || chunkCount != expectedChunks ||
      payload.size() < headerSize + 8 * static_cast<size_t>(chunkCount)) {
    fail(outError, corruption("Compressed array chunk table is inconsistent"));
    return std::nullopt;
  }

  info.bodyOffset = headerSize + 8 * static_cast<size_t>(chunkCount);
  uint64_t available = payload.size() - info.bodyOffset;
  uint64_t bodySize = 0;
  for (uint32_t i = 0; i < chunkCount; ++i) {
    uint64_t size = loadLE<uint64_t>(p + headerSize + 8 * i);
    // Every chunk must fit in what is left of the body
    if (size > available - bodySize) {
      fail(outError, corruption(fmt::format("Compressed array chunk {} overruns the payload", i)));
      return std::nullopt;
    }
    info.chunkSizes.push_back(size);
    bodySize += size;
  }
  if (available != bodySize) {
    fail(outError, corruption("Compressed array body size mismatch"));
    return std::nullopt;
  }
  return info;
}

std::optional<ArrayData> ArrayCodec::decode(std::span<const uint8_t> payload,
                                            const ArrayPayloadInfo &info, Error *outError) {
  auto bytes = decodeRange(payload, info, 0, elementCount(info.shape), outError);
  if (!bytes) {
    return std::nullopt;
  }

  // CRC covers the little-endian body, so check before swapping to host order
  std::vector<uint8_t> check = *bytes;
  swapElementsToLittle(check.data(), dtypeSize(info.dtype), check.size() / dtypeSize(info.dtype));
  if (crc32(check) != info.rawCrc) {
    fail(outError, corruption("Array payload checksum mismatch"));
    return std::nullopt;
  }

  ArrayData data;
  data.shape = info.shape;
  data.dtype = info.dtype;
  data.bytes = std::move(*bytes);
  return data;
}

std::optional<std::vector<uint8_t>> ArrayCodec::decodeRange(std::span<const uint8_t> payload,
                                                            const ArrayPayloadInfo &info,
                                                            uint64_t first, uint64_t count,
                                                            Error *outError) {
  size_t elementSize = dtypeSize(info.dtype);
  uint64_t total = elementCount(info.shape);
  if (first > total || count > total - first) {
    fail(outError, Error(ErrorCode::ShapeMismatch,
                         fmt::format("Slice [{}, {}) outside array of {} elements", first,
                                     first + count, total)));
    return std::nullopt;
  }

  uint64_t begin = first * elementSize;
  uint64_t end = (first + count) * elementSize;
  std::vector<uint8_t> out(static_cast<size_t>(end - begin));
  auto body = payload.subspan(info.bodyOffset);

  if (info.compression == Compression::None) {
    if (!out.empty()) {
      std::memcpy(out.data(), body.data() + begin, out.size());
    }
  } else {
    uint64_t chunkOffset = 0;
    for (size_t i = 0; i < info.chunkSizes.size() && begin < end; ++i) {
      uint64_t chunkBegin = static_cast<uint64_t>(i) * info.chunkRawBytes;
      uint64_t chunkEnd = std::min<uint64_t>(chunkBegin + info.chunkRawBytes, info.rawSize);
      if (chunkEnd > begin && chunkBegin < end) {
        auto raw = zlibDecompress(body.subspan(chunkOffset, info.chunkSizes[i]),
                                  static_cast<size_t>(chunkEnd - chunkBegin), outError);
        if (!raw) {
          return std::nullopt;
        }
        uint64_t from = std::max(begin, chunkBegin);
        uint64_t to = std::min(end, chunkEnd);
        std::memcpy(out.data() + (from - begin), raw->data() + (from - chunkBegin),
                    static_cast<size_t>(to - from));
      }
      chunkOffset += info.chunkSizes[i];
    }
  }

  swapElementsToLittle(out.data(), elementSize, out.size() / elementSize);
  return out;
}

} // namespace resqx
