#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "error.hpp"

namespace resqx {

// CRC-32 (zlib polynomial); pass a previous result as seed to continue a running checksum
uint32_t crc32(std::span<const uint8_t> data, uint32_t seed = 0);

// zlib deflate of one buffer
std::optional<std::vector<uint8_t>> zlibCompress(std::span<const uint8_t> data, int level,
                                                 Error *outError = nullptr);

// zlib inflate of one buffer whose inflated size is known in advance.
// Any size disagreement is reported as Corruption.
std::optional<std::vector<uint8_t>> zlibDecompress(std::span<const uint8_t> data,
                                                   size_t expectedSize,
                                                   Error *outError = nullptr);

// Raw deflate stream without zlib header or trailer, as stored in zip entries
std::optional<std::vector<uint8_t>> deflateRaw(std::span<const uint8_t> data, int level,
                                               Error *outError = nullptr);

// Raw inflate of a zip entry whose inflated size is known in advance.
// A truncated stream or any size disagreement is reported as Corruption.
std::optional<std::vector<uint8_t>> inflateRaw(std::span<const uint8_t> data, size_t expectedSize,
                                               Error *outError = nullptr);

} // namespace resqx
