#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "error.hpp"
#include "types.hpp"

namespace resqx {

inline constexpr size_t KiB = 1024;
inline constexpr size_t MiB = 1024 * KiB;

// Package-level configuration, passed explicitly to Package, ArrayStore and Model
struct PackageOptions {
  // Compression for newly allocated arrays
  Compression defaultCompression = Compression::Zlib;

  // zlib level, 1 (fast) .. 9 (small)
  int compressionLevel = 6;

  // Raw bytes per independently compressed chunk of an array payload
  size_t chunkBytes = 1 * MiB;

  // Arrays larger than this are read through forEachChunk/readSlice
  // rather than cached whole by the higher layers
  size_t streamingThreshold = 64 * MiB;

  // Upper bound for cached payloads that can be re-read from the container; 0 = unlimited
  size_t cacheLimitBytes = 0;

  // Fail open() on the first part diagnostic instead of flagging the part invalid
  bool strictLoad = true;
};

// Build options from a JSON object. Missing keys keep their defaults,
// unknown keys and out-of-range values are Validation errors.
std::optional<PackageOptions> parseOptions(const nlohmann::json &json, Error *outError = nullptr);

// Read options from a JSON file
std::optional<PackageOptions> loadOptions(const std::filesystem::path &path,
                                          Error *outError = nullptr);

nlohmann::json toJson(const PackageOptions &options);

} // namespace resqx
