#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace resqx {

// Element type of an array payload
enum class Dtype : uint8_t {
  Int8 = 1,
  Int16 = 2,
  Int32 = 3,
  Int64 = 4,
  UInt8 = 5,
  UInt16 = 6,
  UInt32 = 7,
  UInt64 = 8,
  Float32 = 9,
  Float64 = 10,
  Bool = 11
};

// Compression applied to an array payload body
enum class Compression : uint8_t { None = 0, Zlib = 1 };

using Shape = std::vector<uint64_t>;

size_t dtypeSize(Dtype dtype);
std::string_view toString(Dtype dtype);
std::optional<Dtype> parseDtype(std::string_view text);
bool isIntegral(Dtype dtype);
bool isFloating(Dtype dtype);

std::string_view toString(Compression compression);
std::optional<Compression> parseCompression(std::string_view text);

// Product of all dimensions; 0 for an empty shape
uint64_t elementCount(const Shape &shape);

// "[2, 3, 4]"
std::string shapeString(const Shape &shape);

template <typename T> constexpr Dtype dtypeOf() {
  if constexpr (std::is_same_v<T, bool>) {
    return Dtype::Bool;
  } else if constexpr (std::is_same_v<T, int8_t>) {
    return Dtype::Int8;
  } else if constexpr (std::is_same_v<T, int16_t>) {
    return Dtype::Int16;
  } else if constexpr (std::is_same_v<T, int32_t>) {
    return Dtype::Int32;
  } else if constexpr (std::is_same_v<T, int64_t>) {
    return Dtype::Int64;
  } else if constexpr (std::is_same_v<T, uint8_t>) {
    return Dtype::UInt8;
  } else if constexpr (std::is_same_v<T, uint16_t>) {
    return Dtype::UInt16;
  } else if constexpr (std::is_same_v<T, uint32_t>) {
    return Dtype::UInt32;
  } else if constexpr (std::is_same_v<T, uint64_t>) {
    return Dtype::UInt64;
  } else if constexpr (std::is_same_v<T, float>) {
    return Dtype::Float32;
  } else {
    static_assert(std::is_same_v<T, double>, "unsupported array element type");
    return Dtype::Float64;
  }
}

// Metadata describing one externally stored array, without its payload
struct ArrayHandle {
  std::string name; // Logical name inside the owning document
  Shape shape;      // Positive dimensions, slowest varying first
  Dtype dtype = Dtype::Float64;
  std::string path; // Part name of the payload inside the container
  Compression compression = Compression::None;

  size_t byteSize() const { return elementCount(shape) * dtypeSize(dtype); }

  friend bool operator==(const ArrayHandle &, const ArrayHandle &) = default;
};

// Materialized array: shape, dtype and raw little-endian bytes
struct ArrayData {
  Shape shape;
  Dtype dtype = Dtype::Float64;
  std::vector<uint8_t> bytes;

  template <typename T> static ArrayData from(Shape shape, std::span<const T> values) {
    ArrayData data;
    data.shape = std::move(shape);
    data.dtype = dtypeOf<T>();
    data.bytes.resize(values.size() * sizeof(T));
    if (!values.empty()) {
      std::memcpy(data.bytes.data(), values.data(), data.bytes.size());
    }
    return data;
  }

  template <typename T> static ArrayData from(Shape shape, const std::vector<T> &values) {
    return from<T>(std::move(shape), std::span<const T>(values.data(), values.size()));
  }

  // Typed view; empty if T does not match dtype
  template <typename T> std::span<const T> values() const {
    if (dtypeOf<T>() != dtype) {
      return {};
    }
    return std::span<const T>(reinterpret_cast<const T *>(bytes.data()), bytes.size() / sizeof(T));
  }

  uint64_t count() const { return elementCount(shape); }

  friend bool operator==(const ArrayData &, const ArrayData &) = default;
};

// Storage method of a zip entry
enum class ZipMethod : uint16_t { Stored = 0, Deflate = 8 };

// Central directory entry of one part in the container
struct PartEntry {
  std::string name;          // Normalized to forward slashes, original case
  std::string lowercaseName; // For case-insensitive lookup
  ZipMethod method = ZipMethod::Stored;
  uint64_t headerOffset = 0;   // Local file header
  uint64_t offset = 0;         // First byte of the stored data
  uint64_t compressedSize = 0; // Stored data size in bytes
  uint64_t size = 0;           // Inflated size in bytes
  uint32_t crc32 = 0;          // CRC-32 of the inflated bytes
};

// Backslashes to forward slashes, leading slashes dropped, case preserved
std::string normalizePartName(std::string_view name);

// Normalized and lower-cased, for case-insensitive lookup
std::string lowercasePartName(std::string_view name);

std::string_view toString(ZipMethod method);

// Fixed part names
inline constexpr std::string_view kContentTypesPart = "[Content_Types].xml";
inline constexpr std::string_view kRelationshipsPart = "_rels/.rels";
inline constexpr std::string_view kPropertiesPart = "docProps/core.xml";
inline constexpr std::string_view kArrayPrefix = "arrays/";

} // namespace resqx
