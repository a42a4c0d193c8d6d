#include <cctype>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <resqx/error.hpp>
#include <resqx/types.hpp>

namespace resqx {

size_t dtypeSize(Dtype dtype) {
  switch (dtype) {
  case Dtype::Int8:
  case Dtype::UInt8:
  case Dtype::Bool:
    return 1;
  case Dtype::Int16:
  case Dtype::UInt16:
    return 2;
  case Dtype::Int32:
  case Dtype::UInt32:
  case Dtype::Float32:
    return 4;
  case Dtype::Int64:
  case Dtype::UInt64:
  case Dtype::Float64:
    return 8;
  }
  return 0;
}

std::string_view toString(Dtype dtype) {
  switch (dtype) {
  case Dtype::Int8:
    return "int8";
  case Dtype::Int16:
    return "int16";
  case Dtype::Int32:
    return "int32";
  case Dtype::Int64:
    return "int64";
  case Dtype::UInt8:
    return "uint8";
  case Dtype::UInt16:
    return "uint16";
  case Dtype::UInt32:
    return "uint32";
  case Dtype::UInt64:
    return "uint64";
  case Dtype::Float32:
    return "float32";
  case Dtype::Float64:
    return "float64";
  case Dtype::Bool:
    return "bool";
  }
  return "unknown";
}

std::optional<Dtype> parseDtype(std::string_view text) {
  static constexpr Dtype all[] = {Dtype::Int8,   Dtype::Int16,   Dtype::Int32,  Dtype::Int64,
                                  Dtype::UInt8,  Dtype::UInt16,  Dtype::UInt32, Dtype::UInt64,
                                  Dtype::Float32, Dtype::Float64, Dtype::Bool};
  for (Dtype dtype : all) {
    if (toString(dtype) == text) {
      return dtype;
    }
  }
  return std::nullopt;
}

bool isIntegral(Dtype dtype) {
  return dtype != Dtype::Float32 && dtype != Dtype::Float64 && dtype != Dtype::Bool;
}

bool isFloating(Dtype dtype) {
  return dtype == Dtype::Float32 || dtype == Dtype::Float64;
}

std::string_view toString(Compression compression) {
  switch (compression) {
  case Compression::None:
    return "none";
  case Compression::Zlib:
    return "zlib";
  }
  return "unknown";
}

std::optional<Compression> parseCompression(std::string_view text) {
  if (text == "none") {
    return Compression::None;
  }
  if (text == "zlib") {
    return Compression::Zlib;
  }
  return std::nullopt;
}

uint64_t elementCount(const Shape &shape) {
  if (shape.empty()) {
    return 0;
  }
  uint64_t count = 1;
  for (uint64_t dim : shape) {
    count *= dim;
  }
  return count;
}

std::string shapeString(const Shape &shape) {
  return fmt::format("[{}]", fmt::join(shape, ", "));
}

std::string normalizePartName(std::string_view name) {
  std::string result;
  result.reserve(name.size());
  for (char c : name) {
    result += c == '\\' ? '/' : c;
  }
  size_t start = result.find_first_not_of('/');
  return start == std::string::npos ? std::string() : result.substr(start);
}

std::string lowercasePartName(std::string_view name) {
  std::string result = normalizePartName(name);
  for (char &c : result) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

std::string_view toString(ZipMethod method) {
  switch (method) {
  case ZipMethod::Stored:
    return "stored";
  case ZipMethod::Deflate:
    return "deflate";
  }
  return "unknown";
}

std::string_view toString(ErrorCode code) {
  switch (code) {
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::Validation:
    return "Validation";
  case ErrorCode::DanglingReference:
    return "DanglingReference";
  case ErrorCode::ShapeMismatch:
    return "ShapeMismatch";
  case ErrorCode::Corruption:
    return "Corruption";
  case ErrorCode::ConcurrentModification:
    return "ConcurrentModification";
  case ErrorCode::Io:
    return "Io";
  }
  return "Unknown";
}

std::string Error::describe() const {
  std::string result = fmt::format("{}: {}", toString(code), message);
  std::vector<std::string> context;
  if (!part.empty()) {
    context.push_back(fmt::format("part={}", part));
  }
  if (!oid.empty()) {
    context.push_back(fmt::format("oid={}", oid));
  }
  if (!field.empty()) {
    context.push_back(fmt::format("field={}", field));
  }
  if (!context.empty()) {
    result += fmt::format(" [{}]", fmt::join(context, ", "));
  }
  return result;
}

} // namespace resqx
