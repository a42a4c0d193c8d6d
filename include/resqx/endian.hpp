#pragma once

#include <bit>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace resqx {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint16_t byteswap(uint16_t value) noexcept {
  return static_cast<uint16_t>((value << 8) | (value >> 8));
}

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

inline constexpr uint64_t byteswap(uint64_t value) noexcept {
  return (static_cast<uint64_t>(byteswap(static_cast<uint32_t>(value))) << 32) |
         byteswap(static_cast<uint32_t>(value >> 32));
}

} // namespace detail

// Container integers are little-endian on disk
inline constexpr bool is_little_endian() noexcept {
  return std::endian::native == std::endian::little;
}

template <typename T> inline constexpr T toLittle(T value) noexcept {
  static_assert(std::is_unsigned_v<T> && sizeof(T) >= 2, "unsigned 16/32/64-bit only");
  if constexpr (is_little_endian()) {
    return value;
  } else {
    return detail::byteswap(value);
  }
}

template <typename T> inline constexpr T fromLittle(T value) noexcept {
  return toLittle(value);
}

// Read an unsigned little-endian integer from an unaligned buffer
template <typename T> inline T loadLE(const uint8_t *src) noexcept {
  if constexpr (sizeof(T) == 1) {
    return static_cast<T>(*src);
  } else {
    T value;
    std::memcpy(&value, src, sizeof(T));
    return fromLittle(value);
  }
}

// Write an unsigned little-endian integer into an unaligned buffer
template <typename T> inline void storeLE(uint8_t *dst, T value) noexcept {
  if constexpr (sizeof(T) == 1) {
    *dst = static_cast<uint8_t>(value);
  } else {
    T le = toLittle(value);
    std::memcpy(dst, &le, sizeof(T));
  }
}

// Swap every element of a packed array in place (no-op on little-endian hosts)
inline void swapElementsToLittle(uint8_t *data, size_t elementSize, size_t count) noexcept {
  if constexpr (is_little_endian()) {
    (void)data;
    (void)elementSize;
    (void)count;
  } else {
    for (size_t i = 0; i < count; ++i) {
      uint8_t *p = data + i * elementSize;
      for (size_t a = 0, b = elementSize - 1; a < b; ++a, --b) {
        uint8_t t = p[a];
        p[a] = p[b];
        p[b] = t;
      }
    }
  }
}

} // namespace resqx
