#include <cstring>
#include <random>

#include <resqx/oid.hpp>

namespace resqx {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

} // namespace

Oid Oid::generate() {
  // One engine per thread, seeded from the OS entropy source
  thread_local std::mt19937_64 engine = [] {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
  }();

  std::array<uint8_t, 16> bytes;
  uint64_t hi = engine();
  uint64_t lo = engine();
  std::memcpy(bytes.data(), &hi, 8);
  std::memcpy(bytes.data() + 8, &lo, 8);

  // Version 4, variant 10xx
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
  return Oid(bytes);
}

std::optional<Oid> Oid::parse(std::string_view text) {
  if (text.size() != 36) {
    return std::nullopt;
  }

  std::array<uint8_t, 16> bytes{};
  size_t out = 0;
  for (size_t i = 0; i < text.size();) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (text[i] != '-') {
        return std::nullopt;
      }
      ++i;
      continue;
    }
    int high = hexValue(text[i]);
    int low = hexValue(text[i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    bytes[out++] = static_cast<uint8_t>((high << 4) | low);
    i += 2;
  }
  return Oid(bytes);
}

std::string Oid::str() const {
  static constexpr char digits[] = "0123456789abcdef";
  std::string result;
  result.reserve(36);
  for (size_t i = 0; i < bytes_.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      result += '-';
    }
    result += digits[bytes_[i] >> 4];
    result += digits[bytes_[i] & 0x0F];
  }
  return result;
}

bool Oid::isNil() const {
  for (uint8_t b : bytes_) {
    if (b != 0) {
      return false;
    }
  }
  return true;
}

size_t OidHash::operator()(const Oid &oid) const noexcept {
  uint64_t hi, lo;
  std::memcpy(&hi, oid.bytes().data(), 8);
  std::memcpy(&lo, oid.bytes().data() + 8, 8);
  return static_cast<size_t>(hi ^ (lo * 0x9E3779B97F4A7C15ull));
}

} // namespace resqx
