#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace resqx {

// 128-bit object identifier, laid out as an RFC 4122 version 4 UUID
class Oid {
public:
  Oid() = default;
  explicit Oid(const std::array<uint8_t, 16> &bytes) : bytes_(bytes) {}

  // Fresh random identifier
  static Oid generate();

  // Parse canonical "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" form (either case)
  static std::optional<Oid> parse(std::string_view text);

  // Canonical lower-case text form
  std::string str() const;

  bool isNil() const;

  const std::array<uint8_t, 16> &bytes() const { return bytes_; }

  friend bool operator==(const Oid &a, const Oid &b) { return a.bytes_ == b.bytes_; }
  friend bool operator!=(const Oid &a, const Oid &b) { return !(a == b); }
  friend bool operator<(const Oid &a, const Oid &b) { return a.bytes_ < b.bytes_; }

private:
  std::array<uint8_t, 16> bytes_{};
};

struct OidHash {
  size_t operator()(const Oid &oid) const noexcept;
};

} // namespace resqx

template <> struct std::hash<resqx::Oid> {
  size_t operator()(const resqx::Oid &oid) const noexcept { return resqx::OidHash{}(oid); }
};
