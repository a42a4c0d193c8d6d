#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "error.hpp"
#include "mmap.hpp"
#include "types.hpp"

namespace resqx {

// Read side of the container format: memory-maps a zip archive, parses its
// central directory (Zip64 included) and hands out zero-copy views of stored parts
class ContainerReader {
public:
  ContainerReader() = default;
  ~ContainerReader() = default;

  // Delete copy, enable move
  ContainerReader(const ContainerReader &) = delete;
  ContainerReader &operator=(const ContainerReader &) = delete;
  ContainerReader(ContainerReader &&) noexcept = default;
  ContainerReader &operator=(ContainerReader &&) noexcept = default;

  // Open container from file (memory-mapped)
  // Structural problems (no end record, truncated directory, bad local headers,
  // out-of-bounds or duplicate parts) are reported as Corruption, and so are
  // features this reader does not handle (multiple disks, encryption,
  // compression methods other than stored and deflate)
  static std::optional<ContainerReader> open(const std::filesystem::path &path,
                                             Error *outError = nullptr);

  // Parts in directory order
  const std::vector<PartEntry> &parts() const { return parts_; }

  size_t partCount() const { return parts_.size(); }

  // Case-insensitive part lookup
  // Returns nullptr if the part does not exist
  const PartEntry *findPart(std::string_view name) const;

  // Zero-copy view of the stored bytes of a part; still compressed for deflated parts
  // Returns empty span if the part bounds are invalid
  std::span<const uint8_t> view(const PartEntry &entry) const;

  // Inflated bytes of a part, after checking the part CRC
  std::optional<std::vector<uint8_t>> extractToMemory(const PartEntry &entry,
                                                      Error *outError = nullptr) const;

  // Check the part CRC; deflated parts are inflated to do so
  bool verify(const PartEntry &entry, Error *outError = nullptr) const;

  const std::filesystem::path &path() const { return path_; }

  bool isOpen() const { return mappedFile_.isOpen(); }

  void close();

private:
  bool parse(Error *outError);
  bool parseEntry(std::span<const uint8_t> directory, size_t &pos, PartEntry &entry,
                  Error *outError) const;

  MappedFile mappedFile_;
  std::filesystem::path path_;
  std::vector<PartEntry> parts_;
  std::unordered_map<std::string, size_t> lookup_; // lowercase name -> index
};

} // namespace resqx
