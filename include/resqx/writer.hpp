#pragma once

#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace resqx {

// Write side of the container format: a zip archive, switching to Zip64
// records wherever a size, offset or entry count outgrows the classic fields.
// Parts are collected in memory (or borrowed) and written in one pass by write()
class ContainerWriter {
public:
  // Called before each part is copied into the output; returning false aborts the write
  using ProgressHook = std::function<bool(const PartEntry &entry, size_t index)>;

  ContainerWriter() = default;
  ~ContainerWriter() = default;

  // Delete copy, enable move
  ContainerWriter(const ContainerWriter &) = delete;
  ContainerWriter &operator=(const ContainerWriter &) = delete;
  ContainerWriter(ContainerWriter &&) noexcept = default;
  ContainerWriter &operator=(ContainerWriter &&) noexcept = default;

  // Add part owning its bytes
  // Returns false on an empty or duplicate (case-insensitive) name
  bool addPart(std::string_view name, ZipMethod method, std::vector<uint8_t> data,
               Error *outError = nullptr);

  // Add part borrowing its bytes; the memory must stay valid until write() returns
  bool addBorrowedPart(std::string_view name, ZipMethod method, std::span<const uint8_t> data,
                       Error *outError = nullptr);

  void setProgressHook(ProgressHook hook) { progressHook_ = std::move(hook); }

  // zlib level for deflated parts
  void setCompressionLevel(int level) { compressionLevel_ = level; }

  // Write container to disk atomically: the bytes go to a temporary file in the
  // destination directory, which is flushed and renamed over destPath only on
  // success. On failure destPath is left untouched and the temporary file removed.
  // A second concurrent write to the same destination fails with ConcurrentModification.
  bool write(const std::filesystem::path &destPath, Error *outError = nullptr);

  void clear();

  // Entries of the last successful write
  const std::vector<PartEntry> &parts() const { return entries_; }

  size_t partCount() const { return pendingParts_.size(); }

private:
  bool addPending(std::string_view name, ZipMethod method, std::vector<uint8_t> data,
                  std::span<const uint8_t> borrowed, bool isBorrowed, Error *outError);
  bool writeTo(const std::filesystem::path &tempPath, Error *outError);

  struct PendingPart {
    std::string name; // Normalized name (forward slashes)
    ZipMethod method = ZipMethod::Deflate;
    std::vector<uint8_t> data;         // Owned bytes
    std::span<const uint8_t> borrowed; // Borrowed bytes, used when isBorrowed
    bool isBorrowed = false;
    std::vector<uint8_t> deflated; // Filled by write() for deflated parts

    std::span<const uint8_t> bytes() const {
      return isBorrowed ? borrowed : std::span<const uint8_t>(data);
    }

    std::span<const uint8_t> stored() const {
      return method == ZipMethod::Deflate ? std::span<const uint8_t>(deflated) : bytes();
    }
  };

  std::vector<PendingPart> pendingParts_;
  std::unordered_set<std::string> names_; // Lowercase names of pending parts
  std::vector<PartEntry> entries_;
  ProgressHook progressHook_;
  int compressionLevel_ = 6;
};

} // namespace resqx
