#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

#include "error.hpp"

namespace resqx {

// RAII wrapper for memory-mapped files
// Read-only mappings back lazy array reads; writable mappings back container saves
class MappedFile {
public:
  MappedFile();
  ~MappedFile();

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Map an existing file read-only
  bool openRead(const std::filesystem::path &path, Error *outError = nullptr);

  // Create (or truncate) a file of the given size and map it read-write
  bool create(const std::filesystem::path &path, size_t size, Error *outError = nullptr);

  // Whole mapping
  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }

  std::span<uint8_t> data() { return std::span<uint8_t>(static_cast<uint8_t *>(data_), size_); }

  // Bounds-checked sub-range; empty span if [offset, offset + length) leaves the mapping
  std::span<const uint8_t> view(uint64_t offset, uint64_t length) const;

  // Flush changes to disk (writable mappings only)
  bool flush(Error *outError = nullptr);

  void close();

  bool isOpen() const { return data_ != nullptr; }
  bool isWritable() const { return writable_; }
  size_t size() const { return size_; }
  const std::filesystem::path &path() const { return path_; }

private:
  void cleanup() noexcept;

#ifdef _WIN32
  void *fileHandle_ = nullptr;    // HANDLE on Windows
  void *mappingHandle_ = nullptr; // HANDLE on Windows
#else
  int fd_ = -1; // File descriptor on POSIX
#endif
  void *data_ = nullptr;
  size_t size_ = 0;
  bool writable_ = false;
  std::filesystem::path path_;
};

} // namespace resqx
