#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "error.hpp"
#include "options.hpp"
#include "types.hpp"

namespace resqx {

// Where encoded array payloads of a saved container can be fetched from
class PayloadSource {
public:
  virtual ~PayloadSource() = default;

  // Encoded payload bytes stored under path; must stay valid while the source lives
  virtual std::optional<std::span<const uint8_t>> payload(std::string_view path,
                                                          Error *outError) const = 0;
};

// Encoded payload ready to be written into a container, either owned or
// borrowed from a live PayloadSource
struct EncodedPayload {
  std::vector<uint8_t> owned;
  std::span<const uint8_t> borrowed;
  bool isBorrowed = false;

  std::span<const uint8_t> bytes() const {
    return isBorrowed ? borrowed : std::span<const uint8_t>(owned);
  }
};

struct ArrayReadResult {
  std::shared_ptr<const ArrayData> data;
  Error error;

  bool ok() const { return data != nullptr; }
};

struct ArrayStoreStats {
  uint64_t payloadReads = 0; // Payload decodes from a container (full or sliced)
  uint64_t cacheHits = 0;    // Reads answered from the cache
  uint64_t streamedReads = 0; // Full reads above the streaming threshold, not cached
  uint64_t cachedBytes = 0;  // Bytes of evictable cached payloads
  uint64_t evictions = 0;
};

// External binary array payloads of one package.
//
// Reads are lazy: a handle carries no payload, and a payload attached from a
// container is only decoded by read(), readSlice() or forEachChunk(). Full reads
// up to the streaming threshold are cached until the next write() or release()
// of the handle.
//
// Writes to one handle are serialized by a per-handle mutex; reads may run on
// any thread, including through readAsync().
class ArrayStore {
public:
  explicit ArrayStore(PackageOptions options = {});
  ~ArrayStore();

  ArrayStore(const ArrayStore &) = delete;
  ArrayStore &operator=(const ArrayStore &) = delete;

  // New handle with a fresh storage path under "arrays/"; all dimensions must be positive
  std::optional<ArrayHandle> allocate(const Shape &shape, Dtype dtype,
                                      std::optional<Compression> compression = std::nullopt,
                                      Error *outError = nullptr);

  // Register a handle whose payload lives in a container.
  // The payload header must match the handle's shape and dtype (ShapeMismatch otherwise).
  bool attach(const ArrayHandle &handle, std::shared_ptr<const PayloadSource> source,
              Error *outError = nullptr);

  // Replace the payload. Shape and dtype must equal the handle's; on mismatch the
  // stored payload is left unchanged and ShapeMismatch is reported.
  bool write(const ArrayHandle &handle, const ArrayData &data, Error *outError = nullptr);

  // Whole array, materialized on first access and cached. Container payloads
  // larger than PackageOptions::streamingThreshold are decoded for this call
  // only; use readSlice() or forEachChunk() to keep memory bounded.
  std::shared_ptr<const ArrayData> read(const ArrayHandle &handle, Error *outError = nullptr);

  // Elements [first, first + count) in row-major order, returned with shape {count}
  std::optional<ArrayData> readSlice(const ArrayHandle &handle, uint64_t first, uint64_t count,
                                     Error *outError = nullptr);

  // Stream the array in pieces of at most elementsPerChunk elements without caching it.
  // The callback receives each piece and the index of its first element; returning
  // false stops the iteration early (not an error).
  bool forEachChunk(const ArrayHandle &handle, uint64_t elementsPerChunk,
                    const std::function<bool(const ArrayData &chunk, uint64_t first)> &callback,
                    Error *outError = nullptr);

  // read() on a worker task
  std::future<ArrayReadResult> readAsync(const ArrayHandle &handle);

  // Forget a handle and its payload
  bool release(const ArrayHandle &handle, Error *outError = nullptr);

  // Drop a cached payload that can be re-read from its container
  void invalidate(const ArrayHandle &handle);

  // Encoded payload for saving; clean attached payloads are passed through untouched
  std::optional<EncodedPayload> encode(const ArrayHandle &handle, Error *outError = nullptr) const;

  bool contains(std::string_view path) const;

  // Declared handle registered under path (name left empty)
  std::optional<ArrayHandle> find(std::string_view path) const;

  bool isMaterialized(const ArrayHandle &handle) const;

  // True if the handle has a payload, either written in this session or in a container
  bool hasPayload(const ArrayHandle &handle) const;

  // True if the payload was written in this session and is not yet saved
  bool isDirty(const ArrayHandle &handle) const;

  std::vector<ArrayHandle> handles() const;

  size_t size() const;

  ArrayStoreStats stats() const;

  const PackageOptions &options() const { return options_; }

  // Mark the payloads stored under paths as saved and rebind them to a freshly
  // written container
  void markSaved(std::shared_ptr<const PayloadSource> source,
                 const std::vector<std::string> &paths);

private:
  struct Entry;

  std::shared_ptr<Entry> lookup(std::string_view path, Error *outError) const;
  bool checkHandle(const Entry &entry, const ArrayHandle &handle, Error *outError) const;
  void touch(Entry &entry);
  void evictIfNeeded(const Entry *keep);

  PackageOptions options_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
  uint64_t clock_ = 0;
  mutable ArrayStoreStats stats_;
};

} // namespace resqx
