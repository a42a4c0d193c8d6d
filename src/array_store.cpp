#include <algorithm>

#include <fmt/format.h>

#include <resqx/array_codec.hpp>
#include <resqx/array_store.hpp>
#include <resqx/log.hpp>
#include <resqx/oid.hpp>

namespace resqx {

struct ArrayStore::Entry {
  ArrayHandle handle;                          // Declared shape, dtype, path, compression
  std::shared_ptr<const PayloadSource> source; // Container payload, if any
  std::shared_ptr<const ArrayData> cached;     // Materialized payload, if any
  bool dirty = false;                          // Written in this session
  uint64_t generation = 0;                     // Bumped by every write
  uint64_t lastUse = 0;
  std::mutex writeMutex;

  bool evictable() const { return cached && !dirty && source; }
};

namespace {

Error notFound(std::string_view path) {
  Error error(ErrorCode::NotFound, "Unknown array handle");
  return error.withPart(std::string(path));
}

Error shapeMismatch(const ArrayHandle &declared, const Shape &shape, Dtype dtype,
                    std::string_view what) {
  Error error(ErrorCode::ShapeMismatch,
              fmt::format("{} has shape {} and dtype {}, handle declares {} and {}", what,
                          shapeString(shape), toString(dtype), shapeString(declared.shape),
                          toString(declared.dtype)));
  error.withPart(declared.path);
  if (!declared.name.empty()) {
    error.withField(declared.name);
  }
  return error;
}

std::optional<ArrayData> decodeFrom(const PayloadSource &source, const ArrayHandle &handle,
                                    Error *outError) {
  auto payload = source.payload(handle.path, outError);
  if (!payload) {
    return std::nullopt;
  }
  Error error;
  auto info = ArrayCodec::decodeHeader(*payload, &error);
  if (!info) {
    fail(outError, error.withPart(handle.path));
    return std::nullopt;
  }
  auto data = ArrayCodec::decode(*payload, *info, &error);
  if (!data) {
    fail(outError, error.withPart(handle.path));
    return std::nullopt;
  }
  return data;
}

} // namespace

ArrayStore::ArrayStore(PackageOptions options) : options_(std::move(options)) {}

ArrayStore::~ArrayStore() = default;

std::optional<ArrayHandle> ArrayStore::allocate(const Shape &shape, Dtype dtype,
                                                std::optional<Compression> compression,
                                                Error *outError) {
  if (shape.empty() || std::find(shape.begin(), shape.end(), 0) != shape.end()) {
    fail(outError, Error(ErrorCode::ShapeMismatch,
                         fmt::format("Array shape {} must have positive dimensions",
                                     shapeString(shape))));
    return std::nullopt;
  }

  auto entry = std::make_shared<Entry>();
  entry->handle.shape = shape;
  entry->handle.dtype = dtype;
  entry->handle.compression = compression.value_or(options_.defaultCompression);
  entry->handle.path = fmt::format("{}{}.bin", kArrayPrefix, Oid::generate().str());

  std::lock_guard<std::mutex> lock(mutex_);
  entries_[entry->handle.path] = entry;
  return entry->handle;
}

bool ArrayStore::attach(const ArrayHandle &handle, std::shared_ptr<const PayloadSource> source,
                        Error *outError) {
  if (!source) {
    return fail(outError, Error(ErrorCode::NotFound, "No payload source given").withPart(handle.path));
  }

  auto payload = source->payload(handle.path, outError);
  if (!payload) {
    return false;
  }

  // Only the header is inspected here; the body stays on disk
  Error error;
  auto info = ArrayCodec::decodeHeader(*payload, &error);
  if (!info) {
    return fail(outError, error.withPart(handle.path));
  }
  if (info->shape != handle.shape || info->dtype != handle.dtype) {
    return fail(outError, shapeMismatch(handle, info->shape, info->dtype, "Stored payload"));
  }

  auto entry = std::make_shared<Entry>();
  entry->handle = handle;
  entry->handle.name.clear();
  entry->handle.compression = info->compression;
  entry->source = std::move(source);

  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.contains(handle.path)) {
    Error duplicate(ErrorCode::Corruption, "Array payload attached twice");
    return fail(outError, duplicate.withPart(handle.path));
  }
  entries_[handle.path] = std::move(entry);
  return true;
}

std::shared_ptr<ArrayStore::Entry> ArrayStore::lookup(std::string_view path,
                                                      Error *outError) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(std::string(path));
  if (it == entries_.end()) {
    fail(outError, notFound(path));
    return nullptr;
  }
  return it->second;
}

bool ArrayStore::checkHandle(const Entry &entry, const ArrayHandle &handle,
                             Error *outError) const {
  if (entry.handle.shape != handle.shape || entry.handle.dtype != handle.dtype) {
    ArrayHandle declared = entry.handle;
    declared.name = handle.name;
    return fail(outError, shapeMismatch(declared, handle.shape, handle.dtype, "Handle"));
  }
  return true;
}

void ArrayStore::touch(Entry &entry) {
  entry.lastUse = ++clock_;
}

bool ArrayStore::write(const ArrayHandle &handle, const ArrayData &data, Error *outError) {
  auto entry = lookup(handle.path, outError);
  if (!entry || !checkHandle(*entry, handle, outError)) {
    return false;
  }

  if (data.shape != entry->handle.shape || data.dtype != entry->handle.dtype) {
    ArrayHandle declared = entry->handle;
    declared.name = handle.name;
    return fail(outError, shapeMismatch(declared, data.shape, data.dtype, "Data"));
  }
  if (data.bytes.size() != entry->handle.byteSize()) {
    Error error(ErrorCode::ShapeMismatch,
                fmt::format("Data holds {} bytes, shape {} of {} needs {}", data.bytes.size(),
                            shapeString(data.shape), toString(data.dtype),
                            entry->handle.byteSize()));
    return fail(outError, error.withPart(handle.path));
  }

  std::lock_guard<std::mutex> writeLock(entry->writeMutex);
  auto copy = std::make_shared<const ArrayData>(data);

  std::lock_guard<std::mutex> lock(mutex_);
  if (entry->evictable()) {
    stats_.cachedBytes -= entry->cached->bytes.size();
  }
  entry->cached = std::move(copy);
  entry->dirty = true;
  entry->source.reset();
  ++entry->generation;
  touch(*entry);
  logger()->debug("Wrote array {} ({} bytes)", handle.path, data.bytes.size());
  return true;
}

std::shared_ptr<const ArrayData> ArrayStore::read(const ArrayHandle &handle, Error *outError) {
  auto entry = lookup(handle.path, outError);
  if (!entry || !checkHandle(*entry, handle, outError)) {
    return nullptr;
  }

  std::shared_ptr<const PayloadSource> source;
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entry->cached) {
      ++stats_.cacheHits;
      touch(*entry);
      return entry->cached;
    }
    source = entry->source;
    generation = entry->generation;
  }

  if (!source) {
    Error error(ErrorCode::NotFound, "Array handle has no payload yet");
    fail(outError, error.withPart(handle.path));
    return nullptr;
  }

  // Decode outside the lock so reads of other handles can proceed
  auto data = decodeFrom(*source, entry->handle, outError);
  if (!data) {
    return nullptr;
  }
  auto shared = std::make_shared<const ArrayData>(std::move(*data));

  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.payloadReads;
  if (shared->bytes.size() > options_.streamingThreshold) {
    // Too large to keep; the caller owns the only copy
    ++stats_.streamedReads;
    logger()->debug("Read array {} ({} bytes) without caching", handle.path,
                    shared->bytes.size());
    return shared;
  }
  if (entry->generation != generation || entry->cached) {
    // A write or another reader got there first
    return entry->cached ? entry->cached : shared;
  }
  entry->cached = shared;
  stats_.cachedBytes += shared->bytes.size();
  touch(*entry);
  evictIfNeeded(entry.get());
  logger()->debug("Materialized array {} ({} bytes)", handle.path, shared->bytes.size());
  return shared;
}

std::optional<ArrayData> ArrayStore::readSlice(const ArrayHandle &handle, uint64_t first,
                                               uint64_t count, Error *outError) {
  auto entry = lookup(handle.path, outError);
  if (!entry || !checkHandle(*entry, handle, outError)) {
    return std::nullopt;
  }

  uint64_t total = elementCount(entry->handle.shape);
  if (first > total || count > total - first) {
    Error error(ErrorCode::ShapeMismatch,
                fmt::format("Slice [{}, {}) outside array of {} elements", first, first + count,
                            total));
    fail(outError, error.withPart(handle.path));
    return std::nullopt;
  }

  ArrayData slice;
  slice.shape = {count};
  slice.dtype = entry->handle.dtype;
  size_t elementSize = dtypeSize(slice.dtype);

  std::shared_ptr<const PayloadSource> source;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entry->cached) {
      ++stats_.cacheHits;
      touch(*entry);
      auto begin = entry->cached->bytes.begin() + static_cast<ptrdiff_t>(first * elementSize);
      slice.bytes.assign(begin, begin + static_cast<ptrdiff_t>(count * elementSize));
      return slice;
    }
    source = entry->source;
  }

  if (!source) {
    Error error(ErrorCode::NotFound, "Array handle has no payload yet");
    fail(outError, error.withPart(handle.path));
    return std::nullopt;
  }

  auto payload = source->payload(handle.path, outError);
  if (!payload) {
    return std::nullopt;
  }
  Error error;
  auto info = ArrayCodec::decodeHeader(*payload, &error);
  std::optional<std::vector<uint8_t>> bytes;
  if (info) {
    bytes = ArrayCodec::decodeRange(*payload, *info, first, count, &error);
  }
  if (!bytes) {
    fail(outError, error.withPart(handle.path));
    return std::nullopt;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.payloadReads;
  }
  slice.bytes = std::move(*bytes);
  return slice;
}

bool ArrayStore::forEachChunk(
    const ArrayHandle &handle, uint64_t elementsPerChunk,
    const std::function<bool(const ArrayData &chunk, uint64_t first)> &callback,
    Error *outError) {
  if (elementsPerChunk == 0) {
    return fail(outError, Error(ErrorCode::Validation, "Chunk size must be positive")
                              .withPart(handle.path));
  }

  auto declared = find(handle.path);
  if (!declared) {
    return fail(outError, notFound(handle.path));
  }

  uint64_t total = elementCount(declared->shape);
  for (uint64_t first = 0; first < total; first += elementsPerChunk) {
    uint64_t count = std::min(elementsPerChunk, total - first);
    auto chunk = readSlice(handle, first, count, outError);
    if (!chunk) {
      return false;
    }
    if (!callback(*chunk, first)) {
      break;
    }
  }
  return true;
}

std::future<ArrayReadResult> ArrayStore::readAsync(const ArrayHandle &handle) {
  return std::async(std::launch::async, [this, handle] {
    ArrayReadResult result;
    result.data = read(handle, &result.error);
    return result;
  });
}

bool ArrayStore::release(const ArrayHandle &handle, Error *outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(handle.path);
  if (it == entries_.end()) {
    return fail(outError, notFound(handle.path));
  }
  if (it->second->evictable()) {
    stats_.cachedBytes -= it->second->cached->bytes.size();
  }
  entries_.erase(it);
  return true;
}

void ArrayStore::invalidate(const ArrayHandle &handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(handle.path);
  if (it != entries_.end() && it->second->evictable()) {
    stats_.cachedBytes -= it->second->cached->bytes.size();
    it->second->cached.reset();
  }
}

void ArrayStore::evictIfNeeded(const Entry *keep) {
  if (options_.cacheLimitBytes == 0) {
    return;
  }
  while (stats_.cachedBytes > options_.cacheLimitBytes) {
    Entry *victim = nullptr;
    for (auto &[path, entry] : entries_) {
      if (entry.get() != keep && entry->evictable() &&
          (!victim || entry->lastUse < victim->lastUse)) {
        victim = entry.get();
      }
    }
    if (!victim) {
      return;
    }
    stats_.cachedBytes -= victim->cached->bytes.size();
    victim->cached.reset();
    ++stats_.evictions;
    logger()->debug("Evicted cached array {}", victim->handle.path);
  }
}

std::optional<EncodedPayload> ArrayStore::encode(const ArrayHandle &handle,
                                                 Error *outError) const {
  std::shared_ptr<const PayloadSource> source;
  std::shared_ptr<const ArrayData> data;
  Compression compression;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle.path);
    if (it == entries_.end()) {
      fail(outError, notFound(handle.path));
      return std::nullopt;
    }
    const Entry &entry = *it->second;
    compression = entry.handle.compression;
    if (!entry.dirty) {
      source = entry.source;
    }
    data = entry.cached;
  }

  EncodedPayload encoded;
  if (source) {
    auto payload = source->payload(handle.path, outError);
    if (!payload) {
      return std::nullopt;
    }
    encoded.borrowed = *payload;
    encoded.isBorrowed = true;
    return encoded;
  }

  if (!data) {
    Error error(ErrorCode::Validation, "Array handle was allocated but never written");
    fail(outError, error.withPart(handle.path));
    return std::nullopt;
  }

  Error error;
  auto bytes = ArrayCodec::encode(*data, compression, options_.compressionLevel,
                                  options_.chunkBytes, &error);
  if (!bytes) {
    fail(outError, error.withPart(handle.path));
    return std::nullopt;
  }
  encoded.owned = std::move(*bytes);
  return encoded;
}

bool ArrayStore::contains(std::string_view path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.contains(std::string(path));
}

std::optional<ArrayHandle> ArrayStore::find(std::string_view path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(std::string(path));
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second->handle;
}

bool ArrayStore::isMaterialized(const ArrayHandle &handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(handle.path);
  return it != entries_.end() && it->second->cached != nullptr;
}

bool ArrayStore::hasPayload(const ArrayHandle &handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(handle.path);
  return it != entries_.end() && (it->second->cached || it->second->source);
}

bool ArrayStore::isDirty(const ArrayHandle &handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(handle.path);
  return it != entries_.end() && it->second->dirty;
}

std::vector<ArrayHandle> ArrayStore::handles() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ArrayHandle> result;
  result.reserve(entries_.size());
  for (const auto &[path, entry] : entries_) {
    result.push_back(entry->handle);
  }
  std::sort(result.begin(), result.end(),
            [](const ArrayHandle &a, const ArrayHandle &b) { return a.path < b.path; });
  return result;
}

size_t ArrayStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

ArrayStoreStats ArrayStore::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void ArrayStore::markSaved(std::shared_ptr<const PayloadSource> source,
                           const std::vector<std::string> &paths) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &path : paths) {
    auto it = entries_.find(path);
    if (it == entries_.end()) {
      continue;
    }
    Entry &entry = *it->second;
    if (entry.cached && !entry.evictable()) {
      stats_.cachedBytes += entry.cached->bytes.size();
    }
    entry.source = source;
    entry.dirty = false;
  }
  evictIfNeeded(nullptr);
}

} // namespace resqx
