#include <cstring>
#include <mutex>
#include <random>
#include <set>

#include <fmt/format.h>

#include <resqx/compression.hpp>
#include <resqx/endian.hpp>
#include <resqx/log.hpp>
#include <resqx/mmap.hpp>
#include <resqx/writer.hpp>

namespace resqx {

namespace {

constexpr uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr uint32_t kEndRecordSignature = 0x06054b50;
constexpr uint32_t kZip64EndRecordSignature = 0x06064b50;
constexpr uint32_t kZip64LocatorSignature = 0x07064b50;

constexpr size_t kLocalHeaderSize = 30;
constexpr size_t kCentralHeaderSize = 46;
constexpr size_t kEndRecordSize = 22;
constexpr size_t kZip64EndRecordSize = 56;
constexpr size_t kZip64LocatorSize = 20;

constexpr uint16_t kZip64ExtraId = 0x0001;
constexpr uint16_t kUtf8NameFlag = 0x0800;
constexpr uint16_t kDosDate = (1 << 5) | 1; // 1980-01-01, so equal packages give equal files
constexpr uint16_t kVersion = 20;
constexpr uint16_t kVersionZip64 = 45;

constexpr uint64_t kMax16 = 0xFFFF;
constexpr uint64_t kMax32 = 0xFFFFFFFF;

// Record sizes of one entry; Zip64 extra fields only where a value does not fit
struct EntryLayout {
  bool zip64Sizes = false;
  bool zip64Offset = false;

  explicit EntryLayout(const PartEntry &entry)
      : zip64Sizes(entry.size >= kMax32 || entry.compressedSize >= kMax32),
        zip64Offset(entry.headerOffset >= kMax32) {}

  uint16_t version() const { return zip64Sizes || zip64Offset ? kVersionZip64 : kVersion; }

  // The local extra field always carries both sizes
  size_t localExtra() const { return zip64Sizes ? 4 + 16 : 0; }

  size_t centralExtra() const {
    size_t fields = (zip64Sizes ? 2 : 0) + (zip64Offset ? 1 : 0);
    return fields == 0 ? 0 : 4 + 8 * fields;
  }
};

void writeLocalHeader(uint8_t *p, const PartEntry &entry) {
  EntryLayout layout(entry);
  storeLE<uint32_t>(p, kLocalHeaderSignature);
  storeLE<uint16_t>(p + 4, layout.version());
  storeLE<uint16_t>(p + 6, kUtf8NameFlag);
  storeLE<uint16_t>(p + 8, static_cast<uint16_t>(entry.method));
  storeLE<uint16_t>(p + 10, 0);
  storeLE<uint16_t>(p + 12, kDosDate);
  storeLE<uint32_t>(p + 14, entry.crc32);
  storeLE<uint32_t>(p + 18,
                    static_cast<uint32_t>(layout.zip64Sizes ? kMax32 : entry.compressedSize));
  storeLE<uint32_t>(p + 22, static_cast<uint32_t>(layout.zip64Sizes ? kMax32 : entry.size));
  storeLE<uint16_t>(p + 26, static_cast<uint16_t>(entry.name.size()));
  storeLE<uint16_t>(p + 28, static_cast<uint16_t>(layout.localExtra()));
  std::memcpy(p + kLocalHeaderSize, entry.name.data(), entry.name.size());

  if (layout.zip64Sizes) {
    uint8_t *extra = p + kLocalHeaderSize + entry.name.size();
    storeLE<uint16_t>(extra, kZip64ExtraId);
    storeLE<uint16_t>(extra + 2, 16);
    storeLE<uint64_t>(extra + 4, entry.size);
    storeLE<uint64_t>(extra + 12, entry.compressedSize);
  }
}

// Returns the size of the record written
size_t writeCentralHeader(uint8_t *p, const PartEntry &entry) {
  EntryLayout layout(entry);
  storeLE<uint32_t>(p, kCentralHeaderSignature);
  storeLE<uint16_t>(p + 4, layout.version()); // Made by: MS-DOS host, no permission bits
  storeLE<uint16_t>(p + 6, layout.version());
  storeLE<uint16_t>(p + 8, kUtf8NameFlag);
  storeLE<uint16_t>(p + 10, static_cast<uint16_t>(entry.method));
  storeLE<uint16_t>(p + 12, 0);
  storeLE<uint16_t>(p + 14, kDosDate);
  storeLE<uint32_t>(p + 16, entry.crc32);
  storeLE<uint32_t>(p + 20,
                    static_cast<uint32_t>(layout.zip64Sizes ? kMax32 : entry.compressedSize));
  storeLE<uint32_t>(p + 24, static_cast<uint32_t>(layout.zip64Sizes ? kMax32 : entry.size));
  storeLE<uint16_t>(p + 28, static_cast<uint16_t>(entry.name.size()));
  storeLE<uint16_t>(p + 30, static_cast<uint16_t>(layout.centralExtra()));
  storeLE<uint16_t>(p + 32, 0);
  storeLE<uint16_t>(p + 34, 0);
  storeLE<uint16_t>(p + 36, 0);
  storeLE<uint32_t>(p + 38, 0);
  storeLE<uint32_t>(p + 42,
                    static_cast<uint32_t>(layout.zip64Offset ? kMax32 : entry.headerOffset));
  std::memcpy(p + kCentralHeaderSize, entry.name.data(), entry.name.size());

  size_t extraSize = layout.centralExtra();
  if (extraSize > 0) {
    uint8_t *extra = p + kCentralHeaderSize + entry.name.size();
    storeLE<uint16_t>(extra, kZip64ExtraId);
    storeLE<uint16_t>(extra + 2, static_cast<uint16_t>(extraSize - 4));
    size_t pos = 4;
    if (layout.zip64Sizes) {
      storeLE<uint64_t>(extra + pos, entry.size);
      storeLE<uint64_t>(extra + pos + 8, entry.compressedSize);
      pos += 16;
    }
    if (layout.zip64Offset) {
      storeLE<uint64_t>(extra + pos, entry.headerOffset);
    }
  }
  return kCentralHeaderSize + entry.name.size() + extraSize;
}

// Destinations currently being written by this process
std::mutex gDestinationsMutex;
std::set<std::filesystem::path> gDestinations;

// Exclusive claim on a destination path for the duration of one write
class DestinationClaim {
public:
  explicit DestinationClaim(std::filesystem::path path) : path_(std::move(path)) {
    std::lock_guard<std::mutex> lock(gDestinationsMutex);
    claimed_ = gDestinations.insert(path_).second;
  }

  ~DestinationClaim() {
    if (claimed_) {
      std::lock_guard<std::mutex> lock(gDestinationsMutex);
      gDestinations.erase(path_);
    }
  }

  DestinationClaim(const DestinationClaim &) = delete;
  DestinationClaim &operator=(const DestinationClaim &) = delete;

  bool claimed() const { return claimed_; }

private:
  std::filesystem::path path_;
  bool claimed_ = false;
};

std::filesystem::path temporaryPathFor(const std::filesystem::path &dest) {
  std::random_device rd;
  uint64_t token = (static_cast<uint64_t>(rd()) << 32) | rd();
  auto name = fmt::format(".{}.tmp-{:016x}", dest.filename().string(), token);
  return dest.has_parent_path() ? dest.parent_path() / name : std::filesystem::path(name);
}

std::filesystem::path canonicalDestination(const std::filesystem::path &dest) {
  std::error_code ec;
  auto absolute = std::filesystem::weakly_canonical(dest, ec);
  return ec ? dest.lexically_normal() : absolute;
}

} // namespace

bool ContainerWriter::addPending(std::string_view name, ZipMethod method,
                                 std::vector<uint8_t> data, std::span<const uint8_t> borrowed,
                                 bool isBorrowed, Error *outError) {
  std::string normalized = normalizePartName(name);
  if (normalized.empty()) {
    return fail(outError, Error(ErrorCode::Validation, "Part name is empty"));
  }
  if (normalized.size() > kMax16) {
    Error error(ErrorCode::Validation, "Part name is longer than a zip entry name can be");
    return fail(outError, error.withPart(normalized));
  }

  // Check for duplicate names (case-insensitive)
  if (!names_.insert(lowercasePartName(normalized)).second) {
    Error error(ErrorCode::Validation, "Duplicate part name in container");
    return fail(outError, error.withPart(normalized));
  }

  PendingPart pending;
  pending.name = std::move(normalized);
  pending.method = method;
  pending.data = std::move(data);
  pending.borrowed = borrowed;
  pending.isBorrowed = isBorrowed;
  pendingParts_.push_back(std::move(pending));
  return true;
}

bool ContainerWriter::addPart(std::string_view name, ZipMethod method, std::vector<uint8_t> data,
                              Error *outError) {
  return addPending(name, method, std::move(data), {}, false, outError);
}

bool ContainerWriter::addBorrowedPart(std::string_view name, ZipMethod method,
                                      std::span<const uint8_t> data, Error *outError) {
  return addPending(name, method, {}, data, true, outError);
}

bool ContainerWriter::write(const std::filesystem::path &destPath, Error *outError) {
  if (pendingParts_.empty()) {
    return fail(outError, Error(ErrorCode::Validation, "Cannot write container with no parts"));
  }

  DestinationClaim claim(canonicalDestination(destPath));
  if (!claim.claimed()) {
    return fail(outError, Error(ErrorCode::ConcurrentModification,
                                fmt::format("Another save to {} is in progress",
                                            destPath.string())));
  }

  std::filesystem::path tempPath = temporaryPathFor(destPath);
  if (!writeTo(tempPath, outError)) {
    std::error_code ec;
    std::filesystem::remove(tempPath, ec);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(tempPath, destPath, ec);
  if (ec) {
    std::filesystem::remove(tempPath, ec);
    return fail(outError, Error(ErrorCode::Io, fmt::format("Failed to move container into place: "
                                                           "{} ({})",
                                                           destPath.string(), ec.message())));
  }

  logger()->info("Wrote container {} ({} parts)", destPath.string(), entries_.size());
  return true;
}

bool ContainerWriter::writeTo(const std::filesystem::path &tempPath, Error *outError) {
  // Step 1: Deflate compressed parts and checksum every part
  std::vector<PartEntry> entries;
  entries.reserve(pendingParts_.size());
  for (auto &pending : pendingParts_) {
    auto bytes = pending.bytes();
    if (pending.method == ZipMethod::Deflate) {
      Error error;
      auto deflated = deflateRaw(bytes, compressionLevel_, &error);
      if (!deflated) {
        return fail(outError, error.withPart(pending.name));
      }
      pending.deflated = std::move(*deflated);
    }

    PartEntry entry;
    entry.name = pending.name;
    entry.lowercaseName = lowercasePartName(pending.name);
    entry.method = pending.method;
    entry.size = bytes.size();
    entry.compressedSize = pending.stored().size();
    entry.crc32 = crc32(bytes);
    entries.push_back(std::move(entry));
  }

  // Step 2: Lay out local headers with their data, then the central directory
  uint64_t pos = 0;
  for (auto &entry : entries) {
    entry.headerOffset = pos;
    entry.offset = pos + kLocalHeaderSize + entry.name.size() + EntryLayout(entry).localExtra();
    pos = entry.offset + entry.compressedSize;
  }
  uint64_t directoryOffset = pos;
  uint64_t directorySize = 0;
  for (const auto &entry : entries) {
    directorySize += kCentralHeaderSize + entry.name.size() + EntryLayout(entry).centralExtra();
  }
  pos += directorySize;

  bool zip64End = entries.size() >= kMax16 || directorySize >= kMax32 || directoryOffset >= kMax32;
  uint64_t zip64EndOffset = pos;
  if (zip64End) {
    pos += kZip64EndRecordSize + kZip64LocatorSize;
  }
  uint64_t endOffset = pos;
  uint64_t totalSize = pos + kEndRecordSize;

  // Step 3: Create memory-mapped output file
  MappedFile outputFile;
  if (!outputFile.create(tempPath, totalSize, outError)) {
    return false;
  }
  auto out = outputFile.data();

  // Step 4: Local headers and part data
  for (size_t i = 0; i < pendingParts_.size(); ++i) {
    const auto &entry = entries[i];
    if (progressHook_ && !progressHook_(entry, i)) {
      Error error(ErrorCode::Io, "Container write aborted");
      return fail(outError, error.withPart(entry.name));
    }

    writeLocalHeader(out.data() + entry.headerOffset, entry);
    auto stored = pendingParts_[i].stored();
    if (!stored.empty()) {
      std::memcpy(out.data() + entry.offset, stored.data(), stored.size());
    }
  }

  // Step 5: Central directory
  uint8_t *directory = out.data() + directoryOffset;
  for (const auto &entry : entries) {
    directory += writeCentralHeader(directory, entry);
  }

  // Step 6: End records last, so a torn file has no readable directory
  if (zip64End) {
    uint8_t *record = out.data() + zip64EndOffset;
    storeLE<uint32_t>(record, kZip64EndRecordSignature);
    storeLE<uint64_t>(record + 4, kZip64EndRecordSize - 12);
    storeLE<uint16_t>(record + 12, kVersionZip64);
    storeLE<uint16_t>(record + 14, kVersionZip64);
    storeLE<uint32_t>(record + 16, 0);
    storeLE<uint32_t>(record + 20, 0);
    storeLE<uint64_t>(record + 24, entries.size());
    storeLE<uint64_t>(record + 32, entries.size());
    storeLE<uint64_t>(record + 40, directorySize);
    storeLE<uint64_t>(record + 48, directoryOffset);

    uint8_t *locator = record + kZip64EndRecordSize;
    storeLE<uint32_t>(locator, kZip64LocatorSignature);
    storeLE<uint32_t>(locator + 4, 0);
    storeLE<uint64_t>(locator + 8, zip64EndOffset);
    storeLE<uint32_t>(locator + 16, 1);
  }

  uint8_t *end = out.data() + endOffset;
  storeLE<uint32_t>(end, kEndRecordSignature);
  storeLE<uint16_t>(end + 4, 0);
  storeLE<uint16_t>(end + 6, 0);
  storeLE<uint16_t>(end + 8, static_cast<uint16_t>(zip64End ? kMax16 : entries.size()));
  storeLE<uint16_t>(end + 10, static_cast<uint16_t>(zip64End ? kMax16 : entries.size()));
  storeLE<uint32_t>(end + 12, static_cast<uint32_t>(zip64End ? kMax32 : directorySize));
  storeLE<uint32_t>(end + 16, static_cast<uint32_t>(zip64End ? kMax32 : directoryOffset));
  storeLE<uint16_t>(end + 20, 0);

  // Step 7: Flush to disk
  if (!outputFile.flush(outError)) {
    return false;
  }
  outputFile.close();

  entries_ = std::move(entries);
  logger()->debug("Laid out {} parts, {} byte central directory{}", entries_.size(),
                  directorySize, zip64End ? " (Zip64)" : "");
  return true;
}

void ContainerWriter::clear() {
  pendingParts_.clear();
  names_.clear();
  entries_.clear();
}

} // namespace resqx
