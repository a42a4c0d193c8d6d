#include <optional>

#include <fmt/format.h>

#include <resqx/compression.hpp>
#include <resqx/endian.hpp>
#include <resqx/log.hpp>
#include <resqx/reader.hpp>

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
constexpr size_t kMaxCommentSize = 0xFFFF;

constexpr uint16_t kZip64ExtraId = 0x0001;
constexpr uint16_t kEncryptedFlag = 0x0001;

constexpr uint64_t kMax16 = 0xFFFF;
constexpr uint64_t kMax32 = 0xFFFFFFFF;

// Fills the values whose classic fields hold the Zip64 sentinel, in the order
// the Zip64 extra field stores them
bool readZip64Extra(std::span<const uint8_t> extra, PartEntry &entry) {
  bool needSize = entry.size == kMax32;
  bool needCompressed = entry.compressedSize == kMax32;
  bool needOffset = entry.headerOffset == kMax32;

  size_t pos = 0;
  while (pos + 4 <= extra.size()) {
    uint16_t id = loadLE<uint16_t>(extra.data() + pos);
    size_t size = loadLE<uint16_t>(extra.data() + pos + 2);
    if (pos + 4 + size > extra.size()) {
      return false;
    }
    if (id == kZip64ExtraId) {
      auto field = extra.subspan(pos + 4, size);
      size_t next = 0;
      auto take = [&](uint64_t &value) {
        if (next + 8 > field.size()) {
          return false;
        }
        value = loadLE<uint64_t>(field.data() + next);
        next += 8;
        return true;
      };
      return (!needSize || take(entry.size)) && (!needCompressed || take(entry.compressedSize)) &&
             (!needOffset || take(entry.headerOffset));
    }
    pos += 4 + size;
  }
  return false;
}

} // namespace

std::optional<ContainerReader> ContainerReader::open(const std::filesystem::path &path,
                                                     Error *outError) {
  ContainerReader reader;
  if (!reader.mappedFile_.openRead(path, outError)) {
    return std::nullopt;
  }
  reader.path_ = path;

  if (!reader.parse(outError)) {
    reader.close();
    return std::nullopt;
  }

  logger()->debug("Opened container {} ({} parts, {} bytes)", path.string(), reader.partCount(),
                  reader.mappedFile_.size());
  return reader;
}

bool ContainerReader::parse(Error *outError) {
  auto fileData = mappedFile_.data();
  auto corrupt = [&](std::string message) {
    return fail(outError, Error(ErrorCode::Corruption, std::move(message)));
  };

  // Check minimum size (end record is 22 bytes)
  if (fileData.size() < kEndRecordSize) {
    return corrupt(fmt::format("File too small to be a container (size: {})", fileData.size()));
  }

  // Step 1: Find the end record; only its comment may follow it
  size_t lowest = fileData.size() > kEndRecordSize + kMaxCommentSize
                      ? fileData.size() - kEndRecordSize - kMaxCommentSize
                      : 0;
  std::optional<size_t> endPos;
  for (size_t pos = fileData.size() - kEndRecordSize + 1; pos-- > lowest;) {
    const uint8_t *p = fileData.data() + pos;
    if (loadLE<uint32_t>(p) == kEndRecordSignature &&
        pos + kEndRecordSize + loadLE<uint16_t>(p + 20) == fileData.size()) {
      endPos = pos;
      break;
    }
  }
  if (!endPos) {
    return corrupt("Not a zip container: end of central directory record not found");
  }

  const uint8_t *end = fileData.data() + *endPos;
  uint32_t disk = loadLE<uint16_t>(end + 4);
  uint32_t directoryDisk = loadLE<uint16_t>(end + 6);
  uint64_t diskEntries = loadLE<uint16_t>(end + 8);
  uint64_t entryCount = loadLE<uint16_t>(end + 10);
  uint64_t directorySize = loadLE<uint32_t>(end + 12);
  uint64_t directoryOffset = loadLE<uint32_t>(end + 16);

  // Step 2: Zip64 end record, consulted when a classic field holds its sentinel
  if (diskEntries == kMax16 || entryCount == kMax16 || directorySize == kMax32 ||
      directoryOffset == kMax32) {
    if (*endPos < kZip64LocatorSize ||
        loadLE<uint32_t>(end - kZip64LocatorSize) != kZip64LocatorSignature) {
      return corrupt("Zip64 end record locator missing");
    }
    uint64_t recordOffset = loadLE<uint64_t>(end - kZip64LocatorSize + 8);
    auto record = mappedFile_.view(recordOffset, kZip64EndRecordSize);
    if (record.size() != kZip64EndRecordSize ||
        recordOffset + kZip64EndRecordSize > *endPos - kZip64LocatorSize ||
        loadLE<uint32_t>(record.data()) != kZip64EndRecordSignature) {
      return corrupt("Zip64 end record is invalid");
    }
    disk = loadLE<uint32_t>(record.data() + 16);
    directoryDisk = loadLE<uint32_t>(record.data() + 20);
    diskEntries = loadLE<uint64_t>(record.data() + 24);
    entryCount = loadLE<uint64_t>(record.data() + 32);
    directorySize = loadLE<uint64_t>(record.data() + 40);
    directoryOffset = loadLE<uint64_t>(record.data() + 48);
  }

  if (disk != 0 || directoryDisk != 0 || diskEntries != entryCount) {
    return corrupt("Multi-disk zip archives are not supported");
  }

  // Step 3: Central directory
  auto directory = mappedFile_.view(directoryOffset, directorySize);
  if (directory.size() != directorySize) {
    return corrupt("Central directory extends beyond file bounds");
  }
  if (entryCount > directorySize / kCentralHeaderSize) {
    return corrupt(fmt::format("Invalid entry count in end record: {}", entryCount));
  }

  size_t pos = 0;
  parts_.reserve(entryCount);
  for (uint64_t i = 0; i < entryCount; ++i) {
    PartEntry entry;
    if (!parseEntry(directory, pos, entry, outError)) {
      return false;
    }
    // Folder entries written by general purpose zip tools hold no data
    if (entry.name.ends_with('/') && entry.size == 0) {
      continue;
    }
    parts_.push_back(std::move(entry));
  }

  if (pos != directory.size()) {
    return corrupt("Trailing bytes after central directory");
  }

  // Build lookup table, rejecting duplicate names
  lookup_.reserve(parts_.size());
  for (size_t i = 0; i < parts_.size(); ++i) {
    const auto &entry = parts_[i];
    if (lookup_.contains(entry.lowercaseName)) {
      Error error(ErrorCode::Corruption, "Duplicate part name in container");
      return fail(outError, error.withPart(entry.name));
    }
    lookup_[entry.lowercaseName] = i;
  }

  return true;
}

bool ContainerReader::parseEntry(std::span<const uint8_t> directory, size_t &pos,
                                 PartEntry &entry, Error *outError) const {
  auto corrupt = [&](std::string message) {
    Error error(ErrorCode::Corruption, std::move(message));
    return fail(outError, error.withPart(entry.name));
  };

  if (pos + kCentralHeaderSize > directory.size()) {
    return corrupt("Central directory entry extends beyond directory bounds");
  }
  const uint8_t *p = directory.data() + pos;
  if (loadLE<uint32_t>(p) != kCentralHeaderSignature) {
    return corrupt(fmt::format("Invalid central directory entry signature at offset {}", pos));
  }

  uint16_t flags = loadLE<uint16_t>(p + 8);
  uint16_t method = loadLE<uint16_t>(p + 10);
  entry.crc32 = loadLE<uint32_t>(p + 16);
  entry.compressedSize = loadLE<uint32_t>(p + 20);
  entry.size = loadLE<uint32_t>(p + 24);
  size_t nameLen = loadLE<uint16_t>(p + 28);
  size_t extraLen = loadLE<uint16_t>(p + 30);
  size_t commentLen = loadLE<uint16_t>(p + 32);
  entry.headerOffset = loadLE<uint32_t>(p + 42);

  size_t recordSize = kCentralHeaderSize + nameLen + extraLen + commentLen;
  if (pos + recordSize > directory.size()) {
    return corrupt("Central directory entry extends beyond directory bounds");
  }
  entry.name = normalizePartName(
      std::string_view(reinterpret_cast<const char *>(p + kCentralHeaderSize), nameLen));
  entry.lowercaseName = lowercasePartName(entry.name);
  pos += recordSize;

  if (entry.name.empty()) {
    return corrupt("Central directory entry has an empty name");
  }
  if (flags & kEncryptedFlag) {
    return corrupt("Encrypted parts are not supported");
  }
  if (method != static_cast<uint16_t>(ZipMethod::Stored) &&
      method != static_cast<uint16_t>(ZipMethod::Deflate)) {
    return corrupt(fmt::format("Unsupported compression method {}", method));
  }
  entry.method = static_cast<ZipMethod>(method);

  if (entry.size == kMax32 || entry.compressedSize == kMax32 || entry.headerOffset == kMax32) {
    std::span<const uint8_t> extra(p + kCentralHeaderSize + nameLen, extraLen);
    if (!readZip64Extra(extra, entry)) {
      return corrupt("Zip64 extra field missing or too short");
    }
  }
  if (entry.method == ZipMethod::Stored && entry.compressedSize != entry.size) {
    return corrupt("Stored part has differing compressed and inflated sizes");
  }

  // The local header repeats the name and may carry its own extra field
  auto local = mappedFile_.view(entry.headerOffset, kLocalHeaderSize);
  if (local.size() != kLocalHeaderSize ||
      loadLE<uint32_t>(local.data()) != kLocalHeaderSignature) {
    return corrupt(fmt::format("Invalid local header at offset {}", entry.headerOffset));
  }
  entry.offset = entry.headerOffset + kLocalHeaderSize + loadLE<uint16_t>(local.data() + 26) +
                 loadLE<uint16_t>(local.data() + 28);

  // Validate offset and size
  if (mappedFile_.view(entry.offset, entry.compressedSize).size() != entry.compressedSize) {
    return corrupt(fmt::format("Part has invalid offset/size (offset={}, size={}, fileSize={})",
                               entry.offset, entry.compressedSize, mappedFile_.size()));
  }
  return true;
}

const PartEntry *ContainerReader::findPart(std::string_view name) const {
  auto it = lookup_.find(lowercasePartName(name));
  if (it == lookup_.end()) {
    return nullptr;
  }
  return &parts_[it->second];
}

std::span<const uint8_t> ContainerReader::view(const PartEntry &entry) const {
  return mappedFile_.view(entry.offset, entry.compressedSize);
}

bool ContainerReader::verify(const PartEntry &entry, Error *outError) const {
  if (entry.method == ZipMethod::Deflate) {
    return extractToMemory(entry, outError).has_value();
  }

  auto bytes = view(entry);
  if (bytes.size() != entry.compressedSize) {
    Error error(ErrorCode::Corruption, "Invalid part bounds");
    return fail(outError, error.withPart(entry.name));
  }
  if (crc32(bytes) != entry.crc32) {
    Error error(ErrorCode::Corruption, "Part checksum mismatch");
    return fail(outError, error.withPart(entry.name));
  }
  return true;
}

std::optional<std::vector<uint8_t>> ContainerReader::extractToMemory(const PartEntry &entry,
                                                                     Error *outError) const {
  auto bytes = view(entry);
  if (bytes.size() != entry.compressedSize) {
    Error error(ErrorCode::Corruption, "Invalid part bounds");
    fail(outError, error.withPart(entry.name));
    return std::nullopt;
  }

  std::vector<uint8_t> data;
  if (entry.method == ZipMethod::Deflate) {
    Error error;
    auto inflated = inflateRaw(bytes, entry.size, &error);
    if (!inflated) {
      fail(outError, error.withPart(entry.name));
      return std::nullopt;
    }
    data = std::move(*inflated);
  } else {
    data.assign(bytes.begin(), bytes.end());
  }

  if (crc32(data) != entry.crc32) {
    Error error(ErrorCode::Corruption, "Part checksum mismatch");
    fail(outError, error.withPart(entry.name));
    return std::nullopt;
  }
  return data;
}

void ContainerReader::close() {
  mappedFile_.close();
  parts_.clear();
  lookup_.clear();
}

} // namespace resqx
