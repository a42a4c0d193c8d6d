#include <fmt/format.h>

#include <resqx/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace resqx {

namespace {

Error ioError(const std::string &what, const std::filesystem::path &path) {
#ifdef _WIN32
  return Error(ErrorCode::Io, fmt::format("{}: {} (error: {})", what, path.string(),
                                          static_cast<unsigned long>(GetLastError())));
#else
  return Error(ErrorCode::Io,
               fmt::format("{}: {} ({})", what, path.string(), std::strerror(errno)));
#endif
}

} // namespace

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  close();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    :
#ifdef _WIN32
      fileHandle_(other.fileHandle_), mappingHandle_(other.mappingHandle_),
#else
      fd_(other.fd_),
#endif
      data_(other.data_), size_(other.size_), writable_(other.writable_),
      path_(std::move(other.path_)) {
#ifdef _WIN32
  other.fileHandle_ = nullptr;
  other.mappingHandle_ = nullptr;
#else
  other.fd_ = -1;
#endif
  other.data_ = nullptr;
  other.size_ = 0;
  other.writable_ = false;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    close();

#ifdef _WIN32
    fileHandle_ = other.fileHandle_;
    mappingHandle_ = other.mappingHandle_;
    other.fileHandle_ = nullptr;
    other.mappingHandle_ = nullptr;
#else
    fd_ = other.fd_;
    other.fd_ = -1;
#endif
    data_ = other.data_;
    size_ = other.size_;
    writable_ = other.writable_;
    path_ = std::move(other.path_);
    other.data_ = nullptr;
    other.size_ = 0;
    other.writable_ = false;
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, Error *outError) {
  close();

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    return fail(outError, ioError("Failed to open file for reading", path));
  }

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(static_cast<HANDLE>(fileHandle_), &fileSize)) {
    Error error = ioError("Failed to get file size", path);
    close();
    return fail(outError, error);
  }
  if (fileSize.QuadPart == 0) {
    close();
    return fail(outError,
                Error(ErrorCode::Corruption, fmt::format("File is empty: {}", path.string())));
  }
  size_ = static_cast<size_t>(fileSize.QuadPart);

  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READONLY, 0, 0, nullptr);
  if (!mappingHandle_) {
    Error error = ioError("Failed to create file mapping", path);
    close();
    return fail(outError, error);
  }

  data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_READ, 0, 0, 0);
  if (!data_) {
    Error error = ioError("Failed to map view of file", path);
    close();
    return fail(outError, error);
  }
#else
  fd_ = ::open(path.string().c_str(), O_RDONLY);
  if (fd_ < 0) {
    return fail(outError, ioError("Failed to open file for reading", path));
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    Error error = ioError("Failed to get file size", path);
    close();
    return fail(outError, error);
  }
  if (st.st_size == 0) {
    close();
    return fail(outError,
                Error(ErrorCode::Corruption, fmt::format("File is empty: {}", path.string())));
  }
  size_ = static_cast<size_t>(st.st_size);

  data_ = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (data_ == MAP_FAILED) {
    data_ = nullptr;
    Error error = ioError("Failed to map file", path);
    close();
    return fail(outError, error);
  }
#endif

  writable_ = false;
  path_ = path;
  return true;
}

bool MappedFile::create(const std::filesystem::path &path, size_t size, Error *outError) {
  close();

  if (size == 0) {
    return fail(outError, Error(ErrorCode::Io, "Cannot create file mapping with zero size"));
  }
  size_ = size;

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    size_ = 0;
    return fail(outError, ioError("Failed to create file for writing", path));
  }

  LARGE_INTEGER fileSize;
  fileSize.QuadPart = static_cast<LONGLONG>(size);
  if (!SetFilePointerEx(static_cast<HANDLE>(fileHandle_), fileSize, nullptr, FILE_BEGIN) ||
      !SetEndOfFile(static_cast<HANDLE>(fileHandle_))) {
    Error error = ioError("Failed to set file size", path);
    close();
    return fail(outError, error);
  }

  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READWRITE, 0, 0, nullptr);
  if (!mappingHandle_) {
    Error error = ioError("Failed to create file mapping", path);
    close();
    return fail(outError, error);
  }

  data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_WRITE, 0, 0, 0);
  if (!data_) {
    Error error = ioError("Failed to map view of file", path);
    close();
    return fail(outError, error);
  }
#else
  fd_ = ::open(path.string().c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (fd_ < 0) {
    size_ = 0;
    return fail(outError, ioError("Failed to create file for writing", path));
  }

  if (ftruncate(fd_, static_cast<off_t>(size)) < 0) {
    Error error = ioError("Failed to set file size", path);
    close();
    return fail(outError, error);
  }

  data_ = mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
  if (data_ == MAP_FAILED) {
    data_ = nullptr;
    Error error = ioError("Failed to map file", path);
    close();
    return fail(outError, error);
  }
#endif

  writable_ = true;
  path_ = path;
  return true;
}

std::span<const uint8_t> MappedFile::view(uint64_t offset, uint64_t length) const {
  if (offset > size_ || length > size_ - offset) {
    return {};
  }
  return data().subspan(static_cast<size_t>(offset), static_cast<size_t>(length));
}

bool MappedFile::flush(Error *outError) {
  if (!data_ || !writable_) {
    return fail(outError, Error(ErrorCode::Io, "Cannot flush: file not open or not writable"));
  }

#ifdef _WIN32
  if (!FlushViewOfFile(data_, 0) || !FlushFileBuffers(static_cast<HANDLE>(fileHandle_))) {
    return fail(outError, ioError("Failed to flush mapped file", path_));
  }
#else
  if (msync(data_, size_, MS_SYNC) < 0 || fsync(fd_) < 0) {
    return fail(outError, ioError("Failed to sync mapped file", path_));
  }
#endif

  return true;
}

void MappedFile::close() {
  cleanup();
}

void MappedFile::cleanup() noexcept {
  if (data_) {
#ifdef _WIN32
    UnmapViewOfFile(data_);
#else
    munmap(data_, size_);
#endif
    data_ = nullptr;
  }

#ifdef _WIN32
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif

  size_ = 0;
  writable_ = false;
  path_.clear();
}

} // namespace resqx
