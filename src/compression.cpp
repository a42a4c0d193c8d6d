#include <algorithm>
#include <limits>

#include <fmt/format.h>
#include <zlib.h>

#include <resqx/compression.hpp>

namespace resqx {

namespace {

constexpr size_t kStreamChunk = 64 * 1024;

uInt clampToUInt(size_t value) {
  return static_cast<uInt>(std::min<size_t>(value, std::numeric_limits<uInt>::max()));
}

// Owns a z_stream set up for raw deflate or raw inflate
class RawStream {
public:
  explicit RawStream(bool inflating) : inflating_(inflating) {}

  ~RawStream() {
    if (!initialized_) {
      return;
    }
    if (inflating_) {
      ::inflateEnd(&stream_);
    } else {
      ::deflateEnd(&stream_);
    }
  }

  RawStream(const RawStream &) = delete;
  RawStream &operator=(const RawStream &) = delete;

  int init(int level) {
    int rc = inflating_ ? ::inflateInit2(&stream_, -MAX_WBITS)
                        : ::deflateInit2(&stream_, level, Z_DEFLATED, -MAX_WBITS, 8,
                                         Z_DEFAULT_STRATEGY);
    initialized_ = rc == Z_OK;
    return rc;
  }

  z_stream *get() { return &stream_; }

private:
  z_stream stream_{};
  bool inflating_;
  bool initialized_ = false;
};

} // namespace

uint32_t crc32(std::span<const uint8_t> data, uint32_t seed) {
  uLong crc = seed;
  const uint8_t *p = data.data();
  size_t remaining = data.size();

  // zlib takes uInt lengths; feed very large buffers in pieces
  while (remaining > 0) {
    uInt piece = static_cast<uInt>(
        std::min<size_t>(remaining, std::numeric_limits<uInt>::max()));
    crc = ::crc32(crc, reinterpret_cast<const Bytef *>(p), piece);
    p += piece;
    remaining -= piece;
  }
  return static_cast<uint32_t>(crc);
}

std::optional<std::vector<uint8_t>> zlibCompress(std::span<const uint8_t> data, int level,
                                                 Error *outError) {
  uLongf bound = ::compressBound(static_cast<uLong>(data.size()));
  std::vector<uint8_t> out(bound);

  int rc = ::compress2(reinterpret_cast<Bytef *>(out.data()), &bound,
                       reinterpret_cast<const Bytef *>(data.data()),
                       static_cast<uLong>(data.size()), level);
  if (rc != Z_OK) {
    fail(outError, Error(ErrorCode::Io, fmt::format("zlib compress2 failed (code {})", rc)));
    return std::nullopt;
  }

  out.resize(bound);
  return out;
}

std::optional<std::vector<uint8_t>> zlibDecompress(std::span<const uint8_t> data,
                                                   size_t expectedSize, Error *outError) {
  std::vector<uint8_t> out(expectedSize);
  uLongf outLen = static_cast<uLongf>(expectedSize);

  int rc = ::uncompress(reinterpret_cast<Bytef *>(out.data()), &outLen,
                        reinterpret_cast<const Bytef *>(data.data()),
                        static_cast<uLong>(data.size()));
  if (rc != Z_OK) {
    fail(outError,
         Error(ErrorCode::Corruption, fmt::format("zlib uncompress failed (code {})", rc)));
    return std::nullopt;
  }

  if (outLen != expectedSize) {
    fail(outError, Error(ErrorCode::Corruption,
                         fmt::format("Inflated size {} does not match expected size {}", outLen,
                                     expectedSize)));
    return std::nullopt;
  }
  return out;
}

std::optional<std::vector<uint8_t>> deflateRaw(std::span<const uint8_t> data, int level,
                                               Error *outError) {
  RawStream raw(false);
  int rc = raw.init(level);
  if (rc != Z_OK) {
    fail(outError, Error(ErrorCode::Io, fmt::format("zlib deflateInit2 failed (code {})", rc)));
    return std::nullopt;
  }
  z_stream *stream = raw.get();

  std::vector<uint8_t> out;
  const uint8_t *in = data.data();
  size_t remaining = data.size();
  do {
    uInt piece = clampToUInt(remaining);
    stream->next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(in));
    stream->avail_in = piece;
    in += piece;
    remaining -= piece;
    int flush = remaining == 0 ? Z_FINISH : Z_NO_FLUSH;

    do {
      size_t used = out.size();
      out.resize(used + kStreamChunk);
      stream->next_out = reinterpret_cast<Bytef *>(out.data() + used);
      stream->avail_out = static_cast<uInt>(kStreamChunk);
      rc = ::deflate(stream, flush);
      out.resize(used + kStreamChunk - stream->avail_out);
      if (rc == Z_STREAM_ERROR) {
        fail(outError, Error(ErrorCode::Io, "zlib deflate failed"));
        return std::nullopt;
      }
    } while (stream->avail_out == 0);
  } while (remaining > 0);

  if (rc != Z_STREAM_END) {
    fail(outError, Error(ErrorCode::Io, fmt::format("zlib deflate did not finish (code {})", rc)));
    return std::nullopt;
  }
  return out;
}

std::optional<std::vector<uint8_t>> inflateRaw(std::span<const uint8_t> data, size_t expectedSize,
                                               Error *outError) {
  RawStream raw(true);
  int rc = raw.init(0);
  if (rc != Z_OK) {
    fail(outError, Error(ErrorCode::Io, fmt::format("zlib inflateInit2 failed (code {})", rc)));
    return std::nullopt;
  }
  z_stream *stream = raw.get();

  // One spare byte shows a stream that inflates to more than expected
  std::vector<uint8_t> out(expectedSize + 1);
  const uint8_t *in = data.data();
  size_t inRemaining = data.size();
  uint8_t *dst = out.data();
  size_t outRemaining = out.size();

  while (true) {
    if (stream->avail_in == 0 && inRemaining > 0) {
      uInt piece = clampToUInt(inRemaining);
      stream->next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(in));
      stream->avail_in = piece;
      in += piece;
      inRemaining -= piece;
    }
    if (stream->avail_out == 0 && outRemaining > 0) {
      uInt piece = clampToUInt(outRemaining);
      stream->next_out = reinterpret_cast<Bytef *>(dst);
      stream->avail_out = piece;
      dst += piece;
      outRemaining -= piece;
    }

    rc = ::inflate(stream, Z_NO_FLUSH);
    if (rc == Z_STREAM_END) {
      break;
    }
    bool moreInput = stream->avail_in > 0 || inRemaining > 0;
    bool moreOutput = stream->avail_out > 0 || outRemaining > 0;
    if (rc != Z_OK && !(rc == Z_BUF_ERROR && moreInput && moreOutput)) {
      std::string_view reason = !moreInput    ? "deflate stream is truncated"
                                : !moreOutput ? "deflate stream inflates past its recorded size"
                                              : "deflate stream is invalid";
      fail(outError, Error(ErrorCode::Corruption, fmt::format("{} (code {})", reason, rc)));
      return std::nullopt;
    }
  }

  size_t produced = out.size() - outRemaining - stream->avail_out;
  if (produced != expectedSize) {
    fail(outError, Error(ErrorCode::Corruption,
                         fmt::format("Inflated size {} does not match expected size {}", produced,
                                     expectedSize)));
    return std::nullopt;
  }
  out.resize(expectedSize);
  return out;
}

} // namespace resqx
