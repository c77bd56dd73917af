#include <zlib.h>

#include <array>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "Gzip.hpp"

namespace lungo {

namespace {
// 15 bits of window plus 16 selects the gzip wrapper instead of zlib's
constexpr int GzipWindowBits = 15 + 16;
constexpr int MemLevel = 8;
constexpr size_t ChunkSize = 16384;
} // namespace

/**
 * gzipCompress
 */
std::string gzipCompress(std::string_view input) {
  z_stream stream{};
  if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GzipWindowBits, MemLevel,
                   Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("deflateInit2 failed");
  }

  // NOLINTNEXTLINE: zlib takes a non-const input pointer but does not modify it
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  stream.avail_in = static_cast<uInt>(input.size());

  std::string output;
  std::array<char, ChunkSize> chunk{};
  int status = Z_OK;
  do {
    stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
    stream.avail_out = static_cast<uInt>(chunk.size());
    status = deflate(&stream, Z_FINISH);
    if (status == Z_STREAM_ERROR) {
      deflateEnd(&stream);
      throw std::runtime_error("deflate failed");
    }
    output.append(chunk.data(), chunk.size() - stream.avail_out);
  } while (status != Z_STREAM_END);

  deflateEnd(&stream);
  return output;
}

/**
 * gzipDecompress
 */
std::optional<std::string> gzipDecompress(std::string_view input) {
  if (input.empty()) {
    SPDLOG_DEBUG("Nothing to decompress");
    return std::nullopt;
  }

  z_stream stream{};
  if (inflateInit2(&stream, GzipWindowBits) != Z_OK) {
    SPDLOG_ERROR("inflateInit2 failed");
    return std::nullopt;
  }

  // NOLINTNEXTLINE: zlib takes a non-const input pointer but does not modify it
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  stream.avail_in = static_cast<uInt>(input.size());

  std::string output;
  std::array<char, ChunkSize> chunk{};
  int status = Z_OK;
  while (status != Z_STREAM_END) {
    stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
    stream.avail_out = static_cast<uInt>(chunk.size());
    status = inflate(&stream, Z_NO_FLUSH);
    if (status != Z_OK && status != Z_STREAM_END) {
      SPDLOG_ERROR("inflate failed with status {}: {}", status,
                   stream.msg != nullptr ? stream.msg : "no message");
      inflateEnd(&stream);
      return std::nullopt;
    }
    output.append(chunk.data(), chunk.size() - stream.avail_out);

    if (status == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
      // Input ran out before the gzip trailer
      SPDLOG_ERROR("Truncated gzip stream, {} bytes inflated so far", output.size());
      inflateEnd(&stream);
      return std::nullopt;
    }
  }

  inflateEnd(&stream);
  return output;
}

} // namespace lungo
