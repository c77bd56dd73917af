#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace lungo {

// gzip (RFC 1952) helpers around zlib. Both directions work on whole buffers.

/// @brief Throws std::runtime_error if zlib refuses to deflate the input
std::string gzipCompress(std::string_view input);

/// @brief Returns std::nullopt if the input is not a complete gzip stream
std::optional<std::string> gzipDecompress(std::string_view input);

} // namespace lungo
