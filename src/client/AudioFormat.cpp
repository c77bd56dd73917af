#include <algorithm>
#include <cstring>
#include <string_view>

#include <spdlog/spdlog.h>

#include "AudioFormat.hpp"

namespace lungo {

namespace {

constexpr size_t RiffHeaderSize = 12;
constexpr size_t ChunkHeaderSize = 8;
constexpr size_t FmtChunkMinSize = 16;
constexpr uint16_t PcmFormatTag = 1;

uint16_t readLe16(const char* p) {
  return static_cast<uint16_t>(static_cast<uint8_t>(p[0]) |
                               (static_cast<uint16_t>(static_cast<uint8_t>(p[1])) << 8U));
}

uint32_t readLe32(const char* p) {
  return static_cast<uint32_t>(static_cast<uint8_t>(p[0])) |
         (static_cast<uint32_t>(static_cast<uint8_t>(p[1])) << 8U) |
         (static_cast<uint32_t>(static_cast<uint8_t>(p[2])) << 16U) |
         (static_cast<uint32_t>(static_cast<uint8_t>(p[3])) << 24U);
}

} // namespace

bool isWav(const std::vector<char>& data) {
  return data.size() >= RiffHeaderSize && std::memcmp(data.data(), "RIFF", 4) == 0 &&
         std::memcmp(data.data() + 8, "WAVE", 4) == 0;
}

/**
 * parseWav
 * @brief Walks the RIFF chunks looking for "fmt " and "data". Chunks are word aligned.
 */
std::optional<WavAudio> parseWav(const std::vector<char>& data) {
  if (!isWav(data)) {
    SPDLOG_ERROR("Audio is not a RIFF/WAVE file ({} bytes)", data.size());
    return std::nullopt;
  }

  WavAudio wav;
  bool foundFmt = false;
  size_t pos = RiffHeaderSize;

  while (pos + ChunkHeaderSize <= data.size()) {
    const std::string_view chunkId(data.data() + pos, 4);
    const size_t chunkSize = readLe32(data.data() + pos + 4);
    const size_t bodyStart = pos + ChunkHeaderSize;
    const size_t available = data.size() - bodyStart;

    if (chunkId == "fmt ") {
      if (chunkSize < FmtChunkMinSize || available < FmtChunkMinSize) {
        SPDLOG_ERROR("fmt chunk is only {} bytes", chunkSize);
        return std::nullopt;
      }
      const char* fmtChunk = data.data() + bodyStart;
      const auto formatTag = readLe16(fmtChunk);
      if (formatTag != PcmFormatTag) {
        SPDLOG_ERROR("Only linear PCM is supported, format tag is {}", formatTag);
        return std::nullopt;
      }
      wav.format.channels = readLe16(fmtChunk + 2);
      wav.format.sampleRate_Hz = readLe32(fmtChunk + 4);
      wav.format.bitsPerSample = readLe16(fmtChunk + 14);
      foundFmt = true;

    } else if (chunkId == "data") {
      if (!foundFmt) {
        SPDLOG_ERROR("data chunk appears before the fmt chunk");
        return std::nullopt;
      }
      const size_t dataSize = std::min(chunkSize, available);
      if (dataSize < chunkSize) {
        SPDLOG_WARN("data chunk claims {} bytes but only {} are present", chunkSize, available);
      }
      wav.samples.assign(data.begin() + static_cast<long>(bodyStart),
                         data.begin() + static_cast<long>(bodyStart + dataSize));

      if (wav.format.channels == 0 || wav.format.bytesPerSample() == 0 ||
          wav.format.sampleRate_Hz == 0) {
        SPDLOG_ERROR("WAV header describes an empty format");
        return std::nullopt;
      }
      SPDLOG_INFO("WAV audio: channels={}, bits={}, rate={}, {} bytes", wav.format.channels,
                  wav.format.bitsPerSample, wav.format.sampleRate_Hz, wav.samples.size());
      return wav;
    }

    pos = bodyStart + chunkSize + (chunkSize % 2);
  }

  SPDLOG_ERROR("No data chunk found in WAV file");
  return std::nullopt;
}

} // namespace lungo
