#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace lungo {

/**
 * @brief Layout of the linear PCM sent to the recognizer. These values are sent verbatim in the
 *        initial request and must match every audio frame that follows.
 */
struct AudioFormat {
  // 16,000 Hz mono is what the recognizer is tuned for
  unsigned int sampleRate_Hz = 16000;
  unsigned int bitsPerSample = 16;
  unsigned int channels = 1;

  [[nodiscard]] size_t bytesPerSample() const noexcept { return bitsPerSample / 8; }
  [[nodiscard]] size_t bytesPerSecond() const noexcept {
    return static_cast<size_t>(channels) * bytesPerSample() * sampleRate_Hz;
  }
  [[nodiscard]] size_t segmentSizeBytes(std::chrono::milliseconds duration) const noexcept {
    return bytesPerSecond() * static_cast<size_t>(duration.count()) / 1000;
  }
  [[nodiscard]] std::chrono::milliseconds bytesToDuration(size_t size) const noexcept {
    const auto perSecond = bytesPerSecond();
    if (perSecond == 0) {
      return std::chrono::milliseconds(0);
    }
    return std::chrono::milliseconds(size * 1000 / perSecond);
  }

  inline bool operator==(const AudioFormat& rhs) const noexcept {
    return sampleRate_Hz == rhs.sampleRate_Hz && bitsPerSample == rhs.bitsPerSample &&
           channels == rhs.channels;
  }
  inline bool operator!=(const AudioFormat& rhs) const noexcept { return !(*this == rhs); }
};

/**
 * @brief PCM samples pulled out of a RIFF/WAVE container
 */
struct WavAudio {
  AudioFormat format;
  std::vector<char> samples;
};

/// @brief Cheap check for the RIFF/WAVE magic
bool isWav(const std::vector<char>& data);

/// @brief Returns std::nullopt (and logs why) if the data is not a PCM WAV file
std::optional<WavAudio> parseWav(const std::vector<char>& data);

} // namespace lungo
