#include <string_view>
#include <thread>

#include <spdlog/spdlog.h>

#include "AsrClient.hpp"
#include "Segmenter.hpp"
#include "Utils.hpp"

namespace lungo {

/**
 * AsrClient::AsrClient
 */
AsrClient::AsrClient(ClientConfig config, TransportFactory transportFactory)
    : config_(std::move(config)), transportFactory_(std::move(transportFactory)) {
  if (!transportFactory_) {
    throw AsrError(ErrorCode::InvalidConfig, "AsrClient needs a transport factory");
  }
  SPDLOG_INFO("AsrClient for {} ({} protocol), app key {}, access key {}", config_.serverUrl,
              config_.variant.name, Utils::redact(config_.credentials.appKey),
              Utils::redact(config_.credentials.accessKey));
}

bool AsrClient::isAvailable() const {
  return !config_.credentials.appKey.empty() && !config_.credentials.accessKey.empty();
}

/**
 * AsrClient::createSession
 */
std::unique_ptr<RealtimeSession> AsrClient::createSession(const AudioFormat& format,
                                                          const std::string& language,
                                                          PartialCallback onPartial,
                                                          FinalCallback onFinal,
                                                          ErrorCallback onError) const {
  if (!isAvailable()) {
    SPDLOG_WARN("Creating a session without complete credentials");
  }
  return std::make_unique<RealtimeSession>(config_, format, language, transportFactory_(),
                                           std::move(onPartial), std::move(onFinal),
                                           std::move(onError));
}

/**
 * AsrClient::transcribe
 */
std::string AsrClient::transcribe(const std::vector<char>& wav, const std::string& language,
                                  PartialCallback onPartial) const {
  const auto audio = parseWav(wav);
  if (!audio) {
    SPDLOG_ERROR("Not transcribing {} bytes that are not a PCM WAV file", wav.size());
    return {};
  }
  if (audio->samples.empty()) {
    SPDLOG_WARN("WAV file holds no samples");
    return {};
  }
  if (audio->format != config_.audio) {
    SPDLOG_INFO("WAV format {} Hz/{} bit/{} ch overrides the configured audio format",
                audio->format.sampleRate_Hz, audio->format.bitsPerSample,
                audio->format.channels);
  }
  SPDLOG_INFO("Transcribing {} ms of audio",
              audio->format.bytesToDuration(audio->samples.size()).count());

  try {
    auto session = createSession(audio->format, language, std::move(onPartial), {},
                                 [](const SessionError& error) {
                                   SPDLOG_ERROR("Transcription failed with {}: {}",
                                                toString(error.code), error.message);
                                 });
    session->start();

    const std::string_view samples(audio->samples.data(), audio->samples.size());
    for (const auto chunk : segment(samples, session->segmentSizeBytes())) {
      const auto state = session->state();
      if (state != SessionState::Streaming) {
        SPDLOG_WARN("Stopped feeding audio, session is {}", toString(state));
        break;
      }
      session->sendAudio(chunk);
      // Keeps the queue short so the finish timeout only covers recognition
      if (config_.session.realtimePacing) {
        std::this_thread::sleep_for(config_.session.segmentDuration);
      }
    }

    auto transcript = session->finish();
    if (session->state() != SessionState::Done) {
      SPDLOG_WARN("Session ended in state {}", toString(session->state()));
      return {};
    }
    return transcript;
  } catch (const AsrError& e) {
    SPDLOG_ERROR("Transcription failed with {}: {}", toString(e.code()), e.what());
    return {};
  }
}

} // namespace lungo
