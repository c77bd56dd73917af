#pragma once

#include <memory>
#include <string>
#include <vector>

#include "AudioFormat.hpp"
#include "ClientConfig.hpp"
#include "RealtimeSession.hpp"
#include "Transport.hpp"
#include "WebSocketTransport.hpp"

namespace lungo {

/**
 * AsrClient
 * @brief Holds the configuration and credentials, and hands out one RealtimeSession per
 *        recognition. Every session gets its own transport from the factory.
 */
class AsrClient {
public:
  explicit AsrClient(ClientConfig config, TransportFactory transportFactory = makeWebSocketTransport);

  /// @brief True if the credentials needed by the configured protocol variant are present
  [[nodiscard]] bool isAvailable() const;

  /// @brief No I/O happens until start() is called on the returned session
  std::unique_ptr<RealtimeSession> createSession(const AudioFormat& format,
                                                 const std::string& language,
                                                 PartialCallback onPartial = {},
                                                 FinalCallback onFinal = {},
                                                 ErrorCallback onError = {}) const;

  /**
   * @brief Runs a whole WAV file through one session, feeding it at real-time pace
   * @return The final transcript, empty if the audio is not a PCM WAV file or recognition failed
   */
  std::string transcribe(const std::vector<char>& wav, const std::string& language,
                         PartialCallback onPartial = {}) const;

  [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

private:
  ClientConfig config_;
  TransportFactory transportFactory_;
};

} // namespace lungo
