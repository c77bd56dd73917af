#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "AudioFormat.hpp"
#include "FrameCodec.hpp"

namespace lungo {

constexpr std::string_view BigModelAsyncUrl =
    "wss://openspeech.bytedance.com/api/v3/sauc/bigmodel_async";
constexpr std::string_view BigModelNoStreamUrl =
    "wss://openspeech.bytedance.com/api/v3/sauc/bigmodel_nostream";
constexpr std::string_view LegacyUrl = "wss://openspeech.bytedance.com/api/v2/asr";

/**
 * @brief Identity sent with every connection. On the legacy endpoint appKey is the application
 *        id and accessKey the bearer token.
 */
struct Credentials {
  std::string appKey;
  std::string accessKey;
  std::string resourceId = "volc.seedasr.sauc.duration";
  std::string cluster = "volcengine_input_common";
};

struct RecognitionOptions {
  std::string uid = "lungo";
  std::string modelName = "bigmodel";
  bool enableItn = true;
  bool enablePunc = true;
  bool enableDdc = true;
  bool showUtterances = true;
  /// @brief Speaker diarization, only understood by the bigmodel endpoints
  bool enableSpeakerInfo = false;
};

struct SessionOptions {
  /// @brief Real time covered by one audio frame
  std::chrono::milliseconds segmentDuration = std::chrono::milliseconds(200);
  /// @brief How long finish() waits for the final transcript
  std::chrono::milliseconds finishTimeout = std::chrono::milliseconds(5000);
  /// @brief How long start() waits for the reply to the initial request
  std::chrono::milliseconds handshakeTimeout = std::chrono::milliseconds(5000);
  /// @brief Never send audio frames faster than they would have been captured
  bool realtimePacing = true;
};

/**
 * ClientConfig
 * @brief Everything needed to talk to the recognition service. Loaded from a JSON file where
 *        each setting is an object with a "value" member, missing settings keep their defaults.
 */
struct ClientConfig {
  std::string serverUrl = std::string(BigModelAsyncUrl);
  ProtocolVariant variant = BigModelVariant;
  Credentials credentials;
  AudioFormat audio;
  RecognitionOptions recognition;
  SessionOptions session;

  /// @throws AsrError if the file can't be read or doesn't hold a valid configuration
  static ClientConfig fromJsonFile(const std::filesystem::path& path);
  /// @throws AsrError if a setting has the wrong type or an unknown protocol variant is named
  static ClientConfig fromJson(const nlohmann::json& json);
};

} // namespace lungo
