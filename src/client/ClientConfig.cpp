#include <fstream>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "AsrError.hpp"
#include "ClientConfig.hpp"

namespace lungo {

namespace {

/// @brief Overwrites target with json[section][key]["value"] when that setting is present
template <typename T>
void readSetting(const nlohmann::json& json, const std::string& section, const std::string& key,
                 T& target) {
  const auto sectionIt = json.find(section);
  if (sectionIt == json.end() || !sectionIt->is_object()) {
    return;
  }
  const auto keyIt = sectionIt->find(key);
  if (keyIt == sectionIt->end()) {
    return;
  }
  const auto valueIt = keyIt->find("value");
  if (valueIt == keyIt->end()) {
    SPDLOG_WARN("Setting {}.{} has no \"value\" member, ignoring it", section, key);
    return;
  }
  try {
    target = valueIt->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw AsrError(ErrorCode::InvalidConfig,
                   fmt::format("Setting {}.{} is invalid: {}", section, key, e.what()));
  }
}

void readDuration(const nlohmann::json& json, const std::string& section, const std::string& key,
                  std::chrono::milliseconds& target) {
  auto count = target.count();
  readSetting(json, section, key, count);
  target = std::chrono::milliseconds(count);
}

} // namespace

/**
 * ClientConfig::fromJson
 */
ClientConfig ClientConfig::fromJson(const nlohmann::json& json) {
  ClientConfig config;

  readSetting(json, "serverParameters", "url", config.serverUrl);
  std::string variantName(config.variant.name);
  readSetting(json, "serverParameters", "protocolVariant", variantName);
  const auto variant = variantFromName(variantName);
  if (!variant) {
    throw AsrError(ErrorCode::InvalidConfig,
                   fmt::format("Unknown protocol variant \"{}\"", variantName));
  }
  config.variant = *variant;

  readSetting(json, "credentials", "appKey", config.credentials.appKey);
  readSetting(json, "credentials", "accessKey", config.credentials.accessKey);
  readSetting(json, "credentials", "resourceId", config.credentials.resourceId);
  readSetting(json, "credentials", "cluster", config.credentials.cluster);

  readSetting(json, "audio", "sampleRate_Hz", config.audio.sampleRate_Hz);
  readSetting(json, "audio", "bitsPerSample", config.audio.bitsPerSample);
  readSetting(json, "audio", "channels", config.audio.channels);

  readSetting(json, "recognition", "uid", config.recognition.uid);
  readSetting(json, "recognition", "modelName", config.recognition.modelName);
  readSetting(json, "recognition", "enableItn", config.recognition.enableItn);
  readSetting(json, "recognition", "enablePunc", config.recognition.enablePunc);
  readSetting(json, "recognition", "enableDdc", config.recognition.enableDdc);
  readSetting(json, "recognition", "showUtterances", config.recognition.showUtterances);
  readSetting(json, "recognition", "enableSpeakerInfo", config.recognition.enableSpeakerInfo);

  readDuration(json, "session", "segmentDuration_ms", config.session.segmentDuration);
  readDuration(json, "session", "finishTimeout_ms", config.session.finishTimeout);
  readDuration(json, "session", "handshakeTimeout_ms", config.session.handshakeTimeout);
  readSetting(json, "session", "realtimePacing", config.session.realtimePacing);

  if (config.session.segmentDuration.count() <= 0 ||
      config.audio.segmentSizeBytes(config.session.segmentDuration) == 0) {
    throw AsrError(ErrorCode::InvalidConfig, "Segment duration must cover at least one byte");
  }
  return config;
}

/**
 * ClientConfig::fromJsonFile
 */
ClientConfig ClientConfig::fromJsonFile(const std::filesystem::path& path) {
  std::ifstream inputStream(path);
  if (!inputStream.is_open()) {
    SPDLOG_ERROR("Could not open config file {}", path.string());
    throw AsrError(ErrorCode::InvalidConfig,
                   fmt::format("Could not open config file {}", path.string()));
  }

  const auto json = nlohmann::json::parse(inputStream, nullptr, false);
  if (json.is_discarded()) {
    SPDLOG_ERROR("{} is not valid JSON", path.string());
    throw AsrError(ErrorCode::InvalidConfig, fmt::format("{} is not valid JSON", path.string()));
  }

  auto config = fromJson(json);
  SPDLOG_INFO("Loaded config from {}: url={}, variant={}", path.string(), config.serverUrl,
              config.variant.name);
  return config;
}

} // namespace lungo
