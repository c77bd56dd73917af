#include "RequestBuilder.hpp"

namespace lungo {

std::string toServiceLanguage(const std::string& language) {
  if (language.find('-') != std::string::npos) {
    return language;
  }
  return language == "zh" ? "zh-CN" : "en-US";
}

nlohmann::json buildFullRequestPayload(const ClientConfig& config, const AudioFormat& format,
                                       const std::string& language,
                                       const std::string& requestId) {
  const auto& options = config.recognition;

  if (config.variant.sequenced) {
    return {
        {"user", {{"uid", options.uid}}},
        {"audio",
         {{"format", "pcm"},
          {"codec", "raw"},
          {"rate", format.sampleRate_Hz},
          {"bits", format.bitsPerSample},
          {"channel", format.channels}}},
        {"request",
         {{"model_name", options.modelName},
          {"enable_itn", options.enableItn},
          {"enable_punc", options.enablePunc},
          {"enable_ddc", options.enableDdc},
          {"show_utterances", options.showUtterances},
          {"enable_speaker_info", options.enableSpeakerInfo}}},
    };
  }

  // The legacy endpoint authenticates through the payload and picks its pipeline by workflow
  std::string workflow = "audio_in,resample,partition,vad,fe,decode";
  if (options.enableItn) {
    workflow += ",itn";
  }
  if (options.enablePunc) {
    workflow += ",nlu_punctuate";
  }
  if (options.enableDdc) {
    workflow += ",nlu_ddc";
  }

  return {
      {"app",
       {{"appid", config.credentials.appKey},
        {"cluster", config.credentials.cluster},
        {"token", config.credentials.accessKey}}},
      {"user", {{"uid", options.uid}}},
      {"request",
       {{"reqid", requestId},
        {"nbest", 1},
        {"workflow", workflow},
        {"show_utterances", options.showUtterances},
        {"result_type", "full"},
        {"sequence", 1}}},
      {"audio",
       {{"format", "raw"},
        {"rate", format.sampleRate_Hz},
        {"language", toServiceLanguage(language)},
        {"bits", format.bitsPerSample},
        {"channel", format.channels},
        {"codec", "raw"}}},
  };
}

HeaderList buildRequestHeaders(const ClientConfig& config, const std::string& requestId) {
  if (config.variant.sequenced) {
    return {{"X-Api-Resource-Id", config.credentials.resourceId},
            {"X-Api-Request-Id", requestId},
            {"X-Api-Access-Key", config.credentials.accessKey},
            {"X-Api-App-Key", config.credentials.appKey}};
  }
  return {{"Authorization", "Bearer; " + config.credentials.accessKey}};
}

} // namespace lungo
