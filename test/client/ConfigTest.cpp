#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "AsrError.hpp"
#include "ClientConfig.hpp"

// @test Settings in the file override the defaults, everything else keeps its default
TEST(ConfigTest, LoadsFile) {
  const auto config = lungo::ClientConfig::fromJsonFile("test/resources/testClientConfig.json");

  EXPECT_EQ(config.serverUrl, "ws://127.0.0.1:5050/api/v2/asr");
  EXPECT_EQ(config.variant.name, "legacy");
  EXPECT_EQ(config.credentials.appKey, "test-app-id");
  EXPECT_EQ(config.credentials.accessKey, "test-token");
  EXPECT_EQ(config.credentials.cluster, "test_cluster");
  EXPECT_EQ(config.audio.sampleRate_Hz, 8000);
  EXPECT_EQ(config.audio.bitsPerSample, 16);
  EXPECT_FALSE(config.recognition.enableDdc);
  EXPECT_TRUE(config.recognition.enablePunc);
  EXPECT_TRUE(config.recognition.enableSpeakerInfo);
  EXPECT_EQ(config.session.segmentDuration, std::chrono::milliseconds(100));
  EXPECT_EQ(config.session.finishTimeout, std::chrono::milliseconds(2000));
  EXPECT_EQ(config.session.handshakeTimeout, std::chrono::milliseconds(5000));
  EXPECT_FALSE(config.session.realtimePacing);
}

// @test The example configuration shipped with the client is valid
TEST(ConfigTest, ExampleConfigLoads) {
  const auto config = lungo::ClientConfig::fromJsonFile("config/clientConfig.json");

  EXPECT_EQ(config.serverUrl, lungo::BigModelAsyncUrl);
  EXPECT_TRUE(config.variant.sequenced);
  EXPECT_EQ(config.session.segmentDuration, std::chrono::milliseconds(200));
}

TEST(ConfigTest, EmptyJsonKeepsDefaults) {
  const auto config = lungo::ClientConfig::fromJson(nlohmann::json::object());

  EXPECT_EQ(config.serverUrl, lungo::BigModelAsyncUrl);
  EXPECT_EQ(config.variant.name, "bigmodel");
  EXPECT_EQ(config.audio, lungo::AudioFormat());
  EXPECT_EQ(config.session.finishTimeout, std::chrono::milliseconds(5000));
}

TEST(ConfigTest, Errors) {
  const auto expectInvalid = [](const auto& load) {
    try {
      load();
      FAIL() << "expected AsrError";
    } catch (const lungo::AsrError& e) {
      EXPECT_EQ(e.code(), lungo::ErrorCode::InvalidConfig);
    }
  };

  expectInvalid([] { lungo::ClientConfig::fromJsonFile("test/resources/missing.json"); });
  expectInvalid(
      [] { lungo::ClientConfig::fromJsonFile("test/resources/invalidClientConfig.json"); });
  expectInvalid([] {
    lungo::ClientConfig::fromJson(
        nlohmann::json::parse(R"({"serverParameters":{"protocolVariant":{"value":"v9"}}})"));
  });
  expectInvalid([] {
    lungo::ClientConfig::fromJson(
        nlohmann::json::parse(R"({"audio":{"sampleRate_Hz":{"value":"fast"}}})"));
  });
  expectInvalid([] {
    lungo::ClientConfig::fromJson(
        nlohmann::json::parse(R"({"session":{"segmentDuration_ms":{"value":0}}})"));
  });
}
