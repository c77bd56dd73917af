#include <algorithm>
#include <chrono>
#include <cstdio>
#include <memory>
#include <string_view>
#include <thread>
#include <vector>

#include <docopt/docopt.h>
#include <fmt/core.h>

#include "AsrClient.hpp"
#include "ClientConfig.hpp"
#include "Utils.hpp"

static constexpr auto Usage =
    R"(LungoClient - Streaming speech recognition client

    Usage: LungoClient [--config <config_file>] [--file <wav_file>] [--url <server_url>] [--variant <protocol>] [--language <lang>] [--timeout <timeout_sec>]

    Options:
          -h, --help     Show this screen.
          -v, --version  Show the version.
          --config <config_file>  client configuration   [default: config/clientConfig.json]
          --file <wav_file>  WAV file to transcribe, raw PCM is read from stdin otherwise
          --url <server_url>  overrides the configured WebSocket url
          --variant <protocol>  overrides the configured protocol (bigmodel or legacy)
          --language <lang>  language of the audio   [default: zh-CN]
          --timeout <timeout_sec>  stop reading stdin after this many seconds
)";

/**
 * streamStdin()
 * @brief Sends raw PCM from stdin to a live session until EOF or the timeout
 */
int streamStdin(const lungo::AsrClient& client, const std::string& language,
                std::chrono::seconds timeout) {
  const auto& config = client.config();
  auto session = client.createSession(
      config.audio, language, [](const std::string& text) { fmt::print("Partial: {}\n", text); },
      [](const std::string& text) { fmt::print("Final: {}\n", text); },
      [](const lungo::SessionError& error) {
        fmt::print("Recognition failed ({}): {}\n", lungo::toString(error.code), error.message);
      });
  session->start();
  fmt::print("Streaming {} Hz audio from stdin\n", config.audio.sampleRate_Hz);

  // Read a tenth of a segment at a time, roughly what a capture device hands out
  const auto chunkSize =
      std::max<size_t>(config.audio.segmentSizeBytes(config.session.segmentDuration) / 10, 1);
  std::vector<char> chunk(chunkSize);
  const auto start = std::chrono::steady_clock::now();
  size_t totalBytes = 0;

  while (session->state() == lungo::SessionState::Streaming) {
    if (timeout.count() > 0 && std::chrono::steady_clock::now() - start >= timeout) {
      SPDLOG_INFO("Reached the {} second timeout", timeout.count());
      break;
    }
    const auto bytesRead = std::fread(chunk.data(), 1, chunk.size(), stdin);
    if (bytesRead == 0) {
      SPDLOG_INFO("End of input after {} bytes", totalBytes);
      break;
    }
    totalBytes += bytesRead;
    session->sendAudio(std::string_view(chunk.data(), bytesRead));
    // A file piped in arrives all at once, feed it at the rate it would be recorded
    if (config.session.realtimePacing) {
      std::this_thread::sleep_for(config.audio.bytesToDuration(bytesRead));
    }
  }

  const auto transcript = session->finish();
  fmt::print("Transcript:{}\n", transcript);
  SPDLOG_INFO("Transcript:{}", transcript);
  return session->state() == lungo::SessionState::Done ? 0 : 1;
}

int main([[maybe_unused]] int argc, [[maybe_unused]] char** argv) {
  lungo::Utils::createLogger();
  auto args = docopt::docopt(Usage, {std::next(argv), std::next(argv, argc)},
                             true,         // show help if requested
                             "Lungo 0.1"); // version string

  try {
    const auto configPath = args[std::string("--config")].asString();
    auto config = lungo::ClientConfig::fromJsonFile(configPath);
    SPDLOG_INFO("Loaded configuration from {}", configPath);

    if (const auto url = args[std::string("--url")]) {
      config.serverUrl = url.asString();
    }
    if (const auto variant = args[std::string("--variant")]) {
      const auto chosen = lungo::variantFromName(variant.asString());
      if (!chosen) {
        fmt::print("Unknown protocol variant {}\n", variant.asString());
        return 1;
      }
      config.variant = *chosen;
    }
    fmt::print("Server url: {} ({})\n", config.serverUrl, config.variant.name);

    lungo::AsrClient client(config);
    if (!client.isAvailable()) {
      fmt::print("Missing credentials, set credentials.appKey and credentials.accessKey in {}\n",
                 configPath);
      return 1;
    }

    const auto language = args[std::string("--language")].asString();
    const auto audioFile = args[std::string("--file")];
    if (audioFile) {
      fmt::print("Processing audio file {}\n", audioFile.asString());
      const auto audioData = lungo::Utils::readInAudioFile(audioFile.asString());
      if (audioData.empty()) {
        SPDLOG_WARN("AudioData was empty!");
        fmt::print("AudioData was empty!\n");
        return 1;
      }

      const auto transcript = client.transcribe(
          audioData, language, [](const std::string& text) { fmt::print("Partial: {}\n", text); });
      if (transcript.empty()) {
        fmt::print("Response was empty!\n");
        SPDLOG_ERROR("Response was empty!");
        return 1;
      }
      fmt::print("Transcript:{}\n", transcript);
      SPDLOG_INFO("Transcript:{}", transcript);
      return 0;
    }

    std::chrono::seconds timeout(0);
    if (const auto timeoutArg = args[std::string("--timeout")]) {
      timeout = std::chrono::seconds(timeoutArg.asLong());
    }
    return streamStdin(client, language, timeout);

  } catch (const lungo::AsrError& e) {
    SPDLOG_ERROR("Caught AsrError ({}): {}", lungo::toString(e.code()), e.what());
    fmt::print("{}: {}\n exiting...\n", lungo::toString(e.code()), e.what());
    return 1;
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Caught std::exception: {}", e.what());
    fmt::print("Caught std::exception: {}\n exiting...\n", e.what());
    return 1;
  }
}
