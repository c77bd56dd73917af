#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>

#include "Utils.hpp"

namespace lungo {

namespace {
size_t findSizeOfFileStream(std::istream& str) {
  const auto originalPos = str.tellg();    // Find current pos
  str.seekg(0, str.end);                   // Go to the end
  const std::streampos size = str.tellg(); // Find size
  str.seekg(originalPos, str.beg);         // Reset pos back to where we were
  return static_cast<size_t>(size);
}
} // namespace

std::vector<char> Utils::readInAudioFile(std::string_view filename) {
  std::ifstream inputStream(std::string(filename), std::fstream::in | std::fstream::binary);

  if (!inputStream.is_open()) {
    SPDLOG_ERROR("Could not open {} for reading", filename);
    return {};
  }

  const auto inputSize = findSizeOfFileStream(inputStream);
  SPDLOG_DEBUG("{} is {} bytes", filename, inputSize);

  // Read in the entire file
  std::vector<char> audioBuffer;
  audioBuffer.reserve(inputSize);
  audioBuffer.assign((std::istreambuf_iterator<char>(inputStream)),
                     std::istreambuf_iterator<char>());

  SPDLOG_DEBUG("audioBuffer has {} bytes after reading in file", audioBuffer.size());
  return audioBuffer;
}

void Utils::createLogger() {
  static std::atomic<bool> hasBeenCalled(false);
  if (hasBeenCalled.exchange(true)) {
    return;
  }

  // [log level] has color enabled
  // [D/M/YR Hour:Month:Second.ms]     [thread id] [log level] [file::func():line] message
  spdlog::set_pattern("[%D %H:%M:%S.%e] [tid %t] [%^%l%$] [%s::%!():%#] %v");
  auto logger = spdlog::basic_logger_mt("LungoClientLogger", "logs/lungo-client.log", true);
  spdlog::set_default_logger(logger);
  spdlog::flush_every(std::chrono::seconds(2));
  spdlog::set_level(spdlog::level::debug);
  SPDLOG_DEBUG("Debug-level logging enabled");
}

std::string Utils::generateRequestId() {
  // random_generator seeds itself from the OS, keep one per thread
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

std::string Utils::redact(std::string_view secret) {
  constexpr size_t visibleChars = 4;
  if (secret.empty()) {
    return "None";
  }
  return std::string(secret.substr(0, visibleChars)) + "...";
}

} // namespace lungo
