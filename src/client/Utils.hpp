#pragma once

#include <spdlog/spdlog.h>

#include <string>
#include <string_view>
#include <vector>

namespace lungo {

class Utils {
public:
  static void createLogger(); // This needs to be called early on to configure the logger correctly

  static std::vector<char> readInAudioFile(std::string_view filename);

  /// @brief Random UUID used to tag a recognition request in logs and request headers
  static std::string generateRequestId();

  /// @brief Shortens a secret to its first characters so it can be logged
  static std::string redact(std::string_view secret);
};

} // namespace lungo
