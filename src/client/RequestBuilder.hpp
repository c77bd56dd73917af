#pragma once

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "AudioFormat.hpp"
#include "ClientConfig.hpp"

namespace lungo {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief JSON body of the ClientFullRequest that opens a session. The two protocol variants
 *        expect differently shaped requests.
 */
nlohmann::json buildFullRequestPayload(const ClientConfig& config, const AudioFormat& format,
                                       const std::string& language,
                                       const std::string& requestId);

/// @brief Headers for the HTTP upgrade request
HeaderList buildRequestHeaders(const ClientConfig& config, const std::string& requestId);

/// @brief "zh" -> "zh-CN", anything else -> "en-US", full locale names pass through
std::string toServiceLanguage(const std::string& language);

} // namespace lungo
