#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lungo {

enum class ErrorCode {
  MalformedFrame,
  ConnectionFailed,
  HandshakeRejected,
  RecognitionTimedOut,
  ServerError,
  Cancelled,
  InvalidConfig
};

constexpr std::string_view toString(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::MalformedFrame:
    return "MalformedFrame";
  case ErrorCode::ConnectionFailed:
    return "ConnectionFailed";
  case ErrorCode::HandshakeRejected:
    return "HandshakeRejected";
  case ErrorCode::RecognitionTimedOut:
    return "RecognitionTimedOut";
  case ErrorCode::ServerError:
    return "ServerError";
  case ErrorCode::Cancelled:
    return "Cancelled";
  case ErrorCode::InvalidConfig:
    return "InvalidConfig";
  }
  return "Unknown";
}

/**
 * @brief Handed to the error callback of a session
 */
struct SessionError {
  ErrorCode code = ErrorCode::ConnectionFailed;
  /// @brief Status reported by the server, 0 when the error didn't come from the server
  int32_t serverCode = 0;
  std::string message;
};

/**
 * AsrError
 * @brief Thrown for failures that are reported synchronously (start(), configuration)
 */
class AsrError : public std::runtime_error {
public:
  AsrError(ErrorCode code, const std::string& message, int32_t serverCode = 0)
      : std::runtime_error(message), code_(code), serverCode_(serverCode) {}

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }
  [[nodiscard]] int32_t serverCode() const noexcept { return serverCode_; }

private:
  ErrorCode code_;
  int32_t serverCode_;
};

} // namespace lungo
