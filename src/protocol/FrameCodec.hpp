#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace lungo {

// Binary framing used by the speech recognition service. Integers are big-endian.
//
//  byte0: version << 4 | header word count
//  byte1: message type << 4 | flags
//  byte2: serialization << 4 | compression
//  byte3: reserved (0x00)
//  [sequence: int32]      present when flags bit 0 is set
//  [error code: int32]    only on ServerErrorResponse
//  [payload size: uint32]
//  payload: gzip(JSON | raw PCM)

constexpr uint8_t ProtocolVersion = 0b0001;
constexpr uint8_t DefaultHeaderWords = 0b0001;
constexpr size_t HeaderSizeBytes = 4;

enum class MessageType : uint8_t {
  ClientFullRequest = 0b0001,
  ClientAudioOnlyRequest = 0b0010,
  ServerFullResponse = 0b1001,
  ServerAck = 0b1011,
  ServerErrorResponse = 0b1111
};

namespace Flags {
constexpr uint8_t NoSequence = 0b0000;
constexpr uint8_t PosSequence = 0b0001;
constexpr uint8_t NegSequence = 0b0010;
constexpr uint8_t NegWithSequence = 0b0011;

constexpr uint8_t HasSequenceBit = 0b0001;
constexpr uint8_t IsLastBit = 0b0010;
} // namespace Flags

enum class Serialization : uint8_t { None = 0b0000, Json = 0b0001 };
enum class Compression : uint8_t { None = 0b0000, Gzip = 0b0001 };

/**
 * @brief Describes the differences between the two flavours of the protocol the service speaks
 */
struct ProtocolVariant {
  std::string_view name;
  /// @brief Frames carry an explicit sequence number and the last audio frame negates it
  bool sequenced;
  /// @brief Status code inside the JSON payload that means success, 0 if the payload has none
  int32_t payloadSuccessCode;
};

/// @brief v3 "bigmodel" streaming endpoints
constexpr ProtocolVariant BigModelVariant{"bigmodel", true, 0};
/// @brief v2 endpoint, end of stream is only marked by a flag
constexpr ProtocolVariant LegacyVariant{"legacy", false, 1000};

/// @brief Looks a variant up by name, std::nullopt if the name is unknown
std::optional<ProtocolVariant> variantFromName(std::string_view name);

/**
 * @brief Result of decoding one frame. Fields that could not be read keep their defaults.
 */
struct ParsedFrame {
  uint8_t headerWords = 0;
  MessageType messageType = MessageType::ServerFullResponse;
  uint8_t flags = Flags::NoSequence;
  Serialization serialization = Serialization::None;
  Compression compression = Compression::None;

  int32_t sequence = 0;
  bool isLast = false;
  int32_t errorCode = 0;
  uint32_t payloadSize = 0;

  /// @brief Decompressed payload bytes
  std::string body;
  /// @brief Parsed JSON payload, empty for audio frames or when parsing failed
  std::optional<nlohmann::json> payload;

  bool malformed = false;
  std::string malformedReason;
};

/**
 * @brief What a server response means to a recognition session
 */
struct TranscriptUpdate {
  int32_t errorCode = 0;
  bool hasResult = false;
  std::string text;
  bool isLast = false;
};

/**
 * FrameCodec
 * @brief Stateless encoder/decoder for protocol frames. Decoding never throws, a frame that
 *        can't be read is returned marked as malformed with whatever could be recovered.
 */
class FrameCodec {
public:
  explicit FrameCodec(const ProtocolVariant& variant = BigModelVariant) : variant_(variant) {}

  static std::array<uint8_t, HeaderSizeBytes> encodeHeader(MessageType messageType, uint8_t flags,
                                                          Serialization serialization,
                                                          Compression compression);

  [[nodiscard]] std::string buildControlFrame(int32_t sequence,
                                              const nlohmann::json& payload) const;
  [[nodiscard]] std::string buildAudioFrame(int32_t sequence, std::string_view segment,
                                            bool isLast) const;

  [[nodiscard]] ParsedFrame decode(std::string_view raw) const;
  [[nodiscard]] TranscriptUpdate interpretResponse(const ParsedFrame& frame) const;

  [[nodiscard]] const ProtocolVariant& variant() const noexcept { return variant_; }

private:
  std::string buildFrame(MessageType messageType, uint8_t flags,
                         std::optional<int32_t> sequence, std::string_view compressedBody) const;

  ProtocolVariant variant_;
};

/// @brief Pulls the transcript out of a "result" member, which is either a list or an object
std::string extractResultText(const nlohmann::json& result);

} // namespace lungo
