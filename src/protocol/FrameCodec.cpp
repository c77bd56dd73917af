#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "FrameCodec.hpp"
#include "Gzip.hpp"

namespace lungo {

namespace {

constexpr size_t FieldSize = 4;

void appendUint32(std::string& out, uint32_t value) {
  out.push_back(static_cast<char>((value >> 24U) & 0xFFU));
  out.push_back(static_cast<char>((value >> 16U) & 0xFFU));
  out.push_back(static_cast<char>((value >> 8U) & 0xFFU));
  out.push_back(static_cast<char>(value & 0xFFU));
}

uint32_t readUint32(std::string_view in) {
  return (static_cast<uint32_t>(static_cast<uint8_t>(in[0])) << 24U) |
         (static_cast<uint32_t>(static_cast<uint8_t>(in[1])) << 16U) |
         (static_cast<uint32_t>(static_cast<uint8_t>(in[2])) << 8U) |
         static_cast<uint32_t>(static_cast<uint8_t>(in[3]));
}

int32_t readInt32(std::string_view in) { return static_cast<int32_t>(readUint32(in)); }

/// @brief Marks the frame as degraded, logs why and hands it back for an early return
ParsedFrame& markMalformed(ParsedFrame& frame, std::string reason) {
  SPDLOG_WARN("Malformed frame: {}", reason);
  frame.malformed = true;
  frame.malformedReason = std::move(reason);
  return frame;
}

bool isKnownMessageType(uint8_t value) {
  switch (static_cast<MessageType>(value)) {
  case MessageType::ClientFullRequest:
  case MessageType::ClientAudioOnlyRequest:
  case MessageType::ServerFullResponse:
  case MessageType::ServerAck:
  case MessageType::ServerErrorResponse:
    return true;
  }
  return false;
}

} // namespace

std::optional<ProtocolVariant> variantFromName(std::string_view name) {
  if (name == BigModelVariant.name) {
    return BigModelVariant;
  }
  if (name == LegacyVariant.name) {
    return LegacyVariant;
  }
  return std::nullopt;
}

/**
 * FrameCodec::encodeHeader
 */
std::array<uint8_t, HeaderSizeBytes> FrameCodec::encodeHeader(MessageType messageType,
                                                              uint8_t flags,
                                                              Serialization serialization,
                                                              Compression compression) {
  return {static_cast<uint8_t>((ProtocolVersion << 4U) | DefaultHeaderWords),
          static_cast<uint8_t>((static_cast<uint8_t>(messageType) << 4U) | (flags & 0x0FU)),
          static_cast<uint8_t>((static_cast<uint8_t>(serialization) << 4U) |
                               static_cast<uint8_t>(compression)),
          0x00};
}

/**
 * FrameCodec::buildFrame
 * @brief Header, optional sequence, payload size and the already compressed payload
 */
std::string FrameCodec::buildFrame(MessageType messageType, uint8_t flags,
                                   std::optional<int32_t> sequence,
                                   std::string_view compressedBody) const {
  const auto header = encodeHeader(messageType, flags, Serialization::Json, Compression::Gzip);

  std::string frame;
  frame.reserve(HeaderSizeBytes + 2 * FieldSize + compressedBody.size());
  frame.append(header.begin(), header.end());
  if (sequence) {
    appendUint32(frame, static_cast<uint32_t>(*sequence));
  }
  appendUint32(frame, static_cast<uint32_t>(compressedBody.size()));
  frame.append(compressedBody);
  return frame;
}

/**
 * FrameCodec::buildControlFrame
 */
std::string FrameCodec::buildControlFrame(int32_t sequence, const nlohmann::json& payload) const {
  const auto compressed = gzipCompress(payload.dump());
  if (variant_.sequenced) {
    const auto flags = sequence < 0 ? Flags::NegWithSequence : Flags::PosSequence;
    return buildFrame(MessageType::ClientFullRequest, flags, sequence, compressed);
  }
  return buildFrame(MessageType::ClientFullRequest, Flags::NoSequence, std::nullopt, compressed);
}

/**
 * FrameCodec::buildAudioFrame
 * @brief The last frame is flagged and, on sequenced variants, also carries a negated sequence
 */
std::string FrameCodec::buildAudioFrame(int32_t sequence, std::string_view segment,
                                        bool isLast) const {
  const auto compressed = gzipCompress(segment);
  if (!variant_.sequenced) {
    return buildFrame(MessageType::ClientAudioOnlyRequest,
                      isLast ? Flags::NegSequence : Flags::NoSequence, std::nullopt, compressed);
  }

  const int32_t magnitude = sequence < 0 ? -sequence : sequence;
  if (isLast) {
    return buildFrame(MessageType::ClientAudioOnlyRequest, Flags::NegWithSequence, -magnitude,
                      compressed);
  }
  return buildFrame(MessageType::ClientAudioOnlyRequest, Flags::PosSequence, magnitude,
                    compressed);
}

/**
 * FrameCodec::decode
 */
ParsedFrame FrameCodec::decode(std::string_view raw) const {
  ParsedFrame frame;
  if (raw.size() < HeaderSizeBytes) {
    return markMalformed(frame, fmt::format("{} bytes is shorter than the header", raw.size()));
  }

  const auto byte0 = static_cast<uint8_t>(raw[0]);
  const auto byte1 = static_cast<uint8_t>(raw[1]);
  const auto byte2 = static_cast<uint8_t>(raw[2]);

  frame.headerWords = byte0 & 0x0FU;
  frame.flags = byte1 & 0x0FU;
  frame.serialization = static_cast<Serialization>(byte2 >> 4U);
  frame.compression = static_cast<Compression>(byte2 & 0x0FU);

  const auto messageType = static_cast<uint8_t>(byte1 >> 4U);
  if (!isKnownMessageType(messageType)) {
    return markMalformed(frame, fmt::format("unknown message type {:#06b}", messageType));
  }
  frame.messageType = static_cast<MessageType>(messageType);

  const size_t headerSize = frame.headerWords * HeaderSizeBytes;
  if (headerSize < HeaderSizeBytes || headerSize > raw.size()) {
    return markMalformed(frame, fmt::format("header of {} words does not fit in {} bytes",
                                            frame.headerWords, raw.size()));
  }
  auto rest = raw.substr(headerSize);

  if ((frame.flags & Flags::HasSequenceBit) != 0) {
    if (rest.size() < FieldSize) {
      return markMalformed(frame, "sequence number is truncated");
    }
    frame.sequence = readInt32(rest);
    rest.remove_prefix(FieldSize);
  }
  if ((frame.flags & Flags::IsLastBit) != 0) {
    frame.isLast = true;
  }

  bool hasPayloadSize = true;
  switch (frame.messageType) {
  case MessageType::ServerErrorResponse:
    if (rest.size() < FieldSize) {
      return markMalformed(frame, "error code is truncated");
    }
    frame.errorCode = readInt32(rest);
    rest.remove_prefix(FieldSize);
    break;
  case MessageType::ServerAck:
    // Acks carry their sequence in the body whether or not the flag says so
    if ((frame.flags & Flags::HasSequenceBit) == 0) {
      if (rest.size() < FieldSize) {
        return markMalformed(frame, "ack sequence is truncated");
      }
      frame.sequence = readInt32(rest);
      rest.remove_prefix(FieldSize);
    }
    hasPayloadSize = rest.size() >= FieldSize;
    break;
  default:
    break;
  }

  if (!hasPayloadSize) {
    return frame;
  }
  if (rest.size() < FieldSize) {
    return markMalformed(frame, "payload size is truncated");
  }
  frame.payloadSize = readUint32(rest);
  rest.remove_prefix(FieldSize);

  if (frame.payloadSize > rest.size()) {
    return markMalformed(frame, fmt::format("payload size {} exceeds the {} bytes available",
                                            frame.payloadSize, rest.size()));
  }
  if (frame.payloadSize < rest.size()) {
    SPDLOG_DEBUG("Ignoring {} trailing bytes after the payload", rest.size() - frame.payloadSize);
  }
  const auto compressed = rest.substr(0, frame.payloadSize);
  if (compressed.empty()) {
    return frame;
  }

  if (frame.compression == Compression::Gzip) {
    auto inflated = gzipDecompress(compressed);
    if (!inflated) {
      return markMalformed(frame, "payload could not be decompressed");
    }
    frame.body = std::move(*inflated);
  } else {
    frame.body.assign(compressed);
  }

  // Audio frames are flagged as JSON by the client but carry raw PCM
  if (frame.messageType == MessageType::ClientAudioOnlyRequest ||
      frame.serialization != Serialization::Json || frame.body.empty()) {
    return frame;
  }

  auto json = nlohmann::json::parse(frame.body, nullptr, false);
  if (json.is_discarded()) {
    return markMalformed(frame, "payload is not valid JSON");
  }
  frame.payload = std::move(json);
  return frame;
}

/**
 * FrameCodec::interpretResponse
 */
TranscriptUpdate FrameCodec::interpretResponse(const ParsedFrame& frame) const {
  TranscriptUpdate update;
  update.errorCode = frame.errorCode;
  update.isLast = frame.isLast;

  if (!frame.payload || !frame.payload->is_object()) {
    return update;
  }
  const auto& payload = *frame.payload;

  if (variant_.payloadSuccessCode != 0) {
    const auto code = payload.find("code");
    if (code != payload.end() && code->is_number_integer() &&
        code->get<int32_t>() != variant_.payloadSuccessCode && update.errorCode == 0) {
      update.errorCode = code->get<int32_t>();
    }
    const auto sequence = payload.find("sequence");
    if (sequence != payload.end() && sequence->is_number_integer() &&
        sequence->get<int32_t>() < 0) {
      update.isLast = true;
    }
  }

  const auto result = payload.find("result");
  if (result != payload.end()) {
    update.hasResult = true;
    update.text = extractResultText(*result);
  }
  return update;
}

std::string extractResultText(const nlohmann::json& result) {
  const nlohmann::json* entry = nullptr;
  if (result.is_array() && !result.empty()) {
    entry = &result.front();
  } else if (result.is_object()) {
    entry = &result;
  }
  if (entry == nullptr || !entry->is_object()) {
    return {};
  }

  const auto text = entry->find("text");
  if (text == entry->end() || !text->is_string()) {
    return {};
  }
  return text->get<std::string>();
}

} // namespace lungo
