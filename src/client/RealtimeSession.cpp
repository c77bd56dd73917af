#include <algorithm>
#include <cstdlib>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "RealtimeSession.hpp"
#include "RequestBuilder.hpp"
#include "Segmenter.hpp"
#include "Utils.hpp"

namespace lungo {

namespace {
/// @brief How often the worker threads wake up to check whether they should stop
constexpr auto PollInterval = std::chrono::milliseconds(100);

bool isTerminalState(SessionState state) {
  return state == SessionState::Done || state == SessionState::Error ||
         state == SessionState::Cancelled;
}
} // namespace

std::string_view toString(SessionState state) noexcept {
  switch (state) {
  case SessionState::Created:
    return "Created";
  case SessionState::Connecting:
    return "Connecting";
  case SessionState::Streaming:
    return "Streaming";
  case SessionState::Finishing:
    return "Finishing";
  case SessionState::Done:
    return "Done";
  case SessionState::Error:
    return "Error";
  case SessionState::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

/**
 * RealtimeSession::RealtimeSession
 */
RealtimeSession::RealtimeSession(ClientConfig config, AudioFormat format, std::string language,
                                 std::unique_ptr<Transport> transport, PartialCallback onPartial,
                                 FinalCallback onFinal, ErrorCallback onError)
    : config_(std::move(config)), format_(format), language_(std::move(language)),
      requestId_(Utils::generateRequestId()), codec_(config_.variant),
      segmentSize_(format_.segmentSizeBytes(config_.session.segmentDuration)),
      transport_(std::move(transport)), onPartial_(std::move(onPartial)),
      onFinal_(std::move(onFinal)), onError_(std::move(onError)) {
  if (!transport_) {
    throw AsrError(ErrorCode::InvalidConfig, "A session needs a transport");
  }
  if (segmentSize_ == 0) {
    throw AsrError(ErrorCode::InvalidConfig,
                   fmt::format("{} ms of audio is less than one byte",
                               config_.session.segmentDuration.count()));
  }
  SPDLOG_INFO("Created session {}: {} Hz, {} bit, {} channel(s), {} byte segments, variant {}",
              requestId_, format_.sampleRate_Hz, format_.bitsPerSample, format_.channels,
              segmentSize_, config_.variant.name);
}

/**
 * RealtimeSession::~RealtimeSession
 */
RealtimeSession::~RealtimeSession() {
  cancel();
  joinThreads();
  // Only reachable when the session is destroyed from one of its own callbacks
  if (sendThread_.joinable()) {
    sendThread_.detach();
  }
  if (receiveThread_.joinable()) {
    receiveThread_.detach();
  }
}

/**
 * RealtimeSession::start
 */
void RealtimeSession::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Created) {
      SPDLOG_WARN("start() called on session {} in state {}", requestId_, toString(state_));
      return;
    }
    state_ = SessionState::Connecting;
  }
  SPDLOG_INFO("Session {} connecting to {}", requestId_, config_.serverUrl);

  try {
    transport_->connect(config_.serverUrl, buildRequestHeaders(config_, requestId_));
    handshake();
  } catch (const AsrError& e) {
    bool cancelled = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled = state_ == SessionState::Cancelled;
      if (!cancelled) {
        state_ = SessionState::Error;
      }
    }
    stateChanged_.notify_all();
    acceptingAudio_ = false;
    stopIo();

    if (cancelled) {
      SPDLOG_INFO("Session {} was cancelled while connecting", requestId_);
      throw AsrError(ErrorCode::Cancelled, "Session was cancelled while connecting");
    }
    SPDLOG_ERROR("Session {} failed to start: {}", requestId_, e.what());
    throw;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Connecting) {
      SPDLOG_INFO("Session {} left {} during the handshake", requestId_, toString(state_));
      return;
    }
    state_ = SessionState::Streaming;
  }
  stateChanged_.notify_all();

  nextSendTime_ = std::chrono::steady_clock::now();
  sendThread_ = std::thread(&RealtimeSession::sendLoop, this);
  receiveThread_ = std::thread(&RealtimeSession::receiveLoop, this);
  SPDLOG_INFO("Session {} streaming", requestId_);
}

/**
 * RealtimeSession::handshake
 * @brief Sends the full client request and waits for the server to accept it
 */
void RealtimeSession::handshake() {
  const auto payload = buildFullRequestPayload(config_, format_, language_, requestId_);
  SPDLOG_DEBUG("Full client request: {}", payload.dump());
  transport_->send(codec_.buildControlFrame(sequence_, payload));
  ++sequence_;

  std::string message;
  const auto status = transport_->receive(message, config_.session.handshakeTimeout);
  if (status == ReceiveStatus::Timeout) {
    throw AsrError(ErrorCode::ConnectionFailed,
                   fmt::format("No reply to the initial request within {} ms",
                               config_.session.handshakeTimeout.count()));
  }
  if (status == ReceiveStatus::Closed) {
    throw AsrError(ErrorCode::ConnectionFailed,
                   "Connection closed before the initial request was answered");
  }

  const auto frame = codec_.decode(message);
  if (frame.malformed) {
    ++malformedFrames_;
  }
  const auto update = codec_.interpretResponse(frame);
  SPDLOG_DEBUG("Initial response: code={}, payload={}", update.errorCode,
               frame.payload ? frame.payload->dump() : std::string("none"));

  if (update.errorCode != 0) {
    const auto detail = frame.payload ? frame.payload->dump() : frame.body;
    throw AsrError(ErrorCode::HandshakeRejected,
                   fmt::format("Initial request rejected with code {}: {}", update.errorCode,
                               detail),
                   update.errorCode);
  }
}

/**
 * RealtimeSession::sendAudio
 */
void RealtimeSession::sendAudio(std::string_view chunk) {
  if (!acceptingAudio_ || chunk.empty()) {
    return;
  }
  audioQueue_.push(AudioItem(std::string(chunk)));
}

/**
 * RealtimeSession::sendLoop
 * @brief Consumes queued audio and sends it as fixed size segments. The end marker queued by
 *        finish() flushes whatever is buffered as the last frame.
 */
void RealtimeSession::sendLoop() {
  SPDLOG_DEBUG("sendLoop(): start");
  SegmentAccumulator accumulator(segmentSize_);

  try {
    while (!stopRequested_) {
      auto item = audioQueue_.popFor(PollInterval);
      if (!item) {
        if (audioQueue_.stopped()) {
          break;
        }
        continue;
      }

      if (!item->has_value()) {
        sendAudioFrame(accumulator.takeRemainder(), true);
        break;
      }

      accumulator.append(**item);
      while (!stopRequested_) {
        auto next = accumulator.nextSegment();
        if (!next) {
          break;
        }
        sendAudioFrame(*next, false);
      }
    }
  } catch (const AsrError& e) {
    emitError(e.code(), fmt::format("Sending audio failed: {}", e.what()));
  } catch (const std::exception& e) {
    emitError(ErrorCode::ConnectionFailed, fmt::format("Sending audio failed: {}", e.what()));
  }

  SPDLOG_DEBUG("sendLoop(): end");
}

/**
 * RealtimeSession::paceSend
 * @brief Holds frames back so they don't leave faster than real time
 */
void RealtimeSession::paceSend() {
  if (!config_.session.realtimePacing) {
    return;
  }
  {
    std::unique_lock<std::mutex> lock(mutex_);
    stateChanged_.wait_until(lock, nextSendTime_, [this] { return stopRequested_.load(); });
  }
  nextSendTime_ = std::max(nextSendTime_, std::chrono::steady_clock::now()) +
                  config_.session.segmentDuration;
}

/**
 * RealtimeSession::sendAudioFrame
 */
void RealtimeSession::sendAudioFrame(std::string_view segment, bool isLast) {
  paceSend();
  if (stopRequested_) {
    return;
  }

  transport_->send(codec_.buildAudioFrame(sequence_, segment, isLast));
  if (isLast) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      lastFrameSent_ = true;
    }
    stateChanged_.notify_all();
    SPDLOG_INFO("Sent last audio frame, sequence {}, {} bytes", -sequence_, segment.size());
    return;
  }
  SPDLOG_DEBUG("Sent audio frame: seq={}, size={}", sequence_, segment.size());
  ++sequence_;
}

/**
 * RealtimeSession::receiveLoop
 */
void RealtimeSession::receiveLoop() {
  SPDLOG_DEBUG("receiveLoop(): start");

  std::string message;
  while (!stopRequested_) {
    const auto status = transport_->receive(message, PollInterval);
    if (status == ReceiveStatus::Timeout) {
      continue;
    }
    if (status == ReceiveStatus::Closed) {
      if (stopRequested_) {
        break;
      }
      if (state() == SessionState::Finishing) {
        endWithoutFinal();
      } else {
        emitError(ErrorCode::ConnectionFailed,
                  "Connection closed by the server before the final result");
      }
      break;
    }

    handleResponse(message);
    if (isTerminal()) {
      break;
    }
  }

  SPDLOG_DEBUG("receiveLoop(): end");
}

/**
 * RealtimeSession::handleResponse
 * @brief Malformed frames are counted and otherwise treated as an empty update
 */
void RealtimeSession::handleResponse(const std::string& message) {
  const auto frame = codec_.decode(message);
  if (frame.malformed) {
    const auto count = ++malformedFrames_;
    SPDLOG_WARN("Ignoring malformed frame #{} ({} bytes): {}", count, message.size(),
                frame.malformedReason);
    return;
  }

  if ((frame.flags & Flags::HasSequenceBit) != 0) {
    // Transport ordering is trusted, this is only a diagnostic
    if (lastServerSequence_ != 0 && std::abs(frame.sequence) < std::abs(lastServerSequence_)) {
      SPDLOG_WARN("Response sequence went from {} to {}", lastServerSequence_, frame.sequence);
    }
    lastServerSequence_ = frame.sequence;
  }

  const auto update = codec_.interpretResponse(frame);
  SPDLOG_DEBUG("Response: seq={}, last={}, code={}, text=\"{}\"", frame.sequence, update.isLast,
               update.errorCode, update.text);

  if (update.errorCode != 0) {
    const auto detail = frame.payload ? frame.payload->dump() : frame.body;
    emitError(ErrorCode::ServerError,
              fmt::format("Server error {}: {}", update.errorCode, detail), update.errorCode);
    return;
  }
  if (update.hasResult && !update.text.empty()) {
    emitPartial(update.text);
  }
  if (update.isLast) {
    emitFinal(update.text);
  }
}

/**
 * RealtimeSession::emitPartial
 */
void RealtimeSession::emitPartial(const std::string& text) {
  std::lock_guard<std::recursive_mutex> callbackLock(callbackMutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Streaming && state_ != SessionState::Finishing) {
      return;
    }
    text_ = text;
  }

  if (onPartial_) {
    try {
      onPartial_(text);
    } catch (const std::exception& e) {
      SPDLOG_ERROR("Partial result callback threw: {}", e.what());
    }
  }
}

/**
 * RealtimeSession::emitFinal
 * @brief The last response's text, if it has any, becomes the final transcript
 */
void RealtimeSession::emitFinal(const std::string& lastText) {
  std::lock_guard<std::recursive_mutex> callbackLock(callbackMutex_);
  std::string finalText;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Streaming && state_ != SessionState::Finishing) {
      return;
    }
    if (!lastText.empty()) {
      text_ = lastText;
    }
    finalReceived_ = true;
    state_ = SessionState::Done;
    finalText = text_;
  }
  stateChanged_.notify_all();
  acceptingAudio_ = false;
  SPDLOG_INFO("Session {} final result: \"{}\"", requestId_, finalText);
  stopIo();

  if (onFinal_) {
    try {
      onFinal_(finalText);
    } catch (const std::exception& e) {
      SPDLOG_ERROR("Final result callback threw: {}", e.what());
    }
  }
}

/**
 * RealtimeSession::emitError
 */
void RealtimeSession::emitError(ErrorCode code, const std::string& message, int32_t serverCode) {
  std::lock_guard<std::recursive_mutex> callbackLock(callbackMutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isTerminalState(state_)) {
      SPDLOG_DEBUG("Not reporting {} after the session ended: {}", toString(code), message);
      return;
    }
    state_ = SessionState::Error;
  }
  stateChanged_.notify_all();
  acceptingAudio_ = false;
  SPDLOG_ERROR("Session {} failed with {}: {}", requestId_, toString(code), message);
  stopIo();

  if (onError_) {
    try {
      onError_(SessionError{code, serverCode, message});
    } catch (const std::exception& e) {
      SPDLOG_ERROR("Error callback threw: {}", e.what());
    }
  }
}

/**
 * RealtimeSession::endWithoutFinal
 */
void RealtimeSession::endWithoutFinal() {
  std::lock_guard<std::recursive_mutex> callbackLock(callbackMutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Finishing) {
      return;
    }
    state_ = SessionState::Done;
  }
  stateChanged_.notify_all();
  SPDLOG_INFO("Session {} closed by the server without a final frame", requestId_);
  stopIo();
}

/**
 * RealtimeSession::finish
 */
std::string RealtimeSession::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
    case SessionState::Created:
      SPDLOG_INFO("Session {} finished before it was started", requestId_);
      state_ = SessionState::Done;
      acceptingAudio_ = false;
      audioQueue_.stop();
      return text_;
    case SessionState::Connecting:
      SPDLOG_WARN("finish() called on session {} while it is still connecting", requestId_);
      return text_;
    case SessionState::Streaming:
      state_ = SessionState::Finishing;
      break;
    case SessionState::Finishing:
      break;
    case SessionState::Done:
    case SessionState::Error:
    case SessionState::Cancelled:
      if (finalReceived_) {
        SPDLOG_DEBUG("Final result already delivered for session {}", requestId_);
      }
      break;
    }
  }
  stateChanged_.notify_all();

  if (!isTerminal()) {
    acceptingAudio_ = false;
    audioQueue_.push(AudioItem());

    const auto timeout = config_.session.finishTimeout;
    bool completed = false;
    {
      // Paced audio still queued is not recognition latency, the timeout starts after the last frame
      std::unique_lock<std::mutex> lock(mutex_);
      stateChanged_.wait(lock, [this] {
        return lastFrameSent_ || stopRequested_ || isTerminalState(state_);
      });
      SPDLOG_INFO("Session {} finishing, waiting up to {} ms for the final result", requestId_,
                  timeout.count());
      completed = stateChanged_.wait_for(lock, timeout, [this] { return isTerminalState(state_); });
    }
    if (!completed) {
      SPDLOG_WARN("Session {} timed out after {} ms waiting for the final result", requestId_,
                  timeout.count());
      emitError(ErrorCode::RecognitionTimedOut, "Recognition timed out");
    }
  }

  joinThreads();
  auto result = text();
  SPDLOG_INFO("Session {} finished in state {}: \"{}\"", requestId_, toString(state()), result);
  return result;
}

/**
 * RealtimeSession::cancel
 */
void RealtimeSession::cancel() {
  std::lock_guard<std::recursive_mutex> callbackLock(callbackMutex_);
  bool wasActive = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    wasActive = !isTerminalState(state_);
    if (wasActive) {
      state_ = SessionState::Cancelled;
    }
  }
  acceptingAudio_ = false;
  if (wasActive) {
    SPDLOG_INFO("Session {} cancelled by the caller", requestId_);
    stateChanged_.notify_all();
  }
  stopIo();
}

SessionState RealtimeSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string RealtimeSession::text() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return text_;
}

bool RealtimeSession::isTerminal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return isTerminalState(state_);
}

/**
 * RealtimeSession::stopIo
 * @brief Stops both loops and closes the connection, safe to call any number of times
 */
void RealtimeSession::stopIo() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopRequested_ = true;
  }
  stateChanged_.notify_all();
  audioQueue_.stop();
  transport_->close();
}

void RealtimeSession::joinThreads() {
  const auto self = std::this_thread::get_id();
  if (sendThread_.joinable() && sendThread_.get_id() != self) {
    sendThread_.join();
  }
  if (receiveThread_.joinable() && receiveThread_.get_id() != self) {
    receiveThread_.join();
  }
}

} // namespace lungo
