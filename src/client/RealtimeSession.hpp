#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "AsrError.hpp"
#include "AudioFormat.hpp"
#include "BlockingQueue.hpp"
#include "ClientConfig.hpp"
#include "FrameCodec.hpp"
#include "Transport.hpp"

namespace lungo {

enum class SessionState { Created, Connecting, Streaming, Finishing, Done, Error, Cancelled };

std::string_view toString(SessionState state) noexcept;

using PartialCallback = std::function<void(const std::string&)>;
using FinalCallback = std::function<void(const std::string&)>;
using ErrorCallback = std::function<void(const SessionError&)>;

/**
 * RealtimeSession
 * @brief One full-duplex recognition exchange over its own connection.
 *
 * start() connects and performs the handshake, then a sender thread turns queued audio into
 * paced audio frames while a receiver thread maps server responses onto the callbacks.
 * finish() flushes the remaining audio as the last frame and waits (bounded) for the final
 * transcript. cancel() tears everything down, no callback fires once it has returned.
 *
 * Callbacks run on the session's threads (the receiver, or the caller of finish() on timeout).
 * onFinal and onError fire at most once each and never both. Destroying the session from inside
 * one of its callbacks is not supported.
 */
class RealtimeSession {
public:
  RealtimeSession(ClientConfig config, AudioFormat format, std::string language,
                  std::unique_ptr<Transport> transport, PartialCallback onPartial = {},
                  FinalCallback onFinal = {}, ErrorCallback onError = {});
  RealtimeSession(const RealtimeSession&) = delete;
  RealtimeSession(RealtimeSession&&) = delete;
  RealtimeSession& operator=(const RealtimeSession&) = delete;
  virtual ~RealtimeSession();

  /// @brief Blocks until the server accepted the initial request
  /// @throws AsrError with ErrorCode::ConnectionFailed or ErrorCode::HandshakeRejected
  void start();

  /// @brief Queues PCM for the sender thread. Never blocks, ignored after finish() or cancel().
  void sendAudio(std::string_view chunk);
  void sendAudio(const std::vector<char>& chunk) {
    sendAudio(std::string_view(chunk.data(), chunk.size()));
  }

  /// @brief Ends the audio stream and waits for the final transcript
  /// @return Last known transcript, empty if none was ever produced
  std::string finish();

  /// @brief Immediate and idempotent
  void cancel();

  [[nodiscard]] SessionState state() const;
  [[nodiscard]] std::string text() const;
  [[nodiscard]] const std::string& requestId() const noexcept { return requestId_; }
  [[nodiscard]] size_t malformedFrameCount() const noexcept { return malformedFrames_.load(); }
  [[nodiscard]] size_t segmentSizeBytes() const noexcept { return segmentSize_; }

private:
  /// @brief An empty optional in the audio queue marks the end of the stream
  using AudioItem = std::optional<std::string>;

  void handshake();
  void sendLoop();
  void receiveLoop();
  void sendAudioFrame(std::string_view segment, bool isLast);
  void handleResponse(const std::string& message);
  void paceSend();

  void emitPartial(const std::string& text);
  void emitFinal(const std::string& lastText);
  void emitError(ErrorCode code, const std::string& message, int32_t serverCode = 0);
  /// @brief Ends the session quietly when the receive loop stops without a final frame
  void endWithoutFinal();

  [[nodiscard]] bool isTerminal() const;
  void stopIo();
  void joinThreads();

  ClientConfig config_;
  AudioFormat format_;
  std::string language_;
  std::string requestId_;
  FrameCodec codec_;
  size_t segmentSize_;

  std::unique_ptr<Transport> transport_;
  PartialCallback onPartial_;
  FinalCallback onFinal_;
  ErrorCallback onError_;

  /// @brief Guards state_, text_, finalReceived_ and lastFrameSent_
  mutable std::mutex mutex_;
  std::condition_variable stateChanged_;
  SessionState state_ = SessionState::Created;
  std::string text_;
  bool finalReceived_ = false;
  bool lastFrameSent_ = false;

  /// @brief Serializes callbacks against each other and against cancel()
  std::recursive_mutex callbackMutex_;

  BlockingQueue<AudioItem> audioQueue_;
  std::atomic<bool> acceptingAudio_ = true;
  std::atomic<bool> stopRequested_ = false;
  std::atomic<size_t> malformedFrames_ = 0;

  /// @brief Only touched by the thread sending frames
  int32_t sequence_ = 1;
  std::chrono::steady_clock::time_point nextSendTime_;
  /// @brief Only touched by the receiver thread
  int32_t lastServerSequence_ = 0;

  std::thread sendThread_;
  std::thread receiveThread_;
};

} // namespace lungo
