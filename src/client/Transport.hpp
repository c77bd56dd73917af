#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "RequestBuilder.hpp"

namespace lungo {

enum class ReceiveStatus { Message, Timeout, Closed };

/**
 * Transport
 * @brief Full-duplex message channel a session runs over. send() and receive() may be called
 *        concurrently from different threads, close() may be called from any thread.
 */
class Transport {
public:
  virtual ~Transport() = default;

  /// @throws AsrError with ErrorCode::ConnectionFailed
  virtual void connect(const std::string& url, const HeaderList& headers) = 0;

  /// @brief Queues one binary message
  /// @throws AsrError with ErrorCode::ConnectionFailed if the connection is gone
  virtual void send(std::string message) = 0;

  /// @brief Waits up to timeout for the next binary message
  virtual ReceiveStatus receive(std::string& message, std::chrono::milliseconds timeout) = 0;

  /// @brief Idempotent. Wakes up any thread blocked in receive().
  virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

} // namespace lungo
