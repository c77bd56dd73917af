#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "BlockingQueue.hpp"
#include "Transport.hpp"

namespace lungo {

struct WebSocketUrl {
  bool secure = false;
  std::string host;
  std::string port;
  std::string target = "/";

  /// @brief Accepts ws://host[:port][/path] and wss://..., std::nullopt otherwise
  static std::optional<WebSocketUrl> parse(std::string_view url);
};

/**
 * WebSocketTransport
 * @brief Boost.Beast WebSocket client. All socket work happens on one I/O thread: an async read
 *        loop feeds the inbound queue and sends are posted to a write queue on that thread.
 */
class WebSocketTransport : public Transport {
public:
  explicit WebSocketTransport(
      std::chrono::milliseconds connectTimeout = std::chrono::milliseconds(10000));
  WebSocketTransport(const WebSocketTransport&) = delete;
  WebSocketTransport& operator=(const WebSocketTransport&) = delete;
  ~WebSocketTransport() override;

  void connect(const std::string& url, const HeaderList& headers) override;
  void send(std::string message) override;
  ReceiveStatus receive(std::string& message, std::chrono::milliseconds timeout) override;
  void close() override;

  class Connection;

private:
  void runIo();

  std::chrono::milliseconds connectTimeout_;

  boost::asio::io_context ioContext_;
  std::unique_ptr<boost::asio::ssl::context> sslContext_;
  std::unique_ptr<Connection> connection_;
  std::thread ioThread_;
  /// @brief Guards connection_ and ioThread_ while connect() sets them up
  std::mutex lifecycleMutex_;

  std::mutex ioMutex_;
  std::condition_variable ioFinishedCv_;
  bool ioFinished_ = false;

  BlockingQueue<std::string> inbound_;
  std::atomic<bool> closed_ = false;
};

std::unique_ptr<Transport> makeWebSocketTransport();

} // namespace lungo
