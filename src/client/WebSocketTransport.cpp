#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <deque>
#include <future>
#include <type_traits>

#include "AsrError.hpp"
#include "WebSocketTransport.hpp"

namespace lungo {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {
constexpr std::string_view UserAgent = "lungo-client";
/// @brief How long close() lets the close handshake run before tearing the I/O thread down
constexpr auto CloseGracePeriod = std::chrono::milliseconds(500);
/// @brief How often connect() checks whether close() was called meanwhile
constexpr auto ConnectPollInterval = std::chrono::milliseconds(50);
} // namespace

/**
 * WebSocketUrl::parse
 */
std::optional<WebSocketUrl> WebSocketUrl::parse(std::string_view url) {
  WebSocketUrl result;
  constexpr std::string_view plainScheme = "ws://";
  constexpr std::string_view secureScheme = "wss://";

  if (url.substr(0, secureScheme.size()) == secureScheme) {
    result.secure = true;
    url.remove_prefix(secureScheme.size());
  } else if (url.substr(0, plainScheme.size()) == plainScheme) {
    url.remove_prefix(plainScheme.size());
  } else {
    return std::nullopt;
  }

  const auto slash = url.find('/');
  auto authority = url.substr(0, slash);
  if (slash != std::string_view::npos) {
    result.target = std::string(url.substr(slash));
  }

  const auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    result.port = std::string(authority.substr(colon + 1));
    authority = authority.substr(0, colon);
    if (result.port.empty() ||
        result.port.find_first_not_of("0123456789") != std::string::npos) {
      return std::nullopt;
    }
  } else {
    result.port = result.secure ? "443" : "80";
  }

  if (authority.empty()) {
    return std::nullopt;
  }
  result.host = std::string(authority);
  return result;
}

/**
 * WebSocketTransport::Connection
 * @brief Stream specific half of the transport. Every member function runs on the I/O thread.
 */
class WebSocketTransport::Connection {
public:
  virtual ~Connection() = default;
  virtual std::future<void> start(const WebSocketUrl& url, const HeaderList& headers) = 0;
  virtual void write(std::string message) = 0;
  virtual void close() = 0;
};

namespace {

using PlainStream = beast::tcp_stream;
using SecureStream = beast::ssl_stream<beast::tcp_stream>;

template <class NextLayer>
class StreamConnection : public WebSocketTransport::Connection {
public:
  template <class... Args>
  StreamConnection(BlockingQueue<std::string>& inbound, net::io_context& ioContext,
                   Args&&... streamArgs)
      : inbound_(inbound), resolver_(ioContext), ws_(ioContext, std::forward<Args>(streamArgs)...) {
  }

  std::future<void> start(const WebSocketUrl& url, const HeaderList& headers) override {
    url_ = url;
    headers_ = headers;
    auto ready = ready_.get_future();
    resolver_.async_resolve(url_.host, url_.port,
                            [this](beast::error_code ec, tcp::resolver::results_type results) {
                              onResolve(ec, std::move(results));
                            });
    return ready;
  }

  void write(std::string message) override {
    if (!open_ || closing_) {
      SPDLOG_WARN("Dropping {} byte message, the connection is not open", message.size());
      return;
    }
    writeQueue_.push_back(std::move(message));
    if (!writing_) {
      doWrite();
    }
  }

  void close() override {
    if (closing_) {
      return;
    }
    closing_ = true;

    if (!open_) {
      // Still connecting, or the peer already went away
      resolver_.cancel();
      beast::close_socket(beast::get_lowest_layer(ws_));
      if (!startReported_) {
        failStart("connection closed while connecting");
      }
      return;
    }
    if (writing_) {
      // Let the write in flight finish, forget the rest
      while (writeQueue_.size() > 1) {
        writeQueue_.pop_back();
      }
      closeAfterWrite_ = true;
      return;
    }
    doClose();
  }

private:
  void onResolve(beast::error_code ec, const tcp::resolver::results_type& results) {
    if (ec) {
      return failStart(fmt::format("could not resolve {}: {}", url_.host, ec.message()));
    }
    SPDLOG_INFO("Resolved {}, connecting to port {}...", url_.host, url_.port);
    beast::get_lowest_layer(ws_).async_connect(
        results, [this](beast::error_code ec, const tcp::resolver::results_type::endpoint_type&) {
          onConnect(ec);
        });
  }

  void onConnect(beast::error_code ec) {
    if (ec) {
      return failStart(fmt::format("could not connect to {}:{}: {}", url_.host, url_.port,
                                   ec.message()));
    }

    if constexpr (std::is_same_v<NextLayer, SecureStream>) {
      // SNI, most TLS front ends refuse the handshake without it
      if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str())) {
        return failStart(fmt::format("could not set SNI host name {}", url_.host));
      }
      ws_.next_layer().set_verify_callback(ssl::host_name_verification(url_.host));
      ws_.next_layer().async_handshake(ssl::stream_base::client, [this](beast::error_code ec) {
        if (ec) {
          return failStart(fmt::format("TLS handshake failed: {}", ec.message()));
        }
        doUpgrade();
      });
    } else {
      doUpgrade();
    }
  }

  void doUpgrade() {
    // The websocket stream has its own timeouts from here on
    beast::get_lowest_layer(ws_).expires_never();

    websocket::stream_base::timeout timeouts{};
    timeouts.handshake_timeout = std::chrono::seconds(5);
    timeouts.idle_timeout = websocket::stream_base::none();
    timeouts.keep_alive_pings = false;
    ws_.set_option(timeouts);

    ws_.set_option(websocket::stream_base::decorator([headers = headers_](
                                                         websocket::request_type& req) {
      req.set(http::field::user_agent, std::string(UserAgent));
      for (const auto& [name, value] : headers) {
        req.set(name, value);
      }
    }));

    const auto hostHeader = url_.host + ":" + url_.port;
    ws_.async_handshake(hostHeader, url_.target, [this](beast::error_code ec) {
      if (ec) {
        return failStart(fmt::format("WebSocket upgrade of {} failed: {}", url_.target,
                                     ec.message()));
      }
      ws_.binary(true);
      open_ = true;
      SPDLOG_INFO("WebSocket connected to {}{}", url_.host, url_.target);
      startReported_ = true;
      ready_.set_value();

      if (closing_) {
        // close() raced the handshake
        closing_ = false;
        close();
        return;
      }
      doRead();
    });
  }

  void failStart(const std::string& reason) {
    SPDLOG_ERROR("{}", reason);
    inbound_.stop();
    if (!startReported_) {
      startReported_ = true;
      ready_.set_exception(
          std::make_exception_ptr(AsrError(ErrorCode::ConnectionFailed, reason)));
    }
  }

  void doRead() {
    ws_.async_read(buffer_, [this](beast::error_code ec, size_t bytesRead) {
      if (ec) {
        if (ec == websocket::error::closed) {
          SPDLOG_INFO("WebSocket closed by peer, reason:\"{}\"", ws_.reason().reason.c_str());
        } else if (ec != net::error::operation_aborted) {
          SPDLOG_WARN("WebSocket read failed: {}", ec.message());
        }
        open_ = false;
        inbound_.stop();
        return;
      }

      if (ws_.got_text()) {
        SPDLOG_WARN("Ignoring {} byte text message", bytesRead);
      } else if (!inbound_.push(beast::buffers_to_string(buffer_.data()))) {
        SPDLOG_DEBUG("Inbound queue is stopped, dropping {} byte message", bytesRead);
      }
      buffer_.consume(buffer_.size());
      doRead();
    });
  }

  void doWrite() {
    writing_ = true;
    ws_.async_write(net::buffer(writeQueue_.front()), [this](beast::error_code ec, size_t) {
      writeQueue_.pop_front();
      if (ec) {
        SPDLOG_ERROR("WebSocket write failed: {}", ec.message());
        writing_ = false;
        writeQueue_.clear();
        open_ = false;
        inbound_.stop();
        beast::close_socket(beast::get_lowest_layer(ws_));
        return;
      }
      if (!writeQueue_.empty()) {
        doWrite();
        return;
      }
      writing_ = false;
      if (closeAfterWrite_) {
        closeAfterWrite_ = false;
        doClose();
      }
    });
  }

  void doClose() {
    SPDLOG_DEBUG("Sending WebSocket close");
    ws_.async_close(websocket::close_code::normal, [this](beast::error_code ec) {
      if (ec) {
        SPDLOG_DEBUG("WebSocket close finished with: {}", ec.message());
      }
      open_ = false;
      inbound_.stop();
    });
  }

  BlockingQueue<std::string>& inbound_;
  tcp::resolver resolver_;
  websocket::stream<NextLayer> ws_;
  beast::flat_buffer buffer_;

  WebSocketUrl url_;
  HeaderList headers_;
  std::promise<void> ready_;
  bool startReported_ = false;

  std::deque<std::string> writeQueue_;
  bool open_ = false;
  bool writing_ = false;
  bool closing_ = false;
  bool closeAfterWrite_ = false;
};

} // namespace

/**
 * WebSocketTransport::WebSocketTransport
 */
WebSocketTransport::WebSocketTransport(std::chrono::milliseconds connectTimeout)
    : connectTimeout_(connectTimeout) {}

/**
 * WebSocketTransport::~WebSocketTransport
 */
WebSocketTransport::~WebSocketTransport() {
  close();
  if (ioThread_.joinable()) {
    ioThread_.join();
  }
}

/**
 * WebSocketTransport::connect
 */
void WebSocketTransport::connect(const std::string& url, const HeaderList& headers) {
  const auto parsedUrl = WebSocketUrl::parse(url);
  if (!parsedUrl) {
    SPDLOG_ERROR("Invalid WebSocket url {}", url);
    throw AsrError(ErrorCode::ConnectionFailed, fmt::format("Invalid WebSocket url {}", url));
  }

  std::future<void> ready;
  {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (connection_) {
      throw AsrError(ErrorCode::ConnectionFailed, "Transport is already connected");
    }
    if (closed_) {
      throw AsrError(ErrorCode::ConnectionFailed, "Transport was closed before connecting");
    }

    if (parsedUrl->secure) {
      try {
        sslContext_ = std::make_unique<ssl::context>(ssl::context::tls_client);
      } catch (const boost::system::system_error& e) {
        throw AsrError(ErrorCode::ConnectionFailed,
                       fmt::format("Could not create a TLS context: {}", e.what()));
      }
      boost::system::error_code ec;
      sslContext_->set_default_verify_paths(ec);
      if (!ec) {
        sslContext_->set_verify_mode(ssl::verify_peer, ec);
      }
      if (ec) {
        throw AsrError(ErrorCode::ConnectionFailed,
                       fmt::format("Could not set up TLS verification: {}", ec.message()));
      }
      connection_ = std::make_unique<StreamConnection<SecureStream>>(inbound_, ioContext_,
                                                                      *sslContext_);
    } else {
      connection_ = std::make_unique<StreamConnection<PlainStream>>(inbound_, ioContext_);
    }

    SPDLOG_INFO("Attempting to connect to {}...", url);
    ready = connection_->start(*parsedUrl, headers);
    ioThread_ = std::thread(&WebSocketTransport::runIo, this);
  }

  // close() from another thread may stop the I/O thread before the promise is fulfilled
  const auto deadline = std::chrono::steady_clock::now() + connectTimeout_;
  while (ready.wait_for(ConnectPollInterval) != std::future_status::ready) {
    if (closed_) {
      throw AsrError(ErrorCode::ConnectionFailed, "Transport was closed while connecting");
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      SPDLOG_ERROR("Timed out after {} ms connecting to {}", connectTimeout_.count(), url);
      close();
      throw AsrError(ErrorCode::ConnectionFailed,
                     fmt::format("Timed out connecting to {}", parsedUrl->host));
    }
  }
  try {
    ready.get();
  } catch (const AsrError&) {
    close();
    throw;
  }
}

/**
 * WebSocketTransport::runIo
 */
void WebSocketTransport::runIo() {
  SPDLOG_DEBUG("I/O thread starting");
  try {
    ioContext_.run();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("I/O thread caught std::exception: {}", e.what());
    inbound_.stop();
  }
  {
    std::lock_guard<std::mutex> lock(ioMutex_);
    ioFinished_ = true;
  }
  ioFinishedCv_.notify_all();
  SPDLOG_DEBUG("I/O thread exiting");
}

/**
 * WebSocketTransport::send
 */
void WebSocketTransport::send(std::string message) {
  if (closed_ || !connection_ || inbound_.stopped()) {
    throw AsrError(ErrorCode::ConnectionFailed, "WebSocket connection is closed");
  }
  net::post(ioContext_, [this, message = std::move(message)]() mutable {
    connection_->write(std::move(message));
  });
}

/**
 * WebSocketTransport::receive
 */
ReceiveStatus WebSocketTransport::receive(std::string& message,
                                          std::chrono::milliseconds timeout) {
  auto next = inbound_.popFor(timeout);
  if (next) {
    message = std::move(*next);
    return ReceiveStatus::Message;
  }
  return inbound_.stopped() ? ReceiveStatus::Closed : ReceiveStatus::Timeout;
}

/**
 * WebSocketTransport::close
 * @brief Starts the close handshake and waits briefly for it, then stops the I/O thread
 */
void WebSocketTransport::close() {
  if (closed_.exchange(true)) {
    return;
  }
  inbound_.stop();
  {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!ioThread_.joinable()) {
      return;
    }
    net::post(ioContext_, [this] { connection_->close(); });
  }

  if (std::this_thread::get_id() == ioThread_.get_id()) {
    // Called from a handler, the destructor joins
    return;
  }
  {
    std::unique_lock<std::mutex> lock(ioMutex_);
    if (!ioFinishedCv_.wait_for(lock, CloseGracePeriod, [this] { return ioFinished_; })) {
      SPDLOG_WARN("Close handshake did not finish in {} ms, stopping I/O",
                  CloseGracePeriod.count());
    }
  }
  ioContext_.stop();
  ioThread_.join();
}

std::unique_ptr<Transport> makeWebSocketTransport() {
  return std::make_unique<WebSocketTransport>();
}

} // namespace lungo
