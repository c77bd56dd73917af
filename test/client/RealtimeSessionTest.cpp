#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "AsrClient.hpp"
#include "FakeTransport.hpp"
#include "RealtimeSession.hpp"

using namespace std::chrono_literals;
using TestUtils::FakeServer;
using TestUtils::FakeTransport;

namespace {

/// @brief Thread-safe record of every callback a session made
struct CallbackLog {
  std::mutex mutex;
  std::vector<std::string> partials;
  std::vector<std::string> finals;
  std::vector<lungo::SessionError> errors;

  lungo::PartialCallback onPartial() {
    return [this](const std::string& text) {
      std::lock_guard<std::mutex> lock(mutex);
      partials.push_back(text);
    };
  }
  lungo::FinalCallback onFinal() {
    return [this](const std::string& text) {
      std::lock_guard<std::mutex> lock(mutex);
      finals.push_back(text);
    };
  }
  lungo::ErrorCallback onError() {
    return [this](const lungo::SessionError& error) {
      std::lock_guard<std::mutex> lock(mutex);
      errors.push_back(error);
    };
  }
  size_t partialCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return partials.size();
  }
  size_t callbackCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return partials.size() + finals.size() + errors.size();
  }
};

lungo::ClientConfig testConfig(const lungo::ProtocolVariant& variant = lungo::BigModelVariant) {
  lungo::ClientConfig config;
  config.serverUrl = "ws://127.0.0.1:5050/asr";
  config.variant = variant;
  config.credentials.appKey = "test-app-key";
  config.credentials.accessKey = "test-access-key";
  config.session.realtimePacing = false;
  config.session.finishTimeout = 2000ms;
  config.session.handshakeTimeout = 1000ms;
  return config;
}

std::unique_ptr<lungo::RealtimeSession> makeSession(const lungo::ClientConfig& config,
                                                    std::shared_ptr<FakeServer> server,
                                                    CallbackLog& log) {
  return std::make_unique<lungo::RealtimeSession>(
      config, config.audio, "zh-CN", std::make_unique<FakeTransport>(std::move(server)),
      log.onPartial(), log.onFinal(), log.onError());
}

/// @brief Feeds audio in 100 ms chunks, roughly what a capture device does
void feed(lungo::RealtimeSession& session, size_t totalBytes, size_t chunkBytes = 3200) {
  const std::string chunk(chunkBytes, '\x01');
  size_t sent = 0;
  while (sent < totalBytes) {
    const auto size = std::min(chunkBytes, totalBytes - sent);
    session.sendAudio(std::string_view(chunk.data(), size));
    sent += size;
  }
}

bool waitFor(const std::function<bool()>& condition,
             std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(10ms);
  }
  return condition();
}

bool isControl(const lungo::ParsedFrame& frame) {
  return frame.messageType == lungo::MessageType::ClientFullRequest;
}

/// @brief Accepts the session, echoes "你好" per audio frame and finishes with "你好，世界"
void helloWorldScript(FakeServer& server, const lungo::ParsedFrame& frame) {
  if (isControl(frame)) {
    server.respond("");
  } else if (frame.isLast) {
    server.respond("你好，世界", true);
  } else {
    server.respondJson(nlohmann::json::parse(R"({"result":[{"text":"你好"}]})"));
  }
}

} // namespace

// @test 3 seconds of 16 kHz mono audio produce partials and the final transcript
TEST(RealtimeSessionTest, EndToEnd) {
  auto server = std::make_shared<FakeServer>();
  server->setScript(helloWorldScript);
  const auto config = testConfig();
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  EXPECT_EQ(session->state(), lungo::SessionState::Streaming);
  feed(*session, 3 * config.audio.bytesPerSecond());
  const auto transcript = session->finish();

  EXPECT_EQ(transcript, "你好，世界");
  EXPECT_EQ(session->state(), lungo::SessionState::Done);
  auto expectedPartials = std::vector<std::string>(15, "你好");
  expectedPartials.push_back("你好，世界");
  EXPECT_EQ(log.partials, expectedPartials);
  EXPECT_EQ(log.finals, std::vector<std::string>{"你好，世界"});
  EXPECT_TRUE(log.errors.empty());
  EXPECT_EQ(session->malformedFrameCount(), 0);
}

// @test The text carried by the last response is reported as a partial before the final result
TEST(RealtimeSessionTest, LastResponseTextReachesOnPartial) {
  auto server = std::make_shared<FakeServer>();
  server->setScript(helloWorldScript);
  const auto config = testConfig();
  std::vector<std::string> order;
  std::mutex orderMutex;
  auto session = std::make_unique<lungo::RealtimeSession>(
      config, config.audio, "zh-CN", std::make_unique<FakeTransport>(server),
      [&](const std::string& text) {
        std::lock_guard<std::mutex> lock(orderMutex);
        order.push_back("partial:" + text);
      },
      [&](const std::string& text) {
        std::lock_guard<std::mutex> lock(orderMutex);
        order.push_back("final:" + text);
      },
      nullptr);

  session->start();
  feed(*session, session->segmentSizeBytes());
  EXPECT_EQ(session->finish(), "你好，世界");

  std::lock_guard<std::mutex> lock(orderMutex);
  EXPECT_THAT(order, ::testing::ElementsAre("partial:你好", "partial:你好，世界",
                                            "final:你好，世界"));
}

// @test Queued audio is paced out before the finish timeout starts counting
TEST(RealtimeSessionTest, FinishTimeoutStartsAfterLastFrame) {
  auto server = std::make_shared<FakeServer>();
  server->setScript([](FakeServer& s, const lungo::ParsedFrame& frame) {
    if (isControl(frame)) {
      s.respond("");
    } else if (frame.isLast) {
      s.respond("done", true);
    } else {
      s.respond("p");
    }
  });
  auto config = testConfig();
  config.session.realtimePacing = true;
  config.session.finishTimeout = 1000ms;
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  // Two seconds of audio take two seconds to send, longer than the finish timeout
  feed(*session, 2 * config.audio.bytesPerSecond());
  const auto transcript = session->finish();

  EXPECT_EQ(transcript, "done");
  EXPECT_EQ(session->state(), lungo::SessionState::Done);
  EXPECT_EQ(log.finals, std::vector<std::string>{"done"});
  EXPECT_TRUE(log.errors.empty());
  EXPECT_EQ(server->audioFrames().size(), 11);
}

// @test Audio sequence numbers count up from 2 and only the last frame is negative
TEST(RealtimeSessionTest, SequenceNumbersIncrease) {
  auto server = std::make_shared<FakeServer>();
  server->setScript(helloWorldScript);
  const auto config = testConfig();
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  feed(*session, 3 * config.audio.bytesPerSecond());
  session->finish();

  const auto frames = server->frames();
  ASSERT_FALSE(frames.empty());
  EXPECT_TRUE(isControl(frames.front()));
  EXPECT_EQ(frames.front().sequence, 1);
  ASSERT_TRUE(frames.front().payload.has_value());
  EXPECT_EQ((*frames.front().payload)["audio"]["rate"], 16000);

  const auto audio = server->audioFrames();
  // 15 full segments of 200 ms, then an empty last frame
  ASSERT_EQ(audio.size(), 16);
  for (size_t i = 0; i < audio.size(); ++i) {
    const auto expected = static_cast<int32_t>(i + 2);
    if (i + 1 < audio.size()) {
      EXPECT_EQ(audio[i].sequence, expected);
      EXPECT_FALSE(audio[i].isLast);
      EXPECT_EQ(audio[i].body.size(), session->segmentSizeBytes());
    } else {
      EXPECT_EQ(audio[i].sequence, -expected);
      EXPECT_TRUE(audio[i].isLast);
      EXPECT_TRUE(audio[i].body.empty());
    }
  }
}

// @test Audio that doesn't fill the last segment is sent with the last frame
TEST(RealtimeSessionTest, RemainderSentAsLastFrame) {
  auto server = std::make_shared<FakeServer>();
  server->setScript(helloWorldScript);
  const auto config = testConfig();
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  feed(*session, session->segmentSizeBytes() * 2 + 1000, 777);
  session->finish();

  const auto audio = server->audioFrames();
  ASSERT_EQ(audio.size(), 3);
  EXPECT_EQ(audio[2].sequence, -4);
  EXPECT_EQ(audio[2].body.size(), 1000);
}

// @test Connection headers carry the request id and credentials
TEST(RealtimeSessionTest, BigModelHeaders) {
  auto server = std::make_shared<FakeServer>();
  server->setScript(helloWorldScript);
  const auto config = testConfig();
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();

  EXPECT_EQ(server->url(), config.serverUrl);
  EXPECT_THAT(server->headers(),
              ::testing::Contains(std::make_pair(std::string("X-Api-Request-Id"),
                                                 session->requestId())));
  EXPECT_THAT(server->headers(),
              ::testing::Contains(std::make_pair(std::string("X-Api-App-Key"),
                                                 std::string("test-app-key"))));
  session->cancel();
}

// @test The legacy protocol sends no sequence numbers and signals the end in the payload
TEST(RealtimeSessionTest, LegacyEndToEnd) {
  auto server = std::make_shared<FakeServer>(lungo::LegacyVariant);
  int32_t responses = 1;
  server->setScript([&responses](FakeServer& s, const lungo::ParsedFrame& frame) {
    if (isControl(frame)) {
      s.respondJson({{"code", 1000}, {"sequence", responses}});
    } else if (frame.isLast) {
      auto payload = nlohmann::json::parse(R"({"code":1000,"result":[{"text":"hello world"}]})");
      payload["sequence"] = -(++responses);
      s.respondJson(payload);
    } else {
      auto payload = nlohmann::json::parse(R"({"code":1000,"result":[{"text":"hello"}]})");
      payload["sequence"] = ++responses;
      s.respondJson(payload);
    }
  });
  const auto config = testConfig(lungo::LegacyVariant);
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  feed(*session, config.audio.bytesPerSecond());
  const auto transcript = session->finish();

  EXPECT_EQ(transcript, "hello world");
  EXPECT_EQ(log.finals, std::vector<std::string>{"hello world"});
  EXPECT_TRUE(log.errors.empty());

  EXPECT_THAT(server->headers(),
              ::testing::ElementsAre(std::make_pair(std::string("Authorization"),
                                                    std::string("Bearer; test-access-key"))));
  const auto control = server->frames().front();
  ASSERT_TRUE(control.payload.has_value());
  EXPECT_EQ((*control.payload)["app"]["appid"], "test-app-key");
  EXPECT_EQ((*control.payload)["request"]["reqid"], session->requestId());

  const auto audio = server->audioFrames();
  ASSERT_EQ(audio.size(), 6);
  for (size_t i = 0; i < audio.size(); ++i) {
    EXPECT_EQ(audio[i].sequence, 0);
    EXPECT_EQ(audio[i].isLast, i + 1 == audio.size());
  }
  EXPECT_EQ(audio.back().flags, lungo::Flags::NegSequence);
}

// @test Duplicate final frames and a late error still produce exactly one onFinal
TEST(RealtimeSessionTest, FinalDeliveredOnce) {
  auto server = std::make_shared<FakeServer>();
  server->setScript([](FakeServer& s, const lungo::ParsedFrame& frame) {
    if (isControl(frame)) {
      s.respond("");
    } else if (frame.isLast) {
      s.respond("done", true);
      s.respond("done again", true);
      s.respondError(45000000, "late error");
    } else {
      s.respond("partial");
    }
  });
  const auto config = testConfig();
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  feed(*session, config.audio.bytesPerSecond());
  EXPECT_EQ(session->finish(), "done");
  std::this_thread::sleep_for(200ms);

  EXPECT_EQ(log.finals, std::vector<std::string>{"done"});
  EXPECT_TRUE(log.errors.empty());
}

// @test A server error mid-stream is reported once and nothing is delivered afterwards
TEST(RealtimeSessionTest, ServerErrorMidStream) {
  auto server = std::make_shared<FakeServer>();
  server->setScript([](FakeServer& s, const lungo::ParsedFrame& frame) {
    if (isControl(frame)) {
      s.respond("");
    } else if (frame.sequence == 2) {
      s.respond("你好");
    } else if (frame.sequence == 3) {
      s.respondError(45000081, "decode failed");
      s.respondError(45000081, "decode failed");
      s.respond("too late", true);
    }
  });
  const auto config = testConfig();
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  feed(*session, config.audio.bytesPerSecond());
  ASSERT_TRUE(waitFor([&session] { return session->state() == lungo::SessionState::Error; }));
  // Ignored once the session has failed
  feed(*session, config.audio.bytesPerSecond());
  const auto transcript = session->finish();

  EXPECT_EQ(transcript, "你好");
  EXPECT_EQ(session->state(), lungo::SessionState::Error);
  EXPECT_EQ(log.partials, std::vector<std::string>{"你好"});
  EXPECT_TRUE(log.finals.empty());
  ASSERT_EQ(log.errors.size(), 1);
  EXPECT_EQ(log.errors.front().code, lungo::ErrorCode::ServerError);
  EXPECT_EQ(log.errors.front().serverCode, 45000081);
  EXPECT_LE(server->audioFrames().size(), 5);
}

// @test Calling finish() again after the final result returns the same text and fires nothing
TEST(RealtimeSessionTest, FinishIsIdempotent) {
  auto server = std::make_shared<FakeServer>();
  server->setScript(helloWorldScript);
  const auto config = testConfig();
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  feed(*session, config.audio.bytesPerSecond());
  const auto first = session->finish();
  const auto second = session->finish();

  EXPECT_EQ(first, "你好，世界");
  EXPECT_EQ(second, first);
  EXPECT_EQ(log.finals.size(), 1);
  EXPECT_TRUE(log.errors.empty());
  EXPECT_EQ(session->state(), lungo::SessionState::Done);
}

// @test A server that never sends the final frame makes finish() give up within its timeout
TEST(RealtimeSessionTest, FinishTimesOut) {
  auto server = std::make_shared<FakeServer>();
  server->setScript([](FakeServer& s, const lungo::ParsedFrame& frame) {
    if (isControl(frame)) {
      s.respond("");
    } else if (!frame.isLast) {
      s.respond("partial");
    }
  });
  auto config = testConfig();
  config.session.finishTimeout = 300ms;
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  feed(*session, session->segmentSizeBytes());
  ASSERT_TRUE(waitFor([&log] { return log.partialCount() == 1; }));

  const auto begin = std::chrono::steady_clock::now();
  const auto transcript = session->finish();
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_EQ(transcript, "partial");
  EXPECT_GE(elapsed, 250ms);
  EXPECT_LT(elapsed, 2000ms);
  EXPECT_EQ(session->state(), lungo::SessionState::Error);
  ASSERT_EQ(log.errors.size(), 1);
  EXPECT_EQ(log.errors.front().code, lungo::ErrorCode::RecognitionTimedOut);
  EXPECT_TRUE(log.finals.empty());

  EXPECT_EQ(session->finish(), "partial");
  EXPECT_EQ(log.errors.size(), 1);
}

// @test Nothing is delivered once cancel() returns, and cancelling twice is harmless
TEST(RealtimeSessionTest, CancelStopsCallbacks) {
  auto server = std::make_shared<FakeServer>();
  server->setScript([](FakeServer& s, const lungo::ParsedFrame& frame) {
    if (isControl(frame)) {
      s.respond("");
    } else {
      s.respond("partial");
    }
  });
  const auto config = testConfig();
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  feed(*session, session->segmentSizeBytes());
  ASSERT_TRUE(waitFor([&log] { return log.partialCount() == 1; }));

  session->cancel();
  const auto callbacksAtCancel = log.callbackCount();
  EXPECT_EQ(session->state(), lungo::SessionState::Cancelled);

  session->cancel();
  feed(*session, session->segmentSizeBytes());
  server->respond("late final", true);
  std::this_thread::sleep_for(200ms);

  EXPECT_EQ(session->finish(), "partial");
  EXPECT_EQ(log.callbackCount(), callbacksAtCancel);
  EXPECT_TRUE(log.finals.empty());
  EXPECT_TRUE(log.errors.empty());
  EXPECT_EQ(session->state(), lungo::SessionState::Cancelled);
  EXPECT_EQ(server->clientCloseCount(), 1);
  EXPECT_EQ(server->audioFrames().size(), 1);
}

// @test Cancelling after the session completed keeps the result
TEST(RealtimeSessionTest, CancelAfterDone) {
  auto server = std::make_shared<FakeServer>();
  server->setScript(helloWorldScript);
  const auto config = testConfig();
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  feed(*session, session->segmentSizeBytes());
  session->finish();
  session->cancel();

  EXPECT_EQ(session->state(), lungo::SessionState::Done);
  EXPECT_EQ(session->text(), "你好，世界");
}

TEST(RealtimeSessionTest, HandshakeRejected) {
  auto server = std::make_shared<FakeServer>();
  server->setScript([](FakeServer& s, const lungo::ParsedFrame& frame) {
    if (isControl(frame)) {
      s.respondError(45000001, "invalid request");
    }
  });
  CallbackLog log;
  auto session = makeSession(testConfig(), server, log);

  try {
    session->start();
    FAIL() << "start() should have thrown";
  } catch (const lungo::AsrError& e) {
    EXPECT_EQ(e.code(), lungo::ErrorCode::HandshakeRejected);
    EXPECT_EQ(e.serverCode(), 45000001);
  }
  EXPECT_EQ(session->state(), lungo::SessionState::Error);
  EXPECT_TRUE(server->audioFrames().empty());
  EXPECT_EQ(log.callbackCount(), 0);
}

// @test On the legacy endpoint a payload code other than 1000 rejects the session
TEST(RealtimeSessionTest, LegacyHandshakeRejected) {
  auto server = std::make_shared<FakeServer>(lungo::LegacyVariant);
  server->setScript([](FakeServer& s, const lungo::ParsedFrame& frame) {
    if (isControl(frame)) {
      s.respondJson({{"code", 1001}, {"message", "invalid appid"}});
    }
  });
  CallbackLog log;
  auto session = makeSession(testConfig(lungo::LegacyVariant), server, log);

  try {
    session->start();
    FAIL() << "start() should have thrown";
  } catch (const lungo::AsrError& e) {
    EXPECT_EQ(e.code(), lungo::ErrorCode::HandshakeRejected);
    EXPECT_EQ(e.serverCode(), 1001);
  }
}

TEST(RealtimeSessionTest, ConnectionRefused) {
  auto server = std::make_shared<FakeServer>();
  server->refuseConnection();
  CallbackLog log;
  auto session = makeSession(testConfig(), server, log);

  try {
    session->start();
    FAIL() << "start() should have thrown";
  } catch (const lungo::AsrError& e) {
    EXPECT_EQ(e.code(), lungo::ErrorCode::ConnectionFailed);
  }
  EXPECT_EQ(session->state(), lungo::SessionState::Error);
  EXPECT_TRUE(server->frames().empty());
  EXPECT_EQ(log.callbackCount(), 0);
}

// @test A server that never answers the initial request is a connection failure
TEST(RealtimeSessionTest, HandshakeTimesOut) {
  auto server = std::make_shared<FakeServer>();
  auto config = testConfig();
  config.session.handshakeTimeout = 200ms;
  CallbackLog log;
  auto session = makeSession(config, server, log);

  try {
    session->start();
    FAIL() << "start() should have thrown";
  } catch (const lungo::AsrError& e) {
    EXPECT_EQ(e.code(), lungo::ErrorCode::ConnectionFailed);
  }
  EXPECT_EQ(server->frames().size(), 1);
}

// @test cancel() from another thread while start() waits for the server makes start() throw
TEST(RealtimeSessionTest, CancelDuringHandshake) {
  auto server = std::make_shared<FakeServer>();
  auto config = testConfig();
  config.session.handshakeTimeout = 5000ms;
  CallbackLog log;
  auto session = makeSession(config, server, log);

  std::thread canceller([&session, &server] {
    waitFor([&server] { return server->frames().size() == 1; });
    std::this_thread::sleep_for(50ms);
    session->cancel();
  });

  const auto begin = std::chrono::steady_clock::now();
  try {
    session->start();
    ADD_FAILURE() << "start() should have thrown";
  } catch (const lungo::AsrError& e) {
    EXPECT_EQ(e.code(), lungo::ErrorCode::Cancelled);
  }
  const auto elapsed = std::chrono::steady_clock::now() - begin;
  canceller.join();

  EXPECT_LT(elapsed, 2000ms);
  EXPECT_EQ(session->state(), lungo::SessionState::Cancelled);
  EXPECT_EQ(session->finish(), "");
  EXPECT_EQ(log.callbackCount(), 0);
  EXPECT_EQ(server->clientCloseCount(), 1);
  EXPECT_TRUE(server->audioFrames().empty());
}

TEST(RealtimeSessionTest, ServerClosesDuringHandshake) {
  auto server = std::make_shared<FakeServer>();
  server->setScript([](FakeServer& s, const lungo::ParsedFrame&) { s.closeFromServer(); });
  CallbackLog log;
  auto session = makeSession(testConfig(), server, log);

  try {
    session->start();
    FAIL() << "start() should have thrown";
  } catch (const lungo::AsrError& e) {
    EXPECT_EQ(e.code(), lungo::ErrorCode::ConnectionFailed);
  }
}

// @test Losing the connection while streaming is reported as a connection failure
TEST(RealtimeSessionTest, ServerClosesWhileStreaming) {
  auto server = std::make_shared<FakeServer>();
  server->setScript([](FakeServer& s, const lungo::ParsedFrame& frame) {
    if (isControl(frame)) {
      s.respond("");
    } else {
      s.closeFromServer();
    }
  });
  const auto config = testConfig();
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  feed(*session, config.audio.bytesPerSecond());
  ASSERT_TRUE(waitFor([&session] { return session->state() == lungo::SessionState::Error; }));
  session->finish();

  ASSERT_EQ(log.errors.size(), 1);
  EXPECT_EQ(log.errors.front().code, lungo::ErrorCode::ConnectionFailed);
  EXPECT_TRUE(log.finals.empty());
}

// @test A clean close after the last frame ends the session without a final result
TEST(RealtimeSessionTest, ServerClosesWhileFinishing) {
  auto server = std::make_shared<FakeServer>();
  server->setScript([](FakeServer& s, const lungo::ParsedFrame& frame) {
    if (isControl(frame)) {
      s.respond("");
    } else if (frame.isLast) {
      s.closeFromServer();
    } else {
      s.respond("partial");
    }
  });
  const auto config = testConfig();
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  feed(*session, session->segmentSizeBytes());

  EXPECT_EQ(session->finish(), "partial");
  EXPECT_EQ(session->state(), lungo::SessionState::Done);
  EXPECT_TRUE(log.finals.empty());
  EXPECT_TRUE(log.errors.empty());
}

// @test Undecodable frames are counted and skipped
TEST(RealtimeSessionTest, MalformedFramesIgnored) {
  auto server = std::make_shared<FakeServer>();
  server->setScript([](FakeServer& s, const lungo::ParsedFrame& frame) {
    if (isControl(frame)) {
      s.respond("");
    } else if (frame.isLast) {
      s.respond("ok", true);
    } else {
      s.respondRaw(std::string("\x11\x90\x11", 3));
      s.respondRaw("definitely not a frame");
      s.respond("ok");
    }
  });
  const auto config = testConfig();
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  feed(*session, session->segmentSizeBytes());

  EXPECT_EQ(session->finish(), "ok");
  EXPECT_EQ(session->state(), lungo::SessionState::Done);
  EXPECT_EQ(session->malformedFrameCount(), 2);
  EXPECT_EQ(log.finals, std::vector<std::string>{"ok"});
}

// @test With pacing on, frames don't leave faster than the audio they carry
TEST(RealtimeSessionTest, RealtimePacing) {
  auto server = std::make_shared<FakeServer>();
  server->setScript(helloWorldScript);
  auto config = testConfig();
  config.session.realtimePacing = true;
  config.session.segmentDuration = 50ms;
  CallbackLog log;
  auto session = makeSession(config, server, log);

  session->start();
  const auto begin = std::chrono::steady_clock::now();
  feed(*session, session->segmentSizeBytes() * 5);
  session->finish();
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  // Six frames, the first goes out immediately
  EXPECT_EQ(server->audioFrames().size(), 6);
  EXPECT_GE(elapsed, 240ms);
}

TEST(RealtimeSessionTest, FinishBeforeStart) {
  auto server = std::make_shared<FakeServer>();
  CallbackLog log;
  auto session = makeSession(testConfig(), server, log);

  EXPECT_EQ(session->finish(), "");
  EXPECT_EQ(session->state(), lungo::SessionState::Done);
  EXPECT_TRUE(server->frames().empty());
}

TEST(RealtimeSessionTest, ZeroLengthSegmentRejected) {
  auto config = testConfig();
  config.audio.sampleRate_Hz = 0;
  CallbackLog log;

  EXPECT_THROW(makeSession(config, std::make_shared<FakeServer>(), log), lungo::AsrError);
}

// @test createSession does no I/O, transcribe runs a whole WAV file through one session
TEST(AsrClientTest, TranscribeWav) {
  auto server = std::make_shared<FakeServer>();
  server->setScript(helloWorldScript);
  const lungo::AsrClient client(testConfig(), TestUtils::fakeTransportFactory(server));
  ASSERT_TRUE(client.isAvailable());

  auto session = client.createSession(client.config().audio, "zh-CN");
  EXPECT_EQ(session->state(), lungo::SessionState::Created);
  EXPECT_TRUE(server->frames().empty());
  session.reset();

  std::vector<std::string> partials;
  const auto wav = TestUtils::makeWav(std::vector<char>(32000, '\x03'));
  const auto transcript = client.transcribe(
      wav, "zh", [&partials](const std::string& text) { partials.push_back(text); });

  EXPECT_EQ(transcript, "你好，世界");
  EXPECT_FALSE(partials.empty());
  EXPECT_EQ(server->audioFrames().size(), 6);
}

// @test The WAV header decides the format announced to the server
TEST(AsrClientTest, TranscribeUsesWavFormat) {
  auto server = std::make_shared<FakeServer>();
  server->setScript(helloWorldScript);
  const lungo::AsrClient client(testConfig(), TestUtils::fakeTransportFactory(server));

  const auto wav = TestUtils::makeWav(std::vector<char>(8000, '\x03'), 8000);
  EXPECT_EQ(client.transcribe(wav, "zh"), "你好，世界");

  const auto control = server->frames().front();
  ASSERT_TRUE(control.payload.has_value());
  EXPECT_EQ((*control.payload)["audio"]["rate"], 8000);
}

TEST(AsrClientTest, TranscribeFailuresReturnEmpty) {
  auto server = std::make_shared<FakeServer>();
  server->setScript([](FakeServer& s, const lungo::ParsedFrame& frame) {
    if (isControl(frame)) {
      s.respondError(45000001, "invalid request");
    }
  });
  const lungo::AsrClient client(testConfig(), TestUtils::fakeTransportFactory(server));

  EXPECT_EQ(client.transcribe({'n', 'o', 't', ' ', 'w', 'a', 'v'}, "zh"), "");
  EXPECT_TRUE(server->frames().empty());

  EXPECT_EQ(client.transcribe(TestUtils::makeWav(std::vector<char>(3200, '\x03')), "zh"), "");
  EXPECT_EQ(server->frames().size(), 1);
}

TEST(AsrClientTest, AvailabilityNeedsCredentials) {
  auto config = testConfig();
  config.credentials.accessKey.clear();
  const lungo::AsrClient client(config, TestUtils::fakeTransportFactory(
                                            std::make_shared<FakeServer>()));

  EXPECT_FALSE(client.isAvailable());
}
