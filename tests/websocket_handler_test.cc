// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "protocol/websocket/websocket_handler.h"

#include <gtest/gtest.h>

#include "fakes.h"
#include "frames.h"
#include "protocol/http/http_handler.h"
#include "services/sync/messages.h"
#include "services/sync/sync_hub.h"
using namespace textsync;

namespace {

// 记录收到的消息，可以设置回复内容与启动结果
class FakeService : public ServiceHandler {
public:
  FakeService() : ServiceHandler(nullptr) {}

  bool parse_parameters(
      const std::unordered_map<std::string, std::vector<std::string>> &)
      override {
    return true;
  }

  bool start() override { return start_ok; }

  void stop() override { ++stop_count; }

  std::string handle(std::string data) override {
    messages.push_back(std::move(data));
    return reply;
  }

  bool start_ok{true};
  std::string reply;
  std::vector<std::string> messages;
  int stop_count{0};
};

// 不依赖连接，记录写出的帧
class RecordingHandler : public WebSocketHandler {
public:
  RecordingHandler(std::unique_ptr<ServiceHandler> service,
                   uint64_t max_message_length = kMaxPayloadLength)
      : WebSocketHandler(nullptr, 1, std::move(service), max_message_length) {}

  void feed(const std::string &data) {
    ASSERT_EQ(RecvDataHandle(data.data(), data.size()), data.size());
  }

  std::vector<server_frame> frames() const {
    return decode_server_frames(written_);
  }

  bool closing() const { return closing_; }
  bool closed() const { return closed_; }

protected:
  bool write(std::string frame, bool close_after) override {
    if (closed_ || closing_)
      return false;
    written_.append(frame);
    closing_ = close_after;
    return true;
  }

  bool connection_closed() const override { return closed_; }

  void close_connection() override { closed_ = true; }

private:
  std::string written_;
  bool closing_{false};
  bool closed_{false};
};

uint16_t close_code(const server_frame &frame) {
  EXPECT_EQ(frame.opcode, WebSocketParser::WS_OPCODE_CLOSE);
  EXPECT_EQ(frame.payload.size(), 2);
  return static_cast<uint16_t>(
      (static_cast<uint8_t>(frame.payload[0]) << 8) |
      static_cast<uint8_t>(frame.payload[1]));
}

} // namespace

TEST(WebSocketHandlerTest, MessageTest) {
  auto service = std::make_unique<FakeService>();
  FakeService *fake = service.get();
  fake->reply = "ack";
  RecordingHandler handler(std::move(service));
  ASSERT_TRUE(handler.start());

  // 一次读取包含两个帧
  handler.feed(client_frame(0x81, "first") + client_frame(0x81, "second"));
  ASSERT_EQ(fake->messages.size(), 2);
  ASSERT_EQ(fake->messages[0], "first");
  ASSERT_EQ(fake->messages[1], "second");

  auto frames = handler.frames();
  ASSERT_EQ(frames.size(), 2);
  ASSERT_TRUE(frames[0].fin);
  ASSERT_EQ(frames[0].opcode, WebSocketParser::WS_OPCODE_TEXT);
  ASSERT_EQ(frames[0].payload, "ack");
}

TEST(WebSocketHandlerTest, FragmentTest) {
  auto service = std::make_unique<FakeService>();
  FakeService *fake = service.get();
  RecordingHandler handler(std::move(service));
  ASSERT_TRUE(handler.start());

  std::string data = client_frame(0x01, "{\"type\":") +
                     client_frame(0x89, "hi") +
                     client_frame(0x00, "\"text_") +
                     client_frame(0x80, "update\"}");
  // 帧被拆分到多次读取中
  size_t half = data.size() / 2;
  handler.feed(data.substr(0, 3));
  handler.feed(data.substr(3, half - 3));
  ASSERT_TRUE(fake->messages.empty());
  handler.feed(data.substr(half));

  ASSERT_EQ(fake->messages.size(), 1);
  ASSERT_EQ(fake->messages[0], "{\"type\":\"text_update\"}");
  // 分片之间的ping帧立即得到回应
  auto frames = handler.frames();
  ASSERT_EQ(frames.size(), 1);
  ASSERT_EQ(frames[0].opcode, WebSocketParser::WS_OPCODE_PONG);
  ASSERT_EQ(frames[0].payload, "hi");
}

TEST(WebSocketHandlerTest, PingTest) {
  RecordingHandler handler(std::make_unique<FakeService>());
  handler.feed(client_frame(0x89, "are you there"));
  auto frames = handler.frames();
  ASSERT_EQ(frames.size(), 1);
  ASSERT_TRUE(frames[0].fin);
  ASSERT_EQ(frames[0].opcode, WebSocketParser::WS_OPCODE_PONG);
  ASSERT_EQ(frames[0].payload, "are you there");
  ASSERT_FALSE(handler.closing());
}

TEST(WebSocketHandlerTest, BinaryFrameTest) {
  auto service = std::make_unique<FakeService>();
  FakeService *fake = service.get();
  RecordingHandler handler(std::move(service));
  handler.feed(client_frame(0x82, "\x01\x02\x03") + client_frame(0x81, "late"));

  // 关闭帧发出后不再处理后续数据
  ASSERT_TRUE(fake->messages.empty());
  ASSERT_TRUE(handler.closing());
  auto frames = handler.frames();
  ASSERT_EQ(frames.size(), 1);
  ASSERT_EQ(frames[0].payload, std::string("\x03\xEB", 2));
  ASSERT_EQ(close_code(frames[0]), 1003);
}

TEST(WebSocketHandlerTest, CloseTest) {
  RecordingHandler handler(std::make_unique<FakeService>());
  handler.feed(client_frame(0x88, std::string("\x03\xE8", 2)));
  auto frames = handler.frames();
  ASSERT_EQ(frames.size(), 1);
  ASSERT_EQ(close_code(frames[0]), 1000);
  ASSERT_TRUE(handler.closing());
}

TEST(WebSocketHandlerTest, ProtocolErrorTest) {
  {
    // 没有开始的分片消息
    RecordingHandler handler(std::make_unique<FakeService>());
    handler.feed(client_frame(0x80, "orphan"));
    auto frames = handler.frames();
    ASSERT_EQ(frames.size(), 1);
    ASSERT_EQ(close_code(frames[0]), 1002);
  }
  {
    // 上一条分片消息尚未结束
    auto service = std::make_unique<FakeService>();
    FakeService *fake = service.get();
    RecordingHandler handler(std::move(service));
    handler.feed(client_frame(0x01, "part") + client_frame(0x81, "new"));
    ASSERT_TRUE(fake->messages.empty());
    auto frames = handler.frames();
    ASSERT_EQ(frames.size(), 1);
    ASSERT_EQ(close_code(frames[0]), 1002);
  }
  {
    // 客户端帧未使用掩码
    RecordingHandler handler(std::make_unique<FakeService>());
    handler.feed(client_frame(0x81, "plain", false));
    auto frames = handler.frames();
    ASSERT_EQ(frames.size(), 1);
    ASSERT_EQ(close_code(frames[0]), 1002);
  }
}

TEST(WebSocketHandlerTest, MessageTooBigTest) {
  {
    RecordingHandler handler(std::make_unique<FakeService>(), 16);
    handler.feed(client_frame(0x81, std::string(17, 'a')));
    auto frames = handler.frames();
    ASSERT_EQ(frames.size(), 1);
    ASSERT_EQ(close_code(frames[0]), 1009);
  }
  {
    // 每个分片都不超过上限，重组后超过
    auto service = std::make_unique<FakeService>();
    FakeService *fake = service.get();
    RecordingHandler handler(std::move(service), 16);
    handler.feed(client_frame(0x01, std::string(10, 'a')) +
                 client_frame(0x80, std::string(10, 'b')));
    ASSERT_TRUE(fake->messages.empty());
    auto frames = handler.frames();
    ASSERT_EQ(frames.size(), 1);
    ASSERT_EQ(close_code(frames[0]), 1009);
  }
}

TEST(WebSocketHandlerTest, StartFailureTest) {
  auto service = std::make_unique<FakeService>();
  service->start_ok = false;
  RecordingHandler handler(std::move(service));
  ASSERT_FALSE(handler.start());
  auto frames = handler.frames();
  ASSERT_EQ(frames.size(), 1);
  ASSERT_EQ(close_code(frames[0]), 1011);
}

TEST(WebSocketHandlerTest, CloseHandleTest) {
  auto service = std::make_unique<FakeService>();
  FakeService *fake = service.get();
  RecordingHandler handler(std::move(service));
  ASSERT_TRUE(handler.start());
  handler.CloseHandle();
  ASSERT_EQ(fake->stop_count, 1);
}

TEST(WebSocketHandlerTest, MaxContentEditTest) {
  MemoryStore store;
  SyncHub hub(&store, "", "2026-01-01T00:00:00.000000Z");
  auto service = std::make_unique<RecordingSyncService>(9, &hub);
  RecordingSyncService *sync = service.get();
  ASSERT_TRUE(sync->parse_parameters({}));
  RecordingHandler handler(std::move(service),
                           HttpHandler::max_message_length(&hub));
  ASSERT_TRUE(handler.start());

  // 控制字符转义后每个字节扩展为6个字节
  std::string content(hub.max_content_bytes(), '\x01');
  std::string message =
      dump_json({{"type", "text_update"}, {"content", content}});
  ASSERT_GT(message.size(), kMaxPayloadLength);
  size_t third = message.size() / 3;
  handler.feed(client_frame(0x01, message.substr(0, third)) +
               client_frame(0x00, message.substr(third, third)) +
               client_frame(0x80, message.substr(2 * third)));

  ASSERT_TRUE(handler.frames().empty());
  ASSERT_EQ(hub.Snapshot().content, content);
  ASSERT_EQ(hub.Snapshot().version, 1);
  auto updates = sync->recorder()->messages_of("text_update");
  ASSERT_EQ(updates.size(), 1);
  ASSERT_EQ(updates[0]["session_id"], 9);
}
