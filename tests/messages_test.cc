// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "services/sync/messages.h"

#include <gtest/gtest.h>

#include "errors.h"
using namespace textsync;

TEST(MessagesTest, ParseEditRequestTest) {
  {
    edit_event edit;
    ASSERT_EQ(parse_edit_request("{\"type\":\"text_update\",\"content\":\"abc\","
                                 "\"user_id\":\"u1\",\"timestamp\":\"t\"}",
                                 true, &edit),
              TEXTSYNC_ERROR_OK);
    ASSERT_EQ(edit.content, "abc");
    ASSERT_EQ(edit.user_id, "u1");
    ASSERT_EQ(edit.timestamp, "t");
  }
  {
    // user_id与timestamp为可选字段
    edit_event edit;
    ASSERT_EQ(parse_edit_request("{\"content\":\"\",\"user_id\":null}", false,
                                 &edit),
              TEXTSYNC_ERROR_OK);
    ASSERT_EQ(edit.content, "");
    ASSERT_FALSE(edit.user_id.has_value());
    ASSERT_TRUE(edit.timestamp.empty());
  }
  {
    edit_event edit;
    ASSERT_EQ(parse_edit_request("{\"content\":\"\\u4f60\\u597d\"}", false,
                                 &edit),
              TEXTSYNC_ERROR_OK);
    ASSERT_EQ(edit.content, "你好");
  }
}

TEST(MessagesTest, MalformedEditRequestTest) {
  const char *messages[] = {
      "",
      "{",
      "\"content\"",
      "{\"type\":\"text_update\"}",
      "{\"type\":\"text_update\",\"content\":null}",
      "{\"type\":\"text_update\",\"content\":[1,2]}",
      "{\"type\":\"text_update\",\"content\":\"x\",\"user_id\":5}",
      // 流式通道上必须携带正确的type
      "{\"content\":\"x\"}",
      "{\"type\":\"initial_state\",\"content\":\"x\"}",
      "{\"type\":1,\"content\":\"x\"}",
  };
  for (const char *message : messages) {
    edit_event edit;
    EXPECT_EQ(parse_edit_request(message, true, &edit),
              TEXTSYNC_ERROR_MALFORMED_MESSAGE)
        << message;
    EXPECT_FALSE(edit.content.has_value()) << message;
  }
}

TEST(MessagesTest, TextUpdateTest) {
  document_snapshot state;
  state.content = "line1\nline2";
  state.version = 3;
  state.last_modified = "2026-01-01T00:00:00.000000Z";
  state.last_editor = "alice";
  nlohmann::json j = nlohmann::json::parse(make_text_update(state, 9));
  ASSERT_EQ(j["type"], "text_update");
  ASSERT_EQ(j["content"], "line1\nline2");
  ASSERT_EQ(j["user_id"], "alice");
  ASSERT_EQ(j["timestamp"], "2026-01-01T00:00:00.000000Z");
  ASSERT_EQ(j["version"], 3);
  ASSERT_EQ(j["session_id"], 9);

  state.last_editor.reset();
  j = nlohmann::json::parse(make_text_update(state, 0));
  ASSERT_TRUE(j["user_id"].is_null());
  ASSERT_EQ(j["session_id"], 0);
}

TEST(MessagesTest, InitialStateAndUserCountTest) {
  document_snapshot state;
  state.content = "doc";
  state.version = 1;
  state.last_modified = "2026-01-01T00:00:00.000000Z";
  nlohmann::json j = nlohmann::json::parse(make_initial_state(state, 4, 12));
  ASSERT_EQ(j["type"], "initial_state");
  ASSERT_EQ(j["content"], "doc");
  ASSERT_EQ(j["last_updated"], "2026-01-01T00:00:00.000000Z");
  ASSERT_EQ(j["user_count"], 4);
  ASSERT_EQ(j["version"], 1);
  ASSERT_EQ(j["session_id"], 12);

  j = nlohmann::json::parse(make_user_count_update(2));
  ASSERT_EQ(j.size(), 2);
  ASSERT_EQ(j["type"], "user_count_update");
  ASSERT_EQ(j["user_count"], 2);
}

TEST(MessagesTest, InvalidUtf8Test) {
  // 持久化文件中的非法UTF-8字节不会导致序列化失败
  document_snapshot state;
  state.content = std::string("ok\xff", 3);
  nlohmann::json j = nlohmann::json::parse(make_text_update(state, 0));
  ASSERT_EQ(j["content"], "ok\xEF\xBF\xBD");
}

TEST(MessagesTest, UnknownTypeTest) {
  // 未知类型不输出任何字段
  syncmsg_desc msg;
  msg.content = "doc";
  nlohmann::json j = msg;
  ASSERT_TRUE(j.is_null());
  ASSERT_FALSE(j.contains("success"));
}

TEST(MessagesTest, MaxEncodedLengthTest) {
  // 控制字符全部转义时消息长度约为内容的6倍
  document_snapshot state;
  state.content = std::string(1 << 20, '\x01');
  state.version = UINT64_MAX;
  state.last_modified = "2026-01-01T00:00:00.000000Z";
  state.last_editor = std::string(128, '\x1f');
  size_t limit = max_encoded_message_bytes(state.content.size());

  std::string update = make_text_update(state, UINT32_MAX);
  ASSERT_GT(update.size(), 6u << 20);
  ASSERT_LE(update.size(), limit);

  std::string request = dump_json(
      {{"type", "text_update"}, {"content", state.content},
       {"user_id", *state.last_editor}, {"timestamp", state.last_modified}});
  ASSERT_GT(request.size(), 6u << 20);
  ASSERT_LE(request.size(), limit);
}
