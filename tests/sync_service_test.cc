// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "services/sync/sync_service.h"

#include <gtest/gtest.h>

#include "fakes.h"
#include "services/sync/sync_hub.h"
using namespace textsync;

namespace {

class SyncServiceTest : public ::testing::Test {
protected:
  SyncServiceTest() : hub_(&store_, "", "2026-01-01T00:00:00.000000Z") {}

  MemoryStore store_;
  SyncHub hub_;
};

} // namespace

TEST_F(SyncServiceTest, JoinTest) {
  RecordingSyncService service(7, &hub_);
  ASSERT_TRUE(service.parse_parameters({{"user_id", {"alice", "bob"}}}));
  ASSERT_TRUE(service.start());
  ASSERT_EQ(hub_.SessionCount(), 1);

  auto session = service.recorder();
  ASSERT_EQ(session->id(), 7);
  ASSERT_EQ(session->user_id(), "alice");
  auto initial = session->messages_of("initial_state");
  ASSERT_EQ(initial.size(), 1);
  ASSERT_EQ(initial[0]["session_id"], 7);
}

TEST_F(SyncServiceTest, EditTest) {
  RecordingSyncService service(7, &hub_);
  ASSERT_TRUE(service.parse_parameters({{"user_id", {"alice"}}}));
  ASSERT_TRUE(service.start());

  // 流式通道上的编辑不回复
  ASSERT_EQ(service.handle("{\"type\":\"text_update\",\"content\":\"hi\","
                           "\"timestamp\":\"1999-01-01T00:00:00Z\"}"),
            "");
  document_snapshot state = hub_.Snapshot();
  ASSERT_EQ(state.content, "hi");
  ASSERT_EQ(state.version, 1);
  ASSERT_EQ(state.last_editor, "alice");
  // 客户端提供的时间被服务器时间取代
  ASSERT_NE(state.last_modified, "1999-01-01T00:00:00Z");

  auto updates = service.recorder()->messages_of("text_update");
  ASSERT_EQ(updates.size(), 1);
  ASSERT_EQ(updates[0]["session_id"], 7);
  ASSERT_EQ(updates[0]["user_id"], "alice");

  // 消息中的user_id优先于握手参数
  service.handle(
      "{\"type\":\"text_update\",\"content\":\"yo\",\"user_id\":\"carol\"}");
  ASSERT_EQ(hub_.Snapshot().last_editor, "carol");
}

TEST_F(SyncServiceTest, AnonymousTest) {
  RecordingSyncService service(3, &hub_);
  ASSERT_TRUE(service.parse_parameters({{"user_id", {""}}}));
  ASSERT_TRUE(service.start());
  ASSERT_FALSE(service.recorder()->user_id().has_value());

  service.handle("{\"type\":\"text_update\",\"content\":\"x\"}");
  ASSERT_EQ(hub_.Snapshot().last_editor, "anonymous");
  auto updates = service.recorder()->messages_of("text_update");
  ASSERT_EQ(updates.size(), 1);
  ASSERT_EQ(updates[0]["user_id"], "anonymous");
}

TEST_F(SyncServiceTest, MalformedMessageTest) {
  RecordingSyncService service(7, &hub_);
  ASSERT_TRUE(service.parse_parameters({}));
  ASSERT_TRUE(service.start());

  ASSERT_EQ(service.handle("not json"), "");
  ASSERT_EQ(service.handle("{\"type\":\"initial_state\",\"content\":\"x\"}"),
            "");
  ASSERT_EQ(service.handle("{\"content\":\"x\"}"), "");
  ASSERT_EQ(service.handle("{\"type\":\"text_update\"}"), "");
  ASSERT_EQ(service.handle("[1,2]"), "");

  ASSERT_EQ(hub_.Snapshot().version, 0);
  ASSERT_EQ(store_.save_count(), 0);
  ASSERT_TRUE(service.recorder()->messages_of("text_update").empty());
}

TEST_F(SyncServiceTest, StopTest) {
  auto other = std::make_shared<RecordingSession>(1);
  ASSERT_TRUE(hub_.Join(other));
  {
    RecordingSyncService service(7, &hub_);
    ASSERT_TRUE(service.parse_parameters({}));
    ASSERT_TRUE(service.start());
    ASSERT_EQ(hub_.SessionCount(), 2);

    service.stop();
    ASSERT_EQ(hub_.SessionCount(), 1);
    ASSERT_TRUE(service.recorder()->closed());
    auto counts = other->messages_of("user_count_update");
    ASSERT_EQ(counts.back()["user_count"], 1);
    size_t seen = other->messages().size();

    // 重复停止与析构均不会再次离开
    service.stop();
    ASSERT_EQ(other->messages().size(), seen);
  }
  ASSERT_EQ(hub_.SessionCount(), 1);
  ASSERT_EQ(other->messages_of("user_count_update").back()["user_count"], 1);
}

TEST_F(SyncServiceTest, DuplicateSessionTest) {
  RecordingSyncService first(7, &hub_);
  ASSERT_TRUE(first.start());
  RecordingSyncService second(7, &hub_);
  ASSERT_FALSE(second.start());
  // 加入失败的服务停止时不影响已有会话
  second.stop();
  ASSERT_EQ(hub_.SessionCount(), 1);
}
