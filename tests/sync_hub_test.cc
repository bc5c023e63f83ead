// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "services/sync/sync_hub.h"

#include <thread>

#include <gtest/gtest.h>

#include "fakes.h"
using namespace textsync;

namespace {

edit_event make_edit(const std::string &content,
                     std::optional<std::string> user_id = {},
                     uint32_t origin_session = 0) {
  edit_event edit;
  edit.content = content;
  edit.user_id = std::move(user_id);
  edit.origin_session = origin_session;
  return edit;
}

} // namespace

TEST(SyncHubTest, LastWriterWinsTest) {
  MemoryStore store;
  SyncHub hub(&store, "", "2026-01-01T00:00:00.000000Z");
  auto session = std::make_shared<RecordingSession>(1);
  ASSERT_TRUE(hub.Join(session));

  ASSERT_EQ(hub.OnEdit(make_edit("Hello", "A")), TEXTSYNC_ERROR_OK);
  ASSERT_EQ(hub.OnEdit(make_edit("World", "B")), TEXTSYNC_ERROR_OK);

  document_snapshot state = hub.Snapshot();
  ASSERT_EQ(state.content, "World");
  ASSERT_EQ(state.version, 2);
  ASSERT_EQ(state.last_editor, "B");

  std::string saved;
  ASSERT_EQ(store.Load(&saved), TEXTSYNC_ERROR_OK);
  ASSERT_EQ(saved, "World");

  auto updates = session->messages_of("text_update");
  ASSERT_EQ(updates.size(), 2);
  ASSERT_EQ(updates[0]["content"], "Hello");
  ASSERT_EQ(updates[0]["user_id"], "A");
  ASSERT_EQ(updates[1]["content"], "World");
  ASSERT_EQ(updates[1]["user_id"], "B");
  ASSERT_EQ(updates[1]["version"], 2);
}

TEST(SyncHubTest, JoinAndLeaveTest) {
  MemoryStore store;
  SyncHub hub(&store, "initial", "2026-01-01T00:00:00.000000Z");
  auto first = std::make_shared<RecordingSession>(1, "alice");
  auto second = std::make_shared<RecordingSession>(2);

  ASSERT_TRUE(hub.Join(first));
  auto initial = first->messages_of("initial_state");
  ASSERT_EQ(initial.size(), 1);
  ASSERT_EQ(initial[0]["content"], "initial");
  ASSERT_EQ(initial[0]["last_updated"], "2026-01-01T00:00:00.000000Z");
  ASSERT_EQ(initial[0]["user_count"], 1);
  ASSERT_EQ(initial[0]["version"], 0);
  ASSERT_EQ(initial[0]["session_id"], 1);
  // 初始状态先于在线人数更新
  ASSERT_EQ(first->messages()[0]["type"], "initial_state");

  ASSERT_TRUE(hub.Join(second));
  ASSERT_EQ(hub.SessionCount(), 2);
  auto counts = first->messages_of("user_count_update");
  ASSERT_EQ(counts.size(), 2);
  ASSERT_EQ(counts.back()["user_count"], 2);
  ASSERT_EQ(second->messages_of("initial_state")[0]["user_count"], 2);

  // 同一会话不能重复加入
  ASSERT_FALSE(hub.Join(second));

  hub.Leave(2);
  ASSERT_EQ(hub.SessionCount(), 1);
  ASSERT_EQ(first->messages_of("user_count_update").back()["user_count"], 1);
  // 重复离开无副作用
  size_t before = first->messages().size();
  hub.Leave(2);
  ASSERT_EQ(first->messages().size(), before);
}

TEST(SyncHubTest, LateJoinerMissesEarlierBroadcastTest) {
  MemoryStore store;
  SyncHub hub(&store, "", "2026-01-01T00:00:00.000000Z");
  auto early = std::make_shared<RecordingSession>(1);
  ASSERT_TRUE(hub.Join(early));
  ASSERT_EQ(hub.OnEdit(make_edit("before")), TEXTSYNC_ERROR_OK);

  auto late = std::make_shared<RecordingSession>(2);
  ASSERT_TRUE(hub.Join(late));
  ASSERT_TRUE(late->messages_of("text_update").empty());
  // 之前的编辑通过初始状态获得
  ASSERT_EQ(late->messages_of("initial_state")[0]["content"], "before");
  ASSERT_EQ(late->messages_of("initial_state")[0]["version"], 1);
}

TEST(SyncHubTest, EchoCarriesOriginSessionTest) {
  MemoryStore store;
  SyncHub hub(&store, "", "2026-01-01T00:00:00.000000Z");
  auto a = std::make_shared<RecordingSession>(7, "A");
  auto b = std::make_shared<RecordingSession>(8, "B");
  ASSERT_TRUE(hub.Join(a));
  ASSERT_TRUE(hub.Join(b));

  ASSERT_EQ(hub.OnEdit(make_edit("from a", "A", 7)), TEXTSYNC_ERROR_OK);
  for (auto &session : {a, b}) {
    auto updates = session->messages_of("text_update");
    ASSERT_EQ(updates.size(), 1);
    ASSERT_EQ(updates[0]["session_id"], 7);
    ASSERT_EQ(updates[0]["content"], "from a");
  }

  // 通过HTTP提交的编辑会话id为0，未提供user_id时记为匿名用户
  ASSERT_EQ(hub.OnEdit(make_edit("from http")), TEXTSYNC_ERROR_OK);
  ASSERT_EQ(a->messages_of("text_update").back()["session_id"], 0);
  ASSERT_EQ(a->messages_of("text_update").back()["user_id"], "anonymous");
  ASSERT_EQ(hub.Snapshot().last_editor, "anonymous");
}

TEST(SyncHubTest, StoreFailureStillBroadcastsTest) {
  MemoryStore store;
  SyncHub hub(&store, "", "2026-01-01T00:00:00.000000Z");
  auto session = std::make_shared<RecordingSession>(1);
  ASSERT_TRUE(hub.Join(session));

  ASSERT_EQ(hub.OnEdit(make_edit("persisted")), TEXTSYNC_ERROR_OK);
  store.set_fail(true);
  ASSERT_EQ(hub.OnEdit(make_edit("lost on crash")), TEXTSYNC_ERROR_OK);

  ASSERT_EQ(hub.Snapshot().content, "lost on crash");
  ASSERT_EQ(session->messages_of("text_update").back()["content"],
            "lost on crash");
  std::string saved;
  ASSERT_EQ(store.Load(&saved), TEXTSYNC_ERROR_OK);
  ASSERT_EQ(saved, "persisted");
}

TEST(SyncHubTest, RejectedEditTest) {
  MemoryStore store;
  SyncHub hub(&store, "keep", "2026-01-01T00:00:00.000000Z", 8);
  auto session = std::make_shared<RecordingSession>(1);
  ASSERT_TRUE(hub.Join(session));
  size_t before = session->messages().size();

  edit_event missing;
  ASSERT_EQ(hub.OnEdit(missing), TEXTSYNC_ERROR_MALFORMED_MESSAGE);
  ASSERT_EQ(hub.OnEdit(make_edit("123456789")),
            TEXTSYNC_ERROR_OVERSIZED_CONTENT);
  ASSERT_EQ(hub.Snapshot().content, "keep");
  ASSERT_EQ(hub.Snapshot().version, 0);
  ASSERT_EQ(session->messages().size(), before);
  ASSERT_EQ(store.save_count(), 0);

  // 正好等于上限的内容可以接受
  ASSERT_EQ(hub.OnEdit(make_edit("12345678")), TEXTSYNC_ERROR_OK);
}

TEST(SyncHubTest, TimestampTest) {
  MemoryStore store;
  SyncHub hub(&store, "", "2026-01-01T00:00:00.000000Z");
  edit_event edit = make_edit("client time");
  edit.timestamp = "2026-02-03T04:05:06.000000Z";
  document_snapshot result;
  ASSERT_EQ(hub.OnEdit(edit, &result), TEXTSYNC_ERROR_OK);
  ASSERT_EQ(result.last_modified, "2026-02-03T04:05:06.000000Z");

  ASSERT_EQ(hub.OnEdit(make_edit("server time"), &result), TEXTSYNC_ERROR_OK);
  // 服务器生成的时间形如YYYY-MM-DDTHH:MM:SS.ffffffZ
  ASSERT_EQ(result.last_modified.size(), 27);
  ASSERT_EQ(result.last_modified.back(), 'Z');
  ASSERT_EQ(result.last_modified[10], 'T');
}

TEST(SyncHubTest, UnreachableSessionDroppedTest) {
  MemoryStore store;
  SyncHub hub(&store, "", "2026-01-01T00:00:00.000000Z");
  auto good = std::make_shared<RecordingSession>(1);
  auto bad = std::make_shared<RecordingSession>(2);
  auto other = std::make_shared<RecordingSession>(3);
  ASSERT_TRUE(hub.Join(good));
  ASSERT_TRUE(hub.Join(bad));
  ASSERT_TRUE(hub.Join(other));

  bad->set_unreachable(true);
  ASSERT_EQ(hub.OnEdit(make_edit("x")), TEXTSYNC_ERROR_OK);
  ASSERT_EQ(hub.SessionCount(), 2);
  ASSERT_TRUE(bad->closed());
  // 其他会话照常收到编辑以及新的在线人数
  for (auto &session : {good, other}) {
    ASSERT_EQ(session->messages_of("text_update").size(), 1);
    ASSERT_EQ(session->messages_of("user_count_update").back()["user_count"],
              2);
  }

  // 加入时无法投递初始状态的会话不会被注册
  auto dead = std::make_shared<RecordingSession>(4);
  dead->set_unreachable(true);
  ASSERT_FALSE(hub.Join(dead));
  ASSERT_EQ(hub.SessionCount(), 2);
}

TEST(SyncHubTest, DropSessionTest) {
  MemoryStore store;
  SyncHub hub(&store, "", "2026-01-01T00:00:00.000000Z");
  auto lagging = std::make_shared<RecordingSession>(1);
  auto other = std::make_shared<RecordingSession>(2);
  ASSERT_TRUE(hub.Join(lagging));
  ASSERT_TRUE(hub.Join(other));

  // 投递已经失败的会话被关闭并移除，剩余会话收到新的在线人数
  hub.Drop(1);
  ASSERT_TRUE(lagging->closed());
  ASSERT_EQ(hub.SessionCount(), 1);
  ASSERT_EQ(other->messages_of("user_count_update").back()["user_count"], 1);

  ASSERT_EQ(hub.OnEdit(make_edit("after drop")), TEXTSYNC_ERROR_OK);
  ASSERT_TRUE(lagging->messages_of("text_update").empty());
  ASSERT_EQ(other->messages_of("text_update").size(), 1);

  // 重复移除以及随后的离开都没有副作用
  size_t before = other->messages().size();
  hub.Drop(1);
  hub.Leave(1);
  ASSERT_EQ(other->messages().size(), before);
}

TEST(SyncHubTest, ConcurrentEditsTotalOrderTest) {
  constexpr int kThreads = 8;
  constexpr int kEditsPerThread = 50;
  MemoryStore store;
  SyncHub hub(&store, "", "2026-01-01T00:00:00.000000Z");
  std::vector<std::shared_ptr<RecordingSession>> sessions;
  for (uint32_t id = 1; id <= 4; ++id) {
    sessions.push_back(std::make_shared<RecordingSession>(id));
    ASSERT_TRUE(hub.Join(sessions.back()));
  }

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&hub, t]() {
      for (int i = 0; i < kEditsPerThread; ++i) {
        hub.OnEdit(make_edit(std::to_string(t) + ":" + std::to_string(i),
                             "user" + std::to_string(t)));
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  document_snapshot state = hub.Snapshot();
  ASSERT_EQ(state.version, kThreads * kEditsPerThread);
  auto reference = sessions[0]->messages_of("text_update");
  ASSERT_EQ(reference.size(), kThreads * kEditsPerThread);
  for (size_t i = 0; i < reference.size(); ++i) {
    ASSERT_EQ(reference[i]["version"], i + 1);
  }
  ASSERT_EQ(reference.back()["content"], state.content);
  // 所有会话看到相同的编辑顺序
  for (auto &session : sessions) {
    ASSERT_EQ(session->messages_of("text_update"), reference);
  }
  std::string saved;
  ASSERT_EQ(store.Load(&saved), TEXTSYNC_ERROR_OK);
  ASSERT_EQ(saved, state.content);
}
