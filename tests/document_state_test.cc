// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "services/sync/document_state.h"

#include <atomic>
#include <thread>

#include <gtest/gtest.h>
using namespace textsync;

TEST(DocumentStateTest, ApplyOverwritesTest) {
  DocumentState state("loaded", "2026-01-01T00:00:00.000000Z");
  document_snapshot snapshot = state.Read();
  ASSERT_EQ(snapshot.content, "loaded");
  ASSERT_EQ(snapshot.version, 0);
  ASSERT_FALSE(snapshot.last_editor.has_value());

  edit_event edit;
  edit.content = "second";
  edit.user_id = "B";
  // 较早的时间戳同样会覆盖，不比较时间
  edit.timestamp = "2020-01-01T00:00:00.000000Z";
  snapshot = state.Apply(edit);
  ASSERT_EQ(snapshot.content, "second");
  ASSERT_EQ(snapshot.version, 1);
  ASSERT_EQ(snapshot.last_modified, "2020-01-01T00:00:00.000000Z");
  ASSERT_EQ(snapshot.last_editor, "B");

  edit.content = "";
  edit.user_id.reset();
  snapshot = state.Apply(edit);
  ASSERT_EQ(snapshot.content, "");
  ASSERT_EQ(snapshot.version, 2);
  ASSERT_FALSE(snapshot.last_editor.has_value());
}

TEST(DocumentStateTest, SnapshotIsCopyTest) {
  DocumentState state;
  edit_event edit;
  edit.content = "v1";
  state.Apply(edit);
  document_snapshot snapshot = state.Read();
  edit.content = "v2";
  state.Apply(edit);
  ASSERT_EQ(snapshot.content, "v1");
  ASSERT_EQ(state.Read().content, "v2");
}

TEST(DocumentStateTest, ConcurrentReadTest) {
  DocumentState state;
  std::atomic<bool> stop{false};
  std::atomic<bool> consistent{true};
  std::thread reader([&]() {
    uint64_t last_version = 0;
    while (!stop.load()) {
      document_snapshot snapshot = state.Read();
      // 内容与版本号总是来自同一次写入
      if (snapshot.version != 0 &&
          snapshot.content != std::to_string(snapshot.version))
        consistent = false;
      if (snapshot.version < last_version)
        consistent = false;
      last_version = snapshot.version;
    }
  });
  for (int i = 1; i <= 1000; ++i) {
    edit_event edit;
    edit.content = std::to_string(i);
    state.Apply(edit);
  }
  stop = true;
  reader.join();
  ASSERT_TRUE(consistent.load());
  ASSERT_EQ(state.Read().version, 1000);
}
