// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_SERVICES_SYNC_DOCUMENT_STATE_H_
#define TEXTSYNC_SERVICES_SYNC_DOCUMENT_STATE_H_

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>

namespace textsync {

// 客户端提交的一次整篇替换请求，只在一次应用与广播的过程中存在
struct edit_event {
  std::optional<std::string> content;
  std::optional<std::string> user_id;
  std::string timestamp;
  // 发起编辑的会话id，通过HTTP提交的编辑为0
  uint32_t origin_session{0};
};

// 文档状态的值拷贝
struct document_snapshot {
  std::string content;
  uint64_t version{0};
  std::string last_modified;
  std::optional<std::string> last_editor;
};

// 进程内唯一的文档状态，写操作由SyncHub串行化
class DocumentState {
public:
  DocumentState() = default;
  DocumentState(std::string content, std::string last_modified);
  ~DocumentState() = default;

  DocumentState(const DocumentState &) = delete;
  DocumentState &operator=(const DocumentState &) = delete;

  // 后写者胜出：无条件覆盖内容、修改时间与最后编辑者，版本号加一
  // 调用方需保证edit.content存在
  document_snapshot Apply(const edit_event &edit);

  document_snapshot Read() const;

private:
  mutable std::shared_mutex mutex_;
  document_snapshot state_;
};

} // namespace textsync

#endif
