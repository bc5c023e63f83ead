// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_SERVICES_SYNC_PERSISTENT_STORE_H_
#define TEXTSYNC_SERVICES_SYNC_PERSISTENT_STORE_H_

#include <string>

#include "errors.h"

namespace textsync {

// 文档内容的持久化接口
class PersistentStore {
public:
  virtual ~PersistentStore() = default;

  // 读取持久化的文档内容，失败时返回TEXTSYNC_ERROR_STORE_UNAVAILABLE
  virtual int Load(std::string *content) = 0;

  // 整体覆盖写入，失败时返回TEXTSYNC_ERROR_STORE_UNAVAILABLE
  virtual int Save(const std::string &content) = 0;

  virtual const std::string &path() const = 0;
};

// 以单个纯文本文件保存文档内容，不带任何头部信息
// 写入时先写临时文件并fsync，再rename覆盖目标文件，避免崩溃时留下残缺文件
class FileStore : public PersistentStore {
public:
  explicit FileStore(std::string path);
  ~FileStore() override = default;

  FileStore(const FileStore &) = delete;
  FileStore &operator=(const FileStore &) = delete;

  int Load(std::string *content) override;

  int Save(const std::string &content) override;

  const std::string &path() const override { return path_; }

private:
  std::string path_;
  std::string tmp_path_;
};

} // namespace textsync

#endif
