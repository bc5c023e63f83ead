// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_INCLUDE_PARSER_H_
#define TEXTSYNC_INCLUDE_PARSER_H_

#include <cstdlib>

namespace textsync {

// 应用层协议解析器接口类，HTTP与WebSocket的增量解析器都需要继承该类
class Parser {
public:
  virtual ~Parser() = default;
  // 传入需要解析的数据以及长度，返回本次消耗的字节数
  // 解析完成后剩余未消耗的数据属于下一个请求或下一帧
  virtual size_t ParserExecute(const void *buffer, size_t length) = 0;
  // 当前解析器是否解析完毕
  virtual bool IsDone() const = 0;
  // 重置解析器的状态，使其恢复初始状态
  virtual void Reset() = 0;
  // 获取错误码，0则代表需要更多数据进行解析
  virtual int GetErrorCode() const = 0;
  virtual const char *GetError() const = 0;
};

} // namespace textsync

#endif
