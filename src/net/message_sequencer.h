// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_NET_MESSAGE_SEQUENCER_H_
#define TEXTSYNC_NET_MESSAGE_SEQUENCER_H_

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace textsync {

// 不同线程投递给同一连接的消息可能乱序到达
// 按发送方分配的连续序号(从0开始)重新排序，只交付已经连续的部分
class MessageSequencer {
public:
  using message_ptr = std::shared_ptr<const std::string>;

  MessageSequencer() = default;
  ~MessageSequencer() = default;

  // 加入一条消息，将可以交付的消息按序号顺序追加到ready中
  // 已经交付过或重复的序号被忽略，空消息同样按序交付
  void Push(uint64_t seq, message_ptr message, std::vector<message_ptr> *ready);

  // 下一条等待交付的消息序号
  inline uint64_t next_seq() const { return next_seq_; }

  // 已到达但因前面的消息缺失而无法交付的消息数量
  inline size_t pending() const { return pending_.size(); }

private:
  uint64_t next_seq_{0};
  std::map<uint64_t, message_ptr> pending_;
};

} // namespace textsync

#endif
