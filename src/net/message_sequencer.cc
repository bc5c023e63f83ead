// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "message_sequencer.h"

namespace textsync {

void MessageSequencer::Push(uint64_t seq, message_ptr message,
                            std::vector<message_ptr> *ready) {
  if (seq < next_seq_)
    return;
  pending_.emplace(seq, std::move(message));
  auto it = pending_.begin();
  while (it != pending_.end() && it->first == next_seq_) {
    ready->push_back(std::move(it->second));
    it = pending_.erase(it);
    ++next_seq_;
  }
}

} // namespace textsync
