// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "timer.h"

#include "utils/helpers.h"

namespace textsync {

TimeWheel::TimeWheel(uint32_t tick) : tick_(tick ? tick : 1) {
  start_millis_ = get_current_millis();
}

void TimeWheel::insert(timer_head *head, timer_node *timer) {
  timer->next = head->first;
  if (head->first) {
    head->first->pprev = &timer->next;
  }
  timer->pprev = &head->first;
  head->first = timer;
}

void TimeWheel::AddTimer(timer_node *timer, uint32_t millis) {
  timer->unlink();
  uint64_t ticks = millis / tick_;
  if (ticks == 0)
    ticks = 1;
  timer->expires = current_tick_ + ticks;
  timer->fired = false;
  add(timer);
}

void TimeWheel::add(timer_node *timer) {
  uint64_t delta = timer->expires - current_tick_;
  if (delta < kTvrSize) {
    insert(&tv1_[timer->expires & kTvrMask], timer);
    return;
  }
  for (uint32_t level = 0; level < kTvnLevels; ++level) {
    uint32_t shift = kTvrBits + kTvnBits * level;
    // 最高层容纳所有更远的计时器
    if (level == kTvnLevels - 1 || delta < (1ULL << (shift + kTvnBits))) {
      insert(&tvn_[level][(timer->expires >> shift) & kTvnMask], timer);
      return;
    }
  }
}

void TimeWheel::cascade(uint32_t level, size_t index) {
  timer_node *timer = tvn_[level][index].first;
  tvn_[level][index].first = nullptr;
  while (timer) {
    timer_node *next_timer = timer->next;
    timer->next = nullptr;
    timer->pprev = nullptr;
    add(timer);
    timer = next_timer;
  }
}

void TimeWheel::Tick() {
  ++current_tick_;
  size_t index = current_tick_ & kTvrMask;
  if (index == 0) {
    for (uint32_t level = 0; level < kTvnLevels; ++level) {
      size_t slot = (current_tick_ >> (kTvrBits + kTvnBits * level)) & kTvnMask;
      cascade(level, slot);
      if (slot != 0)
        break;
    }
  }
  // 先将到期链表整体摘下，回调中重新添加的计时器不会在本刻度内被触发
  timer_node *timer = tv1_[index].first;
  tv1_[index].first = nullptr;
  if (timer)
    timer->pprev = &timer;
  while (timer) {
    timer_node *current = timer;
    timer = current->next;
    if (timer)
      timer->pprev = &timer;
    current->next = nullptr;
    current->pprev = nullptr;
    current->fired = true;
    current->callback();
  }
}

void TimeWheel::Update() {
  uint64_t now = get_current_millis();
  uint64_t target_ticks = (now - start_millis_) / tick_;
  while (current_tick_ < target_ticks)
    Tick();
}

} // namespace textsync
