// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef TEXTSYNC_CORE_TIMER_H_
#define TEXTSYNC_CORE_TIMER_H_

#include <cstddef>
#include <cstdint>
#include <functional>

namespace textsync {

namespace {
// 第一层时间轮256个槽位，其余四层各64个槽位
constexpr static uint32_t kTvrBits = 8;
constexpr static uint32_t kTvrSize = 1 << kTvrBits;
constexpr static uint32_t kTvrMask = kTvrSize - 1;
constexpr static uint32_t kTvnBits = 6;
constexpr static uint32_t kTvnSize = 1 << kTvnBits;
constexpr static uint32_t kTvnMask = kTvnSize - 1;
constexpr static uint32_t kTvnLevels = 4;
} // namespace

// 分层时间轮，只在所属事件循环线程中使用
class TimeWheel {
public:
  using TimerCallBack = std::function<void()>;
  // 时间轮间隔，单位毫秒
  explicit TimeWheel(uint32_t tick = 100);
  ~TimeWheel() = default;

  TimeWheel(const TimeWheel &) = delete;
  TimeWheel &operator=(const TimeWheel &) = delete;

  struct timer_node {
    uint64_t expires{0};
    TimerCallBack callback;
    timer_node *next{nullptr};
    timer_node **pprev{nullptr};
    bool fired{false};

    explicit timer_node(TimerCallBack cb) : callback(std::move(cb)) {}
    // 节点销毁时从链表中摘除，防止破坏链表结构
    ~timer_node() { unlink(); }
    timer_node(const timer_node &) = delete;
    timer_node &operator=(const timer_node &) = delete;

    inline bool IsFired() const { return fired; }
    inline bool IsPending() const { return pprev != nullptr; }

    void unlink() {
      if (pprev)
        *pprev = next;
      if (next)
        next->pprev = pprev;
      next = nullptr;
      pprev = nullptr;
    }
  };

  // 取消一个未触发的计时器，已取消或已触发时什么都不做
  static void Cancel(timer_node *timer) { timer->unlink(); }

  // 添加一个n毫秒后触发的计时器，若计时器已在等待则重新计时
  void AddTimer(timer_node *timer, uint32_t millis);

  // 推进一个刻度，触发到期的计时器
  void Tick();

  // 根据当前时间推进到应到达的刻度
  void Update();

  inline uint32_t tick() const { return tick_; }

private:
  struct timer_head {
    timer_node *first{nullptr};
  };

  void add(timer_node *timer);

  // 将高层时间轮中的一个槽位重新分配到低层
  void cascade(uint32_t level, size_t index);

  static void insert(timer_head *head, timer_node *timer);

  timer_head tv1_[kTvrSize];
  timer_head tvn_[kTvnLevels][kTvnSize];

  uint64_t current_tick_{0};
  uint64_t start_millis_;
  uint32_t tick_;
};

} // namespace textsync

#endif
