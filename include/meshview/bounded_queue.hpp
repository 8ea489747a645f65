/**
 * @file bounded_queue.hpp
 * @brief Thread-safe FIFO with a hard capacity and a drop-oldest overflow policy.
 *
 * @details
 * PURPOSE
 * -------
 * The stages of the ingest pipeline are joined by bounded queues. A producer
 * must never stall on a slow consumer, so `push()` always succeeds: when the
 * queue is full the oldest queued item is evicted and an eviction counter is
 * bumped. Consumers block in `pop_wait()` / `pop_for()` until an item
 * arrives or the queue is closed.
 *
 * WHAT THIS DOES
 * --------------
 * - `push(item)`: append; evict front if at capacity. Returns false when the
 *   push evicted something (or the queue is closed and the item was refused).
 * - `pop_wait(out)`: block until an item or close(); false only once closed
 *   and drained.
 * - `pop_for(out, timeout)`: like pop_wait with a deadline.
 * - `try_pop(out)`: non-blocking.
 * - `close()`: wake every waiter; later pushes are refused.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Capacity is fixed at construction (>= 1) and never exceeded.
 * - Evictions and refused pushes are counted separately.
 */

#ifndef MESHVIEW_BOUNDED_QUEUE_HPP
#define MESHVIEW_BOUNDED_QUEUE_HPP

#include <stdint.h>
#include <stddef.h>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace meshview {

template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(size_t capacity)
  : capacity_(capacity == 0 ? 1 : capacity) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  bool push(T item) {
    bool evicted = false;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) { ++refused_; return false; }
      if (items_.size() >= capacity_) {       // POLICY: drop-oldest, never block the producer
        items_.pop_front();
        ++evictions_;
        evicted = true;
      }
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return !evicted;
  }

  bool pop_wait(T& out) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return closed_ || !items_.empty(); });
    return take(out);
  }

  template <typename Rep, typename Period>
  bool pop_for(T& out, const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [this] { return closed_ || !items_.empty(); });
    return take(out);
  }

  bool try_pop(T& out) {
    std::lock_guard<std::mutex> lk(mu_);
    return take(out);
  }

  void close() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return items_.size();
  }

  size_t capacity() const { return capacity_; }

  uint64_t evictions() const {
    std::lock_guard<std::mutex> lk(mu_);
    return evictions_;
  }

  uint64_t refused() const {
    std::lock_guard<std::mutex> lk(mu_);
    return refused_;
  }

private:
  // PRE: mu_ held.
  bool take(T& out) {
    if (items_.empty()) return false;
    out = std::move(items_.front());
    items_.pop_front();
    return true;
  }

  const size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> items_;
  bool closed_{false};
  uint64_t evictions_{0};
  uint64_t refused_{0};
};

} // namespace meshview

#endif // MESHVIEW_BOUNDED_QUEUE_HPP
