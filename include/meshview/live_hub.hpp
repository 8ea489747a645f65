/**
 * @page mv-live Live Distribution Hub
 * @file live_hub.hpp
 * @brief Fan-out of processed-packet events to live viewers with per-subscriber backpressure.
 *
 * @details
 * PURPOSE
 * -------
 * Live views (a map, a packet ticker) want every processed packet as it
 * happens. Viewers are slow, disconnect without notice, or stop reading.
 * Ingestion must not notice any of that.
 *
 * WHAT THIS DOES
 * --------------
 * - `subscribe()` hands out a Subscription owning a BoundedQueue of
 *   NormalizedEvent with the hub's configured capacity.
 * - `publish(event)` copies the event into every live subscription. It never
 *   blocks on a subscriber: a full queue drops its oldest event and bumps
 *   that subscription's eviction counter.
 * - `unsubscribe(sub)` (or dropping the last shared_ptr and calling
 *   `prune()`) removes the subscription and closes its queue; a reader
 *   blocked in `next()` wakes up with false.
 *
 * OWNERSHIP
 * ---------
 * Only the subscriber reads its queue. The hub holds a shared_ptr so a queue
 * outlives neither side unexpectedly; the hub lock is held only to copy the
 * subscriber list, never while pushing into a queue.
 */

#ifndef MESHVIEW_LIVE_HUB_HPP
#define MESHVIEW_LIVE_HUB_HPP

#include <stdint.h>
#include <stddef.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "meshview/types.hpp"
#include "meshview/envelope.hpp"
#include "meshview/payloads.hpp"
#include "meshview/bounded_queue.hpp"

namespace meshview {

/// What a live viewer receives for one processed observation.
struct NormalizedEvent {
  PacketKey   key;
  NodeNum     to{0};
  NodeNum     gateway{0};
  ChannelStr  channel;
  MessageKind kind{MessageKind::Unknown};
  uint32_t    portnum{0};
  KindRecord  record;
  std::string from_long_name;
  std::string from_short_name;
  std::string to_long_name;
  std::string gateway_long_name;
  std::optional<int32_t>  rssi;
  std::optional<float>    snr;
  std::optional<uint32_t> hop_count;
  std::optional<double>   distance_km;   ///< sender to gateway, when both positions are known
  bool   first_sighting{false};          ///< canonical packet created by this observation
  TimeUs received_at{0};
};

class Subscription {
public:
  Subscription(uint64_t id, size_t capacity) : id_(id), queue_(capacity) {}

  uint64_t id() const { return id_; }

  /// Block up to @p timeout for the next event. False on timeout or once closed and drained.
  template <typename Rep, typename Period>
  bool next(NormalizedEvent& out, const std::chrono::duration<Rep, Period>& timeout) {
    return queue_.pop_for(out, timeout);
  }

  bool try_next(NormalizedEvent& out) { return queue_.try_pop(out); }

  size_t   pending()   const { return queue_.size(); }
  size_t   capacity()  const { return queue_.capacity(); }
  uint64_t evictions() const { return queue_.evictions(); }
  bool     closed()    const { return queue_.closed(); }

private:
  friend class LiveHub;

  void deliver(const NormalizedEvent& ev) { queue_.push(ev); }
  void close() { queue_.close(); }

  const uint64_t id_;
  BoundedQueue<NormalizedEvent> queue_;
};

class LiveHub {
public:
  explicit LiveHub(size_t subscriber_capacity);

  std::shared_ptr<Subscription> subscribe();
  void unsubscribe(const std::shared_ptr<Subscription>& sub);

  /// Drop subscriptions nobody but the hub references any more.
  size_t prune();

  /// Deliver to every subscriber. Returns the number of subscribers reached.
  size_t publish(const NormalizedEvent& ev);

  size_t   subscriber_count() const;
  /// Evictions across live and already-removed subscriptions.
  uint64_t total_evictions() const;
  uint64_t published() const { return published_.load(); }

private:
  void retire(const std::shared_ptr<Subscription>& sub);   // PRE: mu_ held

  const size_t capacity_;
  mutable std::mutex mu_;
  std::vector<std::shared_ptr<Subscription>> subs_;
  uint64_t next_id_{1};
  uint64_t retired_evictions_{0};
  std::atomic<uint64_t> published_{0};
};

} // namespace meshview

#endif // MESHVIEW_LIVE_HUB_HPP
