// ============================================================================
// live_hub.cpp — implementation for meshview/live_hub.hpp
// ============================================================================
#include "meshview/live_hub.hpp"

#include <algorithm>

namespace meshview {

LiveHub::LiveHub(size_t subscriber_capacity)
: capacity_(subscriber_capacity == 0 ? 1 : subscriber_capacity) {}

std::shared_ptr<Subscription> LiveHub::subscribe() {
  std::lock_guard<std::mutex> lk(mu_);
  auto sub = std::make_shared<Subscription>(next_id_++, capacity_);
  subs_.push_back(sub);
  return sub;
}

void LiveHub::retire(const std::shared_ptr<Subscription>& sub) {
  retired_evictions_ += sub->evictions();
  sub->close();                                   // wakes a reader blocked in next()
}

void LiveHub::unsubscribe(const std::shared_ptr<Subscription>& sub) {
  if (!sub) return;
  std::lock_guard<std::mutex> lk(mu_);
  auto it = std::find(subs_.begin(), subs_.end(), sub);
  if (it == subs_.end()) return;                  // already removed
  retire(*it);
  subs_.erase(it);
}

size_t LiveHub::prune() {
  std::lock_guard<std::mutex> lk(mu_);
  size_t removed = 0;
  for (auto it = subs_.begin(); it != subs_.end();) {
    if (it->use_count() == 1) {                   // only the hub still holds it
      retire(*it);
      it = subs_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

// publish() — POLICY: snapshot under the hub lock, deliver outside it.
size_t LiveHub::publish(const NormalizedEvent& ev) {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard<std::mutex> lk(mu_);
    targets = subs_;
  }
  for (const auto& s : targets) s->deliver(ev);   // drop-oldest inside; never blocks
  ++published_;
  return targets.size();
}

size_t LiveHub::subscriber_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return subs_.size();
}

uint64_t LiveHub::total_evictions() const {
  std::lock_guard<std::mutex> lk(mu_);
  uint64_t n = retired_evictions_;
  for (const auto& s : subs_) n += s->evictions();
  return n;
}

} // namespace meshview
