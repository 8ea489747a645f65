/**
 * @page mv-listener Transport Listener
 * @file listener.hpp
 * @brief Persistent broker subscription with reconnect/backoff, feeding a bounded raw queue.
 *
 * @details
 * PURPOSE
 * -------
 * The listener is the only component that talks to the broker. It owns one
 * logical subscription (a set of topic filters) and keeps it alive for the
 * lifetime of the process.
 *
 * WHAT THIS DOES
 * --------------
 * - Runs on its own thread: connect, subscribe every filter, then poll.
 * - Every delivery becomes a RawMessage stamped with the local receive time
 *   and is pushed into the raw BoundedQueue. A full queue drops its oldest
 *   message (counted by the queue); the broker client is never stalled.
 * - On connection loss or a failed attempt it waits
 *   `min(reconnect_max, reconnect_min * 2^failures)` and tries again,
 *   forever, until stop(). A successful subscribe resets the backoff.
 * - Resubscribes every filter after each reconnect. Messages the broker did
 *   not deliver while disconnected are not recovered here.
 *
 * OBSERVABILITY
 * -------------
 * - `state()` is the current ConnState.
 * - `connects()`, `connection_losses()` and `received()` count transitions and
 *   deliveries.
 * - Transitions are logged (info on connect, warn on loss).
 */

#ifndef MESHVIEW_LISTENER_HPP
#define MESHVIEW_LISTENER_HPP

#include <stdint.h>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "meshview/bounded_queue.hpp"
#include "meshview/envelope.hpp"
#include "meshview/transport/broker_client.hpp"

namespace meshview {

struct ListenerConfig {
  transport::BrokerConfig broker;
  std::vector<std::string> topics{"msh/#"};
  uint32_t reconnect_min_ms{500};
  uint32_t reconnect_max_ms{30000};
  int      poll_timeout_ms{200};
};

/// Source of receive timestamps; swapped in tests.
using Clock = std::function<TimeUs()>;

/// Wall clock in microseconds since the Unix epoch.
TimeUs now_us();

class Listener {
public:
  Listener(transport::IBrokerClient& client, BoundedQueue<RawMessage>& out,
           ListenerConfig cfg, Clock clock = now_us);
  ~Listener();

  Listener(const Listener&) = delete;
  Listener& operator=(const Listener&) = delete;

  void start();
  /// Ask the loop to exit, interrupt any backoff wait, disconnect, join.
  void stop();

  transport::ConnState state() const { return state_.load(); }
  uint64_t connects() const { return connects_.load(); }
  uint64_t connection_losses() const { return losses_.load(); }
  uint64_t received() const { return received_.load(); }

  /// Backoff before attempt number @p failures (0 = first retry).
  uint32_t backoff_ms(uint32_t failures) const;

private:
  void run();
  bool connect_and_subscribe();
  void wait_backoff(uint32_t ms);
  void on_message(const std::string& topic, const uint8_t* data, size_t len);
  void set_state(transport::ConnState st);

  transport::IBrokerClient& client_;
  BoundedQueue<RawMessage>& out_;
  const ListenerConfig cfg_;
  Clock clock_;

  std::thread thread_;
  std::atomic<bool> stop_{false};
  std::mutex wait_mu_;
  std::condition_variable wait_cv_;

  std::atomic<transport::ConnState> state_{transport::ConnState::Idle};
  std::atomic<uint64_t> connects_{0};
  std::atomic<uint64_t> losses_{0};
  std::atomic<uint64_t> received_{0};
};

} // namespace meshview

#endif // MESHVIEW_LISTENER_HPP
