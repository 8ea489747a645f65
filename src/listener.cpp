// ============================================================================
// listener.cpp — implementation for meshview/listener.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "meshview/listener.hpp"
#include "meshview/log.hpp"

#include <algorithm>
#include <chrono>

namespace meshview {

namespace transport {
const char* conn_state_name(ConnState st) {
  switch (st) {
    case ConnState::Idle:       return "idle";
    case ConnState::Connecting: return "connecting";
    case ConnState::Connected:  return "connected";
    case ConnState::Backoff:    return "backoff";
    case ConnState::Stopped:    return "stopped";
  }
  return "idle";
}
} // namespace transport

TimeUs now_us() {
  using namespace std::chrono;
  return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

Listener::Listener(transport::IBrokerClient& client, BoundedQueue<RawMessage>& out,
                   ListenerConfig cfg, Clock clock)
: client_(client), out_(out), cfg_(std::move(cfg)), clock_(std::move(clock)) {
  client_.set_message_handler([this](const std::string& topic, const uint8_t* data, size_t len) {
    on_message(topic, data, len);
  });
}

Listener::~Listener() {
  stop();
}

void Listener::start() {
  if (thread_.joinable()) return;               // already running
  stop_.store(false);
  thread_ = std::thread([this] { run(); });
}

void Listener::stop() {
  {
    std::lock_guard<std::mutex> lk(wait_mu_);
    stop_.store(true);
  }
  wait_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  set_state(transport::ConnState::Stopped);
}

// backoff_ms() — exponential, capped; shift bounded so it never overflows.
uint32_t Listener::backoff_ms(uint32_t failures) const {
  const uint32_t lo = std::max<uint32_t>(1, cfg_.reconnect_min_ms);
  const uint32_t hi = std::max(lo, cfg_.reconnect_max_ms);
  const uint32_t shift = std::min<uint32_t>(failures, 20);
  const uint64_t ms = static_cast<uint64_t>(lo) << shift;
  return static_cast<uint32_t>(std::min<uint64_t>(ms, hi));
}

void Listener::set_state(transport::ConnState st) {
  state_.store(st);
}

// on_message() — runs on the listener thread inside client_.poll(); hand off only.
void Listener::on_message(const std::string& topic, const uint8_t* data, size_t len) {
  RawMessage m;
  m.topic = topic;
  m.payload.assign(data, data + len);
  m.received_at = clock_();
  ++received_;
  if (!out_.push(std::move(m))) {
    LogLine(LogLevel::Debug, "raw_queue_overflow")
      .kv("capacity", out_.capacity())
      .kv("dropped_total", out_.evictions());
  }
}

/*
 * connect_and_subscribe()
 * -----------------------
 * PRE:  not connected
 * OUT:  true when connected and every filter accepted
 * NOTE: a partial subscribe counts as a failure; the connection is dropped so
 *       the next attempt starts clean.
 */
bool Listener::connect_and_subscribe() {
  set_state(transport::ConnState::Connecting);

  std::string err;
  const transport::ConnResult cr = client_.connect(cfg_.broker, err);
  if (cr != transport::ConnResult::Ok) {
    LogLine(LogLevel::Warn, "broker_connect_failed")
      .kv("host", cfg_.broker.host).kv("port", cfg_.broker.port)
      .kv("client", client_.name()).kv("reason", err);
    return false;
  }

  for (const auto& filter : cfg_.topics) {
    if (!client_.subscribe(filter, err)) {
      LogLine(LogLevel::Warn, "broker_subscribe_failed").kv("topic", filter).kv("reason", err);
      client_.disconnect();
      return false;
    }
  }

  ++connects_;
  set_state(transport::ConnState::Connected);
  LogLine(LogLevel::Info, "broker_connected")
    .kv("host", cfg_.broker.host).kv("port", cfg_.broker.port)
    .kv("topics", cfg_.topics.size()).kv("connects", connects_.load());
  return true;
}

void Listener::wait_backoff(uint32_t ms) {
  set_state(transport::ConnState::Backoff);
  std::unique_lock<std::mutex> lk(wait_mu_);
  wait_cv_.wait_for(lk, std::chrono::milliseconds(ms), [this] { return stop_.load(); });
}

void Listener::run() {
  uint32_t failures = 0;

  while (!stop_.load()) {
    if (!connect_and_subscribe()) {
      const uint32_t ms = backoff_ms(failures);
      if (failures < UINT32_MAX) ++failures;
      LogLine(LogLevel::Debug, "broker_backoff").kv("wait_ms", ms).kv("failures", failures);
      wait_backoff(ms);
      continue;
    }
    failures = 0;                                  // healthy session resets backoff

    std::string err;
    while (!stop_.load()) {
      if (client_.poll(cfg_.poll_timeout_ms, err) == transport::PollResult::Lost) break;
    }
    client_.disconnect();

    if (stop_.load()) break;
    ++losses_;
    LogLine(LogLevel::Warn, "broker_connection_lost").kv("reason", err).kv("losses", losses_.load());
    wait_backoff(backoff_ms(failures++));
  }

  set_state(transport::ConnState::Stopped);
}

} // namespace meshview
