// ============================================================================
// health.cpp — implementation for meshview/health.hpp
// ============================================================================
#include "meshview/health.hpp"
#include "meshview/log.hpp"

namespace meshview {

void fill_counters(const PipelineCounters& c, HealthSnapshot& out) {
  out.processed               = c.processed.load();
  out.bad_topic               = c.bad_topic.load();
  out.decode_failures         = c.decode_failures.load();
  out.payload_decode_failures = c.payload_decode_failures.load();
  out.undecryptable           = c.undecryptable.load();
  out.ignored                 = c.ignored.load();
  out.dedup_noops             = c.dedup_noops.load();
  out.store_retries           = c.store_retries.load();
  out.store_drops             = c.store_drops.load();
  out.anomalies               = c.anomalies.load();
  out.events_published        = c.events_published.load();
  out.degraded                = c.degraded.load();
}

void log_health(const HealthSnapshot& h) {
  LogLine(LogLevel::Info, "health")
    .kv("conn", transport::conn_state_name(h.connection))
    .kv("connects", h.connects)
    .kv("losses", h.connection_losses)
    .kv("received", h.received)
    .kv("raw_drops", h.raw_queue_drops)
    .kv("processed", h.processed)
    .kv("bad_topic", h.bad_topic)
    .kv("decode_failures", h.decode_failures)
    .kv("payload_decode_failures", h.payload_decode_failures)
    .kv("undecryptable", h.undecryptable)
    .kv("ignored", h.ignored)
    .kv("dedup_noops", h.dedup_noops)
    .kv("store_retries", h.store_retries)
    .kv("store_drops", h.store_drops)
    .kv("anomalies", h.anomalies)
    .kv("events", h.events_published)
    .kv("evictions", h.subscriber_evictions)
    .kv("subscribers", h.subscribers)
    .kv("degraded", h.degraded ? "true" : "false");
}

} // namespace meshview
