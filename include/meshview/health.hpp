/**
 * @file health.hpp
 * @brief Pipeline counters and the point-in-time health snapshot built from them.
 *
 * @details
 * Counters are plain atomics bumped by whichever stage observes the event;
 * they are never reset while the process runs. A HealthSnapshot copies them
 * together with the listener state, raw queue drops and hub evictions so the
 * daemon can log or export one consistent-looking line.
 *
 * | counter                  | bumped when                                           |
 * |--------------------------|-------------------------------------------------------|
 * | processed                | a raw message reached a worker                        |
 * | bad_topic                | topic did not match the uplink layout                 |
 * | decode_failures          | envelope protobuf malformed/truncated                 |
 * | payload_decode_failures  | envelope fine, kind payload malformed                 |
 * | undecryptable            | recorded as opaque (no key / wrong key)               |
 * | ignored                  | packet id 0 or sender on the ignore list              |
 * | dedup_noops              | same gateway reported the same packet again           |
 * | store_retries            | a store call returned Busy and was retried            |
 * | store_drops              | retry budget exhausted or permanent failure           |
 * | anomalies                | conflicting traceroute for one key                    |
 */

#ifndef MESHVIEW_HEALTH_HPP
#define MESHVIEW_HEALTH_HPP

#include <stdint.h>
#include <atomic>

#include "meshview/transport/broker_client.hpp"

namespace meshview {

struct PipelineCounters {
  std::atomic<uint64_t> processed{0};
  std::atomic<uint64_t> bad_topic{0};
  std::atomic<uint64_t> decode_failures{0};
  std::atomic<uint64_t> payload_decode_failures{0};
  std::atomic<uint64_t> undecryptable{0};
  std::atomic<uint64_t> ignored{0};
  std::atomic<uint64_t> dedup_noops{0};
  std::atomic<uint64_t> store_retries{0};
  std::atomic<uint64_t> store_drops{0};
  std::atomic<uint64_t> anomalies{0};
  std::atomic<uint64_t> events_published{0};
  std::atomic<bool>     degraded{false};
};

struct HealthSnapshot {
  transport::ConnState connection{transport::ConnState::Idle};
  uint64_t connects{0};
  uint64_t connection_losses{0};
  uint64_t received{0};
  uint64_t raw_queue_drops{0};
  uint64_t processed{0};
  uint64_t bad_topic{0};
  uint64_t decode_failures{0};
  uint64_t payload_decode_failures{0};
  uint64_t undecryptable{0};
  uint64_t ignored{0};
  uint64_t dedup_noops{0};
  uint64_t store_retries{0};
  uint64_t store_drops{0};
  uint64_t anomalies{0};
  uint64_t events_published{0};
  uint64_t subscriber_evictions{0};
  uint64_t subscribers{0};
  bool     degraded{false};
};

/// Copy the pipeline-owned counters into @p out (other fields untouched).
void fill_counters(const PipelineCounters& c, HealthSnapshot& out);

/// Emit the snapshot as one `event=health` log line at info level.
void log_health(const HealthSnapshot& h);

} // namespace meshview

#endif // MESHVIEW_HEALTH_HPP
