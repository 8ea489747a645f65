/**
 * @page mv-pipeline Ingest Pipeline
 * @file pipeline.hpp
 * @brief Decode workers: raw message -> envelope -> kind record -> store/merge/trace -> live event.
 *
 * @details
 * PURPOSE
 * -------
 * The pipeline is the middle of the data flow:
 *
 * @code
 *   Listener -> [raw queue] -> Pipeline workers -> Store / PathAssembler -> LiveHub
 * @endcode
 *
 * A pool of workers pops RawMessages and runs `process()` on each. Workers
 * share nothing but the Store, the (read-only) ChannelKeys, the LiveHub and
 * the atomic counters, so envelope decoding runs fully in parallel.
 *
 * PROCESSING ORDER (per message)
 * ------------------------------
 *  1. decode_envelope()      BadTopic / Malformed  -> count, drop
 *  2. ignore rules           packet id 0, ignore_from list -> count, drop
 *  3. Opaque                 record Packet(encrypted) + PacketSeen, stop
 *  4. decode_kind()          failure -> record Packet + PacketSeen, count, stop
 *  5. record_packet()        same-gateway repeat -> dedup no-op, stop
 *  6. merge_node()           field-level CAS for the sender
 *  7. PathAssembler          traceroute payloads only; conflicts -> anomaly
 *  8. distance + names       resolved from stored nodes
 *  9. LiveHub::publish()     never blocks
 *
 * FAULT ISOLATION
 * ---------------
 * Nothing in per-message processing throws out of a worker. Store calls
 * returning Busy are retried with exponential backoff up to
 * `store_max_attempts` tries; after that the write is dropped and counted.
 * `store_degraded_threshold` consecutive drops raise the degraded flag; the
 * next successful store call clears it.
 */

#ifndef MESHVIEW_PIPELINE_HPP
#define MESHVIEW_PIPELINE_HPP

#include <stdint.h>
#include <atomic>
#include <functional>
#include <thread>
#include <vector>

#include "meshview/bounded_queue.hpp"
#include "meshview/channel_keys.hpp"
#include "meshview/config.hpp"
#include "meshview/envelope.hpp"
#include "meshview/health.hpp"
#include "meshview/live_hub.hpp"
#include "meshview/path_assembler.hpp"
#include "meshview/payloads.hpp"
#include "meshview/store.hpp"

namespace meshview {

enum class ProcessOutcome : uint8_t {
  Stored = 0,        ///< new observation, semantic processing done, event published
  Duplicate,         ///< same gateway already reported it
  Opaque,            ///< recorded without a kind
  Ignored,
  BadTopic,
  DecodeFailed,      ///< envelope malformed; nothing written
  PayloadFailed,     ///< packet + observation recorded; kind payload malformed
  StoreDropped       ///< retry budget exhausted
};

const char* process_outcome_name(ProcessOutcome o);

class Pipeline {
public:
  using Sleeper = std::function<void(uint32_t ms)>;

  Pipeline(const PipelineConfig& cfg, Store& store, const ChannelKeys& keys,
           LiveHub& hub, PipelineCounters& counters);
  ~Pipeline();

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  /// Process one message synchronously on the calling thread.
  ProcessOutcome process(const RawMessage& raw);

  /// Spawn cfg.workers threads draining @p in.
  void start(BoundedQueue<RawMessage>& in);
  /// Close the input queue, let workers drain it, join.
  void stop();

  /// Replace the retry sleep (tests).
  void set_sleeper(Sleeper s) { sleep_ = std::move(s); }

private:
  StoreStatus store_call(const char* op, const PacketKey& key, const std::function<StoreStatus()>& fn);
  bool record(const DecodedEnvelope& env, bool opaque, RecordResult& out);
  void note_store_success();
  void note_store_drop(const char* op, const PacketKey& key, StoreStatus st);
  NormalizedEvent build_event(const DecodedEnvelope& env, const KindRecord& rec, bool first_sighting) const;
  void worker_loop();

  const PipelineConfig cfg_;
  Store& store_;
  const ChannelKeys& keys_;
  LiveHub& hub_;
  PipelineCounters& counters_;
  PathAssembler paths_;
  Sleeper sleep_;

  BoundedQueue<RawMessage>* in_{nullptr};
  std::vector<std::thread> workers_;
  std::atomic<uint32_t> consecutive_drops_{0};
};

} // namespace meshview

#endif // MESHVIEW_PIPELINE_HPP
