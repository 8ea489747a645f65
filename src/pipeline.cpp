// ============================================================================
// pipeline.cpp — implementation for meshview/pipeline.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "meshview/pipeline.hpp"
#include "meshview/distance.hpp"
#include "meshview/log.hpp"
#include "meshview/node_merge.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace meshview {

const char* process_outcome_name(ProcessOutcome o) {
  switch (o) {
    case ProcessOutcome::Stored:        return "stored";
    case ProcessOutcome::Duplicate:     return "duplicate";
    case ProcessOutcome::Opaque:        return "opaque";
    case ProcessOutcome::Ignored:       return "ignored";
    case ProcessOutcome::BadTopic:      return "bad_topic";
    case ProcessOutcome::DecodeFailed:  return "decode_failed";
    case ProcessOutcome::PayloadFailed: return "payload_failed";
    case ProcessOutcome::StoreDropped:  return "store_dropped";
  }
  return "stored";
}

// ---------- helpers ----------

static std::string packet_ref(const PacketKey& k) {
  return node_id_to_hex(k.from) + "/" + std::to_string(k.packet_id);
}

static Packet packet_from(const DecodedEnvelope& env, bool opaque) {
  Packet p;
  p.key           = PacketKey{env.packet_id, env.from};
  p.to            = env.to;
  p.channel       = env.channel;
  p.payload       = env.inner_payload;
  p.encrypted     = opaque;
  p.want_response = env.want_response;
  p.request_id    = env.request_id;
  p.import_time   = env.received_at;
  if (!opaque) p.portnum = env.portnum;
  return p;
}

static PacketSeen seen_from(const DecodedEnvelope& env) {
  PacketSeen s;
  s.key         = SeenKey{PacketKey{env.packet_id, env.from}, env.gateway};
  s.channel     = env.channel;
  s.topic       = env.topic;
  s.rx_snr      = env.snr;
  s.rx_rssi     = env.rssi;
  s.hop_limit   = env.hop_limit;
  s.hop_start   = env.hop_start;
  s.hop_count   = hop_count(env.hop_start, env.hop_limit);
  s.rx_time     = env.rx_time;
  s.import_time = env.received_at;
  return s;
}

static std::string long_name_of(const std::optional<Node>& n) {
  if (!n || !n->long_name.value) return std::string();
  return std::string(n->long_name.value->c_str());
}

// ---------- public ----------

Pipeline::Pipeline(const PipelineConfig& cfg, Store& store, const ChannelKeys& keys,
                   LiveHub& hub, PipelineCounters& counters)
: cfg_(cfg), store_(store), keys_(keys), hub_(hub), counters_(counters), paths_(store),
  sleep_([](uint32_t ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }) {}

Pipeline::~Pipeline() {
  stop();
}

void Pipeline::start(BoundedQueue<RawMessage>& in) {
  if (!workers_.empty()) return;
  in_ = &in;
  const unsigned n = std::max(1u, cfg_.workers);
  for (unsigned i = 0; i < n; ++i) workers_.emplace_back([this] { worker_loop(); });
}

void Pipeline::stop() {
  if (in_) in_->close();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
  workers_.clear();
}

void Pipeline::worker_loop() {
  RawMessage raw;
  while (in_->pop_wait(raw)) {          // false once closed and drained
    const ProcessOutcome o = process(raw);
    LogLine(LogLevel::Debug, "message").kv("topic", raw.topic).kv("outcome", process_outcome_name(o));
  }
}

/*
 * process()
 * ---------
 * See the processing order table in pipeline.hpp. Every early return is a
 * local decision; nothing here propagates to the caller except the outcome.
 */
ProcessOutcome Pipeline::process(const RawMessage& raw) {
  ++counters_.processed;

  DecodedEnvelope env;
  std::string err;
  const DecodeStatus ds = decode_envelope(raw, keys_, env, err);

  if (ds == DecodeStatus::BadTopic || ds == DecodeStatus::Malformed) {
    LogLine(LogLevel::Debug, "envelope_rejected").kv("status", decode_status_name(ds))
      .kv("topic", raw.topic).kv("bytes", raw.payload.size()).kv("reason", err);
    if (ds == DecodeStatus::BadTopic) {
      ++counters_.bad_topic;
      return ProcessOutcome::BadTopic;
    }
    ++counters_.decode_failures;
    return ProcessOutcome::DecodeFailed;
  }

  // POLICY: id 0 carries no identity; ignore list drops known-noisy senders.
  if (env.packet_id == 0 || cfg_.ignore_from.count(env.from) != 0) {
    ++counters_.ignored;
    return ProcessOutcome::Ignored;
  }

  RecordResult rr;
  if (ds == DecodeStatus::Opaque) {
    ++counters_.undecryptable;
    LogLine(LogLevel::Debug, "undecryptable").kv("packet", packet_ref(PacketKey{env.packet_id, env.from}))
      .kv("channel", env.channel.c_str()).kv("gateway", node_id_to_hex(env.gateway));
    if (!record(env, /*opaque*/true, rr)) return ProcessOutcome::StoreDropped;
    if (rr.dedup_noop()) ++counters_.dedup_noops;
    return ProcessOutcome::Opaque;
  }

  KindRecord rec;
  if (!decode_kind(env, rec, err)) {
    if (!record(env, /*opaque*/false, rr)) return ProcessOutcome::StoreDropped;
    if (rr.dedup_noop()) {                         // same gateway again: already counted once
      ++counters_.dedup_noops;
      return ProcessOutcome::Duplicate;
    }
    ++counters_.payload_decode_failures;
    LogLine(LogLevel::Debug, "payload_decode_failed").kv("packet", packet_ref(PacketKey{env.packet_id, env.from}))
      .kv("kind", kind_name(env.kind)).kv("reason", err);
    return ProcessOutcome::PayloadFailed;
  }

  if (!record(env, /*opaque*/false, rr)) return ProcessOutcome::StoreDropped;
  if (rr.dedup_noop()) {
    ++counters_.dedup_noops;
    return ProcessOutcome::Duplicate;
  }

  // node state: sender only; every packet advances last_seen
  const NodeObservation obs = observation_from(env, rec);
  store_call("merge_node", PacketKey{env.packet_id, env.from}, [&] { return store_.merge_node(obs); });

  if (const auto* tr = std::get_if<TraceRecord>(&rec)) {
    const TraceInput in = trace_input_from(env, *tr);
    TraceOutcome outcome;
    const StoreStatus st = store_call("update_traceroute", in.key, [&] { return paths_.assemble(in, outcome); });
    if (st == StoreStatus::Ok && outcome.conflict) {
      ++counters_.anomalies;
      LogLine(LogLevel::Warn, "traceroute_conflict").kv("trace", packet_ref(in.key))
        .kv("gateway", node_id_to_hex(env.gateway)).kv("hops", in.forward.size());
    }
  }

  hub_.publish(build_event(env, rec, rr.packet_inserted));
  ++counters_.events_published;
  return ProcessOutcome::Stored;
}

// ---------- private ----------

bool Pipeline::record(const DecodedEnvelope& env, bool opaque, RecordResult& out) {
  const Packet     p = packet_from(env, opaque);
  const PacketSeen s = seen_from(env);
  return store_call("record_packet", p.key, [&] { return store_.record_packet(p, s, out); }) == StoreStatus::Ok;
}

/*
 * store_call()
 * ------------
 * POLICY: Busy -> sleep backoff, double it, retry; at most store_max_attempts tries.
 *         Failed -> no retry.
 * OUT:    final status; drops are counted and logged here.
 */
StoreStatus Pipeline::store_call(const char* op, const PacketKey& key, const std::function<StoreStatus()>& fn) {
  const uint32_t attempts = std::max<uint32_t>(1, cfg_.store_max_attempts);
  uint32_t delay = cfg_.store_backoff_ms;
  StoreStatus st = StoreStatus::Failed;

  for (uint32_t i = 1; i <= attempts; ++i) {
    st = fn();
    if (st != StoreStatus::Busy || i == attempts) break;
    ++counters_.store_retries;
    sleep_(delay);
    delay = std::min<uint32_t>(delay * 2, 60000);
  }

  if (st == StoreStatus::Ok) note_store_success();
  else note_store_drop(op, key, st);
  return st;
}

void Pipeline::note_store_success() {
  if (consecutive_drops_.exchange(0) == 0) return;
  if (counters_.degraded.exchange(false)) {
    LogLine(LogLevel::Info, "health_recovered");
  }
}

void Pipeline::note_store_drop(const char* op, const PacketKey& key, StoreStatus st) {
  ++counters_.store_drops;
  LogLine(LogLevel::Warn, "store_drop").kv("op", op).kv("packet", packet_ref(key))
    .kv("status", store_status_name(st)).kv("attempts", cfg_.store_max_attempts);

  const uint32_t n = ++consecutive_drops_;
  if (n >= std::max<uint32_t>(1, cfg_.store_degraded_threshold) && !counters_.degraded.exchange(true)) {
    LogLine(LogLevel::Error, "health_degraded").kv("consecutive_drops", n);
  }
}

NormalizedEvent Pipeline::build_event(const DecodedEnvelope& env, const KindRecord& rec, bool first_sighting) const {
  NormalizedEvent ev;
  ev.key            = PacketKey{env.packet_id, env.from};
  ev.to             = env.to;
  ev.gateway        = env.gateway;
  ev.channel        = env.channel;
  ev.kind           = env.kind;
  ev.portnum        = env.portnum;
  ev.record         = rec;
  ev.rssi           = env.rssi;
  ev.snr            = env.snr;
  ev.hop_count      = hop_count(env.hop_start, env.hop_limit);
  ev.first_sighting = first_sighting;
  ev.received_at    = env.received_at;

  const auto from_node = store_.get_node(env.from);
  const auto gw_node   = (env.gateway == env.from) ? from_node : store_.get_node(env.gateway);
  ev.from_long_name    = long_name_of(from_node);
  if (from_node && from_node->short_name.value) ev.from_short_name = from_node->short_name.value->c_str();
  ev.gateway_long_name = long_name_of(gw_node);
  if (env.to != NODENUM_BROADCAST) ev.to_long_name = long_name_of(store_.get_node(env.to));

  const std::optional<Position> from_pos = from_node ? from_node->position.value : std::nullopt;
  const std::optional<Position> gw_pos   = gw_node   ? gw_node->position.value   : std::nullopt;
  ev.distance_km = distance_km(from_pos, gw_pos);
  return ev;
}

} // namespace meshview
