// ============================================================================
// memory_store.cpp — implementation for meshview/memory_store.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "meshview/memory_store.hpp"

#include <algorithm>
#include <map>
#include <unordered_map>

namespace meshview {

StoreStatus MemoryStore::fault() const {
  return fault_hook_ ? fault_hook_() : StoreStatus::Ok;
}

// ---------- write side ----------

/*
 * record_packet()
 * ---------------
 * POLICY: first writer wins for canonical fields. The only mutation of an
 *         existing Packet is opaque -> decoded enrichment.
 * POLICY: one PacketSeen per gateway; a repeat from the same gateway is a no-op.
 */
StoreStatus MemoryStore::record_packet(const Packet& packet, const PacketSeen& seen, RecordResult& out) {
  ++write_calls_;
  const StoreStatus st = fault();
  if (st != StoreStatus::Ok) return st;

  out = RecordResult{};
  packets_.with_shard(packet.key, [&](auto& map) {
    auto it = map.find(packet.key);
    if (it == map.end()) {
      PacketEntry e;
      e.packet = packet;
      it = map.emplace(packet.key, std::move(e)).first;
      out.packet_inserted = true;
    } else {
      Packet& cur = it->second.packet;
      if (cur.encrypted && !packet.encrypted && packet.portnum) {   // append-only enrichment
        cur.portnum       = packet.portnum;
        cur.payload       = packet.payload;
        cur.encrypted     = false;
        cur.want_response = packet.want_response;
        cur.request_id    = packet.request_id;
        out.packet_enriched = true;
      }
    }

    auto& rows = it->second.seen;
    const bool have = std::any_of(rows.begin(), rows.end(), [&](const PacketSeen& r) {
      return r.key.gateway == seen.key.gateway;
    });
    if (!have) {
      rows.push_back(seen);
      out.seen_inserted = true;
    }
  });
  return StoreStatus::Ok;
}

StoreStatus MemoryStore::merge_node(const NodeObservation& obs) {
  ++write_calls_;
  const StoreStatus st = fault();
  if (st != StoreStatus::Ok) return st;

  nodes_.with_shard(obs.node_id, [&](auto& map) {
    Node& n = map[obs.node_id];
    n.node_id = obs.node_id;
    apply_observation(n, obs);
  });
  return StoreStatus::Ok;
}

StoreStatus MemoryStore::update_traceroute(const PacketKey& key, const TraceMutator& fn) {
  ++write_calls_;
  const StoreStatus st = fault();
  if (st != StoreStatus::Ok) return st;

  traces_.with_shard(key, [&](auto& map) {
    auto it = map.find(key);
    const bool exists = it != map.end();
    Traceroute rec = exists ? it->second : Traceroute{};
    rec.key = key;
    if (fn(rec, exists)) map[key] = std::move(rec);
  });
  return StoreStatus::Ok;
}

// ---------- read side ----------

std::optional<Node> MemoryStore::get_node(NodeNum id) const {
  return nodes_.with_shard(id, [&](const auto& map) -> std::optional<Node> {
    auto it = map.find(id);
    if (it == map.end()) return std::nullopt;
    return it->second;
  });
}

std::vector<Node> MemoryStore::list_nodes() const {
  std::vector<Node> out;
  nodes_.for_each([&](const NodeNum&, const Node& n) { out.push_back(n); });
  std::sort(out.begin(), out.end(), [](const Node& a, const Node& b) { return a.node_id < b.node_id; });
  return out;
}

std::optional<Packet> MemoryStore::get_packet(const PacketKey& key) const {
  return packets_.with_shard(key, [&](const auto& map) -> std::optional<Packet> {
    auto it = map.find(key);
    if (it == map.end()) return std::nullopt;
    return it->second.packet;
  });
}

std::vector<PacketSeen> MemoryStore::packets_seen(const PacketKey& key) const {
  return packets_.with_shard(key, [&](const auto& map) {
    auto it = map.find(key);
    return it == map.end() ? std::vector<PacketSeen>{} : it->second.seen;
  });
}

std::optional<Traceroute> MemoryStore::get_traceroute(const PacketKey& key) const {
  return traces_.with_shard(key, [&](const auto& map) -> std::optional<Traceroute> {
    auto it = map.find(key);
    if (it == map.end()) return std::nullopt;
    return it->second;
  });
}

std::vector<Traceroute> MemoryStore::traceroutes_since(TimeUs since) const {
  std::vector<Traceroute> out;
  traces_.for_each([&](const PacketKey&, const Traceroute& t) {
    if (t.import_time >= since) out.push_back(t);
  });
  std::sort(out.begin(), out.end(), [](const Traceroute& a, const Traceroute& b) {
    return a.import_time != b.import_time ? a.import_time < b.import_time : a.key < b.key;
  });
  return out;
}

std::vector<Packet> MemoryStore::packets_since(TimeUs since, std::optional<uint32_t> portnum) const {
  std::vector<Packet> out;
  packets_.for_each([&](const PacketKey&, const PacketEntry& e) {
    if (e.packet.import_time < since) return;
    if (portnum && e.packet.portnum != portnum) return;
    out.push_back(e.packet);
  });
  std::sort(out.begin(), out.end(), [](const Packet& a, const Packet& b) {
    return a.import_time != b.import_time ? a.import_time < b.import_time : a.key < b.key;
  });
  return out;
}

std::vector<TrafficRow> MemoryStore::top_traffic(TimeUs since, size_t limit) const {
  std::map<NodeNum, TrafficRow> acc;
  packets_.for_each([&](const PacketKey& k, const PacketEntry& e) {
    if (e.packet.import_time < since) return;
    TrafficRow& r = acc[k.from];
    r.node_id = k.from;
    r.packets_sent += 1;
    r.times_seen   += e.seen.size();
  });

  std::vector<TrafficRow> rows;
  rows.reserve(acc.size());
  for (auto& kv : acc) {
    if (auto n = get_node(kv.first)) {
      if (n->long_name.value)  kv.second.long_name  = n->long_name.value->c_str();
      if (n->short_name.value) kv.second.short_name = n->short_name.value->c_str();
    }
    rows.push_back(kv.second);
  }

  std::sort(rows.begin(), rows.end(), [](const TrafficRow& a, const TrafficRow& b) {
    return a.times_seen != b.times_seen ? a.times_seen > b.times_seen : a.node_id < b.node_id;
  });
  if (limit && rows.size() > limit) rows.resize(limit);
  return rows;
}

std::vector<PortCount> MemoryStore::node_traffic(NodeNum id, TimeUs since) const {
  std::map<uint32_t, uint64_t> acc;
  packets_.for_each([&](const PacketKey& k, const PacketEntry& e) {
    if (k.from != id || e.packet.import_time < since || !e.packet.portnum) return;
    ++acc[*e.packet.portnum];
  });

  std::vector<PortCount> out;
  for (const auto& kv : acc) out.push_back(PortCount{kv.first, kv.second});
  std::sort(out.begin(), out.end(), [](const PortCount& a, const PortCount& b) {
    return a.count != b.count ? a.count > b.count : a.portnum < b.portnum;
  });
  return out;
}

StoreCounts MemoryStore::counts() const {
  StoreCounts c;
  c.nodes       = nodes_.size();
  c.traceroutes = traces_.size();
  packets_.for_each([&](const PacketKey&, const PacketEntry& e) {
    ++c.packets;
    c.packets_seen += e.seen.size();
  });
  return c;
}

} // namespace meshview
