// ============================================================================
// aggregators.cpp — implementation for meshview/aggregators.hpp
// ============================================================================
#include "meshview/aggregators.hpp"
#include "meshview/envelope.hpp"
#include "meshview/log.hpp"
#include "meshview/path_assembler.hpp"
#include "meshview/payloads.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace meshview {

std::vector<Edge> dedup_edges(const std::vector<Edge>& edges) {
  std::map<std::pair<NodeNum, NodeNum>, Edge> best;
  for (const Edge& e : edges) {
    auto key = std::make_pair(e.from, e.to);
    auto it = best.find(key);
    if (it == best.end() || e.observed_at > it->second.observed_at) best[key] = e;
  }
  std::vector<Edge> out;
  out.reserve(best.size());
  for (const auto& kv : best) out.push_back(kv.second);   // map order = (from, to)
  return out;
}

Graph build_graph(const Store& store, TimeUs since) {
  std::vector<Edge> all;

  for (const Traceroute& t : store.traceroutes_since(since)) {
    const auto e = trace_edges(t);
    all.insert(all.end(), e.begin(), e.end());
  }

  for (const Packet& p : store.packets_since(since, port::NEIGHBORINFO)) {
    NeighborRecord nr;
    std::string err;
    if (!decode_neighbor_info(p.payload.data(), p.payload.size(), nr, err)) {
      LogLine(LogLevel::Debug, "graph_skip_neighborinfo")
        .kv("packet", node_id_to_hex(p.key.from) + "/" + std::to_string(p.key.packet_id)).kv("reason", err);
      continue;
    }
    const NodeNum reporter = nr.node_id ? nr.node_id : p.key.from;
    for (const NeighborEntry& n : nr.neighbors) {
      Edge e;
      e.from = n.node_id;
      e.to   = reporter;
      e.kind = EdgeKind::Neighbor;
      e.snr  = n.snr;
      e.observed_at = p.import_time;
      all.push_back(e);
    }
  }

  Graph g;
  g.edges = dedup_edges(all);
  std::set<NodeNum> ids;
  for (const Edge& e : g.edges) { ids.insert(e.from); ids.insert(e.to); }
  g.nodes.assign(ids.begin(), ids.end());
  return g;
}

std::vector<TrafficRow> top_traffic(const Store& store, TimeUs now, size_t limit, TimeUs window) {
  return store.top_traffic(now - window, limit);
}

std::vector<PortCount> node_traffic(const Store& store, NodeNum id, TimeUs now, TimeUs window) {
  return store.node_traffic(id, now - window);
}

} // namespace meshview
