// ============================================================================
// path_assembler.cpp — implementation for meshview/path_assembler.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "meshview/path_assembler.hpp"

#include <algorithm>
#include <cmath>

namespace meshview {

namespace {

enum class RouteMerge : uint8_t { Unchanged, Set, Extended, Conflict };

bool is_prefix(const std::vector<NodeNum>& a, const std::vector<NodeNum>& b) {
  return a.size() <= b.size() && std::equal(a.begin(), a.end(), b.begin());
}

// merge_route() — POLICY: append-only; first seen wins on divergence.
RouteMerge merge_route(std::vector<NodeNum>& route, std::vector<float>& snr,
                       const std::vector<NodeNum>& in_route, const std::vector<float>& in_snr) {
  if (in_route.empty()) return RouteMerge::Unchanged;
  if (route.empty()) {
    route = in_route;
    snr   = in_snr;
    return RouteMerge::Set;
  }
  if (is_prefix(in_route, route)) {                  // same or older partial copy
    if (in_route.size() == route.size() && in_snr.size() > snr.size()) snr = in_snr;
    return RouteMerge::Unchanged;
  }
  if (is_prefix(route, in_route)) {                  // later hop saw more of the path
    route = in_route;
    snr   = in_snr;
    return RouteMerge::Extended;
  }
  return RouteMerge::Conflict;
}

void hop_edges(const std::vector<NodeNum>& path, const std::vector<float>& snr,
               TimeUs at, std::vector<Edge>& out) {
  for (size_t i = 0; i + 1 < path.size(); ++i) {
    if (path[i] == path[i + 1]) continue;
    Edge e;
    e.from = path[i];
    e.to   = path[i + 1];
    e.kind = EdgeKind::Trace;
    if (i < snr.size() && !std::isnan(snr[i])) e.snr = snr[i];
    e.observed_at = at;
    out.push_back(e);
  }
}

} // namespace

/*
 * trace_input_from()
 * ------------------
 * POLICY: a response only carries a return route when the firmware filled
 *         route_back or snr_back; older firmware sends neither.
 */
TraceInput trace_input_from(const DecodedEnvelope& env, const TraceRecord& rec) {
  TraceInput in;
  in.gateway     = env.gateway;
  in.observed_at = env.received_at;
  in.response    = rec.is_response;

  if (rec.is_response) {
    in.key       = PacketKey{env.request_id, env.to};
    in.requester = env.to;
    in.target    = env.from;

    in.forward.push_back(in.requester);
    in.forward.insert(in.forward.end(), rec.route.begin(), rec.route.end());
    in.forward.push_back(in.target);
    in.snr_towards.assign(rec.snr_towards.begin(), rec.snr_towards.end());

    if (!rec.route_back.empty() || !rec.snr_back.empty()) {
      in.back.push_back(in.target);
      in.back.insert(in.back.end(), rec.route_back.begin(), rec.route_back.end());
      in.back.push_back(in.requester);
      in.snr_back.assign(rec.snr_back.begin(), rec.snr_back.end());
    }
  } else {
    in.key       = PacketKey{env.packet_id, env.from};
    in.requester = env.from;
    in.target    = env.to;

    in.forward.push_back(in.requester);
    in.forward.insert(in.forward.end(), rec.route.begin(), rec.route.end());
    in.snr_towards.assign(rec.snr_towards.begin(), rec.snr_towards.end());
  }
  return in;
}

TraceOutcome merge_trace(Traceroute& rec, bool exists, const TraceInput& in) {
  TraceOutcome out;
  if (!exists) {
    rec.key         = in.key;
    rec.gateway     = in.gateway;
    rec.import_time = in.observed_at;
    out.created     = true;
  }
  if (rec.target == 0) rec.target = in.target;

  const RouteMerge f = merge_route(rec.route, rec.snr_towards, in.forward, in.snr_towards);
  const RouteMerge b = merge_route(rec.route_back, rec.snr_back, in.back, in.snr_back);

  out.forward_changed = (f == RouteMerge::Set || f == RouteMerge::Extended);
  out.back_changed    = (b == RouteMerge::Set || b == RouteMerge::Extended);
  out.conflict        = (f == RouteMerge::Conflict || b == RouteMerge::Conflict);

  if (in.response && !rec.done) {
    rec.done      = true;
    out.completed = true;
  }
  if (out.changed()) {
    rec.updated_at = std::max(rec.updated_at, in.observed_at);
  }

  out.edges = trace_edges(rec);
  return out;
}

std::vector<Edge> trace_edges(const Traceroute& rec) {
  std::vector<Edge> out;
  hop_edges(rec.route, rec.snr_towards, rec.updated_at, out);
  hop_edges(rec.route_back, rec.snr_back, rec.updated_at, out);
  return out;
}

StoreStatus PathAssembler::assemble(const TraceInput& in, TraceOutcome& out) {
  TraceOutcome result;
  const StoreStatus st = store_.update_traceroute(in.key, [&](Traceroute& rec, bool exists) {
    result = merge_trace(rec, exists, in);
    return result.changed();
  });
  if (st == StoreStatus::Ok) out = std::move(result);
  return st;
}

} // namespace meshview
