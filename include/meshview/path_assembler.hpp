/**
 * @page mv-path Path Assembler
 * @file path_assembler.hpp
 * @brief Rebuild traceroute records from path-trace payloads and derive edges.
 *
 * @details
 * PURPOSE
 * -------
 * A traceroute is a request/response pair. Gateways along the way uplink
 * either half, sometimes both, sometimes several partial copies of the
 * request taken at different hops. This module folds all of them into a
 * single Traceroute record per request.
 *
 * KEYING
 * ------
 * | payload  | record key                    | requester | target |
 * |----------|-------------------------------|-----------|--------|
 * | request  | (packet id, from)             | from      | to     |
 * | response | (request_id, to)              | to        | from   |
 *
 * PATHS
 * -----
 * @code
 *   forward = [requester] + route + [target]      // target appended once answered
 *   back    = [target] + route_back + [requester] // response only
 * @endcode
 *
 * MERGE RULES (per direction)
 * ---------------------------
 * - empty stored route: take the incoming one.
 * - identical, or incoming is a prefix of stored: nothing to do.
 * - stored is a proper prefix of incoming: extend (append-only).
 * - anything else: conflict. The stored route is kept (first seen wins),
 *   the outcome is flagged so the caller counts an anomaly.
 *
 * A route, once written, is never shortened or replaced.
 */

#ifndef MESHVIEW_PATH_ASSEMBLER_HPP
#define MESHVIEW_PATH_ASSEMBLER_HPP

#include <vector>

#include "meshview/types.hpp"
#include "meshview/envelope.hpp"
#include "meshview/payloads.hpp"
#include "meshview/store.hpp"

namespace meshview {

/// Normalized view of one path-trace payload, already keyed and framed.
struct TraceInput {
  PacketKey key;
  NodeNum   requester{0};
  NodeNum   target{0};
  NodeNum   gateway{0};
  std::vector<NodeNum> forward;        ///< empty = payload carries no forward route
  std::vector<float>   snr_towards;
  std::vector<NodeNum> back;           ///< empty = payload carries no return route
  std::vector<float>   snr_back;
  bool   response{false};
  TimeUs observed_at{0};
};

struct TraceOutcome {
  bool created{false};
  bool forward_changed{false};
  bool back_changed{false};
  bool completed{false};               ///< first response seen for this request
  bool conflict{false};                ///< anomaly: differing route for the same key
  std::vector<Edge> edges;             ///< edges of the record after the merge

  bool changed() const { return created || forward_changed || back_changed || completed; }
};

TraceInput trace_input_from(const DecodedEnvelope& env, const TraceRecord& rec);

/// Pure merge of @p in into @p rec. Returns what changed.
TraceOutcome merge_trace(Traceroute& rec, bool exists, const TraceInput& in);

/// Consecutive-hop edges of both directions, SNR taken from the matching hop.
std::vector<Edge> trace_edges(const Traceroute& rec);

class PathAssembler {
public:
  explicit PathAssembler(Store& store) : store_(store) {}

  /// Merge @p in into the stored record atomically. @p out is valid when Ok.
  StoreStatus assemble(const TraceInput& in, TraceOutcome& out);

private:
  Store& store_;
};

} // namespace meshview

#endif // MESHVIEW_PATH_ASSEMBLER_HPP
