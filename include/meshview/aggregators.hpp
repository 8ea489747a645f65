/**
 * @file aggregators.hpp
 * @brief Read-side graph and traffic aggregation over a Store.
 *
 * @details
 * These run on the reader's thread, never inside ingestion.
 *
 * - `build_graph()` collects trace edges from traceroutes and neighbor edges
 *   (`neighbor -> reporter`) from neighbor-info packets in a time window,
 *   then keeps one edge per `(from, to)`: the most recent `observed_at`
 *   wins. Output is sorted by `(from, to)`.
 * - `top_traffic()` / `node_traffic()` forward to the store's index-backed
 *   windowed queries with a default 24 hour window.
 */

#ifndef MESHVIEW_AGGREGATORS_HPP
#define MESHVIEW_AGGREGATORS_HPP

#include <stddef.h>
#include <vector>

#include "meshview/store.hpp"
#include "meshview/types.hpp"

namespace meshview {

static constexpr TimeUs DAY_US = 24LL * 3600LL * 1000000LL;

struct Graph {
  std::vector<NodeNum> nodes;   ///< every node id touched by an edge, ascending
  std::vector<Edge>    edges;
};

/// Keep the newest edge per (from, to); sorted by (from, to).
std::vector<Edge> dedup_edges(const std::vector<Edge>& edges);

Graph build_graph(const Store& store, TimeUs since);

std::vector<TrafficRow> top_traffic(const Store& store, TimeUs now, size_t limit, TimeUs window = DAY_US);

std::vector<PortCount> node_traffic(const Store& store, NodeNum id, TimeUs now, TimeUs window = DAY_US);

} // namespace meshview

#endif // MESHVIEW_AGGREGATORS_HPP
