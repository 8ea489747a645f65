/**
 * @page mv-store Store Interface
 * @file store.hpp
 * @brief Authoring-of-record contract shared by every persistence backend.
 *
 * @details
 * PURPOSE
 * -------
 * The store is the only resource every pipeline stage shares. This header
 * fixes what a backend must guarantee so that the pipeline can stay
 * correct under duplicated, concurrent and out-of-order input:
 *
 * WRITE CONTRACT
 * --------------
 * - `record_packet()`: upsert-if-absent the canonical Packet keyed by
 *   `(packet_id, from)`, then upsert-if-absent the PacketSeen keyed by
 *   `(packet_id, from, gateway)`. An existing canonical row is kept; the
 *   only change ever made to it is filling port + payload into a row that
 *   was recorded opaque. A conflicting insert is a no-op, reported through
 *   RecordResult, never an error.
 * - `merge_node()`: field-level compare-and-set (see node_merge.hpp),
 *   atomic per node id.
 * - `update_traceroute()`: read-modify-write of one Traceroute record,
 *   atomic per key. The mutator decides the merge; the store only provides
 *   isolation and persistence.
 *
 * Writes to distinct keys must not serialize on each other in the backend's
 * own locking. Writes to the same key are atomic.
 *
 * RESULT CODES
 * ------------
 * | StoreStatus | meaning                                        |
 * |-------------|------------------------------------------------|
 * | Ok          | committed (including a dedup no-op)            |
 * | Busy        | lock/IO timeout; safe to retry with backoff    |
 * | Failed      | permanent error for this call; do not retry    |
 *
 * READ CONTRACT
 * -------------
 * Synchronous lookups used by the query CLI, the graph/top aggregators and
 * the pipeline's name/position resolution. Read failures are logged by the
 * backend and surface as "not found" / empty results.
 */

#ifndef MESHVIEW_STORE_HPP
#define MESHVIEW_STORE_HPP

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <optional>
#include <vector>

#include "meshview/types.hpp"
#include "meshview/node_merge.hpp"

namespace meshview {

enum class StoreStatus : uint8_t { Ok = 0, Busy = 1, Failed = 2 };

const char* store_status_name(StoreStatus st);

struct RecordResult {
  bool packet_inserted{false};   ///< canonical row created by this call
  bool packet_enriched{false};   ///< opaque canonical row filled in by this call
  bool seen_inserted{false};     ///< new gateway observation

  /// Nothing new was learned: the same gateway already reported this packet.
  bool dedup_noop() const { return !packet_inserted && !packet_enriched && !seen_inserted; }
};

struct StoreCounts {
  uint64_t nodes{0};
  uint64_t packets{0};
  uint64_t packets_seen{0};
  uint64_t traceroutes{0};
};

/// Mutator for update_traceroute(). Return true to persist @p rec.
using TraceMutator = std::function<bool(Traceroute& rec, bool exists)>;

class Store {
public:
  virtual ~Store() = default;

  // ---- write side ----
  virtual StoreStatus record_packet(const Packet& packet, const PacketSeen& seen, RecordResult& out) = 0;
  virtual StoreStatus merge_node(const NodeObservation& obs) = 0;
  virtual StoreStatus update_traceroute(const PacketKey& key, const TraceMutator& fn) = 0;

  // ---- read side ----
  virtual std::optional<Node>       get_node(NodeNum id) const = 0;
  virtual std::vector<Node>         list_nodes() const = 0;
  virtual std::optional<Packet>     get_packet(const PacketKey& key) const = 0;
  virtual std::vector<PacketSeen>   packets_seen(const PacketKey& key) const = 0;
  virtual std::optional<Traceroute> get_traceroute(const PacketKey& key) const = 0;
  virtual std::vector<Traceroute>   traceroutes_since(TimeUs since) const = 0;

  /// Packets imported at or after @p since, optionally restricted to one port.
  virtual std::vector<Packet> packets_since(TimeUs since, std::optional<uint32_t> portnum) const = 0;

  /**
   * @brief Ranked traffic table over packets imported at or after @p since.
   *
   * Ordered by times_seen descending, ties by node id ascending. At most
   * @p limit rows (0 = no limit).
   */
  virtual std::vector<TrafficRow> top_traffic(TimeUs since, size_t limit) const = 0;

  /// Packets per port for one sender since @p since, count desc then port asc.
  virtual std::vector<PortCount> node_traffic(NodeNum id, TimeUs since) const = 0;

  virtual StoreCounts counts() const = 0;
};

} // namespace meshview

#endif // MESHVIEW_STORE_HPP
