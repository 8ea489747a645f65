/**
 * @page mv-node-merge Node State Merger
 * @file node_merge.hpp
 * @brief Field-level, timestamped compare-and-set merge of node observations.
 *
 * @details
 * PURPOSE
 * -------
 * A node's aggregate record is assembled from many small reports: identity
 * broadcasts, position beacons, telemetry, map reports. Each report carries
 * only some fields, arrives through several gateways, and may arrive out of
 * order. The merge rule is per field:
 *
 * @code
 *   apply value  iff  observed_at >= field.updated_at
 *   last_seen    =    max(last_seen, observed_at)
 * @endcode
 *
 * Ties apply, so replaying the same observation is idempotent. An
 * observation that does not mention a field leaves it alone; nothing ever
 * deletes a known field.
 *
 * WHAT THIS DOES
 * --------------
 * - `NodeObservation` is the unit of merge: a node id, an observation time,
 *   and an optional value per field.
 * - `apply_observation()` merges one observation into a Node in memory.
 *   Stores call it under their per-node lock (MemoryStore) or express the
 *   same rule as conditional UPDATEs (SqliteStore).
 * - `observation_from()` maps a decoded kind record to the observation it
 *   implies for the sending node.
 */

#ifndef MESHVIEW_NODE_MERGE_HPP
#define MESHVIEW_NODE_MERGE_HPP

#include <optional>

#include "meshview/types.hpp"
#include "meshview/envelope.hpp"
#include "meshview/payloads.hpp"

namespace meshview {

struct NodeObservation {
  NodeNum node_id{0};
  TimeUs  observed_at{0};
  std::optional<LongNameStr>        long_name;
  std::optional<ShortNameStr>       short_name;
  std::optional<uint32_t>           hw_model;
  std::optional<uint32_t>           role;
  std::optional<FirmwareStr>        firmware;
  std::optional<ChannelStr>         channel;
  std::optional<Position>           position;
  std::optional<DeviceMetrics>      device_metrics;
  std::optional<EnvironmentMetrics> environment_metrics;
};

/// CAS one field. Returns true when the value was applied.
template <typename T>
bool merge_field(Stamped<T>& field, const std::optional<T>& value, TimeUs observed_at) {
  if (!value) return false;                       // absent: never clears
  if (observed_at < field.updated_at) return false;
  field.value      = value;
  field.updated_at = observed_at;
  return true;
}

/// Merge @p obs into @p node. Returns true when any field changed (last_seen excluded).
bool apply_observation(Node& node, const NodeObservation& obs);

/**
 * @brief Observation implied for @p env.from by a decoded record.
 *
 * Every packet contributes at least last_seen and the channel it was heard
 * on. Identity, position, telemetry and map-report records add their fields.
 */
NodeObservation observation_from(const DecodedEnvelope& env, const KindRecord& rec);

} // namespace meshview

#endif // MESHVIEW_NODE_MERGE_HPP
