// ============================================================================
// node_merge.cpp — implementation for meshview/node_merge.hpp
// ============================================================================
#include "meshview/node_merge.hpp"

#include <algorithm>
#include <type_traits>

namespace meshview {

bool apply_observation(Node& node, const NodeObservation& obs) {
  const TimeUs at = obs.observed_at;
  bool changed = false;

  changed |= merge_field(node.long_name,           obs.long_name,           at);
  changed |= merge_field(node.short_name,          obs.short_name,          at);
  changed |= merge_field(node.hw_model,            obs.hw_model,            at);
  changed |= merge_field(node.role,                obs.role,                at);
  changed |= merge_field(node.firmware,            obs.firmware,            at);
  changed |= merge_field(node.channel,             obs.channel,             at);
  changed |= merge_field(node.position,            obs.position,            at);
  changed |= merge_field(node.device_metrics,      obs.device_metrics,      at);
  changed |= merge_field(node.environment_metrics, obs.environment_metrics, at);

  node.last_seen = std::max(node.last_seen, at);   // unconditional
  return changed;
}

NodeObservation observation_from(const DecodedEnvelope& env, const KindRecord& rec) {
  NodeObservation obs;
  obs.node_id     = env.from;
  obs.observed_at = env.received_at;
  obs.channel     = env.channel;

  // Wire defaults (empty string, 0) read as absent: they never overwrite a known field.
  std::visit([&obs](const auto& r) {
    using R = std::decay_t<decltype(r)>;
    if constexpr (std::is_same_v<R, NodeInfoRecord>) {
      if (!r.long_name.empty())  obs.long_name  = r.long_name;
      if (!r.short_name.empty()) obs.short_name = r.short_name;
      if (r.hw_model != 0)       obs.hw_model   = r.hw_model;
      if (r.role != 0)           obs.role       = r.role;
    } else if constexpr (std::is_same_v<R, PositionRecord>) {
      if (r.position) obs.position = r.position;
    } else if constexpr (std::is_same_v<R, TelemetryRecord>) {
      if (r.device)      obs.device_metrics      = r.device;
      if (r.environment) obs.environment_metrics = r.environment;
    } else if constexpr (std::is_same_v<R, MapReportRecord>) {
      if (!r.long_name.empty())  obs.long_name  = r.long_name;
      if (!r.short_name.empty()) obs.short_name = r.short_name;
      if (r.hw_model != 0)       obs.hw_model   = r.hw_model;
      if (r.role != 0)           obs.role       = r.role;
      if (!r.firmware.empty())   obs.firmware   = r.firmware;
      if (r.position)            obs.position   = r.position;
    }
    // text, routing, traceroute, neighborinfo, unknown: last_seen + channel only
  }, rec);

  return obs;
}

} // namespace meshview
