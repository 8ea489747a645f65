// ============================================================================
// json_format.cpp — implementation for json_format.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "json_format.hpp"

#include <type_traits>

namespace meshview {

using nlohmann::json;

namespace {

template <typename T>
json opt(const std::optional<T>& v) {
  return v ? json(*v) : json(nullptr);
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
  static const char* digits = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0f]);
  }
  return out;
}

template <typename Vec>
json ids(const Vec& v) {
  json a = json::array();
  for (NodeNum n : v) a.push_back(node_id_to_hex(n));
  return a;
}

template <typename Vec>
json floats(const Vec& v) {
  json a = json::array();
  for (float f : v) a.push_back(f);          // NaN dumps as null
  return a;
}

json device_json(const DeviceMetrics& d) {
  return json{{"battery_level", opt(d.battery_level)},
              {"voltage", opt(d.voltage)},
              {"channel_utilization", opt(d.channel_utilization)},
              {"air_util_tx", opt(d.air_util_tx)},
              {"uptime_seconds", opt(d.uptime_seconds)}};
}

json environment_json(const EnvironmentMetrics& e) {
  return json{{"temperature", opt(e.temperature)},
              {"relative_humidity", opt(e.relative_humidity)},
              {"barometric_pressure", opt(e.barometric_pressure)},
              {"gas_resistance", opt(e.gas_resistance)},
              {"iaq", opt(e.iaq)},
              {"wind_direction", opt(e.wind_direction)},
              {"wind_speed", opt(e.wind_speed)}};
}

json power_json(const PowerMetrics& p) {
  return json{{"ch1_voltage", opt(p.ch1_voltage)}, {"ch1_current", opt(p.ch1_current)},
              {"ch2_voltage", opt(p.ch2_voltage)}, {"ch2_current", opt(p.ch2_current)},
              {"ch3_voltage", opt(p.ch3_voltage)}, {"ch3_current", opt(p.ch3_current)}};
}

json position_opt(const std::optional<Position>& p) {
  return p ? json(*p) : json(nullptr);
}

} // namespace

void to_json(json& j, const Position& p) {
  j = json{{"lat", p.lat}, {"lon", p.lon}, {"altitude", opt(p.altitude)}};
}

void to_json(json& j, const Node& n) {
  j = json::object();
  j["id"]        = node_id_to_hex(n.node_id);
  j["node_num"]  = n.node_id;
  j["long_name"] = n.long_name.value ? json(n.long_name.value->c_str()) : json(nullptr);
  j["short_name"] = n.short_name.value ? json(n.short_name.value->c_str()) : json(nullptr);
  j["hw_model"]  = n.hw_model.value ? json(hw_model_name(*n.hw_model.value)) : json(nullptr);
  j["role"]      = n.role.value ? json(role_name(*n.role.value)) : json(nullptr);
  j["firmware"]  = n.firmware.value ? json(n.firmware.value->c_str()) : json(nullptr);
  j["channel"]   = n.channel.value ? json(n.channel.value->c_str()) : json(nullptr);
  j["position"]  = position_opt(n.position.value);
  j["device_metrics"] = n.device_metrics.value ? device_json(*n.device_metrics.value) : json(nullptr);
  j["environment_metrics"] =
    n.environment_metrics.value ? environment_json(*n.environment_metrics.value) : json(nullptr);
  j["position_updated_at"] = n.position.updated_at;
  j["last_seen"] = n.last_seen;
}

void to_json(json& j, const Packet& p) {
  j = json{{"id", p.key.packet_id},
           {"from", node_id_to_hex(p.key.from)},
           {"to", node_id_to_hex(p.to)},
           {"channel", p.channel.c_str()},
           {"portnum", opt(p.portnum)},
           {"payload_hex", to_hex(p.payload)},
           {"encrypted", p.encrypted},
           {"want_response", p.want_response},
           {"request_id", p.request_id},
           {"import_time", p.import_time}};
}

void to_json(json& j, const PacketSeen& s) {
  j = json{{"packet_id", s.key.packet.packet_id},
           {"from", node_id_to_hex(s.key.packet.from)},
           {"gateway", node_id_to_hex(s.key.gateway)},
           {"channel", s.channel.c_str()},
           {"topic", s.topic},
           {"rx_snr", opt(s.rx_snr)},
           {"rx_rssi", opt(s.rx_rssi)},
           {"hop_limit", s.hop_limit},
           {"hop_start", s.hop_start},
           {"hop_count", opt(s.hop_count)},
           {"rx_time", s.rx_time},
           {"import_time", s.import_time}};
}

void to_json(json& j, const Traceroute& t) {
  j = json{{"packet_id", t.key.packet_id},
           {"from", node_id_to_hex(t.key.from)},
           {"target", node_id_to_hex(t.target)},
           {"gateway", node_id_to_hex(t.gateway)},
           {"route", ids(t.route)},
           {"snr_towards", floats(t.snr_towards)},
           {"route_back", ids(t.route_back)},
           {"snr_back", floats(t.snr_back)},
           {"done", t.done},
           {"import_time", t.import_time},
           {"updated_at", t.updated_at}};
}

void to_json(json& j, const Edge& e) {
  j = json{{"from", node_id_to_hex(e.from)},
           {"to", node_id_to_hex(e.to)},
           {"kind", e.kind == EdgeKind::Trace ? "trace" : "neighbor"},
           {"snr", opt(e.snr)},
           {"observed_at", e.observed_at}};
}

void to_json(json& j, const Graph& g) {
  j = json{{"nodes", ids(g.nodes)}, {"edges", g.edges}};
}

void to_json(json& j, const TrafficRow& r) {
  j = json{{"id", node_id_to_hex(r.node_id)},
           {"long_name", r.long_name},
           {"short_name", r.short_name},
           {"packets_sent", r.packets_sent},
           {"times_seen", r.times_seen}};
}

void to_json(json& j, const PortCount& c) {
  j = json{{"portnum", c.portnum},
           {"kind", kind_name(kind_from_portnum(c.portnum))},
           {"count", c.count}};
}

/*
 * record_json()
 * -------------
 * One branch per alternative; the "kind" tag matches kind_name().
 */
json record_json(const KindRecord& rec) {
  return std::visit([](const auto& r) -> json {
    using T = std::decay_t<decltype(r)>;
    if constexpr (std::is_same_v<T, UnknownRecord>) {
      return json{{"kind", "unknown"}, {"portnum", r.portnum}};
    } else if constexpr (std::is_same_v<T, TextRecord>) {
      return json{{"kind", "text"}, {"text", r.text}};
    } else if constexpr (std::is_same_v<T, PositionRecord>) {
      return json{{"kind", "position"}, {"position", position_opt(r.position)}, {"time", r.time},
                  {"precision_bits", r.precision_bits}, {"sats_in_view", r.sats_in_view}};
    } else if constexpr (std::is_same_v<T, NodeInfoRecord>) {
      return json{{"kind", "nodeinfo"}, {"user_id", r.user_id}, {"long_name", r.long_name.c_str()},
                  {"short_name", r.short_name.c_str()}, {"hw_model", hw_model_name(r.hw_model)},
                  {"role", role_name(r.role)}, {"is_licensed", r.is_licensed}};
    } else if constexpr (std::is_same_v<T, RoutingRecord>) {
      return json{{"kind", "routing"}, {"is_error", r.is_error}, {"error_reason", r.error_reason},
                  {"request_id", r.request_id}};
    } else if constexpr (std::is_same_v<T, TelemetryRecord>) {
      return json{{"kind", "telemetry"}, {"time", r.time},
                  {"device", r.device ? device_json(*r.device) : json(nullptr)},
                  {"environment", r.environment ? environment_json(*r.environment) : json(nullptr)},
                  {"power", r.power ? power_json(*r.power) : json(nullptr)}};
    } else if constexpr (std::is_same_v<T, TraceRecord>) {
      return json{{"kind", "traceroute"}, {"route", ids(r.route)}, {"snr_towards", floats(r.snr_towards)},
                  {"route_back", ids(r.route_back)}, {"snr_back", floats(r.snr_back)},
                  {"is_response", r.is_response}};
    } else if constexpr (std::is_same_v<T, NeighborRecord>) {
      json n = json::array();
      for (const NeighborEntry& e : r.neighbors) n.push_back(json{{"id", node_id_to_hex(e.node_id)}, {"snr", e.snr}});
      return json{{"kind", "neighborinfo"}, {"node", node_id_to_hex(r.node_id)},
                  {"broadcast_interval_s", r.broadcast_interval_s}, {"neighbors", n}};
    } else {
      return json{{"kind", "map_report"}, {"long_name", r.long_name.c_str()}, {"short_name", r.short_name.c_str()},
                  {"role", role_name(r.role)}, {"hw_model", hw_model_name(r.hw_model)},
                  {"firmware", r.firmware.c_str()}, {"region", r.region}, {"modem_preset", r.modem_preset},
                  {"position", position_opt(r.position)}, {"online_local_nodes", r.num_online_local_nodes}};
    }
  }, rec);
}

void to_json(json& j, const NormalizedEvent& ev) {
  j = json::object();
  j["packet_id"]      = ev.key.packet_id;
  j["from"]           = node_id_to_hex(ev.key.from);
  j["from_long_name"] = ev.from_long_name;
  j["from_short_name"] = ev.from_short_name;
  j["to"]             = node_id_to_hex(ev.to);
  j["to_long_name"]   = ev.to_long_name;
  j["gateway"]        = node_id_to_hex(ev.gateway);
  j["gateway_long_name"] = ev.gateway_long_name;
  j["channel"]        = ev.channel.c_str();
  j["kind"]           = kind_name(ev.kind);
  j["portnum"]        = ev.portnum;
  j["record"]         = record_json(ev.record);
  j["rssi"]           = opt(ev.rssi);
  j["snr"]            = opt(ev.snr);
  j["hop_count"]      = opt(ev.hop_count);
  j["distance_km"]    = opt(ev.distance_km);
  j["first_sighting"] = ev.first_sighting;
  j["received_at"]    = ev.received_at;
}

void to_json(json& j, const HealthSnapshot& h) {
  j = json{{"connection", transport::conn_state_name(h.connection)},
           {"connects", h.connects},
           {"connection_losses", h.connection_losses},
           {"received", h.received},
           {"raw_queue_drops", h.raw_queue_drops},
           {"processed", h.processed},
           {"bad_topic", h.bad_topic},
           {"decode_failures", h.decode_failures},
           {"payload_decode_failures", h.payload_decode_failures},
           {"undecryptable", h.undecryptable},
           {"ignored", h.ignored},
           {"dedup_noops", h.dedup_noops},
           {"store_retries", h.store_retries},
           {"store_drops", h.store_drops},
           {"anomalies", h.anomalies},
           {"events_published", h.events_published},
           {"subscriber_evictions", h.subscriber_evictions},
           {"subscribers", h.subscribers},
           {"degraded", h.degraded}};
}

} // namespace meshview
