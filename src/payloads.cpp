// ============================================================================
// payloads.cpp — implementation for meshview/payloads.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "meshview/payloads.hpp"
#include "meshview/pb_util.hpp"

#include "meshtastic/mesh.pb.h"
#include "meshtastic/mqtt.pb.h"
#include "meshtastic/telemetry.pb.h"

#include <cmath>
#include <limits>

namespace meshview {

// Position fields arrive in 1e-7 degrees.
static constexpr double DEG_SCALE = 1e-7;

// Traceroute SNR is dB * 4 in an int8 range; INT8_MIN marks an unknown hop.
static constexpr int32_t TRACE_SNR_UNKNOWN = -128;
static constexpr float   TRACE_SNR_SCALE   = 4.0f;

// ---------- helpers ----------

// make_position() — POLICY: both coordinates must be present and non-zero (0/0 = "no fix").
static std::optional<Position> make_position(bool has_lat, int32_t lat_i,
                                             bool has_lon, int32_t lon_i,
                                             bool has_alt, int32_t alt) {
  if (!has_lat || !has_lon) return std::nullopt;
  if (lat_i == 0 && lon_i == 0) return std::nullopt;
  Position p;
  p.lat = lat_i * DEG_SCALE;
  p.lon = lon_i * DEG_SCALE;
  if (has_alt) p.altitude = alt;
  return p;
}

static float trace_snr(int32_t raw) {
  if (raw == TRACE_SNR_UNKNOWN) return std::numeric_limits<float>::quiet_NaN();
  return static_cast<float>(raw) / TRACE_SNR_SCALE;
}

template <size_t N>
static void copy_route(const uint32_t* src, pb_size_t count, etl::vector<NodeNum, N>& dst) {
  dst.clear();
  for (pb_size_t i = 0; i < count && !dst.full(); ++i) dst.push_back(src[i]);
}

template <size_t N>
static void copy_snr(const int32_t* src, pb_size_t count, etl::vector<float, N>& dst) {
  dst.clear();
  for (pb_size_t i = 0; i < count && !dst.full(); ++i) dst.push_back(trace_snr(src[i]));
}

// ---------- per-kind decoders ----------

static bool decode_text(const DecodedEnvelope& env, KindRecord& out, std::string& err) {
  TextRecord r;
  r.text.assign(env.inner_payload.begin(), env.inner_payload.end());
  if (!valid_utf8(r.text)) { err = "text payload is not valid utf-8"; return false; }
  out = std::move(r);
  return true;
}

static bool decode_position(const DecodedEnvelope& env, KindRecord& out, std::string& err) {
  meshtastic_Position p = meshtastic_Position_init_zero;
  if (!pb_decode_bytes(env.inner_payload.data(), env.inner_payload.size(), meshtastic_Position_fields, &p, err))
    return false;

  PositionRecord r;
  r.position       = make_position(p.has_latitude_i, p.latitude_i, p.has_longitude_i, p.longitude_i,
                                   p.has_altitude, p.altitude);
  r.time           = p.time;
  r.precision_bits = p.precision_bits;
  r.sats_in_view   = p.sats_in_view;
  out = r;
  return true;
}

static bool decode_nodeinfo(const DecodedEnvelope& env, KindRecord& out, std::string& err) {
  meshtastic_User u = meshtastic_User_init_zero;
  if (!pb_decode_bytes(env.inner_payload.data(), env.inner_payload.size(), meshtastic_User_fields, &u, err))
    return false;

  NodeInfoRecord r;
  r.user_id     = u.id;
  r.long_name.assign(u.long_name);
  r.short_name.assign(u.short_name);
  r.hw_model    = static_cast<uint32_t>(u.hw_model);
  r.role        = static_cast<uint32_t>(u.role);
  r.is_licensed = u.is_licensed;
  out = r;
  return true;
}

static bool decode_routing(const DecodedEnvelope& env, KindRecord& out, std::string& err) {
  meshtastic_Routing rt = meshtastic_Routing_init_zero;
  if (!pb_decode_bytes(env.inner_payload.data(), env.inner_payload.size(), meshtastic_Routing_fields, &rt, err))
    return false;

  RoutingRecord r;
  r.request_id = env.request_id;
  if (rt.which_variant == meshtastic_Routing_error_reason_tag) {
    r.error_reason = rt.error_reason;
    r.is_error     = rt.error_reason != 0;
  }
  out = r;
  return true;
}

static bool decode_telemetry(const DecodedEnvelope& env, KindRecord& out, std::string& err) {
  meshtastic_Telemetry t = meshtastic_Telemetry_init_zero;
  if (!pb_decode_bytes(env.inner_payload.data(), env.inner_payload.size(), meshtastic_Telemetry_fields, &t, err))
    return false;

  TelemetryRecord r;
  r.time = t.time;
  switch (t.which_variant) {
    case meshtastic_Telemetry_device_metrics_tag: {
      const auto& m = t.device_metrics;
      DeviceMetrics d;
      if (m.has_battery_level)       d.battery_level       = m.battery_level;
      if (m.has_voltage)             d.voltage             = m.voltage;
      if (m.has_channel_utilization) d.channel_utilization = m.channel_utilization;
      if (m.has_air_util_tx)         d.air_util_tx         = m.air_util_tx;
      if (m.has_uptime_seconds)      d.uptime_seconds      = m.uptime_seconds;
      r.device = d;
      break;
    }
    case meshtastic_Telemetry_environment_metrics_tag: {
      const auto& m = t.environment_metrics;
      EnvironmentMetrics e;
      if (m.has_temperature)         e.temperature         = m.temperature;
      if (m.has_relative_humidity)   e.relative_humidity   = m.relative_humidity;
      if (m.has_barometric_pressure) e.barometric_pressure = m.barometric_pressure;
      if (m.has_gas_resistance)      e.gas_resistance      = m.gas_resistance;
      if (m.has_iaq)                 e.iaq                 = m.iaq;
      if (m.has_wind_direction)      e.wind_direction      = m.wind_direction;
      if (m.has_wind_speed)          e.wind_speed          = m.wind_speed;
      r.environment = e;
      break;
    }
    case meshtastic_Telemetry_power_metrics_tag: {
      const auto& m = t.power_metrics;
      PowerMetrics pm;
      if (m.has_ch1_voltage) pm.ch1_voltage = m.ch1_voltage;
      if (m.has_ch1_current) pm.ch1_current = m.ch1_current;
      if (m.has_ch2_voltage) pm.ch2_voltage = m.ch2_voltage;
      if (m.has_ch2_current) pm.ch2_current = m.ch2_current;
      if (m.has_ch3_voltage) pm.ch3_voltage = m.ch3_voltage;
      if (m.has_ch3_current) pm.ch3_current = m.ch3_current;
      r.power = pm;
      break;
    }
    default:
      break;                              // newer variant: keep time only
  }
  out = r;
  return true;
}

static bool decode_traceroute(const DecodedEnvelope& env, KindRecord& out, std::string& err) {
  meshtastic_RouteDiscovery rd = meshtastic_RouteDiscovery_init_zero;
  if (!pb_decode_bytes(env.inner_payload.data(), env.inner_payload.size(), meshtastic_RouteDiscovery_fields, &rd, err))
    return false;

  TraceRecord r;
  copy_route(rd.route, rd.route_count, r.route);
  copy_snr(rd.snr_towards, rd.snr_towards_count, r.snr_towards);
  copy_route(rd.route_back, rd.route_back_count, r.route_back);
  copy_snr(rd.snr_back, rd.snr_back_count, r.snr_back);
  r.is_response = !env.want_response && env.request_id != 0;
  out = r;
  return true;
}

static bool decode_map_report(const DecodedEnvelope& env, KindRecord& out, std::string& err) {
  meshtastic_MapReport m = meshtastic_MapReport_init_zero;
  if (!pb_decode_bytes(env.inner_payload.data(), env.inner_payload.size(), meshtastic_MapReport_fields, &m, err))
    return false;

  MapReportRecord r;
  r.long_name.assign(m.long_name);
  r.short_name.assign(m.short_name);
  r.role         = static_cast<uint32_t>(m.role);
  r.hw_model     = static_cast<uint32_t>(m.hw_model);
  r.firmware.assign(m.firmware_version);
  r.region       = static_cast<uint32_t>(m.region);
  r.modem_preset = static_cast<uint32_t>(m.modem_preset);
  r.position     = make_position(true, m.latitude_i, true, m.longitude_i, m.altitude != 0, m.altitude);
  r.num_online_local_nodes = m.num_online_local_nodes;
  out = r;
  return true;
}

// ---------- public ----------

bool decode_neighbor_info(const uint8_t* data, size_t len, NeighborRecord& out, std::string& err) {
  meshtastic_NeighborInfo ni = meshtastic_NeighborInfo_init_zero;
  if (!pb_decode_bytes(data, len, meshtastic_NeighborInfo_fields, &ni, err)) return false;

  NeighborRecord r;
  r.node_id              = ni.node_id;
  r.last_sent_by         = ni.last_sent_by_id;
  r.broadcast_interval_s = ni.node_broadcast_interval_secs;
  for (pb_size_t i = 0; i < ni.neighbors_count && !r.neighbors.full(); ++i) {
    r.neighbors.push_back(NeighborEntry{ni.neighbors[i].node_id, ni.neighbors[i].snr});
  }
  out = r;
  return true;
}

/*
 * decode_kind()
 * -------------
 * PRE:  env is not opaque.
 * OUT:  out holds the record for env.kind; UnknownRecord for unhandled ports.
 */
bool decode_kind(const DecodedEnvelope& env, KindRecord& out, std::string& err) {
  switch (env.kind) {
    case MessageKind::Text:       return decode_text(env, out, err);
    case MessageKind::Position:   return decode_position(env, out, err);
    case MessageKind::NodeInfo:   return decode_nodeinfo(env, out, err);
    case MessageKind::Routing:    return decode_routing(env, out, err);
    case MessageKind::Telemetry:  return decode_telemetry(env, out, err);
    case MessageKind::Traceroute: return decode_traceroute(env, out, err);
    case MessageKind::MapReport:  return decode_map_report(env, out, err);
    case MessageKind::NeighborInfo: {
      NeighborRecord r;
      if (!decode_neighbor_info(env.inner_payload.data(), env.inner_payload.size(), r, err)) return false;
      out = r;
      return true;
    }
    case MessageKind::Unknown:
      break;
  }
  out = UnknownRecord{env.portnum};
  return true;
}

// valid_utf8() — strict: rejects overlongs, surrogates and code points > U+10FFFF.
bool valid_utf8(const std::string& s) {
  const auto* p = reinterpret_cast<const unsigned char*>(s.data());
  const size_t n = s.size();
  size_t i = 0;
  while (i < n) {
    const unsigned char c = p[i];
    size_t len = 0;
    uint32_t cp = 0;
    if (c < 0x80)                { ++i; continue; }
    else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else return false;

    if (i + len > n) return false;                     // truncated sequence
    for (size_t k = 1; k < len; ++k) {
      if ((p[i + k] & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (p[i + k] & 0x3F);
    }
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += len;
  }
  return true;
}

const char* role_name(uint32_t role) {
  switch (role) {
    case 0:  return "CLIENT";
    case 1:  return "CLIENT_MUTE";
    case 2:  return "ROUTER";
    case 3:  return "ROUTER_CLIENT";
    case 4:  return "REPEATER";
    case 5:  return "TRACKER";
    case 6:  return "SENSOR";
    case 7:  return "TAK";
    case 8:  return "CLIENT_HIDDEN";
    case 9:  return "LOST_AND_FOUND";
    case 10: return "TAK_TRACKER";
    case 11: return "ROUTER_LATE";
    case 12: return "CLIENT_BASE";
    default: return "UNKNOWN";
  }
}

// Common hardware models; anything else prints as UNSET/unknown.
const char* hw_model_name(uint32_t hw_model) {
  switch (hw_model) {
    case 0:   return "UNSET";
    case 1:   return "TLORA_V2";
    case 2:   return "TLORA_V1";
    case 3:   return "TLORA_V2_1_1P6";
    case 4:   return "TBEAM";
    case 5:   return "HELTEC_V2_0";
    case 6:   return "TBEAM_V0P7";
    case 7:   return "T_ECHO";
    case 8:   return "TLORA_V1_1P3";
    case 9:   return "RAK4631";
    case 10:  return "HELTEC_V2_1";
    case 11:  return "HELTEC_V1";
    case 12:  return "LILYGO_TBEAM_S3_CORE";
    case 13:  return "RAK11200";
    case 14:  return "NANO_G1";
    case 15:  return "TLORA_V2_1_1P8";
    case 16:  return "TLORA_T3_S3";
    case 17:  return "NANO_G1_EXPLORER";
    case 18:  return "NANO_G2_ULTRA";
    case 25:  return "STATION_G1";
    case 26:  return "RAK11310";
    case 29:  return "CANARYONE";
    case 31:  return "STATION_G2";
    case 39:  return "DIY_V1";
    case 43:  return "HELTEC_V3";
    case 44:  return "HELTEC_WSL_V3";
    case 47:  return "RPI_PICO";
    case 48:  return "HELTEC_WIRELESS_TRACKER";
    case 49:  return "HELTEC_WIRELESS_PAPER";
    case 50:  return "T_DECK";
    case 51:  return "T_WATCH_S3";
    case 52:  return "PICOMPUTER_S3";
    case 53:  return "HELTEC_HT62";
    case 57:  return "HELTEC_WIRELESS_PAPER_V1_0";
    case 58:  return "HELTEC_WIRELESS_TRACKER_V1_0";
    case 64:  return "TRACKER_T1000_E";
    case 65:  return "RAK3172";
    case 71:  return "SEEED_XIAO_S3";
    case 255: return "PRIVATE_HW";
    default:  return "UNKNOWN";
  }
}

} // namespace meshview
