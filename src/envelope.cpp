// ============================================================================
// envelope.cpp — implementation for meshview/envelope.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "meshview/envelope.hpp"
#include "meshview/pb_util.hpp"
#include "meshview/topic.hpp"

#include "meshtastic/mesh.pb.h"
#include "meshtastic/mqtt.pb.h"

namespace meshview {

MessageKind kind_from_portnum(uint32_t portnum) {
  switch (portnum) {
    case port::TEXT_MESSAGE: return MessageKind::Text;
    case port::POSITION:     return MessageKind::Position;
    case port::NODEINFO:     return MessageKind::NodeInfo;
    case port::ROUTING:      return MessageKind::Routing;
    case port::TELEMETRY:    return MessageKind::Telemetry;
    case port::TRACEROUTE:   return MessageKind::Traceroute;
    case port::NEIGHBORINFO: return MessageKind::NeighborInfo;
    case port::MAP_REPORT:   return MessageKind::MapReport;
    default:                 return MessageKind::Unknown;
  }
}

const char* kind_name(MessageKind kind) {
  switch (kind) {
    case MessageKind::Text:         return "text";
    case MessageKind::Position:     return "position";
    case MessageKind::NodeInfo:     return "nodeinfo";
    case MessageKind::Routing:      return "routing";
    case MessageKind::Telemetry:    return "telemetry";
    case MessageKind::Traceroute:   return "traceroute";
    case MessageKind::NeighborInfo: return "neighborinfo";
    case MessageKind::MapReport:    return "map_report";
    case MessageKind::Unknown:      break;
  }
  return "unknown";
}

const char* decode_status_name(DecodeStatus st) {
  switch (st) {
    case DecodeStatus::Ok:        return "ok";
    case DecodeStatus::Opaque:    return "opaque";
    case DecodeStatus::BadTopic:  return "bad_topic";
    case DecodeStatus::Malformed: return "malformed";
  }
  return "malformed";
}

std::optional<uint32_t> hop_count(uint32_t hop_start, uint32_t hop_limit) {
  if (hop_start == 0 || hop_start < hop_limit) return std::nullopt;  // older firmware / inconsistent
  return hop_start - hop_limit;
}

// fill_from_data() — copy the decoded Data fields into the envelope.
static void fill_from_data(const meshtastic_Data& d, DecodedEnvelope& out) {
  out.portnum       = static_cast<uint32_t>(d.portnum);
  out.kind          = kind_from_portnum(out.portnum);
  out.want_response = d.want_response;
  out.request_id    = d.request_id;
  out.inner_payload.assign(d.payload.bytes, d.payload.bytes + d.payload.size);
  out.opaque        = false;
}

/*
 * decode_envelope()
 * -----------------
 * Phases:
 *   1) topic -> gateway + channel (fail closed),
 *   2) ServiceEnvelope protobuf (truncation -> Malformed),
 *   3) identity + signal fields from MeshPacket,
 *   4) inner Data: as-is when decoded, AES-CTR + protobuf when encrypted.
 *
 * POLICY: an encrypted payload whose decryption does not parse as Data with a
 *         non-zero port is treated as "wrong key" -> Opaque, not Malformed.
 */
DecodeStatus decode_envelope(const RawMessage& raw, const ChannelKeys& keys,
                             DecodedEnvelope& out, std::string& err) {
  TopicInfo ti;
  if (!parse_topic(raw.topic, ti)) {
    err = "topic does not match <root>/<region>/2/<e|c>/<channel>/<!gateway>";
    return DecodeStatus::BadTopic;
  }

  meshtastic_ServiceEnvelope env = meshtastic_ServiceEnvelope_init_zero;
  if (!pb_decode_bytes(raw.payload.data(), raw.payload.size(), meshtastic_ServiceEnvelope_fields, &env, err)) {
    return DecodeStatus::Malformed;
  }
  if (!env.has_packet) {
    err = "envelope has no packet";
    return DecodeStatus::Malformed;
  }

  const meshtastic_MeshPacket& p = env.packet;
  DecodedEnvelope e;
  e.packet_id   = p.id;
  e.from        = p.from;
  e.to          = p.to;
  e.channel     = ti.channel;
  e.gateway     = ti.gateway;
  e.hop_limit   = p.hop_limit;
  e.hop_start   = p.hop_start;
  e.rx_time     = p.rx_time;
  e.topic       = raw.topic;
  e.received_at = raw.received_at;
  if (p.rx_rssi != 0) {                         // heard over the air
    e.rssi = p.rx_rssi;
    e.snr  = p.rx_snr;
  }

  if (p.which_payload_variant == meshtastic_MeshPacket_decoded_tag) {
    fill_from_data(p.decoded, e);
    out = std::move(e);
    return DecodeStatus::Ok;
  }

  if (p.which_payload_variant != meshtastic_MeshPacket_encrypted_tag) {
    err = "packet carries neither decoded nor encrypted payload";
    return DecodeStatus::Malformed;
  }

  e.was_encrypted = true;
  e.opaque        = true;
  e.inner_payload.assign(p.encrypted.bytes, p.encrypted.bytes + p.encrypted.size);

  const ChannelKey* key = keys.find(e.channel.c_str());
  if (key && key->usable()) {
    std::vector<uint8_t> plain;
    if (ChannelKeys::crypt(*key, e.packet_id, e.from, p.encrypted.bytes, p.encrypted.size, plain)) {
      meshtastic_Data d = meshtastic_Data_init_zero;
      std::string derr;
      if (pb_decode_bytes(plain.data(), plain.size(), meshtastic_Data_fields, &d, derr) &&
          d.portnum != meshtastic_PortNum_UNKNOWN_APP) {
        fill_from_data(d, e);
        out = std::move(e);
        return DecodeStatus::Ok;
      }
    }
  }

  out = std::move(e);
  return DecodeStatus::Opaque;
}

} // namespace meshview
