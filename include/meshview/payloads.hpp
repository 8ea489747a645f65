/**
 * @page mv-payloads Message-Kind Decoders
 * @file payloads.hpp
 * @brief One pure decoder per message kind, producing a closed variant.
 *
 * @details
 * PURPOSE
 * -------
 * After the envelope stage the inner payload is still protobuf bytes whose
 * schema depends on the port number. `decode_kind()` picks the decoder for
 * the envelope's MessageKind and yields a `KindRecord`, a std::variant over
 * the normalized records below. Dispatch downstream uses std::visit, so a
 * newly added kind that is not handled fails to compile instead of falling
 * through silently.
 *
 * | kind          | record           | notes                                           |
 * |---------------|------------------|-------------------------------------------------|
 * | text          | TextRecord       | invalid UTF-8 is a decode error                 |
 * | position      | PositionRecord   | lat/lon given in 1e-7 degrees; 0/0 = unknown    |
 * | nodeinfo      | NodeInfoRecord   | names, hw model, role                           |
 * | routing       | RoutingRecord    | ack / error reason for a request id             |
 * | telemetry     | TelemetryRecord  | device, environment or power variant            |
 * | traceroute    | TraceRecord      | hop lists + SNR (dB); INT8_MIN SNR = unknown    |
 * | neighborinfo  | NeighborRecord   | reporting node + neighbor list                  |
 * | map_report    | MapReportRecord  | names, firmware, region, position               |
 * | (other)       | UnknownRecord    | port number only; never an error                |
 *
 * CONTRACT
 * --------
 * - Pure: no I/O, no shared state; safe on any worker thread.
 * - Unknown protobuf fields are skipped (forward compatible).
 * - Truncated input returns false with a reason; it never throws or aborts.
 */

#ifndef MESHVIEW_PAYLOADS_HPP
#define MESHVIEW_PAYLOADS_HPP

#include <stdint.h>
#include <optional>
#include <string>
#include <variant>

#include "etl/vector.h"

#include "meshview/types.hpp"
#include "meshview/envelope.hpp"

namespace meshview {

struct UnknownRecord {
  uint32_t portnum{0};
};

struct TextRecord {
  std::string text;
};

struct PositionRecord {
  std::optional<Position> position;
  uint32_t time{0};
  uint32_t precision_bits{0};
  uint32_t sats_in_view{0};
};

struct NodeInfoRecord {
  std::string  user_id;               ///< "!xxxxxxxx" as the node announces it
  LongNameStr  long_name;
  ShortNameStr short_name;
  uint32_t     hw_model{0};
  uint32_t     role{0};
  bool         is_licensed{false};
};

struct RoutingRecord {
  bool     is_error{false};
  int32_t  error_reason{0};           ///< 0 = ack
  PacketId request_id{0};
};

struct TelemetryRecord {
  uint32_t time{0};
  std::optional<DeviceMetrics>      device;
  std::optional<EnvironmentMetrics> environment;
  std::optional<PowerMetrics>       power;
};

struct TraceRecord {
  RouteVec route;
  SnrVec   snr_towards;
  RouteVec route_back;
  SnrVec   snr_back;
  bool     is_response{false};        ///< reply to an earlier request (request_id set)
};

struct NeighborEntry {
  NodeNum node_id{0};
  float   snr{0.0f};
};

struct NeighborRecord {
  NodeNum  node_id{0};
  NodeNum  last_sent_by{0};
  uint32_t broadcast_interval_s{0};
  etl::vector<NeighborEntry, 10> neighbors;
};

struct MapReportRecord {
  LongNameStr  long_name;
  ShortNameStr short_name;
  uint32_t     role{0};
  uint32_t     hw_model{0};
  FirmwareStr  firmware;
  uint32_t     region{0};
  uint32_t     modem_preset{0};
  std::optional<Position> position;
  uint32_t     num_online_local_nodes{0};
};

using KindRecord = std::variant<UnknownRecord,
                                TextRecord,
                                PositionRecord,
                                NodeInfoRecord,
                                RoutingRecord,
                                TelemetryRecord,
                                TraceRecord,
                                NeighborRecord,
                                MapReportRecord>;

/**
 * @brief Decode @p env.inner_payload according to @p env.kind.
 * @return false on truncated/invalid input; @p err carries the reason.
 * PRE: env was decoded with DecodeStatus::Ok (not opaque).
 */
bool decode_kind(const DecodedEnvelope& env, KindRecord& out, std::string& err);

/// Decode a neighbor-info payload on its own (read-side graph building uses this).
bool decode_neighbor_info(const uint8_t* data, size_t len, NeighborRecord& out, std::string& err);

/// Lookup tables for display.
const char* hw_model_name(uint32_t hw_model);
const char* role_name(uint32_t role);

/// True when @p s is well-formed UTF-8.
bool valid_utf8(const std::string& s);

} // namespace meshview

#endif // MESHVIEW_PAYLOADS_HPP
