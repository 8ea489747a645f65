/**
 * @page mv-types MeshView Data Model
 * @file types.hpp
 * @brief Records that flow through the ingest pipeline and land in the store.
 *
 * @details
 * PURPOSE
 * -------
 * Every stage of the pipeline speaks in terms of the handful of records
 * declared here. Raw broker deliveries become envelopes, envelopes become
 * canonical packets plus per-gateway observations, and selected payloads
 * update node state or traceroute records.
 *
 * IDENTITY RULES
 * --------------
 * - A mesh packet id is **not** unique by itself. Independent senders reuse
 *   values, so the canonical identity is `PacketKey{packet_id, from}`.
 * - An observation (PacketSeen) is identified by `SeenKey{packet, gateway}`.
 *   The same packet uplinked by two gateways is two observations of one
 *   packet, never two packets.
 * - Traceroutes share the `PacketKey` of the request they describe.
 *
 * SIZING
 * ------
 * Protocol-bounded strings and arrays use ETL fixed-capacity containers so
 * record sizes are predictable and never allocate on the hot path:
 *   - long names fit 40 bytes, short names 5 bytes (UTF-8, possibly an emoji),
 *   - a path-trace carries at most 8 intermediate hops.
 *
 * TIME
 * ----
 * All timestamps are `TimeUs`: microseconds since the Unix epoch, taken from
 * the ingest host's clock when the broker delivered the message.
 */

#ifndef MESHVIEW_TYPES_HPP
#define MESHVIEW_TYPES_HPP

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "etl/string.h"
#include "etl/vector.h"

namespace meshview {

/// Mesh node number (the 32-bit address every radio owns).
using NodeNum  = uint32_t;
/// Mesh-assigned packet id (reused across senders; see PacketKey).
using PacketId = uint32_t;
/// Microseconds since the Unix epoch.
using TimeUs   = int64_t;

/// Broadcast destination address.
static constexpr NodeNum NODENUM_BROADCAST = 0xFFFFFFFFu;

/// Maximum hops a path-trace can record in one direction.
static constexpr size_t ROUTE_MAX = 8;

using LongNameStr  = etl::string<40>;
using ShortNameStr = etl::string<5>;
using FirmwareStr  = etl::string<18>;
using ChannelStr   = etl::string<64>;

using RouteVec = etl::vector<NodeNum, ROUTE_MAX>;
/// Per-hop SNR in dB. NaN marks a hop whose SNR was not recorded.
using SnrVec   = etl::vector<float, ROUTE_MAX>;

/**
 * @brief Canonical identity of a logical mesh packet.
 */
struct PacketKey {
  PacketId packet_id{0};
  NodeNum  from{0};

  bool operator==(const PacketKey& o) const { return packet_id == o.packet_id && from == o.from; }
  bool operator!=(const PacketKey& o) const { return !(*this == o); }
  bool operator<(const PacketKey& o) const {
    return packet_id != o.packet_id ? packet_id < o.packet_id : from < o.from;
  }
};

/// Identity of one gateway's report of one packet.
struct SeenKey {
  PacketKey packet;
  NodeNum   gateway{0};

  bool operator==(const SeenKey& o) const { return packet == o.packet && gateway == o.gateway; }
};

/// Geographic position in degrees; altitude in metres when known.
struct Position {
  double lat{0.0};
  double lon{0.0};
  std::optional<int32_t> altitude;

  bool operator==(const Position& o) const {
    return lat == o.lat && lon == o.lon && altitude == o.altitude;
  }
};

/// Device health figures reported by a node about itself.
struct DeviceMetrics {
  std::optional<uint32_t> battery_level;
  std::optional<float>    voltage;
  std::optional<float>    channel_utilization;
  std::optional<float>    air_util_tx;
  std::optional<uint32_t> uptime_seconds;

  bool operator==(const DeviceMetrics& o) const {
    return battery_level == o.battery_level && voltage == o.voltage &&
           channel_utilization == o.channel_utilization && air_util_tx == o.air_util_tx &&
           uptime_seconds == o.uptime_seconds;
  }
};

/// Environment sensor readings.
struct EnvironmentMetrics {
  std::optional<float>    temperature;
  std::optional<float>    relative_humidity;
  std::optional<float>    barometric_pressure;
  std::optional<float>    gas_resistance;
  std::optional<uint32_t> iaq;
  std::optional<uint32_t> wind_direction;
  std::optional<float>    wind_speed;

  bool operator==(const EnvironmentMetrics& o) const {
    return temperature == o.temperature && relative_humidity == o.relative_humidity &&
           barometric_pressure == o.barometric_pressure && gas_resistance == o.gas_resistance &&
           iaq == o.iaq && wind_direction == o.wind_direction && wind_speed == o.wind_speed;
  }
};

/// Power channel readings (voltage / current per channel).
struct PowerMetrics {
  std::optional<float> ch1_voltage, ch1_current;
  std::optional<float> ch2_voltage, ch2_current;
  std::optional<float> ch3_voltage, ch3_current;
};

/**
 * @brief One independently-merged node field.
 *
 * `updated_at` is the observation time of the value currently held. A field
 * that has never been written has `value == std::nullopt` and `updated_at == 0`.
 */
template <typename T>
struct Stamped {
  std::optional<T> value;
  TimeUs updated_at{0};

  bool known() const { return value.has_value(); }
};

/**
 * @brief Aggregate state for one mesh node.
 *
 * Each field is merged on its own; see node_merge.hpp. `last_seen` is the
 * latest observation time of anything that touched the node.
 */
struct Node {
  NodeNum node_id{0};
  Stamped<LongNameStr>        long_name;
  Stamped<ShortNameStr>       short_name;
  Stamped<uint32_t>           hw_model;
  Stamped<uint32_t>           role;
  Stamped<FirmwareStr>        firmware;
  Stamped<ChannelStr>         channel;
  Stamped<Position>           position;
  Stamped<DeviceMetrics>      device_metrics;
  Stamped<EnvironmentMetrics> environment_metrics;
  TimeUs last_seen{0};
};

/**
 * @brief Canonical record of a logical packet.
 *
 * Written once by the first reporter. Fields unknown at that time (port and
 * payload of an encrypted packet) may be filled in later, never replaced.
 */
struct Packet {
  PacketKey key;
  NodeNum   to{0};
  ChannelStr channel;
  std::optional<uint32_t> portnum;     ///< empty while the payload is opaque
  std::vector<uint8_t>    payload;     ///< decoded Data.payload (or ciphertext while opaque)
  bool     encrypted{false};           ///< true while only ciphertext is known
  bool     want_response{false};
  PacketId request_id{0};
  TimeUs   import_time{0};
};

/**
 * @brief One gateway's observation of a packet.
 */
struct PacketSeen {
  SeenKey key;
  ChannelStr channel;
  std::string topic;
  std::optional<float>   rx_snr;
  std::optional<int32_t> rx_rssi;
  uint32_t hop_limit{0};
  uint32_t hop_start{0};
  std::optional<uint32_t> hop_count;
  uint32_t rx_time{0};                 ///< gateway clock, seconds (informational)
  TimeUs   import_time{0};
};

/**
 * @brief Reconstructed path-trace for one request.
 *
 * `route` holds the forward path **including** the requester and, once the
 * response arrived, the target. `route_back` holds the return path the same
 * way. Both only ever grow.
 */
struct Traceroute {
  PacketKey key;                       ///< key of the request packet
  NodeNum   target{0};                 ///< node the trace was sent to
  NodeNum   gateway{0};                ///< gateway of the first report
  std::vector<NodeNum> route;
  std::vector<float>   snr_towards;
  std::vector<NodeNum> route_back;
  std::vector<float>   snr_back;
  bool   done{false};                  ///< response observed
  TimeUs import_time{0};
  TimeUs updated_at{0};
};

enum class EdgeKind : uint8_t { Trace = 0, Neighbor = 1 };

/// Directed topology edge derived from a traceroute or neighbor list.
struct Edge {
  NodeNum  from{0};
  NodeNum  to{0};
  EdgeKind kind{EdgeKind::Trace};
  std::optional<float> snr;
  TimeUs   observed_at{0};
};

/// One row of the ranked traffic table.
struct TrafficRow {
  NodeNum node_id{0};
  std::string long_name;
  std::string short_name;
  uint64_t packets_sent{0};
  uint64_t times_seen{0};
};

/// Per-port packet count for one node.
struct PortCount {
  uint32_t portnum{0};
  uint64_t count{0};
};

/// Render a node number the way the mesh prints it: `!` + 8 lowercase hex digits.
std::string node_id_to_hex(NodeNum n);

/// Parse `!1a2b3c4d`, `0x1a2b3c4d` or decimal into a node number.
std::optional<NodeNum> parse_node_id(const std::string& s);

} // namespace meshview

namespace std {
template <>
struct hash<meshview::PacketKey> {
  size_t operator()(const meshview::PacketKey& k) const noexcept {
    return std::hash<uint64_t>{}((static_cast<uint64_t>(k.from) << 32) | k.packet_id);
  }
};
} // namespace std

#endif // MESHVIEW_TYPES_HPP
