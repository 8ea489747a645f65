/**
 * @page mv-envelope Envelope Decoder
 * @file envelope.hpp
 * @brief Turn a raw broker delivery into a typed, kind-tagged envelope.
 *
 * @details
 * PURPOSE
 * -------
 * A broker delivery is just `(topic, bytes, receivedAt)`. This stage parses
 * the topic (see topic.hpp), decodes the outer ServiceEnvelope protobuf,
 * decrypts the inner payload when the channel key is known, and tags the
 * result with a MessageKind chosen from the inner port number.
 *
 * OUTCOMES
 * --------
 * | DecodeStatus | meaning                                         | caller does          |
 * |--------------|-------------------------------------------------|----------------------|
 * | Ok           | envelope + inner Data decoded                   | kind decode, store   |
 * | Opaque       | encrypted, no usable key / key did not fit      | record opaque, stop  |
 * | BadTopic     | topic does not match the uplink layout          | count, drop          |
 * | Malformed    | protobuf truncated/invalid or packet missing    | count, drop          |
 *
 * Opaque is expected steady state: many channels on a public broker use keys
 * this ingest host does not have. It is never logged above debug level.
 *
 * On Opaque the identity fields (`packet_id`, `from`, `to`, gateway, channel,
 * signal figures) are still filled so the observation can be recorded.
 *
 * SIGNAL FIGURES
 * --------------
 * `rssi`/`snr` are present only when the gateway heard the packet over the
 * air (`rx_rssi != 0`). Packets originated by the gateway itself carry none.
 */

#ifndef MESHVIEW_ENVELOPE_HPP
#define MESHVIEW_ENVELOPE_HPP

#include <stdint.h>
#include <optional>
#include <string>
#include <vector>

#include "meshview/types.hpp"
#include "meshview/channel_keys.hpp"

namespace meshview {

/// Closed set of message kinds the pipeline understands.
enum class MessageKind : uint8_t {
  Unknown = 0,
  Text,
  Position,
  NodeInfo,
  Routing,
  Telemetry,
  Traceroute,
  NeighborInfo,
  MapReport
};

/// Well-known port numbers (wire values).
namespace port {
static constexpr uint32_t TEXT_MESSAGE  = 1;
static constexpr uint32_t POSITION      = 3;
static constexpr uint32_t NODEINFO      = 4;
static constexpr uint32_t ROUTING       = 5;
static constexpr uint32_t TELEMETRY     = 67;
static constexpr uint32_t TRACEROUTE    = 70;
static constexpr uint32_t NEIGHBORINFO  = 71;
static constexpr uint32_t MAP_REPORT    = 73;
} // namespace port

MessageKind kind_from_portnum(uint32_t portnum);
const char* kind_name(MessageKind kind);

/// One broker delivery. Owned by the listener until handed to a worker.
struct RawMessage {
  std::string topic;
  std::vector<uint8_t> payload;
  TimeUs received_at{0};
};

struct DecodedEnvelope {
  PacketId   packet_id{0};
  NodeNum    from{0};
  NodeNum    to{0};
  ChannelStr channel;                 ///< channel name from the topic
  NodeNum    gateway{0};              ///< reporting gateway from the topic
  MessageKind kind{MessageKind::Unknown};
  uint32_t   portnum{0};
  std::vector<uint8_t> inner_payload; ///< Data.payload, or ciphertext when opaque
  bool       opaque{false};
  bool       was_encrypted{false};    ///< arrived encrypted (decrypted or not)
  bool       want_response{false};
  PacketId   request_id{0};
  uint32_t   hop_limit{0};
  uint32_t   hop_start{0};
  std::optional<int32_t> rssi;
  std::optional<float>   snr;
  uint32_t   rx_time{0};
  std::string topic;
  TimeUs     received_at{0};
};

enum class DecodeStatus : uint8_t { Ok = 0, Opaque = 1, BadTopic = 2, Malformed = 3 };

const char* decode_status_name(DecodeStatus st);

/**
 * @brief Decode one raw delivery.
 * @param raw   topic + bytes + receive time
 * @param keys  channel key registry (may be empty)
 * @param out   filled on Ok and Opaque; unspecified otherwise
 * @param err   short reason on BadTopic / Malformed
 */
DecodeStatus decode_envelope(const RawMessage& raw, const ChannelKeys& keys,
                             DecodedEnvelope& out, std::string& err);

/// hop_start - hop_limit when the packet reports hop_start and it is consistent.
std::optional<uint32_t> hop_count(uint32_t hop_start, uint32_t hop_limit);

} // namespace meshview

#endif // MESHVIEW_ENVELOPE_HPP
