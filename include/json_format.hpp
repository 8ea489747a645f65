#pragma once
/**
 * @file json_format.hpp
 * @brief nlohmann/json rendering of store records, live events and health.
 *
 * Used by meshview-query (one JSON document per command) and by
 * meshview-ingest (`--events` prints one event per line; the health
 * snapshot on shutdown). Conventions:
 *   - node ids render as "!xxxxxxxx" strings,
 *   - unknown optional values render as null,
 *   - timestamps stay integer microseconds since the epoch,
 *   - payload bytes render as lowercase hex.
 */

#include <nlohmann/json.hpp>

#include "meshview/aggregators.hpp"
#include "meshview/health.hpp"
#include "meshview/live_hub.hpp"
#include "meshview/payloads.hpp"
#include "meshview/types.hpp"

namespace meshview {

void to_json(nlohmann::json& j, const Position& p);
void to_json(nlohmann::json& j, const Node& n);
void to_json(nlohmann::json& j, const Packet& p);
void to_json(nlohmann::json& j, const PacketSeen& s);
void to_json(nlohmann::json& j, const Traceroute& t);
void to_json(nlohmann::json& j, const Edge& e);
void to_json(nlohmann::json& j, const Graph& g);
void to_json(nlohmann::json& j, const TrafficRow& r);
void to_json(nlohmann::json& j, const PortCount& c);
void to_json(nlohmann::json& j, const NormalizedEvent& ev);
void to_json(nlohmann::json& j, const HealthSnapshot& h);

/// Kind-specific body of a decoded record, tagged with "kind".
nlohmann::json record_json(const KindRecord& rec);

} // namespace meshview
