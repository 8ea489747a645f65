#include <doctest/doctest.h>
#include "meshview/payloads.hpp"
#include "proto_builders.hpp"

#include <cmath>

using namespace meshview;
using namespace mvtest;

static DecodedEnvelope env_for(uint32_t portnum, std::vector<uint8_t> payload) {
    DecodedEnvelope env;
    env.packet_id = 100;
    env.from = 0x1;
    env.to = 0x2;
    env.portnum = portnum;
    env.kind = kind_from_portnum(portnum);
    env.inner_payload = std::move(payload);
    return env;
}

TEST_CASE("Text must be valid UTF-8") {
    KindRecord rec;
    std::string err;
    REQUIRE(decode_kind(env_for(port::TEXT_MESSAGE, text("h\xC3\xA9llo")), rec, err));
    CHECK(std::get<TextRecord>(rec).text == "h\xC3\xA9llo");

    CHECK_FALSE(decode_kind(env_for(port::TEXT_MESSAGE, text("bad\xC3")), rec, err));
    CHECK_FALSE(valid_utf8("\xED\xA0\x80"));        // surrogate
    CHECK_FALSE(valid_utf8("\xC0\xAF"));            // overlong
    CHECK(valid_utf8("\xF0\x9F\x93\xA1"));           // emoji
}

TEST_CASE("Position converts 1e-7 degrees and treats 0/0 as no fix") {
    KindRecord rec;
    std::string err;
    REQUIRE(decode_kind(env_for(port::POSITION, position(51.5, -0.125, 35)), rec, err));
    const auto& p = std::get<PositionRecord>(rec);
    REQUIRE(p.position.has_value());
    CHECK(p.position->lat == doctest::Approx(51.5));
    CHECK(p.position->lon == doctest::Approx(-0.125));
    CHECK(p.position->altitude == std::optional<int32_t>(35));
    CHECK(p.sats_in_view == 7u);

    REQUIRE(decode_kind(env_for(port::POSITION, position(0.0, 0.0)), rec, err));
    CHECK_FALSE(std::get<PositionRecord>(rec).position.has_value());
}

TEST_CASE("Node identity carries names, hardware and role") {
    KindRecord rec;
    std::string err;
    REQUIRE(decode_kind(env_for(port::NODEINFO, user("Base Camp", "BC", 43, 2)), rec, err));
    const auto& u = std::get<NodeInfoRecord>(rec);
    CHECK(u.long_name == LongNameStr("Base Camp"));
    CHECK(u.short_name == ShortNameStr("BC"));
    CHECK(u.hw_model == 43u);
    CHECK(std::string(role_name(u.role)) == "ROUTER");
    CHECK(std::string(hw_model_name(u.hw_model)) == "HELTEC_V3");
}

TEST_CASE("Telemetry keeps only the metrics that were sent") {
    KindRecord rec;
    std::string err;
    REQUIRE(decode_kind(env_for(port::TELEMETRY, device_telemetry(87, 3.9f)), rec, err));
    const auto& t = std::get<TelemetryRecord>(rec);
    REQUIRE(t.device.has_value());
    CHECK(t.device->battery_level == std::optional<uint32_t>(87));
    CHECK(*t.device->voltage == doctest::Approx(3.9));
    CHECK_FALSE(t.device->uptime_seconds.has_value());
    CHECK_FALSE(t.environment.has_value());
}

TEST_CASE("Path-trace SNR is scaled and the unknown marker becomes NaN") {
    DecodedEnvelope env = env_for(port::TRACEROUTE, route_discovery({0x5, 0x6}, {20, -128, 8}));
    env.want_response = false;
    env.request_id = 55;

    KindRecord rec;
    std::string err;
    REQUIRE(decode_kind(env, rec, err));
    const auto& t = std::get<TraceRecord>(rec);
    CHECK(t.is_response);
    REQUIRE(t.route.size() == 2);
    CHECK(t.route[1] == 0x6u);
    REQUIRE(t.snr_towards.size() == 3);
    CHECK(t.snr_towards[0] == doctest::Approx(5.0));
    CHECK(std::isnan(t.snr_towards[1]));
    CHECK(t.snr_towards[2] == doctest::Approx(2.0));

    env.want_response = true;
    env.request_id = 0;
    REQUIRE(decode_kind(env, rec, err));
    CHECK_FALSE(std::get<TraceRecord>(rec).is_response);
}

TEST_CASE("Neighbor list and map report decode") {
    KindRecord rec;
    std::string err;
    REQUIRE(decode_kind(env_for(port::NEIGHBORINFO, neighbor_info(0x1, {{0x7, 6.5f}, {0x8, -3.0f}})), rec, err));
    const auto& n = std::get<NeighborRecord>(rec);
    CHECK(n.node_id == 0x1u);
    REQUIRE(n.neighbors.size() == 2);
    CHECK(n.neighbors[0].node_id == 0x7u);
    CHECK(n.neighbors[1].snr == doctest::Approx(-3.0));

    REQUIRE(decode_kind(env_for(port::MAP_REPORT, map_report("Hilltop", "2.5.6.abc", 45.0, 7.5)), rec, err));
    const auto& m = std::get<MapReportRecord>(rec);
    CHECK(m.long_name == LongNameStr("Hilltop"));
    CHECK(m.firmware == FirmwareStr("2.5.6.abc"));
    REQUIRE(m.position.has_value());
    CHECK(m.position->lat == doctest::Approx(45.0));
    CHECK(m.num_online_local_nodes == 12u);
}

TEST_CASE("Unknown ports are safely ignored and garbage is a decode error") {
    KindRecord rec;
    std::string err;
    REQUIRE(decode_kind(env_for(256, {0x01, 0x02}), rec, err));
    CHECK(std::get<UnknownRecord>(rec).portnum == 256u);

    const std::vector<uint8_t> garbage = {0x0a, 0xff, 0x01};   // length runs past the end
    CHECK_FALSE(decode_kind(env_for(port::POSITION, garbage), rec, err));
    CHECK_FALSE(err.empty());
}
