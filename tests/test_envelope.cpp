#include <doctest/doctest.h>
#include "meshview/envelope.hpp"
#include "proto_builders.hpp"

using namespace meshview;
using namespace mvtest;

static ChannelKeys default_keys() {
    ChannelKeys keys;
    std::string err;
    keys.add_base64("LongFast", "AQ==", err);
    return keys;
}

TEST_CASE("Decoded envelope carries identity, signal and inner payload") {
    PacketSpec s;
    s.id = 1234;
    s.from = 0x1;
    s.to = 0x2;
    s.payload = text("hi");
    s.hop_start = 5;
    s.hop_limit = 3;

    const ChannelKeys keys = default_keys();
    DecodedEnvelope env;
    std::string err;
    REQUIRE(decode_envelope(raw(s, 0x0a, 1000), keys, env, err) == DecodeStatus::Ok);
    CHECK(env.packet_id == 1234u);
    CHECK(env.from == 0x1u);
    CHECK(env.to == 0x2u);
    CHECK(env.gateway == 0x0au);
    CHECK(env.channel == ChannelStr("LongFast"));
    CHECK(env.kind == MessageKind::Text);
    CHECK(env.inner_payload == text("hi"));
    CHECK(env.received_at == 1000);
    CHECK_FALSE(env.was_encrypted);
    REQUIRE(env.rssi.has_value());
    CHECK(*env.rssi == -90);
    REQUIRE(env.snr.has_value());
    CHECK(*env.snr == doctest::Approx(5.25));
    CHECK(hop_count(env.hop_start, env.hop_limit) == std::optional<uint32_t>(2));
}

TEST_CASE("Packets relayed without radio reception have no signal figures") {
    PacketSpec s;
    s.rssi = 0;
    const ChannelKeys keys = default_keys();
    DecodedEnvelope env;
    std::string err;
    REQUIRE(decode_envelope(raw(s, 0x0a, 1), keys, env, err) == DecodeStatus::Ok);
    CHECK_FALSE(env.rssi.has_value());
    CHECK_FALSE(env.snr.has_value());
}

TEST_CASE("Encrypted payload under a known key decodes like a clear one") {
    const ChannelKeys keys = default_keys();
    PacketSpec s;
    s.id = 77;
    s.from = 0xdeadbeef;
    s.portnum = port::POSITION;
    s.payload = position(37.5, -122.25);

    RawMessage m;
    m.topic = topic_for(0x0a);
    m.payload = encrypted_envelope(s, *keys.find("LongFast"));
    m.received_at = 5;

    DecodedEnvelope env;
    std::string err;
    REQUIRE(decode_envelope(m, keys, env, err) == DecodeStatus::Ok);
    CHECK(env.was_encrypted);
    CHECK_FALSE(env.opaque);
    CHECK(env.kind == MessageKind::Position);
    CHECK(env.inner_payload == s.payload);
}

TEST_CASE("Encrypted payload on a channel without a key is an opaque observation") {
    ChannelKeys writer;
    std::string err;
    REQUIRE(writer.add("Secret", std::vector<uint8_t>(16, 0x33), err));

    PacketSpec s;
    s.id = 9;
    s.payload = text("classified");

    RawMessage m;
    m.topic = topic_for(0x0a, "Secret");
    m.payload = encrypted_envelope(s, *writer.find("Secret"), "Secret");

    DecodedEnvelope env;
    const ChannelKeys no_keys;
    REQUIRE(decode_envelope(m, no_keys, env, err) == DecodeStatus::Opaque);
    CHECK(env.opaque);
    CHECK(env.packet_id == 9u);
    CHECK_FALSE(env.inner_payload.empty());
}

TEST_CASE("Bad topic and truncated bytes are distinguished") {
    const ChannelKeys keys = default_keys();
    PacketSpec s;
    RawMessage m = raw(s, 0x0a, 1);

    DecodedEnvelope env;
    std::string err;
    RawMessage bad_topic = m;
    bad_topic.topic = "msh/US/2/json/LongFast/!0a";
    CHECK(decode_envelope(bad_topic, keys, env, err) == DecodeStatus::BadTopic);

    RawMessage truncated = m;
    truncated.payload.resize(truncated.payload.size() / 2);
    CHECK(decode_envelope(truncated, keys, env, err) == DecodeStatus::Malformed);
    CHECK_FALSE(err.empty());

    RawMessage empty = m;
    empty.payload.clear();
    CHECK(decode_envelope(empty, keys, env, err) == DecodeStatus::Malformed);
}

TEST_CASE("Hop count is unknown for old firmware and inconsistent headers") {
    CHECK(hop_count(0, 3) == std::nullopt);
    CHECK(hop_count(2, 3) == std::nullopt);
    CHECK(hop_count(7, 7) == std::optional<uint32_t>(0));
    CHECK(hop_count(7, 4) == std::optional<uint32_t>(3));
}

TEST_CASE("Port numbers map to message kinds") {
    CHECK(kind_from_portnum(port::TEXT_MESSAGE) == MessageKind::Text);
    CHECK(kind_from_portnum(port::TRACEROUTE) == MessageKind::Traceroute);
    CHECK(kind_from_portnum(port::MAP_REPORT) == MessageKind::MapReport);
    CHECK(kind_from_portnum(256) == MessageKind::Unknown);
    CHECK(std::string(kind_name(MessageKind::NeighborInfo)) == "neighborinfo");
}
