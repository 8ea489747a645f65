#include <doctest/doctest.h>
#include "meshview/log.hpp"
#include "meshview/memory_store.hpp"
#include "meshview/pipeline.hpp"
#include "proto_builders.hpp"

#include <sstream>
#include <vector>

using namespace meshview;
using namespace mvtest;

// Pipeline wired to an in-memory store, a hub with one subscriber and a
// sleeper that records delays instead of sleeping.
struct Harness {
    explicit Harness(PipelineConfig cfg = PipelineConfig{})
    : hub(64), pipeline(cfg, store, keys, hub, counters) {
        std::string err;
        keys.add_base64("LongFast", "AQ==", err);
        sub = hub.subscribe();
        pipeline.set_sleeper([this](uint32_t ms) { sleeps.push_back(ms); });
    }

    std::vector<NormalizedEvent> drain() {
        std::vector<NormalizedEvent> out;
        NormalizedEvent ev;
        while (sub->try_next(ev)) out.push_back(ev);
        return out;
    }

    MemoryStore store;
    ChannelKeys keys;
    LiveHub hub;
    PipelineCounters counters;
    Pipeline pipeline;
    std::shared_ptr<Subscription> sub;
    std::vector<uint32_t> sleeps;
};

static PacketSpec text_packet(PacketId id, NodeNum from, const std::string& body) {
    PacketSpec s;
    s.id = id;
    s.from = from;
    s.payload = text(body);
    return s;
}

TEST_CASE("Two gateways reporting one packet give one packet and two observations") {
    Harness h;
    const PacketSpec s = text_packet(1234, 0x1, "hello");

    CHECK(h.pipeline.process(raw(s, 0xA, 100)) == ProcessOutcome::Stored);
    CHECK(h.pipeline.process(raw(s, 0xB, 200)) == ProcessOutcome::Stored);

    const auto p = h.store.get_packet(PacketKey{1234, 0x1});
    REQUIRE(p.has_value());
    CHECK(p->import_time == 100);
    CHECK(p->payload == text("hello"));
    CHECK(h.store.packets_seen(PacketKey{1234, 0x1}).size() == 2);
    CHECK(h.store.counts().packets == 1);

    const auto events = h.drain();
    REQUIRE(events.size() == 2);
    CHECK(events[0].first_sighting);
    CHECK(events[0].gateway == 0xAu);
    CHECK_FALSE(events[1].first_sighting);
    CHECK(events[1].gateway == 0xBu);
    CHECK(std::get<TextRecord>(events[1].record).text == "hello");
}

TEST_CASE("Position report creates node, packet and one observation per gateway") {
    Harness h;
    PacketSpec s;
    s.id = 77;
    s.from = 42;
    s.portnum = port::POSITION;
    s.payload = position(37.0, -122.0);

    CHECK(h.pipeline.process(raw(s, 0xA, 100)) == ProcessOutcome::Stored);
    const auto n = h.store.get_node(42);
    REQUIRE(n.has_value());
    REQUIRE(n->position.value.has_value());
    CHECK(n->position.value->lat == doctest::Approx(37.0));
    CHECK(n->position.value->lon == doctest::Approx(-122.0));
    CHECK(h.store.get_packet(PacketKey{77, 42}).has_value());
    CHECK(h.store.packets_seen(PacketKey{77, 42}).size() == 1);

    CHECK(h.pipeline.process(raw(s, 0xB, 200)) == ProcessOutcome::Stored);
    const auto seen = h.store.packets_seen(PacketKey{77, 42});
    REQUIRE(seen.size() == 2);
    CHECK(h.store.counts().packets == 1);
}

TEST_CASE("Same gateway reporting again is a silent no-op") {
    Harness h;
    const RawMessage m = raw(text_packet(7, 0x1, "x"), 0xA, 100);
    CHECK(h.pipeline.process(m) == ProcessOutcome::Stored);
    CHECK(h.pipeline.process(m) == ProcessOutcome::Duplicate);

    CHECK(h.counters.dedup_noops.load() == 1);
    CHECK(h.store.packets_seen(PacketKey{7, 0x1}).size() == 1);
    CHECK(h.drain().size() == 1);
}

TEST_CASE("Unparseable topic is counted and nothing is written") {
    Harness h;
    RawMessage m = raw(text_packet(1, 0x1, "x"), 0xA, 100);
    m.topic = "not/a/mesh/topic";
    CHECK(h.pipeline.process(m) == ProcessOutcome::BadTopic);
    CHECK(h.counters.bad_topic.load() == 1);
    CHECK(h.store.write_calls() == 0);
}

TEST_CASE("Truncated envelope is a decode failure with zero store writes") {
    Harness h;
    RawMessage m = raw(text_packet(1, 0x1, "hello"), 0xA, 100);
    m.payload.resize(m.payload.size() - 3);

    CHECK(h.pipeline.process(m) == ProcessOutcome::DecodeFailed);
    CHECK(h.counters.decode_failures.load() == 1);
    CHECK(h.store.write_calls() == 0);
    CHECK(h.drain().empty());

    // the next well-formed message is unaffected
    CHECK(h.pipeline.process(raw(text_packet(2, 0x1, "next"), 0xA, 101)) == ProcessOutcome::Stored);
    CHECK(h.store.get_packet(PacketKey{2, 0x1}).has_value());
}

TEST_CASE("Packet id zero and ignored senders are dropped") {
    PipelineConfig cfg;
    cfg.ignore_from.insert(0xBAD);
    Harness h(cfg);

    CHECK(h.pipeline.process(raw(text_packet(0, 0x1, "x"), 0xA, 1)) == ProcessOutcome::Ignored);
    CHECK(h.pipeline.process(raw(text_packet(5, 0xBAD, "x"), 0xA, 1)) == ProcessOutcome::Ignored);
    CHECK(h.counters.ignored.load() == 2);
    CHECK(h.store.write_calls() == 0);
}

TEST_CASE("Undecryptable packet is recorded opaque and later enriched") {
    Harness h;
    ChannelKeys private_keys;
    std::string err;
    REQUIRE(private_keys.add_base64("Secret", "ESIzRFVmd4iZqrvM3e7/AA==", err));

    PacketSpec s = text_packet(900, 0x1, "psst");
    RawMessage sealed;
    sealed.topic = topic_for(0xA, "Secret");
    sealed.payload = encrypted_envelope(s, *private_keys.find("Secret"), "Secret", 0xA);
    sealed.received_at = 100;

    CHECK(h.pipeline.process(sealed) == ProcessOutcome::Opaque);
    CHECK(h.counters.undecryptable.load() == 1);
    auto p = h.store.get_packet(PacketKey{900, 0x1});
    REQUIRE(p.has_value());
    CHECK(p->encrypted);
    CHECK_FALSE(p->portnum.has_value());
    CHECK(h.drain().empty());

    // A gateway holding the key uplinks the decoded form.
    CHECK(h.pipeline.process(raw(s, 0xB, 200, "Secret")) == ProcessOutcome::Stored);
    p = h.store.get_packet(PacketKey{900, 0x1});
    REQUIRE(p.has_value());
    CHECK_FALSE(p->encrypted);
    CHECK(p->portnum == std::optional<uint32_t>(port::TEXT_MESSAGE));
    CHECK(p->payload == text("psst"));
    CHECK(p->import_time == 100);
    CHECK(h.store.packets_seen(PacketKey{900, 0x1}).size() == 2);

    const auto events = h.drain();
    REQUIRE(events.size() == 1);
    CHECK_FALSE(events[0].first_sighting);
}

TEST_CASE("Malformed kind payload still records the observation") {
    Harness h;
    PacketSpec s;
    s.id = 44;
    s.portnum = port::NODEINFO;
    s.payload = {0xff, 0xff};
    CHECK(h.pipeline.process(raw(s, 0xA, 5)) == ProcessOutcome::PayloadFailed);
    CHECK(h.counters.payload_decode_failures.load() == 1);
    CHECK(h.store.get_packet(PacketKey{44, s.from}).has_value());
    CHECK(h.store.packets_seen(PacketKey{44, s.from}).size() == 1);
    CHECK_FALSE(h.store.get_node(s.from).has_value());

    // same gateway again is a duplicate, not a second failure
    CHECK(h.pipeline.process(raw(s, 0xA, 6)) == ProcessOutcome::Duplicate);
    CHECK(h.counters.payload_decode_failures.load() == 1);
    CHECK(h.counters.dedup_noops.load() == 1);

    // another gateway is a new observation of the same bad payload
    CHECK(h.pipeline.process(raw(s, 0xB, 7)) == ProcessOutcome::PayloadFailed);
    CHECK(h.counters.payload_decode_failures.load() == 2);
    CHECK(h.store.packets_seen(PacketKey{44, s.from}).size() == 2);
}

TEST_CASE("Node info updates the sender and names appear on later events") {
    Harness h;
    PacketSpec info;
    info.id = 10;
    info.from = 0x1;
    info.portnum = port::NODEINFO;
    info.payload = user("Alpha Base", "ALB");
    CHECK(h.pipeline.process(raw(info, 0xA, 100)) == ProcessOutcome::Stored);

    PacketSpec gw_pos;
    gw_pos.id = 11;
    gw_pos.from = 0xA;
    gw_pos.portnum = port::POSITION;
    gw_pos.payload = position(40.0, -105.0);
    CHECK(h.pipeline.process(raw(gw_pos, 0xA, 110)) == ProcessOutcome::Stored);

    PacketSpec pos;
    pos.id = 12;
    pos.from = 0x1;
    pos.portnum = port::POSITION;
    pos.payload = position(40.1, -105.0);
    CHECK(h.pipeline.process(raw(pos, 0xA, 120)) == ProcessOutcome::Stored);

    const auto n = h.store.get_node(0x1);
    REQUIRE(n.has_value());
    REQUIRE(n->long_name.value.has_value());
    CHECK(std::string(n->long_name.value->c_str()) == "Alpha Base");
    REQUIRE(n->position.value.has_value());
    CHECK(n->position.value->lat == doctest::Approx(40.1));
    CHECK(n->last_seen == 120);

    const auto events = h.drain();
    REQUIRE(events.size() == 3);
    CHECK(events[0].kind == MessageKind::NodeInfo);
    CHECK(events[0].from_long_name == "Alpha Base");
    CHECK(events[0].from_short_name == "ALB");
    CHECK_FALSE(events[0].distance_km.has_value());
    CHECK(events[2].from_long_name == "Alpha Base");
    REQUIRE(events[2].distance_km.has_value());
    CHECK(*events[2].distance_km == doctest::Approx(11.1).epsilon(0.01));
}

TEST_CASE("Traceroute request and response assemble into one completed record") {
    Harness h;

    PacketSpec req;
    req.id = 500;
    req.from = 0x1;
    req.to = 0x4;
    req.portnum = port::TRACEROUTE;
    req.want_response = true;
    req.payload = route_discovery({0x2}, {24});
    CHECK(h.pipeline.process(raw(req, 0xA, 100)) == ProcessOutcome::Stored);

    auto t = h.store.get_traceroute(PacketKey{500, 0x1});
    REQUIRE(t.has_value());
    CHECK(t->route == std::vector<NodeNum>{0x1, 0x2});
    CHECK_FALSE(t->done);

    PacketSpec resp;
    resp.id = 501;
    resp.from = 0x4;
    resp.to = 0x1;
    resp.portnum = port::TRACEROUTE;
    resp.request_id = 500;
    resp.payload = route_discovery({0x2, 0x3}, {24, 20, 16}, {0x3, 0x2}, {12, 8, 4});
    CHECK(h.pipeline.process(raw(resp, 0xB, 200)) == ProcessOutcome::Stored);

    t = h.store.get_traceroute(PacketKey{500, 0x1});
    REQUIRE(t.has_value());
    CHECK(t->done);
    CHECK(t->target == 0x4u);
    CHECK(t->route == std::vector<NodeNum>{0x1, 0x2, 0x3, 0x4});
    CHECK(t->route_back == std::vector<NodeNum>{0x4, 0x3, 0x2, 0x1});
    REQUIRE(t->snr_towards.size() == 3);
    CHECK(t->snr_towards[0] == doctest::Approx(6.0));
    CHECK(h.store.counts().traceroutes == 1);
    CHECK(h.counters.anomalies.load() == 0);
}

TEST_CASE("Diverging traceroute copies raise an anomaly and keep the first path") {
    Harness h;
    PacketSpec req;
    req.id = 600;
    req.from = 0x1;
    req.to = 0x4;
    req.portnum = port::TRACEROUTE;
    req.want_response = true;
    req.payload = route_discovery({0x2});
    CHECK(h.pipeline.process(raw(req, 0xA, 100)) == ProcessOutcome::Stored);

    req.payload = route_discovery({0x7});
    CHECK(h.pipeline.process(raw(req, 0xB, 110)) == ProcessOutcome::Stored);

    CHECK(h.counters.anomalies.load() == 1);
    const auto t = h.store.get_traceroute(PacketKey{600, 0x1});
    REQUIRE(t.has_value());
    CHECK(t->route == std::vector<NodeNum>{0x1, 0x2});
}

TEST_CASE("Busy store calls are retried with growing backoff") {
    PipelineConfig cfg;
    cfg.store_max_attempts = 4;
    cfg.store_backoff_ms = 10;
    Harness h(cfg);

    int busy_left = 2;
    h.store.set_fault_hook([&busy_left] {
        if (busy_left > 0) { --busy_left; return StoreStatus::Busy; }
        return StoreStatus::Ok;
    });

    CHECK(h.pipeline.process(raw(text_packet(1, 0x1, "x"), 0xA, 1)) == ProcessOutcome::Stored);
    CHECK(h.counters.store_retries.load() == 2);
    CHECK(h.sleeps == std::vector<uint32_t>{10, 20});
    CHECK(h.store.get_packet(PacketKey{1, 0x1}).has_value());
    CHECK(h.counters.store_drops.load() == 0);
}

TEST_CASE("Exhausted retries drop the write and repeated drops mark the pipeline degraded") {
    PipelineConfig cfg;
    cfg.store_max_attempts = 3;
    cfg.store_backoff_ms = 1;
    cfg.store_degraded_threshold = 2;
    Harness h(cfg);

    h.store.set_fault_hook([] { return StoreStatus::Busy; });
    CHECK(h.pipeline.process(raw(text_packet(1, 0x1, "x"), 0xA, 1)) == ProcessOutcome::StoreDropped);
    CHECK(h.counters.store_retries.load() == 2);
    CHECK(h.counters.store_drops.load() == 1);
    CHECK_FALSE(h.counters.degraded.load());

    CHECK(h.pipeline.process(raw(text_packet(2, 0x1, "x"), 0xA, 2)) == ProcessOutcome::StoreDropped);
    CHECK(h.counters.degraded.load());
    CHECK(h.drain().empty());

    // Failed is permanent: no retry.
    h.store.set_fault_hook([] { return StoreStatus::Failed; });
    const uint64_t retries = h.counters.store_retries.load();
    CHECK(h.pipeline.process(raw(text_packet(3, 0x1, "x"), 0xA, 3)) == ProcessOutcome::StoreDropped);
    CHECK(h.counters.store_retries.load() == retries);

    h.store.set_fault_hook(nullptr);
    CHECK(h.pipeline.process(raw(text_packet(4, 0x1, "x"), 0xA, 4)) == ProcessOutcome::Stored);
    CHECK_FALSE(h.counters.degraded.load());
}

TEST_CASE("Workers drain the raw queue on stop") {
    PipelineConfig cfg;
    cfg.workers = 4;
    Harness h(cfg);

    BoundedQueue<RawMessage> q(256);
    for (PacketId id = 1; id <= 50; ++id) {
        q.push(raw(text_packet(id, 0x1, "n"), (id % 2) ? 0xA : 0xB, static_cast<TimeUs>(id)));
    }
    h.pipeline.start(q);
    h.pipeline.stop();

    CHECK(h.counters.processed.load() == 50);
    CHECK(h.store.counts().packets == 50);
    CHECK(h.counters.events_published.load() == 50);
    CHECK(q.closed());
}

TEST_CASE("Debug log names the envelope status and each message outcome") {
    std::ostringstream sink;
    set_log_stream(&sink);
    set_log_level(LogLevel::Debug);

    Harness h;
    BoundedQueue<RawMessage> q(8);
    RawMessage bad = raw(text_packet(1, 0x1, "x"), 0xA, 1);
    bad.topic = "not/a/mesh/topic";
    q.push(bad);
    q.push(raw(text_packet(2, 0x1, "y"), 0xA, 2));
    h.pipeline.start(q);
    h.pipeline.stop();

    set_log_level(LogLevel::Info);
    set_log_stream(nullptr);

    const std::string out = sink.str();
    CHECK(out.find("event=envelope_rejected status=bad_topic") != std::string::npos);
    CHECK(out.find("outcome=bad_topic") != std::string::npos);
    CHECK(out.find("outcome=stored") != std::string::npos);
}
