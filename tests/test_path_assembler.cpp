#include <doctest/doctest.h>
#include "meshview/memory_store.hpp"
#include "meshview/path_assembler.hpp"

#include <cmath>

using namespace meshview;

// Request from 0x1 towards 0x4; response travels back through 0x3, 0x2.
static DecodedEnvelope trace_env(PacketId id, NodeNum from, NodeNum to, bool want_response,
                                 PacketId request_id, NodeNum gateway, TimeUs at) {
    DecodedEnvelope env;
    env.packet_id = id;
    env.from = from;
    env.to = to;
    env.want_response = want_response;
    env.request_id = request_id;
    env.gateway = gateway;
    env.kind = MessageKind::Traceroute;
    env.portnum = port::TRACEROUTE;
    env.received_at = at;
    return env;
}

static TraceRecord trace_rec(std::initializer_list<NodeNum> route, std::initializer_list<float> snr,
                             bool response, std::initializer_list<NodeNum> back = {},
                             std::initializer_list<float> snr_back = {}) {
    TraceRecord r;
    for (NodeNum n : route) r.route.push_back(n);
    for (float s : snr) r.snr_towards.push_back(s);
    for (NodeNum n : back) r.route_back.push_back(n);
    for (float s : snr_back) r.snr_back.push_back(s);
    r.is_response = response;
    return r;
}

TEST_CASE("Request and response are keyed by the request") {
    const TraceInput req = trace_input_from(trace_env(500, 0x1, 0x4, true, 0, 0xA, 10),
                                            trace_rec({}, {}, false));
    CHECK(req.key == PacketKey{500, 0x1});
    CHECK(req.forward == std::vector<NodeNum>{0x1});
    CHECK(req.back.empty());

    const TraceInput resp = trace_input_from(trace_env(501, 0x4, 0x1, false, 500, 0xB, 20),
                                             trace_rec({0x2, 0x3}, {6.0f, 5.0f, 4.0f}, true,
                                                       {0x3, 0x2}, {3.0f, 2.0f, 1.0f}));
    CHECK(resp.key == PacketKey{500, 0x1});
    CHECK(resp.requester == 0x1u);
    CHECK(resp.target == 0x4u);
    CHECK(resp.forward == std::vector<NodeNum>{0x1, 0x2, 0x3, 0x4});
    CHECK(resp.back == std::vector<NodeNum>{0x4, 0x3, 0x2, 0x1});
}

TEST_CASE("Forward route grows by prefix extension and completes on response") {
    MemoryStore st;
    PathAssembler pa(st);

    TraceInput partial;
    partial.key = PacketKey{500, 0x1};
    partial.requester = 0x1;
    partial.target = 0x4;
    partial.gateway = 0xA;
    partial.forward = {0x1, 0x2};
    partial.snr_towards = {6.0f};
    partial.observed_at = 10;

    TraceOutcome out;
    REQUIRE(pa.assemble(partial, out) == StoreStatus::Ok);
    CHECK(out.created);
    CHECK(out.forward_changed);
    CHECK_FALSE(out.completed);

    TraceInput full = partial;
    full.forward = {0x1, 0x2, 0x3, 0x4};
    full.snr_towards = {6.0f, 5.0f, 4.0f};
    full.back = {0x4, 0x3, 0x2, 0x1};
    full.snr_back = {3.0f, 2.0f, 1.0f};
    full.response = true;
    full.gateway = 0xB;
    full.observed_at = 20;
    REQUIRE(pa.assemble(full, out) == StoreStatus::Ok);
    CHECK_FALSE(out.created);
    CHECK(out.forward_changed);
    CHECK(out.back_changed);
    CHECK(out.completed);
    CHECK_FALSE(out.conflict);
    CHECK(out.edges.size() == 6);

    const auto t = st.get_traceroute(PacketKey{500, 0x1});
    REQUIRE(t.has_value());
    CHECK(t->route == std::vector<NodeNum>{0x1, 0x2, 0x3, 0x4});
    CHECK(t->route_back == std::vector<NodeNum>{0x4, 0x3, 0x2, 0x1});
    CHECK(t->done);
    CHECK(t->gateway == 0xAu);                     // first report's gateway kept
    CHECK(t->import_time == 10);
    CHECK(t->updated_at == 20);
}

TEST_CASE("Replaying the same trace from another gateway changes nothing") {
    Traceroute rec;
    TraceInput in;
    in.key = PacketKey{1, 0x1};
    in.forward = {0x1, 0x2, 0x3};
    in.observed_at = 5;
    merge_trace(rec, false, in);

    TraceInput again = in;
    again.gateway = 0xC;
    again.observed_at = 9;
    const TraceOutcome o = merge_trace(rec, true, again);
    CHECK_FALSE(o.changed());
    CHECK_FALSE(o.conflict);
    CHECK(rec.updated_at == 5);

    TraceInput shorter = in;
    shorter.forward = {0x1, 0x2};
    CHECK_FALSE(merge_trace(rec, true, shorter).changed());
    CHECK(rec.route.size() == 3);
}

TEST_CASE("Return route is appended to a record that only had the forward route") {
    Traceroute rec;
    TraceInput fwd;
    fwd.key = PacketKey{8, 0x1};
    fwd.requester = 0x1;
    fwd.target = 0x4;
    fwd.forward = {0x1, 0x2, 0x4};
    fwd.snr_towards = {6.0f, 3.5f};
    fwd.observed_at = 10;
    merge_trace(rec, false, fwd);
    REQUIRE(rec.route_back.empty());

    TraceInput ret;
    ret.key = fwd.key;
    ret.requester = 0x1;
    ret.target = 0x4;
    ret.back = {0x4, 0x3, 0x1};
    ret.snr_back = {2.0f, -1.25f};
    ret.response = true;
    ret.observed_at = 30;
    const TraceOutcome o = merge_trace(rec, true, ret);

    CHECK_FALSE(o.created);
    CHECK_FALSE(o.forward_changed);
    CHECK(o.back_changed);
    CHECK(o.completed);
    CHECK_FALSE(o.conflict);
    CHECK(rec.route == std::vector<NodeNum>{0x1, 0x2, 0x4});
    CHECK(rec.route_back == std::vector<NodeNum>{0x4, 0x3, 0x1});
    CHECK(rec.snr_back.size() == 2);
    CHECK(rec.done);
    CHECK(rec.import_time == 10);
    CHECK(rec.updated_at == 30);
    CHECK(o.edges.size() == 4);
}

TEST_CASE("Diverging route keeps the first one and flags a conflict") {
    Traceroute rec;
    TraceInput in;
    in.key = PacketKey{1, 0x1};
    in.forward = {0x1, 0x2, 0x3};
    merge_trace(rec, false, in);

    TraceInput other = in;
    other.forward = {0x1, 0x7, 0x3};
    const TraceOutcome o = merge_trace(rec, true, other);
    CHECK(o.conflict);
    CHECK_FALSE(o.forward_changed);
    CHECK(rec.route == std::vector<NodeNum>{0x1, 0x2, 0x3});
}

TEST_CASE("Edges follow consecutive hops with SNR of the receiving hop") {
    Traceroute rec;
    rec.route = {0x1, 0x2, 0x3};
    rec.snr_towards = {4.0f, std::nanf("")};
    rec.updated_at = 42;

    const auto edges = trace_edges(rec);
    REQUIRE(edges.size() == 2);
    CHECK(edges[0].from == 0x1u);
    CHECK(edges[0].to == 0x2u);
    CHECK(edges[0].snr == std::optional<float>(4.0f));
    CHECK_FALSE(edges[1].snr.has_value());
    CHECK(edges[1].observed_at == 42);
    CHECK(edges[1].kind == EdgeKind::Trace);
}
