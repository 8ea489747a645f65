#include <doctest/doctest.h>
#include "meshview/health.hpp"
#include "meshview/log.hpp"
#include "json_format.hpp"

#include <sstream>
#include <string>

using namespace meshview;

static bool has(const std::string& line, const std::string& needle) {
    return line.find(needle) != std::string::npos;
}

TEST_CASE("fill_counters copies pipeline counters and leaves listener fields alone") {
    PipelineCounters c;
    c.processed = 12;
    c.dedup_noops = 3;
    c.store_drops = 1;
    c.degraded = true;

    HealthSnapshot h;
    h.connects = 7;
    h.connection = transport::ConnState::Connected;
    fill_counters(c, h);

    CHECK(h.processed == 12u);
    CHECK(h.dedup_noops == 3u);
    CHECK(h.store_drops == 1u);
    CHECK(h.bad_topic == 0u);
    CHECK(h.degraded);
    CHECK(h.connects == 7u);
    CHECK(h.connection == transport::ConnState::Connected);
}

TEST_CASE("log_health writes one key=value line at info level") {
    std::ostringstream sink;
    set_log_stream(&sink);
    set_log_level(LogLevel::Info);

    HealthSnapshot h;
    h.connection = transport::ConnState::Backoff;
    h.received = 40;
    h.raw_queue_drops = 2;
    h.degraded = true;
    log_health(h);

    set_log_level(LogLevel::Warn);
    log_health(h);                        // below threshold, nothing written

    set_log_stream(nullptr);
    set_log_level(LogLevel::Info);

    const std::string out = sink.str();
    CHECK(has(out, "level=info event=health"));
    CHECK(has(out, "conn=backoff"));
    CHECK(has(out, "received=40"));
    CHECK(has(out, "raw_drops=2"));
    CHECK(has(out, "degraded=true"));
    CHECK(out.find('\n') == out.size() - 1);
}

TEST_CASE("health snapshot renders as JSON with the connection state by name") {
    HealthSnapshot h;
    h.connection = transport::ConnState::Connected;
    h.anomalies = 5;
    const nlohmann::json j = h;
    CHECK(j["connection"] == "connected");
    CHECK(j["anomalies"] == 5);
    CHECK(j["degraded"] == false);
}
