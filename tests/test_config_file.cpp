#include <doctest/doctest.h>
#include "config_file.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace meshview;

TEST_CASE("Empty document keeps every default") {
    Config cfg;
    std::string err;
    REQUIRE(parse_config("{}", cfg, err));
    CHECK(cfg.mqtt.broker.host == "localhost");
    CHECK(cfg.mqtt.broker.port == 1883);
    CHECK(cfg.mqtt.topics == std::vector<std::string>{"msh/#"});
    CHECK(cfg.pipeline.workers == 2);
    CHECK(cfg.store.path == "meshview.db");
    CHECK(cfg.channels.count("LongFast") == 1);
    CHECK(cfg.log_level == LogLevel::Info);
}

TEST_CASE("Sections override only the keys they name") {
    const std::string text = R"({
        "mqtt": { "host": "mqtt.example.org", "port": 8883, "topics": ["msh/US/#", "msh/EU/#"],
                  "reconnect_min_ms": 250 },
        "pipeline": { "workers": 6, "ignore_from": [305419896, "!0000beef"] },
        "channels": { "Ops": "ESIzRFVmd4iZqrvM3e7/AA==" },
        "store": { "path": ":memory:" },
        "live": { "subscriber_capacity": 32 },
        "log_level": "debug",
        "health_interval_s": 15
    })";
    Config cfg;
    std::string err;
    REQUIRE_MESSAGE(parse_config(text, cfg, err), err);

    CHECK(cfg.mqtt.broker.host == "mqtt.example.org");
    CHECK(cfg.mqtt.broker.port == 8883);
    CHECK(cfg.mqtt.topics.size() == 2);
    CHECK(cfg.mqtt.reconnect_min_ms == 250);
    CHECK(cfg.mqtt.reconnect_max_ms == 30000);
    CHECK(cfg.pipeline.workers == 6);
    CHECK(cfg.pipeline.raw_queue_capacity == 4096);
    CHECK(cfg.pipeline.ignore_from.count(0x12345678) == 1);
    CHECK(cfg.pipeline.ignore_from.count(0xbeef) == 1);
    CHECK(cfg.channels.size() == 1);
    CHECK(cfg.channels.count("LongFast") == 0);
    CHECK(cfg.store.path == ":memory:");
    CHECK(cfg.store.busy_timeout_ms == 2000);
    CHECK(cfg.live.subscriber_capacity == 32);
    CHECK(cfg.log_level == LogLevel::Debug);
    CHECK(cfg.health_interval_s == 15);
}

TEST_CASE("Invalid documents are rejected with a reason") {
    Config cfg;
    std::string err;

    CHECK_FALSE(parse_config("{ not json", cfg, err));
    CHECK_FALSE(err.empty());

    err.clear();
    CHECK_FALSE(parse_config("[1, 2]", cfg, err));
    CHECK(err.find("object") != std::string::npos);

    Config c2;
    CHECK_FALSE(parse_config(R"({"log_level": "chatty"})", c2, err));
    CHECK(err.find("log_level") != std::string::npos);

    Config c3;
    CHECK_FALSE(parse_config(R"({"mqtt": {"port": "eighteen"}})", c3, err));

    Config c4;
    CHECK_FALSE(parse_config(R"({"pipeline": {"ignore_from": ["!zz"]}})", c4, err));

    Config c5;
    CHECK_FALSE(parse_config(R"({"mqtt": {"reconnect_min_ms": 5000, "reconnect_max_ms": 100}})", c5, err));

    Config c6;
    CHECK_FALSE(parse_config(R"({"live": {"subscriber_capacity": 0}})", c6, err));
}

TEST_CASE("Config file is read from disk") {
    char path[] = "/tmp/meshview_cfg_XXXXXX";
    const int fd = mkstemp(path);
    REQUIRE(fd >= 0);
    close(fd);
    {
        std::ofstream out(path);
        out << R"({"mqtt": {"host": "broker.local"}})";
    }
    Config cfg;
    std::string err;
    CHECK(load_config_file(path, cfg, err));
    CHECK(cfg.mqtt.broker.host == "broker.local");
    std::remove(path);

    CHECK_FALSE(load_config_file("/nonexistent/meshview.json", cfg, err));
    CHECK(err.find("cannot read") != std::string::npos);
}

TEST_CASE("Channel keys are built from the config and bad keys are reported") {
    Config cfg;
    ChannelKeys keys;
    std::string err;
    REQUIRE(build_channel_keys(cfg, keys, err));
    CHECK(keys.size() == 1);
    CHECK(keys.find("LongFast") != nullptr);

    cfg.channels["Broken"] = "not base64!";
    ChannelKeys keys2;
    CHECK_FALSE(build_channel_keys(cfg, keys2, err));
    CHECK(err.find("Broken") != std::string::npos);
}
