#include <doctest/doctest.h>
#include "meshview/topic.hpp"

using namespace meshview;

TEST_CASE("Uplink topic yields gateway, channel and region") {
    TopicInfo ti;
    REQUIRE(parse_topic("msh/US/2/e/LongFast/!a1b2c3d4", ti));
    CHECK(ti.gateway == 0xa1b2c3d4u);
    CHECK(ti.channel == ChannelStr("LongFast"));
    CHECK(ti.region == "US");
}

TEST_CASE("Sub-regions are kept and short gateway ids are accepted") {
    TopicInfo ti;
    REQUIRE(parse_topic("msh/EU_868/DE/Berlin/2/c/MediumSlow/!1f", ti));
    CHECK(ti.gateway == 0x1fu);
    CHECK(ti.region == "EU_868/DE/Berlin");
    CHECK(ti.channel == ChannelStr("MediumSlow"));
}

TEST_CASE("Non-protobuf and malformed topics fail closed") {
    TopicInfo ti;
    ti.gateway = 7;
    CHECK_FALSE(parse_topic("msh/US/2/json/LongFast/!a1b2c3d4", ti));
    CHECK_FALSE(parse_topic("msh/US/2/map/", ti));
    CHECK_FALSE(parse_topic("msh/US/2/stat/!a1b2c3d4", ti));
    CHECK_FALSE(parse_topic("msh/US/1/e/LongFast/!a1b2c3d4", ti));    // wrong version
    CHECK_FALSE(parse_topic("msh/2/e/LongFast/!a1b2c3d4", ti));       // no region
    CHECK_FALSE(parse_topic("msh//2/e/LongFast/!a1b2c3d4", ti));      // empty region
    CHECK_FALSE(parse_topic("msh/US/2/e//!a1b2c3d4", ti));            // empty channel
    CHECK_FALSE(parse_topic("msh/US/2/e/LongFast/a1b2c3d4", ti));     // gateway without '!'
    CHECK_FALSE(parse_topic("msh/US/2/e/LongFast/!", ti));
    CHECK_FALSE(parse_topic("msh/US/2/e/LongFast/!123456789", ti));   // > 8 hex digits
    CHECK_FALSE(parse_topic("msh/US/2/e/LongFast/!12zz", ti));
    CHECK_FALSE(parse_topic("region/sub/gatewayA/1234", ti));
    CHECK(ti.gateway == 7u);                                            // untouched on failure
}

TEST_CASE("Channel names longer than 64 bytes are rejected") {
    TopicInfo ti;
    const std::string long_channel(65, 'x');
    CHECK_FALSE(parse_topic("msh/US/2/e/" + long_channel + "/!0a", ti));
    CHECK(parse_topic("msh/US/2/e/" + std::string(64, 'x') + "/!0a", ti));
}
