#include "gnss_rtk_bridge/coordinate_json.hpp"
#include "gnss_rtk_bridge/errors.hpp"

#include <gtest/gtest.h>

using namespace gnss_rtk_bridge;

TEST(CoordinateJson, GeodeticRoundTrip) {
    const GeodeticCoordinate coord(47.5, 19.05, 120.25);
    const Json::Value json = toJson(coord);
    EXPECT_DOUBLE_EQ(json["lat"].asDouble(), 47.5);
    EXPECT_DOUBLE_EQ(json["lon"].asDouble(), 19.05);
    EXPECT_DOUBLE_EQ(json["alt"].asDouble(), 120.25);

    EXPECT_EQ(geodeticFromJson(parseJsonString(toJsonString(json))), coord);
}

TEST(CoordinateJson, EcefUsesIntegerMillimeters) {
    const EcefCoordinate ecef{4081882.1234, -1410011.4567, 4678622.7891};
    const Json::Value json = toJson(ecef);
    ASSERT_TRUE(json["x"].isInt64());
    EXPECT_EQ(json["x"].asInt64(), 4081882123);
    EXPECT_EQ(json["y"].asInt64(), -1410011457);
    EXPECT_EQ(json["z"].asInt64(), 4678622789);

    const EcefCoordinate back = ecefFromJson(parseJsonString(toJsonString(json)));
    EXPECT_NEAR(back.x, ecef.x, 0.0005);
    EXPECT_NEAR(back.y, ecef.y, 0.0005);
    EXPECT_NEAR(back.z, ecef.z, 0.0005);
}

TEST(CoordinateJson, MissingMemberIsParseError) {
    EXPECT_THROW(geodeticFromJson(parseJsonString(R"({"lat": 1.0, "lon": 2.0})")), ParseError);
    EXPECT_THROW(ecefFromJson(parseJsonString(R"({"x": 1, "y": 2})")), ParseError);
    EXPECT_THROW(geodeticFromJson(parseJsonString("[1, 2, 3]")), ParseError);
}

TEST(CoordinateJson, MistypedMemberIsParseError) {
    EXPECT_THROW(geodeticFromJson(parseJsonString(R"({"lat": "north", "lon": 2.0, "alt": 0})")), ParseError);
    EXPECT_THROW(ecefFromJson(parseJsonString(R"({"x": 1.5, "y": 2, "z": 3})")), ParseError);
}

TEST(CoordinateJson, OutOfRangeLatitudeIsParseError) {
    EXPECT_THROW(geodeticFromJson(parseJsonString(R"({"lat": 91, "lon": 0, "alt": 0})")), ParseError);
}

TEST(CoordinateJson, MalformedTextIsParseError) {
    EXPECT_THROW(parseJsonString("{\"lat\": "), ParseError);
}
