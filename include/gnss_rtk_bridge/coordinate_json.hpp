#pragma once

#include "gnss_rtk_bridge/geodesy.hpp"

#include <json/json.h>

#include <string>

namespace gnss_rtk_bridge {

// Geodetic coordinates travel as plain degrees/meters:
//   {"lat": 47.5, "lon": 19.05, "alt": 120.25}
// ECEF coordinates travel as integer millimeters:
//   {"x": 4081882123, "y": 1410011456, "z": 4678622789}
// Decoding throws ParseError on missing or mistyped members.

Json::Value toJson(const GeodeticCoordinate &coord);
Json::Value toJson(const EcefCoordinate &coord);

GeodeticCoordinate geodeticFromJson(const Json::Value &value);
EcefCoordinate ecefFromJson(const Json::Value &value);

std::string toJsonString(const Json::Value &value);
Json::Value parseJsonString(const std::string &text);

} // namespace gnss_rtk_bridge
