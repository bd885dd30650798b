#include "gnss_rtk_bridge/coordinate_json.hpp"
#include "gnss_rtk_bridge/errors.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>

namespace gnss_rtk_bridge {

namespace {

constexpr double kMillimetersPerMeter = 1000.0;

const Json::Value &requireMember(const Json::Value &value, const char *name) {
    if (!value.isObject() || !value.isMember(name)) {
        throw ParseError(std::string("missing JSON member '") + name + "'");
    }
    return value[name];
}

double requireDouble(const Json::Value &value, const char *name) {
    const Json::Value &member = requireMember(value, name);
    if (!member.isNumeric()) {
        throw ParseError(std::string("JSON member '") + name + "' is not a number");
    }
    return member.asDouble();
}

Json::Int64 requireMillimeters(const Json::Value &value, const char *name) {
    const Json::Value &member = requireMember(value, name);
    if (!member.isInt64()) {
        throw ParseError(std::string("JSON member '") + name + "' is not an integer");
    }
    return member.asInt64();
}

Json::Int64 toMillimeters(double meters) {
    return static_cast<Json::Int64>(std::llround(meters * kMillimetersPerMeter));
}

} // namespace

Json::Value toJson(const GeodeticCoordinate &coord) {
    Json::Value out(Json::objectValue);
    out["lat"] = coord.latitude();
    out["lon"] = coord.longitude();
    out["alt"] = coord.altitude();
    return out;
}

Json::Value toJson(const EcefCoordinate &coord) {
    Json::Value out(Json::objectValue);
    out["x"] = toMillimeters(coord.x);
    out["y"] = toMillimeters(coord.y);
    out["z"] = toMillimeters(coord.z);
    return out;
}

GeodeticCoordinate geodeticFromJson(const Json::Value &value) {
    const double lat = requireDouble(value, "lat");
    const double lon = requireDouble(value, "lon");
    const double alt = requireDouble(value, "alt");
    try {
        return GeodeticCoordinate(lat, lon, alt);
    } catch (const std::out_of_range &ex) {
        throw ParseError(std::string("invalid geodetic coordinate: ") + ex.what());
    }
}

EcefCoordinate ecefFromJson(const Json::Value &value) {
    EcefCoordinate out;
    out.x = static_cast<double>(requireMillimeters(value, "x")) / kMillimetersPerMeter;
    out.y = static_cast<double>(requireMillimeters(value, "y")) / kMillimetersPerMeter;
    out.z = static_cast<double>(requireMillimeters(value, "z")) / kMillimetersPerMeter;
    return out;
}

std::string toJsonString(const Json::Value &value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["precision"] = 17;
    return Json::writeString(builder, value);
}

Json::Value parseJsonString(const std::string &text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw ParseError("invalid JSON: " + errors);
    }
    return root;
}

} // namespace gnss_rtk_bridge
