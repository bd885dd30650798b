#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace gnss_rtk_bridge {

namespace wgs84 {
constexpr double kSemiMajorAxis = 6378137.0;
constexpr double kFlattening = 1.0 / 298.257223563;
constexpr double kEccentricitySquared = kFlattening * (2.0 - kFlattening);
constexpr double kSemiMinorAxis = kSemiMajorAxis * (1.0 - kFlattening);
// IUGG mean radius, used for great circle computations
constexpr double kMeanRadius = (2.0 * kSemiMajorAxis + kSemiMinorAxis) / 3.0;
} // namespace wgs84

/// Latitude/longitude in degrees, altitude in meters above the WGS84 ellipsoid.
/// Latitude must be within [-90, 90]; longitude is normalized to (-180, 180].
class GeodeticCoordinate {
public:
    GeodeticCoordinate() = default;
    GeodeticCoordinate(double lat_deg, double lon_deg, double alt_m = 0.0);

    double latitude() const { return lat_; }
    double longitude() const { return lon_; }
    double altitude() const { return alt_; }

    bool operator==(const GeodeticCoordinate &other) const {
        return lat_ == other.lat_ && lon_ == other.lon_ && alt_ == other.alt_;
    }
    bool operator!=(const GeodeticCoordinate &other) const { return !(*this == other); }

    std::string format() const;

private:
    double lat_ = 0.0;
    double lon_ = 0.0;
    double alt_ = 0.0;
};

/// Earth-centered, earth-fixed position in meters.
struct EcefCoordinate {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    bool operator==(const EcefCoordinate &other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const EcefCoordinate &other) const { return !(*this == other); }
};

/// Local tangent plane offset in meters.
struct EnuVector {
    double east = 0.0;
    double north = 0.0;
    double up = 0.0;
};

struct DistanceAndBearing {
    double distance_m = 0.0;
    double bearing_deg = 0.0;  // initial bearing, [0, 360)
};

double normalizeLongitude(double lon_deg);

EcefCoordinate geodeticToEcef(double lat_deg, double lon_deg, double alt_m);
EcefCoordinate geodeticToEcef(const GeodeticCoordinate &coord);

/// Throws ConvergenceError for degenerate input or when the latitude does not
/// settle within the iteration bound.
GeodeticCoordinate ecefToGeodetic(const EcefCoordinate &coord);

EnuVector geodeticToEnu(const GeodeticCoordinate &origin, const GeodeticCoordinate &point);
GeodeticCoordinate enuToGeodetic(const GeodeticCoordinate &origin, const EnuVector &enu);

DistanceAndBearing greatCircleDistanceAndBearing(const GeodeticCoordinate &a,
                                                 const GeodeticCoordinate &b);

//------------------------- Flat earth frame -------------------------
struct FlatEarthCoordinate {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

/// Flat earth approximation around an origin. The X axis points at
/// `orientation_deg` (clockwise from north); `type` picks the handedness and
/// vertical sense: "neu", "nwu", "ned" or "nwd".
class FlatEarthTransform {
public:
    explicit FlatEarthTransform(const GeodeticCoordinate &origin,
                                double orientation_deg = 0.0,
                                const std::string &type = "nwu");

    FlatEarthCoordinate toFlatEarth(const GeodeticCoordinate &coord) const;
    GeodeticCoordinate toGeodetic(const FlatEarthCoordinate &coord) const;

    const GeodeticCoordinate &origin() const { return origin_; }
    double orientation() const { return orientation_deg_; }
    const std::string &type() const { return type_; }

private:
    GeodeticCoordinate origin_;
    double orientation_deg_;
    std::string type_;

    double r1_ = 0.0;
    double r2_cos_lat_ = 0.0;
    double sin_alpha_ = 0.0;
    double cos_alpha_ = 1.0;
    double ymul_ = 1.0;
    double zmul_ = 1.0;
};

} // namespace gnss_rtk_bridge

namespace std {
template <>
struct hash<gnss_rtk_bridge::GeodeticCoordinate> {
    size_t operator()(const gnss_rtk_bridge::GeodeticCoordinate &c) const noexcept {
        size_t h = hash<double>()(c.latitude());
        h ^= hash<double>()(c.longitude()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= hash<double>()(c.altitude()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};
} // namespace std
