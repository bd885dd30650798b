#include "gnss_rtk_bridge/geodesy.hpp"
#include "gnss_rtk_bridge/errors.hpp"

#include <Eigen/Core>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace gnss_rtk_bridge {

namespace {

constexpr double kDegToRad = M_PI / 180.0;
constexpr double kRadToDeg = 180.0 / M_PI;

constexpr double kLatitudeTolerance = 1e-11;  // radians
constexpr int kMaxIterations = 10;
constexpr double kMinimumRadius = 1.0;  // meters from the earth's center

double primeVerticalRadius(double sin_lat) {
    return wgs84::kSemiMajorAxis / std::sqrt(1.0 - wgs84::kEccentricitySquared * sin_lat * sin_lat);
}

// Rows are the east, north and up unit vectors expressed in ECEF.
Eigen::Matrix3d enuRotation(double lat_rad, double lon_rad) {
    const double sl = std::sin(lat_rad), cl = std::cos(lat_rad);
    const double so = std::sin(lon_rad), co = std::cos(lon_rad);
    Eigen::Matrix3d r;
    r << -so,       co,      0.0,
         -sl * co, -sl * so, cl,
          cl * co,  cl * so, sl;
    return r;
}

Eigen::Vector3d toVector(const EcefCoordinate &c) { return Eigen::Vector3d(c.x, c.y, c.z); }

} // namespace

//------------------------- GeodeticCoordinate -------------------------
GeodeticCoordinate::GeodeticCoordinate(double lat_deg, double lon_deg, double alt_m)
: lat_(lat_deg), lon_(normalizeLongitude(lon_deg)), alt_(alt_m)
{
    if (!std::isfinite(lat_deg) || lat_deg < -90.0 || lat_deg > 90.0) {
        throw std::out_of_range("latitude out of range: " + std::to_string(lat_deg));
    }
    if (!std::isfinite(alt_m)) {
        throw std::out_of_range("altitude is not finite");
    }
}

std::string GeodeticCoordinate::format() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(7) << lat_ << ", " << lon_ << ", "
       << std::setprecision(3) << alt_ << "m";
    return ss.str();
}

double normalizeLongitude(double lon_deg) {
    if (!std::isfinite(lon_deg)) {
        throw std::out_of_range("longitude is not finite");
    }
    double lon = std::fmod(lon_deg, 360.0);
    if (lon > 180.0) lon -= 360.0;
    else if (lon <= -180.0) lon += 360.0;
    return lon;
}

//------------------------- Geodetic <-> ECEF -------------------------
EcefCoordinate geodeticToEcef(double lat_deg, double lon_deg, double alt_m) {
    const double lat = lat_deg * kDegToRad;
    const double lon = lon_deg * kDegToRad;
    const double sin_lat = std::sin(lat);
    const double cos_lat = std::cos(lat);
    const double n = primeVerticalRadius(sin_lat);

    EcefCoordinate out;
    out.x = (n + alt_m) * cos_lat * std::cos(lon);
    out.y = (n + alt_m) * cos_lat * std::sin(lon);
    out.z = (n * (1.0 - wgs84::kEccentricitySquared) + alt_m) * sin_lat;
    return out;
}

EcefCoordinate geodeticToEcef(const GeodeticCoordinate &coord) {
    return geodeticToEcef(coord.latitude(), coord.longitude(), coord.altitude());
}

GeodeticCoordinate ecefToGeodetic(const EcefCoordinate &coord) {
    const double x = coord.x, y = coord.y, z = coord.z;
    if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(z)) {
        throw ConvergenceError("ECEF coordinate is not finite");
    }

    const double p = std::hypot(x, y);
    if (std::hypot(p, z) < kMinimumRadius) {
        throw ConvergenceError("ECEF coordinate too close to the earth's center");
    }

    const double e2 = wgs84::kEccentricitySquared;
    const double lon = std::atan2(y, x);

    // Successive approximation: tan(lat) = (z + e^2 N sin(lat)) / p
    double lat = std::atan2(z, p * (1.0 - e2));
    bool converged = false;
    for (int i = 0; i < kMaxIterations; ++i) {
        const double sin_lat = std::sin(lat);
        const double n = primeVerticalRadius(sin_lat);
        const double next = std::atan2(z + e2 * n * sin_lat, p);
        const double delta = std::fabs(next - lat);
        lat = next;
        if (delta < kLatitudeTolerance) {
            converged = true;
            break;
        }
    }
    if (!converged) {
        throw ConvergenceError("latitude did not converge within " +
                               std::to_string(kMaxIterations) + " iterations");
    }

    // This form of the height stays well conditioned near the poles.
    const double sin_lat = std::sin(lat);
    const double cos_lat = std::cos(lat);
    const double n = primeVerticalRadius(sin_lat);
    const double alt = p * cos_lat + z * sin_lat - wgs84::kSemiMajorAxis * wgs84::kSemiMajorAxis / n;

    const double lat_deg = std::max(-90.0, std::min(90.0, lat * kRadToDeg));
    return GeodeticCoordinate(lat_deg, lon * kRadToDeg, alt);
}

//------------------------- Local tangent plane -------------------------
EnuVector geodeticToEnu(const GeodeticCoordinate &origin, const GeodeticCoordinate &point) {
    const Eigen::Vector3d delta = toVector(geodeticToEcef(point)) - toVector(geodeticToEcef(origin));
    const Eigen::Vector3d enu =
        enuRotation(origin.latitude() * kDegToRad, origin.longitude() * kDegToRad) * delta;
    return EnuVector{enu.x(), enu.y(), enu.z()};
}

GeodeticCoordinate enuToGeodetic(const GeodeticCoordinate &origin, const EnuVector &enu) {
    const Eigen::Matrix3d r =
        enuRotation(origin.latitude() * kDegToRad, origin.longitude() * kDegToRad);
    const Eigen::Vector3d ecef =
        toVector(geodeticToEcef(origin)) + r.transpose() * Eigen::Vector3d(enu.east, enu.north, enu.up);
    return ecefToGeodetic(EcefCoordinate{ecef.x(), ecef.y(), ecef.z()});
}

//------------------------- Great circle -------------------------
DistanceAndBearing greatCircleDistanceAndBearing(const GeodeticCoordinate &a,
                                                 const GeodeticCoordinate &b) {
    const double lat1 = a.latitude() * kDegToRad;
    const double lat2 = b.latitude() * kDegToRad;
    const double dlat = lat2 - lat1;
    const double dlon = (b.longitude() - a.longitude()) * kDegToRad;

    const double s_lat = std::sin(dlat * 0.5);
    const double s_lon = std::sin(dlon * 0.5);
    double h = s_lat * s_lat + std::cos(lat1) * std::cos(lat2) * s_lon * s_lon;
    h = std::min(1.0, std::max(0.0, h));

    DistanceAndBearing out;
    out.distance_m = 2.0 * wgs84::kMeanRadius * std::asin(std::sqrt(h));

    const double yb = std::sin(dlon) * std::cos(lat2);
    const double xb = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
    double bearing = std::atan2(yb, xb) * kRadToDeg;
    bearing = std::fmod(bearing + 360.0, 360.0);
    if (bearing >= 360.0) bearing = 0.0;
    out.bearing_deg = bearing;
    return out;
}

//------------------------- FlatEarthTransform -------------------------
FlatEarthTransform::FlatEarthTransform(const GeodeticCoordinate &origin,
                                       double orientation_deg,
                                       const std::string &type)
: origin_(origin), orientation_deg_(orientation_deg)
{
    std::string normalized;
    for (char c : type) normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (normalized != "neu" && normalized != "nwu" && normalized != "ned" && normalized != "nwd") {
        throw std::invalid_argument("unknown coordinate system type: " + type);
    }
    type_ = normalized;

    const double lat = origin_.latitude() * kDegToRad;
    const double x = 1.0 - wgs84::kEccentricitySquared * std::sin(lat) * std::sin(lat);
    r1_ = wgs84::kSemiMajorAxis * (1.0 - wgs84::kEccentricitySquared) / std::pow(x, 1.5);
    r2_cos_lat_ = wgs84::kSemiMajorAxis / std::sqrt(x) * std::cos(lat);

    sin_alpha_ = std::sin(orientation_deg_ * kDegToRad);
    cos_alpha_ = std::cos(orientation_deg_ * kDegToRad);
    ymul_ = type_[1] == 'e' ? 1.0 : -1.0;
    zmul_ = type_[2] == 'u' ? 1.0 : -1.0;
}

FlatEarthCoordinate FlatEarthTransform::toFlatEarth(const GeodeticCoordinate &coord) const {
    const double dlon = normalizeLongitude(coord.longitude() - origin_.longitude());
    const double north = (coord.latitude() - origin_.latitude()) * kDegToRad * r1_;
    const double east = dlon * kDegToRad * r2_cos_lat_;

    FlatEarthCoordinate out;
    out.x = north * cos_alpha_ + east * sin_alpha_;
    out.y = (-north * sin_alpha_ + east * cos_alpha_) * ymul_;
    out.z = coord.altitude() * zmul_;
    return out;
}

GeodeticCoordinate FlatEarthTransform::toGeodetic(const FlatEarthCoordinate &coord) const {
    const double x = coord.x;
    const double y = coord.y * ymul_;
    const double north = x * cos_alpha_ - y * sin_alpha_;
    const double east = x * sin_alpha_ + y * cos_alpha_;

    return GeodeticCoordinate(origin_.latitude() + north / r1_ * kRadToDeg,
                              origin_.longitude() + east / r2_cos_lat_ * kRadToDeg,
                              coord.z * zmul_);
}

} // namespace gnss_rtk_bridge
