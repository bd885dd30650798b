#include "gnss_rtk_bridge/rtk_bridge.hpp"
#include "gnss_rtk_bridge/errors.hpp"
#include "gnss_rtk_bridge/geodesy.hpp"
#include "gnss_rtk_bridge/nmea_parser.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <variant>

namespace gnss_rtk_bridge {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
// Rough user equivalent range error used to turn DOP into a covariance.
constexpr double kUereMeters = 1.0;

int8_t navSatStatus(FixQuality quality) {
    using Status = sensor_msgs::msg::NavSatStatus;
    switch (quality) {
        case FixQuality::NoFix: return Status::STATUS_NO_FIX;
        case FixQuality::Gps: return Status::STATUS_FIX;
        case FixQuality::Dgps: return Status::STATUS_SBAS_FIX;
        case FixQuality::RtkFixed:
        case FixQuality::RtkFloat: return Status::STATUS_GBAS_FIX;
        case FixQuality::DeadReckoning: return Status::STATUS_FIX;
    }
    return Status::STATUS_NO_FIX;
}

} // namespace

//------------------------- Conversions -------------------------
sensor_msgs::msg::NavSatFix toNavSatFix(const FixRecord &fix) {
    sensor_msgs::msg::NavSatFix out;
    out.latitude = fix.position ? fix.position->latitude() : kNaN;
    out.longitude = fix.position ? fix.position->longitude() : kNaN;
    out.altitude = fix.position && fix.position_has_altitude ? fix.position->altitude() : kNaN;
    out.status.status = navSatStatus(fix.fixQuality());
    out.status.service = sensor_msgs::msg::NavSatStatus::SERVICE_GPS;

    if (fix.hdop) {
        const double h = *fix.hdop * kUereMeters;
        const double v = fix.vdop.value_or(*fix.hdop * 2.0) * kUereMeters;
        out.position_covariance = {h * h, 0.0, 0.0, 0.0, h * h, 0.0, 0.0, 0.0, v * v};
        out.position_covariance_type = sensor_msgs::msg::NavSatFix::COVARIANCE_TYPE_APPROXIMATED;
    } else {
        out.position_covariance_type = sensor_msgs::msg::NavSatFix::COVARIANCE_TYPE_UNKNOWN;
    }
    return out;
}

sensor_msgs::msg::NavSatFix toNavSatFix(const RtcmStationPosition &station) {
    const GeodeticCoordinate geo = ecefToGeodetic(station.position);
    sensor_msgs::msg::NavSatFix out;
    out.latitude = geo.latitude();
    out.longitude = geo.longitude();
    out.altitude = geo.altitude();
    out.status.status = sensor_msgs::msg::NavSatStatus::STATUS_FIX;
    out.status.service = 0;
    if (station.gps) out.status.service |= sensor_msgs::msg::NavSatStatus::SERVICE_GPS;
    if (station.glonass) out.status.service |= sensor_msgs::msg::NavSatStatus::SERVICE_GLONASS;
    if (station.galileo) out.status.service |= sensor_msgs::msg::NavSatStatus::SERVICE_GALILEO;
    out.position_covariance_type = sensor_msgs::msg::NavSatFix::COVARIANCE_TYPE_UNKNOWN;
    return out;
}

std::optional<geometry_msgs::msg::TwistStamped> toTwist(const FixRecord &fix) {
    if (!fix.speed_mps || !fix.course_deg) return std::nullopt;
    const double cog_rad = *fix.course_deg * M_PI / 180.0;

    geometry_msgs::msg::TwistStamped twist;
    twist.twist.linear.x = *fix.speed_mps * std::cos(cog_rad);
    twist.twist.linear.y = *fix.speed_mps * std::sin(cog_rad);
    twist.twist.linear.z = 0.0;
    return twist;
}

std_msgs::msg::UInt8MultiArray toRtcmMsg(const RtcmMessage &message) {
    std_msgs::msg::UInt8MultiArray out;
    out.data.assign(message.frame.begin(), message.frame.end());
    return out;
}

//------------------------- Parameters -------------------------
NtripConfig ntripConfigFromParameters(rclcpp::Node &node) {
    NtripConfig defaults;
    const std::string uri = node.declare_parameter<std::string>("caster_uri", "");
    const std::string host = node.declare_parameter<std::string>("host", "");
    const int port = node.declare_parameter<int>("port", defaults.port);
    const std::string mountpoint = node.declare_parameter<std::string>("mountpoint", "");
    const std::string username = node.declare_parameter<std::string>("username", "");
    const std::string password = node.declare_parameter<std::string>("password", "");
    const std::string protocol = node.declare_parameter<std::string>("protocol_version", "http");

    NtripConfig config;
    if (!uri.empty()) {
        config = NtripConfig::fromUri(uri);
        // Explicit credentials win over the URI
        if (!username.empty()) config.username = username;
        if (!password.empty()) config.password = password;
        if (!mountpoint.empty()) config.mountpoint = mountpoint;
    } else {
        if (port <= 0 || port > 65535) throw std::invalid_argument("port out of range: " + std::to_string(port));
        config.host = host;
        config.port = static_cast<uint16_t>(port);
        config.mountpoint = mountpoint;
        config.username = username;
        config.password = password;
        config.protocol = protocolFromString(protocol);
    }

    config.user_agent = node.declare_parameter<std::string>("user_agent", defaults.user_agent);
    config.connect_timeout_seconds =
        node.declare_parameter<double>("connect_timeout_seconds", defaults.connect_timeout_seconds);
    config.idle_timeout_seconds = node.declare_parameter<double>("idle_timeout_seconds", defaults.idle_timeout_seconds);
    config.backoff_base_seconds = node.declare_parameter<double>("backoff_base_seconds", defaults.backoff_base_seconds);
    config.backoff_cap_seconds = node.declare_parameter<double>("backoff_cap_seconds", defaults.backoff_cap_seconds);
    config.max_reconnect_attempts =
        node.declare_parameter<int>("max_reconnect_attempts", defaults.max_reconnect_attempts);
    config.gga_interval_seconds = node.declare_parameter<double>("gga_interval_seconds", defaults.gga_interval_seconds);

    config.validate();
    return config;
}

//------------------------- Constructor -------------------------
RtkBridge::RtkBridge(const rclcpp::NodeOptions &options)
: Node("gnss_rtk_bridge", options)
{
    frame_id_ = this->declare_parameter<std::string>("frame_id", "gps");
    publish_fix_ = this->declare_parameter<bool>("publish_fix", true);
    publish_twist_ = this->declare_parameter<bool>("publish_twist", true);

    NtripConfig config;
    try {
        config = ntripConfigFromParameters(*this);
    } catch (const std::invalid_argument &ex) {
        RCLCPP_FATAL(get_logger(), "Invalid NTRIP parameters: %s", ex.what());
        throw;
    }

    if (publish_fix_) fix_pub_ = this->create_publisher<sensor_msgs::msg::NavSatFix>("fix", 10);
    if (publish_twist_) twist_pub_ = this->create_publisher<geometry_msgs::msg::TwistStamped>("ground_speed", 10);
    rtcm_pub_ = this->create_publisher<std_msgs::msg::UInt8MultiArray>("rtcm", 100);
    base_fix_pub_ = this->create_publisher<sensor_msgs::msg::NavSatFix>("base_station_fix", 10);

    nmea_sub_ = this->create_subscription<nmea_msgs::msg::Sentence>(
        "nmea_sentence", 100, std::bind(&RtkBridge::onSentence, this, std::placeholders::_1));

    RCLCPP_INFO(get_logger(), "Caster %s:%u/%s (%s)", config.host.c_str(), config.port,
                config.mountpoint.c_str(), toString(config.protocol));

    client_ = std::make_unique<NtripClient>(config);
    client_->setMessageHandler([this](RtcmMessage message) { onRtcm(std::move(message)); });
    client_->setStateHandler([this](NtripState state) { onState(state); });
    client_->setFrameErrorHandler(
        [this](RtcmFrameError error, const std::string &message) { onFrameError(error, message); });
    client_->start();
}

//------------------------- Destructor -------------------------
RtkBridge::~RtkBridge() {
    if (client_) client_->stop();
}

//------------------------- NMEA -------------------------
void RtkBridge::onSentence(const nmea_msgs::msg::Sentence::SharedPtr msg) {
    const NmeaLineResult result = NmeaParser::decodeLine(msg->sentence);
    if (!result.ok()) {
        RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 5000, "Dropped NMEA sentence: %s",
                             result.message.c_str());
        return;
    }

    const std::optional<FixRecord> completed = accumulator_.add(*result.sentence);
    if (completed) publishFix(*completed, msg->header.stamp);
}

void RtkBridge::publishFix(const FixRecord &fix, const builtin_interfaces::msg::Time &stamp) {
    if (!fix.conflicting_positions.empty()) {
        RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 5000,
                             "%zu conflicting positions in %s fix cycle (kept %s)",
                             fix.conflicting_positions.size(), fix.talker.c_str(),
                             fix.position_source.c_str());
    }

    if (fix_pub_ && fix.position) {
        sensor_msgs::msg::NavSatFix out = toNavSatFix(fix);
        out.header.stamp = stamp;
        out.header.frame_id = frame_id_;
        fix_pub_->publish(out);
    }

    if (twist_pub_) {
        std::optional<geometry_msgs::msg::TwistStamped> twist = toTwist(fix);
        if (twist) {
            twist->header.stamp = stamp;
            twist->header.frame_id = frame_id_;
            twist_pub_->publish(*twist);
        }
    }

    if (fix.position && fix.fixQuality() != FixQuality::NoFix) {
        client_->setRoverPosition(*fix.position);
    }
}

//------------------------- NTRIP callbacks (client thread) -------------------------
void RtkBridge::onRtcm(RtcmMessage message) {
    std_msgs::msg::UInt8MultiArray raw = toRtcmMsg(message);
    rtcm_pub_->publish(raw);

    if (const auto *station = std::get_if<RtcmStationPosition>(&message.body)) {
        try {
            sensor_msgs::msg::NavSatFix fix = toNavSatFix(*station);
            fix.header.stamp = this->now();
            fix.header.frame_id = frame_id_;
            base_fix_pub_->publish(fix);
        } catch (const ConvergenceError &ex) {
            RCLCPP_WARN(get_logger(), "Base station %u position unusable: %s", station->station_id, ex.what());
        }
    }
}

void RtkBridge::onState(NtripState state) {
    RCLCPP_INFO(get_logger(), "NTRIP %s", toString(state));
}

void RtkBridge::onFrameError(RtcmFrameError error, const std::string &message) {
    RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 5000, "RTCM %s error: %s", toString(error),
                         message.c_str());
}

} // namespace gnss_rtk_bridge
