#pragma once

#include <rclcpp/rclcpp.hpp>
#include <nmea_msgs/msg/sentence.hpp>
#include <sensor_msgs/msg/nav_sat_fix.hpp>
#include <geometry_msgs/msg/twist_stamped.hpp>
#include <std_msgs/msg/u_int8_multi_array.hpp>

#include <memory>
#include <optional>
#include <string>

#include "gnss_rtk_bridge/fix_record.hpp"
#include "gnss_rtk_bridge/ntrip_client.hpp"
#include "gnss_rtk_bridge/rtcm_messages.hpp"

namespace gnss_rtk_bridge {

//------------------------- Message conversions -------------------------
// Unset position leaves latitude/longitude/altitude NaN.
sensor_msgs::msg::NavSatFix toNavSatFix(const FixRecord &fix);
sensor_msgs::msg::NavSatFix toNavSatFix(const RtcmStationPosition &station);

// linear.x north, linear.y east. Empty if speed or course is unset.
std::optional<geometry_msgs::msg::TwistStamped> toTwist(const FixRecord &fix);

std_msgs::msg::UInt8MultiArray toRtcmMsg(const RtcmMessage &message);

// Reads the node parameters into an NTRIP configuration. caster_uri, when
// set, provides host, port, mountpoint, credentials and protocol.
NtripConfig ntripConfigFromParameters(rclcpp::Node &node);

class RtkBridge : public rclcpp::Node {
public:
    explicit RtkBridge(const rclcpp::NodeOptions &options = rclcpp::NodeOptions());
    ~RtkBridge();

private:
    void onSentence(const nmea_msgs::msg::Sentence::SharedPtr msg);
    void publishFix(const FixRecord &fix, const builtin_interfaces::msg::Time &stamp);
    void onRtcm(RtcmMessage message);
    void onState(NtripState state);
    void onFrameError(RtcmFrameError error, const std::string &message);

    // Params
    std::string frame_id_;
    bool publish_fix_;
    bool publish_twist_;

    // NMEA
    FixAccumulator accumulator_;

    // NTRIP
    std::unique_ptr<NtripClient> client_;

    rclcpp::Subscription<nmea_msgs::msg::Sentence>::SharedPtr nmea_sub_;
    rclcpp::Publisher<sensor_msgs::msg::NavSatFix>::SharedPtr fix_pub_;
    rclcpp::Publisher<geometry_msgs::msg::TwistStamped>::SharedPtr twist_pub_;
    rclcpp::Publisher<std_msgs::msg::UInt8MultiArray>::SharedPtr rtcm_pub_;
    rclcpp::Publisher<sensor_msgs::msg::NavSatFix>::SharedPtr base_fix_pub_;
};

} // namespace gnss_rtk_bridge
