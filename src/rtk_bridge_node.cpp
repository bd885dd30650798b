#include "gnss_rtk_bridge/rtk_bridge.hpp"

//------------------------- Main -------------------------
int main(int argc, char** argv) {
    rclcpp::init(argc, argv);
    auto node = std::make_shared<gnss_rtk_bridge::RtkBridge>();
    rclcpp::spin(node);
    rclcpp::shutdown();
    return 0;
}
