#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "fc_detector/boards.hpp"
#include "fc_detector/detector.hpp"
#include "fc_detector/linux_i2c_bus.hpp"
#include "rclcpp/rclcpp.hpp"
#include "std_msgs/msg/string.hpp"

namespace
{

constexpr auto kDefaultStatusTopic = "/obc/fc/board";
constexpr auto kNoBoard = "none";

class FlightControllerDetectorNode : public rclcpp::Node
{
public:
  explicit FlightControllerDetectorNode(const rclcpp::NodeOptions & options)
  : rclcpp::Node("flight_controller_detector", options)
  {
    const auto device_prefix =
      declare_parameter<std::string>("i2c_device_prefix", fc_detector::kDefaultI2cDevicePrefix);
    const auto probe_timeout_ms = declare_parameter<int>(
      "probe_timeout_ms", static_cast<int>(fc_detector::kDefaultProbeTimeout.count()));
    const auto status_topic = declare_parameter<std::string>("status_topic", kDefaultStatusTopic);
    if (probe_timeout_ms <= 0) {
      throw std::invalid_argument(
              "probe_timeout_ms must be positive, got " + std::to_string(probe_timeout_ms));
    }

    bus_ = std::make_unique<fc_detector::LinuxI2cBus>(
      device_prefix, std::chrono::milliseconds(probe_timeout_ms));
    detector_ = std::make_unique<fc_detector::Detector>(fc_detector::MakeFlightControllers(*bus_));

    status_pub_ = create_publisher<std_msgs::msg::String>(
      status_topic, rclcpp::QoS(rclcpp::KeepLast(1)).reliable().transient_local());

    Detect();
  }

private:
  void Detect()
  {
    const auto report = detector_->Run();
    const auto * board = report.selected();

    std_msgs::msg::String msg;
    if (board == nullptr) {
      if (report.any_unreachable()) {
        RCLCPP_ERROR(get_logger(), "No flight controller detected; some buses were not accessible");
      } else {
        RCLCPP_WARN(get_logger(), "No flight controller detected");
      }
      msg.data = kNoBoard;
    } else {
      RCLCPP_INFO(
        get_logger(), "Detected %s by %s", board->name().c_str(), board->manufacturer().c_str());
      for (const auto & serial : board->GetSerials()) {
        RCLCPP_INFO(
          get_logger(), "  serial %s -> %s", serial.port.c_str(), serial.endpoint.c_str());
      }
      msg.data = board->name();
    }
    status_pub_->publish(msg);
  }

  std::unique_ptr<fc_detector::LinuxI2cBus> bus_;
  std::unique_ptr<fc_detector::Detector> detector_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr status_pub_;
};

}  // namespace

int main(int argc, char ** argv)
{
  rclcpp::InitOptions init_options;
  rclcpp::init(argc, argv, init_options);

  // Intra-process comms cannot carry the latched status publisher.
  auto node = std::make_shared<FlightControllerDetectorNode>(rclcpp::NodeOptions());
  rclcpp::spin(node);
  rclcpp::shutdown();
  return 0;
}
