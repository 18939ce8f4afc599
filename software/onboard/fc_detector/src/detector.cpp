#include "fc_detector/detector.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "fc_detector/i2c_bus.hpp"
#include "rclcpp/logging.hpp"

namespace fc_detector
{

std::string ToString(DetectionState state)
{
  switch (state) {
    case DetectionState::kDetected:
      return "detected";
    case DetectionState::kAbsent:
      return "absent";
    case DetectionState::kUnreachable:
      return "unreachable";
  }
  return "unknown";
}

const FlightController * DetectionReport::selected() const
{
  for (const auto & outcome : outcomes) {
    if (outcome.state == DetectionState::kDetected) {
      return outcome.board;
    }
  }
  return nullptr;
}

bool DetectionReport::any_unreachable() const
{
  for (const auto & outcome : outcomes) {
    if (outcome.state == DetectionState::kUnreachable) {
      return true;
    }
  }
  return false;
}

Detector::Detector(std::vector<std::unique_ptr<FlightController>> candidates)
: candidates_(std::move(candidates))
{
}

DetectionReport Detector::Run()
{
  const auto logger = rclcpp::get_logger("fc_detector");
  DetectionReport report;
  std::size_t matches = 0;

  for (const auto & candidate : candidates_) {
    BoardOutcome outcome{candidate->name(), candidate->platform(), DetectionState::kAbsent, "",
      nullptr};
    try {
      if (candidate->Detect()) {
        outcome.state = DetectionState::kDetected;
        outcome.board = candidate.get();
        ++matches;
      }
    } catch (const BusAccessError & e) {
      outcome.state = DetectionState::kUnreachable;
      outcome.error = e.what();
      RCLCPP_ERROR(
        logger, "Cannot probe %s (bus %d): %s", outcome.name.c_str(), e.bus(), e.what());
    }

    if (outcome.state != DetectionState::kUnreachable) {
      RCLCPP_INFO(
        logger, "%s (%s): %s", outcome.name.c_str(), ToString(outcome.platform).c_str(),
        ToString(outcome.state).c_str());
    }
    report.outcomes.push_back(std::move(outcome));
  }

  if (matches > 1) {
    RCLCPP_WARN(
      logger, "%zu boards matched, using %s", matches, report.selected()->name().c_str());
  }
  return report;
}

}  // namespace fc_detector
