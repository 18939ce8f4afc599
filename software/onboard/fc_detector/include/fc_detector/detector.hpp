#ifndef FC_DETECTOR__DETECTOR_HPP_
#define FC_DETECTOR__DETECTOR_HPP_

#include <memory>
#include <string>
#include <vector>

#include "fc_detector/flight_controller.hpp"
#include "fc_detector/platform.hpp"

namespace fc_detector
{

enum class DetectionState
{
  kDetected,
  kAbsent,
  kUnreachable,
};

std::string ToString(DetectionState state);

struct BoardOutcome
{
  std::string name;
  Platform platform;
  DetectionState state;
  std::string error;
  // Points into the Detector's candidates; null unless state is kDetected.
  const FlightController * board{nullptr};
};

struct DetectionReport
{
  std::vector<BoardOutcome> outcomes;

  /// First detected board in candidate order, or null.
  /// Owned by the Detector that produced the report; do not use it after that
  /// Detector is destroyed.
  const FlightController * selected() const;
  bool any_unreachable() const;
};

/// One detection pass over an explicit candidate list.
/// Transport faults are recorded per board rather than aborting the pass.
class Detector
{
public:
  explicit Detector(std::vector<std::unique_ptr<FlightController>> candidates);

  DetectionReport Run();

  const std::vector<std::unique_ptr<FlightController>> & candidates() const
  {
    return candidates_;
  }

private:
  std::vector<std::unique_ptr<FlightController>> candidates_;
};

}  // namespace fc_detector

#endif  // FC_DETECTOR__DETECTOR_HPP_
