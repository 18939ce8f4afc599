#include "fc_detector/flight_controller.hpp"

#include <utility>
#include <vector>

namespace fc_detector
{

I2cFlightController::I2cFlightController(BoardDefinition definition, I2cBus & bus)
: definition_(std::move(definition)),
  bus_(bus)
{
}

bool I2cFlightController::Detect()
{
  for (const auto & device : definition_.devices) {
    const auto & where = device.second;
    if (!bus_.Exists(where.bus, where.address)) {
      return false;
    }
  }
  return true;
}

std::vector<Serial> I2cFlightController::GetSerials() const
{
  return definition_.serials;
}

}  // namespace fc_detector
