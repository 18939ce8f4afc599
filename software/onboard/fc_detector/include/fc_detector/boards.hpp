#ifndef FC_DETECTOR__BOARDS_HPP_
#define FC_DETECTOR__BOARDS_HPP_

#include <memory>
#include <vector>

#include "fc_detector/flight_controller.hpp"
#include "fc_detector/i2c_bus.hpp"

namespace fc_detector
{

const BoardDefinition & TummlerBoard();

/// Every board this host knows how to detect, in detection priority order.
const std::vector<BoardDefinition> & KnownBoards();

std::vector<std::unique_ptr<FlightController>> MakeFlightControllers(I2cBus & bus);

}  // namespace fc_detector

#endif  // FC_DETECTOR__BOARDS_HPP_
