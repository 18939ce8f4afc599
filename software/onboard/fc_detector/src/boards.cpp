#include "fc_detector/boards.hpp"

#include <memory>
#include <vector>

namespace fc_detector
{

const BoardDefinition & TummlerBoard()
{
  static const BoardDefinition board{
    "Tummler",
    "Tummler ROV",
    Platform::kTummler,
    {
      {"STM32", BusAddress{0x66, 1}},
    },
    {
      Serial{"C", "/dev/ttyAMA0"},
      Serial{"B", "/dev/ttyAMA2"},
    },
  };
  return board;
}

const std::vector<BoardDefinition> & KnownBoards()
{
  static const std::vector<BoardDefinition> boards{
    TummlerBoard(),
  };
  return boards;
}

std::vector<std::unique_ptr<FlightController>> MakeFlightControllers(I2cBus & bus)
{
  std::vector<std::unique_ptr<FlightController>> controllers;
  for (const auto & definition : KnownBoards()) {
    controllers.push_back(std::make_unique<I2cFlightController>(definition, bus));
  }
  return controllers;
}

}  // namespace fc_detector
