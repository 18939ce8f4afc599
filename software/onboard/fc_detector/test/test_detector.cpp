#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "fake_i2c_bus.hpp"
#include "fc_detector/boards.hpp"
#include "fc_detector/detector.hpp"
#include "fc_detector/flight_controller.hpp"

using fc_detector::BoardDefinition;
using fc_detector::BusAddress;
using fc_detector::DetectionState;
using fc_detector::Detector;
using fc_detector::FlightController;
using fc_detector::I2cFlightController;
using fc_detector::Platform;
using fc_detector::Serial;

namespace
{

BoardDefinition BoardAt(const char * name, int bus, uint8_t address)
{
  return BoardDefinition{
    name, "Test", Platform::kGenericSerial, {{"MCU", BusAddress{address, bus}}},
    {Serial{"A", "/dev/ttyUSB0"}}};
}

std::vector<std::unique_ptr<FlightController>> Candidates(
  FakeI2cBus & bus, std::vector<BoardDefinition> definitions)
{
  std::vector<std::unique_ptr<FlightController>> candidates;
  for (auto & definition : definitions) {
    candidates.push_back(std::make_unique<I2cFlightController>(std::move(definition), bus));
  }
  return candidates;
}

}  // namespace

TEST(Detector, SelectsTummlerWhenPresent)
{
  FakeI2cBus bus;
  bus.SetPresent(1, 0x66);
  Detector detector(fc_detector::MakeFlightControllers(bus));

  const auto report = detector.Run();
  ASSERT_NE(report.selected(), nullptr);
  EXPECT_EQ(report.selected()->platform(), Platform::kTummler);
  EXPECT_FALSE(report.any_unreachable());
}

TEST(Detector, NothingSelectedWhenAllAbsent)
{
  FakeI2cBus bus;
  Detector detector(fc_detector::MakeFlightControllers(bus));

  const auto report = detector.Run();
  EXPECT_EQ(report.selected(), nullptr);
  for (const auto & outcome : report.outcomes) {
    EXPECT_EQ(outcome.state, DetectionState::kAbsent);
    EXPECT_TRUE(outcome.error.empty());
  }
}

TEST(Detector, UnreachableIsReportedSeparatelyFromAbsent)
{
  FakeI2cBus bus;
  bus.faulty_buses.insert(3);
  Detector detector(Candidates(bus, {BoardAt("Faulty", 3, 0x20), BoardAt("Missing", 1, 0x21)}));

  const auto report = detector.Run();
  ASSERT_EQ(report.outcomes.size(), 2u);
  EXPECT_EQ(report.outcomes[0].state, DetectionState::kUnreachable);
  EXPECT_EQ(report.outcomes[0].error, "simulated transport fault");
  EXPECT_EQ(report.outcomes[0].board, nullptr);
  EXPECT_EQ(report.outcomes[1].state, DetectionState::kAbsent);
  EXPECT_TRUE(report.any_unreachable());
  EXPECT_EQ(report.selected(), nullptr);
}

TEST(Detector, FaultOnOneBoardDoesNotHideAnother)
{
  FakeI2cBus bus;
  bus.faulty_buses.insert(3);
  bus.SetPresent(1, 0x21);
  Detector detector(Candidates(bus, {BoardAt("Faulty", 3, 0x20), BoardAt("Good", 1, 0x21)}));

  const auto report = detector.Run();
  ASSERT_NE(report.selected(), nullptr);
  EXPECT_EQ(report.selected()->name(), "Good");
}

TEST(Detector, FirstMatchInOrderWins)
{
  FakeI2cBus bus;
  bus.SetPresent(1, 0x20);
  bus.SetPresent(1, 0x21);
  Detector detector(Candidates(bus, {BoardAt("First", 1, 0x20), BoardAt("Second", 1, 0x21)}));

  const auto report = detector.Run();
  ASSERT_EQ(report.outcomes.size(), 2u);
  EXPECT_EQ(report.outcomes[0].state, DetectionState::kDetected);
  EXPECT_EQ(report.outcomes[1].state, DetectionState::kDetected);
  ASSERT_NE(report.selected(), nullptr);
  EXPECT_EQ(report.selected()->name(), "First");
}

TEST(Detector, StateNames)
{
  EXPECT_EQ(fc_detector::ToString(DetectionState::kDetected), "detected");
  EXPECT_EQ(fc_detector::ToString(DetectionState::kAbsent), "absent");
  EXPECT_EQ(fc_detector::ToString(DetectionState::kUnreachable), "unreachable");
}

TEST(Detector, PlatformNames)
{
  EXPECT_EQ(fc_detector::ToString(Platform::kNavigator), "Navigator");
  EXPECT_EQ(fc_detector::ToString(Platform::kNavigator64), "Navigator64");
  EXPECT_EQ(fc_detector::ToString(Platform::kArgonot), "Argonot");
  EXPECT_EQ(fc_detector::ToString(Platform::kTummler), "Tummler");
  EXPECT_EQ(fc_detector::ToString(Platform::kGenericSerial), "GenericSerial");
  EXPECT_EQ(fc_detector::ToString(Platform::kSitl), "SITL");
}

TEST(Detector, SelectedBoardIsOwnedByDetector)
{
  FakeI2cBus bus;
  bus.SetPresent(1, 0x21);
  Detector detector(Candidates(bus, {BoardAt("Missing", 1, 0x20), BoardAt("Good", 1, 0x21)}));

  const auto report = detector.Run();
  ASSERT_EQ(detector.candidates().size(), 2u);
  EXPECT_EQ(report.selected(), detector.candidates()[1].get());
  EXPECT_EQ(report.outcomes[1].board, detector.candidates()[1].get());
}
