#ifndef FC_DETECTOR__FLIGHT_CONTROLLER_HPP_
#define FC_DETECTOR__FLIGHT_CONTROLLER_HPP_

#include <map>
#include <string>
#include <vector>

#include "fc_detector/i2c_bus.hpp"
#include "fc_detector/platform.hpp"
#include "fc_detector/serial.hpp"

namespace fc_detector
{

/// Static description of one supported autopilot board.
struct BoardDefinition
{
  std::string name;
  std::string manufacturer;
  Platform platform;
  /// Device role -> where it must answer. Every entry has to respond for a match.
  std::map<std::string, BusAddress> devices;
  /// Port table in the order consumers expect it.
  std::vector<Serial> serials;
};

class FlightController
{
public:
  virtual ~FlightController() = default;

  virtual const std::string & name() const = 0;
  virtual const std::string & manufacturer() const = 0;
  virtual Platform platform() const = 0;

  /// May throw BusAccessError; never reports a transport fault as "absent".
  virtual bool Detect() = 0;

  /// Pure lookup, no bus traffic.
  virtual std::vector<Serial> GetSerials() const = 0;
};

/// Board recognised by a fixed set of I2C devices.
class I2cFlightController : public FlightController
{
public:
  I2cFlightController(BoardDefinition definition, I2cBus & bus);

  const std::string & name() const override {return definition_.name;}
  const std::string & manufacturer() const override {return definition_.manufacturer;}
  Platform platform() const override {return definition_.platform;}
  const std::map<std::string, BusAddress> & devices() const {return definition_.devices;}

  bool Detect() override;
  std::vector<Serial> GetSerials() const override;

private:
  const BoardDefinition definition_;
  I2cBus & bus_;
};

}  // namespace fc_detector

#endif  // FC_DETECTOR__FLIGHT_CONTROLLER_HPP_
