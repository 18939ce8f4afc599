#include "fc_detector/i2c_bus.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

namespace fc_detector
{

BusAccessError::BusAccessError(
  int bus, uint8_t address, int error_code, const std::string & what)
: std::runtime_error(what), bus_(bus), address_(address), error_code_(error_code)
{
}

void ValidateBusAddress(int bus_index, uint8_t address)
{
  if (bus_index < 0) {
    throw std::invalid_argument("I2C bus index must be non-negative, got " +
            std::to_string(bus_index));
  }
  if (address < kFirstProbeAddress || address > kLastProbeAddress) {
    char hex[8];
    std::snprintf(hex, sizeof(hex), "0x%02x", address);
    throw std::invalid_argument(std::string("I2C address ") + hex + " is outside 0x03-0x77");
  }
}

}  // namespace fc_detector
