#ifndef FC_DETECTOR__I2C_BUS_HPP_
#define FC_DETECTOR__I2C_BUS_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>

namespace fc_detector
{

/// Lowest and highest 7-bit addresses that may be probed (same window as i2cdetect).
constexpr uint8_t kFirstProbeAddress = 0x03;
constexpr uint8_t kLastProbeAddress = 0x77;

/// Where a device is expected to answer.
struct BusAddress
{
  uint8_t address;
  int bus;
};

/// The bus could not be queried at all. Distinct from "nothing answered".
class BusAccessError : public std::runtime_error
{
public:
  BusAccessError(int bus, uint8_t address, int error_code, const std::string & what);

  int bus() const {return bus_;}
  uint8_t address() const {return address_;}
  int error_code() const {return error_code_;}

private:
  int bus_;
  uint8_t address_;
  int error_code_;
};

class I2cBus
{
public:
  virtual ~I2cBus() = default;

  /// True if a device ACKs at `address` on `bus_index`.
  /// Throws BusAccessError on transport faults and std::invalid_argument on bad arguments.
  virtual bool Exists(int bus_index, uint8_t address) = 0;
};

/// Throws std::invalid_argument unless the pair names a probeable address.
void ValidateBusAddress(int bus_index, uint8_t address);

}  // namespace fc_detector

#endif  // FC_DETECTOR__I2C_BUS_HPP_
