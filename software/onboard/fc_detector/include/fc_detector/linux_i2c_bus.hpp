#ifndef FC_DETECTOR__LINUX_I2C_BUS_HPP_
#define FC_DETECTOR__LINUX_I2C_BUS_HPP_

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "fc_detector/i2c_bus.hpp"

namespace fc_detector
{

constexpr auto kDefaultI2cDevicePrefix = "/dev/i2c-";
constexpr std::chrono::milliseconds kDefaultProbeTimeout{100};

enum class ProbeAnswer
{
  kAbsent,
  kFault,
};

/// Maps the errno of a failed SMBus read. Only an address NACK means "absent".
ProbeAnswer ClassifyTransferError(int error_code);

/// The i2c-dev calls LinuxI2cBus issues. Failures return -errno.
class I2cDevOps
{
public:
  virtual ~I2cDevOps() = default;

  /// File descriptor or -errno.
  virtual int Open(const std::string & path) = 0;
  virtual void Close(int fd) = 0;
  /// 0 or -errno. `force` selects the address even if a kernel client owns it.
  virtual int SelectAddress(int fd, uint8_t address, bool force) = 0;
  /// The byte read or -errno.
  virtual int ReadByte(int fd) = 0;
};

std::unique_ptr<I2cDevOps> MakeSyscallI2cDevOps();

/// Probes /dev/i2c-N with a single SMBus read-byte transaction.
/// The adapter's own timeout bounds the transfer. A transfer slower than
/// `probe_timeout` is reported as a BusAccessError (ETIMEDOUT). Adapter
/// settings are never changed, and instances may be shared across threads.
class LinuxI2cBus : public I2cBus
{
public:
  explicit LinuxI2cBus(
    std::string device_prefix = kDefaultI2cDevicePrefix,
    std::chrono::milliseconds probe_timeout = kDefaultProbeTimeout,
    std::unique_ptr<I2cDevOps> ops = MakeSyscallI2cDevOps());

  bool Exists(int bus_index, uint8_t address) override;

  std::string DevicePath(int bus_index) const;

private:
  std::string device_prefix_;
  std::chrono::milliseconds probe_timeout_;
  std::unique_ptr<I2cDevOps> ops_;
};

}  // namespace fc_detector

#endif  // FC_DETECTOR__LINUX_I2C_BUS_HPP_
