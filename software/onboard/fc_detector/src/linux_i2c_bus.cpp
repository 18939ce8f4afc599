#include "fc_detector/linux_i2c_bus.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <linux/i2c.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "rclcpp/logging.hpp"

namespace fc_detector
{
namespace
{

std::string FormatAddress(uint8_t address)
{
  char hex[8];
  std::snprintf(hex, sizeof(hex), "0x%02x", address);
  return hex;
}

class SyscallI2cDevOps : public I2cDevOps
{
public:
  int Open(const std::string & path) override
  {
    const int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    return fd < 0 ? -errno : fd;
  }

  void Close(int fd) override
  {
    ::close(fd);
  }

  int SelectAddress(int fd, uint8_t address, bool force) override
  {
    const unsigned long request = force ? I2C_SLAVE_FORCE : I2C_SLAVE;
    return ::ioctl(fd, request, static_cast<unsigned long>(address)) < 0 ? -errno : 0;
  }

  int ReadByte(int fd) override
  {
    i2c_smbus_data data{};
    i2c_smbus_ioctl_data args{};
    args.read_write = I2C_SMBUS_READ;
    args.command = 0;
    args.size = I2C_SMBUS_BYTE;
    args.data = &data;
    if (::ioctl(fd, I2C_SMBUS, &args) < 0) {
      return -errno;
    }
    return data.byte;
  }
};

class FileDescriptor
{
public:
  FileDescriptor(I2cDevOps & ops, int fd)
  : ops_(ops), fd_(fd)
  {
  }

  ~FileDescriptor()
  {
    if (fd_ >= 0) {
      ops_.Close(fd_);
    }
  }

  FileDescriptor(const FileDescriptor &) = delete;
  FileDescriptor & operator=(const FileDescriptor &) = delete;

  int get() const {return fd_;}
  bool valid() const {return fd_ >= 0;}

private:
  I2cDevOps & ops_;
  int fd_;
};

}  // namespace

ProbeAnswer ClassifyTransferError(int error_code)
{
  // Codes the adapter returns when the address phase is not acknowledged.
  if (error_code == ENXIO || error_code == EREMOTEIO) {
    return ProbeAnswer::kAbsent;
  }
  return ProbeAnswer::kFault;
}

std::unique_ptr<I2cDevOps> MakeSyscallI2cDevOps()
{
  return std::make_unique<SyscallI2cDevOps>();
}

LinuxI2cBus::LinuxI2cBus(
  std::string device_prefix, std::chrono::milliseconds probe_timeout,
  std::unique_ptr<I2cDevOps> ops)
: device_prefix_(std::move(device_prefix)),
  probe_timeout_(probe_timeout),
  ops_(std::move(ops))
{
  if (probe_timeout_.count() <= 0) {
    throw std::invalid_argument(
            "I2C probe timeout must be positive, got " +
            std::to_string(probe_timeout_.count()) + " ms");
  }
  if (!ops_) {
    throw std::invalid_argument("LinuxI2cBus needs an i2c-dev backend");
  }
}

std::string LinuxI2cBus::DevicePath(int bus_index) const
{
  return device_prefix_ + std::to_string(bus_index);
}

bool LinuxI2cBus::Exists(int bus_index, uint8_t address)
{
  ValidateBusAddress(bus_index, address);

  const auto logger = rclcpp::get_logger("fc_detector");
  const auto path = DevicePath(bus_index);
  const auto where = path + " address " + FormatAddress(address);

  FileDescriptor fd(*ops_, ops_->Open(path));
  if (!fd.valid()) {
    const int err = -fd.get();
    throw BusAccessError(
            bus_index, address, err,
            "Failed to open I2C adapter at " + path + ": " + std::strerror(err));
  }

  int rc = ops_->SelectAddress(fd.get(), address, false);
  if (rc == -EBUSY) {
    // A kernel client is registered here, which says nothing about the
    // hardware. Address it anyway and let the transfer decide.
    RCLCPP_DEBUG(logger, "%s is claimed by a kernel client, forcing", where.c_str());
    rc = ops_->SelectAddress(fd.get(), address, true);
  }
  if (rc < 0) {
    throw BusAccessError(
            bus_index, address, -rc,
            "Failed to select " + where + ": " + std::strerror(-rc));
  }

  const auto start = std::chrono::steady_clock::now();
  rc = ops_->ReadByte(fd.get());
  const auto elapsed = std::chrono::steady_clock::now() - start;

  if (elapsed > probe_timeout_) {
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
    throw BusAccessError(
            bus_index, address, ETIMEDOUT,
            "I2C transaction on " + where + " took " + std::to_string(elapsed_ms.count()) +
            " ms, limit is " + std::to_string(probe_timeout_.count()) + " ms");
  }

  if (rc < 0) {
    if (ClassifyTransferError(-rc) == ProbeAnswer::kAbsent) {
      RCLCPP_DEBUG(logger, "No device at %s", where.c_str());
      return false;
    }
    throw BusAccessError(
            bus_index, address, -rc,
            "I2C transaction failed on " + where + ": " + std::strerror(-rc));
  }

  RCLCPP_DEBUG(logger, "Device answered at %s", where.c_str());
  return true;
}

}  // namespace fc_detector
