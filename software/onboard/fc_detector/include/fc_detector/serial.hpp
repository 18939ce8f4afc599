#ifndef FC_DETECTOR__SERIAL_HPP_
#define FC_DETECTOR__SERIAL_HPP_

#include <string>

namespace fc_detector
{

/// Logical autopilot port ("B", "C", ...) bound to a host device path.
struct Serial
{
  std::string port;
  std::string endpoint;
};

inline bool operator==(const Serial & lhs, const Serial & rhs)
{
  return lhs.port == rhs.port && lhs.endpoint == rhs.endpoint;
}

inline bool operator!=(const Serial & lhs, const Serial & rhs)
{
  return !(lhs == rhs);
}

}  // namespace fc_detector

#endif  // FC_DETECTOR__SERIAL_HPP_
