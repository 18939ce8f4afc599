#ifndef FC_DETECTOR__PLATFORM_HPP_
#define FC_DETECTOR__PLATFORM_HPP_

#include <string>

namespace fc_detector
{

enum class Platform
{
  kNavigator,
  kNavigator64,
  kArgonot,
  kTummler,
  kGenericSerial,
  kSitl,
};

std::string ToString(Platform platform);

}  // namespace fc_detector

#endif  // FC_DETECTOR__PLATFORM_HPP_
