#include "fc_detector/platform.hpp"

#include <string>

namespace fc_detector
{

std::string ToString(Platform platform)
{
  switch (platform) {
    case Platform::kNavigator:
      return "Navigator";
    case Platform::kNavigator64:
      return "Navigator64";
    case Platform::kArgonot:
      return "Argonot";
    case Platform::kTummler:
      return "Tummler";
    case Platform::kGenericSerial:
      return "GenericSerial";
    case Platform::kSitl:
      return "SITL";
  }
  return "Unknown";
}

}  // namespace fc_detector
