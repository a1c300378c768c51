/**
 * @file Device.cpp
 * @brief Fleet selection helpers.
 */

#include "src/config/inc/Device.hpp"

#include <algorithm>
#include <iterator>

namespace proxwatch {

namespace config {

std::vector<Device> filterByGroup(const std::vector<Device>& devices, std::string_view group) {
  if (group.empty()) {
    return devices;
  }

  std::vector<Device> out;
  std::copy_if(devices.begin(), devices.end(), std::back_inserter(out),
               [group](const Device& d) { return d.group == group; });
  return out;
}

std::vector<std::string> listGroups(const std::vector<Device>& devices) {
  std::vector<std::string> groups;
  for (const Device& d : devices) {
    if (!d.group.empty()) {
      groups.push_back(d.group);
    }
  }
  std::sort(groups.begin(), groups.end());
  groups.erase(std::unique(groups.begin(), groups.end()), groups.end());
  return groups;
}

} // namespace config

} // namespace proxwatch
