// Copyright (c) 2025 R.J. (kencube@hotmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <nlohmann/json.hpp>

namespace device_query {

enum class DeviceType {
  AndroidDevice,
  AndroidEmulator,
  IosDevice,
  IosSimulator,
};

class DeviceTypeConverter {
  static constexpr std::array kSupportedTypes = {
        std::pair{DeviceType::AndroidDevice, std::string_view{"android-device"}},
        std::pair{DeviceType::AndroidEmulator, std::string_view{"android-emulator"}},
        std::pair{DeviceType::IosDevice, std::string_view{"ios-device"}},
        std::pair{DeviceType::IosSimulator, std::string_view{"ios-simulator"}},
    };

public:
  static constexpr std::string_view stringfiyType(DeviceType type) {
    for (const auto& [t, name] : kSupportedTypes) {
      if (t == type) {
        return name;
      }
    }
    return {};
  }

  // also accepts the short forms android, emulator, ios, simulator
  static constexpr std::optional<DeviceType> stringToType(std::string_view str) {
    for (const auto& [type, name] : kSupportedTypes) {
      if (str == name) {
        return type;
      }
    }
    if (str == "android") return DeviceType::AndroidDevice;
    if (str == "emulator") return DeviceType::AndroidEmulator;
    if (str == "ios" || str == "iphone") return DeviceType::IosDevice;
    if (str == "simulator") return DeviceType::IosSimulator;
    return std::nullopt;
  }
};

constexpr bool is_android(DeviceType type) {
  return type == DeviceType::AndroidDevice || type == DeviceType::AndroidEmulator;
}

struct Device {
  std::string id;
  std::string name;
  std::string model;
  DeviceType type{DeviceType::AndroidDevice};
  std::string description;
};

struct Package {
  std::string name;
  std::string bundleId;
};

struct VirtualDevice {
  std::string id;
  std::string name;
  std::string model;
  std::string platform;  // android or ios
  std::string state;
};

inline void to_json(nlohmann::json &j, const DeviceType &type) {
  j = std::string(DeviceTypeConverter::stringfiyType(type));
}

inline void to_json(nlohmann::json &j, const Device &dev) {
  j = nlohmann::json{
    {"id", dev.id},
    {"name", dev.name},
    {"model", dev.model},
    {"deviceType", dev.type},
  };
  if (!dev.description.empty()) j["description"] = dev.description;
}

inline void to_json(nlohmann::json &j, const Package &pkg) {
  j = nlohmann::json{{"name", pkg.name}, {"bundleId", pkg.bundleId}};
}

inline void to_json(nlohmann::json &j, const VirtualDevice &dev) {
  j = nlohmann::json{
    {"id", dev.id},
    {"name", dev.name},
    {"model", dev.model},
    {"platform", dev.platform},
    {"state", dev.state},
  };
}

} // namespace device_query
