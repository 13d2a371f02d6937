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
#include "device-types.h"
#include "device-discovery.h"
#include "tools/tool-resolver.h"
#include "process/process-runner.h"
#include <string>
#include <string_view>
#include <vector>
#include <asio/awaitable.hpp>

namespace device_query {

constexpr std::string_view SIMULATOR_ALREADY_BOOTED = "Unable to boot device in current state: Booted";

// avd names from `emulator -list-avds`, INFO chatter dropped
std::vector<std::string> parseAvdList(std::string_view output);

// first line of `adb emu avd name`, empty when it is only the OK trailer
std::string parseAvdName(std::string_view output);

class VirtualDevices {
public:
  VirtualDevices(tool_resolver::ToolResolver &resolver, process_lib::CommandRunner &runner);

  asio::awaitable<std::vector<VirtualDevice>> co_listAndroidEmulators();

  // every available simulator, whatever its state
  asio::awaitable<std::vector<VirtualDevice>> co_listIosSimulators();

  asio::awaitable<std::vector<VirtualDevice>> co_listVirtualDevices();

  // returns as soon as the emulator process is started
  asio::awaitable<void> co_launchAndroidEmulator(std::string avd);

  asio::awaitable<void> co_launchIosSimulator(std::string udid);

  std::vector<VirtualDevice> listVirtualDevices();
  void launch(const std::string &id, DeviceType type);

private:
  tool_resolver::ToolResolver &resolver_;
  process_lib::CommandRunner &runner_;
  DeviceDiscovery discovery_;
};

} // namespace device_query
