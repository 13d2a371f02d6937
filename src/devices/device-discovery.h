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
#include "tools/tool-resolver.h"
#include "process/process-runner.h"
#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <asio/awaitable.hpp>

namespace device_query {

constexpr std::chrono::seconds DEFAULT_APP_CHECK_TIMEOUT{30};

// one entry of `simctl list devices --json`
struct SimulatorEntry {
  std::string udid;
  std::string name;
  std::string state;
  std::string runtime;  // e.g. "iOS 17.0"
};

std::vector<Device> parseAdbDevices(std::string_view output);

std::vector<SimulatorEntry> parseSimctlDevices(std::string_view json);

// com.apple.CoreSimulator.SimRuntime.iOS-17-0 -> iOS 17.0
std::string runtimeDisplayName(std::string_view runtimeKey);

std::vector<Package> parseAndroidPackages(std::string_view output);

std::vector<Package> parseInstalledApps(std::string_view output);

std::vector<Package> parseSimulatorApps(std::string_view output);

std::map<std::string, std::string> parseGetprop(std::string_view output);

class DeviceDiscovery {
public:
  DeviceDiscovery(tool_resolver::ToolResolver &resolver, process_lib::CommandRunner &runner);

  asio::awaitable<std::vector<Device>> co_listAndroidDevices();
  asio::awaitable<std::vector<Device>> co_listIosDevices();
  // booted simulators only
  asio::awaitable<std::vector<Device>> co_listIosSimulators();
  asio::awaitable<std::vector<SimulatorEntry>> co_listSimulatorEntries();

  // every platform, one that fails contributes nothing
  asio::awaitable<std::vector<Device>> co_listDevices();

  asio::awaitable<std::vector<Package>> co_listAndroidPackages(std::string device);
  asio::awaitable<std::vector<Package>> co_listIosPackages(std::string device);
  asio::awaitable<std::vector<Package>> co_listSimulatorPackages(std::string device);
  asio::awaitable<std::vector<Package>> co_listPackages(std::string device, DeviceType type);

  // throws process_lib::timeout_error when the device does not answer in time
  asio::awaitable<bool>
  co_isIosAppInstalled(std::string device, std::string bundleId,
      std::chrono::seconds timeout = DEFAULT_APP_CHECK_TIMEOUT);

  asio::awaitable<std::map<std::string, std::string>>
  co_getAndroidDeviceInfo(std::string device);

  std::vector<Device> listDevices();
  std::vector<Package> listPackages(const std::string &device, DeviceType type);
  bool isIosAppInstalled(const std::string &device, const std::string &bundleId,
      std::chrono::seconds timeout = DEFAULT_APP_CHECK_TIMEOUT);
  std::map<std::string, std::string> getAndroidDeviceInfo(const std::string &device);

private:
  tool_resolver::ToolResolver &resolver_;
  process_lib::CommandRunner &runner_;

  asio::awaitable<process_lib::ProcessResult>
  co_tool(std::string tool, std::vector<std::string> args, process_lib::RunOptions options = {});
};

} // namespace device_query
