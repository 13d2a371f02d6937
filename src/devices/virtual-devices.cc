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

#ifdef ENABLE_TEST
#include "../../tests/test_base.h"
#endif
#include "virtual-devices.h"
#include "common/string-utils.h"
#include "common/co-spawn-run.h"
#include <asio.hpp>
#include <format>
#include <set>
#include <spdlog/spdlog.h>

namespace device_query {

using asio::awaitable;

namespace {

constexpr std::string_view MACOS_OPEN = "/usr/bin/open";

} // namespace

std::vector<std::string> parseAvdList(std::string_view output) {
  std::vector<std::string> avds;
  for (auto &line : common::split_lines(output)) {
    if (line.starts_with("INFO")) {
      continue;
    }
    avds.push_back(line);
  }
  return avds;
}

std::string parseAvdName(std::string_view output) {
  auto lines = common::split_lines(output);
  if (lines.empty() || lines.front() == "OK") {
    return {};
  }
  return lines.front();
}

VirtualDevices::VirtualDevices(tool_resolver::ToolResolver &resolver, process_lib::CommandRunner &runner)
: resolver_(resolver),
  runner_(runner),
  discovery_(resolver, runner)
{}

awaitable<std::vector<VirtualDevice>>
VirtualDevices::co_listAndroidEmulators() {
  auto emulator = (co_await resolver_.co_resolve("emulator")).absolutePath;
  auto listing = co_await runner_.co_run(emulator, {"-list-avds"});
  if (!listing.succeeded()) {
    throw process_lib::process_error(std::format("emulator -list-avds failed (exit {}): {}",
        listing.exitCode, common::trim(listing.err)));
  }
  auto avds = parseAvdList(listing.out);

  std::set<std::string> running;
  try {
    auto adb = (co_await resolver_.co_resolve("adb")).absolutePath;
    for (auto &dev : co_await discovery_.co_listAndroidDevices()) {
      if (dev.type != DeviceType::AndroidEmulator || !dev.id.starts_with("emulator-")) {
        continue;
      }
      auto name = co_await runner_.co_run(adb, {"-s", dev.id, "emu", "avd", "name"});
      auto avd = name.succeeded() ? parseAvdName(name.out) : std::string();
      if (avd.empty()) {
        spdlog::debug("no avd name from {}: {}", dev.id, common::trim(name.err));
        continue;
      }
      running.insert(avd);
    }
  } catch (const std::exception &e) {
    // without adb every avd is reported stopped
    spdlog::warn("cannot query running emulators: {}", e.what());
  }

  std::vector<VirtualDevice> out;
  for (auto &avd : avds) {
    out.push_back({avd, avd, avd, "android", running.contains(avd) ? "running" : "stopped"});
  }
  co_return out;
}

awaitable<std::vector<VirtualDevice>>
VirtualDevices::co_listIosSimulators() {
  std::vector<VirtualDevice> out;
  for (auto &sim : co_await discovery_.co_listSimulatorEntries()) {
    out.push_back({
      sim.udid,
      std::format("{} ({})", sim.name, sim.runtime),
      sim.name,
      "ios",
      sim.state,
    });
  }
  co_return out;
}

awaitable<std::vector<VirtualDevice>>
VirtualDevices::co_listVirtualDevices() {
  std::vector<VirtualDevice> out;

  try {
    auto emulators = co_await co_listAndroidEmulators();
    out.insert(out.end(), emulators.begin(), emulators.end());
  } catch (const std::exception &e) {
    spdlog::warn("android emulators unavailable: {}", e.what());
  }

  if (resolver_.environment().platform == tool_resolver::HostPlatform::MacOS) {
    try {
      auto simulators = co_await co_listIosSimulators();
      out.insert(out.end(), simulators.begin(), simulators.end());
    } catch (const std::exception &e) {
      spdlog::warn("ios simulators unavailable: {}", e.what());
    }
  }

  co_return out;
}

awaitable<void>
VirtualDevices::co_launchAndroidEmulator(std::string avd) {
  auto emulator = (co_await resolver_.co_resolve("emulator")).absolutePath;
  runner_.spawnDetached(emulator, {"-avd", avd});
  spdlog::info("emulator {} launched", avd);
}

awaitable<void>
VirtualDevices::co_launchIosSimulator(std::string udid) {
  auto xcrun = (co_await resolver_.co_resolve("xcrun")).absolutePath;
  auto boot = co_await runner_.co_run(xcrun, {"simctl", "boot", udid});
  if (!boot.succeeded()) {
    if (!common::contains(boot.err, SIMULATOR_ALREADY_BOOTED)) {
      throw process_lib::process_error(std::format("simctl boot {} failed (exit {}): {}",
          udid, boot.exitCode, common::trim(boot.err)));
    }
    spdlog::debug("simulator {} already booted", udid);
  }

  try {
    auto open = co_await runner_.co_run(std::filesystem::path(MACOS_OPEN), {"-a", "Simulator"});
    if (!open.succeeded()) {
      spdlog::warn("cannot bring Simulator.app forward: {}", common::trim(open.err));
    }
  } catch (const process_lib::process_error &e) {
    spdlog::warn("cannot bring Simulator.app forward: {}", e.what());
  }

  spdlog::info("simulator {} booted", udid);
}

std::vector<VirtualDevice> VirtualDevices::listVirtualDevices() {
  return common::co_spawn_run_ret<std::vector<VirtualDevice>>([this]() {
    return co_listVirtualDevices();
  });
}

void VirtualDevices::launch(const std::string &id, DeviceType type) {
  switch (type) {
  case DeviceType::AndroidEmulator:
    common::co_spawn_run([&]() { return co_launchAndroidEmulator(id); });
    return;
  case DeviceType::IosSimulator:
    common::co_spawn_run([&]() { return co_launchIosSimulator(id); });
    return;
  default:
    throw std::invalid_argument(std::format("{} is not a virtual device type",
        DeviceTypeConverter::stringfiyType(type)));
  }
}

#ifdef ENABLE_TEST
#include "virtual-devices_tests.cc"
#endif

} // namespace device_query
