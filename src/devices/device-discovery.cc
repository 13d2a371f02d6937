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
#include "device-discovery.h"
#include "common/string-utils.h"
#include "common/co-spawn-run.h"
#include <asio.hpp>
#include <format>
#include <regex>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace device_query {

using asio::awaitable;
using process_lib::ProcessResult;

namespace {

constexpr std::string_view SIM_RUNTIME_PREFIX = "com.apple.CoreSimulator.SimRuntime.";

const ProcessResult &checked(const ProcessResult &result, std::string_view what) {
  if (!result.succeeded()) {
    throw process_lib::process_error(std::format("{} failed (exit {}): {}",
        what, result.exitCode, common::trim(result.err)));
  }
  return result;
}

std::string unquote(std::string_view s) {
  s = common::trim(s);
  if (s.ends_with(';')) {
    s.remove_suffix(1);
    s = common::trim(s);
  }
  if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
    s = s.substr(1, s.size() - 2);
  }
  return std::string(s);
}

// nesting change of one line of an old-style plist, quoted text ignored
int depth_delta(std::string_view line) {
  int delta = 0;
  bool quoted = false;
  for (size_t i = 0; i < line.size(); i++) {
    char c = line[i];
    if (c == '\\' && quoted) {
      i++;
    } else if (c == '"') {
      quoted = !quoted;
    } else if (!quoted && (c == '{' || c == '(')) {
      delta++;
    } else if (!quoted && (c == '}' || c == ')')) {
      delta--;
    }
  }
  return delta;
}

} // namespace

std::vector<Device> parseAdbDevices(std::string_view output) {
  std::regex ws_re("\\s+");
  std::vector<Device> out;

  for (auto &line : common::split_lines(output)) {
    if (line.starts_with("List of devices") || line.starts_with("*")) {
      continue;
    }

    std::sregex_token_iterator first {line.begin(), line.end(), ws_re, -1}, last;
    auto items = std::vector<std::string>(first, last);
    if (items.size() < 2 || items[1] != "device") {
      continue;
    }

    Device dev;
    dev.id = std::move(items[0]);
    dev.type = DeviceType::AndroidEmulator;

    for (size_t i = 2; i < items.size(); i++) {
      if (auto *val = common::value_of_starts_with(items[i], "model:")) {
        dev.model = val;
        common::string_replace_all<char>(dev.model, "_", " ");
      } else if (auto *val = common::value_of_starts_with(items[i], "device:")) {
        dev.description = val;
      } else if (items[i].starts_with("usb:")) {
        dev.type = DeviceType::AndroidDevice;
      }
    }

    dev.name = dev.model.empty() ? dev.id : dev.model;
    out.push_back(std::move(dev));
  }

  return out;
}

std::string runtimeDisplayName(std::string_view runtimeKey) {
  if (runtimeKey.starts_with(SIM_RUNTIME_PREFIX)) {
    runtimeKey.remove_prefix(SIM_RUNTIME_PREFIX.size());
  }
  std::string name(runtimeKey);
  auto dash = name.find('-');
  if (dash != std::string::npos) {
    name[dash] = ' ';
    std::replace(name.begin() + dash, name.end(), '-', '.');
  }
  return name;
}

std::vector<SimulatorEntry> parseSimctlDevices(std::string_view json) {
  std::vector<SimulatorEntry> out;

  auto doc = nlohmann::json::parse(json);
  auto devices = doc.find("devices");
  if (devices == doc.end() || !devices->is_object()) {
    return out;
  }

  for (auto &[runtime, list] : devices->items()) {
    if (!list.is_array()) {
      continue;
    }
    for (auto &dev : list) {
      if (!dev.contains("udid") || !dev.contains("name") || !dev.contains("state")) {
        continue;
      }
      if (dev.value("isAvailable", true) == false) {
        continue;
      }
      out.push_back({
        dev["udid"].get<std::string>(),
        dev["name"].get<std::string>(),
        dev["state"].get<std::string>(),
        runtimeDisplayName(runtime),
      });
    }
  }

  return out;
}

std::vector<Package> parseAndroidPackages(std::string_view output) {
  std::vector<Package> out;
  for (auto &line : common::split_lines(output)) {
    if (auto *id = common::value_of_starts_with(line, "package:")) {
      out.push_back({id, id});
    }
  }
  return out;
}

std::vector<Package> parseInstalledApps(std::string_view output) {
  std::vector<Package> out;

  for (auto &line : common::split_lines(output)) {
    if (line.starts_with("CFBundleIdentifier") || line.starts_with("Total:")) {
      continue;
    }

    Package pkg;
    if (auto comma = line.find(','); comma != std::string::npos) {
      // com.a, "1.0", "Display Name"
      pkg.bundleId = std::string(common::trim(std::string_view(line).substr(0, comma)));
      auto rest = std::string_view(line).substr(comma + 1);
      auto second = rest.find(',');
      pkg.name = second == std::string_view::npos ? pkg.bundleId : unquote(rest.substr(second + 1));
    } else if (auto dash = line.find(" - "); dash != std::string::npos) {
      pkg.bundleId = line.substr(0, dash);
      pkg.name = std::string(common::trim(std::string_view(line).substr(dash + 3)));
    } else if (auto tab = line.find('\t'); tab != std::string::npos) {
      pkg.bundleId = line.substr(0, tab);
      pkg.name = std::string(common::trim(std::string_view(line).substr(tab + 1)));
    } else {
      pkg.bundleId = line;
    }

    if (pkg.bundleId.empty()) {
      continue;
    }
    if (pkg.name.empty()) {
      pkg.name = pkg.bundleId;
    }
    out.push_back(std::move(pkg));
  }

  return out;
}

std::vector<Package> parseSimulatorApps(std::string_view output) {
  std::vector<Package> out;
  int depth = 0;
  std::string display_name, bundle_name;

  for (auto &line : common::split_lines(output)) {
    auto eq = line.find(" = ");

    if (depth == 1 && eq != std::string::npos && line.ends_with("{")) {
      out.push_back({"", unquote(std::string_view(line).substr(0, eq))});
      display_name.clear();
      bundle_name.clear();
    } else if (depth == 2 && eq != std::string::npos && !out.empty()) {
      auto key = line.substr(0, eq);
      if (key == "CFBundleDisplayName") {
        display_name = unquote(std::string_view(line).substr(eq + 3));
      } else if (key == "CFBundleName") {
        bundle_name = unquote(std::string_view(line).substr(eq + 3));
      }
    }

    depth += depth_delta(line);

    if (depth == 1 && !out.empty() && out.back().name.empty()) {
      auto &app = out.back();
      app.name = !display_name.empty() ? display_name : !bundle_name.empty() ? bundle_name : app.bundleId;
    }
  }

  return out;
}

std::map<std::string, std::string> parseGetprop(std::string_view output) {
  static const std::regex prop_re(R"(^\[([^\]]+)\]:\s*\[(.*)\]$)");
  std::map<std::string, std::string> props;

  for (auto &line : common::split_lines(output)) {
    std::smatch m;
    if (std::regex_match(line, m, prop_re)) {
      props[m[1].str()] = m[2].str();
    }
  }
  return props;
}

DeviceDiscovery::DeviceDiscovery(tool_resolver::ToolResolver &resolver, process_lib::CommandRunner &runner)
: resolver_(resolver),
  runner_(runner)
{}

awaitable<ProcessResult>
DeviceDiscovery::co_tool(std::string tool, std::vector<std::string> args, process_lib::RunOptions options) {
  auto path = (co_await resolver_.co_resolve(tool)).absolutePath;
  co_return co_await runner_.co_run(path, std::move(args), std::move(options));
}

awaitable<std::vector<Device>>
DeviceDiscovery::co_listAndroidDevices() {
  auto result = co_await co_tool("adb", {"devices", "-l"});
  co_return parseAdbDevices(checked(result, "adb devices").out);
}

awaitable<std::vector<Device>>
DeviceDiscovery::co_listIosDevices() {
  auto ids = co_await co_tool("idevice_id", {"-l"});

  std::vector<Device> out;
  for (auto &udid : common::split_lines(checked(ids, "idevice_id").out)) {
    Device dev;
    dev.id = udid;
    dev.name = udid;
    dev.model = "iPhone";
    dev.type = DeviceType::IosDevice;
    dev.description = "iOS device";

    auto info = co_await co_tool("ideviceinfo", {"-u", udid, "-k", "DeviceName"});
    auto name = common::trim(info.out);
    if (info.succeeded() && !name.empty()) {
      dev.name = std::string(name);
    } else {
      spdlog::debug("no device name for {}: {}", udid, common::trim(info.err));
    }

    out.push_back(std::move(dev));
  }

  co_return out;
}

awaitable<std::vector<SimulatorEntry>>
DeviceDiscovery::co_listSimulatorEntries() {
  auto result = co_await co_tool("xcrun", {"simctl", "list", "devices", "available", "--json"});
  co_return parseSimctlDevices(checked(result, "simctl list devices").out);
}

awaitable<std::vector<Device>>
DeviceDiscovery::co_listIosSimulators() {
  std::vector<Device> out;
  for (auto &sim : co_await co_listSimulatorEntries()) {
    if (sim.state != "Booted") {
      continue;
    }
    out.push_back({
      sim.udid,
      std::format("{} ({})", sim.name, sim.runtime),
      sim.name,
      DeviceType::IosSimulator,
      "iOS simulator",
    });
  }
  co_return out;
}

awaitable<std::vector<Device>>
DeviceDiscovery::co_listDevices() {
  std::vector<Device> out;

  auto append = [&out](std::vector<Device> devices) {
    out.insert(out.end(), std::make_move_iterator(devices.begin()), std::make_move_iterator(devices.end()));
  };

  try {
    append(co_await co_listAndroidDevices());
  } catch (const std::exception &e) {
    spdlog::warn("android devices unavailable: {}", e.what());
  }

  try {
    append(co_await co_listIosDevices());
  } catch (const std::exception &e) {
    spdlog::warn("ios devices unavailable: {}", e.what());
  }

  if (resolver_.environment().platform == tool_resolver::HostPlatform::MacOS) {
    try {
      append(co_await co_listIosSimulators());
    } catch (const std::exception &e) {
      spdlog::warn("ios simulators unavailable: {}", e.what());
    }
  }

  co_return out;
}

awaitable<std::vector<Package>>
DeviceDiscovery::co_listAndroidPackages(std::string device) {
  auto result = co_await co_tool("adb", {"-s", device, "shell", "pm", "list", "packages", "-3"});
  co_return parseAndroidPackages(checked(result, "pm list packages").out);
}

awaitable<std::vector<Package>>
DeviceDiscovery::co_listIosPackages(std::string device) {
  auto result = co_await co_tool("ideviceinstaller", {"-u", device, "-l"});
  co_return parseInstalledApps(checked(result, "ideviceinstaller -l").out);
}

awaitable<std::vector<Package>>
DeviceDiscovery::co_listSimulatorPackages(std::string device) {
  auto result = co_await co_tool("xcrun", {"simctl", "listapps", device});
  co_return parseSimulatorApps(checked(result, "simctl listapps").out);
}

awaitable<std::vector<Package>>
DeviceDiscovery::co_listPackages(std::string device, DeviceType type) {
  switch (type) {
  case DeviceType::AndroidDevice:
  case DeviceType::AndroidEmulator:
    co_return co_await co_listAndroidPackages(device);
  case DeviceType::IosDevice:
    co_return co_await co_listIosPackages(device);
  case DeviceType::IosSimulator:
    co_return co_await co_listSimulatorPackages(device);
  }
  throw std::invalid_argument(std::format("unknown device type {}", static_cast<int>(type)));
}

awaitable<bool>
DeviceDiscovery::co_isIosAppInstalled(std::string device, std::string bundleId, std::chrono::seconds timeout) {
  ProcessResult result;
  try {
    result = co_await co_tool("ideviceinstaller", {"-u", device, "-l"},
        process_lib::RunOptions{std::chrono::duration_cast<std::chrono::milliseconds>(timeout), std::nullopt});
  } catch (const process_lib::timeout_error &) {
    throw process_lib::timeout_error(std::format(
        "device {} did not list its apps within {}s, is it locked or still pairing?", device, timeout.count()));
  }

  for (auto &pkg : parseInstalledApps(checked(result, "ideviceinstaller -l").out)) {
    if (pkg.bundleId == bundleId) {
      co_return true;
    }
  }
  co_return false;
}

awaitable<std::map<std::string, std::string>>
DeviceDiscovery::co_getAndroidDeviceInfo(std::string device) {
  auto result = co_await co_tool("adb", {"-s", device, "shell", "getprop"});
  co_return parseGetprop(checked(result, "getprop").out);
}

std::vector<Device> DeviceDiscovery::listDevices() {
  return common::co_spawn_run_ret<std::vector<Device>>([this]() {
    return co_listDevices();
  });
}

std::vector<Package> DeviceDiscovery::listPackages(const std::string &device, DeviceType type) {
  return common::co_spawn_run_ret<std::vector<Package>>([&]() {
    return co_listPackages(device, type);
  });
}

bool DeviceDiscovery::isIosAppInstalled(const std::string &device, const std::string &bundleId, std::chrono::seconds timeout) {
  return common::co_spawn_run_ret<bool>([&]() {
    return co_isIosAppInstalled(device, bundleId, timeout);
  });
}

std::map<std::string, std::string> DeviceDiscovery::getAndroidDeviceInfo(const std::string &device) {
  return common::co_spawn_run_ret<std::map<std::string, std::string>>([&]() {
    return co_getAndroidDeviceInfo(device);
  });
}

#ifdef ENABLE_TEST
#include "device-discovery_tests.cc"
#endif

} // namespace device_query
