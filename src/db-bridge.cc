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

#include "common/config.h"
#include "common/logging.h"
#include "common/result.h"
#include "devices/device-discovery.h"
#include "devices/virtual-devices.h"
#include "scratch/scratch-dir.h"
#include "tools/tool-resolver.h"
#include "transfer/transfer-orchestrator.h"
#include "process/process-runner.h"
#include <gflags/gflags.h>
#include <format>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#ifdef _WIN32
#include <windows.h>
#endif

using json = nlohmann::json;

using common::Result;
using common::Unit;
using device_query::DeviceType;

namespace tool_resolver {

void to_json(json &j, const ValidatedTool &tool) {
  j = json{
    {"path", tool.absolutePath.string()},
    {"strategy", tool.strategyName},
    {"version", tool.version},
  };
}

} // namespace tool_resolver

DEFINE_bool(pretty, false,
                  "pretty json output.");

DEFINE_bool(verbose, false,
                  "debug logging on stderr.");

DEFINE_string(app_root, "",
                  "application root for bundled tools, default is the executable's directory.");

DEFINE_string(scratch_dir, "",
                  "staging directory for pulled databases, default is <temp>/db-bridge-temp.");

DEFINE_int32(stale_max_age, 3600,
                  "seconds a pulled file is kept after its last touch.");

DEFINE_int32(app_check_timeout, 30,
                  "seconds to wait for an ios device to list its apps.");

// the following flags select the target of a command

DEFINE_string(device, "",
                  "device serial, udid or avd name.");

DEFINE_string(type, "",
                  "device type. e.g. android-device,android-emulator,ios-device,ios-simulator");

DEFINE_string(package, "",
                  "android package or ios bundle id.");

DEFINE_string(remote, "",
                  "database path on the device.");

DEFINE_string(local, "",
                  "database path on this machine.");

DEFINE_bool(admin, false,
                  "pull through run-as from the app's private storage.");

DEFINE_string(tool, "",
                  "tool name for the resolve command. e.g. adb,xcrun,afcclient");

DEFINE_bool(force, false,
                  "clean: wipe the scratch directory instead of removing stale files.");

namespace {

constexpr int EXIT_USAGE = 2;

class usage_error : public std::runtime_error {
public:
  usage_error(const std::string& arg): std::runtime_error(arg) {}
};

std::filesystem::path executable_dir(const char *argv0) {
  std::error_code ec;
#if defined(_WIN32)
  wchar_t buf[MAX_PATH];
  auto n = GetModuleFileNameW(nullptr, buf, MAX_PATH);
  if (n > 0 && n < MAX_PATH) {
    return std::filesystem::path(std::wstring(buf, n)).parent_path();
  }
#elif defined(__linux__)
  auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec) {
    return self.parent_path();
  }
#endif
  auto abs = std::filesystem::absolute(argv0, ec);
  return ec ? std::filesystem::current_path() : abs.parent_path();
}

const std::string &require(const std::string &value, std::string_view flag) {
  if (value.empty()) {
    throw usage_error(std::format("--{} is required", flag));
  }
  return value;
}

DeviceType require_type() {
  auto type = device_query::DeviceTypeConverter::stringToType(require(FLAGS_type, "type"));
  if (!type) {
    throw usage_error(std::format("unknown device type '{}'", FLAGS_type));
  }
  return *type;
}

template <typename T>
int print(const Result<T> &result) {
  json j = result;
  std::cout << j.dump(FLAGS_pretty ? 4 : -1) << std::endl;
  return result.success ? 0 : 1;
}

std::string describe_failure(const std::exception &e, tool_resolver::HostPlatform platform) {
  if (auto *tool = dynamic_cast<const tool_resolver::tool_resolution_error *>(&e)) {
    return std::format("{}\n{}", tool->what(), tool_resolver::installationInstructions(tool->error, platform));
  }
  return e.what();
}

// runs a throwing query and prints its outcome as a Result
template <typename F>
int emit(F f, tool_resolver::HostPlatform platform) {
  using T = decltype(f());
  Result<T> result;
  try {
    result = Result<T>::ok(f());
  } catch (const usage_error &) {
    throw;
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    result = Result<T>::fail(describe_failure(e, platform));
  }
  return print(result);
}

common::BridgeConfig config_from_flags(const char *argv0) {
  common::BridgeConfig config;
  config.appRoot = FLAGS_app_root.empty() ? executable_dir(argv0) : std::filesystem::path(FLAGS_app_root);
  config.scratchDir = FLAGS_scratch_dir.empty() ? scratch::ScratchDirectory::defaultRoot()
                                                : std::filesystem::path(FLAGS_scratch_dir);
  config.staleMaxAge = std::chrono::seconds(FLAGS_stale_max_age);
  config.appCheckTimeout = std::chrono::seconds(FLAGS_app_check_timeout);
  return config;
}

int run_command(const std::string &command, const common::BridgeConfig &config) {
  process_lib::ProcessCommandRunner runner;
  tool_resolver::ToolResolver resolver(tool_resolver::ToolEnvironment::capture(config.appRoot), runner);
  scratch::ScratchDirectory scratch(config.scratchDir);

  db_transfer::TransferOrchestrator orchestrator(resolver, runner, scratch, config.staleMaxAge);
  device_query::DeviceDiscovery discovery(resolver, runner);
  device_query::VirtualDevices virtuals(resolver, runner);

  const auto platform = resolver.environment().platform;

  if (command == "devices") {
    return emit([&]() { return discovery.listDevices(); }, platform);
  }

  if (command == "packages") {
    auto &device = require(FLAGS_device, "device");
    auto type = require_type();
    return emit([&]() { return discovery.listPackages(device, type); }, platform);
  }

  if (command == "virtual-devices") {
    return emit([&]() { return virtuals.listVirtualDevices(); }, platform);
  }

  if (command == "launch") {
    auto &device = require(FLAGS_device, "device");
    auto type = require_type();
    return emit([&]() {
      virtuals.launch(device, type);
      return Unit{};
    }, platform);
  }

  if (command == "list-dbs") {
    auto &device = require(FLAGS_device, "device");
    auto type = require_type();
    auto &package = require(FLAGS_package, "package");
    return print(orchestrator.listDatabaseFiles(device, type, package));
  }

  if (command == "pull") {
    auto &device = require(FLAGS_device, "device");
    auto type = require_type();
    auto &package = require(FLAGS_package, "package");
    auto &remote = require(FLAGS_remote, "remote");
    return print(orchestrator.pullDatabaseFile(device, type, package, remote, FLAGS_admin));
  }

  if (command == "push") {
    auto &device = require(FLAGS_device, "device");
    auto type = require_type();
    auto &package = require(FLAGS_package, "package");
    auto &local = require(FLAGS_local, "local");
    auto &remote = require(FLAGS_remote, "remote");
    return print(orchestrator.pushDatabaseFile(device, type, package, local, remote));
  }

  if (command == "resolve") {
    return print(orchestrator.resolveTool(require(FLAGS_tool, "tool")));
  }

  if (command == "clean") {
    if (FLAGS_force) {
      return print(orchestrator.forceClean());
    }
    return print(orchestrator.cleanStale());
  }

  if (command == "touch") {
    return print(orchestrator.touch(require(FLAGS_local, "local")));
  }

  if (command == "device-info") {
    auto &device = require(FLAGS_device, "device");
    return emit([&]() { return discovery.getAndroidDeviceInfo(device); }, platform);
  }

  if (command == "app-installed") {
    auto &device = require(FLAGS_device, "device");
    auto &package = require(FLAGS_package, "package");
    return emit([&]() {
      return discovery.isIosAppInstalled(device, package, config.appCheckTimeout);
    }, platform);
  }

  throw usage_error(std::format("unknown command '{}'", command));
}

} // namespace


int main(int argc, char *argv[]) {
#ifdef _WIN32
  SetThreadUILanguage(MAKELANGID(LANG_ENGLISH, SUBLANG_ENGLISH_US));
#endif

  gflags::SetVersionString(VERSION);
  gflags::SetUsageMessage(
    "<command> [flags]\n"
    "commands: devices, packages, virtual-devices, launch, list-dbs, pull, push,\n"
    "          resolve, clean, touch, device-info, app-installed\n"
    "Sample usage:\n db-bridge list-dbs --device=emulator-5554 --type=android-emulator --package=com.example.app\n"
    " db-bridge pull --device=emulator-5554 --type=android-emulator --package=com.example.app\n"
    "   --remote=/data/data/com.example.app/databases/app.db --admin --pretty\n");

  gflags::ParseCommandLineFlags(&argc, &argv, true);

  common::init_logging(FLAGS_verbose);

  if (argc < 2) {
    std::cerr << gflags::ProgramUsage() << std::endl;
    return EXIT_USAGE;
  }

  try {
    return run_command(argv[1], config_from_flags(argv[0]));
  } catch (const usage_error &e) {
    std::cerr << e.what() << std::endl;
    return EXIT_USAGE;
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}
