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
#include "transfer-orchestrator.h"
#include "common/co-spawn-run.h"
#include <asio.hpp>
#include <format>
#include <spdlog/spdlog.h>

namespace db_transfer {

using asio::awaitable;
using tool_resolver::ValidatedTool;

namespace {

[[noreturn]] void unsupported(DeviceType type) {
  throw transfer_error(
      std::format("unsupported device type {}", device_query::DeviceTypeConverter::stringfiyType(type)),
      transfer_error::unsupported_device);
}

} // namespace

TransferOrchestrator::TransferOrchestrator(
    tool_resolver::ToolResolver &resolver,
    process_lib::CommandRunner &runner,
    scratch::ScratchDirectory &scratch,
    std::chrono::seconds staleMaxAge)
: resolver_(resolver),
  scratch_(scratch),
  staleMaxAge_(staleMaxAge),
  android_(resolver, runner, scratch),
  simulator_(resolver, runner, scratch),
  device_(resolver, runner, scratch, staleMaxAge)
{}

std::string TransferOrchestrator::failureMessage(const std::exception &e) const {
  if (auto *tool = dynamic_cast<const tool_resolver::tool_resolution_error *>(&e)) {
    return std::format("{}\n{}", tool->what(),
        tool_resolver::installationInstructions(tool->error, resolver_.environment().platform));
  }
  return e.what();
}

awaitable<Result<std::vector<DatabaseFile>>>
TransferOrchestrator::co_listDatabaseFiles(std::string device, DeviceType type, std::string package) {
  std::string error;
  try {
    switch (type) {
    case DeviceType::AndroidDevice:
    case DeviceType::AndroidEmulator:
      co_return Result<std::vector<DatabaseFile>>::ok(co_await android_.co_listDatabaseFiles(device, type, package));
    case DeviceType::IosSimulator:
      co_return Result<std::vector<DatabaseFile>>::ok(co_await simulator_.co_listDatabaseFiles(device, package));
    case DeviceType::IosDevice:
      co_return Result<std::vector<DatabaseFile>>::ok(co_await device_.co_listDatabaseFiles(device, package));
    }
    unsupported(type);
  } catch (const std::exception &e) {
    error = failureMessage(e);
  }

  spdlog::error("listing databases of {} on {} failed: {}", package, device, error);
  co_return Result<std::vector<DatabaseFile>>::fail(std::move(error));
}

awaitable<Result<std::string>>
TransferOrchestrator::co_pullDatabaseFile(std::string device, DeviceType type, std::string package, std::string remote, bool admin) {
  std::string error;
  try {
    std::filesystem::path local;
    switch (type) {
    case DeviceType::AndroidDevice:
    case DeviceType::AndroidEmulator:
      local = co_await android_.co_pull(device, package, remote, admin);
      break;
    case DeviceType::IosSimulator:
      local = co_await simulator_.co_pullCopy(device, package, remote);
      break;
    case DeviceType::IosDevice:
      local = co_await device_.co_pull(device, package, remote);
      break;
    default:
      unsupported(type);
    }
    co_return Result<std::string>::ok(local.string());
  } catch (const std::exception &e) {
    error = failureMessage(e);
  }

  spdlog::error("pulling {} from {} failed: {}", remote, device, error);
  co_return Result<std::string>::fail(std::move(error));
}

awaitable<Result<Unit>>
TransferOrchestrator::co_pushDatabaseFile(std::string device, DeviceType type, std::string package,
    std::filesystem::path local, std::string remote) {
  std::string error;
  try {
    switch (type) {
    case DeviceType::AndroidDevice:
    case DeviceType::AndroidEmulator:
      co_await android_.co_push(device, package, local, remote);
      break;
    case DeviceType::IosSimulator:
      co_await simulator_.co_push(local, remote);
      break;
    case DeviceType::IosDevice:
      co_await device_.co_push(device, package, local, remote);
      break;
    default:
      unsupported(type);
    }
    co_return Result<Unit>::ok({});
  } catch (const std::exception &e) {
    error = failureMessage(e);
  }

  spdlog::error("pushing {} to {}:{} failed: {}", local.string(), device, remote, error);
  co_return Result<Unit>::fail(std::move(error));
}

awaitable<Result<ValidatedTool>>
TransferOrchestrator::co_resolveTool(std::string tool) {
  std::string error;
  try {
    co_return Result<ValidatedTool>::ok(co_await resolver_.co_resolve(tool));
  } catch (const std::exception &e) {
    error = failureMessage(e);
  }

  spdlog::error("{}", error);
  co_return Result<ValidatedTool>::fail(std::move(error));
}

Result<std::vector<DatabaseFile>>
TransferOrchestrator::listDatabaseFiles(const std::string &device, DeviceType type, const std::string &package) {
  return common::co_spawn_run_ret<Result<std::vector<DatabaseFile>>>([&]() {
    return co_listDatabaseFiles(device, type, package);
  });
}

Result<std::string>
TransferOrchestrator::pullDatabaseFile(const std::string &device, DeviceType type, const std::string &package,
    const std::string &remote, bool admin) {
  return common::co_spawn_run_ret<Result<std::string>>([&]() {
    return co_pullDatabaseFile(device, type, package, remote, admin);
  });
}

Result<Unit>
TransferOrchestrator::pushDatabaseFile(const std::string &device, DeviceType type, const std::string &package,
    const std::filesystem::path &local, const std::string &remote) {
  return common::co_spawn_run_ret<Result<Unit>>([&]() {
    return co_pushDatabaseFile(device, type, package, local, remote);
  });
}

Result<ValidatedTool> TransferOrchestrator::resolveTool(const std::string &tool) {
  return common::co_spawn_run_ret<Result<ValidatedTool>>([&]() {
    return co_resolveTool(tool);
  });
}

Result<Unit> TransferOrchestrator::touch(const std::filesystem::path &local) {
  try {
    scratch_.touch(local);
    return Result<Unit>::ok({});
  } catch (const std::exception &e) {
    spdlog::error("touch failed: {}", e.what());
    return Result<Unit>::fail(e.what());
  }
}

Result<size_t> TransferOrchestrator::cleanStale() {
  try {
    return Result<size_t>::ok(scratch_.cleanStale(staleMaxAge_));
  } catch (const std::exception &e) {
    spdlog::error("stale clean failed: {}", e.what());
    return Result<size_t>::fail(e.what());
  }
}

Result<Unit> TransferOrchestrator::forceClean() {
  try {
    scratch_.forceClean();
    return Result<Unit>::ok({});
  } catch (const std::exception &e) {
    spdlog::error("clean failed: {}", e.what());
    return Result<Unit>::fail(e.what());
  }
}

#ifdef ENABLE_TEST
#include "transfer-orchestrator_tests.cc"
#endif

} // namespace db_transfer
