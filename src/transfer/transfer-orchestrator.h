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
#include "transfer-types.h"
#include "android-transfer.h"
#include "ios-simulator-transfer.h"
#include "ios-device-transfer.h"
#include "common/result.h"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <asio/awaitable.hpp>

namespace db_transfer {

using common::Result;
using common::Unit;

/// Entry point for the UI layer.
///
/// Dispatches each request to the protocol of the device class and reports
/// every outcome as a Result; nothing thrown below escapes these methods.
/// A tool that cannot be resolved is reported together with instructions for
/// installing it.
class TransferOrchestrator {
public:
  TransferOrchestrator(
      tool_resolver::ToolResolver &resolver,
      process_lib::CommandRunner &runner,
      scratch::ScratchDirectory &scratch,
      std::chrono::seconds staleMaxAge = scratch::DEFAULT_MAX_AGE);

  asio::awaitable<Result<std::vector<DatabaseFile>>>
  co_listDatabaseFiles(std::string device, DeviceType type, std::string package);

  Result<std::vector<DatabaseFile>>
  listDatabaseFiles(const std::string &device, DeviceType type, const std::string &package);

  // local path of the pulled copy
  asio::awaitable<Result<std::string>>
  co_pullDatabaseFile(std::string device, DeviceType type, std::string package, std::string remote, bool admin);

  Result<std::string>
  pullDatabaseFile(const std::string &device, DeviceType type, const std::string &package,
      const std::string &remote, bool admin);

  asio::awaitable<Result<Unit>>
  co_pushDatabaseFile(std::string device, DeviceType type, std::string package,
      std::filesystem::path local, std::string remote);

  Result<Unit>
  pushDatabaseFile(const std::string &device, DeviceType type, const std::string &package,
      const std::filesystem::path &local, const std::string &remote);

  asio::awaitable<Result<tool_resolver::ValidatedTool>>
  co_resolveTool(std::string tool);

  Result<tool_resolver::ValidatedTool> resolveTool(const std::string &tool);

  Result<Unit> touch(const std::filesystem::path &local);

  // number of files removed
  Result<size_t> cleanStale();

  Result<Unit> forceClean();

private:
  tool_resolver::ToolResolver &resolver_;
  scratch::ScratchDirectory &scratch_;
  std::chrono::seconds staleMaxAge_;

  AndroidTransfer android_;
  IosSimulatorTransfer simulator_;
  IosDeviceTransfer device_;

  std::string failureMessage(const std::exception &e) const;
};

} // namespace db_transfer
