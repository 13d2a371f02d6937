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
#include "tools/tool-resolver.h"
#include "scratch/scratch-dir.h"
#include "process/process-runner.h"
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include <asio/awaitable.hpp>

namespace db_transfer {

enum class PushState {
  Idle,
  ValidatingSource,
  BackingUp,
  Writing,
  Verifying,
  Committed,
  RolledBack,
};

std::string_view stringifyState(PushState state);

using PushObserver = std::function<void(PushState)>;

// copies src over dst, throws on failure
using FileWriter = std::function<void(const std::filesystem::path &, const std::filesystem::path &)>;

void overwriteFile(const std::filesystem::path &src, const std::filesystem::path &dst);

constexpr std::string_view BACKUP_SUFFIX = ".backup";

/// Replace `dest` with `source` on the local filesystem.
///
/// The destination is backed up to <dest>.backup before it is written. Any
/// failure after that point restores the backup and rethrows the original error.
/// If the restore itself fails the backup is left in place and rollback_failed
/// names it. Otherwise the backup never outlives the call. Returns the terminal
/// state (Committed).
PushState pushLocalFile(
    const std::filesystem::path &source,
    const std::filesystem::path &dest,
    const PushObserver &observer = {},
    const FileWriter &writer = overwriteFile);

// Simulator containers live on the host, files are read and written in place.
class IosSimulatorTransfer {
public:
  IosSimulatorTransfer(
      tool_resolver::ToolResolver &resolver,
      process_lib::CommandRunner &runner,
      scratch::ScratchDirectory &scratch);

  asio::awaitable<std::filesystem::path>
  co_appContainer(std::string device, std::string package);

  asio::awaitable<std::vector<DatabaseFile>>
  co_listDatabaseFiles(std::string device, std::string package);

  // isolated copy in the scratch directory, with its sidecar
  asio::awaitable<std::filesystem::path>
  co_pullCopy(std::string device, std::string package, std::string remote);

  asio::awaitable<void>
  co_push(std::filesystem::path local, std::string remote);

private:
  tool_resolver::ToolResolver &resolver_;
  process_lib::CommandRunner &runner_;
  scratch::ScratchDirectory &scratch_;
};

} // namespace db_transfer
