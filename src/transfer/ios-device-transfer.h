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
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include <asio/awaitable.hpp>

namespace db_transfer {

constexpr std::string_view IOS_DOCUMENTS_DIR = "Documents";

// afcclient reports a missing path with exit 0 on some builds
bool afcListingShowsFile(const process_lib::ProcessResult &result);

// Physical devices, through the app's Documents share over AFC.
class IosDeviceTransfer {
public:
  IosDeviceTransfer(
      tool_resolver::ToolResolver &resolver,
      process_lib::CommandRunner &runner,
      scratch::ScratchDirectory &scratch,
      std::chrono::seconds staleMaxAge = scratch::DEFAULT_MAX_AGE);

  // stale-cleans the scratch directory, then pulls every database in Documents
  asio::awaitable<std::vector<DatabaseFile>>
  co_listDatabaseFiles(std::string device, std::string package);

  asio::awaitable<std::filesystem::path>
  co_pull(std::string device, std::string package, std::string remote);

  asio::awaitable<void>
  co_push(std::string device, std::string package, std::filesystem::path local, std::string remote);

private:
  tool_resolver::ToolResolver &resolver_;
  process_lib::CommandRunner &runner_;
  scratch::ScratchDirectory &scratch_;
  std::chrono::seconds staleMaxAge_;

  asio::awaitable<process_lib::ProcessResult>
  co_afc(const std::filesystem::path &afc, const std::string &device, const std::string &package,
      std::vector<std::string> command);

  asio::awaitable<std::filesystem::path>
  co_pullLocked(const std::filesystem::path &afc, const std::string &device, const std::string &package,
      const std::string &remote);
};

} // namespace db_transfer
