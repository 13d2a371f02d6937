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
#include <array>
#include <string>
#include <string_view>
#include <vector>
#include <asio/awaitable.hpp>

namespace db_transfer {

struct AndroidLocation {
  std::string_view root;
  bool admin;
};

// scanned in order, the first root that yields files wins
constexpr std::array ANDROID_DB_LOCATIONS = {
  AndroidLocation{"/data/data/", true},
  AndroidLocation{"/sdcard/Android/data/", false},
  AndroidLocation{"/storage/emulated/0/Android/data/", false},
};

constexpr std::string_view ANDROID_STAGING_DIR = "/data/local/tmp/";

// run-as and adb exit non-zero (255 included) on harmless conditions once the
// bytes landed; a signal-terminated transfer may have left a truncated file
bool isBenignElevationExit(const process_lib::ProcessResult &result);

// shared storage accepts a direct adb push
bool isSharedStoragePath(std::string_view remote);

// find(1) output from the device, keeping database files only
std::vector<std::string> parseFindOutput(std::string_view output);

class AndroidTransfer {
public:
  AndroidTransfer(
      tool_resolver::ToolResolver &resolver,
      process_lib::CommandRunner &runner,
      scratch::ScratchDirectory &scratch);

  asio::awaitable<std::vector<DatabaseFile>>
  co_listDatabaseFiles(std::string device, DeviceType type, std::string package);

  asio::awaitable<std::filesystem::path>
  co_pull(std::string device, std::string package, std::string remote, bool admin);

  asio::awaitable<void>
  co_push(std::string device, std::string package, std::filesystem::path local, std::string remote);

private:
  tool_resolver::ToolResolver &resolver_;
  process_lib::CommandRunner &runner_;
  scratch::ScratchDirectory &scratch_;

  asio::awaitable<std::vector<std::string>>
  co_find(const std::filesystem::path &adb, const std::string &device, const std::string &package, AndroidLocation location);

  // caller holds the scratch batch lock
  asio::awaitable<std::filesystem::path>
  co_pullLocked(const std::filesystem::path &adb, const std::string &device, const std::string &package,
      const std::string &remote, bool admin);
};

} // namespace db_transfer
