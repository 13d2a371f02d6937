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
#include "android-transfer.h"
#include "sqlite-file.h"
#include "transfer-metadata.h"
#include "process/process.h"
#include "common/string-utils.h"
#include <asio.hpp>
#include <format>
#include <spdlog/spdlog.h>

namespace db_transfer {

using asio::awaitable;
using process_lib::RunOptions;

namespace {

std::vector<std::string> find_args(const std::string &dir) {
  return {
    "find", dir,
    "-name", "'*.db'", "-o",
    "-name", "'*.sqlite'", "-o",
    "-name", "'*.sqlite3'",
  };
}

std::string command_failure(std::string_view what, const process_lib::ProcessResult &r) {
  auto detail = common::trim(r.err);
  if (detail.empty()) {
    detail = common::trim(r.out);
  }
  return std::format("{} failed (exit {}): {}", what, r.exitCode, detail);
}

} // namespace

bool isBenignElevationExit(const process_lib::ProcessResult &result) {
  return !result.signaled && result.exitCode >= 0;
}

bool isSharedStoragePath(std::string_view remote) {
  return common::contains(remote, "sdcard") || common::contains(remote, "external");
}

std::vector<std::string> parseFindOutput(std::string_view output) {
  std::vector<std::string> files;
  for (auto &line : common::split_lines(output)) {
    if (common::contains(line, "No such file") ||
        common::contains(line, "Permission denied") ||
        common::contains(line, "run-as:")) {
      continue;
    }
    if (has_database_extension(line)) {
      files.push_back(line);
    }
  }
  return files;
}

AndroidTransfer::AndroidTransfer(
    tool_resolver::ToolResolver &resolver,
    process_lib::CommandRunner &runner,
    scratch::ScratchDirectory &scratch)
: resolver_(resolver),
  runner_(runner),
  scratch_(scratch)
{}

awaitable<std::vector<std::string>>
AndroidTransfer::co_find(const std::filesystem::path &adb, const std::string &device, const std::string &package, AndroidLocation location) {
  auto dir = std::format("{}{}/", location.root, package);

  std::vector<std::string> args = {"-s", device, "shell"};
  if (location.admin) {
    args.insert(args.end(), {"run-as", package});
  }
  auto find = find_args(dir);
  args.insert(args.end(), find.begin(), find.end());

  auto result = co_await runner_.co_run(adb, std::move(args));
  // find exits 1 when some branches are unreadable but still lists the rest
  auto files = parseFindOutput(result.out);
  spdlog::debug("{}: {} database files under {}", device, files.size(), dir);
  co_return files;
}

awaitable<std::filesystem::path>
AndroidTransfer::co_pullLocked(const std::filesystem::path &adb, const std::string &device, const std::string &package,
    const std::string &remote, bool admin) {
  scratch_.ensure();
  auto local = localPathFor(scratch_, device, remote);

  std::error_code ec;
  std::filesystem::remove(local, ec);

  if (admin) {
    // run-as has no two-argument copy, stream the bytes straight into the local file
    auto result = co_await runner_.co_run(adb,
        {"-s", device, "exec-out", "run-as", package, "cat", remote},
        RunOptions{std::nullopt, local});

    auto size = std::filesystem::file_size(local, ec);
    if (ec || size == 0) {
      std::filesystem::remove(local, ec);
      throw transfer_error(command_failure(std::format("run-as pull of {}", remote), result),
          transfer_error::remote_command_failed);
    }

    if (!result.succeeded()) {
      if (!isBenignElevationExit(result)) {
        std::filesystem::remove(local, ec);
        throw transfer_error(command_failure(std::format("run-as pull of {}", remote), result),
            transfer_error::remote_command_failed);
      }
      spdlog::debug("run-as exited with {} but {} arrived, accepting", result.exitCode, local.string());
    }
  } else {
    auto result = co_await runner_.co_run(adb, {"-s", device, "pull", remote, local.string()});
    if (!result.succeeded()) {
      std::filesystem::remove(local, ec);
      throw transfer_error(command_failure(std::format("adb pull of {}", remote), result),
          transfer_error::remote_command_failed);
    }
  }

  acceptPulledFile(local);
  writeMetadata(local, {device, package, remote, iso8601Now()});
  spdlog::info("pulled {} from {} to {}", remote, device, local.string());
  co_return local;
}

awaitable<std::vector<DatabaseFile>>
AndroidTransfer::co_listDatabaseFiles(std::string device, DeviceType type, std::string package) {
  auto adb = (co_await resolver_.co_resolve("adb")).absolutePath;

  auto batch = scratch_.lockBatch();
  // a new scan must never pick up a file from an earlier device or package
  scratch_.forceClean();

  std::vector<DatabaseFile> out;

  for (auto location : ANDROID_DB_LOCATIONS) {
    auto remotes = co_await co_find(adb, device, package, location);
    if (remotes.empty()) {
      continue;
    }

    for (auto &remote : remotes) {
      DatabaseFile file;
      file.remotePath = remote;
      file.packageId = package;
      file.deviceType = type;
      file.location = std::string(location.root);
      file.filename = remote_filename(remote);

      try {
        file.localPath = co_await co_pullLocked(adb, device, package, remote, location.admin);
      } catch (const std::runtime_error &e) {
        // listed anyway so the file can be retried
        spdlog::warn("pull of {} failed: {}", remote, e.what());
        file.localPath = remote;
      }

      out.push_back(std::move(file));
    }
    break;
  }

  co_return out;
}

awaitable<std::filesystem::path>
AndroidTransfer::co_pull(std::string device, std::string package, std::string remote, bool admin) {
  auto adb = (co_await resolver_.co_resolve("adb")).absolutePath;
  auto batch = scratch_.lockBatch();
  co_return co_await co_pullLocked(adb, device, package, remote, admin);
}

awaitable<void>
AndroidTransfer::co_push(std::string device, std::string package, std::filesystem::path local, std::string remote) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(local, ec)) {
    throw transfer_error(std::format("local file not found: {}", local.string()), transfer_error::local_file_missing);
  }

  auto adb = (co_await resolver_.co_resolve("adb")).absolutePath;

  if (isSharedStoragePath(remote)) {
    auto result = co_await runner_.co_run(adb, {"-s", device, "push", local.string(), remote});
    if (!result.succeeded()) {
      throw transfer_error(command_failure("adb push", result), transfer_error::remote_command_failed);
    }
    spdlog::info("pushed {} to {}:{}", local.string(), device, remote);
    co_return;
  }

  auto staging = std::format("{}{}", ANDROID_STAGING_DIR, local.filename().string());

  auto staged = co_await runner_.co_run(adb, {"-s", device, "push", local.string(), staging});
  if (!staged.succeeded()) {
    throw transfer_error(command_failure(std::format("adb push to {}", staging), staged),
        transfer_error::remote_command_failed);
  }

  std::exception_ptr failure;
  try {
    auto copied = co_await runner_.co_run(adb, {"-s", device, "shell", "run-as", package, "cp", staging, remote});
    if (!copied.succeeded()) {
      throw transfer_error(command_failure(std::format("run-as copy to {}", remote), copied),
          transfer_error::remote_command_failed);
    }
  } catch (const std::exception &) {
    failure = std::current_exception();
  }

  // the staging copy goes away whatever happened
  try {
    auto removed = co_await runner_.co_run(adb, {"-s", device, "shell", "rm", staging});
    if (!removed.succeeded()) {
      spdlog::warn("could not remove {} on {}: {}", staging, device, common::trim(removed.err));
    }
  } catch (const process_lib::process_error &e) {
    spdlog::warn("could not remove {} on {}: {}", staging, device, e.what());
  }

  if (failure) {
    std::rethrow_exception(failure);
  }

  spdlog::info("pushed {} to {}:{} via {}", local.string(), device, remote, staging);
}

#ifdef ENABLE_TEST
#include "android-transfer_tests.cc"
#endif

} // namespace db_transfer
