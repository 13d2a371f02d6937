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
#include "ios-simulator-transfer.h"
#include "sqlite-file.h"
#include "transfer-metadata.h"
#include "common/string-utils.h"
#include <asio.hpp>
#include <exception>
#include <format>
#include <spdlog/spdlog.h>

namespace db_transfer {

namespace fs = std::filesystem;
using asio::awaitable;

std::string_view stringifyState(PushState state) {
  switch (state) {
  case PushState::Idle: return "idle";
  case PushState::ValidatingSource: return "validating-source";
  case PushState::BackingUp: return "backing-up";
  case PushState::Writing: return "writing";
  case PushState::Verifying: return "verifying";
  case PushState::Committed: return "committed";
  case PushState::RolledBack: return "rolled-back";
  }
  return "unknown";
}

void overwriteFile(const fs::path &src, const fs::path &dst) {
  fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
}

PushState pushLocalFile(
    const fs::path &source,
    const fs::path &dest,
    const PushObserver &observer,
    const FileWriter &writer) {
  auto enter = [&](PushState state) {
    spdlog::debug("push {}: {}", dest.string(), stringifyState(state));
    if (observer) {
      observer(state);
    }
  };

  std::error_code ec;
  if (fs::equivalent(source, dest, ec)) {
    enter(PushState::Committed);
    return PushState::Committed;
  }

  const auto backup = fs::path(dest.string() + std::string(BACKUP_SUFFIX));
  bool backed_up = false;

  try {
    enter(PushState::ValidatingSource);
    validatePushSource(source);

    enter(PushState::BackingUp);
    if (!fs::is_regular_file(dest, ec)) {
      throw transfer_error(std::format("destination does not exist: {}", dest.string()),
          transfer_error::destination_missing);
    }
    fs::copy_file(dest, backup, fs::copy_options::overwrite_existing);
    backed_up = true;

    enter(PushState::Writing);
    writer(source, dest);

    enter(PushState::Verifying);
    auto size = fs::file_size(dest, ec);
    if (ec || size == 0) {
      throw transfer_error(std::format("{} is missing or empty after write", dest.string()),
          transfer_error::verification_failed);
    }
  } catch (const std::exception &e) {
    if (backed_up) {
      std::error_code restore_ec;
      fs::copy_file(backup, dest, fs::copy_options::overwrite_existing, restore_ec);
      if (restore_ec) {
        // the backup is now the only good copy, leave it in place
        spdlog::error("restoring {} from {} failed: {}", dest.string(), backup.string(), restore_ec.message());
        throw transfer_error(
            std::format("{}; restoring {} failed ({}), original kept at {}",
                e.what(), dest.string(), restore_ec.message(), backup.string()),
            transfer_error::rollback_failed);
      }
      spdlog::warn("push to {} failed, original restored: {}", dest.string(), e.what());
      fs::remove(backup, restore_ec);
    }
    enter(PushState::RolledBack);
    throw;
  }

  fs::remove(backup, ec);
  if (ec) {
    spdlog::warn("cannot remove {}: {}", backup.string(), ec.message());
  }

  enter(PushState::Committed);
  spdlog::info("pushed {} to {}", source.string(), dest.string());
  return PushState::Committed;
}

IosSimulatorTransfer::IosSimulatorTransfer(
    tool_resolver::ToolResolver &resolver,
    process_lib::CommandRunner &runner,
    scratch::ScratchDirectory &scratch)
: resolver_(resolver),
  runner_(runner),
  scratch_(scratch)
{}

awaitable<fs::path>
IosSimulatorTransfer::co_appContainer(std::string device, std::string package) {
  auto xcrun = (co_await resolver_.co_resolve("xcrun")).absolutePath;
  auto result = co_await runner_.co_run(xcrun, {"simctl", "get_app_container", device, package, "data"});

  auto container = common::trim(result.out);
  if (!result.succeeded() || container.empty()) {
    throw transfer_error(
        std::format("no data container for {} on simulator {}: {}", package, device, common::trim(result.err)),
        transfer_error::remote_command_failed);
  }
  co_return fs::path(container);
}

awaitable<std::vector<DatabaseFile>>
IosSimulatorTransfer::co_listDatabaseFiles(std::string device, std::string package) {
  auto container = co_await co_appContainer(device, package);

  std::vector<DatabaseFile> out;
  std::error_code ec;
  fs::recursive_directory_iterator it(container, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    throw transfer_error(std::format("cannot read container {}: {}", container.string(), ec.message()),
        transfer_error::remote_command_failed);
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      spdlog::debug("skipping unreadable entry under {}: {}", container.string(), ec.message());
      ec.clear();
      continue;
    }

    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || !has_database_extension(it->path().filename().string())) {
      continue;
    }

    DatabaseFile file;
    file.localPath = it->path();
    file.remotePath = it->path().string();
    file.packageId = package;
    file.deviceType = DeviceType::IosSimulator;
    file.location = it->path().parent_path().string();
    file.filename = it->path().filename().string();
    out.push_back(std::move(file));
  }

  spdlog::debug("{}: {} database files in {}", device, out.size(), container.string());
  co_return out;
}

awaitable<fs::path>
IosSimulatorTransfer::co_pullCopy(std::string device, std::string package, std::string remote) {
  auto batch = scratch_.lockBatch();
  scratch_.ensure();

  auto local = localPathFor(scratch_, device, remote);
  std::error_code ec;
  fs::copy_file(remote, local, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    std::error_code remove_ec;
    fs::remove(local, remove_ec);
    throw transfer_error(std::format("cannot copy {}: {}", remote, ec.message()),
        transfer_error::remote_command_failed);
  }

  acceptPulledFile(local);
  writeMetadata(local, {device, package, remote, iso8601Now()});
  spdlog::info("copied {} from simulator {} to {}", remote, device, local.string());
  co_return local;
}

awaitable<void>
IosSimulatorTransfer::co_push(fs::path local, std::string remote) {
  pushLocalFile(local, remote);
  co_return;
}

#ifdef ENABLE_TEST
#include "ios-simulator-transfer_tests.cc"
#endif

} // namespace db_transfer
