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
#include "ios-device-transfer.h"
#include "sqlite-file.h"
#include "transfer-metadata.h"
#include "common/string-utils.h"
#include <asio.hpp>
#include <format>
#include <spdlog/spdlog.h>

namespace db_transfer {

using asio::awaitable;

namespace {

// afcclient diagnostics, as opposed to a listed path that happens to contain these words
bool is_afc_diagnostic(std::string_view line) {
  auto head = common::to_lower(line.substr(0, 6));
  return head == "error:" || head == "error " ||
         common::contains(line, "No such file") ||
         line.ends_with("not found");
}

} // namespace

bool afcListingShowsFile(const process_lib::ProcessResult &result) {
  if (!result.succeeded()) {
    return false;
  }
  for (auto &line : common::split_lines(result.out + "\n" + result.err)) {
    if (is_afc_diagnostic(line)) {
      return false;
    }
  }
  return true;
}

IosDeviceTransfer::IosDeviceTransfer(
    tool_resolver::ToolResolver &resolver,
    process_lib::CommandRunner &runner,
    scratch::ScratchDirectory &scratch,
    std::chrono::seconds staleMaxAge)
: resolver_(resolver),
  runner_(runner),
  scratch_(scratch),
  staleMaxAge_(staleMaxAge)
{}

awaitable<process_lib::ProcessResult>
IosDeviceTransfer::co_afc(const std::filesystem::path &afc, const std::string &device, const std::string &package,
    std::vector<std::string> command) {
  std::vector<std::string> args = {"--documents", package, "-u", device};
  args.insert(args.end(), command.begin(), command.end());
  co_return co_await runner_.co_run(afc, std::move(args));
}

awaitable<std::filesystem::path>
IosDeviceTransfer::co_pullLocked(const std::filesystem::path &afc, const std::string &device, const std::string &package,
    const std::string &remote) {
  scratch_.ensure();
  auto local = localPathFor(scratch_, device, remote);

  auto result = co_await co_afc(afc, device, package, {"get", remote, local.string()});
  if (!result.succeeded()) {
    std::error_code ec;
    std::filesystem::remove(local, ec);
    throw transfer_error(std::format("afcclient get {} failed (exit {}): {}", remote, result.exitCode,
        common::trim(result.err)), transfer_error::remote_command_failed);
  }

  acceptPulledFile(local);
  writeMetadata(local, {device, package, remote, iso8601Now()});
  spdlog::info("pulled {} from {} to {}", remote, device, local.string());
  co_return local;
}

awaitable<std::vector<DatabaseFile>>
IosDeviceTransfer::co_listDatabaseFiles(std::string device, std::string package) {
  auto afc = (co_await resolver_.co_resolve("afcclient")).absolutePath;

  auto batch = scratch_.lockBatch();
  scratch_.cleanStale(staleMaxAge_);

  std::vector<DatabaseFile> out;

  auto listing = co_await co_afc(afc, device, package, {"ls", std::string(IOS_DOCUMENTS_DIR)});
  if (!listing.succeeded()) {
    // some apps accept uploads but refuse directory browsing
    spdlog::warn("cannot list {} of {} on {}: {}", IOS_DOCUMENTS_DIR, package, device, common::trim(listing.err));
    co_return out;
  }

  for (auto &name : common::split_lines(listing.out)) {
    if (!has_database_extension(name)) {
      continue;
    }

    DatabaseFile file;
    file.remotePath = std::format("/{}/{}", IOS_DOCUMENTS_DIR, name);
    file.packageId = package;
    file.deviceType = DeviceType::IosDevice;
    file.location = std::string(IOS_DOCUMENTS_DIR);
    file.filename = name;

    try {
      file.localPath = co_await co_pullLocked(afc, device, package, file.remotePath);
    } catch (const std::runtime_error &e) {
      spdlog::warn("pull of {} failed: {}", file.remotePath, e.what());
      file.localPath = file.remotePath;
    }

    out.push_back(std::move(file));
  }

  co_return out;
}

awaitable<std::filesystem::path>
IosDeviceTransfer::co_pull(std::string device, std::string package, std::string remote) {
  auto afc = (co_await resolver_.co_resolve("afcclient")).absolutePath;
  auto batch = scratch_.lockBatch();
  co_return co_await co_pullLocked(afc, device, package, remote);
}

awaitable<void>
IosDeviceTransfer::co_push(std::string device, std::string package, std::filesystem::path local, std::string remote) {
  validatePushSource(local);

  auto afc = (co_await resolver_.co_resolve("afcclient")).absolutePath;

  auto existing = co_await co_afc(afc, device, package, {"ls", remote});
  if (!afcListingShowsFile(existing)) {
    throw transfer_error(std::format("{} does not exist on {}, nothing to replace", remote, device),
        transfer_error::destination_missing);
  }

  auto removed = co_await co_afc(afc, device, package, {"rm", remote});
  if (!removed.succeeded()) {
    spdlog::debug("afcclient rm {} exited with {}, uploading anyway", remote, removed.exitCode);
  }

  auto put = co_await co_afc(afc, device, package, {"put", local.string(), remote});
  if (!put.succeeded()) {
    throw transfer_error(std::format("afcclient put {} failed (exit {}): {}", remote, put.exitCode,
        common::trim(put.err)), transfer_error::remote_command_failed);
  }

  auto verified = co_await co_afc(afc, device, package, {"ls", remote});
  if (!afcListingShowsFile(verified)) {
    throw transfer_error(std::format("{} not present on {} after upload", remote, device),
        transfer_error::verification_failed);
  }

  spdlog::info("pushed {} to {}:{}", local.string(), device, remote);
}

#ifdef ENABLE_TEST
#include "ios-device-transfer_tests.cc"
#endif

} // namespace db_transfer
