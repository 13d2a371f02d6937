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
#include "process-runner.h"
#include "process.h"
#include "process-output.h"
#include "common/string-utils.h"
#include "common/co-spawn-run.h"
#include <asio.hpp>
#include <format>
#include <memory>
#include <thread>
#include <system_error>
#include <spdlog/spdlog.h>

namespace process_lib {

using asio::awaitable;

namespace {

ProcessResult
run_blocking(
    const std::filesystem::path &program,
    const std::vector<std::string> &args,
    const RunOptions &options) {
  auto command = describe_command(program, args);

  StringOutputReader out;
  StringOutputReader err;
  std::unique_ptr<FileOutputReader> file_out;

  if (options.stdoutFile) {
    file_out = std::make_unique<FileOutputReader>(*options.stdoutFile);
    if (!file_out->isOpen()) {
      throw process_error(std::format("cannot open {} for writing", options.stdoutFile->string()));
    }
  }

  ProcessOutputReader &out_reader = file_out ? static_cast<ProcessOutputReader&>(*file_out) : out;

  Process process(program, args, out_reader, err);
  if (!process.started()) {
    auto reason = std::system_category().message(process.spawnError());
    spdlog::debug("exec: {} -> spawn failed: {}", command, reason);
    throw spawn_error(std::format("failed to start {}: {}", program.string(), reason), process.spawnError());
  }

  int status = 0;
  if (options.timeout) {
    if (!process.wait(status, static_cast<long>(options.timeout->count()))) {
      process.kill();
      process.wait();
      spdlog::debug("exec: {} -> timeout after {}ms", command, options.timeout->count());
      throw timeout_error(std::format("{} did not finish within {} seconds",
          program.filename().string(),
          std::chrono::duration_cast<std::chrono::seconds>(*options.timeout).count()));
    }
  } else {
    status = process.wait();
  }

  ProcessResult result;
  result.out = out.take();
  result.err = err.take();
  result.exitCode = status;
  result.signaled = process.terminatedBySignal();

  spdlog::debug("exec: {} -> {}", command, status);
  if (auto text = common::trim(result.err); !text.empty()) {
    // informational for tools such as adb, never a failure on its own
    spdlog::debug("stderr: {}", text);
  }

  if (file_out && file_out->failed()) {
    throw process_error(std::format("writing {} failed", options.stdoutFile->string()));
  }

  return result;
}

// the blocking wait runs on its own thread, completion is posted back to the caller's executor
template<typename CompletionToken = asio::use_awaitable_t<>>
auto async_run(
    std::filesystem::path program,
    std::vector<std::string> args,
    RunOptions options,
    CompletionToken&& token = {}) {
  auto initiate = [program = std::move(program), args = std::move(args), options = std::move(options)]
    <typename Handler>(Handler&& handler) mutable
    {
      auto work = asio::make_work_guard(asio::get_associated_executor(handler));
      auto self = std::make_shared<std::decay_t<Handler>>(std::forward<Handler>(handler));

      std::thread([self, work = std::move(work), program, args, options]() mutable {
        std::exception_ptr error;
        ProcessResult result;
        try {
          result = run_blocking(program, args, options);
        } catch (const std::exception &) {
          error = std::current_exception();
        }

        auto ex = work.get_executor();
        asio::post(ex, [self, error, result = std::move(result)]() mutable {
          (*self)(error, std::move(result));
        });
        work.reset();
      }).detach();
    };

  return asio::async_initiate<CompletionToken, void(std::exception_ptr, ProcessResult)>(
      std::move(initiate), token);
}

} // namespace

awaitable<ProcessResult>
co_run(std::filesystem::path program,
    std::vector<std::string> args,
    RunOptions options) {
  co_return co_await async_run(std::move(program), std::move(args), std::move(options));
}

ProcessResult
run(const std::filesystem::path &program,
    const std::vector<std::string> &args,
    const RunOptions &options) {
  return common::co_spawn_run_ret<ProcessResult>([&]() {
    return co_run(program, args, options);
  });
}

void spawn_detached(
    const std::filesystem::path &program,
    const std::vector<std::string> &args) {
  Process process(program, args, Process::detached);
  if (!process.started()) {
    auto reason = std::system_category().message(process.spawnError());
    throw spawn_error(std::format("failed to start {}: {}", program.string(), reason), process.spawnError());
  }
  spdlog::debug("spawned: {}", describe_command(program, args));
}

awaitable<ProcessResult>
ProcessCommandRunner::co_run(
    std::filesystem::path program,
    std::vector<std::string> args,
    RunOptions options) {
  co_return co_await process_lib::co_run(std::move(program), std::move(args), std::move(options));
}

void ProcessCommandRunner::spawnDetached(
    const std::filesystem::path &program,
    const std::vector<std::string> &args) {
  spawn_detached(program, args);
}

#ifdef ENABLE_TEST

#ifndef _WIN32

TEST(ProcessRunner, RunCapturesOutput) {
  auto result = run("/bin/sh", {"-c", "echo line1; echo warn 1>&2"});
  ASSERT_EQ(result.exitCode, 0);
  ASSERT_EQ(result.out, "line1\n");
  ASSERT_EQ(result.err, "warn\n");
}

TEST(ProcessRunner, NonZeroExitIsNotAnException) {
  auto result = run("/bin/sh", {"-c", "exit 4"});
  ASSERT_FALSE(result.succeeded());
  ASSERT_EQ(result.exitCode, 4);
}

TEST(ProcessRunner, SpawnFailureIsDistinct) {
  try {
    run("/definitely/not/here/adb", {"devices"});
    FAIL() << "expected spawn_error";
  } catch (const spawn_error &e) {
    ASSERT_EQ(e.code, ENOENT);
  }
}

TEST(ProcessRunner, TimeoutRaises) {
  ASSERT_THROW(
    run("/bin/sh", {"-c", "sleep 10"}, RunOptions{std::chrono::milliseconds(200), std::nullopt}),
    timeout_error);
}

TEST(ProcessRunner, StdoutRedirectedToFile) {
  test::TempDir dir;
  auto target = dir.path() / "out.bin";
  auto result = run("/bin/sh", {"-c", "printf 'SQLite format 3'; exit 1"},
      RunOptions{std::nullopt, target});
  ASSERT_EQ(result.exitCode, 1);
  ASSERT_TRUE(result.out.empty());
  ASSERT_EQ(test::readFile(target), "SQLite format 3");
}

TEST(ProcessRunner, AwaitableRunsOnCallerContext) {
  asio::io_context ctx;
  ProcessResult result;
  asio::co_spawn(ctx, [&]() -> awaitable<void> {
    ProcessCommandRunner runner;
    result = co_await runner.co_run("/bin/sh", {"-c", "printf ok"});
  }, asio::detached);
  ctx.run();
  ASSERT_EQ(result.out, "ok");
}

#endif

#endif // ENABLE_TEST

} // namespace process_lib
