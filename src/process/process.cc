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
#include "process.h"
#include "process-output.h"
#include "common/string-utils.h"
#include <filesystem>
#ifdef _WIN32
#include "process-win.cc"
#else
#include "process-unix.cc"
#endif

namespace process_lib {

std::filesystem::path
search_exe_path(const std::filesystem::path &exe) {
  return search_exe_path(exe, get_sys_paths());
}

std::filesystem::path
search_exe_path(const std::filesystem::path &exe, const std::vector<std::filesystem::path> &sys_paths) {
  if (exe.is_absolute()) {
    return exe;
  }

#if defined(_WIN32)
  bool has_ext = exe.has_extension();
#endif

  for (auto & sys : sys_paths) {
    auto path = sys / exe;
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec)) {
      return path;
    }

#if defined(_WIN32)
    if (!has_ext) {
      for (auto *ext : {".exe", ".cmd", ".bat"}) {
        auto path = sys / (exe.string() + ext);
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
          return path;
        }
      }
    }
#endif
  }

  return std::filesystem::path();
}

std::string
describe_command(const std::filesystem::path &program, const std::vector<std::string> &args) {
  std::vector<std::string> parts;
  parts.push_back(program.string());
  parts.insert(parts.end(), args.begin(), args.end());
  for (auto &part : parts) {
    if (part.find_first_of(" \t") != std::string::npos) {
      part = "\"" + part + "\"";
    }
  }
  return common::join(parts, " ");
}

Process::FileHandle::FileHandle(fd_type fd)
: fd_(fd)
{}

Process::Process(
    const std::filesystem::path &program,
    const std::vector<std::string> &args,
    ProcessOutputReader &read_stdout,
    ProcessOutputReader &read_stderr,
    const std::filesystem::path &workDir) noexcept {
  if (open(program, args, workDir, true)) {
    closed_ = false;
    started_ = true;

    asyncRead(read_stdout, read_stderr);
  }
}

Process::Process(
    const std::filesystem::path &program,
    const std::vector<std::string> &args,
    detach_t) noexcept {
  if (open(program, args, {}, false)) {
    started_ = true;
    closeProcessHandle();
  }
}

Process::~Process() noexcept {
  closeFDs();
}

void Process::closeHandles() noexcept {
  {
    std::lock_guard lk(close_mutex);
    closeProcessHandle();
    closed_ = true;
  }

  closeFDs();
}

void Process::closeFDs() noexcept {
  if(stdout_thread.joinable())
    stdout_thread.join();
  if(stderr_thread.joinable())
    stderr_thread.join();

  stdoutFd_.reset();
  stderrFd_.reset();
}

void Process::asyncRead(
    ProcessOutputReader &read_stdout,
    ProcessOutputReader &read_stderr) noexcept {
  auto pump = [](FileHandle &fd, ProcessOutputReader &reader) {
    size_t buffer_size, n;
    for (;;) {
      auto *ptr = reader.allocateReadBuffer(buffer_size);
      if (!ptr || !buffer_size) {
        break;
      }

      if (!fd.read(ptr, buffer_size, n)) {
        break;
      }

      reader.commitReadBuffer(n);
    }

    reader.commitReadBuffer(0);
  };

  if (stdoutFd_) {
    stdout_thread = std::thread([this, &read_stdout, pump]() {
      pump(*stdoutFd_, read_stdout);
    });
  }

  if (stderrFd_) {
    stderr_thread = std::thread([this, &read_stderr, pump]() {
      pump(*stderrFd_, read_stderr);
    });
  }
}

#ifdef ENABLE_TEST

TEST(Process, DescribeCommandQuotesBlanks) {
  auto line = describe_command("/usr/bin/adb", {"-s", "emulator-5554", "shell", "run-as com.a cat /x y"});
  ASSERT_EQ(line, "/usr/bin/adb -s emulator-5554 shell \"run-as com.a cat /x y\"");
}

TEST(Process, SearchExePathReturnsAbsoluteUnchanged) {
  std::filesystem::path abs = std::filesystem::temp_directory_path() / "no-such-tool";
  ASSERT_EQ(search_exe_path(abs, {}).string(), abs.string());
}

#ifndef _WIN32

TEST(Process, SysPathsSkipEmptyEntries) {
  std::string saved = ::getenv("PATH") ? ::getenv("PATH") : "";
  ::setenv("PATH", "/usr/bin::/bin:", 1);
  auto paths = get_sys_paths();
  ::setenv("PATH", saved.c_str(), 1);
  ASSERT_EQ(paths.size(), 2u);
  ASSERT_EQ(paths[0].string(), "/usr/bin");
  ASSERT_EQ(paths[1].string(), "/bin");
}

TEST(Process, CapturesStdoutAndExitCode) {
  StringOutputReader out, err;
  Process process("/bin/sh", {"-c", "printf hello; printf oops 1>&2; exit 3"}, out, err);
  ASSERT_TRUE(process.started());
  ASSERT_EQ(process.wait(), 3);
  ASSERT_EQ(out.take(), "hello");
  ASSERT_EQ(err.take(), "oops");
}

TEST(Process, MissingProgramIsSpawnError) {
  StringOutputReader out, err;
  Process process("/nonexistent/dir/tool", {"--help"}, out, err);
  ASSERT_FALSE(process.started());
  ASSERT_EQ(process.spawnError(), ENOENT);
}

TEST(Process, TimedWaitExpires) {
  StringOutputReader out, err;
  Process process("/bin/sh", {"-c", "sleep 5"}, out, err);
  ASSERT_TRUE(process.started());
  int status = 0;
  ASSERT_FALSE(process.wait(status, 100));
  process.kill();
  ASSERT_EQ(process.wait(), Process::SIGNAL_EXIT_BASE + SIGTERM);
  ASSERT_TRUE(process.terminatedBySignal());
}

TEST(Process, HighExitCodeIsNotASignal) {
  StringOutputReader out, err;
  Process process("/bin/sh", {"-c", "exit 255"}, out, err);
  ASSERT_EQ(process.wait(), 255);
  ASSERT_FALSE(process.terminatedBySignal());
}

TEST(Process, TimedWaitReturnsExitCode) {
  StringOutputReader out, err;
  Process process("/bin/sh", {"-c", "exit 7"}, out, err);
  int status = 0;
  ASSERT_TRUE(process.wait(status, 5000));
  ASSERT_EQ(status, 7);
}

#endif

#endif // ENABLE_TEST

} // namespace process_lib
