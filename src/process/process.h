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

#pragma  once

#include <string>
#include <vector>
#include <mutex>
#include <thread>
#include <memory>
#ifndef _WIN32
#include <sys/wait.h>
#endif
#include <filesystem>
#include <cstdint>

namespace process_lib {

class ProcessOutputReader {
public:
  virtual ~ProcessOutputReader() {}
  virtual void *allocateReadBuffer(size_t &buffer_size) = 0;
  virtual void commitReadBuffer(size_t count) = 0;
};

class Process {
public:
#ifdef _WIN32
  typedef void *fd_type;
  typedef std::wstring string_type;
#else
  typedef int fd_type;
  typedef std::string string_type;
#endif

private:
  class FileHandle {
  public:
    FileHandle(fd_type);
    FileHandle(const FileHandle&) = delete;
    FileHandle(FileHandle&&) = delete;
    ~FileHandle();

    bool read(void *buf, size_t size, size_t &got) noexcept;

  private:
    fd_type fd_;
  };

public:
  struct detach_t { explicit detach_t() = default; };
  static constexpr detach_t detached{};

  // exit status reported for a child terminated by a signal is 128 + signo
  static constexpr int SIGNAL_EXIT_BASE = 128;

  /// Run `program` with `args` (argv[0] is derived from program).
  /// stdout and stderr are drained on reader threads until the child exits.
  Process(
    const std::filesystem::path &program,
    const std::vector<std::string> &args,
    ProcessOutputReader &read_stdout,
    ProcessOutputReader &read_stderr,
    const std::filesystem::path &workDir = {}) noexcept;

  /// Start without waiting, stdio redirected to the null device.
  Process(
    const std::filesystem::path &program,
    const std::vector<std::string> &args,
    detach_t) noexcept;

  ~Process() noexcept;

  // false when the program never started, spawnError() has the OS error
  bool started() const noexcept { return started_; }
  int spawnError() const noexcept { return spawnError_; }

  // the last wait() reaped a child killed by a signal, never set on Windows
  bool terminatedBySignal() const noexcept { return signaled_; }

  void kill() noexcept;
  int wait() noexcept;
  bool wait(int &status, long ms) noexcept;

private:
#ifdef _WIN32
  void * procHandle_{nullptr};
  unsigned long dwProcessId_{0};
#else
  pid_t pid_{-1};
#endif
  bool closed_{true};
  bool started_{false};
  int spawnError_{0};
  bool signaled_{false};

  std::mutex close_mutex;
  std::thread stdout_thread, stderr_thread;

  std::unique_ptr<FileHandle> stdoutFd_;
  std::unique_ptr<FileHandle> stderrFd_;

  bool open(
    const std::filesystem::path &program,
    const std::vector<std::string> &args,
    const std::filesystem::path &workDir,
    bool redirect_output) noexcept;

  void asyncRead(
    ProcessOutputReader &read_stdout,
    ProcessOutputReader &read_stderr) noexcept;

  void closeFDs() noexcept;
  void closeHandles() noexcept;
  void closeProcessHandle() noexcept;
};

std::vector<std::filesystem::path>
get_sys_paths();

std::filesystem::path
search_exe_path(const std::filesystem::path &exe, const std::vector<std::filesystem::path> &sys_paths);

std::filesystem::path
search_exe_path(const std::filesystem::path &exe);

template <typename CharT>
void maybe_quote_arg(std::basic_string<CharT>& arg);

template <typename CharT>
std::basic_string<CharT> build_args(std::vector<std::basic_string<CharT>> && data) {
  std::basic_string<CharT> st;

  for(auto & arg : data) {
    if (arg.empty()) {
      arg.push_back(CharT('"'));
      arg.push_back(CharT('"'));
    } else {
      maybe_quote_arg<CharT>(arg);
    }

    if (!st.empty())
      st += CharT(' ');

    st += arg;
  }

  return st;
}

// single line for logs, args containing blanks are quoted
std::string
describe_command(const std::filesystem::path &program, const std::vector<std::string> &args);

} // namespace process_lib
