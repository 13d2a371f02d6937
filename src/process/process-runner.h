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
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <asio/awaitable.hpp>

namespace process_lib {

class process_error : public std::runtime_error {
public:
  process_error(const std::string& arg): std::runtime_error(arg) {}
};

// the program never ran
class spawn_error : public process_error {
public:
  spawn_error(const std::string& arg, int c): process_error(arg), code(c) {}

  const int code;
};

class timeout_error : public process_error {
public:
  timeout_error(const std::string& arg): process_error(arg) {}
};

struct ProcessResult {
  std::string out;
  std::string err;
  int exitCode{0};
  // exitCode is then 128 + signo and no exit status exists
  bool signaled{false};

  bool succeeded() const { return exitCode == 0; }
};

struct RunOptions {
  std::optional<std::chrono::milliseconds> timeout;
  // stdout goes to this file instead of ProcessResult::out
  std::optional<std::filesystem::path> stdoutFile;
};

ProcessResult
run(const std::filesystem::path &program,
    const std::vector<std::string> &args,
    const RunOptions &options = {});

asio::awaitable<ProcessResult>
co_run(std::filesystem::path program,
    std::vector<std::string> args,
    RunOptions options = {});

void spawn_detached(
    const std::filesystem::path &program,
    const std::vector<std::string> &args);

// Seam between the transfer/discovery logic and real subprocesses.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  virtual asio::awaitable<ProcessResult>
  co_run(std::filesystem::path program,
      std::vector<std::string> args,
      RunOptions options = {}) = 0;

  virtual void spawnDetached(
      const std::filesystem::path &program,
      const std::vector<std::string> &args) = 0;
};

class ProcessCommandRunner : public CommandRunner {
public:
  asio::awaitable<ProcessResult>
  co_run(std::filesystem::path program,
      std::vector<std::string> args,
      RunOptions options = {}) override;

  void spawnDetached(
      const std::filesystem::path &program,
      const std::vector<std::string> &args) override;
};

} // namespace process_lib
