#pragma once
#include <gtest/gtest.h>
#include "process/process-runner.h"
#include "process/process.h"
#include "tools/tool-resolver.h"
#include "scratch/scratch-dir.h"
#include "common/string-utils.h"
#include "common/co-spawn-run.h"
#include <asio/awaitable.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace test {

class TempDir {
public:
  TempDir() {
    static std::atomic<int> counter{0};
    std::random_device rd;
    auto name = "db-bridge-test-" + std::to_string(rd()) + "-" + std::to_string(counter++);
    path_ = std::filesystem::temp_directory_path() / name;
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path &path, std::string_view content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  f.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string readFile(const std::filesystem::path &path) {
  std::ifstream f(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

// header page of a real database file, padded
inline std::string sqliteBytes(size_t size = 4096, char fill = '\0') {
  std::string data("SQLite format 3", 15);
  data.push_back('\0');
  if (data.size() < size) {
    data.append(size - data.size(), fill);
  }
  return data;
}

inline void writeSqliteFile(const std::filesystem::path &path, size_t size = 4096, char fill = '\0') {
  writeFile(path, sqliteBytes(size, fill));
}

inline void writeExecutable(const std::filesystem::path &path, std::string_view script, bool executable = true) {
  writeFile(path, script);
  using std::filesystem::perms;
  std::filesystem::permissions(path,
      executable ? perms::owner_all | perms::group_read | perms::group_exec | perms::others_read | perms::others_exec
                 : perms::owner_read | perms::owner_write | perms::group_read | perms::others_read,
      std::filesystem::perm_options::replace);
}

inline void setAge(const std::filesystem::path &path, std::chrono::seconds age) {
  std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - age);
}

struct Invocation {
  std::filesystem::path program;
  std::vector<std::string> args;
  process_lib::RunOptions options;

  std::string commandLine() const {
    return process_lib::describe_command(program, args);
  }
};

// Scripted stand-in for real subprocesses. The first rule whose key occurs in the
// command line answers, unmatched commands fail with exit code 1.
class FakeCommandRunner : public process_lib::CommandRunner {
public:
  using Handler = std::function<process_lib::ProcessResult(const Invocation &)>;

  void on(std::string key, Handler handler) {
    rules_.emplace_back(std::move(key), std::move(handler));
  }

  void on(std::string key, process_lib::ProcessResult result) {
    rules_.emplace_back(std::move(key), [result](const Invocation &) { return result; });
  }

  asio::awaitable<process_lib::ProcessResult>
  co_run(std::filesystem::path program,
      std::vector<std::string> args,
      process_lib::RunOptions options = {}) override {
    Invocation inv{std::move(program), std::move(args), std::move(options)};
    calls.push_back(inv);
    auto line = inv.commandLine();
    for (auto &[key, handler] : rules_) {
      if (line.find(key) != std::string::npos) {
        co_return handler(inv);
      }
    }
    co_return process_lib::ProcessResult{"", "unexpected command: " + line, 1};
  }

  void spawnDetached(
      const std::filesystem::path &program,
      const std::vector<std::string> &args) override {
    calls.push_back(Invocation{program, args, {}});
  }

  bool called(std::string_view key) const {
    for (auto &call : calls) {
      if (call.commandLine().find(key) != std::string::npos)
        return true;
    }
    return false;
  }

  std::vector<Invocation> calls;

private:
  std::vector<std::pair<std::string, Handler>> rules_;
};

// Placeholder executables on a private PATH, version probes answered by the fake runner.
class FakeToolbox {
public:
  explicit FakeToolbox(std::initializer_list<std::string_view> tools)
  : env(environmentIn(dir.path())),
    resolver(env, runner) {
    for (auto tool : tools) {
      std::string name(tool);
#ifdef _WIN32
      name += ".exe";
#endif
      writeExecutable(dir.path() / "bin" / name, "#!/bin/sh\nexit 0\n");

      auto probe = "/" + name + " " + common::join(tool_resolver::probeArgs(tool), " ");
      runner.on(probe, process_lib::ProcessResult{std::string(tool) + " version 1.0\n", "", 0});
    }
  }

  std::filesystem::path toolPath(std::string_view tool) const {
    return env.pathEntries.front() / tool;
  }

  TempDir dir;
  FakeCommandRunner runner;
  tool_resolver::ToolEnvironment env;
  tool_resolver::ToolResolver resolver;
  scratch::ScratchDirectory scratch{dir.path() / "scratch"};

private:
  static tool_resolver::ToolEnvironment environmentIn(const std::filesystem::path &root) {
    tool_resolver::ToolEnvironment env;
    env.appRoot = root / "app";
    env.pathEntries = {root / "bin"};
    env.homeDir = root / "home";
    return env;
  }
};

} // namespace test
