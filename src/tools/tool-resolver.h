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
#include "process/process-runner.h"
#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <functional>
#include <filesystem>
#include <stdexcept>
#include <asio/awaitable.hpp>

namespace tool_resolver {

enum class HostPlatform {
  MacOS,
  Linux,
  Windows,
};

constexpr HostPlatform current_platform() {
#if defined(_WIN32)
  return HostPlatform::Windows;
#elif defined(__APPLE__)
  return HostPlatform::MacOS;
#else
  return HostPlatform::Linux;
#endif
}

// Everything the strategies derive paths from. Captured once, passed in.
struct ToolEnvironment {
  std::filesystem::path appRoot;
  HostPlatform platform{current_platform()};
  std::vector<std::filesystem::path> pathEntries;
  std::filesystem::path homeDir;
  std::filesystem::path androidSdkRoot;
  std::filesystem::path embeddedToolsDir;

  static ToolEnvironment capture(const std::filesystem::path &appRoot);
};

struct ValidatedTool {
  std::filesystem::path absolutePath;
  std::string strategyName;
  std::string version;
};

struct NotFound {
  std::string tool;
  std::vector<std::filesystem::path> attemptedPaths;
};

struct NotExecutable {
  std::string tool;
  std::filesystem::path path;
};

struct PermissionDenied {
  std::string tool;
  std::filesystem::path path;
};

struct ProbeFailed {
  std::string tool;
  std::string detail;
};

using ToolResolutionError = std::variant<NotFound, NotExecutable, PermissionDenied, ProbeFailed>;

std::string describe(const ToolResolutionError &error);

std::string installationInstructions(const ToolResolutionError &error, HostPlatform platform);

class tool_resolution_error : public std::runtime_error {
public:
  explicit tool_resolution_error(ToolResolutionError e)
    : std::runtime_error(describe(e)), error(std::move(e)) {}

  const ToolResolutionError error;
};

using Validator = std::function<bool(const std::filesystem::path &)>;

// One named way of locating a binary.
struct Strategy {
  std::string name;
  std::vector<std::filesystem::path> candidateDirectories;
  Validator validator;
};

std::vector<Strategy>
buildStrategies(std::string_view tool, const ToolEnvironment &env);

std::vector<std::string>
nameVariants(std::string_view tool, HostPlatform platform);

std::vector<std::string>
probeArgs(std::string_view tool);

// Some tools exit non-zero on --help but still print their usage text.
bool looksLikeUsageBanner(std::string_view text);

// First line mentioning "version", or "unknown version".
std::string extractVersion(std::string_view text);

class ToolResolver {
public:
  ToolResolver(ToolEnvironment env, process_lib::CommandRunner &runner);

  // throws tool_resolution_error, never caches
  asio::awaitable<ValidatedTool> co_resolve(std::string tool);

  ValidatedTool resolve(std::string_view tool);

  const ToolEnvironment &environment() const { return env_; }

private:
  ToolEnvironment env_;
  process_lib::CommandRunner &runner_;
};

} // namespace tool_resolver
