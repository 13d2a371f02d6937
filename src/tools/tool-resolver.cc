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
#include "tool-resolver.h"
#include "process/process.h"
#include "common/string-utils.h"
#include "common/co-spawn-run.h"
#include <asio.hpp>
#include <array>
#include <algorithm>
#include <optional>
#include <format>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace tool_resolver {

using asio::awaitable;

namespace {

constexpr std::chrono::seconds PROBE_TIMEOUT{10};

constexpr uintmax_t BUNDLED_MIN_SIZE = 50000;
constexpr uintmax_t BUNDLED_MAX_SIZE = 10000000;

constexpr std::array libimobiledevice_tools = {
  std::string_view{"idevice_id"},
  std::string_view{"ideviceinfo"},
  std::string_view{"ideviceinstaller"},
  std::string_view{"afcclient"},
};

bool is_libimobiledevice_tool(std::string_view tool) {
  return std::ranges::find(libimobiledevice_tools, tool) != libimobiledevice_tools.end();
}

bool is_android_tool(std::string_view tool) {
  return tool == "adb" || tool == "emulator";
}

std::filesystem::path env_path(const char *name) {
  const char *value = ::getenv(name);
  if (value && *value) {
    return std::filesystem::path(value);
  }
  return {};
}

bool exists_validator(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

bool package_manager_validator(const std::filesystem::path &path) {
  auto s = path.generic_string();
  return common::contains(s, "/opt/homebrew/") || common::contains(s, "/usr/local/");
}

bool bundled_size_validator(const std::filesystem::path &path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  return !ec && size > BUNDLED_MIN_SIZE && size < BUNDLED_MAX_SIZE;
}

bool exe_extension_validator(const std::filesystem::path &path) {
  return common::to_lower(path.extension().string()) == ".exe";
}

std::vector<std::filesystem::path>
android_sdk_dirs(std::string_view tool, const ToolEnvironment &env) {
  std::string_view sub = tool == "emulator" ? "emulator" : "platform-tools";
  std::vector<std::filesystem::path> dirs;

  if (!env.androidSdkRoot.empty()) {
    dirs.push_back(env.androidSdkRoot / sub);
  }

  if (!env.homeDir.empty()) {
    if (env.platform == HostPlatform::Windows) {
      dirs.push_back(env.homeDir / "AppData" / "Local" / "Android" / "Sdk" / sub);
    } else {
      dirs.push_back(env.homeDir / "Library" / "Android" / "sdk" / sub);
      dirs.push_back(env.homeDir / "Android" / "Sdk" / sub);
    }
  }

  return dirs;
}

Strategy bundled_production(const ToolEnvironment &env) {
  return {
    "Bundled (Production)",
    {
      env.appRoot / ".." / "MacOS",
      env.appRoot / ".." / "Resources" / "tools",
      env.appRoot / "tools",
    },
    bundled_size_validator,
  };
}

// Windows launches by extension, there is no permission bit to repair
bool has_executable_extension(const std::filesystem::path &path) {
  auto ext = common::to_lower(path.extension().string());
  return ext == ".exe" || ext == ".cmd" || ext == ".bat";
}

#if !defined(_WIN32)
bool is_executable(const std::filesystem::path &path, std::error_code &ec) {
  using std::filesystem::perms;
  auto p = std::filesystem::status(path, ec).permissions();
  if (ec) {
    return false;
  }
  return (p & (perms::owner_exec | perms::group_exec | perms::others_exec)) != perms::none;
}

bool make_executable(const std::filesystem::path &path) {
  using std::filesystem::perms;
  std::error_code ec;
  std::filesystem::permissions(path,
      perms::owner_exec | perms::group_exec | perms::others_exec,
      std::filesystem::perm_options::add, ec);
  if (ec) {
    spdlog::warn("chmod +x {} failed: {}", path.string(), ec.message());
    return false;
  }
  return is_executable(path, ec);
}
#else
bool is_executable(const std::filesystem::path &path, std::error_code &ec) {
  ec.clear();
  return has_executable_extension(path);
}

bool make_executable(const std::filesystem::path &) {
  return false;
}
#endif

} // namespace

ToolEnvironment ToolEnvironment::capture(const std::filesystem::path &appRoot) {
  ToolEnvironment env;
  env.appRoot = appRoot;
  env.platform = current_platform();
  env.pathEntries = process_lib::get_sys_paths();
#ifdef _WIN32
  env.homeDir = env_path("USERPROFILE");
#else
  env.homeDir = env_path("HOME");
#endif
  env.androidSdkRoot = env_path("ANDROID_HOME");
  if (env.androidSdkRoot.empty()) {
    env.androidSdkRoot = env_path("ANDROID_SDK_ROOT");
  }
  std::error_code ec;
  auto temp = std::filesystem::temp_directory_path(ec);
  if (!ec) {
    env.embeddedToolsDir = temp / "db-bridge-tools";
  }
  return env;
}

std::vector<Strategy>
buildStrategies(std::string_view tool, const ToolEnvironment &env) {
  std::vector<Strategy> chain;
  const bool windows = env.platform == HostPlatform::Windows;

  if (tool == "xcrun") {
    chain.push_back({"System", {"/usr/bin"}, exists_validator});
    chain.push_back({"System PATH", env.pathEntries, exists_validator});
    return chain;
  }

  if (is_android_tool(tool)) {
    chain.push_back({"System PATH", env.pathEntries, exists_validator});
    if (!windows) {
      chain.push_back({"Homebrew (Apple Silicon)", {"/opt/homebrew/bin"}, package_manager_validator});
      chain.push_back({"Homebrew (Intel)", {"/usr/local/bin"}, package_manager_validator});
      chain.push_back({"System", {"/usr/bin"}, exists_validator});
    }
    chain.push_back({"Android SDK", android_sdk_dirs(tool, env), exists_validator});
    if (!windows) {
      chain.push_back(bundled_production(env));
    }
    return chain;
  }

  if (!windows) {
    chain.push_back({
      "Homebrew (Apple Silicon)",
      {"/opt/homebrew/bin", "/opt/homebrew/opt/libimobiledevice/bin"},
      package_manager_validator,
    });
    chain.push_back({
      "Homebrew (Intel)",
      {"/usr/local/bin", "/usr/local/opt/libimobiledevice/bin"},
      package_manager_validator,
    });
    chain.push_back({"MacPorts", {"/opt/local/bin"}, exists_validator});
  }

  chain.push_back({"System PATH", env.pathEntries, exists_validator});

  if (!windows) {
    chain.push_back(bundled_production(env));
    chain.push_back({
      "Bundled (Development)",
      {env.appRoot / ".." / ".." / ".." / "resources" / "libimobiledevice" / "tools"},
      exists_validator,
    });
  } else {
    std::vector<std::filesystem::path> dirs = {
      env.appRoot,
      env.appRoot / "resources" / "libimobiledevice-windows",
      env.appRoot / "_up_" / "resources" / "libimobiledevice-windows",
      env.appRoot / "bin",
    };
    if (!env.embeddedToolsDir.empty()) {
      dirs.push_back(env.embeddedToolsDir);
    }
    chain.push_back({"Embedded (Windows)", std::move(dirs), exe_extension_validator});
  }

  return chain;
}

std::vector<std::string>
nameVariants(std::string_view tool, HostPlatform platform) {
  std::vector<std::string> names = {std::string(tool)};
  if (platform == HostPlatform::Windows && !std::filesystem::path(tool).has_extension()) {
    names.push_back(std::string(tool) + ".exe");
  }
  return names;
}

std::vector<std::string>
probeArgs(std::string_view tool) {
  if (tool == "adb") {
    return {"version"};
  }
  if (tool == "emulator") {
    return {"-version"};
  }
  if (tool == "xcrun") {
    return {"simctl", "help"};
  }
  if (is_libimobiledevice_tool(tool)) {
    return {"--help"};
  }
  return {"--version"};
}

bool looksLikeUsageBanner(std::string_view text) {
  return common::contains(text, "Usage") || common::contains_icase(text, "usage:");
}

std::string extractVersion(std::string_view text) {
  for (auto &line : common::split_lines(text)) {
    if (common::contains_icase(line, "version")) {
      return line;
    }
  }
  return "unknown version";
}

std::string describe(const ToolResolutionError &error) {
  return std::visit([](auto &&e) -> std::string {
    using T = std::decay_t<decltype(e)>;
    if constexpr (std::is_same_v<T, NotFound>) {
      return std::format("tool '{}' not found in {} locations", e.tool, e.attemptedPaths.size());
    } else if constexpr (std::is_same_v<T, NotExecutable>) {
      return std::format("tool '{}' found at '{}' but is not executable", e.tool, e.path.string());
    } else if constexpr (std::is_same_v<T, PermissionDenied>) {
      return std::format("permission denied accessing tool '{}' at '{}'", e.tool, e.path.string());
    } else {
      return std::format("tool '{}' failed to run: {}", e.tool, e.detail);
    }
  }, error);
}

std::string installationInstructions(const ToolResolutionError &error, HostPlatform platform) {
  return std::visit([platform](auto &&e) -> std::string {
    using T = std::decay_t<decltype(e)>;
    if constexpr (std::is_same_v<T, NotFound>) {
      std::string text;
      if (is_android_tool(e.tool)) {
        text = std::format(
          "'{}' was not found. Install the Android SDK platform-tools and emulator "
          "(Android Studio, or `brew install --cask android-platform-tools` on macOS), "
          "and make sure it is on PATH or ANDROID_HOME is set.\n", e.tool);
      } else if (platform == HostPlatform::Windows) {
        text = std::format(
          "iOS tool '{}' was not found. Reinstall the application so its bundled "
          "libimobiledevice tools are restored.\n", e.tool);
      } else {
        text = std::format(
          "iOS tool '{}' was not found. To install libimobiledevice tools:\n"
          "  Homebrew (recommended): brew install libimobiledevice\n"
          "  MacPorts: sudo port install libimobiledevice\n", e.tool);
      }
      text += "Searched locations:\n";
      for (auto &path : e.attemptedPaths) {
        text += "  " + path.string() + "\n";
      }
      return text;
    } else if constexpr (std::is_same_v<T, NotExecutable>) {
      return std::format("'{}' exists but is not executable. Fix with: chmod +x \"{}\"\n",
          e.tool, e.path.string());
    } else if constexpr (std::is_same_v<T, PermissionDenied>) {
      return std::format("'{}' cannot be accessed at {}. Check the file and directory permissions.\n",
          e.tool, e.path.string());
    } else {
      return std::format("'{}' was found but does not run correctly ({}). Reinstall it.\n",
          e.tool, e.detail);
    }
  }, error);
}

ToolResolver::ToolResolver(ToolEnvironment env, process_lib::CommandRunner &runner)
: env_(std::move(env)),
  runner_(runner)
{}

awaitable<ValidatedTool>
ToolResolver::co_resolve(std::string tool) {
  const auto names = nameVariants(tool, env_.platform);
  const auto chain = buildStrategies(tool, env_);

  std::vector<std::filesystem::path> attempted;
  std::optional<std::string> probe_failure;

  for (auto &strategy : chain) {
    for (auto &dir : strategy.candidateDirectories) {
      for (auto &name : names) {
        auto candidate = dir / name;
        attempted.push_back(candidate);

        std::error_code ec;
        auto st = std::filesystem::status(candidate, ec);
        if (ec == std::errc::permission_denied) {
          throw tool_resolution_error(PermissionDenied{tool, candidate});
        }
        if (ec || !std::filesystem::is_regular_file(st)) {
          continue;
        }

        if (!strategy.validator(candidate)) {
          spdlog::debug("{}: {} rejected by {} validator", tool, candidate.string(), strategy.name);
          continue;
        }

        if (env_.platform == HostPlatform::Windows && !has_executable_extension(candidate)) {
          // extensionless shims sit beside the real .exe in npm-style directories
          spdlog::debug("{}: {} has no executable extension, skipping", tool, candidate.string());
          continue;
        }

        if (!is_executable(candidate, ec)) {
          if (ec == std::errc::permission_denied) {
            throw tool_resolution_error(PermissionDenied{tool, candidate});
          }
          spdlog::info("{}: {} lacks the executable bit, fixing", tool, candidate.string());
          if (!make_executable(candidate)) {
            throw tool_resolution_error(NotExecutable{tool, candidate});
          }
        }

        auto absolute = std::filesystem::absolute(candidate, ec);
        if (ec) {
          absolute = candidate;
        }

        try {
          auto probe = co_await runner_.co_run(absolute, probeArgs(tool),
              process_lib::RunOptions{PROBE_TIMEOUT, std::nullopt});
          auto output = probe.out + "\n" + probe.err;

          if (probe.succeeded() || looksLikeUsageBanner(output)) {
            ValidatedTool found{absolute.lexically_normal(), strategy.name, extractVersion(output)};
            spdlog::info("{} resolved via {}: {} ({})", tool, found.strategyName,
                found.absolutePath.string(), found.version);
            co_return found;
          }

          probe_failure = std::format("{} exited with {}", absolute.string(), probe.exitCode);
        } catch (const process_lib::process_error &e) {
          probe_failure = std::format("{}: {}", absolute.string(), e.what());
        }

        spdlog::debug("{}: probe failed, {}", tool, *probe_failure);
      }
    }
  }

  if (probe_failure) {
    throw tool_resolution_error(ProbeFailed{tool, *probe_failure});
  }

  spdlog::debug("{}: not found after {} candidates", tool, attempted.size());
  throw tool_resolution_error(NotFound{tool, std::move(attempted)});
}

ValidatedTool ToolResolver::resolve(std::string_view tool) {
  return common::co_spawn_run_ret<ValidatedTool>([&]() {
    return co_resolve(std::string(tool));
  });
}

#ifdef ENABLE_TEST
#include "tool-resolver_tests.cc"
#endif

} // namespace tool_resolver
