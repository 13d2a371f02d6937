namespace {

ToolEnvironment test_environment(const std::filesystem::path &root, HostPlatform platform = current_platform()) {
  ToolEnvironment env;
  env.appRoot = root / "app" / "bin";
  env.platform = platform;
  env.pathEntries = {root / "path-a", root / "path-b"};
  env.homeDir = root / "home";
  env.androidSdkRoot = root / "sdk";
  env.embeddedToolsDir = root / "embedded";
  return env;
}

std::vector<std::string> strategy_names(const std::vector<Strategy> &chain) {
  std::vector<std::string> names;
  for (auto &s : chain) {
    names.push_back(s.name);
  }
  return names;
}

} // namespace

TEST(ToolResolver, UsageBannerPredicate) {
  ASSERT_TRUE(looksLikeUsageBanner("Usage: afcclient [OPTIONS] [COMMAND]"));
  ASSERT_TRUE(looksLikeUsageBanner("error\nusage: idevice_id [OPTIONS] [UDID]"));
  ASSERT_FALSE(looksLikeUsageBanner("ERROR: Could not connect to lockdownd"));
  ASSERT_FALSE(looksLikeUsageBanner(""));
}

TEST(ToolResolver, ExtractVersionTakesFirstMatchingLine) {
  ASSERT_EQ(extractVersion("Android Debug Bridge version 1.0.41\nVersion 34.0.5-10900879\n"),
      "Android Debug Bridge version 1.0.41");
  ASSERT_EQ(extractVersion("Usage: afcclient\n  -v, --VERSION  print version\n"),
      "-v, --VERSION  print version");
  ASSERT_EQ(extractVersion("Usage: ideviceinfo [OPTIONS]"), "unknown version");
}

TEST(ToolResolver, IosToolStrategyOrder) {
  auto env = test_environment("/tmp/x", HostPlatform::MacOS);
  auto names = strategy_names(buildStrategies("afcclient", env));
  std::vector<std::string> expected = {
    "Homebrew (Apple Silicon)",
    "Homebrew (Intel)",
    "MacPorts",
    "System PATH",
    "Bundled (Production)",
    "Bundled (Development)",
  };
  ASSERT_EQ(names, expected);
}

TEST(ToolResolver, WindowsChainEndsWithEmbeddedTools) {
  auto env = test_environment("C:/db-bridge", HostPlatform::Windows);
  auto chain = buildStrategies("ideviceinfo", env);
  ASSERT_EQ(chain.front().name, "System PATH");
  ASSERT_EQ(chain.back().name, "Embedded (Windows)");
  ASSERT_TRUE(chain.back().validator("C:/tools/ideviceinfo.exe"));
  ASSERT_FALSE(chain.back().validator("C:/tools/ideviceinfo.dll"));

  auto variants = nameVariants("ideviceinfo", HostPlatform::Windows);
  ASSERT_EQ(variants, (std::vector<std::string>{"ideviceinfo", "ideviceinfo.exe"}));
  ASSERT_EQ(nameVariants("adb.exe", HostPlatform::Windows).size(), 1u);
  ASSERT_EQ(nameVariants("adb", HostPlatform::Linux).size(), 1u);
}

TEST(ToolResolver, AndroidChainSearchesSdk) {
  auto env = test_environment("/tmp/x", HostPlatform::Linux);
  auto chain = buildStrategies("adb", env);
  ASSERT_EQ(chain.front().name, "System PATH");

  auto sdk = std::ranges::find_if(chain, [](auto &s) { return s.name == "Android SDK"; });
  ASSERT_NE(sdk, chain.end());
  ASSERT_EQ(sdk->candidateDirectories.front(), env.androidSdkRoot / "platform-tools");

  auto emulator = buildStrategies("emulator", env);
  auto esdk = std::ranges::find_if(emulator, [](auto &s) { return s.name == "Android SDK"; });
  ASSERT_EQ(esdk->candidateDirectories.front(), env.androidSdkRoot / "emulator");
}

TEST(ToolResolver, PackageManagerValidatorChecksInstallRoot) {
  auto env = test_environment("/tmp/x", HostPlatform::MacOS);
  auto chain = buildStrategies("idevice_id", env);
  ASSERT_TRUE(chain[0].validator("/opt/homebrew/bin/idevice_id"));
  ASSERT_TRUE(chain[1].validator("/usr/local/opt/libimobiledevice/bin/idevice_id"));
  ASSERT_FALSE(chain[0].validator("/home/me/bin/idevice_id"));
}

#ifndef _WIN32

TEST(ToolResolver, FakeProbeUsesToolSpecificArgs) {
  test::TempDir dir;
  auto env = test_environment(dir.path());
  auto adb = env.pathEntries[0] / "adb";
  test::writeExecutable(adb, "#!/bin/sh\nexit 0\n");

  test::FakeCommandRunner runner;
  runner.on("adb", [](const test::Invocation &) {
    return process_lib::ProcessResult{"Android Debug Bridge version 1.0.41\n", "", 0};
  });

  ToolResolver resolver(env, runner);
  auto tool = resolver.resolve("adb");
  ASSERT_EQ(tool.strategyName, "System PATH");
  ASSERT_EQ(tool.version, "Android Debug Bridge version 1.0.41");
  ASSERT_EQ(runner.calls.size(), 1u);
  ASSERT_EQ(runner.calls[0].args, std::vector<std::string>{"version"});
  ASSERT_TRUE(runner.calls[0].options.timeout.has_value());
}

TEST(ToolResolver, WindowsSkipsExtensionlessShim) {
  test::TempDir dir;
  auto env = test_environment(dir.path(), HostPlatform::Windows);
  test::writeExecutable(env.pathEntries[0] / "adb", "#!/bin/sh\nexit 0\n", false);
  test::writeExecutable(env.pathEntries[0] / "adb.exe", "#!/bin/sh\nexit 0\n");

  test::FakeCommandRunner runner;
  runner.on("adb.exe version", process_lib::ProcessResult{"Android Debug Bridge version 1.0.41\n", "", 0});

  ToolResolver resolver(env, runner);
  auto tool = resolver.resolve("adb");
  ASSERT_EQ(tool.absolutePath.filename().string(), "adb.exe");
  ASSERT_EQ(tool.strategyName, "System PATH");
}

TEST(ToolResolver, AcceptsUsageBannerOnNonZeroExit) {
  test::TempDir dir;
  auto env = test_environment(dir.path());
  auto tool_path = env.pathEntries[1] / "dbbridge-fake-afc";
  test::writeExecutable(tool_path,
      "#!/bin/sh\necho 'Usage: dbbridge-fake-afc [OPTIONS]'\necho 'dbbridge-fake-afc version 1.3.0'\nexit 1\n");

  process_lib::ProcessCommandRunner runner;
  ToolResolver resolver(env, runner);
  auto tool = resolver.resolve("dbbridge-fake-afc");

  ASSERT_EQ(tool.strategyName, "System PATH");
  ASSERT_EQ(tool.absolutePath, std::filesystem::absolute(tool_path).lexically_normal());
  ASSERT_EQ(tool.version, "dbbridge-fake-afc version 1.3.0");
  ASSERT_TRUE(std::filesystem::is_regular_file(tool.absolutePath));
}

TEST(ToolResolver, RepairsMissingExecutableBit) {
  test::TempDir dir;
  auto env = test_environment(dir.path());
  auto tool_path = env.pathEntries[0] / "dbbridge-noexec";
  test::writeExecutable(tool_path, "#!/bin/sh\nexit 0\n", false);

  process_lib::ProcessCommandRunner runner;
  ToolResolver resolver(env, runner);
  auto tool = resolver.resolve("dbbridge-noexec");

  using std::filesystem::perms;
  auto p = std::filesystem::status(tool.absolutePath).permissions();
  ASSERT_NE(p & perms::owner_exec, perms::none);
  ASSERT_EQ(tool.version, "unknown version");
}

TEST(ToolResolver, ProbeFailedWhenEveryCandidateFails) {
  test::TempDir dir;
  auto env = test_environment(dir.path());
  test::writeExecutable(env.pathEntries[0] / "dbbridge-broken", "#!/bin/sh\necho boom 1>&2\nexit 2\n");

  process_lib::ProcessCommandRunner runner;
  ToolResolver resolver(env, runner);
  try {
    resolver.resolve("dbbridge-broken");
    FAIL() << "expected tool_resolution_error";
  } catch (const tool_resolution_error &e) {
    ASSERT_TRUE(std::holds_alternative<ProbeFailed>(e.error));
    ASSERT_TRUE(common::contains(std::get<ProbeFailed>(e.error).detail, "exited with 2"));
  }
}

TEST(ToolResolver, BundledProductionRequiresPlausibleSize) {
  test::TempDir dir;
  auto env = test_environment(dir.path());
  auto bundled = env.appRoot / "tools" / "dbbridge-bundled";

  test::writeExecutable(bundled, "#!/bin/sh\nexit 0\n");
  process_lib::ProcessCommandRunner runner;
  ToolResolver resolver(env, runner);
  ASSERT_THROW(resolver.resolve("dbbridge-bundled"), tool_resolution_error);

  std::string script = "#!/bin/sh\nexit 0\n#" + std::string(60000, 'x') + "\n";
  test::writeExecutable(bundled, script);
  auto tool = resolver.resolve("dbbridge-bundled");
  ASSERT_EQ(tool.strategyName, "Bundled (Production)");
}

TEST(ToolResolver, ResolutionIsNeverCached) {
  test::TempDir dir;
  auto env = test_environment(dir.path());
  auto tool_path = env.pathEntries[0] / "dbbridge-transient";
  test::writeExecutable(tool_path, "#!/bin/sh\nexit 0\n");

  process_lib::ProcessCommandRunner runner;
  ToolResolver resolver(env, runner);
  ASSERT_NO_THROW(resolver.resolve("dbbridge-transient"));

  std::filesystem::remove(tool_path);
  ASSERT_THROW(resolver.resolve("dbbridge-transient"), tool_resolution_error);
}

#endif

TEST(ToolResolver, NotFoundListsPathsFromEveryStrategy) {
  test::TempDir dir;
  auto env = test_environment(dir.path());
  test::FakeCommandRunner runner;
  ToolResolver resolver(env, runner);

  try {
    resolver.resolve("afcclient-definitely-missing");
    FAIL() << "expected tool_resolution_error";
  } catch (const tool_resolution_error &e) {
    ASSERT_TRUE(std::holds_alternative<NotFound>(e.error));
    auto &nf = std::get<NotFound>(e.error);
    ASSERT_FALSE(nf.attemptedPaths.empty());

    for (auto &strategy : buildStrategies("afcclient-definitely-missing", env)) {
      if (strategy.candidateDirectories.empty())
        continue;
      bool listed = std::ranges::any_of(nf.attemptedPaths, [&](auto &p) {
        return std::ranges::find(strategy.candidateDirectories, p.parent_path()) != strategy.candidateDirectories.end();
      });
      ASSERT_TRUE(listed) << strategy.name;
    }
  }
  ASSERT_TRUE(runner.calls.empty());
}

TEST(ToolResolver, InstallationInstructions) {
  NotFound nf{"afcclient", {"/opt/homebrew/bin/afcclient", "/usr/local/bin/afcclient"}};
  auto text = installationInstructions(nf, HostPlatform::MacOS);
  ASSERT_TRUE(common::contains(text, "brew install libimobiledevice"));
  ASSERT_TRUE(common::contains(text, "sudo port install libimobiledevice"));
  ASSERT_TRUE(common::contains(text, "/usr/local/bin/afcclient"));

  auto chmod = installationInstructions(NotExecutable{"afcclient", "/opt/x/afcclient"}, HostPlatform::MacOS);
  ASSERT_TRUE(common::contains(chmod, "chmod +x"));

  auto adb = installationInstructions(NotFound{"adb", {}}, HostPlatform::Linux);
  ASSERT_TRUE(common::contains(adb, "platform-tools"));
}
