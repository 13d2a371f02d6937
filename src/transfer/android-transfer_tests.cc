TEST(AndroidTransfer, BenignElevationExit) {
  ASSERT_TRUE(isBenignElevationExit({"", "", 0}));
  ASSERT_TRUE(isBenignElevationExit({"", "", 1}));
  ASSERT_TRUE(isBenignElevationExit({"", "", 255}));
  ASSERT_FALSE(isBenignElevationExit({"", "", process_lib::Process::SIGNAL_EXIT_BASE + 9, true}));
  ASSERT_FALSE(isBenignElevationExit({"", "", -1}));
}

TEST(AndroidTransfer, SharedStoragePaths) {
  ASSERT_TRUE(isSharedStoragePath("/sdcard/Android/data/com.a/files/x.db"));
  ASSERT_TRUE(isSharedStoragePath("/storage/external/x.db"));
  ASSERT_FALSE(isSharedStoragePath("/data/data/com.a/databases/x.db"));
}

TEST(AndroidTransfer, FindOutputDropsNoise) {
  auto files = parseFindOutput(
      "/data/data/com.a/databases/app.db\n"
      "find: /data/data/com.a/cache: Permission denied\n"
      "/data/data/com.a/databases/app.db-journal\n"
      "\n"
      "/data/data/com.a/files/store.sqlite\r\n"
      "run-as: package not debuggable: com.a\n");
  ASSERT_EQ(files, (std::vector<std::string>{
    "/data/data/com.a/databases/app.db",
    "/data/data/com.a/files/store.sqlite",
  }));
}

#ifndef _WIN32

namespace {

process_lib::ProcessResult write_sqlite_to_stdout_file(const test::Invocation &inv, int exit_code,
    size_t size = 4096, bool signaled = false) {
  if (inv.options.stdoutFile) {
    test::writeFile(*inv.options.stdoutFile, test::sqliteBytes(size));
  }
  return {"", "", exit_code, signaled};
}

} // namespace

TEST(AndroidTransfer, AdminPullAcceptsNonZeroExitWhenBytesArrived) {
  test::FakeToolbox box{"adb"};
  box.runner.on("run-as com.example.app find /data/data/com.example.app/",
      process_lib::ProcessResult{"/data/data/com.example.app/databases/app.db\n", "", 0});
  box.runner.on("exec-out run-as com.example.app cat", [](const test::Invocation &inv) {
    return write_sqlite_to_stdout_file(inv, 1);
  });

  AndroidTransfer transfer(box.resolver, box.runner, box.scratch);
  auto files = common::co_spawn_run_ret<std::vector<DatabaseFile>>([&]() {
    return transfer.co_listDatabaseFiles("emulator-5554", DeviceType::AndroidEmulator, "com.example.app");
  });

  ASSERT_EQ(files.size(), 1u);
  auto &file = files[0];
  ASSERT_EQ(file.localPath, box.scratch.pathFor("app.db"));
  ASSERT_EQ(file.remotePath, "/data/data/com.example.app/databases/app.db");
  ASSERT_EQ(file.location, "/data/data/");
  ASSERT_EQ(file.filename, "app.db");
  ASSERT_EQ(file.deviceType, DeviceType::AndroidEmulator);
  ASSERT_EQ(std::filesystem::file_size(file.localPath), 4096u);

  auto meta = readMetadata(file.localPath);
  ASSERT_TRUE(meta.has_value());
  ASSERT_EQ(meta->deviceId, "emulator-5554");
  ASSERT_EQ(meta->packageId, "com.example.app");
  ASSERT_EQ(meta->remotePath, file.remotePath);

  // the pull streams through exec-out into the scratch file
  auto pull = std::ranges::find_if(box.runner.calls, [](auto &c) {
    return common::contains(c.commandLine(), "exec-out");
  });
  ASSERT_NE(pull, box.runner.calls.end());
  ASSERT_EQ(pull->options.stdoutFile, file.localPath);
}

TEST(AndroidTransfer, SignalTerminatedPullIsFailure) {
  test::FakeToolbox box{"adb"};
  box.runner.on("exec-out", [](const test::Invocation &inv) {
    return write_sqlite_to_stdout_file(inv, process_lib::Process::SIGNAL_EXIT_BASE + 9, 1024, true);
  });

  AndroidTransfer transfer(box.resolver, box.runner, box.scratch);
  try {
    common::co_spawn_run_ret<std::filesystem::path>([&]() {
      return transfer.co_pull("emulator-5554", "com.example.app", "/data/data/com.example.app/databases/app.db", true);
    });
    FAIL() << "expected transfer_error";
  } catch (const transfer_error &e) {
    ASSERT_EQ(e.code, transfer_error::remote_command_failed);
  }
  ASSERT_FALSE(std::filesystem::exists(box.scratch.pathFor("app.db")));
}

TEST(AndroidTransfer, AdminPullAcceptsExit255WhenBytesArrived) {
  test::FakeToolbox box{"adb"};
  box.runner.on("exec-out", [](const test::Invocation &inv) {
    return write_sqlite_to_stdout_file(inv, 255);
  });

  AndroidTransfer transfer(box.resolver, box.runner, box.scratch);
  auto local = common::co_spawn_run_ret<std::filesystem::path>([&]() {
    return transfer.co_pull("emulator-5554", "com.example.app", "/data/data/com.example.app/databases/app.db", true);
  });
  ASSERT_EQ(local, box.scratch.pathFor("app.db"));
  ASSERT_EQ(std::filesystem::file_size(local), 4096u);
}

TEST(AndroidTransfer, ZeroBytePullIsFailure) {
  test::FakeToolbox box{"adb"};
  box.runner.on("exec-out", [](const test::Invocation &inv) {
    test::writeFile(*inv.options.stdoutFile, "");
    return process_lib::ProcessResult{"", "run-as: permission denied", 0};
  });

  AndroidTransfer transfer(box.resolver, box.runner, box.scratch);
  ASSERT_THROW(common::co_spawn_run_ret<std::filesystem::path>([&]() {
    return transfer.co_pull("emulator-5554", "com.example.app", "/data/data/com.example.app/databases/app.db", true);
  }), transfer_error);
}

TEST(AndroidTransfer, FirstLocationWithResultsWins) {
  test::FakeToolbox box{"adb"};
  box.runner.on("find /data/data/", process_lib::ProcessResult{"", "run-as: package not debuggable", 1});
  box.runner.on("find /sdcard/Android/data/",
      process_lib::ProcessResult{"/sdcard/Android/data/com.a/files/cache.sqlite\n", "", 0});
  box.runner.on(" pull ", [](const test::Invocation &inv) {
    test::writeSqliteFile(inv.args.back());
    return process_lib::ProcessResult{"1 file pulled", "", 0};
  });

  AndroidTransfer transfer(box.resolver, box.runner, box.scratch);
  auto files = common::co_spawn_run_ret<std::vector<DatabaseFile>>([&]() {
    return transfer.co_listDatabaseFiles("R58M123", DeviceType::AndroidDevice, "com.a");
  });

  ASSERT_EQ(files.size(), 1u);
  ASSERT_EQ(files[0].location, "/sdcard/Android/data/");
  ASSERT_FALSE(box.runner.called("/storage/emulated/0/"));
  // shared storage needs no run-as
  ASSERT_FALSE(box.runner.called("shell run-as com.a find /sdcard"));
}

TEST(AndroidTransfer, FailedPullIsListedWithRemotePath) {
  test::FakeToolbox box{"adb"};
  box.runner.on("find /data/data/",
      process_lib::ProcessResult{"/data/data/com.a/databases/a.db\n/data/data/com.a/databases/b.db\n", "", 0});
  box.runner.on("cat /data/data/com.a/databases/a.db", [](const test::Invocation &inv) {
    return write_sqlite_to_stdout_file(inv, 0);
  });
  box.runner.on("cat /data/data/com.a/databases/b.db", process_lib::ProcessResult{"", "No such file", 1});

  AndroidTransfer transfer(box.resolver, box.runner, box.scratch);
  auto files = common::co_spawn_run_ret<std::vector<DatabaseFile>>([&]() {
    return transfer.co_listDatabaseFiles("R58M123", DeviceType::AndroidDevice, "com.a");
  });

  ASSERT_EQ(files.size(), 2u);
  ASSERT_EQ(files[0].localPath, box.scratch.pathFor("a.db"));
  ASSERT_EQ(files[1].localPath, std::filesystem::path("/data/data/com.a/databases/b.db"));
}

TEST(AndroidTransfer, SameNamedDatabasesKeepSeparateCopies) {
  test::FakeToolbox box{"adb"};
  box.runner.on("find /data/data/",
      process_lib::ProcessResult{"/data/data/com.a/databases/app.db\n/data/data/com.a/files/app.db\n", "", 0});
  box.runner.on("cat /data/data/com.a/databases/app.db", [](const test::Invocation &inv) {
    test::writeFile(*inv.options.stdoutFile, test::sqliteBytes(4096, 'd'));
    return process_lib::ProcessResult{};
  });
  box.runner.on("cat /data/data/com.a/files/app.db", [](const test::Invocation &inv) {
    test::writeFile(*inv.options.stdoutFile, test::sqliteBytes(8192, 'f'));
    return process_lib::ProcessResult{};
  });

  AndroidTransfer transfer(box.resolver, box.runner, box.scratch);
  auto files = common::co_spawn_run_ret<std::vector<DatabaseFile>>([&]() {
    return transfer.co_listDatabaseFiles("emulator-5554", DeviceType::AndroidEmulator, "com.a");
  });

  ASSERT_EQ(files.size(), 2u);
  ASSERT_NE(files[0].localPath, files[1].localPath);
  ASSERT_EQ(files[0].localPath.filename().string(), "app.db");
  ASSERT_EQ(test::readFile(files[0].localPath), test::sqliteBytes(4096, 'd'));
  ASSERT_EQ(test::readFile(files[1].localPath), test::sqliteBytes(8192, 'f'));
  ASSERT_EQ(readMetadata(files[0].localPath)->remotePath, "/data/data/com.a/databases/app.db");
  ASSERT_EQ(readMetadata(files[1].localPath)->remotePath, "/data/data/com.a/files/app.db");
}

TEST(AndroidTransfer, UnwritableSidecarDoesNotFailPull) {
  test::FakeToolbox box{"adb"};
  box.runner.on("exec-out", [](const test::Invocation &inv) {
    return write_sqlite_to_stdout_file(inv, 0);
  });
  box.scratch.ensure();
  std::filesystem::create_directory(box.scratch.pathFor("app.db.meta.json"));

  AndroidTransfer transfer(box.resolver, box.runner, box.scratch);
  auto local = common::co_spawn_run_ret<std::filesystem::path>([&]() {
    return transfer.co_pull("emulator-5554", "com.example.app", "/data/data/com.example.app/databases/app.db", true);
  });
  ASSERT_EQ(local, box.scratch.pathFor("app.db"));
  ASSERT_EQ(std::filesystem::file_size(local), 4096u);
}

TEST(AndroidTransfer, RejectedPlainPullLeavesNothingBehind) {
  test::FakeToolbox box{"adb"};
  box.runner.on(" pull ", [](const test::Invocation &inv) {
    test::writeFile(inv.args.back(), "");
    return process_lib::ProcessResult{"1 file pulled, 0 bytes", "", 0};
  });

  AndroidTransfer transfer(box.resolver, box.runner, box.scratch);
  ASSERT_THROW(common::co_spawn_run_ret<std::filesystem::path>([&]() {
    return transfer.co_pull("R58M123", "com.a", "/sdcard/Android/data/com.a/files/cache.db", false);
  }), transfer_error);
  ASSERT_FALSE(std::filesystem::exists(box.scratch.pathFor("cache.db")));
}

TEST(AndroidTransfer, ListingClearsPreviousScan) {
  test::FakeToolbox box{"adb"};
  box.scratch.ensure();
  test::writeSqliteFile(box.scratch.pathFor("other-device.db"));

  AndroidTransfer transfer(box.resolver, box.runner, box.scratch);
  auto files = common::co_spawn_run_ret<std::vector<DatabaseFile>>([&]() {
    return transfer.co_listDatabaseFiles("R58M123", DeviceType::AndroidDevice, "com.a");
  });

  ASSERT_TRUE(files.empty());
  ASSERT_FALSE(std::filesystem::exists(box.scratch.pathFor("other-device.db")));
}

TEST(AndroidTransfer, PrivatePushGoesThroughStaging) {
  test::FakeToolbox box{"adb"};
  box.runner.on(" push ", process_lib::ProcessResult{"1 file pushed", "", 0});
  box.runner.on("run-as com.a cp", process_lib::ProcessResult{"", "", 0});
  box.runner.on("shell rm", process_lib::ProcessResult{"", "", 0});

  auto local = box.dir.path() / "edited" / "app.db";
  test::writeSqliteFile(local);

  AndroidTransfer transfer(box.resolver, box.runner, box.scratch);
  common::co_spawn_run([&]() {
    return transfer.co_push("R58M123", "com.a", local, "/data/data/com.a/databases/app.db");
  });

  std::vector<std::string> lines;
  for (auto &call : box.runner.calls) {
    if (call.args.size() > 2)
      lines.push_back(common::join(std::vector<std::string>(call.args.begin() + 2, call.args.end()), " "));
  }
  std::vector<std::string> expected = {
    "push " + local.string() + " /data/local/tmp/app.db",
    "shell run-as com.a cp /data/local/tmp/app.db /data/data/com.a/databases/app.db",
    "shell rm /data/local/tmp/app.db",
  };
  ASSERT_EQ(lines, expected);
}

TEST(AndroidTransfer, StagingRemovedWhenCopyFails) {
  test::FakeToolbox box{"adb"};
  box.runner.on(" push ", process_lib::ProcessResult{"1 file pushed", "", 0});
  box.runner.on("run-as com.a cp", process_lib::ProcessResult{"", "cp: Read-only file system", 1});
  box.runner.on("shell rm", process_lib::ProcessResult{"", "", 0});

  auto local = box.dir.path() / "app.db";
  test::writeSqliteFile(local);

  AndroidTransfer transfer(box.resolver, box.runner, box.scratch);
  try {
    common::co_spawn_run([&]() {
      return transfer.co_push("R58M123", "com.a", local, "/data/data/com.a/databases/app.db");
    });
    FAIL() << "expected transfer_error";
  } catch (const transfer_error &e) {
    ASSERT_EQ(e.code, transfer_error::remote_command_failed);
    ASSERT_TRUE(common::contains(e.what(), "Read-only"));
  }
  ASSERT_TRUE(box.runner.called("shell rm /data/local/tmp/app.db"));
}

TEST(AndroidTransfer, SharedStoragePushIsDirect) {
  test::FakeToolbox box{"adb"};
  box.runner.on(" push ", process_lib::ProcessResult{"1 file pushed", "", 0});

  auto local = box.dir.path() / "cache.sqlite";
  test::writeSqliteFile(local);

  AndroidTransfer transfer(box.resolver, box.runner, box.scratch);
  common::co_spawn_run([&]() {
    return transfer.co_push("R58M123", "com.a", local, "/sdcard/Android/data/com.a/files/cache.sqlite");
  });

  ASSERT_TRUE(box.runner.called("push " + local.string() + " /sdcard/Android/data/com.a/files/cache.sqlite"));
  ASSERT_FALSE(box.runner.called("/data/local/tmp"));
}

TEST(AndroidTransfer, PushOfMissingFileFailsBeforeAnyCommand) {
  test::FakeToolbox box{"adb"};
  AndroidTransfer transfer(box.resolver, box.runner, box.scratch);
  try {
    common::co_spawn_run([&]() {
      return transfer.co_push("R58M123", "com.a", box.dir.path() / "gone.db", "/data/data/com.a/databases/gone.db");
    });
    FAIL() << "expected transfer_error";
  } catch (const transfer_error &e) {
    ASSERT_EQ(e.code, transfer_error::local_file_missing);
  }
  ASSERT_TRUE(box.runner.calls.empty());
}

#endif
