TEST(VirtualDevices, ParseAvdList) {
  auto avds = parseAvdList("INFO    | Storing crashdata in: /tmp/android/emu-crash.db\nPixel_7_API_34\nSmall_Phone\n");
  ASSERT_EQ(avds, (std::vector<std::string>{"Pixel_7_API_34", "Small_Phone"}));
}

TEST(VirtualDevices, ParseAvdName) {
  ASSERT_EQ(parseAvdName("Pixel_7_API_34\r\nOK\r\n"), "Pixel_7_API_34");
  ASSERT_EQ(parseAvdName("OK\n"), "");
  ASSERT_EQ(parseAvdName(""), "");
}

#ifndef _WIN32

TEST(VirtualDevices, EmulatorStateFromRunningPorts) {
  test::FakeToolbox box{"adb", "emulator"};
  box.runner.on("-list-avds", process_lib::ProcessResult{"Pixel_7_API_34\nSmall_Phone\n", "", 0});
  box.runner.on("devices -l", process_lib::ProcessResult{
      "List of devices attached\nemulator-5554 device product:sdk model:sdk_gphone64 device:emu64x\n", "", 0});
  box.runner.on("-s emulator-5554 emu avd name", process_lib::ProcessResult{"Small_Phone\nOK\n", "", 0});

  VirtualDevices virtuals(box.resolver, box.runner);
  auto avds = common::co_spawn_run_ret<std::vector<VirtualDevice>>([&]() {
    return virtuals.co_listAndroidEmulators();
  });

  ASSERT_EQ(avds.size(), 2u);
  ASSERT_EQ(avds[0].id, "Pixel_7_API_34");
  ASSERT_EQ(avds[0].state, "stopped");
  ASSERT_EQ(avds[1].state, "running");
  ASSERT_EQ(avds[1].platform, "android");
}

TEST(VirtualDevices, LaunchEmulatorIsDetached) {
  test::FakeToolbox box{"emulator"};
  VirtualDevices virtuals(box.resolver, box.runner);
  virtuals.launch("Pixel_7_API_34", DeviceType::AndroidEmulator);

  ASSERT_EQ(box.runner.calls.back().args, (std::vector<std::string>{"-avd", "Pixel_7_API_34"}));
  ASSERT_FALSE(box.runner.calls.back().options.timeout.has_value());
}

TEST(VirtualDevices, AlreadyBootedSimulatorIsSuccess) {
  test::FakeToolbox box{"xcrun"};
  box.runner.on("simctl boot 5A1C", process_lib::ProcessResult{"",
      "An error was encountered processing the command (domain=com.apple.CoreSimulator.SimError, code=405):\n"
      "Unable to boot device in current state: Booted\n", 149});
  box.runner.on("-a Simulator", process_lib::ProcessResult{});

  VirtualDevices virtuals(box.resolver, box.runner);
  ASSERT_NO_THROW(virtuals.launch("5A1C", DeviceType::IosSimulator));
  ASSERT_TRUE(box.runner.called("/usr/bin/open -a Simulator"));
}

TEST(VirtualDevices, BootFailureIsReported) {
  test::FakeToolbox box{"xcrun"};
  box.runner.on("simctl boot DEAD", process_lib::ProcessResult{"", "Invalid device: DEAD", 148});

  VirtualDevices virtuals(box.resolver, box.runner);
  ASSERT_THROW(virtuals.launch("DEAD", DeviceType::IosSimulator), process_lib::process_error);
  ASSERT_FALSE(box.runner.called("-a Simulator"));
}

TEST(VirtualDevices, PhysicalDeviceCannotBeLaunched) {
  test::FakeToolbox box{};
  VirtualDevices virtuals(box.resolver, box.runner);
  ASSERT_THROW(virtuals.launch("R58M123", DeviceType::AndroidDevice), std::invalid_argument);
}

#endif
