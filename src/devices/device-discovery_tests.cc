TEST(DeviceDiscovery, ParseAdbDevices) {
  auto devices = parseAdbDevices(
      "List of devices attached\n"
      "emulator-5554          device product:sdk_gphone64_x86_64 model:sdk_gphone64_x86_64 device:emu64x transport_id:1\n"
      "R58M123ABC             device usb:1-1 product:a51nsxx model:SM_A515F device:a51 transport_id:2\n"
      "0A1B2C3D               unauthorized usb:1-2 transport_id:3\n"
      "\n");

  ASSERT_EQ(devices.size(), 2u);
  ASSERT_EQ(devices[0].id, "emulator-5554");
  ASSERT_EQ(devices[0].type, DeviceType::AndroidEmulator);
  ASSERT_EQ(devices[0].name, "sdk gphone64 x86 64");
  ASSERT_EQ(devices[0].description, "emu64x");

  ASSERT_EQ(devices[1].id, "R58M123ABC");
  ASSERT_EQ(devices[1].type, DeviceType::AndroidDevice);
  ASSERT_EQ(devices[1].model, "SM A515F");
}

TEST(DeviceDiscovery, AdbDeviceWithoutModelUsesSerial) {
  auto devices = parseAdbDevices("192.168.1.20:5555\tdevice\n");
  ASSERT_EQ(devices.size(), 1u);
  ASSERT_EQ(devices[0].name, "192.168.1.20:5555");
}

TEST(DeviceDiscovery, ParseSimctlDevices) {
  auto sims = parseSimctlDevices(R"({
    "devices": {
      "com.apple.CoreSimulator.SimRuntime.iOS-17-0": [
        {"udid": "5A1C", "name": "iPhone 15", "state": "Booted", "isAvailable": true},
        {"udid": "7B2D", "name": "iPad Air", "state": "Shutdown", "isAvailable": true}
      ],
      "com.apple.CoreSimulator.SimRuntime.watchOS-10-0": [
        {"udid": "9C3E", "name": "Apple Watch", "state": "Shutdown", "isAvailable": false}
      ]
    }
  })");

  ASSERT_EQ(sims.size(), 2u);
  ASSERT_EQ(sims[0].udid, "5A1C");
  ASSERT_EQ(sims[0].runtime, "iOS 17.0");
  ASSERT_EQ(sims[1].state, "Shutdown");
}

TEST(DeviceDiscovery, RuntimeDisplayName) {
  ASSERT_EQ(runtimeDisplayName("com.apple.CoreSimulator.SimRuntime.iOS-17-0"), "iOS 17.0");
  ASSERT_EQ(runtimeDisplayName("com.apple.CoreSimulator.SimRuntime.tvOS-16-4"), "tvOS 16.4");
  ASSERT_EQ(runtimeDisplayName("custom"), "custom");
}

TEST(DeviceDiscovery, ParseInstalledAppsFormats) {
  auto apps = parseInstalledApps(
      "CFBundleIdentifier, CFBundleVersion, CFBundleDisplayName\n"
      "com.example.notes, \"2.1\", \"Notes Plus\"\n"
      "com.example.old - Old App 1.0\n"
      "com.example.tab\tTabbed\n"
      "com.example.bare\n"
      "Total: 4 apps\n");

  ASSERT_EQ(apps.size(), 4u);
  ASSERT_EQ(apps[0].bundleId, "com.example.notes");
  ASSERT_EQ(apps[0].name, "Notes Plus");
  ASSERT_EQ(apps[1].bundleId, "com.example.old");
  ASSERT_EQ(apps[1].name, "Old App 1.0");
  ASSERT_EQ(apps[2].name, "Tabbed");
  ASSERT_EQ(apps[3].name, "com.example.bare");
}

TEST(DeviceDiscovery, ParseSimulatorApps) {
  auto apps = parseSimulatorApps(
      "{\n"
      "    \"com.apple.Bridge\" =     {\n"
      "        ApplicationType = System;\n"
      "        CFBundleDisplayName = Watch;\n"
      "        CFBundleName = Bridge;\n"
      "        GroupContainers =         {\n"
      "            \"group.com.apple.bridge\" = \"file:///x/{y}\";\n"
      "        };\n"
      "        SBAppTags =         (\n"
      "        );\n"
      "    };\n"
      "    \"com.example.app\" =     {\n"
      "        CFBundleIdentifier = \"com.example.app\";\n"
      "        CFBundleName = \"Example App\";\n"
      "    };\n"
      "    \"com.example.nameless\" =     {\n"
      "        ApplicationType = User;\n"
      "    };\n"
      "}\n");

  ASSERT_EQ(apps.size(), 3u);
  ASSERT_EQ(apps[0].bundleId, "com.apple.Bridge");
  ASSERT_EQ(apps[0].name, "Watch");
  ASSERT_EQ(apps[1].name, "Example App");
  ASSERT_EQ(apps[2].name, "com.example.nameless");
}

TEST(DeviceDiscovery, ParseGetprop) {
  auto props = parseGetprop(
      "[ro.product.model]: [Pixel 7]\n"
      "[ro.build.version.release]: [14]\n"
      "[persist.empty]: []\n"
      "garbage\n");
  ASSERT_EQ(props.size(), 3u);
  ASSERT_EQ(props["ro.product.model"], "Pixel 7");
  ASSERT_EQ(props["persist.empty"], "");
}

#ifndef _WIN32

TEST(DeviceDiscovery, IosDeviceNameFallsBackToUdid) {
  test::FakeToolbox box{"idevice_id", "ideviceinfo"};
  box.runner.on("idevice_id -l", process_lib::ProcessResult{"00008030-AAAA\n00008030-BBBB\n", "", 0});
  box.runner.on("-u 00008030-AAAA -k DeviceName", process_lib::ProcessResult{"Kim's iPhone\n", "", 0});
  box.runner.on("-u 00008030-BBBB -k DeviceName", process_lib::ProcessResult{"", "ERROR: Could not connect", 255});

  DeviceDiscovery discovery(box.resolver, box.runner);
  auto devices = common::co_spawn_run_ret<std::vector<Device>>([&]() {
    return discovery.co_listIosDevices();
  });

  ASSERT_EQ(devices.size(), 2u);
  ASSERT_EQ(devices[0].name, "Kim's iPhone");
  ASSERT_EQ(devices[1].name, "00008030-BBBB");
  ASSERT_EQ(devices[1].type, DeviceType::IosDevice);
}

TEST(DeviceDiscovery, FailingPlatformDoesNotHideOthers) {
  // no ios tools at all
  test::FakeToolbox box{"adb"};
  box.runner.on("devices -l", process_lib::ProcessResult{"List of devices attached\nemulator-5554 device model:Pixel_7\n", "", 0});

  DeviceDiscovery discovery(box.resolver, box.runner);
  auto devices = discovery.listDevices();
  ASSERT_GE(devices.size(), 1u);
  ASSERT_EQ(devices[0].id, "emulator-5554");
  ASSERT_EQ(devices[0].name, "Pixel 7");
}

TEST(DeviceDiscovery, AppInstalledMatchesWholeBundleId) {
  test::FakeToolbox box{"ideviceinstaller"};
  box.runner.on("-u 00008030 -l", process_lib::ProcessResult{
      "CFBundleIdentifier, CFBundleVersion, CFBundleDisplayName\ncom.example.appx, \"1\", \"X\"\n", "", 0});

  DeviceDiscovery discovery(box.resolver, box.runner);
  ASSERT_FALSE(discovery.isIosAppInstalled("00008030", "com.example.app"));
  ASSERT_TRUE(discovery.isIosAppInstalled("00008030", "com.example.appx"));

  auto list = std::ranges::find_if(box.runner.calls, [](auto &c) {
    return common::contains(c.commandLine(), "-u 00008030 -l");
  });
  ASSERT_EQ(list->options.timeout, std::chrono::milliseconds(30000));
}

TEST(DeviceDiscovery, AppCheckTimeoutIsReported) {
  test::FakeToolbox box{"ideviceinstaller"};
  box.runner.on("-u 00008030 -l", [](const test::Invocation &) -> process_lib::ProcessResult {
    throw process_lib::timeout_error("timed out");
  });

  DeviceDiscovery discovery(box.resolver, box.runner);
  try {
    discovery.isIosAppInstalled("00008030", "com.example.app", std::chrono::seconds(2));
    FAIL() << "expected timeout_error";
  } catch (const process_lib::timeout_error &e) {
    ASSERT_TRUE(common::contains(e.what(), "within 2s"));
  }
}

TEST(DeviceDiscovery, PackagesDispatchOnType) {
  test::FakeToolbox box{"adb"};
  box.runner.on("pm list packages -3", process_lib::ProcessResult{"package:com.a\npackage:com.b\n", "", 0});

  DeviceDiscovery discovery(box.resolver, box.runner);
  auto packages = discovery.listPackages("emulator-5554", DeviceType::AndroidEmulator);
  ASSERT_EQ(packages.size(), 2u);
  ASSERT_EQ(packages[1].bundleId, "com.b");
}

#endif
