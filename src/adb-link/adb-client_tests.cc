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

#include "adb-client.h"
#include "fake-daemon.h"
#include "server-launcher.h"
#include "wire.h"
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace adb_link;
using adb_link::test_support::fake_daemon;

namespace {

std::vector<std::string> serials_of(const std::vector<adb_device> &devices) {
  std::vector<std::string> out;
  for (const auto &dev : devices) {
    out.push_back(dev.serial().value_or(""));
  }
  return out;
}

// a loopback port nobody listens on
std::string unused_port() {
  asio::io_context io;
  asio::ip::tcp::acceptor acceptor(io, {asio::ip::make_address("127.0.0.1"), 0});
  return std::to_string(acceptor.local_endpoint().port());
}

class AdbClient : public ::testing::Test {
protected:
  void SetUp() override {
    ::unsetenv("ANDROID_SERIAL");
  }

  void TearDown() override {
    ::unsetenv("ANDROID_SERIAL");
  }

  fake_daemon daemon_;
  adb_client client_{daemon_.option()};
};

} // namespace

TEST(DeviceList, ParseKeepsOrderAndDropsShortLines) {
  auto devices = parse_device_list(
    "AAA\tdevice\n"
    "BBB\toffline\n"
    "\n"
    "lonely\n"
    "CCC\tunauthorized\n", false);

  ASSERT_EQ(devices.size(), 3u);
  ASSERT_EQ(devices[0].serial, "AAA");
  ASSERT_EQ(devices[0].state, DeviceState::Device);
  ASSERT_EQ(devices[1].serial, "BBB");
  ASSERT_EQ(devices[1].state, DeviceState::Offline);
  ASSERT_EQ(devices[2].serial, "CCC");
  ASSERT_EQ(devices[2].state, DeviceState::Unauthorized);
  ASSERT_TRUE(devices[0].tags.empty());
}

TEST(DeviceList, ParseCrLfAndLeadingBlanks) {
  auto devices = parse_device_list("  AAA   device\r\nBBB\trecovery\r\n", false);

  ASSERT_EQ(devices.size(), 2u);
  ASSERT_EQ(devices[0].serial, "AAA");
  ASSERT_EQ(devices[0].stateName, "device");
  ASSERT_EQ(devices[1].state, DeviceState::Recovery);
}

TEST(DeviceList, ParseExtendedTags) {
  auto devices = parse_device_list(
    "emulator-5554          device product:sdk_gphone64 model:Pixel_7 device:emu64a transport_id:3\n",
    true);

  ASSERT_EQ(devices.size(), 1u);
  const auto &dev = devices[0];
  ASSERT_EQ(dev.serial, "emulator-5554");
  ASSERT_EQ(dev.tags.size(), 4u);
  ASSERT_EQ(dev.tags.at("model"), "Pixel_7");
  ASSERT_EQ(dev.transportId(), 3);
}

TEST(DeviceList, MalformedTagIsSkipped) {
  auto devices = parse_device_list("X device usb:1-1 junk product:a:b\n", true);

  ASSERT_EQ(devices.size(), 1u);
  ASSERT_EQ(devices[0].tags.size(), 2u);
  ASSERT_EQ(devices[0].tags.at("usb"), "1-1");
  // split at the first ':' only
  ASSERT_EQ(devices[0].tags.at("product"), "a:b");
  ASSERT_FALSE(devices[0].transportId().has_value());
}

TEST(DeviceList, TagsIgnoredWithoutExtended) {
  auto devices = parse_device_list("X device product:a\n", false);

  ASSERT_EQ(devices.size(), 1u);
  ASSERT_TRUE(devices[0].tags.empty());
}

TEST(DeviceList, NoPermissionsState) {
  auto devices = parse_device_list("0123456789ABCDEF\tno permissions (user in plugdev group)\n", false);

  ASSERT_EQ(devices.size(), 1u);
  ASSERT_EQ(devices[0].state, DeviceState::NoPermissions);
  ASSERT_EQ(parse_device_state("sideload"), DeviceState::Sideload);
  ASSERT_EQ(parse_device_state("whatever"), DeviceState::Unknown);
  ASSERT_EQ(to_string(DeviceState::Bootloader), "bootloader");
}

TEST(DeviceList, TrailingNewlineAndEmptyPieces) {
  auto devices = parse_device_list("AAA\tdevice\nBBB\toffline\n", false);
  ASSERT_EQ(devices.size(), 2u);
  ASSERT_EQ(devices[1].serial, "BBB");

  ASSERT_TRUE(parse_device_list("\n", false).empty());
  ASSERT_TRUE(parse_device_list("\n\n", true).empty());
  ASSERT_TRUE(parse_device_list("", false).empty());

  auto last = parse_device_list("\nAAA\tdevice", false);
  ASSERT_EQ(last.size(), 1u);
  ASSERT_EQ(last[0].serial, "AAA");
}

TEST_F(AdbClient, ListReturnsEveryState) {
  daemon_.add_device("AAA");
  daemon_.add_device("BBB", "offline");

  auto devices = client_.list();
  ASSERT_EQ(devices.size(), 2u);
  ASSERT_EQ(devices[1].state, DeviceState::Offline);
  ASSERT_EQ(daemon_.commands(), std::vector<std::string>{"host:devices"});
}

TEST_F(AdbClient, ListExtended) {
  daemon_.add_device("AAA", "device", "product:p model:m", 7);

  auto devices = client_.list(true);
  ASSERT_EQ(devices.size(), 1u);
  ASSERT_EQ(devices[0].tags.at("model"), "m");
  ASSERT_EQ(devices[0].transportId(), 7);
  ASSERT_EQ(daemon_.commands(), std::vector<std::string>{"host:devices-l"});
}

TEST_F(AdbClient, IterDeviceOnlyYieldsReadyDevices) {
  daemon_.set_device_listing("AAA\tdevice\nBBB\toffline\nCCC\tdevice\n");

  auto devices = client_.device_list();
  ASSERT_EQ(serials_of(devices), (std::vector<std::string>{"AAA", "CCC"}));
}

TEST_F(AdbClient, IterDeviceQueriesOnFirstPull) {
  daemon_.add_device("AAA");

  auto range = client_.iter_device();
  ASSERT_TRUE(daemon_.commands().empty());

  auto first = range.next();
  ASSERT_TRUE(first.has_value());
  ASSERT_EQ(first->serial(), "AAA");
  ASSERT_FALSE(range.next().has_value());
  ASSERT_EQ(daemon_.commands().size(), 1u);
}

TEST_F(AdbClient, IterDeviceEmpty) {
  auto range = client_.iter_device();
  ASSERT_TRUE(range.begin() == range.end());
}

TEST_F(AdbClient, ExplicitSerialWinsWithoutQuery) {
  ::setenv("ANDROID_SERIAL", "CCC", 1);

  auto dev = client_.device("AAA");
  ASSERT_EQ(dev.serial(), "AAA");
  ASSERT_TRUE(daemon_.commands().empty());
}

TEST_F(AdbClient, TransportIdBeforeEnvironment) {
  ::setenv("ANDROID_SERIAL", "CCC", 1);

  auto dev = client_.device(std::nullopt, 5);
  ASSERT_FALSE(dev.serial().has_value());
  ASSERT_EQ(dev.transport_id(), 5);
  ASSERT_EQ(dev.describe(), "transport_id:5");
}

TEST_F(AdbClient, EnvironmentBeforeAutoDetect) {
  daemon_.add_device("AAA");
  daemon_.add_device("BBB");
  ::setenv("ANDROID_SERIAL", "CCC", 1);

  auto dev = client_.device();
  ASSERT_EQ(dev.serial(), "CCC");
  ASSERT_TRUE(daemon_.commands().empty());
}

TEST_F(AdbClient, AutoDetectSingleDevice) {
  daemon_.add_device("AAA");
  daemon_.add_device("BBB", "offline");

  auto dev = client_.device();
  ASSERT_EQ(dev.serial(), "AAA");
}

TEST_F(AdbClient, AutoDetectNoDevice) {
  daemon_.add_device("BBB", "unauthorized");

  ASSERT_THROW(client_.device(), no_device_error);
}

TEST_F(AdbClient, AutoDetectAmbiguous) {
  daemon_.add_device("AAA");
  daemon_.add_device("CCC");

  ASSERT_THROW(client_.device(), ambiguous_device_error);
}

TEST_F(AdbClient, ServerVersion) {
  ASSERT_EQ(client_.server_version(), 0x29);
}

TEST_F(AdbClient, ConnectAndDisconnect) {
  ASSERT_EQ(client_.connect("192.168.1.20:5555"), "connected to 192.168.1.20:5555");
  ASSERT_EQ(client_.disconnect("192.168.1.20:5555"), "disconnected 192.168.1.20:5555");

  auto cmds = daemon_.commands();
  ASSERT_EQ(cmds.size(), 2u);
  ASSERT_EQ(cmds[0], "host:connect:192.168.1.20:5555");
  ASSERT_EQ(cmds[1], "host:disconnect:192.168.1.20:5555");
}

TEST_F(AdbClient, WaitForReadyDevice) {
  daemon_.add_device("AAA");

  ASSERT_NO_THROW(client_.wait_for(std::nullopt, "device", std::chrono::seconds(5)));
  ASSERT_NO_THROW(client_.wait_for("AAA", "device", std::chrono::seconds(5)));
  ASSERT_EQ(daemon_.commands().back(), "host-serial:AAA:wait-for-any-device");
}

TEST_F(AdbClient, WaitForTimesOut) {
  ASSERT_THROW(client_.wait_for(std::nullopt, "device", std::chrono::milliseconds(200)), timeout_error);
}

TEST_F(AdbClient, ServerKillNeverThrows) {
  client_.server_kill();
  ASSERT_EQ(daemon_.commands(), std::vector<std::string>{"host:kill"});

  auto option = daemon_.option();
  option.port = unused_port();
  adb_client(option).server_kill();
}

TEST_F(AdbClient, UnreachableServer) {
  auto option = daemon_.option();
  option.port = unused_port();

  ASSERT_THROW(adb_client(option).list(), connection_error);
}

TEST_F(AdbClient, ServerByHostName) {
  auto option = daemon_.option();
  option.server = "localhost";

  ASSERT_EQ(adb_client(option).server_version(), 0x29);
}

TEST_F(AdbClient, FailReasonIsVerbatim) {
  daemon_.set_raw_reply("host:version", "FAIL" + encode_command("device offline (x)"));

  try {
    client_.server_version();
    FAIL() << "expected protocol_error";
  } catch (const protocol_error &e) {
    ASSERT_STREQ(e.what(), "device offline (x)");
  }
}

TEST_F(AdbClient, BadLengthPrefix) {
  daemon_.set_raw_reply("host:version", "OKAY00zz");

  ASSERT_THROW(client_.server_version(), framing_error);
}

TEST_F(AdbClient, ClosedMidFrame) {
  daemon_.set_raw_reply("host:devices", "OKAY0010abc");

  ASSERT_THROW(client_.list(), framing_error);
}

TEST_F(AdbClient, UnknownStatus) {
  daemon_.set_raw_reply("host:devices", "WHAT");

  ASSERT_THROW(client_.list(), framing_error);
}

TEST(ServerLauncher, AdbPathFromEnvironment) {
  ::setenv("ADB_LINK_ADB_PATH", "/opt/platform-tools/adb", 1);
  auto path = find_adb_executable();
  ::unsetenv("ADB_LINK_ADB_PATH");

  ASSERT_EQ(path, std::filesystem::path("/opt/platform-tools/adb"));
}

TEST(ServerLauncher, LaunchedOncePerServerWithItsPort) {
  namespace fs = std::filesystem;

  auto dir = fs::temp_directory_path() / fmt::format("adb-link-launch-{}", ::getpid());
  fs::create_directories(dir);
  auto script = dir / "adb";
  auto calls = dir / "calls";
  {
    // records its arguments and exits without acknowledging
    std::ofstream out(script);
    out << "#!/bin/sh\nprintf '%s\\n' \"$*\" >> '" << calls.string() << "'\n";
  }
  fs::permissions(script, fs::perms::owner_all);
  ::setenv("ADB_LINK_ADB_PATH", script.c_str(), 1);

  ClientOption option;
  option.port = unused_port();
  option.launchServerIfNeed = true;

  EXPECT_THROW(adb_client(option).server_version(), connection_error);
  EXPECT_THROW(adb_client(option).list(), connection_error);
  ::unsetenv("ADB_LINK_ADB_PATH");

  std::vector<std::string> lines;
  {
    std::ifstream in(calls);
    for (std::string line; std::getline(in, line);) {
      lines.push_back(line);
    }
  }
  fs::remove_all(dir);

  ASSERT_EQ(lines.size(), 1u);
  ASSERT_EQ(lines[0].rfind(fmt::format("-P {} fork-server server --reply-fd ", option.port), 0), 0u);
}
