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
#include "adb-device.h"
#include "fake-daemon.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <future>

using namespace adb_link;
using adb_link::test_support::fake_daemon;
using namespace std::chrono_literals;

namespace {

class recording_extension : public device_extension {
public:
  void install(const adb_device &device, const std::filesystem::path &apk) override {
    calls.push_back("install " + device.describe() + " " + apk.string());
  }

  void uninstall(const adb_device &device, std::string_view package) override {
    calls.push_back("uninstall " + device.describe() + " " + std::string(package));
  }

  std::vector<char> screenshot(const adb_device &) override {
    return {'\x89', 'P', 'N', 'G'};
  }

  std::optional<AppInfo> app_info(const adb_device &, std::string_view package) override {
    if (package != "com.example.app") {
      return std::nullopt;
    }
    return AppInfo{std::string(package), "1.2.3", 123, "/data/app/com.example.app/base.apk"};
  }

  std::vector<std::string> calls;
};

class AdbDevice : public ::testing::Test {
protected:
  void SetUp() override {
    daemon_.add_device("AAA");
    daemon_.add_device("BBB", "offline");
    daemon_.add_device("CCC");
  }

  adb_device device(const char *serial) {
    return adb_device(daemon_.option(), std::string(serial));
  }

  fake_daemon daemon_;
};

} // namespace

TEST(ShellArgs, QuoteOnlyWhenNeeded) {
  ASSERT_EQ(quote_shell_arg("ls"), "ls");
  ASSERT_EQ(quote_shell_arg("/sdcard/a-b_c.txt"), "/sdcard/a-b_c.txt");
  ASSERT_EQ(quote_shell_arg(""), "''");
  ASSERT_EQ(quote_shell_arg("my file"), "'my file'");
  ASSERT_EQ(quote_shell_arg("$HOME"), "'$HOME'");
  ASSERT_EQ(quote_shell_arg("it's"), "'it'\\''s'");
}

TEST(ShellArgs, Join) {
  ASSERT_EQ(join_shell_args({"ls", "-l", "my dir"}), "ls -l 'my dir'");
  ASSERT_EQ(join_shell_args({}), "");
}

TEST_F(AdbDevice, ShellSelectsDeviceOnTheSameConnection) {
  ASSERT_EQ(device("AAA").shell("echo hello"), "hello\n");

  auto cmds = daemon_.commands();
  ASSERT_EQ(cmds.size(), 2u);
  ASSERT_EQ(cmds[0], "host:transport:AAA");
  ASSERT_EQ(cmds[1], "shell,raw:echo hello");
}

TEST_F(AdbDevice, ShellByTransportId) {
  adb_device dev(daemon_.option(), int64_t(3));

  ASSERT_EQ(dev.shell("echo hi"), "hi\n");
  ASSERT_EQ(daemon_.commands().front(), "host:transport-id:3");
}

TEST_F(AdbDevice, ShellLargeOutput) {
  std::string big(300000, 'x');
  for (size_t i = 0; i < big.size(); i += 97) {
    big[i] = '\n';
  }
  daemon_.set_shell_output("cat /big", big);

  ASSERT_EQ(device("AAA").shell("cat /big"), big);
}

TEST_F(AdbDevice, ShellArgumentList) {
  daemon_.set_shell_output("touch '/sdcard/my file'", "");

  device("AAA").shell(std::vector<std::string>{"touch", "/sdcard/my file"});
  ASSERT_EQ(daemon_.commands().back(), "shell,raw:touch '/sdcard/my file'");
}

TEST_F(AdbDevice, UnknownDeviceReasonIsVerbatim) {
  try {
    device("ZZZ").shell("echo x");
    FAIL() << "expected protocol_error";
  } catch (const protocol_error &e) {
    ASSERT_STREQ(e.what(), "device 'ZZZ' not found");
  }
}

TEST_F(AdbDevice, OfflineDevice) {
  ASSERT_THROW(device("BBB").shell("echo x"), protocol_error);
}

TEST_F(AdbDevice, ShellTimeout) {
  daemon_.set_shell_output("sleep 1", "", 1000ms);

  auto start = std::chrono::steady_clock::now();
  ASSERT_THROW(device("AAA").shell("sleep 1", 100ms), timeout_error);
  ASSERT_LT(std::chrono::steady_clock::now() - start, 900ms);
}

TEST_F(AdbDevice, SocketTimeout) {
  daemon_.set_shell_output("sleep 1", "", 1000ms);

  auto option = daemon_.option();
  option.socketTimeout = 100ms;
  ASSERT_THROW(adb_device(option, std::string("AAA")).shell("sleep 1"), timeout_error);
}

TEST_F(AdbDevice, ConcurrentShellsAreIndependent) {
  daemon_.set_shell_output("work", "done\n", 200ms);

  auto ok = std::async(std::launch::async, [this] {
    return device("AAA").shell("work");
  });
  auto bad = std::async(std::launch::async, [this] {
    return device("ZZZ").shell("work");
  });
  auto other = std::async(std::launch::async, [this] {
    return device("CCC").shell("echo ccc");
  });

  ASSERT_THROW(bad.get(), protocol_error);
  ASSERT_EQ(other.get(), "ccc\n");
  ASSERT_EQ(ok.get(), "done\n");
}

TEST_F(AdbDevice, ShellStream) {
  daemon_.set_shell_output("logcat -d", "line 1\nline 2\n");

  auto stream = device("AAA").shell_stream("logcat -d");

  std::string got;
  char buf[4];
  for (;;) {
    auto n = stream->read_some(buf, sizeof(buf));
    if (n == 0) {
      break;
    }
    got.append(buf, n);
  }

  ASSERT_EQ(got, "line 1\nline 2\n");
  ASSERT_EQ(stream->read_some(buf, sizeof(buf)), 0u);
}

TEST_F(AdbDevice, ShellStreamTimeout) {
  daemon_.set_shell_output("logcat", "late\n", 1000ms);

  auto stream = device("AAA").shell_stream("logcat", 100ms);

  char buf[16];
  auto start = std::chrono::steady_clock::now();
  ASSERT_THROW(stream->read_some(buf, sizeof(buf)), timeout_error);
  ASSERT_LT(std::chrono::steady_clock::now() - start, 900ms);
  ASSERT_FALSE(stream->is_open());
}

TEST_F(AdbDevice, ShellV2ExitCode) {
  daemon_.set_shell_v2("ls /nope", {"", "ls: /nope: No such file or directory\n", 1});
  daemon_.set_shell_v2("id -u", {"2000\n", "", 0});

  auto failed = device("AAA").shell_v2("ls /nope");
  ASSERT_EQ(failed.exitCode, 1);
  ASSERT_TRUE(failed.output.empty());
  ASSERT_EQ(failed.errout, "ls: /nope: No such file or directory\n");

  auto ok = device("AAA").shell_v2("id -u");
  ASSERT_EQ(ok.exitCode, 0);
  ASSERT_EQ(ok.output, "2000\n");
}

TEST_F(AdbDevice, HostQueries) {
  ASSERT_EQ(device("AAA").get_state(), "device");
  ASSERT_EQ(device("CCC").get_serialno(), "CCC");

  auto features = device("AAA").get_features();
  ASSERT_NE(std::find(features.begin(), features.end(), "shell_v2"), features.end());

  ASSERT_EQ(daemon_.commands().front(), "host-serial:AAA:get-state");
}

TEST_F(AdbDevice, Getprop) {
  daemon_.set_shell_output("getprop ro.product.model", "Pixel 7\r\n");

  ASSERT_EQ(device("AAA").getprop("ro.product.model"), "Pixel 7");
}

TEST_F(AdbDevice, ExtensionOperations) {
  auto ext = std::make_shared<recording_extension>();
  adb_client client(daemon_.option());
  client.set_device_extension(ext);

  auto dev = client.device("AAA");
  dev.install("/tmp/app.apk");
  dev.uninstall("com.example.app");

  ASSERT_EQ(ext->calls, (std::vector<std::string>{
    "install AAA /tmp/app.apk",
    "uninstall AAA com.example.app",
  }));
  ASSERT_EQ(dev.screenshot().size(), 4u);
  ASSERT_EQ(dev.app_info("com.example.app")->versionCode, 123);
  ASSERT_FALSE(dev.app_info("com.example.other").has_value());
}

TEST_F(AdbDevice, ExtensionMissing) {
  ASSERT_THROW(device("AAA").install("/tmp/app.apk"), adb_error);
  ASSERT_THROW(device("AAA").screenshot(), adb_error);
}

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"

TEST_F(AdbDevice, DeprecatedClientShell) {
  adb_client client(daemon_.option());

  ASSERT_EQ(client.shell("CCC", "echo legacy"), "legacy\n");
  ASSERT_EQ(daemon_.commands().front(), "host:transport:CCC");
}

#pragma GCC diagnostic pop
