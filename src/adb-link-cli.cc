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

#include "adb-link/adb-client.h"
#include "adb-link/log.h"
#include "adb-link/sync.h"
#include <gflags/gflags.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

using namespace adb_link;

using json = nlohmann::json;

#ifndef ADB_LINK_VERSION
#define ADB_LINK_VERSION "0.0.0"
#endif

DEFINE_string(server, "127.0.0.1",
                  "adb server host.");

DEFINE_string(port, "5037",
                  "adb server port.");

DEFINE_string(serial, "",
                  "target device serial, overrides ANDROID_SERIAL.");

DEFINE_int64(transport_id, 0,
                  "target device transport id.");

DEFINE_int32(timeout_ms, 0,
                  "bound on each socket operation, 0 for none.");

DEFINE_bool(extended, false,
                  "devices: list with key:value tags (host:devices-l).");

DEFINE_bool(pretty, false,
                  "pretty json output.");

DEFINE_bool(verbose, false,
                  "log protocol traffic to stderr.");

DEFINE_bool(no_launch, false,
                  "do not start the adb server when it is not running.");

namespace {

json
deviceInfoToJsonObject(const DeviceInfo &dev) {
  json jdev;

  jdev["serial"] = dev.serial;
  jdev["state"] = dev.stateName;
  if (auto id = dev.transportId()) jdev["transport_id"] = *id;
  if (!dev.tags.empty()) jdev["tags"] = dev.tags;

  return jdev;
}

json
fileStatToJsonObject(const FileStat &st) {
  json jst;

  jst["path"] = st.path;
  jst["exists"] = st.exists();
  jst["mode"] = st.mode;
  jst["size"] = st.size;
  jst["mtime"] = st.mtime;
  if (st.exists()) jst["type"] = st.isDir() ? "dir" : st.isRegular() ? "file" : "other";

  return jst;
}

json
dirEntryToJsonObject(const DirEntry &ent) {
  json jent;

  jent["name"] = ent.name;
  jent["mode"] = ent.mode;
  jent["size"] = ent.size;
  jent["mtime"] = ent.mtime;

  return jent;
}

void print_json(const json &j) {
  std::cout << j.dump(FLAGS_pretty ? 4 : -1) << std::endl;
}

ClientOption option_from_flags() {
  ClientOption option;
  option.server = FLAGS_server;
  option.port = FLAGS_port;
  if (FLAGS_timeout_ms > 0) {
    option.socketTimeout = std::chrono::milliseconds(FLAGS_timeout_ms);
  }
  option.launchServerIfNeed = !FLAGS_no_launch;
  return option;
}

adb_device target_device(const adb_client &client) {
  std::optional<std::string> serial;
  std::optional<int64_t> transportId;
  if (!FLAGS_serial.empty()) serial = FLAGS_serial;
  if (FLAGS_transport_id > 0) transportId = FLAGS_transport_id;
  return client.device(serial, transportId);
}

bool expect_args(const std::vector<std::string> &args, size_t n, const char *usage) {
  if (args.size() < n) {
    std::cerr << "usage: adb-link " << usage << std::endl;
    return false;
  }
  return true;
}

int run_command(const adb_client &client, const std::string &command, const std::vector<std::string> &args) {
  if (command == "version") {
    std::cout << "adb-link " << ADB_LINK_VERSION << std::endl;
    std::cout << "adb server version " << client.server_version() << std::endl;
    return 0;
  }

  if (command == "devices") {
    json jdevs = json::array();
    for (const auto &dev : client.list(FLAGS_extended)) {
      jdevs.push_back(deviceInfoToJsonObject(dev));
    }
    print_json(jdevs);
    return 0;
  }

  if (command == "connect" || command == "disconnect") {
    if (!expect_args(args, 1, "connect|disconnect <host[:port]>")) return 1;
    auto reply = command == "connect" ? client.connect(args[0]) : client.disconnect(args[0]);
    std::cout << reply << std::endl;
    return 0;
  }

  if (command == "kill-server") {
    client.server_kill();
    return 0;
  }

  auto device = target_device(client);

  if (command == "shell") {
    if (!expect_args(args, 1, "shell <command...>")) return 1;
    std::string cmd;
    for (const auto &arg : args) {
      if (!cmd.empty()) cmd.push_back(' ');
      cmd += arg;
    }
    auto output = device.shell(cmd);
    std::fwrite(output.data(), 1, output.size(), stdout);
    return 0;
  }

  if (command == "stat") {
    if (!expect_args(args, 1, "stat <remote-path>")) return 1;
    print_json(fileStatToJsonObject(device.sync().stat(args[0])));
    return 0;
  }

  if (command == "ls") {
    if (!expect_args(args, 1, "ls <remote-dir>")) return 1;
    json jents = json::array();
    for (auto &ent : device.sync().iter_directory(args[0])) {
      if (ent.name == "." || ent.name == "..") continue;
      jents.push_back(dirEntryToJsonObject(ent));
    }
    print_json(jents);
    return 0;
  }

  if (command == "push") {
    if (!expect_args(args, 2, "push <local> <remote>")) return 1;
    auto n = device.sync().push_file(args[0], args[1]);
    std::cerr << args[0] << ": " << n << " bytes pushed" << std::endl;
    return 0;
  }

  if (command == "pull") {
    if (!expect_args(args, 2, "pull <remote> <local>")) return 1;
    auto n = device.sync().pull_file(args[0], args[1]);
    std::cerr << args[0] << ": " << n << " bytes pulled" << std::endl;
    return 0;
  }

  if (command == "cat") {
    if (!expect_args(args, 1, "cat <remote-path>")) return 1;
    for (auto &chunk : device.sync().iter_content(args[0])) {
      std::fwrite(chunk.data(), 1, chunk.size(), stdout);
    }
    return 0;
  }

  std::cerr << "unknown command: " << command << std::endl;
  return 1;
}

} // namespace


int main(int argc, char *argv[]) {
  gflags::SetVersionString(ADB_LINK_VERSION);
  gflags::SetUsageMessage(
    "Sample usage:\n adb-link devices --extended --pretty\n"
    " adb-link --serial=emulator-5554 shell getprop ro.product.model\n"
    " adb-link push local.txt /data/local/tmp/remote.txt\n"
    "commands: devices, version, connect, disconnect, kill-server,\n"
    "          shell, stat, ls, push, pull, cat");

  gflags::ParseCommandLineFlags(&argc, &argv, true);

  init_logging(FLAGS_verbose ? spdlog::level::debug : spdlog::level::warn);

  if (argc < 2) {
    std::cerr << gflags::ProgramUsage() << std::endl;
    return 1;
  }

  std::string command = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  int ret = 1;
  try {
    adb_client client(option_from_flags());
    ret = run_command(client, command, args);
  } catch (const adb_error &e) {
    std::cerr << "adb-link: " << e.what() << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "adb-link: unexpected error: " << e.what() << std::endl;
  }

  shutdown_logging();
  return ret;
}
