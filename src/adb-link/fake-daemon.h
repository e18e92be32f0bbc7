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
#include "connection.h"
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace adb_link::test_support {

struct FakeFile {
  std::string data;
  uint32_t mode{0100644};
  uint32_t mtime{0};
};

struct ShellScript {
  std::string output;
  std::chrono::milliseconds delay{0};
};

struct ShellV2Script {
  std::string output;
  std::string errout;
  uint8_t exitCode{0};
};

// Server side of the adb host and sync protocols on an ephemeral loopback
// port, one thread per accepted connection. Devices, shell replies and
// files are in memory and shared by every connection.
class fake_daemon {
public:
  fake_daemon();

  ~fake_daemon();

  fake_daemon(const fake_daemon&) = delete;
  fake_daemon& operator=(const fake_daemon&) = delete;

  std::string port() const { return port_; }

  // points at this daemon, never launches a real server
  ClientOption option() const;

  void add_device(
      std::string serial,
      std::string state = "device",
      std::string tags = {},
      int64_t transportId = 0);

  // served verbatim for host:devices and host:devices-l
  void set_device_listing(std::string listing);

  void set_shell_output(
      std::string command,
      std::string output,
      std::chrono::milliseconds delay = std::chrono::milliseconds(0));

  void set_shell_v2(std::string command, ShellV2Script script);

  // the bytes are written as the whole reply, then the connection closes
  void set_raw_reply(std::string command, std::string bytes);

  void put_file(std::string path, std::string data, uint32_t mode = 0100644, uint32_t mtime = 0);

  void add_directory(std::string path);

  // SEND below this prefix answers FAIL
  void set_read_only(std::string prefix);

  std::optional<FakeFile> file(const std::string &path) const;

  // every request received over the command protocol, in arrival order
  std::vector<std::string> commands() const;

  // SEND transfers the daemon saw a DONE frame for
  int sends_done() const { return sendsDone_; }

private:
  struct Device {
    std::string serial;
    std::string state;
    std::string tags;
    int64_t transportId{0};
  };

  void accept_loop();

  void serve(std::shared_ptr<asio::ip::tcp::socket> sock);

  void serve_sync(asio::ip::tcp::socket &sock);

  bool serve_host_query(asio::ip::tcp::socket &sock, std::string_view command);

  void serve_shell(asio::ip::tcp::socket &sock, const std::string &command);

  void serve_shell_v2(asio::ip::tcp::socket &sock, const std::string &command);

  std::optional<Device> find_device(std::string_view serial) const;

  std::optional<Device> find_device(int64_t transportId) const;

  std::string device_listing(bool extended) const;

  asio::io_context io_;
  asio::ip::tcp::acceptor acceptor_;
  std::string port_;

  std::atomic<bool> stopping_{false};
  std::atomic<int> sendsDone_{0};
  std::thread acceptThread_;

  mutable std::mutex mutex_;
  std::vector<std::thread> workers_;
  std::vector<std::shared_ptr<asio::ip::tcp::socket>> sockets_;
  std::vector<Device> devices_;
  std::optional<std::string> listing_;
  std::map<std::string, ShellScript> shells_;
  std::map<std::string, ShellV2Script> shellsV2_;
  std::map<std::string, std::string> rawReplies_;
  std::map<std::string, FakeFile> files_;
  std::set<std::string> dirs_;
  std::vector<std::string> readOnly_;
  std::vector<std::string> commands_;
};

} // namespace adb_link::test_support
