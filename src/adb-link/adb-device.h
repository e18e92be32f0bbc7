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
#include "device-extension.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adb_link {

class adb_sync;

struct ShellResult {
  uint8_t exitCode{0};
  std::string output;
  std::string errout;
};

// live shell connection, read with read_some() or read_until_close()
using stream_handle = std::unique_ptr<connection>;

// Handle on one device, addressed by serial or by transport id. It holds
// no connection: every call opens its own session, selects the device
// and then issues the operation on that same socket.
class adb_device {
public:
  adb_device(
      ClientOption option,
      std::string serial,
      std::shared_ptr<device_extension> extension = nullptr);

  adb_device(
      ClientOption option,
      int64_t transportId,
      std::shared_ptr<device_extension> extension = nullptr);

  const std::optional<std::string>& serial() const { return serial_; }
  std::optional<int64_t> transport_id() const { return transportId_; }
  const ClientOption& option() const { return option_; }

  // "serial" or "transport_id:N", for messages
  std::string describe() const;

  // connect, select this device, then send `command` if not empty.
  // the timeout bounds everything done on the returned connection.
  std::unique_ptr<connection> open_transport(
      std::string_view command = {},
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  std::string shell(
      std::string_view command,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  std::string shell(
      const std::vector<std::string> &args,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  // the timeout bounds every read on the returned stream as well
  stream_handle shell_stream(
      std::string_view command,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  ShellResult shell_v2(
      std::string_view command,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  std::string get_state() const;

  std::string get_serialno() const;

  std::vector<std::string> get_features() const;

  std::string getprop(std::string_view name) const;

  adb_sync sync() const;

  void install(const std::filesystem::path &apk) const;

  void uninstall(std::string_view package) const;

  std::vector<char> screenshot() const;

  std::optional<AppInfo> app_info(std::string_view package) const;

private:
  std::string host_query(std::string_view query) const;

  device_extension& extension(std::string_view operation) const;

  ClientOption option_;
  std::optional<std::string> serial_;
  std::optional<int64_t> transportId_;
  std::shared_ptr<device_extension> extension_;
};

// single-quote an argument when the shell would otherwise split or expand it
std::string quote_shell_arg(std::string_view arg);

std::string join_shell_args(const std::vector<std::string> &args);

} // namespace adb_link
