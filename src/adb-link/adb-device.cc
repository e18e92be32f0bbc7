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

#include "adb-device.h"
#include "sync.h"
#include "wire.h"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <ranges>

namespace adb_link {

adb_device::adb_device(
    ClientOption option,
    std::string serial,
    std::shared_ptr<device_extension> extension)
  : option_(std::move(option)),
    serial_(std::move(serial)),
    extension_(std::move(extension)) {}

adb_device::adb_device(
    ClientOption option,
    int64_t transportId,
    std::shared_ptr<device_extension> extension)
  : option_(std::move(option)),
    transportId_(transportId),
    extension_(std::move(extension)) {}

std::string adb_device::describe() const {
  if (serial_) {
    return *serial_;
  }
  return fmt::format("transport_id:{}", *transportId_);
}

std::unique_ptr<connection>
adb_device::open_transport(
    std::string_view command,
    std::optional<std::chrono::milliseconds> timeout) const {
  std::optional<connection::clock::time_point> deadline;
  if (timeout) {
    deadline = connection::clock::now() + *timeout;
  }

  auto conn = std::make_unique<connection>(option_, deadline);

  // selection and command must share the socket, the daemon keeps the
  // selected transport per connection
  if (transportId_) {
    conn->send_command(fmt::format("host:transport-id:{}", *transportId_));
  } else {
    conn->send_command(fmt::format("host:transport:{}", *serial_));
  }
  conn->check_okay();

  if (!command.empty()) {
    conn->send_command(command);
    conn->check_okay();
  }

  return conn;
}

std::string adb_device::host_query(std::string_view query) const {
  std::string command;
  if (transportId_) {
    command = fmt::format("host-transport-id:{}:{}", *transportId_, query);
  } else {
    command = fmt::format("host-serial:{}:{}", *serial_, query);
  }

  connection conn(option_);
  conn.send_command(command);
  conn.check_okay();
  return conn.read_string_block();
}

std::string adb_device::shell(
    std::string_view command,
    std::optional<std::chrono::milliseconds> timeout) const {
  auto conn = open_transport(fmt::format("shell,raw:{}", command), timeout);
  return conn->read_until_close();
}

std::string adb_device::shell(
    const std::vector<std::string> &args,
    std::optional<std::chrono::milliseconds> timeout) const {
  return shell(join_shell_args(args), timeout);
}

stream_handle adb_device::shell_stream(
    std::string_view command,
    std::optional<std::chrono::milliseconds> timeout) const {
  return open_transport(fmt::format("shell,raw:{}", command), timeout);
}

ShellResult adb_device::shell_v2(
    std::string_view command,
    std::optional<std::chrono::milliseconds> timeout) const {
  enum Id : uint8_t {
    kIdStdin = 0,
    kIdStdout = 1,
    kIdStderr = 2,
    kIdExit = 3,
  };

  constexpr size_t kHeaderSize = 5;

  auto conn = open_transport(fmt::format("shell,v2,raw:{}", command), timeout);

  ShellResult result;

  for (;;) {
    auto header = conn->read_exact(kHeaderSize);
    uint32_t packet_length = get_le32(header.data() + 1);
    auto data = conn->read_exact(packet_length);

    switch (static_cast<uint8_t>(header[0])) {
      case kIdStdout:
        result.output.append(data);
        break;
      case kIdStderr:
        result.errout.append(data);
        break;
      case kIdExit:
        result.exitCode = data.empty() ? 0 : static_cast<uint8_t>(data[0]);
        return result;
      default:
        spdlog::debug("shell v2: ignoring packet id {}", static_cast<int>(header[0]));
        break;
    }
  }
}

std::string adb_device::get_state() const {
  return host_query("get-state");
}

std::string adb_device::get_serialno() const {
  return host_query("get-serialno");
}

std::vector<std::string> adb_device::get_features() const {
  auto feature_str = host_query("features");

  std::vector<std::string> out;
  for (auto word : feature_str | std::views::split(',')) {
    std::string feature(word.begin(), word.end());
    if (!feature.empty()) {
      out.push_back(std::move(feature));
    }
  }
  return out;
}

std::string adb_device::getprop(std::string_view name) const {
  auto value = shell(fmt::format("getprop {}", quote_shell_arg(name)));
  while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) {
    value.pop_back();
  }
  return value;
}

adb_sync adb_device::sync() const {
  return adb_sync(*this);
}

device_extension& adb_device::extension(std::string_view operation) const {
  if (!extension_) {
    throw adb_error(fmt::format("{}: no device extension configured", operation));
  }
  return *extension_;
}

void adb_device::install(const std::filesystem::path &apk) const {
  extension("install").install(*this, apk);
}

void adb_device::uninstall(std::string_view package) const {
  extension("uninstall").uninstall(*this, package);
}

std::vector<char> adb_device::screenshot() const {
  return extension("screenshot").screenshot(*this);
}

std::optional<AppInfo> adb_device::app_info(std::string_view package) const {
  return extension("app_info").app_info(*this, package);
}

std::string quote_shell_arg(std::string_view arg) {
  if (arg.empty()) {
    return "''";
  }

  auto safe = [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '@' || c == '%' || c == '+' || c == '=' || c == ':' || c == ',' ||
           c == '.' || c == '/' || c == '-' || c == '_';
  };

  if (std::ranges::all_of(arg, safe)) {
    return std::string(arg);
  }

  // Escape any ' in the string (before we single-quote the whole thing).
  // The correct way to do this for the shell is to replace ' with '\'' --- that is,
  // close the existing single-quoted string, escape a single single-quote, and start
  // a new single-quoted string.
  std::string result;
  result.push_back('\'');

  size_t base = 0;
  while (true) {
    size_t found = arg.find('\'', base);
    result.append(arg, base, found == arg.npos ? arg.npos : found - base);
    if (found == arg.npos) break;
    result.append("'\\''");
    base = found + 1;
  }

  result.push_back('\'');
  return result;
}

std::string join_shell_args(const std::vector<std::string> &args) {
  std::string cmd;
  for (const auto &arg : args) {
    if (!cmd.empty()) {
      cmd.push_back(' ');
    }
    cmd += quote_shell_arg(arg);
  }
  return cmd;
}

} // namespace adb_link
