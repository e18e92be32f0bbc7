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
#include "sync.h"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <charconv>
#include <cstdlib>
#include <ranges>
#include <regex>

namespace adb_link {

namespace {

struct StateName {
  DeviceState state;
  std::string_view name;
};

constexpr StateName kStateNames[] = {
  {DeviceState::Device, "device"},
  {DeviceState::Offline, "offline"},
  {DeviceState::Unauthorized, "unauthorized"},
  {DeviceState::Bootloader, "bootloader"},
  {DeviceState::Recovery, "recovery"},
  {DeviceState::Sideload, "sideload"},
  {DeviceState::Authorizing, "authorizing"},
  {DeviceState::Connecting, "connecting"},
  {DeviceState::NoPermissions, "no permissions"},
  {DeviceState::Host, "host"},
  {DeviceState::Unknown, "unknown"},
};

} // namespace

DeviceState parse_device_state(std::string_view state) {
  // adb prints "no permissions (...)" of which a whitespace split keeps "no"
  if (state == "no") {
    return DeviceState::NoPermissions;
  }

  for (const auto &entry : kStateNames) {
    if (entry.name == state) {
      return entry.state;
    }
  }
  return DeviceState::Unknown;
}

std::string_view to_string(DeviceState state) {
  for (const auto &entry : kStateNames) {
    if (entry.state == state) {
      return entry.name;
    }
  }
  return "unknown";
}

std::optional<int64_t> DeviceInfo::transportId() const {
  auto it = tags.find("transport_id");
  if (it == tags.end()) {
    return std::nullopt;
  }

  int64_t id = 0;
  const auto &s = it->second;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), id);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return id;
}

std::vector<DeviceInfo> parse_device_list(std::string_view text, bool extended) {
  auto v = text
           | std::views::split('\n')
           | std::views::transform([](auto word) {
               return std::string_view(word.begin(), word.end());
             });

  std::regex ws_re("\\s+");

  std::vector<DeviceInfo> out;

  for (auto line : v) {
    if (line.empty()) {
      continue;
    }

    std::regex_token_iterator<std::string_view::const_iterator> first {line.begin(), line.end(), ws_re, -1}, last;
    std::vector<std::string> items;
    for (; first != last; ++first) {
      if (first->length() > 0) {
        items.push_back(first->str());
      }
    }

    if (items.size() < 2) {
      continue;
    }

    DeviceInfo dev;
    dev.serial = std::move(items[0]);
    dev.stateName = std::move(items[1]);
    dev.state = parse_device_state(dev.stateName);

    if (extended) {
      for (size_t i = 2; i < items.size(); i++) {
        auto pos = items[i].find(':');
        if (pos == std::string::npos) {
          spdlog::warn("device {}: skipping malformed tag '{}'", dev.serial, items[i]);
          continue;
        }
        dev.tags[items[i].substr(0, pos)] = items[i].substr(pos + 1);
      }
    }

    out.push_back(std::move(dev));
  }

  return out;
}

adb_client::adb_client(ClientOption option)
  : option_(std::move(option)) {}

std::unique_ptr<connection>
adb_client::make_connection(std::optional<std::chrono::milliseconds> timeout) const {
  std::optional<connection::clock::time_point> deadline;
  if (timeout) {
    deadline = connection::clock::now() + *timeout;
  }
  return std::make_unique<connection>(option_, deadline);
}

std::string adb_client::host_query(
    std::string_view command,
    std::optional<std::chrono::milliseconds> timeout) const {
  auto conn = make_connection(timeout);
  conn->send_command(command);
  conn->check_okay();
  return conn->read_string_block();
}

std::vector<DeviceInfo> adb_client::list(bool extended) const {
  auto liststr = host_query(extended ? "host:devices-l" : "host:devices");
  return parse_device_list(liststr, extended);
}

lazy_range<adb_device> adb_client::iter_device() const {
  return lazy_range<adb_device>(
    [client = *this, infos = std::optional<std::vector<DeviceInfo>>(), index = size_t(0)]() mutable
        -> std::optional<adb_device> {
      if (!infos) {
        infos = client.list();
      }

      while (index < infos->size()) {
        const auto &info = (*infos)[index++];
        if (info.stateName == "device") {
          return adb_device(client.option_, info.serial, client.extension_);
        }
      }
      return std::nullopt;
    });
}

std::vector<adb_device> adb_client::device_list() const {
  return iter_device().collect<std::vector<adb_device>>();
}

adb_device adb_client::device(
    std::optional<std::string> serial,
    std::optional<int64_t> transportId) const {
  if (serial && !serial->empty()) {
    return adb_device(option_, std::move(*serial), extension_);
  }

  if (transportId) {
    return adb_device(option_, *transportId, extension_);
  }

  if (const char *env = ::getenv("ANDROID_SERIAL"); env && *env) {
    return adb_device(option_, std::string(env), extension_);
  }

  auto devices = device_list();
  if (devices.empty()) {
    throw no_device_error("can't find any android device/emulator");
  }
  if (devices.size() > 1) {
    throw ambiguous_device_error("more than one device/emulator, please specify the serial number");
  }
  return std::move(devices.front());
}

int adb_client::server_version() const {
  auto version = host_query("host:version");

  int value = 0;
  auto [ptr, ec] = std::from_chars(version.data(), version.data() + version.size(), value, 16);
  if (version.empty() || ec != std::errc() || ptr != version.data() + version.size()) {
    throw framing_error(fmt::format("bad server version '{}'", version));
  }
  return value;
}

void adb_client::server_kill() const noexcept {
  try {
    auto option = option_;
    option.launchServerIfNeed = false;

    connection conn(option);
    conn.send_command("host:kill");

    // The server might send OKAY, so consume that.
    conn.check_okay();
  } catch (const std::exception &e) {
    // a server that is already gone is what we wanted
    spdlog::debug("host:kill: {}", e.what());
  }
}

std::string adb_client::connect(
    std::string_view address,
    std::optional<std::chrono::milliseconds> timeout) const {
  return host_query(fmt::format("host:connect:{}", address), timeout);
}

std::string adb_client::disconnect(std::string_view address) const {
  return host_query(fmt::format("host:disconnect:{}", address));
}

void adb_client::wait_for(
    std::optional<std::string> serial,
    std::string_view state,
    std::optional<std::chrono::milliseconds> timeout) const {
  std::string command;
  if (serial && !serial->empty()) {
    command = fmt::format("host-serial:{}:wait-for-any-{}", *serial, state);
  } else {
    command = fmt::format("host:wait-for-any-{}", state);
  }

  auto conn = make_connection(timeout);
  conn->send_command(command);
  // once for the request, once when the device reached the state
  conn->check_okay();
  conn->check_okay();
}

std::string adb_client::shell(
    std::string_view serial,
    std::string_view command,
    std::optional<std::chrono::milliseconds> timeout) const {
  return device(std::string(serial)).shell(command, timeout);
}

adb_sync adb_client::sync(std::string_view serial) const {
  return device(std::string(serial)).sync();
}

} // namespace adb_link
