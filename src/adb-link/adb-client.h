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
#include "adb-device.h"
#include "connection.h"
#include "device-extension.h"
#include "lazy-range.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adb_link {

class adb_sync;

enum class DeviceState {
  Device,
  Offline,
  Unauthorized,
  Bootloader,
  Recovery,
  Sideload,
  Authorizing,
  Connecting,
  NoPermissions,
  Host,
  Unknown,
};

DeviceState parse_device_state(std::string_view state);

std::string_view to_string(DeviceState state);

struct DeviceInfo {
  std::string serial;
  DeviceState state{DeviceState::Unknown};
  // the token as listed, also for states not in DeviceState
  std::string stateName;
  // key:value tokens of "host:devices-l", empty otherwise
  std::map<std::string, std::string> tags;

  std::optional<int64_t> transportId() const;
};

// Parses a device listing, one device per line. Lines with fewer than two
// whitespace separated tokens are dropped. With `extended` every further
// token is split at its first ':' into a tag; tokens without ':' are skipped.
std::vector<DeviceInfo> parse_device_list(std::string_view text, bool extended);

class adb_client {
public:
  explicit adb_client(ClientOption option = {});

  const ClientOption& option() const { return option_; }

  // handed to every adb_device this client creates
  void set_device_extension(std::shared_ptr<device_extension> extension) {
    extension_ = std::move(extension);
  }

  std::unique_ptr<connection> make_connection(
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  // every listed device, whatever its state
  std::vector<DeviceInfo> list(bool extended = false) const;

  // devices in state "device", in listing order. the first pull runs a
  // fresh discovery, the range never reflects later changes.
  lazy_range<adb_device> iter_device() const;

  std::vector<adb_device> device_list() const;

  // explicit serial, then transport id, then ANDROID_SERIAL, then the
  // single connected device
  adb_device device(
      std::optional<std::string> serial = std::nullopt,
      std::optional<int64_t> transportId = std::nullopt) const;

  int server_version() const;

  void server_kill() const noexcept;

  std::string connect(
      std::string_view address,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  std::string disconnect(std::string_view address) const;

  void wait_for(
      std::optional<std::string> serial = std::nullopt,
      std::string_view state = "device",
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  [[deprecated("resolve with device(serial) and call shell on the handle")]]
  std::string shell(
      std::string_view serial,
      std::string_view command,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  [[deprecated("resolve with device(serial) and call sync on the handle")]]
  adb_sync sync(std::string_view serial) const;

private:
  std::string host_query(
      std::string_view command,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  ClientOption option_;
  std::shared_ptr<device_extension> extension_;
};

} // namespace adb_link
