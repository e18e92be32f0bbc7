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

#include "async-client.h"

namespace adb_link {

async_client::async_client(ClientOption option, size_t threads)
  : pool_(threads),
    client_(std::move(option)) {}

async_client::~async_client() {
  pool_.join();
}

asio::awaitable<std::vector<DeviceInfo>> async_client::co_list(bool extended) {
  return co_dispatch(pool_, [client = client_, extended] {
    return client.list(extended);
  });
}

asio::awaitable<std::vector<adb_device>> async_client::co_device_list() {
  return co_dispatch(pool_, [client = client_] {
    return client.device_list();
  });
}

asio::awaitable<adb_device> async_client::co_device(
    std::optional<std::string> serial,
    std::optional<int64_t> transportId) {
  return co_dispatch(pool_, [client = client_, serial = std::move(serial), transportId] {
    return client.device(serial, transportId);
  });
}

asio::awaitable<int> async_client::co_server_version() {
  return co_dispatch(pool_, [client = client_] {
    return client.server_version();
  });
}

asio::awaitable<void> async_client::co_server_kill() {
  return co_dispatch(pool_, [client = client_] {
    client.server_kill();
  });
}

asio::awaitable<void> async_client::co_wait_for(
    std::optional<std::string> serial,
    std::string state,
    std::optional<std::chrono::milliseconds> timeout) {
  return co_dispatch(pool_, [client = client_, serial = std::move(serial), state = std::move(state), timeout] {
    client.wait_for(serial, state, timeout);
  });
}

asio::awaitable<std::string> async_client::co_connect(std::string address) {
  return co_dispatch(pool_, [client = client_, address = std::move(address)] {
    return client.connect(address);
  });
}

asio::awaitable<std::string> async_client::co_disconnect(std::string address) {
  return co_dispatch(pool_, [client = client_, address = std::move(address)] {
    return client.disconnect(address);
  });
}

asio::awaitable<std::string> async_client::co_shell(
    adb_device device,
    std::string command,
    std::optional<std::chrono::milliseconds> timeout) {
  return co_dispatch(pool_, [device = std::move(device), command = std::move(command), timeout] {
    return device.shell(std::string_view(command), timeout);
  });
}

asio::awaitable<ShellResult> async_client::co_shell_v2(
    adb_device device,
    std::string command,
    std::optional<std::chrono::milliseconds> timeout) {
  return co_dispatch(pool_, [device = std::move(device), command = std::move(command), timeout] {
    return device.shell_v2(command, timeout);
  });
}

asio::awaitable<std::string> async_client::co_getprop(adb_device device, std::string name) {
  return co_dispatch(pool_, [device = std::move(device), name = std::move(name)] {
    return device.getprop(name);
  });
}

asio::awaitable<FileStat> async_client::co_stat(adb_device device, std::string path) {
  return co_dispatch(pool_, [device = std::move(device), path = std::move(path)] {
    return device.sync().stat(path);
  });
}

asio::awaitable<std::vector<DirEntry>>
async_client::co_list_directory(adb_device device, std::string path) {
  return co_dispatch(pool_, [device = std::move(device), path = std::move(path)] {
    return device.sync().list(path);
  });
}

asio::awaitable<size_t> async_client::co_push(
    adb_device device,
    std::filesystem::path local_path,
    std::string remote_path) {
  return co_dispatch(pool_,
    [device = std::move(device), local_path = std::move(local_path), remote_path = std::move(remote_path)] {
      return device.sync().push_file(local_path, remote_path);
    });
}

asio::awaitable<size_t> async_client::co_push_bytes(
    adb_device device,
    std::string data,
    std::string remote_path) {
  return co_dispatch(pool_,
    [device = std::move(device), data = std::move(data), remote_path = std::move(remote_path)] {
      return device.sync().push_bytes(data, remote_path);
    });
}

asio::awaitable<size_t> async_client::co_pull(
    adb_device device,
    std::string remote_path,
    std::filesystem::path local_path) {
  return co_dispatch(pool_,
    [device = std::move(device), remote_path = std::move(remote_path), local_path = std::move(local_path)] {
      return device.sync().pull_file(remote_path, local_path);
    });
}

asio::awaitable<std::vector<char>> async_client::co_read_bytes(adb_device device, std::string path) {
  return co_dispatch(pool_, [device = std::move(device), path = std::move(path)] {
    return device.sync().read_bytes(path);
  });
}

asio::awaitable<std::string> async_client::co_read_text(adb_device device, std::string path) {
  return co_dispatch(pool_, [device = std::move(device), path = std::move(path)] {
    return device.sync().read_text(path);
  });
}

asio::awaitable<void> async_client::co_install(adb_device device, std::filesystem::path apk) {
  return co_dispatch(pool_, [device = std::move(device), apk = std::move(apk)] {
    device.install(apk);
  });
}

asio::awaitable<void> async_client::co_uninstall(adb_device device, std::string package) {
  return co_dispatch(pool_, [device = std::move(device), package = std::move(package)] {
    device.uninstall(package);
  });
}

asio::awaitable<std::optional<AppInfo>>
async_client::co_app_info(adb_device device, std::string package) {
  return co_dispatch(pool_, [device = std::move(device), package = std::move(package)] {
    return device.app_info(package);
  });
}

asio::awaitable<std::vector<char>> async_client::co_screenshot(adb_device device) {
  return co_dispatch(pool_, [device = std::move(device)] {
    return device.screenshot();
  });
}

} // namespace adb_link
