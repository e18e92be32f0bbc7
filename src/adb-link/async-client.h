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
#include "adb-client.h"
#include "dispatch.h"
#include "sync.h"
#include <asio/awaitable.hpp>
#include <asio/thread_pool.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace adb_link {

// Awaitable front end of adb_client. Each co_* call runs the blocking
// operation on the pool and resumes the caller on its own executor.
// Abandoning the awaiting coroutine does not stop the exchange already
// running on the pool.
class async_client {
public:
  explicit async_client(ClientOption option = {}, size_t threads = 4);

  ~async_client();

  async_client(const async_client&) = delete;
  async_client& operator=(const async_client&) = delete;

  adb_client& client() { return client_; }
  asio::thread_pool& pool() { return pool_; }

  asio::awaitable<std::vector<DeviceInfo>> co_list(bool extended = false);

  asio::awaitable<std::vector<adb_device>> co_device_list();

  asio::awaitable<adb_device> co_device(
      std::optional<std::string> serial = std::nullopt,
      std::optional<int64_t> transportId = std::nullopt);

  asio::awaitable<int> co_server_version();

  asio::awaitable<void> co_server_kill();

  asio::awaitable<void> co_wait_for(
      std::optional<std::string> serial = std::nullopt,
      std::string state = "device",
      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  asio::awaitable<std::string> co_connect(std::string address);

  asio::awaitable<std::string> co_disconnect(std::string address);

  asio::awaitable<std::string> co_shell(
      adb_device device,
      std::string command,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  asio::awaitable<ShellResult> co_shell_v2(
      adb_device device,
      std::string command,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  asio::awaitable<std::string> co_getprop(adb_device device, std::string name);

  asio::awaitable<FileStat> co_stat(adb_device device, std::string path);

  asio::awaitable<std::vector<DirEntry>> co_list_directory(adb_device device, std::string path);

  asio::awaitable<size_t> co_push(
      adb_device device,
      std::filesystem::path local_path,
      std::string remote_path);

  asio::awaitable<size_t> co_push_bytes(
      adb_device device,
      std::string data,
      std::string remote_path);

  asio::awaitable<size_t> co_pull(
      adb_device device,
      std::string remote_path,
      std::filesystem::path local_path);

  // whole remote file in memory
  asio::awaitable<std::vector<char>> co_read_bytes(adb_device device, std::string path);

  asio::awaitable<std::string> co_read_text(adb_device device, std::string path);

  asio::awaitable<void> co_install(adb_device device, std::filesystem::path apk);

  asio::awaitable<void> co_uninstall(adb_device device, std::string package);

  asio::awaitable<std::optional<AppInfo>> co_app_info(adb_device device, std::string package);

  asio::awaitable<std::vector<char>> co_screenshot(adb_device device);

private:
  asio::thread_pool pool_;
  adb_client client_;
};

} // namespace adb_link
