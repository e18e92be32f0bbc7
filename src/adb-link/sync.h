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
#include "lazy-range.h"
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adb_link {

struct FileStat {
  uint32_t mode{0};
  uint32_t size{0};
  uint32_t mtime{0};
  std::string path;

  // the daemon reports a missing path as an all-zero stat
  bool exists() const { return mode != 0; }
  bool isDir() const;
  bool isRegular() const;
};

struct DirEntry {
  std::string name;
  uint32_t mode{0};
  uint32_t size{0};
  uint32_t mtime{0};
};

// One connection switched into sync mode. Operations run one at a time:
// each starts from Ready, holds the session Busy until its DONE or FAIL
// frame, and returns it to Ready. A framing error closes the session.
// Lazy ranges returned here borrow the session and must be drained
// before the next operation.
class sync_session {
public:
  enum class State {
    Ready,
    Busy,
    Closed,
  };

  // `conn` must already have been switched with "sync:"
  explicit sync_session(std::unique_ptr<connection> conn);

  ~sync_session();

  sync_session(const sync_session&) = delete;
  sync_session& operator=(const sync_session&) = delete;

  State state() const { return state_; }

  FileStat stat(std::string_view path);

  lazy_range<DirEntry> iter_directory(std::string_view path);

  std::vector<DirEntry> list(std::string_view path);

  // returns the number of bytes sent
  size_t push(
      std::istream &source,
      std::string_view remote_path,
      uint32_t mode = 0644,
      std::optional<uint32_t> mtime = std::nullopt);

  size_t push_bytes(
      std::string_view data,
      std::string_view remote_path,
      uint32_t mode = 0644,
      std::optional<uint32_t> mtime = std::nullopt);

  // mode and mtime taken from the local file
  size_t push_file(
      const std::filesystem::path &local_path,
      std::string_view remote_path);

  // returns the number of bytes received
  size_t pull(std::string_view remote_path, std::ostream &sink);

  // a partial local file is removed when the transfer fails
  size_t pull_file(std::string_view remote_path, const std::filesystem::path &local_path);

  lazy_range<std::string> iter_content(std::string_view path);

  // sends QUIT when idle, then closes the socket
  void close();

private:
  // misuse errors leave the session as it was
  void check_ready(std::string_view path) const;

  void begin(uint32_t id, std::string_view path);

  void finish();

  [[noreturn]] void fail_remote(uint32_t length);

  std::optional<DirEntry> read_dent();

  std::optional<std::string> read_chunk();

  template <typename Function>
  auto guarded(Function &&f);

  std::unique_ptr<connection> conn_;
  State state_{State::Ready};
};

// Sync access to one device. Every call runs on a fresh sync_session;
// ranges keep their session alive until drained or destroyed.
class adb_sync {
public:
  explicit adb_sync(adb_device device);

  std::unique_ptr<sync_session> open() const;

  FileStat stat(std::string_view path) const;

  bool exists(std::string_view path) const;

  std::vector<DirEntry> list(std::string_view path) const;

  lazy_range<DirEntry> iter_directory(std::string_view path) const;

  size_t push(
      std::istream &source,
      std::string_view remote_path,
      uint32_t mode = 0644,
      std::optional<uint32_t> mtime = std::nullopt) const;

  size_t push_bytes(
      std::string_view data,
      std::string_view remote_path,
      uint32_t mode = 0644,
      std::optional<uint32_t> mtime = std::nullopt) const;

  size_t push_file(
      const std::filesystem::path &local_path,
      std::string_view remote_path) const;

  size_t pull(std::string_view remote_path, std::ostream &sink) const;

  size_t pull_file(std::string_view remote_path, const std::filesystem::path &local_path) const;

  lazy_range<std::string> iter_content(std::string_view path) const;

  std::vector<char> read_bytes(std::string_view path) const;

  std::string read_text(std::string_view path) const;

private:
  adb_device device_;
};

} // namespace adb_link
