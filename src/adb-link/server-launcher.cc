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

#include "server-launcher.h"
#include "errors.h"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace adb_link {

namespace {

std::vector<std::filesystem::path>
get_sys_paths() {
  std::vector<std::filesystem::path> out;

  const auto *paths = ::getenv("PATH");
  if (paths) {
    for (;;) {
      const char *next = strchr(paths, ':');
      if (next) {
        out.push_back(std::filesystem::path(std::string(paths, next)));
      } else {
        out.push_back(std::filesystem::path(std::string(paths)));
        break;
      }
      paths = next + 1;
    }
  }

  return out;
}

} // namespace

std::filesystem::path find_adb_executable() {
  if (const char *env = ::getenv("ADB_LINK_ADB_PATH"); env && *env) {
    return std::filesystem::path(env);
  }

  for (auto &sys : get_sys_paths()) {
    auto path = sys / "adb";
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec)) {
      return path;
    }
  }

  return std::filesystem::path();
}

void launch_adb_server(const std::string &port) {
#ifdef _WIN32
  throw connection_error("launching the adb server is not supported on this platform");
#else
  auto adbpath = find_adb_executable();
  if (adbpath.empty()) {
    throw connection_error("adb not found");
  }

  spdlog::debug("launching adb server: {} -P {}", adbpath.string(), port);

  int ack_fd[2];
  if (::pipe(ack_fd) != 0) {
    throw connection_error(fmt::format("pipe failed: {}", strerror(errno)));
  }

  pid_t pid = fork();
  if (pid < 0) {
    ::close(ack_fd[0]);
    ::close(ack_fd[1]);
    throw connection_error(fmt::format("fork failed: {}", strerror(errno)));
  }

  if (pid == 0) {
    // child side of the fork
    ::close(ack_fd[0]);
    fcntl(ack_fd[1], F_SETFD, 0);

    char reply_fd[30];
    snprintf(reply_fd, sizeof(reply_fd), "%d", ack_fd[1]);
    execl(adbpath.c_str(), "adb", "-P", port.c_str(), "fork-server", "server",
                           "--reply-fd", reply_fd, nullptr);
    _exit(127);
  }

  // parent side: wait for the "OK\n" message
  ::close(ack_fd[1]);
  char temp[3];
  auto ret = ::read(ack_fd[0], temp, sizeof(temp));
  ::close(ack_fd[0]);

  if (ret != 3 || memcmp(temp, "OK\n", 3) != 0) {
    throw connection_error("start adb server failed");
  }
#endif
}

} // namespace adb_link
