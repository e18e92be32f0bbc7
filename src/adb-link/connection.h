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
#include "errors.h"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace adb_link {

constexpr std::string_view default_adb_server = "127.0.0.1";
constexpr std::string_view default_adb_port = "5037";

struct ClientOption {
  std::string server{default_adb_server};
  std::string port{default_adb_port};
  // bound on every single socket operation
  std::optional<std::chrono::milliseconds> socketTimeout;
  bool launchServerIfNeed{true};
};

// One socket to the daemon. Every call blocks until its frame is fully
// written or read. A framing error or an expired bound closes the socket,
// so a connection is never left in the middle of a frame.
//
// An expired bound also cancels a pending name lookup, but a host name
// lookup already handed to getaddrinfo runs until the system resolver
// returns. A numeric server address never waits on it.
class connection {
public:
  using clock = std::chrono::steady_clock;

  explicit connection(
      const ClientOption &option,
      std::optional<clock::time_point> deadline = std::nullopt);

  ~connection();

  connection(const connection&) = delete;
  connection& operator=(const connection&) = delete;

  void send_command(std::string_view command);

  // consume a status frame, protocol_error on FAIL
  void check_okay();

  std::string read_string_block();

  std::string read_exact(size_t n);

  // at most buf_size bytes, 0 once the peer has closed the stream
  size_t read_some(char *buf, size_t buf_size);

  std::string read_until_close();

  void write(std::string_view bytes);

  // bound for the remaining calls on this connection
  void set_deadline(std::optional<clock::time_point> deadline) {
    deadline_ = deadline;
  }

  bool is_open() const {
    return socket_.is_open();
  }

  void close() noexcept;

private:
  template <typename T>
  T run(asio::awaitable<T> op);

  void connect_once();

  std::optional<clock::time_point> next_limit() const;

  ClientOption option_;
  std::optional<clock::time_point> deadline_;
  asio::io_context io_;
  asio::ip::tcp::resolver resolver_;
  asio::ip::tcp::socket socket_;
};

} // namespace adb_link
