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

#include "connection.h"
#include "server-launcher.h"
#include "wire.h"
#include <asio.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <mutex>
#include <set>
#include <string>
#include <type_traits>
#include <variant>

namespace adb_link {

using asio::awaitable;
using asio::use_awaitable;
using asio::ip::tcp;

namespace {

// the adb server is launched at most once per process and server address
bool claim_server_launch(const ClientOption &option) {
  static std::mutex mutex;
  static std::set<std::string> tried;

  std::lock_guard lock(mutex);
  return tried.insert(fmt::format("{}:{}", option.server, option.port)).second;
}

awaitable<void>
connect_socket(tcp::socket &socket, tcp::resolver &resolver, const ClientOption &option) {
  std::error_code ec;
  auto endpoints = co_await resolver.async_resolve(tcp::v4(),
            option.server, option.port,
            asio::redirect_error(use_awaitable, ec));
  if (ec) {
    throw connection_error(fmt::format("cannot resolve adb server {}:{}: {}",
        option.server, option.port, ec.message()));
  }

  co_await asio::async_connect(socket, endpoints, asio::redirect_error(use_awaitable, ec));
  if (ec) {
    throw connection_error(fmt::format("cannot connect to adb server {}:{}: {}",
        option.server, option.port, ec.message()));
  }
}

awaitable<void>
write_all(tcp::socket &socket, std::string_view bytes) {
  std::error_code ec;
  co_await async_write(socket, asio::buffer(bytes.data(), bytes.size()),
            asio::redirect_error(use_awaitable, ec));
  if (ec) {
    throw framing_error(fmt::format("write failed: {}", ec.message()));
  }
}

awaitable<size_t>
read_some_bytes(tcp::socket &socket, char *buf, size_t buf_size) {
  std::error_code ec;
  auto n = co_await socket.async_read_some(asio::buffer(buf, buf_size),
            asio::redirect_error(use_awaitable, ec));
  if (ec == asio::error::eof) {
    co_return 0;
  }
  if (ec) {
    throw framing_error(fmt::format("read failed: {}", ec.message()));
  }
  co_return n;
}

} // namespace

connection::connection(
    const ClientOption &option,
    std::optional<clock::time_point> deadline)
  : option_(option),
    deadline_(deadline),
    resolver_(io_),
    socket_(io_) {
  try {
    connect_once();
  } catch (const connection_error &e) {
    if (!option_.launchServerIfNeed || !claim_server_launch(option_)) {
      throw;
    }

    spdlog::debug("{}, launching the adb server", e.what());
    launch_adb_server(option_.port);
    connect_once();
  }
}

connection::~connection() {
  close();
}

void connection::connect_once() {
  run(connect_socket(socket_, resolver_, option_));
}

void connection::close() noexcept {
  resolver_.cancel();
  std::error_code ec;
  socket_.close(ec);
}

std::optional<connection::clock::time_point>
connection::next_limit() const {
  std::optional<clock::time_point> limit = deadline_;

  if (option_.socketTimeout) {
    auto t = clock::now() + *option_.socketTimeout;
    if (!limit || t < *limit) {
      limit = t;
    }
  }

  return limit;
}

template <typename T>
T connection::run(awaitable<T> op) {
  using value_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

  std::optional<value_type> result;
  std::exception_ptr error;

  auto wrap = [](awaitable<T> op, std::optional<value_type> &out) -> awaitable<void> {
    if constexpr (std::is_void_v<T>) {
      co_await std::move(op);
      out.emplace();
    } else {
      out.emplace(co_await std::move(op));
    }
  };

  asio::co_spawn(
    io_,
    wrap(std::move(op), result),
    [&error](std::exception_ptr e) {
      error = e;
    });

  io_.restart();

  if (auto limit = next_limit()) {
    io_.run_until(*limit);
    if (!io_.stopped()) {
      // cancel the pending operation and let its handler run
      close();
      io_.run();
      spdlog::debug("adb connection timed out, session closed");
      throw timeout_error("operation timed out");
    }
  } else {
    io_.run();
  }

  if (error) {
    try {
      std::rethrow_exception(error);
    } catch (const protocol_error &) {
      // a complete FAIL frame was read, the stream is still in sync
      throw;
    } catch (...) {
      close();
      throw;
    }
  }

  if constexpr (!std::is_void_v<T>) {
    return std::move(*result);
  }
}

void connection::send_command(std::string_view command) {
  if (!is_open()) {
    throw adb_error("connection is closed");
  }

  spdlog::debug("adb > {}", command);
  run(send_protocol_string(socket_, command));
}

void connection::check_okay() {
  run(adb_status(socket_));
}

std::string connection::read_string_block() {
  return run(read_protocol_string(socket_));
}

std::string connection::read_exact(size_t n) {
  return run(adb_link::read_exact(socket_, n));
}

size_t connection::read_some(char *buf, size_t buf_size) {
  if (!is_open()) {
    return 0;
  }
  return run(read_some_bytes(socket_, buf, buf_size));
}

std::string connection::read_until_close() {
  std::string output;

  constexpr auto kBufferSize = 40960;
  char buffer[kBufferSize];

  for (;;) {
    auto n = read_some(buffer, sizeof(buffer));
    if (n == 0) {
      break;
    }
    output.append(buffer, n);
  }

  return output;
}

void connection::write(std::string_view bytes) {
  if (!is_open()) {
    throw adb_error("connection is closed");
  }
  run(write_all(socket_, bytes));
}

} // namespace adb_link
