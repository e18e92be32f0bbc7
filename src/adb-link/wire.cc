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

#include "wire.h"
#include <asio.hpp>
#include <fmt/format.h>
#include <cctype>

namespace adb_link {

using asio::awaitable;
using asio::use_awaitable;
using asio::ip::tcp;

void put_le32(char *out, uint32_t v) {
  out[0] = static_cast<char>(v & 0xff);
  out[1] = static_cast<char>((v >> 8) & 0xff);
  out[2] = static_cast<char>((v >> 16) & 0xff);
  out[3] = static_cast<char>((v >> 24) & 0xff);
}

uint32_t get_le32(const char *in) {
  auto b = reinterpret_cast<const uint8_t*>(in);
  return static_cast<uint32_t>(b[0]) |
         (static_cast<uint32_t>(b[1]) << 8) |
         (static_cast<uint32_t>(b[2]) << 16) |
         (static_cast<uint32_t>(b[3]) << 24);
}

std::string encode_command(std::string_view command) {
  if (command.size() > MAX_COMMAND_LENGTH) {
    throw adb_error("message too big");
  }

  return fmt::format("{:04x}{}", command.size(), command);
}

size_t decode_length(std::string_view hex4) {
  if (hex4.size() != 4) {
    throw framing_error(fmt::format("bad length prefix size {}", hex4.size()));
  }

  size_t len = 0;
  for (char c : hex4) {
    int digit;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      digit = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      digit = c - 'A' + 10;
    } else {
      throw framing_error(fmt::format("protocol fault (bad length prefix '{}')", hex4));
    }
    len = (len << 4) | static_cast<size_t>(digit);
  }

  return len;
}

std::string encode_sync_header(uint32_t id, uint32_t value) {
  std::string buf(SYNC_HEADER_SIZE, '\0');
  put_le32(&buf[0], id);
  put_le32(&buf[4], value);
  return buf;
}

std::string encode_sync_request(uint32_t id, std::string_view payload) {
  auto buf = encode_sync_header(id, static_cast<uint32_t>(payload.size()));
  buf.append(payload);
  return buf;
}

SyncHeader decode_sync_header(std::string_view bytes) {
  if (bytes.size() < SYNC_HEADER_SIZE) {
    throw framing_error(fmt::format("short sync header ({} bytes)", bytes.size()));
  }

  return SyncHeader{get_le32(bytes.data()), get_le32(bytes.data() + 4)};
}

std::string sync_id_name(uint32_t id) {
  std::string name;
  for (int i = 0; i < 4; i++) {
    char c = static_cast<char>((id >> (8 * i)) & 0xff);
    if (!std::isprint(static_cast<unsigned char>(c))) {
      return fmt::format("{:#010x}", id);
    }
    name.push_back(c);
  }
  return name;
}

awaitable<void>
send_protocol_string(tcp::socket &socket, std::string_view s) {
  auto str = encode_command(s);

  std::error_code ec;
  co_await async_write(socket, asio::buffer(str), asio::redirect_error(use_awaitable, ec));
  if (ec) {
    throw framing_error(fmt::format("write failed: {}", ec.message()));
  }
}

awaitable<std::string>
read_exact(tcp::socket &socket, size_t n) {
  std::string msg;
  std::error_code ec;
  auto got = co_await async_read(socket,
            asio::dynamic_buffer(msg, n), asio::transfer_exactly(n),
            asio::redirect_error(use_awaitable, ec));

  if (ec || got != n) {
    if (ec == asio::error::eof) {
      throw framing_error(fmt::format("connection closed mid-frame ({} of {} bytes)", got, n));
    }
    throw framing_error(fmt::format("read failed: {}", ec.message()));
  }

  co_return msg;
}

awaitable<std::string>
read_protocol_string(tcp::socket &socket) {
  auto len = decode_length(co_await read_exact(socket, 4));
  co_return co_await read_exact(socket, len);
}

awaitable<void>
adb_status(tcp::socket &socket) {
  auto msg = co_await read_exact(socket, 4);

  if (msg == "OKAY") {
    co_return;
  }

  if (msg != "FAIL") {
    throw framing_error(fmt::format("protocol fault (status {:02x} {:02x} {:02x} {:02x}?!)",
        static_cast<uint8_t>(msg[0]), static_cast<uint8_t>(msg[1]),
        static_cast<uint8_t>(msg[2]), static_cast<uint8_t>(msg[3])));
  }

  msg = co_await read_protocol_string(socket);
  throw protocol_error(msg);
}

} // namespace adb_link
