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
#include <asio/ip/tcp.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace adb_link {

constexpr size_t MAX_COMMAND_LENGTH = 0xffff;

// largest DATA payload either side may put in one sync frame
constexpr size_t SYNC_DATA_MAX = 64 * 1024;

// longest path accepted by the daemon in a sync request
constexpr size_t SYNC_PATH_MAX = 1024;

constexpr uint32_t mkid(char a, char b, char c, char d) {
  return static_cast<uint32_t>(static_cast<uint8_t>(a)) |
         (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 8) |
         (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 16) |
         (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 24);
}

constexpr uint32_t ID_STAT = mkid('S', 'T', 'A', 'T');
constexpr uint32_t ID_LIST = mkid('L', 'I', 'S', 'T');
constexpr uint32_t ID_DENT = mkid('D', 'E', 'N', 'T');
constexpr uint32_t ID_SEND = mkid('S', 'E', 'N', 'D');
constexpr uint32_t ID_RECV = mkid('R', 'E', 'C', 'V');
constexpr uint32_t ID_DONE = mkid('D', 'O', 'N', 'E');
constexpr uint32_t ID_DATA = mkid('D', 'A', 'T', 'A');
constexpr uint32_t ID_OKAY = mkid('O', 'K', 'A', 'Y');
constexpr uint32_t ID_FAIL = mkid('F', 'A', 'I', 'L');
constexpr uint32_t ID_QUIT = mkid('Q', 'U', 'I', 'T');

// id plus the 32-bit word that follows it: a length for most frames,
// the mtime for DONE on upload.
struct SyncHeader {
  uint32_t id{0};
  uint32_t value{0};
};

constexpr size_t SYNC_HEADER_SIZE = 8;

void put_le32(char *out, uint32_t v);

uint32_t get_le32(const char *in);

// "000chost:version" for "host:version"
std::string encode_command(std::string_view command);

// strict parse of the 4 hex digits that prefix every string block
size_t decode_length(std::string_view hex4);

std::string encode_sync_request(uint32_t id, std::string_view payload);

std::string encode_sync_header(uint32_t id, uint32_t value);

SyncHeader decode_sync_header(std::string_view bytes);

// printable form of a sync id for error messages, e.g. "DENT"
std::string sync_id_name(uint32_t id);

// socket level primitives, all raise framing_error on short reads

asio::awaitable<void>
send_protocol_string(asio::ip::tcp::socket &socket, std::string_view s);

asio::awaitable<std::string>
read_exact(asio::ip::tcp::socket &socket, size_t n);

asio::awaitable<std::string>
read_protocol_string(asio::ip::tcp::socket &socket);

asio::awaitable<void>
adb_status(asio::ip::tcp::socket &socket);

} // namespace adb_link
