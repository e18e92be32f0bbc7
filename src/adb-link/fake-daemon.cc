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

#include "fake-daemon.h"
#include "wire.h"
#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>

namespace adb_link::test_support {

using asio::ip::tcp;

namespace {

std::optional<std::string> read_bytes(tcp::socket &sock, size_t n) {
  std::string buf(n, '\0');
  if (n == 0) {
    return buf;
  }

  std::error_code ec;
  asio::read(sock, asio::buffer(buf.data(), n), ec);
  if (ec) {
    return std::nullopt;
  }
  return buf;
}

void write_bytes(tcp::socket &sock, std::string_view bytes) {
  asio::write(sock, asio::buffer(bytes.data(), bytes.size()));
}

std::optional<std::string> read_request(tcp::socket &sock) {
  auto hex = read_bytes(sock, 4);
  if (!hex) {
    return std::nullopt;
  }
  return read_bytes(sock, decode_length(*hex));
}

void reply_okay(tcp::socket &sock) {
  write_bytes(sock, "OKAY");
}

void reply_block(tcp::socket &sock, std::string_view payload) {
  write_bytes(sock, "OKAY" + encode_command(payload));
}

void reply_fail(tcp::socket &sock, std::string_view reason) {
  write_bytes(sock, "FAIL" + encode_command(reason));
}

void sync_fail(tcp::socket &sock, std::string_view reason) {
  write_bytes(sock, encode_sync_request(ID_FAIL, reason));
}

std::string parent_of(std::string_view path) {
  auto pos = path.rfind('/');
  if (pos == std::string_view::npos) {
    return {};
  }
  if (pos == 0) {
    return "/";
  }
  return std::string(path.substr(0, pos));
}

std::string strip_trailing_slash(std::string path) {
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  return path;
}

std::string stat_body(uint32_t mode, uint32_t size, uint32_t mtime) {
  std::string body(12, '\0');
  put_le32(&body[0], mode);
  put_le32(&body[4], size);
  put_le32(&body[8], mtime);
  return body;
}

} // namespace

fake_daemon::fake_daemon()
  : acceptor_(io_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
  port_ = std::to_string(acceptor_.local_endpoint().port());
  acceptThread_ = std::thread([this] { accept_loop(); });
}

fake_daemon::~fake_daemon() {
  stopping_ = true;

  // wake up the blocking accept
  try {
    tcp::socket waker(io_);
    waker.connect(acceptor_.local_endpoint());
  } catch (const std::exception &e) {
    spdlog::debug("fake daemon: wake up failed: {}", e.what());
  }
  acceptThread_.join();

  std::vector<std::thread> workers;
  {
    std::lock_guard lock(mutex_);
    for (auto &sock : sockets_) {
      std::error_code ec;
      sock->shutdown(tcp::socket::shutdown_both, ec);
    }
    workers.swap(workers_);
  }

  for (auto &t : workers) {
    t.join();
  }
}

ClientOption fake_daemon::option() const {
  ClientOption option;
  option.server = "127.0.0.1";
  option.port = port_;
  option.launchServerIfNeed = false;
  return option;
}

void fake_daemon::add_device(
    std::string serial,
    std::string state,
    std::string tags,
    int64_t transportId) {
  std::lock_guard lock(mutex_);
  if (transportId == 0) {
    transportId = static_cast<int64_t>(devices_.size()) + 1;
  }
  devices_.push_back({std::move(serial), std::move(state), std::move(tags), transportId});
}

void fake_daemon::set_device_listing(std::string listing) {
  std::lock_guard lock(mutex_);
  listing_ = std::move(listing);
}

void fake_daemon::set_shell_output(
    std::string command,
    std::string output,
    std::chrono::milliseconds delay) {
  std::lock_guard lock(mutex_);
  shells_[std::move(command)] = {std::move(output), delay};
}

void fake_daemon::set_shell_v2(std::string command, ShellV2Script script) {
  std::lock_guard lock(mutex_);
  shellsV2_[std::move(command)] = std::move(script);
}

void fake_daemon::set_raw_reply(std::string command, std::string bytes) {
  std::lock_guard lock(mutex_);
  rawReplies_[std::move(command)] = std::move(bytes);
}

void fake_daemon::put_file(std::string path, std::string data, uint32_t mode, uint32_t mtime) {
  std::lock_guard lock(mutex_);
  files_[std::move(path)] = {std::move(data), mode, mtime};
}

void fake_daemon::add_directory(std::string path) {
  std::lock_guard lock(mutex_);
  dirs_.insert(strip_trailing_slash(std::move(path)));
}

void fake_daemon::set_read_only(std::string prefix) {
  std::lock_guard lock(mutex_);
  readOnly_.push_back(std::move(prefix));
}

std::optional<FakeFile> fake_daemon::file(const std::string &path) const {
  std::lock_guard lock(mutex_);
  auto it = files_.find(path);
  if (it == files_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> fake_daemon::commands() const {
  std::lock_guard lock(mutex_);
  return commands_;
}

std::optional<fake_daemon::Device> fake_daemon::find_device(std::string_view serial) const {
  std::lock_guard lock(mutex_);
  for (const auto &dev : devices_) {
    if (dev.serial == serial) {
      return dev;
    }
  }
  return std::nullopt;
}

std::optional<fake_daemon::Device> fake_daemon::find_device(int64_t transportId) const {
  std::lock_guard lock(mutex_);
  for (const auto &dev : devices_) {
    if (dev.transportId == transportId) {
      return dev;
    }
  }
  return std::nullopt;
}

std::string fake_daemon::device_listing(bool extended) const {
  std::lock_guard lock(mutex_);
  if (listing_) {
    return *listing_;
  }

  std::string out;
  for (const auto &dev : devices_) {
    if (extended) {
      out += fmt::format("{:<22} {}", dev.serial, dev.state);
      if (!dev.tags.empty()) {
        out += " " + dev.tags;
      }
      out += fmt::format(" transport_id:{}\n", dev.transportId);
    } else {
      out += fmt::format("{}\t{}\n", dev.serial, dev.state);
    }
  }
  return out;
}

void fake_daemon::accept_loop() {
  for (;;) {
    auto sock = std::make_shared<tcp::socket>(io_);

    std::error_code ec;
    acceptor_.accept(*sock, ec);
    if (stopping_) {
      break;
    }
    if (ec) {
      spdlog::debug("fake daemon: accept failed: {}", ec.message());
      continue;
    }

    std::lock_guard lock(mutex_);
    sockets_.push_back(sock);
    workers_.emplace_back([this, sock] { serve(sock); });
  }
}

void fake_daemon::serve(std::shared_ptr<tcp::socket> conn) {
  auto &sock = *conn;

  try {
    for (;;) {
      auto request = read_request(sock);
      if (!request) {
        return;
      }
      const auto &command = *request;

      std::optional<std::string> raw;
      {
        std::lock_guard lock(mutex_);
        commands_.push_back(command);
        if (auto it = rawReplies_.find(command); it != rawReplies_.end()) {
          raw = it->second;
        }
      }

      if (raw) {
        write_bytes(sock, *raw);
        return;
      }

      if (command.starts_with("host:transport:")) {
        auto serial = std::string_view(command).substr(15);
        auto dev = find_device(serial);
        if (!dev) {
          reply_fail(sock, fmt::format("device '{}' not found", serial));
          return;
        }
        if (dev->state != "device") {
          reply_fail(sock, fmt::format("device {}", dev->state));
          return;
        }
        reply_okay(sock);
        continue;
      }

      if (command.starts_with("host:transport-id:")) {
        int64_t id = 0;
        auto sv = std::string_view(command).substr(18);
        std::from_chars(sv.data(), sv.data() + sv.size(), id);
        if (!find_device(id)) {
          reply_fail(sock, fmt::format("no device with transport id '{}'", sv));
          return;
        }
        reply_okay(sock);
        continue;
      }

      if (command.starts_with("shell,v2,raw:")) {
        reply_okay(sock);
        serve_shell_v2(sock, command.substr(13));
        return;
      }

      if (command.starts_with("shell,raw:")) {
        reply_okay(sock);
        serve_shell(sock, command.substr(10));
        return;
      }

      if (command == "sync:") {
        reply_okay(sock);
        serve_sync(sock);
        return;
      }

      if (!serve_host_query(sock, command)) {
        reply_fail(sock, fmt::format("unknown host service '{}'", command));
      }
      return;
    }
  } catch (const std::exception &e) {
    // the client went away mid exchange
    spdlog::debug("fake daemon: {}", e.what());
  }
}

bool fake_daemon::serve_host_query(tcp::socket &sock, std::string_view command) {
  if (command == "host:version") {
    reply_block(sock, "0029");
    return true;
  }

  if (command == "host:devices" || command == "host:devices-l") {
    reply_block(sock, device_listing(command == "host:devices-l"));
    return true;
  }

  if (command == "host:kill") {
    reply_okay(sock);
    return true;
  }

  if (command.starts_with("host:connect:")) {
    reply_block(sock, fmt::format("connected to {}", command.substr(13)));
    return true;
  }

  if (command.starts_with("host:disconnect:")) {
    reply_block(sock, fmt::format("disconnected {}", command.substr(16)));
    return true;
  }

  if (command.starts_with("host:wait-for-any-")) {
    auto state = command.substr(18);
    reply_okay(sock);

    for (;;) {
      {
        std::lock_guard lock(mutex_);
        for (const auto &dev : devices_) {
          if (dev.state == state) {
            reply_okay(sock);
            return true;
          }
        }
      }
      if (stopping_) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  }

  // host-serial:<serial>:<query>, the serial itself may contain ':'
  std::optional<Device> dev;
  std::string_view query;
  if (command.starts_with("host-serial:")) {
    auto rest = command.substr(12);
    auto pos = rest.rfind(':');
    if (pos == std::string_view::npos) {
      return false;
    }
    query = rest.substr(pos + 1);
    dev = find_device(rest.substr(0, pos));
    if (!dev) {
      reply_fail(sock, fmt::format("device '{}' not found", rest.substr(0, pos)));
      return true;
    }
  } else if (command.starts_with("host-transport-id:")) {
    auto rest = command.substr(18);
    auto pos = rest.find(':');
    if (pos == std::string_view::npos) {
      return false;
    }
    int64_t id = 0;
    std::from_chars(rest.data(), rest.data() + pos, id);
    query = rest.substr(pos + 1);
    dev = find_device(id);
    if (!dev) {
      reply_fail(sock, fmt::format("no device with transport id '{}'", id));
      return true;
    }
  } else {
    return false;
  }

  if (query == "get-state") {
    reply_block(sock, dev->state);
  } else if (query == "get-serialno") {
    reply_block(sock, dev->serial);
  } else if (query == "features") {
    reply_block(sock, "shell_v2,cmd,stat_v2,ls_v2");
  } else if (query.starts_with("wait-for-any-")) {
    reply_okay(sock);
    reply_okay(sock);
  } else {
    return false;
  }
  return true;
}

void fake_daemon::serve_shell(tcp::socket &sock, const std::string &command) {
  std::optional<ShellScript> script;
  {
    std::lock_guard lock(mutex_);
    if (auto it = shells_.find(command); it != shells_.end()) {
      script = it->second;
    }
  }

  if (!script) {
    if (command.starts_with("echo ")) {
      script = ShellScript{command.substr(5) + "\n"};
    } else {
      script = ShellScript{fmt::format("/system/bin/sh: {}: inaccessible or not found\n", command)};
    }
  }

  if (script->delay.count() > 0) {
    std::this_thread::sleep_for(script->delay);
  }

  write_bytes(sock, script->output);
}

void fake_daemon::serve_shell_v2(tcp::socket &sock, const std::string &command) {
  ShellV2Script script;
  {
    std::lock_guard lock(mutex_);
    if (auto it = shellsV2_.find(command); it != shellsV2_.end()) {
      script = it->second;
    } else {
      script.errout = fmt::format("/system/bin/sh: {}: inaccessible or not found\n", command);
      script.exitCode = 127;
    }
  }

  auto packet = [](uint8_t id, std::string_view data) {
    std::string out(5, '\0');
    out[0] = static_cast<char>(id);
    put_le32(&out[1], static_cast<uint32_t>(data.size()));
    out.append(data);
    return out;
  };

  if (!script.output.empty()) {
    write_bytes(sock, packet(1, script.output));
  }
  if (!script.errout.empty()) {
    write_bytes(sock, packet(2, script.errout));
  }
  write_bytes(sock, packet(3, std::string(1, static_cast<char>(script.exitCode))));
}

void fake_daemon::serve_sync(tcp::socket &sock) {
  for (;;) {
    auto raw = read_bytes(sock, SYNC_HEADER_SIZE);
    if (!raw) {
      return;
    }
    auto hdr = decode_sync_header(*raw);

    if (hdr.id == ID_QUIT) {
      return;
    }

    auto payload = read_bytes(sock, hdr.value);
    if (!payload) {
      return;
    }

    if (hdr.id == ID_STAT) {
      std::string body;
      {
        std::lock_guard lock(mutex_);
        auto path = strip_trailing_slash(*payload);
        if (auto it = files_.find(path); it != files_.end()) {
          body = stat_body(it->second.mode, static_cast<uint32_t>(it->second.data.size()), it->second.mtime);
        } else if (dirs_.contains(path)) {
          body = stat_body(040755, 4096, 0);
        } else {
          body = stat_body(0, 0, 0);
        }
      }
      write_bytes(sock, encode_sync_header(ID_STAT, 0).substr(0, 4) + body);

    } else if (hdr.id == ID_LIST) {
      auto dir = strip_trailing_slash(*payload);
      std::string out;
      {
        std::lock_guard lock(mutex_);
        auto dent = [&out](std::string_view name, uint32_t mode, uint32_t size, uint32_t mtime) {
          std::string frame(20, '\0');
          put_le32(&frame[0], ID_DENT);
          put_le32(&frame[4], mode);
          put_le32(&frame[8], size);
          put_le32(&frame[12], mtime);
          put_le32(&frame[16], static_cast<uint32_t>(name.size()));
          out += frame;
          out.append(name);
        };

        for (const auto &d : dirs_) {
          if (d != dir && parent_of(d) == dir) {
            dent(d.substr(d.rfind('/') + 1), 040755, 4096, 0);
          }
        }
        for (const auto &[path, f] : files_) {
          if (parent_of(path) == dir) {
            dent(path.substr(path.rfind('/') + 1), f.mode, static_cast<uint32_t>(f.data.size()), f.mtime);
          }
        }
      }
      out += encode_sync_header(ID_DONE, 0) + std::string(12, '\0');
      write_bytes(sock, out);

    } else if (hdr.id == ID_SEND) {
      auto comma = payload->rfind(',');
      auto path = payload->substr(0, comma);
      uint32_t mode = 0100644;
      if (comma != std::string::npos) {
        mode = static_cast<uint32_t>(std::stoul(payload->substr(comma + 1)));
      }

      std::string data;
      uint32_t mtime = 0;
      for (;;) {
        auto frame = read_bytes(sock, SYNC_HEADER_SIZE);
        if (!frame) {
          return;
        }
        auto h = decode_sync_header(*frame);
        if (h.id == ID_DONE) {
          mtime = h.value;
          break;
        }
        if (h.id != ID_DATA) {
          sync_fail(sock, "invalid data message");
          return;
        }
        auto chunk = read_bytes(sock, h.value);
        if (!chunk) {
          return;
        }
        data += *chunk;
      }

      bool read_only = false;
      {
        std::lock_guard lock(mutex_);
        read_only = std::any_of(readOnly_.begin(), readOnly_.end(), [&path](const std::string &prefix) {
          return path.starts_with(prefix);
        });
        if (!read_only) {
          files_[path] = {std::move(data), mode, mtime};
        }
      }
      sendsDone_++;

      if (read_only) {
        sync_fail(sock, fmt::format("couldn't create file: Read-only file system"));
      } else {
        write_bytes(sock, encode_sync_header(ID_OKAY, 0));
      }

    } else if (hdr.id == ID_RECV) {
      std::optional<FakeFile> f = file(*payload);
      if (!f) {
        sync_fail(sock, "No such file or directory");
        continue;
      }

      std::string_view rest = f->data;
      while (!rest.empty()) {
        auto n = std::min(rest.size(), SYNC_DATA_MAX);
        write_bytes(sock, encode_sync_request(ID_DATA, rest.substr(0, n)));
        rest.remove_prefix(n);
      }
      write_bytes(sock, encode_sync_header(ID_DONE, 0));

    } else {
      sync_fail(sock, fmt::format("unknown sync request {}", sync_id_name(hdr.id)));
      return;
    }
  }
}

} // namespace adb_link::test_support
