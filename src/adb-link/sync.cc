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

#include "sync.h"
#include "wire.h"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>

namespace adb_link {

namespace {

constexpr uint32_t kFileTypeMask = 0170000;
constexpr uint32_t kRegularFile = 0100000;
constexpr uint32_t kDirectory = 0040000;

uint32_t now_seconds() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

uint32_t read_id(connection &conn) {
  return get_le32(conn.read_exact(4).data());
}

} // namespace

bool FileStat::isDir() const {
  return (mode & kFileTypeMask) == kDirectory;
}

bool FileStat::isRegular() const {
  return (mode & kFileTypeMask) == kRegularFile;
}

sync_session::sync_session(std::unique_ptr<connection> conn)
  : conn_(std::move(conn)) {}

sync_session::~sync_session() {
  close();
}

template <typename Function>
auto sync_session::guarded(Function &&f) {
  try {
    return f();
  } catch (const sync_error &) {
    // the FAIL frame was consumed whole, the session stays usable
    if (state_ != State::Closed) {
      state_ = State::Ready;
    }
    throw;
  } catch (...) {
    state_ = State::Closed;
    conn_->close();
    throw;
  }
}

void sync_session::check_ready(std::string_view path) const {
  if (state_ == State::Closed) {
    throw adb_error("sync session is closed");
  }
  if (state_ == State::Busy) {
    throw adb_error("sync session busy, finish the previous operation first");
  }
  if (path.size() > SYNC_PATH_MAX) {
    throw sync_error("sync path length too long");
  }
}

void sync_session::begin(uint32_t id, std::string_view path) {
  spdlog::debug("sync > {} {}", sync_id_name(id), path);

  state_ = State::Busy;
  conn_->write(encode_sync_request(id, path));
}

void sync_session::finish() {
  state_ = State::Ready;
}

void sync_session::fail_remote(uint32_t length) {
  if (length > SYNC_DATA_MAX) {
    throw framing_error(fmt::format("too-long message length from daemon: msglen = {}", length));
  }

  auto msg = conn_->read_exact(length);
  throw sync_error(msg);
}

FileStat sync_session::stat(std::string_view path) {
  check_ready(path);
  return guarded([&] {
    begin(ID_STAT, path);

    auto id = read_id(*conn_);
    if (id == ID_FAIL) {
      fail_remote(read_id(*conn_));
    }
    if (id != ID_STAT) {
      throw framing_error(fmt::format("protocol fault: stat response has wrong message id {}", sync_id_name(id)));
    }

    auto body = conn_->read_exact(12);

    FileStat st;
    st.mode = get_le32(&body[0]);
    st.size = get_le32(&body[4]);
    st.mtime = get_le32(&body[8]);
    st.path = std::string(path);

    finish();
    return st;
  });
}

std::optional<DirEntry> sync_session::read_dent() {
  auto id = read_id(*conn_);
  if (id == ID_FAIL) {
    fail_remote(read_id(*conn_));
  }
  if (id != ID_DENT && id != ID_DONE) {
    throw framing_error(fmt::format("unexpected dent id {}", sync_id_name(id)));
  }

  // mode, size, mtime, namelen
  auto body = conn_->read_exact(16);

  if (id == ID_DONE) {
    finish();
    return std::nullopt;
  }

  auto namelen = get_le32(&body[12]);
  if (namelen > SYNC_PATH_MAX) {
    throw framing_error(fmt::format("dent namelen too long ({})", namelen));
  }

  DirEntry item;
  item.mode = get_le32(&body[0]);
  item.size = get_le32(&body[4]);
  item.mtime = get_le32(&body[8]);
  item.name = conn_->read_exact(namelen);
  return item;
}

lazy_range<DirEntry> sync_session::iter_directory(std::string_view path) {
  check_ready(path);
  guarded([&] { begin(ID_LIST, path); });

  return lazy_range<DirEntry>([this] {
    return guarded([this] { return read_dent(); });
  });
}

std::vector<DirEntry> sync_session::list(std::string_view path) {
  return iter_directory(path).collect<std::vector<DirEntry>>();
}

size_t sync_session::push(
    std::istream &source,
    std::string_view remote_path,
    uint32_t mode,
    std::optional<uint32_t> mtime) {
  auto path_and_mode = fmt::format("{},{}", remote_path, kRegularFile | (mode & 07777));
  check_ready(path_and_mode);

  return guarded([&] {
    begin(ID_SEND, path_and_mode);

    std::vector<char> chunk(SYNC_DATA_MAX);
    size_t total = 0;
    std::optional<std::string> source_error;

    for (;;) {
      try {
        source.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
      } catch (const std::exception &e) {
        source_error = e.what();
      }

      auto n = static_cast<size_t>(source.gcount());
      if (n > 0) {
        conn_->write(encode_sync_request(ID_DATA, std::string_view(chunk.data(), n)));
        total += n;
      }

      if (!source_error && source.bad()) {
        source_error = "stream error";
      }

      if (source_error || n < chunk.size() || source.eof()) {
        break;
      }
    }

    // the daemon waits for DONE whatever happened to the source
    conn_->write(encode_sync_header(ID_DONE, mtime.value_or(now_seconds())));

    if (source_error) {
      spdlog::warn("push {}: source failed after {} bytes, transfer terminated", remote_path, total);
      state_ = State::Closed;
      conn_->close();
      throw sync_error(fmt::format("push {}: reading the source failed after {} bytes: {}",
          remote_path, total, *source_error));
    }

    auto hdr = decode_sync_header(conn_->read_exact(SYNC_HEADER_SIZE));
    if (hdr.id == ID_FAIL) {
      fail_remote(hdr.value);
    }
    if (hdr.id != ID_OKAY) {
      throw framing_error(fmt::format("unexpected response from daemon: id = {}", sync_id_name(hdr.id)));
    }
    if (hdr.value != 0) {
      throw framing_error(fmt::format("received ID_OKAY with msg_len {} != 0", hdr.value));
    }

    finish();
    return total;
  });
}

size_t sync_session::push_bytes(
    std::string_view data,
    std::string_view remote_path,
    uint32_t mode,
    std::optional<uint32_t> mtime) {
  std::istringstream source{std::string(data)};
  return push(source, remote_path, mode, mtime);
}

size_t sync_session::push_file(
    const std::filesystem::path &local_path,
    std::string_view remote_path) {
  struct stat st;
  if (::stat(local_path.string().c_str(), &st) == -1) {
    throw adb_error(fmt::format("cannot stat '{}'", local_path.string()));
  }

  std::ifstream source(local_path, std::ios::binary);
  if (!source) {
    throw adb_error(fmt::format("cannot open '{}'", local_path.string()));
  }

  return push(source, remote_path,
      static_cast<uint32_t>(st.st_mode & 0777),
      static_cast<uint32_t>(st.st_mtime));
}

std::optional<std::string> sync_session::read_chunk() {
  auto hdr = decode_sync_header(conn_->read_exact(SYNC_HEADER_SIZE));

  if (hdr.id == ID_DONE) {
    finish();
    return std::nullopt;
  }
  if (hdr.id == ID_FAIL) {
    fail_remote(hdr.value);
  }
  if (hdr.id != ID_DATA) {
    throw framing_error(fmt::format("bad sync recv id {}", sync_id_name(hdr.id)));
  }
  if (hdr.value > SYNC_DATA_MAX) {
    throw framing_error(fmt::format("sync recv size too large ({})", hdr.value));
  }

  return conn_->read_exact(hdr.value);
}

lazy_range<std::string> sync_session::iter_content(std::string_view path) {
  check_ready(path);
  guarded([&] { begin(ID_RECV, path); });

  return lazy_range<std::string>([this] {
    return guarded([this] { return read_chunk(); });
  });
}

size_t sync_session::pull(std::string_view remote_path, std::ostream &sink) {
  size_t total = 0;

  for (auto &chunk : iter_content(remote_path)) {
    sink.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    if (!sink) {
      // frames are left unread, the session cannot be reused
      state_ = State::Closed;
      conn_->close();
      throw adb_error(fmt::format("pull {}: writing to the sink failed after {} bytes", remote_path, total));
    }
    total += chunk.size();
  }

  return total;
}

size_t sync_session::pull_file(std::string_view remote_path, const std::filesystem::path &local_path) {
  std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw adb_error(fmt::format("cannot create '{}'", local_path.string()));
  }

  try {
    auto n = pull(remote_path, out);
    out.close();
    return n;
  } catch (const std::exception &) {
    out.close();
    std::error_code ec;
    std::filesystem::remove(local_path, ec);
    throw;
  }
}

void sync_session::close() {
  if (state_ == State::Ready && conn_->is_open()) {
    try {
      conn_->write(encode_sync_request(ID_QUIT, ""));
    } catch (const adb_error &e) {
      spdlog::warn("sync QUIT failed: {}", e.what());
    }
  }

  conn_->close();
  state_ = State::Closed;
}

adb_sync::adb_sync(adb_device device)
  : device_(std::move(device)) {}

std::unique_ptr<sync_session> adb_sync::open() const {
  return std::make_unique<sync_session>(device_.open_transport("sync:"));
}

FileStat adb_sync::stat(std::string_view path) const {
  return open()->stat(path);
}

bool adb_sync::exists(std::string_view path) const {
  return stat(path).exists();
}

std::vector<DirEntry> adb_sync::list(std::string_view path) const {
  return open()->list(path);
}

lazy_range<DirEntry> adb_sync::iter_directory(std::string_view path) const {
  std::shared_ptr<sync_session> session = open();
  auto entries = std::make_shared<lazy_range<DirEntry>>(session->iter_directory(path));

  return lazy_range<DirEntry>([session, entries] {
    return entries->next();
  });
}

size_t adb_sync::push(
    std::istream &source,
    std::string_view remote_path,
    uint32_t mode,
    std::optional<uint32_t> mtime) const {
  return open()->push(source, remote_path, mode, mtime);
}

size_t adb_sync::push_bytes(
    std::string_view data,
    std::string_view remote_path,
    uint32_t mode,
    std::optional<uint32_t> mtime) const {
  return open()->push_bytes(data, remote_path, mode, mtime);
}

size_t adb_sync::push_file(
    const std::filesystem::path &local_path,
    std::string_view remote_path) const {
  return open()->push_file(local_path, remote_path);
}

size_t adb_sync::pull(std::string_view remote_path, std::ostream &sink) const {
  return open()->pull(remote_path, sink);
}

size_t adb_sync::pull_file(std::string_view remote_path, const std::filesystem::path &local_path) const {
  return open()->pull_file(remote_path, local_path);
}

lazy_range<std::string> adb_sync::iter_content(std::string_view path) const {
  std::shared_ptr<sync_session> session = open();
  auto chunks = std::make_shared<lazy_range<std::string>>(session->iter_content(path));

  return lazy_range<std::string>([session, chunks] {
    return chunks->next();
  });
}

std::vector<char> adb_sync::read_bytes(std::string_view path) const {
  std::vector<char> out;
  auto session = open();
  for (auto &chunk : session->iter_content(path)) {
    out.insert(out.end(), chunk.begin(), chunk.end());
  }
  return out;
}

std::string adb_sync::read_text(std::string_view path) const {
  std::string out;
  auto session = open();
  for (auto &chunk : session->iter_content(path)) {
    out.append(chunk);
  }
  return out;
}

} // namespace adb_link
