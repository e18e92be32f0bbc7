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
#include "fake-daemon.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <thread>
#include <unistd.h>

using namespace adb_link;
using adb_link::test_support::fake_daemon;
using namespace std::chrono_literals;

namespace {

std::string pattern_data(size_t size) {
  std::string data(size, '\0');
  for (size_t i = 0; i < size; i++) {
    data[i] = static_cast<char>((i * 31 + 7) & 0xff);
  }
  return data;
}

// serves `size` bytes, then fails the next read
class failing_buf : public std::streambuf {
public:
  explicit failing_buf(size_t size)
    : data_(pattern_data(size)) {
    setg(data_.data(), data_.data(), data_.data() + data_.size());
  }

protected:
  int_type underflow() override {
    throw std::runtime_error("disk on fire");
  }

private:
  std::string data_;
};

class Sync : public ::testing::Test {
protected:
  void SetUp() override {
    daemon_.add_device("AAA");
    daemon_.add_directory("/sdcard");
    daemon_.add_directory("/sdcard/Download");
  }

  adb_sync sync() {
    return adb_device(daemon_.option(), std::string("AAA")).sync();
  }

  std::filesystem::path temp_path(const std::string &name) {
    auto dir = std::filesystem::temp_directory_path() / "adb-link-tests";
    std::filesystem::create_directories(dir);
    return dir / (std::to_string(::getpid()) + "-" + name);
  }

  fake_daemon daemon_;
};

} // namespace

TEST_F(Sync, PushPullRoundTrip) {
  const size_t sizes[] = {0, 1, 65535, 65536, 65537, 3 * 65536 + 17};

  for (auto size : sizes) {
    SCOPED_TRACE(size);
    auto data = pattern_data(size);
    auto remote = "/sdcard/blob-" + std::to_string(size);

    ASSERT_EQ(sync().push_bytes(data, remote), size);

    auto stored = daemon_.file(remote);
    ASSERT_TRUE(stored.has_value());
    ASSERT_EQ(stored->data, data);
    ASSERT_EQ(stored->mode, 0100644u);

    std::ostringstream out;
    ASSERT_EQ(sync().pull(remote, out), size);
    ASSERT_EQ(out.str(), data);
  }
}

TEST_F(Sync, PushModeAndMtime) {
  sync().push_bytes("#!/bin/sh\n", "/sdcard/run.sh", 0755, 1700000000);

  auto stored = daemon_.file("/sdcard/run.sh");
  ASSERT_TRUE(stored.has_value());
  ASSERT_EQ(stored->mode, 0100755u);
  ASSERT_EQ(stored->mtime, 1700000000u);
  ASSERT_EQ(daemon_.commands().back(), "sync:");
}

TEST_F(Sync, StatFileAndDirectory) {
  daemon_.put_file("/sdcard/a.txt", "hello", 0100600, 1234);

  auto st = sync().stat("/sdcard/a.txt");
  ASSERT_TRUE(st.exists());
  ASSERT_TRUE(st.isRegular());
  ASSERT_EQ(st.size, 5u);
  ASSERT_EQ(st.mtime, 1234u);
  ASSERT_EQ(st.path, "/sdcard/a.txt");

  auto dir = sync().stat("/sdcard");
  ASSERT_TRUE(dir.isDir());
}

TEST_F(Sync, StatMissingIsAllZero) {
  auto st = sync().stat("/sdcard/missing");
  ASSERT_EQ(st.mode, 0u);
  ASSERT_EQ(st.size, 0u);
  ASSERT_FALSE(st.exists());
  ASSERT_FALSE(sync().exists("/sdcard/missing"));
}

TEST_F(Sync, ListDirectory) {
  daemon_.put_file("/sdcard/a.txt", "a");
  daemon_.put_file("/sdcard/b.txt", "bb");
  daemon_.put_file("/sdcard/Download/c.txt", "ccc");

  std::set<std::string> names;
  for (const auto &ent : sync().list("/sdcard")) {
    names.insert(ent.name);
  }
  ASSERT_EQ(names, (std::set<std::string>{"Download", "a.txt", "b.txt"}));

  auto sub = sync().list("/sdcard/Download/");
  ASSERT_EQ(sub.size(), 1u);
  ASSERT_EQ(sub[0].name, "c.txt");
  ASSERT_EQ(sub[0].size, 3u);
}

TEST_F(Sync, IterDirectoryOutlivesHandle) {
  daemon_.put_file("/sdcard/a.txt", "a");

  auto entries = sync().iter_directory("/sdcard");
  size_t count = 0;
  for (auto &ent : entries) {
    ASSERT_FALSE(ent.name.empty());
    count++;
  }
  ASSERT_EQ(count, 2u);
}

TEST_F(Sync, IterContentChunks) {
  auto data = pattern_data(3 * 65536 + 17);
  daemon_.put_file("/sdcard/big.bin", data);

  std::string joined;
  size_t chunks = 0;
  for (auto &chunk : sync().iter_content("/sdcard/big.bin")) {
    ASSERT_LE(chunk.size(), SYNC_DATA_MAX);
    joined += chunk;
    chunks++;
  }
  ASSERT_EQ(chunks, 4u);
  ASSERT_EQ(joined, data);
}

TEST_F(Sync, ReadTextAndBytes) {
  daemon_.put_file("/sdcard/hello.txt", "hello world\n");

  ASSERT_EQ(sync().read_text("/sdcard/hello.txt"), "hello world\n");
  auto bytes = sync().read_bytes("/sdcard/hello.txt");
  ASSERT_EQ(std::string(bytes.begin(), bytes.end()), "hello world\n");
}

TEST_F(Sync, PullMissingReportsRemoteText) {
  std::ostringstream out;
  try {
    sync().pull("/sdcard/nope", out);
    FAIL() << "expected sync_error";
  } catch (const sync_error &e) {
    ASSERT_STREQ(e.what(), "No such file or directory");
  }
}

TEST_F(Sync, PushToReadOnlyPath) {
  daemon_.set_read_only("/system/");

  try {
    sync().push_bytes("x", "/system/bin/evil");
    FAIL() << "expected sync_error";
  } catch (const sync_error &e) {
    ASSERT_STREQ(e.what(), "couldn't create file: Read-only file system");
  }
  ASSERT_FALSE(daemon_.file("/system/bin/evil").has_value());
}

TEST_F(Sync, FailingSourceStillSendsDone) {
  failing_buf buf(100000);
  std::istream source(&buf);

  ASSERT_THROW(sync().push(source, "/sdcard/partial.bin"), sync_error);

  // the daemon sees DONE after the client already gave up on the reply
  auto deadline = std::chrono::steady_clock::now() + 5s;
  while (daemon_.sends_done() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_EQ(daemon_.sends_done(), 1);

  auto stored = daemon_.file("/sdcard/partial.bin");
  ASSERT_TRUE(stored.has_value());
  ASSERT_EQ(stored->data.size(), 100000u);
}

TEST_F(Sync, SessionRunsOneOperationAtATime) {
  daemon_.put_file("/sdcard/a.txt", "a");

  auto session = sync().open();
  auto entries = session->iter_directory("/sdcard");
  ASSERT_EQ(session->state(), sync_session::State::Busy);
  ASSERT_THROW(session->stat("/sdcard/a.txt"), adb_error);

  auto listed = entries.collect<std::vector<DirEntry>>();
  ASSERT_EQ(listed.size(), 2u);
  ASSERT_EQ(session->state(), sync_session::State::Ready);

  ASSERT_EQ(session->stat("/sdcard/a.txt").size, 1u);
  session->close();
  ASSERT_EQ(session->state(), sync_session::State::Closed);
  ASSERT_THROW(session->stat("/sdcard/a.txt"), adb_error);
}

TEST_F(Sync, SessionSurvivesRemoteFailure) {
  daemon_.put_file("/sdcard/a.txt", "abc");

  auto session = sync().open();
  std::ostringstream out;
  ASSERT_THROW(session->pull("/sdcard/nope", out), sync_error);
  ASSERT_EQ(session->state(), sync_session::State::Ready);

  ASSERT_EQ(session->pull("/sdcard/a.txt", out), 3u);
  ASSERT_EQ(out.str(), "abc");
}

TEST_F(Sync, PathTooLong) {
  ASSERT_THROW(sync().stat("/" + std::string(SYNC_PATH_MAX, 'a')), sync_error);
}

TEST_F(Sync, PushAndPullFiles) {
  auto local = temp_path("push.bin");
  auto back = temp_path("pull.bin");
  auto data = pattern_data(70000);
  {
    std::ofstream out(local, std::ios::binary);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
  }

  ASSERT_EQ(sync().push_file(local, "/sdcard/push.bin"), data.size());
  ASSERT_EQ(sync().pull_file("/sdcard/push.bin", back), data.size());

  std::ifstream in(back, std::ios::binary);
  std::string got((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  ASSERT_EQ(got, data);

  std::filesystem::remove(local);
  std::filesystem::remove(back);
}

TEST_F(Sync, FailedPullRemovesLocalFile) {
  auto local = temp_path("missing.bin");

  ASSERT_THROW(sync().pull_file("/sdcard/nope", local), sync_error);
  ASSERT_FALSE(std::filesystem::exists(local));
}
