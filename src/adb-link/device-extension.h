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
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adb_link {

class adb_device;

struct AppInfo {
  std::string packageName;
  std::string versionName;
  int64_t versionCode{0};
  std::string path;
};

// Package management and screen capture live outside this library.
// adb_device forwards those calls to the extension set on its client.
class device_extension {
public:
  virtual ~device_extension() = default;

  virtual void install(const adb_device &device, const std::filesystem::path &apk) = 0;

  virtual void uninstall(const adb_device &device, std::string_view package) = 0;

  // encoded image bytes
  virtual std::vector<char> screenshot(const adb_device &device) = 0;

  // std::nullopt when the package is not installed
  virtual std::optional<AppInfo> app_info(const adb_device &device, std::string_view package) = 0;
};

} // namespace adb_link
