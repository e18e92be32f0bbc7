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
#include <string>
#include <stdexcept>

namespace adb_link {

class adb_error : public std::runtime_error {
public:
  adb_error(const std::string& arg): std::runtime_error(arg) {}
};

// malformed length prefix, short read, unexpected close.
// the session that raised it is always torn down.
class framing_error : public adb_error {
public:
  framing_error(const std::string& arg): adb_error(arg) {}
};

// the daemon answered FAIL, what() is its reason verbatim
class protocol_error : public adb_error {
public:
  protocol_error(const std::string& reason): adb_error(reason) {}
};

class connection_error : public adb_error {
public:
  connection_error(const std::string& arg) noexcept : adb_error(arg) {}
};

class timeout_error : public adb_error {
public:
  timeout_error(const std::string& arg): adb_error(arg) {}
};

class no_device_error : public adb_error {
public:
  no_device_error(const std::string& arg): adb_error(arg) {}
};

class ambiguous_device_error : public adb_error {
public:
  ambiguous_device_error(const std::string& arg): adb_error(arg) {}
};

// FAIL frame inside a sync exchange, what() is the remote text
class sync_error : public adb_error {
public:
  sync_error(const std::string& arg): adb_error(arg) {}
};

} // namespace adb_link
