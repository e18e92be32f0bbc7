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
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string_view>

namespace adb_link {

constexpr std::string_view logger_name = "adb-link";
constexpr std::string_view logger_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

// Installs a colored stderr logger as spdlog's default. stdout is left
// to command output.
inline void init_logging(spdlog::level::level_enum level) {
  if (auto logger = spdlog::get(std::string(logger_name)); logger) {
    spdlog::set_default_logger(logger);
  } else {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    logger = std::make_shared<spdlog::logger>(std::string(logger_name), sink);
    logger->set_pattern(std::string(logger_pattern));

    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
  }

  spdlog::set_level(level);
}

inline void shutdown_logging() noexcept {
  if (auto logger = spdlog::get(std::string(logger_name)); logger) {
    logger->flush();
  }
  spdlog::shutdown();
}

} // namespace adb_link
