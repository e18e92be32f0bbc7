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
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <utility>

namespace adb_link {

// A finite, single-pass sequence pulled from a producer callback. The
// producer returns std::nullopt once exhausted and is released right
// away, together with whatever connection it captured.
template <typename T>
class lazy_range {
public:
  using producer_type = std::function<std::optional<T>()>;

  explicit lazy_range(producer_type producer)
    : producer_(std::move(producer)) {}

  lazy_range(lazy_range&&) = default;
  lazy_range& operator=(lazy_range&&) = default;
  lazy_range(const lazy_range&) = delete;
  lazy_range& operator=(const lazy_range&) = delete;

  std::optional<T> next() {
    if (!producer_) {
      return std::nullopt;
    }

    auto value = producer_();
    if (!value) {
      producer_ = nullptr;
    }
    return value;
  }

  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = T*;
    using reference = T&;

    iterator() = default;

    explicit iterator(lazy_range *range)
      : range_(range), current_(range->next()) {}

    reference operator*() { return *current_; }
    pointer operator->() { return &*current_; }

    iterator& operator++() {
      current_ = range_->next();
      return *this;
    }

    void operator++(int) {
      ++*this;
    }

    friend bool operator==(const iterator &it, std::default_sentinel_t) {
      return !it.current_.has_value();
    }

  private:
    lazy_range *range_{nullptr};
    std::optional<T> current_;
  };

  iterator begin() {
    return iterator(this);
  }

  std::default_sentinel_t end() {
    return {};
  }

  // drain what is left
  template <typename Container>
  Container collect() {
    Container out;
    while (auto value = next()) {
      out.push_back(std::move(*value));
    }
    return out;
  }

private:
  producer_type producer_;
};

} // namespace adb_link
