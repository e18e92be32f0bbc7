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
#include <asio/associated_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/awaitable.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>
#include <exception>
#include <future>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace adb_link {

template <typename Function>
using dispatch_result_t = std::invoke_result_t<std::decay_t<Function>&>;

// what the completion handler receives, void results become std::monostate
template <typename R>
using dispatch_value_t = std::conditional_t<std::is_void_v<R>, std::monostate, R>;

// Runs the blocking callable `f` on `pool`. The completion handler is
// invoked on its own associated executor with either the exception thrown
// by `f` or its result:
//
//   void(std::exception_ptr, std::optional<dispatch_value_t<R>>)
//
template <typename Function, typename CompletionToken>
auto async_dispatch(asio::thread_pool &pool, Function &&f, CompletionToken &&token) {
  using R = dispatch_result_t<Function>;
  using V = dispatch_value_t<R>;

  auto initiate = [&pool]<typename Handler>(Handler &&handler, std::decay_t<Function> f) {
    auto work = asio::make_work_guard(asio::get_associated_executor(handler));

    asio::post(pool,
      [handler = std::forward<Handler>(handler), work = std::move(work), f = std::move(f)]() mutable {
        std::exception_ptr error;
        std::optional<V> value;

        try {
          if constexpr (std::is_void_v<R>) {
            f();
            value.emplace();
          } else {
            value.emplace(f());
          }
        } catch (...) {
          // handed to the awaiting side unchanged
          error = std::current_exception();
        }

        auto ex = work.get_executor();
        asio::post(ex,
          [handler = std::move(handler), error, value = std::move(value)]() mutable {
            std::move(handler)(error, std::move(value));
          });
        work.reset();
      });
  };

  return asio::async_initiate<CompletionToken, void(std::exception_ptr, std::optional<V>)>(
      initiate, token, std::forward<Function>(f));
}

template <typename Function>
asio::awaitable<dispatch_result_t<Function>>
co_dispatch(asio::thread_pool &pool, Function f) {
  using R = dispatch_result_t<Function>;

  auto value = co_await async_dispatch(pool, std::move(f), asio::use_awaitable);
  if constexpr (!std::is_void_v<R>) {
    co_return std::move(*value);
  }
}

template <typename Function>
std::future<dispatch_result_t<Function>>
future_dispatch(asio::thread_pool &pool, Function f) {
  return asio::post(pool, asio::use_future(std::move(f)));
}

} // namespace adb_link
