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
#include <asio.hpp>
#include <exception>
#include <utility>

namespace common {

// Blocking front for an awaitable: private io_context, exceptions rethrown to the caller.
template <typename FUNC, typename... Args>
void co_spawn_run(FUNC f, Args&&... args) {
  asio::io_context ctx;

  co_spawn(
    ctx,
    f(std::forward<Args>(args)...),
    [](std::exception_ptr e) {
      if (e)
       std::rethrow_exception(e);
    });

  ctx.run();
}

template <typename TOUT, typename FUNC, typename... Args>
TOUT co_spawn_run_ret(FUNC f, Args&&... args) {
  asio::io_context ctx;
  TOUT result{};

  auto f_wrap = [f](TOUT &out, Args&&... args) -> asio::awaitable<void> {
    out = co_await f(std::forward<Args>(args)...);
  };

  co_spawn(
    ctx,
    f_wrap(result, std::forward<Args>(args)...),
    [](std::exception_ptr e) {
      if (e)
       std::rethrow_exception(e);
    });

  ctx.run();

  return result;
}

} // namespace common
