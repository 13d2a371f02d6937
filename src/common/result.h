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
#include <optional>
#include <exception>
#include <utility>
#include <nlohmann/json.hpp>

namespace common {

// Uniform outcome handed to the UI layer.
template <typename T>
struct Result {
  bool success{false};
  std::optional<T> data;
  std::optional<std::string> error;

  static Result ok(T value) {
    Result r;
    r.success = true;
    r.data = std::move(value);
    return r;
  }

  static Result fail(std::string message) {
    Result r;
    r.error = std::move(message);
    return r;
  }
};

// Result<void> carries no payload
struct Unit {};

inline void to_json(nlohmann::json &j, const Unit &) {
  j = nullptr;
}

template <typename T>
void to_json(nlohmann::json &j, const Result<T> &r) {
  j = nlohmann::json::object();
  j["success"] = r.success;
  if (r.data) {
    j["data"] = *r.data;
  } else {
    j["data"] = nullptr;
  }
  if (r.error) {
    j["error"] = *r.error;
  } else {
    j["error"] = nullptr;
  }
}

} // namespace common
