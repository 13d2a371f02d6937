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
#include <filesystem>
#include <mutex>
#include <chrono>
#include <stdexcept>
#include <string>

namespace scratch {

class scratch_error : public std::runtime_error {
public:
  scratch_error(const std::string& arg): std::runtime_error(arg) {}
};

constexpr std::string_view DEFAULT_DIR_NAME = "db-bridge-temp";
constexpr std::chrono::seconds DEFAULT_MAX_AGE{3600};

// Staging area for pulled database files and their .meta.json sidecars.
//
// Cleaning and pull batches are serialized on one recursive mutex: a clean
// issued from another thread waits for the batch, while the batch owner may
// clean from inside its own batch.
class ScratchDirectory {
public:
  explicit ScratchDirectory(std::filesystem::path root);

  // <system temp>/db-bridge-temp
  static std::filesystem::path defaultRoot();

  const std::filesystem::path &root() const { return root_; }

  using BatchLock = std::unique_lock<std::recursive_mutex>;

  [[nodiscard]] BatchLock lockBatch();

  void ensure();

  // removes regular files older than maxAge, returns how many
  size_t cleanStale(std::chrono::seconds maxAge = DEFAULT_MAX_AGE);

  void forceClean();

  // refresh mtime so cleanStale keeps an open file (and its sidecar)
  void touch(const std::filesystem::path &path);

  bool contains(const std::filesystem::path &path) const;

  // root / filename component of name
  std::filesystem::path pathFor(const std::filesystem::path &name) const;

private:
  std::filesystem::path root_;
  std::recursive_mutex mutex_;
};

} // namespace scratch
