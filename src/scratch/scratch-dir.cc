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

#ifdef ENABLE_TEST
#include "../../tests/test_base.h"
#endif
#include "scratch-dir.h"
#include <format>
#include <spdlog/spdlog.h>

namespace scratch {

namespace fs = std::filesystem;

ScratchDirectory::ScratchDirectory(fs::path root)
: root_(fs::absolute(root).lexically_normal())
{}

fs::path ScratchDirectory::defaultRoot() {
  return fs::temp_directory_path() / DEFAULT_DIR_NAME;
}

ScratchDirectory::BatchLock ScratchDirectory::lockBatch() {
  return BatchLock(mutex_);
}

void ScratchDirectory::ensure() {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    throw scratch_error(std::format("cannot create {}: {}", root_.string(), ec.message()));
  }
}

size_t ScratchDirectory::cleanStale(std::chrono::seconds maxAge) {
  std::lock_guard lk(mutex_);
  ensure();

  const auto cutoff = fs::file_time_type::clock::now() - maxAge;
  size_t removed = 0;

  std::error_code ec;
  for (auto it = fs::directory_iterator(root_, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec)) {
      continue;
    }

    auto mtime = it->last_write_time(entry_ec);
    if (entry_ec) {
      spdlog::warn("cannot stat {}: {}", it->path().string(), entry_ec.message());
      continue;
    }

    if (mtime < cutoff) {
      if (fs::remove(it->path(), entry_ec)) {
        removed++;
        spdlog::debug("removed stale {}", it->path().string());
      } else if (entry_ec) {
        spdlog::warn("cannot remove stale {}: {}", it->path().string(), entry_ec.message());
      }
    }
  }

  if (ec) {
    spdlog::warn("scanning {} failed: {}", root_.string(), ec.message());
  }

  if (removed) {
    spdlog::info("removed {} stale files from {}", removed, root_.string());
  }
  return removed;
}

void ScratchDirectory::forceClean() {
  std::lock_guard lk(mutex_);

  std::error_code ec;
  fs::remove_all(root_, ec);
  if (ec) {
    spdlog::warn("removing {} failed: {}, removing entries one by one", root_.string(), ec.message());
    std::error_code iter_ec;
    for (auto it = fs::directory_iterator(root_, iter_ec); !iter_ec && it != fs::directory_iterator(); it.increment(iter_ec)) {
      std::error_code entry_ec;
      fs::remove_all(it->path(), entry_ec);
      if (entry_ec) {
        spdlog::warn("cannot remove {}: {}", it->path().string(), entry_ec.message());
      }
    }
  }

  ensure();
  spdlog::debug("scratch directory {} reset", root_.string());
}

void ScratchDirectory::touch(const fs::path &path) {
  std::lock_guard lk(mutex_);

  if (!contains(path)) {
    throw scratch_error(std::format("{} is not inside {}", path.string(), root_.string()));
  }

  std::error_code ec;
  auto now = fs::file_time_type::clock::now();
  fs::last_write_time(path, now, ec);
  if (ec) {
    throw scratch_error(std::format("cannot touch {}: {}", path.string(), ec.message()));
  }

  auto sidecar = fs::path(path.string() + ".meta.json");
  if (fs::exists(sidecar, ec)) {
    fs::last_write_time(sidecar, now, ec);
    if (ec) {
      spdlog::warn("cannot touch {}: {}", sidecar.string(), ec.message());
    }
  }
}

bool ScratchDirectory::contains(const fs::path &path) const {
  auto normalized = fs::absolute(path).lexically_normal();
  auto rel = normalized.lexically_relative(root_);
  return !rel.empty() && *rel.begin() != ".." && rel != ".";
}

fs::path ScratchDirectory::pathFor(const fs::path &name) const {
  return root_ / name.filename();
}

#ifdef ENABLE_TEST
#include "scratch-dir_tests.cc"
#endif

} // namespace scratch
