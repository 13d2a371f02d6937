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
#include "sqlite-file.h"
#include "transfer-types.h"
#include <array>
#include <format>
#include <fstream>
#include <spdlog/spdlog.h>

namespace db_transfer {

namespace {

uintmax_t checked_size(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw transfer_error(std::format("file not found: {}", path.string()), transfer_error::local_file_missing);
  }

  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw transfer_error(std::format("cannot read size of {}: {}", path.string(), ec.message()),
        transfer_error::local_file_missing);
  }
  if (size == 0) {
    throw transfer_error(std::format("file is empty: {}", path.string()), transfer_error::local_file_empty);
  }
  return size;
}

} // namespace

bool hasSqliteSignature(const std::filesystem::path &path) {
  std::ifstream f(path, std::ios::binary);
  std::array<char, 15> header{};
  if (!f.read(header.data(), header.size())) {
    return false;
  }
  return std::string_view(header.data(), SQLITE_SIGNATURE.size()) == SQLITE_SIGNATURE;
}

void verifyPulledFile(const std::filesystem::path &path) {
  auto size = checked_size(path);
  if (size >= SQLITE_MIN_CHECK_SIZE && !hasSqliteSignature(path)) {
    spdlog::warn("{} does not carry an SQLite header, keeping it anyway", path.string());
  }
  spdlog::debug("verified {} ({} bytes)", path.string(), size);
}

void acceptPulledFile(const std::filesystem::path &path) {
  try {
    verifyPulledFile(path);
  } catch (const transfer_error &) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
      spdlog::warn("cannot remove rejected {}: {}", path.string(), ec.message());
    }
    throw;
  }
}

void validatePushSource(const std::filesystem::path &path) {
  auto size = checked_size(path);
  if (size >= SQLITE_MIN_CHECK_SIZE && !hasSqliteSignature(path)) {
    throw transfer_error(std::format("{} is not a valid SQLite database", path.string()),
        transfer_error::verification_failed);
  }
}

#ifdef ENABLE_TEST

TEST(SqliteFile, SignatureOfWellFormedFile) {
  test::TempDir dir;
  test::writeSqliteFile(dir.path() / "app.db");
  ASSERT_TRUE(hasSqliteSignature(dir.path() / "app.db"));

  test::writeFile(dir.path() / "notes.db", "plain text that is long enough");
  ASSERT_FALSE(hasSqliteSignature(dir.path() / "notes.db"));
  ASSERT_FALSE(hasSqliteSignature(dir.path() / "missing.db"));
}

TEST(SqliteFile, PulledFileMustNotBeEmpty) {
  test::TempDir dir;
  test::writeFile(dir.path() / "empty.db", "");
  try {
    verifyPulledFile(dir.path() / "empty.db");
    FAIL() << "expected transfer_error";
  } catch (const transfer_error &e) {
    ASSERT_EQ(e.code, transfer_error::local_file_empty);
  }
  ASSERT_THROW(verifyPulledFile(dir.path() / "missing.db"), transfer_error);
}

TEST(SqliteFile, RejectedPullIsDeleted) {
  test::TempDir dir;
  test::writeFile(dir.path() / "empty.db", "");
  ASSERT_THROW(acceptPulledFile(dir.path() / "empty.db"), transfer_error);
  ASSERT_FALSE(std::filesystem::exists(dir.path() / "empty.db"));

  test::writeSqliteFile(dir.path() / "app.db");
  ASSERT_NO_THROW(acceptPulledFile(dir.path() / "app.db"));
  ASSERT_TRUE(std::filesystem::exists(dir.path() / "app.db"));
}

TEST(SqliteFile, ForeignSignatureOnlyWarnsOnPull) {
  test::TempDir dir;
  test::writeFile(dir.path() / "cache.db", "this is not sqlite but still listed");
  ASSERT_NO_THROW(verifyPulledFile(dir.path() / "cache.db"));
}

TEST(SqliteFile, PushSourceRejectsForeignSignature) {
  test::TempDir dir;
  test::writeFile(dir.path() / "bad.db", "this is not sqlite but long enough");
  test::writeFile(dir.path() / "tiny.db", "abc");
  test::writeSqliteFile(dir.path() / "good.db");

  ASSERT_THROW(validatePushSource(dir.path() / "bad.db"), transfer_error);
  ASSERT_NO_THROW(validatePushSource(dir.path() / "tiny.db"));
  ASSERT_NO_THROW(validatePushSource(dir.path() / "good.db"));
}

#endif // ENABLE_TEST

} // namespace db_transfer
