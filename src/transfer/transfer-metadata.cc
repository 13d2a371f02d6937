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
#include "transfer-metadata.h"
#include "transfer-types.h"
#include <chrono>
#include <format>
#include <fstream>
#include <spdlog/spdlog.h>

namespace db_transfer {

void to_json(nlohmann::json &j, const TransferMetadata &m) {
  j = nlohmann::json{
    {"deviceId", m.deviceId},
    {"packageId", m.packageId},
    {"remotePath", m.remotePath},
    {"pulledAtTimestamp", m.pulledAtTimestamp},
  };
}

void from_json(const nlohmann::json &j, TransferMetadata &m) {
  j.at("deviceId").get_to(m.deviceId);
  j.at("packageId").get_to(m.packageId);
  j.at("remotePath").get_to(m.remotePath);
  j.at("pulledAtTimestamp").get_to(m.pulledAtTimestamp);
}

std::filesystem::path metadataPathFor(const std::filesystem::path &localPath) {
  return std::filesystem::path(localPath.string() + ".meta.json");
}

std::string iso8601Now() {
  auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", now);
}

void writeMetadata(const std::filesystem::path &localPath, const TransferMetadata &metadata) {
  auto path = metadataPathFor(localPath);

  std::string text;
  try {
    text = nlohmann::json(metadata).dump(2);
  } catch (const nlohmann::json::exception &e) {
    spdlog::warn("cannot encode metadata for {}: {}", localPath.string(), e.what());
    return;
  }

  std::ofstream f(path, std::ios::trunc);
  f << text;
  f.close();
  if (!f) {
    spdlog::warn("cannot write {}, {} has no provenance record", path.string(), localPath.string());
    return;
  }
  spdlog::debug("metadata written to {}", path.string());
}

std::optional<TransferMetadata> readMetadata(const std::filesystem::path &localPath) {
  std::ifstream f(metadataPathFor(localPath));
  if (!f) {
    return std::nullopt;
  }

  auto j = nlohmann::json::parse(f, nullptr, false);
  if (j.is_discarded()) {
    spdlog::warn("malformed metadata beside {}", localPath.string());
    return std::nullopt;
  }

  try {
    return j.get<TransferMetadata>();
  } catch (const nlohmann::json::exception &e) {
    spdlog::warn("incomplete metadata beside {}: {}", localPath.string(), e.what());
    return std::nullopt;
  }
}

std::filesystem::path localPathFor(
    const scratch::ScratchDirectory &scratch,
    std::string_view device,
    std::string_view remote) {
  const std::filesystem::path name = remote_filename(remote);
  const auto stem = name.stem().string();
  const auto ext = name.extension().string();

  for (int n = 1;; n++) {
    auto candidate = scratch.pathFor(n == 1 ? name : std::filesystem::path(std::format("{}-{}{}", stem, n, ext)));

    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) {
      return candidate;
    }

    auto owner = readMetadata(candidate);
    if (owner && owner->remotePath == remote && owner->deviceId == device) {
      return candidate;
    }
  }
}

#ifdef ENABLE_TEST

TEST(TransferMetadata, SidecarBesidePulledFile) {
  test::TempDir dir;
  auto db = dir.path() / "app.db";
  test::writeSqliteFile(db);

  writeMetadata(db, {"emulator-5554", "com.example.app", "/data/data/com.example.app/databases/app.db", iso8601Now()});

  ASSERT_TRUE(std::filesystem::exists(dir.path() / "app.db.meta.json"));
  auto raw = nlohmann::json::parse(test::readFile(dir.path() / "app.db.meta.json"));
  ASSERT_EQ(raw["deviceId"], "emulator-5554");
  ASSERT_EQ(raw["packageId"], "com.example.app");
  ASSERT_TRUE(raw.contains("remotePath"));
  ASSERT_TRUE(raw.contains("pulledAtTimestamp"));

  auto md = readMetadata(db);
  ASSERT_TRUE(md.has_value());
  ASSERT_EQ(md->remotePath, "/data/data/com.example.app/databases/app.db");
}

TEST(TransferMetadata, TimestampIsIso8601Utc) {
  auto ts = iso8601Now();
  ASSERT_EQ(ts.size(), 20u);
  ASSERT_EQ(ts[4], '-');
  ASSERT_EQ(ts[10], 'T');
  ASSERT_EQ(ts.back(), 'Z');
}

TEST(TransferMetadata, UnwritableSidecarIsNotAnError) {
  test::TempDir dir;
  auto db = dir.path() / "app.db";
  test::writeSqliteFile(db);
  std::filesystem::create_directory(dir.path() / "app.db.meta.json");

  ASSERT_NO_THROW(writeMetadata(db, {"emulator-5554", "com.example.app", "/data/data/x/app.db", iso8601Now()}));
  ASSERT_FALSE(readMetadata(db).has_value());
}

TEST(TransferMetadata, SameNamedRemotesGetDistinctLocalPaths) {
  test::TempDir dir;
  scratch::ScratchDirectory scratch(dir.path() / "scratch");
  scratch.ensure();

  auto first = localPathFor(scratch, "emulator-5554", "/data/data/com.a/databases/app.db");
  ASSERT_EQ(first.filename().string(), "app.db");
  test::writeSqliteFile(first);
  writeMetadata(first, {"emulator-5554", "com.a", "/data/data/com.a/databases/app.db", iso8601Now()});

  auto second = localPathFor(scratch, "emulator-5554", "/data/data/com.a/files/app.db");
  ASSERT_EQ(second.filename().string(), "app-2.db");
  test::writeSqliteFile(second);
  writeMetadata(second, {"emulator-5554", "com.a", "/data/data/com.a/files/app.db", iso8601Now()});

  // same remote from another device
  ASSERT_EQ(localPathFor(scratch, "R58M123", "/data/data/com.a/databases/app.db").filename().string(), "app-3.db");

  // a repeated pull overwrites its own copy
  ASSERT_EQ(localPathFor(scratch, "emulator-5554", "/data/data/com.a/files/app.db").string(), second.string());
  ASSERT_EQ(localPathFor(scratch, "emulator-5554", "/data/data/com.a/databases/app.db").string(), first.string());
}

TEST(TransferMetadata, MissingOrBrokenSidecarIsNotAnError) {
  test::TempDir dir;
  ASSERT_FALSE(readMetadata(dir.path() / "none.db").has_value());
  test::writeFile(dir.path() / "x.db.meta.json", "{not json");
  ASSERT_FALSE(readMetadata(dir.path() / "x.db").has_value());
}

#endif // ENABLE_TEST

} // namespace db_transfer
