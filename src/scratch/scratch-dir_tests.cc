TEST(ScratchDirectory, EnsureIsIdempotent) {
  test::TempDir dir;
  ScratchDirectory scratch(dir.path() / "scratch");
  scratch.ensure();
  test::writeSqliteFile(scratch.pathFor("app.db"));
  scratch.ensure();
  ASSERT_TRUE(fs::exists(scratch.pathFor("app.db")));
}

TEST(ScratchDirectory, ForceCleanLeavesEmptyWritableDirectory) {
  test::TempDir dir;
  ScratchDirectory scratch(dir.path() / "scratch");
  scratch.ensure();
  test::writeSqliteFile(scratch.pathFor("a.db"));
  test::writeFile(scratch.pathFor("a.db.meta.json"), "{}");
  fs::create_directories(scratch.root() / "nested" / "deeper");

  scratch.forceClean();

  ASSERT_TRUE(fs::is_directory(scratch.root()));
  ASSERT_TRUE(fs::is_empty(scratch.root()));
  test::writeFile(scratch.pathFor("probe"), "x");
  ASSERT_EQ(test::readFile(scratch.pathFor("probe")), "x");
}

TEST(ScratchDirectory, CleanStaleKeepsRecentFiles) {
  test::TempDir dir;
  ScratchDirectory scratch(dir.path() / "scratch");
  scratch.ensure();

  test::writeSqliteFile(scratch.pathFor("old.db"));
  test::writeSqliteFile(scratch.pathFor("fresh.db"));
  test::setAge(scratch.pathFor("old.db"), std::chrono::hours(2));
  test::setAge(scratch.pathFor("fresh.db"), std::chrono::minutes(59));

  ASSERT_EQ(scratch.cleanStale(std::chrono::hours(1)), 1u);
  ASSERT_FALSE(fs::exists(scratch.pathFor("old.db")));
  ASSERT_TRUE(fs::exists(scratch.pathFor("fresh.db")));
}

TEST(ScratchDirectory, TouchProtectsFileFromEviction) {
  test::TempDir dir;
  ScratchDirectory scratch(dir.path() / "scratch");
  scratch.ensure();

  auto db = scratch.pathFor("open.db");
  test::writeSqliteFile(db);
  test::writeFile(db.string() + ".meta.json", "{}");
  test::setAge(db, std::chrono::hours(5));
  test::setAge(db.string() + ".meta.json", std::chrono::hours(5));

  scratch.touch(db);

  ASSERT_EQ(scratch.cleanStale(std::chrono::hours(1)), 0u);
  ASSERT_TRUE(fs::exists(db));
  ASSERT_TRUE(fs::exists(db.string() + ".meta.json"));
}

TEST(ScratchDirectory, TouchRejectsForeignAndMissingFiles) {
  test::TempDir dir;
  ScratchDirectory scratch(dir.path() / "scratch");
  scratch.ensure();

  test::writeSqliteFile(dir.path() / "elsewhere.db");
  ASSERT_THROW(scratch.touch(dir.path() / "elsewhere.db"), scratch_error);
  ASSERT_THROW(scratch.touch(scratch.pathFor("missing.db")), scratch_error);
}

TEST(ScratchDirectory, ContainsIsLexical) {
  ScratchDirectory scratch("/tmp/db-bridge-unit");
  ASSERT_TRUE(scratch.contains("/tmp/db-bridge-unit/app.db"));
  ASSERT_FALSE(scratch.contains("/tmp/db-bridge-unit/../app.db"));
  ASSERT_FALSE(scratch.contains("/tmp/db-bridge-unit"));
  ASSERT_EQ(scratch.pathFor("/data/data/com.a/databases/app.db"), fs::path("/tmp/db-bridge-unit/app.db"));
}

TEST(ScratchDirectory, CleanWaitsForBatchOnAnotherThread) {
  test::TempDir dir;
  ScratchDirectory scratch(dir.path() / "scratch");
  scratch.ensure();
  test::writeSqliteFile(scratch.pathFor("pulling.db"));

  std::atomic<bool> cleaned{false};
  std::thread cleaner;
  {
    auto batch = scratch.lockBatch();
    cleaner = std::thread([&] {
      scratch.forceClean();
      cleaned = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_FALSE(cleaned.load());
    EXPECT_TRUE(fs::exists(scratch.pathFor("pulling.db")));

    // the owner may still clean within its batch
    EXPECT_EQ(scratch.cleanStale(std::chrono::hours(1)), 0u);
  }
  cleaner.join();
  ASSERT_TRUE(cleaned.load());
  ASSERT_FALSE(fs::exists(scratch.pathFor("pulling.db")));
}
