//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <chrono>
#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <Vellum/Testing/GTest.h>
#include <Vellum/Testing/TempDirectory.h>

#include <Vellum/Publish/FileCommitter.h>
#include <Vellum/Publish/PublishErrors.h>
#include <Vellum/Publish/Test/Mocks/FaultyFileSystem.h>

using vellum::publish::CopyItem;
using vellum::publish::FileCommitter;
using vellum::publish::FileError;
using vellum::publish::LocalFileSystem;
using vellum::publish::PublishCancelledError;
using vellum::publish::PublishIdentity;
using vellum::publish::PublishIOError;
using vellum::publish::testing::FaultyFileSystem;
using vellum::testing::TempDirectory;

namespace fs = std::filesystem;

namespace {

class FileCommitterTest : public ::testing::Test {
protected:
  //! Three sources under `export/`, destinations under a new `publish/v001`.
  auto MakeItems() -> std::vector<CopyItem>
  {
    std::vector<CopyItem> items;
    for (const auto* name : { "a.png", "b.png", "c.png" }) {
      items.push_back({
        .source = temp_.WriteFile(fs::path("export") / name, name),
        .destination = temp_.Path() / "publish" / "v001" / name,
      });
    }
    return items;
  }

  [[nodiscard]] auto Exists(const fs::path& relative) const -> bool
  {
    return fs::exists(temp_.Path() / relative);
  }

  TempDirectory temp_ { "vellum_commit" };
  FileCommitter::Options options_ { .workers = 1 };
};

//=== Success ===-------------------------------------------------------------//

//! Every file lands at its destination and the sources are untouched.
NOLINT_TEST_F(FileCommitterTest, Commit_AllSucceed_CopiesEverything)
{
  // Arrange
  const auto items = MakeItems();
  const FileCommitter committer(std::make_shared<LocalFileSystem>(),
    FileCommitter::Options { .workers = 4 });

  // Act
  const auto committed = committer.Commit(items);

  // Assert
  ASSERT_EQ(committed.size(), items.size());
  for (std::size_t i = 0; i < items.size(); ++i) {
    EXPECT_EQ(committed[i].string(), items[i].destination.string());
    EXPECT_EQ(TempDirectory::ReadFile(items[i].destination),
      TempDirectory::ReadFile(items[i].source));
    EXPECT_TRUE(fs::exists(items[i].source));
  }
  EXPECT_FALSE(fs::exists(FileCommitter::TempPathFor(items[0].destination)));
}

//! Nothing to commit is not an error.
NOLINT_TEST_F(FileCommitterTest, Commit_NoItems_ReturnsEmpty)
{
  const FileCommitter committer(std::make_shared<LocalFileSystem>(), options_);

  EXPECT_TRUE(committer.Commit({}).empty());
}

//! The temporary file is hidden and sits next to its destination.
NOLINT_TEST(FileCommitterTempPathTest, TempPathFor_HiddenSibling)
{
  const auto temp
    = FileCommitter::TempPathFor("/pub/v001/hull_Normal.1001.exr");

  EXPECT_EQ(
    temp.generic_string(), "/pub/v001/.hull_Normal.1001.exr.vellum-tmp");
}

//! A stale temporary file from an earlier crash is replaced.
NOLINT_TEST_F(FileCommitterTest, Commit_StaleTempFile_Replaced)
{
  const auto items = MakeItems();
  const auto stale = FileCommitter::TempPathFor(items[0].destination);
  temp_.WriteFile(fs::relative(stale, temp_.Path()), "stale");
  const FileCommitter committer(std::make_shared<LocalFileSystem>(), options_);

  [[maybe_unused]] const auto committed = committer.Commit(items);

  EXPECT_EQ(TempDirectory::ReadFile(items[0].destination), "a.png");
  EXPECT_FALSE(fs::exists(FileCommitter::TempPathFor(items[0].destination)));
}

//=== Failure and rollback ===------------------------------------------------//

//! A failure on the second of three copies leaves no destination behind.
NOLINT_TEST_F(FileCommitterTest, Commit_SecondCopyFails_RollsBackEverything)
{
  // Arrange
  const auto items = MakeItems();
  const auto file_system = std::make_shared<FaultyFileSystem>();
  file_system->fail_copy = 2;
  file_system->fail_code = FileError::kNoSpace;
  const FileCommitter committer(file_system, options_);
  const PublishIdentity identity { .asset = "hull", .task = "texturing" };

  // Act
  CAPTURE_THROW([[maybe_unused]] auto committed
    = committer.Commit(items, {}, identity),
    PublishIOError, error);

  // Assert
  ASSERT_EQ(error.Failures().size(), 1U);
  EXPECT_EQ(error.Failures()[0].code, FileError::kNoSpace);
  ASSERT_EQ(error.RolledBack().size(), 1U);
  EXPECT_EQ(error.RolledBack()[0].string(), items[0].destination.string());
  EXPECT_TRUE(error.IsClean());
  ASSERT_TRUE(error.Identity().has_value());
  EXPECT_EQ(error.Identity()->asset, "hull");
  EXPECT_EQ(file_system->CopyCount(), 2U);
  EXPECT_FALSE(Exists("publish"));
  for (const auto& item : items) {
    EXPECT_TRUE(fs::exists(item.source));
  }
}

//! Directories that existed before the commit survive its rollback.
NOLINT_TEST_F(FileCommitterTest, Commit_Failure_KeepsPreexistingDirectories)
{
  const auto items = MakeItems();
  fs::create_directories(temp_.Path() / "publish");
  const auto file_system = std::make_shared<FaultyFileSystem>();
  file_system->fail_copy = 1;
  const FileCommitter committer(file_system, options_);

  NOLINT_EXPECT_THROW(
    [[maybe_unused]] auto committed = committer.Commit(items), PublishIOError);

  EXPECT_TRUE(Exists("publish"));
  EXPECT_FALSE(Exists("publish/v001"));
}

//! A rollback that cannot remove a file says so.
NOLINT_TEST_F(FileCommitterTest, Commit_RollbackFails_ReportsLeftovers)
{
  const auto items = MakeItems();
  const auto file_system = std::make_shared<FaultyFileSystem>();
  file_system->fail_copy = 3;
  file_system->fail_remove = true;
  const FileCommitter committer(file_system, options_);

  CAPTURE_THROW(
    [[maybe_unused]] auto committed = committer.Commit(items), PublishIOError,
    error);

  EXPECT_FALSE(error.IsClean());
  EXPECT_TRUE(error.RolledBack().empty());
  EXPECT_FALSE(error.RollbackFailures().empty());
}

//! An existing destination is refused before anything is written.
NOLINT_TEST_F(FileCommitterTest, Commit_DestinationExists_NothingWritten)
{
  // Arrange
  const auto items = MakeItems();
  temp_.WriteFile("publish/v001/b.png", "original");
  const auto file_system = std::make_shared<FaultyFileSystem>();
  const FileCommitter committer(file_system, options_);

  // Act
  CAPTURE_THROW(
    [[maybe_unused]] auto committed = committer.Commit(items), PublishIOError,
    error);

  // Assert
  ASSERT_EQ(error.Failures().size(), 1U);
  EXPECT_EQ(error.Failures()[0].code, FileError::kAlreadyExists);
  EXPECT_EQ(file_system->CopyCount(), 0U);
  EXPECT_FALSE(Exists("publish/v001/a.png"));
  EXPECT_EQ(TempDirectory::ReadFile(items[1].destination), "original");
}

//! Two items aimed at the same destination are refused.
NOLINT_TEST_F(FileCommitterTest, Commit_DuplicateDestination_Refused)
{
  auto items = MakeItems();
  items[2].destination = items[0].destination;
  const FileCommitter committer(std::make_shared<LocalFileSystem>(), options_);

  NOLINT_EXPECT_THROW(
    [[maybe_unused]] auto committed = committer.Commit(items), PublishIOError);
  EXPECT_FALSE(Exists("publish"));
}

//! A missing source fails the commit.
NOLINT_TEST_F(FileCommitterTest, Commit_MissingSource_Fails)
{
  auto items = MakeItems();
  fs::remove(items[1].source);
  const FileCommitter committer(std::make_shared<LocalFileSystem>(), options_);

  CAPTURE_THROW(
    [[maybe_unused]] auto committed = committer.Commit(items), PublishIOError,
    error);

  ASSERT_FALSE(error.Failures().empty());
  EXPECT_EQ(error.Failures()[0].code, FileError::kNotFound);
  EXPECT_FALSE(Exists("publish"));
}

//! A commit that outlives its timeout fails and rolls back.
NOLINT_TEST_F(FileCommitterTest, Commit_Timeout_RollsBack)
{
  const auto items = MakeItems();
  const auto file_system = std::make_shared<FaultyFileSystem>();
  file_system->on_copy = [](std::size_t number) {
    if (number == 2) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  };
  const FileCommitter committer(file_system,
    FileCommitter::Options {
      .workers = 1, .timeout = std::chrono::milliseconds(10) });

  CAPTURE_THROW(
    [[maybe_unused]] auto committed = committer.Commit(items), PublishIOError,
    error);

  ASSERT_FALSE(error.Failures().empty());
  EXPECT_EQ(error.Failures()[0].code, FileError::kTimedOut);
  EXPECT_FALSE(Exists("publish"));
}

//=== Cancellation ===--------------------------------------------------------//

//! A stop requested before the commit starts writes nothing.
NOLINT_TEST_F(FileCommitterTest, Commit_StoppedBeforeStart_NothingWritten)
{
  const auto items = MakeItems();
  std::stop_source stop;
  stop.request_stop();
  const auto file_system = std::make_shared<FaultyFileSystem>();
  const FileCommitter committer(file_system, options_);

  NOLINT_EXPECT_THROW([[maybe_unused]] auto committed
    = committer.Commit(items, stop.get_token()),
    PublishCancelledError);
  EXPECT_EQ(file_system->CopyCount(), 0U);
  EXPECT_FALSE(Exists("publish"));
}

//! A stop during the commit finishes the in-flight copy, then rolls back.
NOLINT_TEST_F(FileCommitterTest, Commit_StoppedMidway_RollsBack)
{
  // Arrange
  const auto items = MakeItems();
  std::stop_source stop;
  const auto file_system = std::make_shared<FaultyFileSystem>();
  file_system->on_copy = [&stop](std::size_t number) {
    if (number == 1) {
      stop.request_stop();
    }
  };
  const FileCommitter committer(file_system, options_);

  // Act
  CAPTURE_THROW([[maybe_unused]] auto committed
    = committer.Commit(items, stop.get_token()),
    PublishCancelledError, error);

  // Assert
  EXPECT_EQ(file_system->CopyCount(), 1U);
  ASSERT_EQ(error.RolledBack().size(), 1U);
  EXPECT_EQ(error.RolledBack()[0].string(), items[0].destination.string());
  EXPECT_FALSE(Exists("publish"));
}

//! A cancelled commit whose rollback fails reports what was left behind.
NOLINT_TEST_F(FileCommitterTest, Commit_StoppedMidwayRollbackFails_NotClean)
{
  // Arrange
  const auto items = MakeItems();
  std::stop_source stop;
  const auto file_system = std::make_shared<FaultyFileSystem>();
  file_system->fail_remove = true;
  file_system->on_copy = [&stop](std::size_t number) {
    if (number == 1) {
      stop.request_stop();
    }
  };
  const FileCommitter committer(file_system, options_);

  // Act
  CAPTURE_THROW([[maybe_unused]] auto committed
    = committer.Commit(items, stop.get_token()),
    PublishCancelledError, error);

  // Assert
  EXPECT_TRUE(fs::exists(items[0].destination));
  EXPECT_FALSE(error.IsClean());
  EXPECT_TRUE(error.RolledBack().empty());
  ASSERT_FALSE(error.RollbackFailures().empty());
  EXPECT_EQ(error.RollbackFailures()[0].path.string(),
    items[0].destination.string());
  EXPECT_THAT(error.what(), ::testing::HasSubstr("needs cleanup"));
}

} // namespace
