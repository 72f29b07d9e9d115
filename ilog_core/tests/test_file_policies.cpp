#include <gtest/gtest.h>

#include <chrono>

#include "ilog/sinks/file_policies.hpp"
#include "test_utils.hpp"

using namespace ilog;
using ilog_test::kFixedWallNs;

constexpr uint64_t kNsPerSec = 1'000'000'000ULL;
constexpr uint64_t kNsPerDay = 86400ULL * kNsPerSec;

TEST(FileNamePolicy, ChangelessKeepsName)
{
  auto policy = FileNamePolicy::Changeless("app.log");
  EXPECT_FALSE(policy.IsChangeable());
  EXPECT_EQ(policy.GetKind(), FileNamePolicy::Kind::Changeless);
  EXPECT_EQ(policy.Generate(LogLevel::Info, kFixedWallNs), "app.log");
  EXPECT_EQ(policy.Generate(LogLevel::Error, kFixedWallNs + kNsPerDay), "app.log");
}

TEST(FileNamePolicy, DateFollowsRecordDay)
{
  auto policy = FileNamePolicy::Date(true);
  EXPECT_TRUE(policy.IsChangeable());
  EXPECT_EQ(policy.Generate(LogLevel::Info, kFixedWallNs), "2025-02-16");
  EXPECT_EQ(policy.Generate(LogLevel::Info, kFixedWallNs + kNsPerDay), "2025-02-17");
}

TEST(FileNamePolicy, LevelUsesFullLevelName)
{
  auto policy = FileNamePolicy::Level();
  EXPECT_TRUE(policy.IsChangeable());
  EXPECT_EQ(policy.Generate(LogLevel::Info, kFixedWallNs), "INFO");
  EXPECT_EQ(policy.Generate(LogLevel::Error, kFixedWallNs), "ERROR");
}

TEST(BackupPolicy, NeverDoesNotBackup)
{
  auto policy = BackupPolicy::Never();
  EXPECT_EQ(policy.GetKind(), BackupPolicy::Kind::Never);
  EXPECT_FALSE(policy.ShouldBackup(1ULL << 40, 100));
}

TEST(BackupPolicy, FileSizeThreshold)
{
  auto policy = BackupPolicy::FileSize(100, 3);
  EXPECT_EQ(policy.MaxSize(), 100u);
  EXPECT_EQ(policy.MaxBackupIndex(), 3u);

  EXPECT_FALSE(policy.ShouldBackup(50, 50));
  EXPECT_TRUE(policy.ShouldBackup(50, 51));
  EXPECT_TRUE(policy.ShouldBackup(200, 1));
}

TEST(BackupPolicy, EmptyFileNeverBacksUp)
{
  auto policy = BackupPolicy::FileSize(10, 3);
  EXPECT_FALSE(policy.ShouldBackup(0, 1000));
}

TEST(BackupPolicy, BackupFileName)
{
  EXPECT_EQ(BackupPolicy::BackupFileName("log", 1), "log.1");
  EXPECT_EQ(BackupPolicy::BackupFileName("app.log", 12), "app.log.12");
}

TEST(CleanPolicy, NeverIsDisabled)
{
  auto policy = CleanPolicy::Never();
  EXPECT_FALSE(policy.IsEnabled());
  EXPECT_FALSE(policy.ShouldClean(0, kFixedWallNs));
}

TEST(CleanPolicy, LastModifiedAge)
{
  auto policy = CleanPolicy::LastModified(std::chrono::hours(1));
  EXPECT_TRUE(policy.IsEnabled());
  EXPECT_EQ(policy.MaxAge(), std::chrono::milliseconds(3600 * 1000));

  uint64_t now = kFixedWallNs;
  EXPECT_FALSE(policy.ShouldClean(now - 30 * 60 * kNsPerSec, now));
  EXPECT_FALSE(policy.ShouldClean(now - 3600 * kNsPerSec, now));
  EXPECT_TRUE(policy.ShouldClean(now - 3601 * kNsPerSec, now));
}

TEST(CleanPolicy, FutureTimestampNotCleaned)
{
  auto policy = CleanPolicy::LastModified(std::chrono::milliseconds(1));
  EXPECT_FALSE(policy.ShouldClean(kFixedWallNs + kNsPerSec, kFixedWallNs));
}
