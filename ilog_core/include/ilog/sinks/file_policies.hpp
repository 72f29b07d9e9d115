#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "../log_level.hpp"

namespace ilog
{

// Decides the name of the active log file.
class FileNamePolicy
{
 public:
  enum class Kind : uint8_t
  {
    Changeless,  // always the same name
    Date,        // "YYYY-MM-DD", changes daily
    Level        // full level name, one file per level
  };

  static FileNamePolicy Changeless(std::string file_name);
  static FileNamePolicy Date(bool use_utc = false);
  static FileNamePolicy Level();

  Kind GetKind() const { return kind_; }

  // false: the name never changes once a file is open
  bool IsChangeable() const { return kind_ != Kind::Changeless; }

  std::string Generate(LogLevel level, uint64_t wall_clock_ns) const;

 private:
  FileNamePolicy(Kind kind, std::string file_name, bool use_utc);

  Kind kind_;
  std::string file_name_;
  bool use_utc_;
};

// Decides when the active file is moved into a numbered backup slot.
class BackupPolicy
{
 public:
  enum class Kind : uint8_t
  {
    Never,
    FileSize
  };

  // max_backup_index == kNoLimit keeps every backup
  static constexpr size_t kNoLimit = 0;

  static BackupPolicy Never();
  static BackupPolicy FileSize(uint64_t max_bytes, size_t max_backup_index);

  Kind GetKind() const { return kind_; }
  uint64_t MaxSize() const { return max_size_; }
  size_t MaxBackupIndex() const { return max_backup_index_; }

  // An empty file is never rotated, so a single oversized line still lands.
  bool ShouldBackup(uint64_t current_size, size_t pending_bytes) const;

  // "<file_name>.<index>", index starts at 1 (newest)
  static std::string BackupFileName(const std::string& file_name, size_t index);

 private:
  BackupPolicy(Kind kind, uint64_t max_size, size_t max_backup_index);

  Kind kind_;
  uint64_t max_size_;
  size_t max_backup_index_;
};

// Decides which non-active files in the log folder get deleted.
class CleanPolicy
{
 public:
  enum class Kind : uint8_t
  {
    Never,
    LastModified
  };

  static CleanPolicy Never();
  static CleanPolicy LastModified(std::chrono::milliseconds max_age);

  Kind GetKind() const { return kind_; }
  bool IsEnabled() const { return kind_ != Kind::Never; }
  std::chrono::milliseconds MaxAge() const { return max_age_; }

  bool ShouldClean(uint64_t last_modified_ns, uint64_t now_ns) const;

 private:
  CleanPolicy(Kind kind, std::chrono::milliseconds max_age);

  Kind kind_;
  std::chrono::milliseconds max_age_;
};

}  // namespace ilog
