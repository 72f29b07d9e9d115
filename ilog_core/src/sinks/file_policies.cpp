#include "ilog/sinks/file_policies.hpp"

#include "ilog/timestamp.hpp"

namespace ilog
{

// ===== FileNamePolicy =====

FileNamePolicy::FileNamePolicy(Kind kind, std::string file_name, bool use_utc)
    : kind_(kind), file_name_(std::move(file_name)), use_utc_(use_utc)
{
}

FileNamePolicy FileNamePolicy::Changeless(std::string file_name)
{
  return FileNamePolicy(Kind::Changeless, std::move(file_name), false);
}

FileNamePolicy FileNamePolicy::Date(bool use_utc) { return FileNamePolicy(Kind::Date, {}, use_utc); }

FileNamePolicy FileNamePolicy::Level() { return FileNamePolicy(Kind::Level, {}, false); }

std::string FileNamePolicy::Generate(LogLevel level, uint64_t wall_clock_ns) const
{
  switch (kind_)
  {
    case Kind::Changeless:
      return file_name_;
    case Kind::Date:
    {
      char buf[16];
      size_t n = format_date(wall_clock_ns, buf, sizeof(buf), use_utc_);
      return std::string(buf, n);
    }
    case Kind::Level:
      return std::string(ToString(level));
  }
  return file_name_;
}

// ===== BackupPolicy =====

BackupPolicy::BackupPolicy(Kind kind, uint64_t max_size, size_t max_backup_index)
    : kind_(kind), max_size_(max_size), max_backup_index_(max_backup_index)
{
}

BackupPolicy BackupPolicy::Never() { return BackupPolicy(Kind::Never, 0, 0); }

BackupPolicy BackupPolicy::FileSize(uint64_t max_bytes, size_t max_backup_index)
{
  return BackupPolicy(Kind::FileSize, max_bytes, max_backup_index);
}

bool BackupPolicy::ShouldBackup(uint64_t current_size, size_t pending_bytes) const
{
  if (kind_ != Kind::FileSize || current_size == 0)
  {
    return false;
  }
  return current_size + pending_bytes > max_size_;
}

std::string BackupPolicy::BackupFileName(const std::string& file_name, size_t index)
{
  return file_name + "." + std::to_string(index);
}

// ===== CleanPolicy =====

CleanPolicy::CleanPolicy(Kind kind, std::chrono::milliseconds max_age)
    : kind_(kind), max_age_(max_age)
{
}

CleanPolicy CleanPolicy::Never() { return CleanPolicy(Kind::Never, std::chrono::milliseconds(0)); }

CleanPolicy CleanPolicy::LastModified(std::chrono::milliseconds max_age)
{
  return CleanPolicy(Kind::LastModified, max_age);
}

bool CleanPolicy::ShouldClean(uint64_t last_modified_ns, uint64_t now_ns) const
{
  if (kind_ != Kind::LastModified || now_ns <= last_modified_ns)
  {
    return false;
  }
  uint64_t max_age_ns = static_cast<uint64_t>(max_age_.count()) * 1'000'000ULL;
  return now_ns - last_modified_ns > max_age_ns;
}

}  // namespace ilog
