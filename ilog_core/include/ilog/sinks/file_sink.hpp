#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "../platform.hpp"
#include "file_policies.hpp"
#include "sink_interface.hpp"

namespace ilog
{

struct FileSinkOptions
{
  // Created recursively on first write
  std::string folder;

  FileNamePolicy file_name_policy = FileNamePolicy::Changeless(ILOG_DEFAULT_FILE_NAME);
  BackupPolicy backup_policy =
      BackupPolicy::FileSize(ILOG_DEFAULT_MAX_FILE_SIZE, ILOG_DEFAULT_MAX_BACKUP_INDEX);
  CleanPolicy clean_policy = CleanPolicy::Never();

  // nullptr selects ClassicFlattener
  std::shared_ptr<const IFlattener> flattener;

  // Called with the full path of every new (or empty) file; the returned
  // text is written before the first line. Empty result writes nothing.
  // Runs under the sink lock: records the provider emits to this same sink
  // are reported and dropped.
  std::function<std::string(const std::string& file_path)> header_provider;
};

// Writes one flattened line per record into folder/<name>, rotating into
// <name>.1..<name>.N per the backup policy and pruning old files per the
// clean policy. Every Emit runs open/rotate/clean/write under one mutex.
class FileSink : public ISink
{
 public:
  explicit FileSink(FileSinkOptions options);
  ~FileSink() override;

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  void Emit(const LogRecord& record) override;
  void Flush() override;

  const std::string& Folder() const { return options_.folder; }

  // Empty until the first successful open
  std::string CurrentFilePath() const;

 private:
  FileSinkOptions options_;
  mutable std::mutex mutex_;
  int fd_;
  std::string current_file_name_;
  uint64_t current_size_;
  // After a failed backup, no new attempt until the file reaches this size
  uint64_t backup_retry_size_;

  bool EnsureFileOpen(const LogRecord& record);
  bool OpenFile(const std::string& file_name);
  void CloseFile();
  void Rotate();
  void CleanFolder();
  bool WriteBytes(const std::string& data);
  std::string PathFor(const std::string& file_name) const;
  static bool MkdirRecursive(const std::string& path);
};

}  // namespace ilog
