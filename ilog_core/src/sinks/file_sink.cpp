#include "ilog/sinks/file_sink.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <exception>

#include "ilog/diagnostics.hpp"
#include "ilog/flatteners/pattern_flattener.hpp"
#include "ilog/timestamp.hpp"

namespace ilog
{

namespace
{

constexpr const char* kComponent = "FileSink";

bool PathExists(const std::string& path)
{
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0;
}

// Sink whose header provider is running on this thread (and holds its lock)
thread_local const FileSink* tls_header_owner = nullptr;

class HeaderScope
{
 public:
  explicit HeaderScope(const FileSink* sink) : previous_(tls_header_owner)
  {
    tls_header_owner = sink;
  }
  ~HeaderScope() { tls_header_owner = previous_; }

  HeaderScope(const HeaderScope&) = delete;
  HeaderScope& operator=(const HeaderScope&) = delete;

 private:
  const FileSink* previous_;
};

bool InsideHeaderProvider(const FileSink* sink)
{
  if (tls_header_owner != sink)
  {
    return false;
  }
  diagnostics::Report(kComponent, "record emitted from the header provider dropped");
  return true;
}

}  // namespace

FileSink::FileSink(FileSinkOptions options)
    : options_(std::move(options)), fd_(-1), current_size_(0), backup_retry_size_(0)
{
  flattener_ = options_.flattener ? options_.flattener : std::make_shared<ClassicFlattener>();
}

FileSink::~FileSink()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ >= 0)
  {
    ::fsync(fd_);
    ::close(fd_);
    fd_ = -1;
  }
}

bool FileSink::MkdirRecursive(const std::string& path)
{
  std::string tmp;
  for (size_t i = 0; i < path.size(); ++i)
  {
    tmp += path[i];
    if (path[i] == '/' || i == path.size() - 1)
    {
      if (tmp == "/") continue;
      if (::mkdir(tmp.c_str(), 0755) != 0 && errno != EEXIST)
      {
        return false;
      }
    }
  }
  return true;
}

std::string FileSink::PathFor(const std::string& file_name) const
{
  if (options_.folder.empty())
  {
    return file_name;
  }
  std::string result = options_.folder;
  if (result.back() != '/')
  {
    result += '/';
  }
  result += file_name;
  return result;
}

std::string FileSink::CurrentFilePath() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return fd_ >= 0 ? PathFor(current_file_name_) : std::string();
}

bool FileSink::OpenFile(const std::string& file_name)
{
  if (!MkdirRecursive(options_.folder))
  {
    diagnostics::ReportErrno(kComponent, "cannot create folder '" + options_.folder + "'", errno);
    return false;
  }

  std::string path = PathFor(file_name);
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0)
  {
    diagnostics::ReportErrno(kComponent, "failed to open '" + path + "'", errno);
    return false;
  }

  if (file_name != current_file_name_)
  {
    backup_retry_size_ = 0;
  }
  fd_ = fd;
  current_file_name_ = file_name;

  struct stat st{};
  current_size_ = (::fstat(fd_, &st) == 0) ? static_cast<uint64_t>(st.st_size) : 0;

  if (current_size_ == 0 && options_.header_provider)
  {
    try
    {
      HeaderScope scope(this);
      std::string header = options_.header_provider(path);
      if (!header.empty())
      {
        WriteBytes(header);
      }
    }
    catch (const std::exception& e)
    {
      diagnostics::Report(kComponent, std::string("header provider failed: ") + e.what());
    }
    catch (...)
    {
      diagnostics::Report(kComponent, "header provider failed: non-standard exception");
    }
  }
  return true;
}

void FileSink::CloseFile()
{
  if (fd_ >= 0)
  {
    ::close(fd_);
    fd_ = -1;
  }
  current_size_ = 0;
}

bool FileSink::EnsureFileOpen(const LogRecord& record)
{
  if (fd_ >= 0 && !options_.file_name_policy.IsChangeable())
  {
    return true;
  }

  std::string name = options_.file_name_policy.Generate(record.level, record.wall_clock_ns);
  if (fd_ >= 0 && name == current_file_name_)
  {
    return true;
  }

  CloseFile();
  return OpenFile(name);
}

void FileSink::Rotate()
{
  const std::string name = current_file_name_;
  const size_t max_index = options_.backup_policy.MaxBackupIndex();
  CloseFile();

  size_t top = max_index;
  if (max_index == BackupPolicy::kNoLimit)
  {
    // First free slot; everything below it shifts up by one
    top = 1;
    while (PathExists(PathFor(BackupPolicy::BackupFileName(name, top))))
    {
      ++top;
    }
  }
  else
  {
    std::string oldest = PathFor(BackupPolicy::BackupFileName(name, max_index));
    if (::unlink(oldest.c_str()) != 0 && errno != ENOENT)
    {
      diagnostics::ReportErrno(kComponent, "cannot delete '" + oldest + "'", errno);
    }
  }

  for (size_t i = top; i > 1; --i)
  {
    std::string src = PathFor(BackupPolicy::BackupFileName(name, i - 1));
    std::string dst = PathFor(BackupPolicy::BackupFileName(name, i));
    if (::rename(src.c_str(), dst.c_str()) != 0 && errno != ENOENT)
    {
      diagnostics::ReportErrno(kComponent, "cannot rename '" + src + "'", errno);
    }
  }

  std::string active = PathFor(name);
  std::string first = PathFor(BackupPolicy::BackupFileName(name, 1));
  bool moved = ::rename(active.c_str(), first.c_str()) == 0;
  if (!moved)
  {
    diagnostics::ReportErrno(kComponent, "backup of '" + active + "' failed", errno);
  }

  if (!OpenFile(name))
  {
    return;
  }

  // Keep appending to the oversized file and try again once it has grown by
  // another threshold, so a persistent failure does not churn the backups on
  // every write.
  backup_retry_size_ = moved ? 0 : current_size_ + options_.backup_policy.MaxSize();
}

void FileSink::CleanFolder()
{
  DIR* dir = ::opendir(options_.folder.empty() ? "." : options_.folder.c_str());
  if (!dir)
  {
    diagnostics::ReportErrno(kComponent, "cannot scan '" + options_.folder + "'", errno);
    return;
  }

  const uint64_t now = wall_clock_now_ns();
  struct dirent* ent;
  while ((ent = ::readdir(dir)) != nullptr)
  {
    std::string name(ent->d_name);
    if (name == "." || name == ".." || (fd_ >= 0 && name == current_file_name_))
    {
      continue;
    }

    std::string full_path = PathFor(name);
    struct stat st{};
    if (::stat(full_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
      continue;
    }

    uint64_t mtime_ns = static_cast<uint64_t>(st.st_mtime) * 1'000'000'000ULL;
    if (options_.clean_policy.ShouldClean(mtime_ns, now))
    {
      if (::unlink(full_path.c_str()) != 0 && errno != ENOENT)
      {
        diagnostics::ReportErrno(kComponent, "cannot delete '" + full_path + "'", errno);
      }
    }
  }
  ::closedir(dir);
}

bool FileSink::WriteBytes(const std::string& data)
{
  size_t offset = 0;
  while (offset < data.size())
  {
    ssize_t written = ::write(fd_, data.data() + offset, data.size() - offset);
    if (written < 0)
    {
      if (errno == EINTR) continue;
      diagnostics::ReportErrno(kComponent, "write to '" + PathFor(current_file_name_) + "' failed",
                               errno);
      return false;
    }
    offset += static_cast<size_t>(written);
    current_size_ += static_cast<uint64_t>(written);
  }
  return true;
}

void FileSink::Emit(const LogRecord& record)
{
  if (!ShouldLog(record.level) || InsideHeaderProvider(this))
  {
    return;
  }

  // One write(2) per record keeps lines whole even for other processes
  // appending to the same file.
  std::string line = DoFlatten(record);
  line += ILOG_LINE_SEPARATOR;

  std::lock_guard<std::mutex> lock(mutex_);
  if (!EnsureFileOpen(record))
  {
    return;
  }

  if (current_size_ >= backup_retry_size_ &&
      options_.backup_policy.ShouldBackup(current_size_, line.size()))
  {
    Rotate();
    if (fd_ < 0)
    {
      return;
    }
  }

  if (options_.clean_policy.IsEnabled())
  {
    CleanFolder();
  }

  WriteBytes(line);
}

void FileSink::Flush()
{
  if (tls_header_owner == this)
  {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ >= 0)
  {
#if defined(ILOG_PLATFORM_MACOS)
    ::fsync(fd_);
#else
    ::fdatasync(fd_);
#endif
  }
}

}  // namespace ilog
