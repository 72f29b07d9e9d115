#include "ilog/thread_info.hpp"

#include <fmt/format.h>

#include <cstring>
#include <functional>
#include <thread>

#include "ilog/platform.hpp"

#if defined(ILOG_PLATFORM_LINUX)
#include <sys/syscall.h>
#include <unistd.h>
#elif defined(ILOG_PLATFORM_MACOS)
#include <pthread.h>
#endif

namespace ilog
{

thread_local char ThreadInfo::tls_thread_name_[32] = {};
thread_local uint32_t ThreadInfo::tls_thread_id_ = 0;
thread_local bool ThreadInfo::tls_thread_id_cached_ = false;

void ThreadInfo::SetThreadName(const char* name)
{
  if (!name) return;
  std::strncpy(tls_thread_name_, name, sizeof(tls_thread_name_) - 1);
  tls_thread_name_[sizeof(tls_thread_name_) - 1] = '\0';
}

const char* ThreadInfo::GetThreadName() { return tls_thread_name_; }

uint32_t ThreadInfo::GetThreadId()
{
  if (!tls_thread_id_cached_)
  {
#if defined(ILOG_PLATFORM_LINUX)
    tls_thread_id_ = static_cast<uint32_t>(syscall(SYS_gettid));
#elif defined(ILOG_PLATFORM_MACOS)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    tls_thread_id_ = static_cast<uint32_t>(tid);
#else
    tls_thread_id_ =
        static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
#endif
    tls_thread_id_cached_ = true;
  }
  return tls_thread_id_;
}

std::string ThreadInfo::Describe()
{
  if (tls_thread_name_[0] == '\0')
  {
    return fmt::format("Thread: {}", GetThreadId());
  }
  return fmt::format("Thread: {}({})", tls_thread_name_, GetThreadId());
}

}  // namespace ilog
