#include "ilog/timestamp.hpp"

#include <time.h>

#include <cstdio>

namespace ilog
{

uint64_t wall_clock_now_ns()
{
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<uint64_t>(ts.tv_nsec);
}

std::tm to_calendar(uint64_t wall_ns, bool use_utc)
{
  time_t sec = static_cast<time_t>(wall_ns / 1'000'000'000ULL);
  std::tm tm_val{};
  if (use_utc)
  {
    gmtime_r(&sec, &tm_val);
  }
  else
  {
    localtime_r(&sec, &tm_val);
  }
  return tm_val;
}

size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size, bool use_utc)
{
  if (buf_size == 0) return 0;
  std::tm tm_val = to_calendar(wall_ns, use_utc);
  unsigned ms = static_cast<unsigned>((wall_ns / 1'000'000ULL) % 1000ULL);
  int n = std::snprintf(buf, buf_size, "%04d-%02d-%02d %02d:%02d:%02d.%03u",
                        tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                        tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec, ms);
  return (n > 0 && static_cast<size_t>(n) < buf_size) ? static_cast<size_t>(n)
                                                      : (buf_size - 1);
}

size_t format_date(uint64_t wall_ns, char* buf, size_t buf_size, bool use_utc)
{
  if (buf_size == 0) return 0;
  std::tm tm_val = to_calendar(wall_ns, use_utc);
  int n = std::snprintf(buf, buf_size, "%04d-%02d-%02d", tm_val.tm_year + 1900,
                        tm_val.tm_mon + 1, tm_val.tm_mday);
  return (n > 0 && static_cast<size_t>(n) < buf_size) ? static_cast<size_t>(n)
                                                      : (buf_size - 1);
}

}  // namespace ilog
