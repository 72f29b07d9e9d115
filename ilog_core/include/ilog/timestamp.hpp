#pragma once
#include <cstddef>
#include <cstdint>
#include <ctime>

namespace ilog
{

uint64_t wall_clock_now_ns();

// Broken-down time for wall_ns, local time unless use_utc.
std::tm to_calendar(uint64_t wall_ns, bool use_utc);

// "YYYY-MM-DD HH:MM:SS.mmm"
size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size, bool use_utc = false);
// "YYYY-MM-DD"
size_t format_date(uint64_t wall_ns, char* buf, size_t buf_size, bool use_utc = false);

}  // namespace ilog
