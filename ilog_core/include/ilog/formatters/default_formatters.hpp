#pragma once
#include <exception>
#include <string>
#include <vector>

namespace ilog
{

// what() of the error, then one "Caused by: ..." line per nested exception
std::string FormatThrowable(const std::exception_ptr& error);

// Frames as "\tat <frame>" lines
std::string FormatStackTrace(const std::vector<std::string>& frames);

// Boxes the non-empty segments, one divider between segments
std::string FormatBorder(const std::vector<std::string>& segments);

}  // namespace ilog
