#include "ilog/formatters/default_formatters.hpp"

#include <exception>

#include "ilog/platform.hpp"

namespace ilog
{

namespace
{

constexpr const char* kTopBorder =
    "╔════════════════════════════════════════════════════════════════════════════";
constexpr const char* kDivider =
    "╟────────────────────────────────────────────────────────────────────────────";
constexpr const char* kBottomBorder =
    "╚════════════════════════════════════════════════════════════════════════════";
constexpr const char* kVertical = "║ ";

// Appends the description of error and each exception nested inside it
void DescribeInto(std::string& out, const std::exception_ptr& error, bool caused_by)
{
  if (!error) return;
  if (caused_by)
  {
    out += ILOG_LINE_SEPARATOR;
    out += "Caused by: ";
  }
  try
  {
    std::rethrow_exception(error);
  }
  catch (const std::exception& e)
  {
    out += e.what();
    try
    {
      std::rethrow_if_nested(e);
    }
    catch (...)
    {
      DescribeInto(out, std::current_exception(), true);
    }
  }
  catch (...)
  {
    out += "unknown exception";
  }
}

}  // namespace

std::string FormatThrowable(const std::exception_ptr& error)
{
  std::string out;
  DescribeInto(out, error, false);
  return out;
}

std::string FormatStackTrace(const std::vector<std::string>& frames)
{
  std::string out;
  for (size_t i = 0; i < frames.size(); ++i)
  {
    if (i > 0) out += ILOG_LINE_SEPARATOR;
    out += "\tat ";
    out += frames[i];
  }
  return out;
}

std::string FormatBorder(const std::vector<std::string>& segments)
{
  std::string out = kTopBorder;
  bool first = true;
  for (const auto& segment : segments)
  {
    if (segment.empty()) continue;
    if (!first)
    {
      out += ILOG_LINE_SEPARATOR;
      out += kDivider;
    }
    first = false;

    size_t start = 0;
    while (start <= segment.size())
    {
      size_t end = segment.find('\n', start);
      if (end == std::string::npos) end = segment.size();
      out += ILOG_LINE_SEPARATOR;
      out += kVertical;
      out.append(segment, start, end - start);
      start = end + 1;
    }
  }
  out += ILOG_LINE_SEPARATOR;
  out += kBottomBorder;
  return out;
}

}  // namespace ilog
