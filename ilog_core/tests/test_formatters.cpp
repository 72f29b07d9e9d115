#include <gtest/gtest.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "ilog/formatters/default_formatters.hpp"

using namespace ilog;

TEST(FormatThrowable, NullIsEmpty) { EXPECT_EQ(FormatThrowable(nullptr), ""); }

TEST(FormatThrowable, StandardException)
{
  auto error = std::make_exception_ptr(std::runtime_error("disk full"));
  EXPECT_EQ(FormatThrowable(error), "disk full");
}

TEST(FormatThrowable, NestedExceptionsAddCausedBy)
{
  std::exception_ptr error;
  try
  {
    try
    {
      throw std::runtime_error("socket closed");
    }
    catch (const std::exception&)
    {
      std::throw_with_nested(std::runtime_error("request failed"));
    }
  }
  catch (const std::exception&)
  {
    error = std::current_exception();
  }

  EXPECT_EQ(FormatThrowable(error), "request failed\nCaused by: socket closed");
}

TEST(FormatThrowable, NonStandardException)
{
  auto error = std::make_exception_ptr(42);
  EXPECT_EQ(FormatThrowable(error), "unknown exception");
}

TEST(FormatStackTrace, OneLinePerFrame)
{
  EXPECT_EQ(FormatStackTrace({"main", "run"}), "\tat main\n\tat run");
  EXPECT_EQ(FormatStackTrace({}), "");
}

TEST(FormatBorder, BoxesSegments)
{
  std::string out = FormatBorder({"Thread: main(1)", "", "line1\nline2"});

  std::vector<std::string> lines;
  size_t start = 0;
  while (start <= out.size())
  {
    size_t end = out.find('\n', start);
    if (end == std::string::npos) end = out.size();
    lines.push_back(out.substr(start, end - start));
    start = end + 1;
  }

  ASSERT_EQ(lines.size(), 6u);
  EXPECT_EQ(lines[0].rfind("╔", 0), 0u);
  EXPECT_EQ(lines[1], "║ Thread: main(1)");
  EXPECT_EQ(lines[2].rfind("╟", 0), 0u);
  EXPECT_EQ(lines[3], "║ line1");
  EXPECT_EQ(lines[4], "║ line2");
  EXPECT_EQ(lines[5].rfind("╚", 0), 0u);
}

TEST(FormatBorder, NoSegmentsIsTopAndBottom)
{
  std::string out = FormatBorder({});
  EXPECT_EQ(out.find("║"), std::string::npos);
  EXPECT_NE(out.find('\n'), std::string::npos);
}
