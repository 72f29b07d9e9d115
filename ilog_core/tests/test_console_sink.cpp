#include <gtest/gtest.h>
#include <unistd.h>

#include <cstdio>
#include <functional>
#include <memory>
#include <string>

#include "ilog/flatteners/pattern_flattener.hpp"
#include "ilog/sinks/console_sink.hpp"
#include "test_utils.hpp"

using namespace ilog;
using ilog_test::MakeRecord;

static std::string capture_fd_output(int fd, const std::function<void()>& action)
{
  int pipefd[2];
  EXPECT_EQ(pipe(pipefd), 0);

  int saved_fd = dup(fd);
  EXPECT_NE(saved_fd, -1);

  fflush(nullptr);
  dup2(pipefd[1], fd);
  close(pipefd[1]);

  action();
  fflush(nullptr);

  dup2(saved_fd, fd);
  close(saved_fd);

  char buf[4096] = {};
  ssize_t n = read(pipefd[0], buf, sizeof(buf) - 1);
  close(pipefd[0]);

  if (n > 0)
  {
    return std::string(buf, static_cast<size_t>(n));
  }
  return "";
}

TEST(ConsoleSink, DefaultLevelIsAll)
{
  ConsoleSink sink(false);
  EXPECT_EQ(sink.Level(), LogLevel::All);
}

TEST(ConsoleSink, ForceColor)
{
  EXPECT_TRUE(ConsoleSink(true).UsesColor());
  EXPECT_FALSE(ConsoleSink(false).UsesColor());
}

TEST(ConsoleSink, ShouldLogFiltering)
{
  ConsoleSink sink(false);
  sink.SetLevel(LogLevel::Warn);

  EXPECT_FALSE(sink.ShouldLog(LogLevel::Verbose));
  EXPECT_FALSE(sink.ShouldLog(LogLevel::Debug));
  EXPECT_FALSE(sink.ShouldLog(LogLevel::Info));
  EXPECT_TRUE(sink.ShouldLog(LogLevel::Warn));
  EXPECT_TRUE(sink.ShouldLog(LogLevel::Error));
  EXPECT_TRUE(sink.ShouldLog(LogLevel::Assert));
}

TEST(ConsoleSink, InfoGoesToStdout)
{
  ConsoleSink sink(false);
  auto record = MakeRecord(LogLevel::Info);

  std::string out = capture_fd_output(STDOUT_FILENO, [&]() { sink.Emit(record); });
  EXPECT_NE(out.find("I/TestTag: test message"), std::string::npos);
  EXPECT_EQ(out.back(), '\n');
}

TEST(ConsoleSink, DebugNotOnStderr)
{
  ConsoleSink sink(false);
  auto record = MakeRecord(LogLevel::Debug);

  std::string err = capture_fd_output(STDERR_FILENO, [&]() { sink.Emit(record); });
  EXPECT_TRUE(err.empty());
}

TEST(ConsoleSink, WarnAndAboveGoToStderr)
{
  ConsoleSink sink(false);

  for (LogLevel level : {LogLevel::Warn, LogLevel::Error, LogLevel::Assert})
  {
    auto record = MakeRecord(level);
    std::string err = capture_fd_output(STDERR_FILENO, [&]() { sink.Emit(record); });
    EXPECT_NE(err.find("test message"), std::string::npos) << ToString(level);
  }
}

TEST(ConsoleSink, ErrorNotOnStdout)
{
  ConsoleSink sink(false);
  auto record = MakeRecord(LogLevel::Error);

  std::string out = capture_fd_output(STDOUT_FILENO, [&]() { sink.Emit(record); });
  EXPECT_TRUE(out.empty());
}

TEST(ConsoleSink, ColorWrapsLine)
{
  ConsoleSink sink(true);
  auto record = MakeRecord(LogLevel::Info);

  std::string out = capture_fd_output(STDOUT_FILENO, [&]() { sink.Emit(record); });
  EXPECT_EQ(out.rfind("\033[", 0), 0u);
  EXPECT_NE(out.find("\033[0m\n"), std::string::npos);
}

TEST(ConsoleSink, NoColorHasNoEscapes)
{
  ConsoleSink sink(false);
  auto record = MakeRecord(LogLevel::Info);

  std::string out = capture_fd_output(STDOUT_FILENO, [&]() { sink.Emit(record); });
  EXPECT_EQ(out.find("\033["), std::string::npos);
}

TEST(ConsoleSink, FilteredRecordWritesNothing)
{
  ConsoleSink sink(false);
  sink.SetLevel(LogLevel::Error);
  auto record = MakeRecord(LogLevel::Info);

  std::string out = capture_fd_output(STDOUT_FILENO, [&]() { sink.Emit(record); });
  EXPECT_TRUE(out.empty());
}

TEST(ConsoleSink, CustomFlattener)
{
  ConsoleSink sink(false);
  sink.SetFlattener(std::make_shared<PatternFlattener>("<{L}> {m}"));
  auto record = MakeRecord(LogLevel::Info, "custom");

  std::string out = capture_fd_output(STDOUT_FILENO, [&]() { sink.Emit(record); });
  EXPECT_EQ(out, "<INFO> custom\n");
}

TEST(ConsoleSink, FlushDoesNotThrow)
{
  ConsoleSink sink(false);
  EXPECT_NO_THROW(sink.Flush());
}
