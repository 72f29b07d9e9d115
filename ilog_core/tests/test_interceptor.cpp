#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "ilog/diagnostics.hpp"
#include "ilog/interceptor.hpp"
#include "test_utils.hpp"

using namespace ilog;
using ilog_test::MakeRecord;

namespace
{

class RecordingFilter : public IFilter
{
 public:
  RecordingFilter(std::vector<std::string>* calls, std::string name, bool reject)
      : calls_(calls), name_(std::move(name)), reject_(reject)
  {
  }

  bool Reject(const LogRecord&) const override
  {
    calls_->push_back(name_);
    return reject_;
  }

 private:
  std::vector<std::string>* calls_;
  std::string name_;
  bool reject_;
};

class DiagnosticsCapture
{
 public:
  DiagnosticsCapture()
  {
    diagnostics::SetHandler([this](std::string_view component, std::string_view message)
                            { reports.emplace_back(std::string(component) + ": " +
                                                   std::string(message)); });
  }
  ~DiagnosticsCapture() { diagnostics::SetHandler(nullptr); }

  std::vector<std::string> reports;
};

}  // namespace

TEST(InterceptorChain, EmptyChainPassesRecordThrough)
{
  InterceptorChain chain;
  EXPECT_TRUE(chain.Empty());
  auto out = chain.Process(MakeRecord(LogLevel::Info, "hello"));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->message, "hello");
}

TEST(InterceptorChain, BlacklistMessageRejectsAnyToken)
{
  InterceptorChain chain({BlacklistMsgFilter({"A", "B"})});

  EXPECT_FALSE(chain.Process(MakeRecord(LogLevel::Info, "xAx")).has_value());
  EXPECT_FALSE(chain.Process(MakeRecord(LogLevel::Info, "B")).has_value());
  EXPECT_TRUE(chain.Process(MakeRecord(LogLevel::Info, "xyz")).has_value());
}

TEST(InterceptorChain, WhitelistMessageKeepsOnlyMatches)
{
  InterceptorChain chain({WhitelistMsgFilter({"X"})});

  EXPECT_TRUE(chain.Process(MakeRecord(LogLevel::Info, "aXb")).has_value());
  EXPECT_FALSE(chain.Process(MakeRecord(LogLevel::Info, "abc")).has_value());
}

TEST(InterceptorChain, EmptyWhitelistRejectsEverything)
{
  InterceptorChain chain({WhitelistTagsFilter({})});
  EXPECT_FALSE(chain.Process(MakeRecord(LogLevel::Info, "m", "AnyTag")).has_value());
}

TEST(InterceptorChain, EmptyBlacklistRejectsNothing)
{
  InterceptorChain chain({BlacklistTagsFilter({})});
  EXPECT_TRUE(chain.Process(MakeRecord(LogLevel::Info, "m", "AnyTag")).has_value());
}

TEST(InterceptorChain, TagFiltersLookAtTagOnly)
{
  InterceptorChain black({BlacklistTagsFilter({"Net"})});
  EXPECT_FALSE(black.Process(MakeRecord(LogLevel::Info, "msg", "Network")).has_value());
  EXPECT_TRUE(black.Process(MakeRecord(LogLevel::Info, "Net in message", "Db")).has_value());

  InterceptorChain white({WhitelistTagsFilter({"Db"})});
  EXPECT_TRUE(white.Process(MakeRecord(LogLevel::Info, "msg", "Db")).has_value());
  EXPECT_FALSE(white.Process(MakeRecord(LogLevel::Info, "Db", "Net")).has_value());
}

TEST(InterceptorChain, MatchIsCaseSensitive)
{
  InterceptorChain chain({BlacklistMsgFilter({"secret"})});
  EXPECT_TRUE(chain.Process(MakeRecord(LogLevel::Info, "SECRET")).has_value());
  EXPECT_FALSE(chain.Process(MakeRecord(LogLevel::Info, "a secret")).has_value());
}

TEST(InterceptorChain, RunsInRegistrationOrderAndShortCircuits)
{
  std::vector<std::string> calls;
  InterceptorChain chain({MakeFilter<RecordingFilter>(&calls, "first", false),
                          MakeFilter<RecordingFilter>(&calls, "second", true),
                          MakeFilter<RecordingFilter>(&calls, "third", false)});

  EXPECT_FALSE(chain.Process(MakeRecord()).has_value());
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0], "first");
  EXPECT_EQ(calls[1], "second");
}

TEST(InterceptorChain, TransformSeenByLaterFilters)
{
  InterceptorChain chain(
      {MakeTransform<CallbackTransform>([](const LogRecord& r)
                                        { return r.WithMessage(r.message + " [redacted]"); }),
       BlacklistMsgFilter({"[redacted]"})});

  EXPECT_FALSE(chain.Process(MakeRecord(LogLevel::Info, "password")).has_value());
}

TEST(InterceptorChain, FilterBeforeTransformSeesOriginal)
{
  InterceptorChain chain(
      {BlacklistMsgFilter({"[redacted]"}),
       MakeTransform<CallbackTransform>([](const LogRecord& r)
                                        { return r.WithMessage(r.message + " [redacted]"); })});

  auto out = chain.Process(MakeRecord(LogLevel::Info, "password"));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->message, "password [redacted]");
}

TEST(InterceptorChain, TransformDoesNotMutateInput)
{
  InterceptorChain chain({MakeTransform<CallbackTransform>(
      [](const LogRecord& r) { return r.WithLevel(LogLevel::Error).WithTag("Rewritten"); })});

  LogRecord original = MakeRecord(LogLevel::Info, "m", "Orig");
  auto out = chain.Process(original);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->tag, "Rewritten");
  EXPECT_EQ(out->level, LogLevel::Error);
  EXPECT_EQ(original.tag, "Orig");
  EXPECT_EQ(original.level, LogLevel::Info);
}

TEST(InterceptorChain, CallbackFilter)
{
  InterceptorChain chain({MakeFilter<CallbackFilter>(
      [](const LogRecord& r) { return r.level < LogLevel::Warn; })});

  EXPECT_FALSE(chain.Process(MakeRecord(LogLevel::Info)).has_value());
  EXPECT_TRUE(chain.Process(MakeRecord(LogLevel::Warn)).has_value());
}

TEST(InterceptorChain, ThrowingFilterRejectsAndReports)
{
  DiagnosticsCapture capture;
  InterceptorChain chain({MakeFilter<CallbackFilter>(
      [](const LogRecord&) -> bool { throw std::runtime_error("filter broke"); })});

  EXPECT_FALSE(chain.Process(MakeRecord()).has_value());
  ASSERT_EQ(capture.reports.size(), 1u);
  EXPECT_NE(capture.reports[0].find("filter broke"), std::string::npos);
}

TEST(InterceptorChain, ThrowingTransformRejects)
{
  DiagnosticsCapture capture;
  InterceptorChain chain({MakeTransform<CallbackTransform>(
      [](const LogRecord&) -> LogRecord { throw 42; })});

  EXPECT_FALSE(chain.Process(MakeRecord()).has_value());
  EXPECT_EQ(capture.reports.size(), 1u);
}

TEST(InterceptorChain, NullEntriesAreSkipped)
{
  InterceptorChain chain({FilterPtr(), TransformPtr()});
  EXPECT_EQ(chain.Size(), 2u);
  EXPECT_TRUE(chain.Process(MakeRecord()).has_value());
}
