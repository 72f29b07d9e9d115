#include <ilog/flatteners/default_flattener.hpp>
#include <ilog/flatteners/pattern_flattener.hpp>
#include <ilog/ilog.hpp>
#include <ilog/interceptor.hpp>
#include <ilog/sinks/callback_sink.hpp>
#include <ilog/sinks/console_sink.hpp>
#include <ilog/sinks/file_sink.hpp>
#include <ilog/thread_info.hpp>

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <thread>

int main()
{
  // --- Sink setup ---

  // 1) Console sink with a custom pattern
  auto console = std::make_shared<ilog::ConsoleSink>();
  console->SetFlattener(
      std::make_shared<ilog::PatternFlattener>("{d %H:%M:%S.%3N} [{L}] {t}: {m}"));

  // 2) File sink: one file per day, size-based backups, week-old files pruned
  ilog::FileSinkOptions file_options;
  file_options.folder = "/tmp/ilog_example";
  file_options.file_name_policy = ilog::FileNamePolicy::Date();
  file_options.backup_policy = ilog::BackupPolicy::FileSize(1024 * 1024, 3);
  file_options.clean_policy = ilog::CleanPolicy::LastModified(std::chrono::hours(24 * 7));
  file_options.flattener = std::make_shared<ilog::DefaultFlattener>();
  file_options.header_provider = [](const std::string& path)
  { return "# ilog basic_example, file " + path + "\n"; };
  auto file_sink = std::make_shared<ilog::FileSink>(file_options);

  // 3) Callback sink (custom processing)
  auto alert_sink = std::make_shared<ilog::CallbackSink>(
      [](const ilog::LogRecord& record, const std::string& line)
      { std::fprintf(stderr, "[ALERT] %s (%s)\n", line.c_str(), record.tag.c_str()); });
  alert_sink->SetLevel(ilog::LogLevel::Error);

  // --- Configuration ---

  auto config = ilog::LogConfiguration::Builder()
                    .Level(ilog::LogLevel::Verbose)
                    .Tag("basic_example")
                    .EnableThreadInfo()
                    .AddInterceptor(ilog::BlacklistMsgFilter({"password"}))
                    .AddInterceptor(ilog::MakeTransform<ilog::CallbackTransform>(
                        [](const ilog::LogRecord& r) { return r.WithMessage("[dev] " + r.message); }))
                    .Build();

  ilog::ThreadInfo::SetThreadName("main");
  ilog::ILog::Init(config, {console, file_sink, alert_sink});

  // --- Basic logging ---

  ILOG_V("application started");
  ILOG_D("debug value: {}", 42);
  ILOG_I("hello {}, version {}", "world", "1.0");
  ILOG_W("disk usage at {}%", 85);
  ILOG_E("connection failed: {}", "timeout");
  ILOG_I("user password is hunter2");  // dropped by the blacklist

  // --- Exceptions ---

  try
  {
    throw std::runtime_error("socket closed by peer");
  }
  catch (const std::exception&)
  {
    ilog::ILog::Get()->Error("request aborted", std::current_exception());
  }

  // --- Conditional logging ---

  int error_code = 404;
  ILOG_W_IF(error_code != 200, "HTTP error: {}", error_code);
  ILOG_E_IF(error_code >= 500, "server error: {}", error_code);

  // --- ILOG_ONCE ---

  for (int i = 0; i < 10; ++i)
  {
    ILOG_ONCE(Warn, "this warning only appears once");
  }

  // --- Bordered logger for a single subsystem ---

  ilog::Logger boxed(ilog::LogConfiguration::Builder().Tag("boxed").EnableBorder().Build(),
                     ilog::SinkSet({console}));
  boxed.Info("first line\nsecond line");

  // --- Multi-thread demo ---

  auto worker = [](int id)
  {
    char name[16];
    std::snprintf(name, sizeof(name), "worker-%d", id);
    ilog::ThreadInfo::SetThreadName(name);

    for (int i = 0; i < 5; ++i)
    {
      ILOG_I("task {} processing step {}", id, i);
    }
  };

  std::thread t1(worker, 1);
  std::thread t2(worker, 2);
  t1.join();
  t2.join();

  // --- Shutdown ---

  ILOG_I("shutting down");
  ilog::ILog::Shutdown();

  std::printf("Example finished. Check /tmp/ilog_example/ for file output.\n");
  return 0;
}
