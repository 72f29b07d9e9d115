#include "ilog/diagnostics.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <cstring>
#include <mutex>

namespace ilog
{
namespace diagnostics
{

namespace
{

std::mutex& HandlerMutex()
{
  static std::mutex m;
  return m;
}

Handler& CurrentHandler()
{
  static Handler handler;
  return handler;
}

}  // namespace

void SetHandler(Handler handler)
{
  std::lock_guard<std::mutex> lock(HandlerMutex());
  CurrentHandler() = std::move(handler);
}

void Report(std::string_view component, std::string_view message) noexcept
{
  std::lock_guard<std::mutex> lock(HandlerMutex());
  try
  {
    if (CurrentHandler())
    {
      CurrentHandler()(component, message);
      return;
    }
    fmt::print(stderr, "[ilog][{}] {}\n", component, message);
  }
  catch (const std::exception& e)
  {
    // Last resort: the diagnostic channel itself failed
    std::fprintf(stderr, "[ilog][diagnostics] handler failed: %s\n", e.what());
  }
  catch (...)
  {
    std::fprintf(stderr, "[ilog][diagnostics] handler failed\n");
  }
}

void ReportErrno(std::string_view component, std::string_view what, int errnum) noexcept
{
  try
  {
    Report(component, fmt::format("{}: {}", what, std::strerror(errnum)));
  }
  catch (const std::exception& e)
  {
    std::fprintf(stderr, "[ilog][diagnostics] %s\n", e.what());
  }
}

}  // namespace diagnostics
}  // namespace ilog
