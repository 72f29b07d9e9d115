#pragma once
#include <functional>
#include <string>
#include <string_view>

namespace ilog
{
namespace diagnostics
{

// Fallback channel for failures inside the logging pipeline itself
// (sink I/O, interceptor faults, double initialization). Never throws.
using Handler = std::function<void(std::string_view component, std::string_view message)>;

// Replace the default stderr handler; pass nullptr to restore it.
void SetHandler(Handler handler);

void Report(std::string_view component, std::string_view message) noexcept;

// Report(component, "<what>: <strerror(errnum)>")
void ReportErrno(std::string_view component, std::string_view what, int errnum) noexcept;

}  // namespace diagnostics
}  // namespace ilog
