#include "ilog/sink_set.hpp"

#include <fmt/format.h>

#include <exception>

#include "ilog/diagnostics.hpp"

namespace ilog
{

SinkSet::SinkSet(std::vector<std::shared_ptr<ISink>> sinks)
{
  for (auto& sink : sinks)
  {
    Add(std::move(sink));
  }
}

void SinkSet::Add(std::shared_ptr<ISink> sink)
{
  if (sink)
  {
    sinks_.push_back(std::move(sink));
  }
}

void SinkSet::Emit(const LogRecord& record) const
{
  for (size_t i = 0; i < sinks_.size(); ++i)
  {
    try
    {
      sinks_[i]->Emit(record);
    }
    catch (const std::exception& e)
    {
      diagnostics::Report("SinkSet", fmt::format("sink #{} failed: {}", i, e.what()));
    }
    catch (...)
    {
      diagnostics::Report("SinkSet", fmt::format("sink #{} failed: non-standard exception", i));
    }
  }
}

void SinkSet::Flush() const
{
  for (size_t i = 0; i < sinks_.size(); ++i)
  {
    try
    {
      sinks_[i]->Flush();
    }
    catch (const std::exception& e)
    {
      diagnostics::Report("SinkSet", fmt::format("sink #{} flush failed: {}", i, e.what()));
    }
    catch (...)
    {
      diagnostics::Report("SinkSet",
                          fmt::format("sink #{} flush failed: non-standard exception", i));
    }
  }
}

}  // namespace ilog
