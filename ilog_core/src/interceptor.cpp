#include "ilog/interceptor.hpp"

#include <fmt/format.h>

#include <exception>

#include "ilog/diagnostics.hpp"

namespace ilog
{

InterceptorChain::InterceptorChain(std::vector<Interceptor> interceptors)
    : interceptors_(std::move(interceptors))
{
}

std::optional<LogRecord> InterceptorChain::Process(const LogRecord& record) const
{
  std::optional<LogRecord> current = record;
  for (size_t i = 0; i < interceptors_.size(); ++i)
  {
    const Interceptor& interceptor = interceptors_[i];
    try
    {
      if (const auto* filter = std::get_if<FilterPtr>(&interceptor))
      {
        if (*filter && (*filter)->Reject(*current))
        {
          return std::nullopt;
        }
      }
      else if (const auto* transform = std::get_if<TransformPtr>(&interceptor))
      {
        if (*transform)
        {
          current = (*transform)->Intercept(*current);
        }
      }
    }
    catch (const std::exception& e)
    {
      diagnostics::Report("InterceptorChain",
                          fmt::format("interceptor #{} threw, record dropped: {}", i, e.what()));
      return std::nullopt;
    }
    catch (...)
    {
      diagnostics::Report("InterceptorChain",
                          fmt::format("interceptor #{} threw a non-standard exception, record "
                                      "dropped",
                                      i));
      return std::nullopt;
    }
  }
  return current;
}

TokenFilter::TokenFilter(Field field, Mode mode, std::vector<std::string> tokens)
    : field_(field), mode_(mode), tokens_(std::move(tokens))
{
}

bool TokenFilter::Reject(const LogRecord& record) const
{
  const std::string& subject = (field_ == Field::Tag) ? record.tag : record.message;

  bool matched = false;
  for (const auto& token : tokens_)
  {
    if (subject.find(token) != std::string::npos)
    {
      matched = true;
      break;
    }
  }

  return (mode_ == Mode::Blacklist) ? matched : !matched;
}

Interceptor BlacklistTagsFilter(std::vector<std::string> tags)
{
  return MakeFilter<TokenFilter>(TokenFilter::Field::Tag, TokenFilter::Mode::Blacklist,
                                 std::move(tags));
}

Interceptor WhitelistTagsFilter(std::vector<std::string> tags)
{
  return MakeFilter<TokenFilter>(TokenFilter::Field::Tag, TokenFilter::Mode::Whitelist,
                                 std::move(tags));
}

Interceptor BlacklistMsgFilter(std::vector<std::string> tokens)
{
  return MakeFilter<TokenFilter>(TokenFilter::Field::Message, TokenFilter::Mode::Blacklist,
                                 std::move(tokens));
}

Interceptor WhitelistMsgFilter(std::vector<std::string> tokens)
{
  return MakeFilter<TokenFilter>(TokenFilter::Field::Message, TokenFilter::Mode::Whitelist,
                                 std::move(tokens));
}

CallbackFilter::CallbackFilter(Callback reject) : reject_(std::move(reject)) {}

bool CallbackFilter::Reject(const LogRecord& record) const
{
  return reject_ ? reject_(record) : false;
}

CallbackTransform::CallbackTransform(Callback intercept) : intercept_(std::move(intercept)) {}

LogRecord CallbackTransform::Intercept(const LogRecord& record) const
{
  return intercept_ ? intercept_(record) : record;
}

}  // namespace ilog
