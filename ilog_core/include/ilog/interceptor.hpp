#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "log_record.hpp"

namespace ilog
{

// Drops a record when Reject returns true.
class IFilter
{
 public:
  virtual ~IFilter() = default;
  virtual bool Reject(const LogRecord& record) const = 0;
};

// Rewrites a record; must return a new value rather than touch shared state.
class ITransform
{
 public:
  virtual ~ITransform() = default;
  virtual LogRecord Intercept(const LogRecord& record) const = 0;
};

using FilterPtr = std::shared_ptr<const IFilter>;
using TransformPtr = std::shared_ptr<const ITransform>;
using Interceptor = std::variant<FilterPtr, TransformPtr>;

class InterceptorChain
{
 public:
  InterceptorChain() = default;
  explicit InterceptorChain(std::vector<Interceptor> interceptors);

  // Applies every interceptor in registration order. std::nullopt means the
  // record was rejected (or an interceptor threw) and must not reach a sink.
  std::optional<LogRecord> Process(const LogRecord& record) const;

  size_t Size() const { return interceptors_.size(); }
  bool Empty() const { return interceptors_.empty(); }

 private:
  std::vector<Interceptor> interceptors_;
};

// ===== Built-in filters =====

// Substring match against a fixed token set, case-sensitive.
class TokenFilter : public IFilter
{
 public:
  enum class Field : uint8_t
  {
    Tag,
    Message
  };
  enum class Mode : uint8_t
  {
    Blacklist,
    Whitelist
  };

  TokenFilter(Field field, Mode mode, std::vector<std::string> tokens);

  bool Reject(const LogRecord& record) const override;

 private:
  Field field_;
  Mode mode_;
  std::vector<std::string> tokens_;
};

Interceptor BlacklistTagsFilter(std::vector<std::string> tags);
Interceptor WhitelistTagsFilter(std::vector<std::string> tags);
Interceptor BlacklistMsgFilter(std::vector<std::string> tokens);
Interceptor WhitelistMsgFilter(std::vector<std::string> tokens);

class CallbackFilter : public IFilter
{
 public:
  using Callback = std::function<bool(const LogRecord&)>;

  explicit CallbackFilter(Callback reject);

  bool Reject(const LogRecord& record) const override;

 private:
  Callback reject_;
};

class CallbackTransform : public ITransform
{
 public:
  using Callback = std::function<LogRecord(const LogRecord&)>;

  explicit CallbackTransform(Callback intercept);

  LogRecord Intercept(const LogRecord& record) const override;

 private:
  Callback intercept_;
};

// Convenience constructors for the variant
template <typename T, typename... Args>
Interceptor MakeFilter(Args&&... args)
{
  return FilterPtr(std::make_shared<T>(std::forward<Args>(args)...));
}

template <typename T, typename... Args>
Interceptor MakeTransform(Args&&... args)
{
  return TransformPtr(std::make_shared<T>(std::forward<Args>(args)...));
}

}  // namespace ilog
