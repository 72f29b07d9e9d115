#pragma once
#include <optional>

#include "sink_interface.hpp"

namespace ilog
{

// Warn and above go to stderr, everything else to stdout.
class ConsoleSink : public ISink
{
 public:
  explicit ConsoleSink(std::optional<bool> force_color = std::nullopt);

  void Emit(const LogRecord& record) override;
  void Flush() override;

  bool UsesColor() const { return use_color_; }

 private:
  bool use_color_;
};

}  // namespace ilog
