#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "flattener_interface.hpp"

namespace ilog
{

// Placeholders:
//   {d}          timestamp, "yyyy-MM-dd HH:mm:ss.SSS"
//   {d <fmt>}    timestamp through strftime(<fmt>), "%3N" inserts milliseconds
//   {l} / {L}    short / full level name
//   {t}          tag
//   {m}          message
// Anything else, including unknown {...} groups, is copied literally.
class PatternFlattener : public IFlattener
{
 public:
  explicit PatternFlattener(std::string_view pattern, bool use_utc = false);

  std::string Flatten(uint64_t wall_clock_ns, LogLevel level, std::string_view tag,
                      std::string_view message) const override;

  const std::string& Pattern() const { return pattern_; }

 private:
  enum class OpType : uint8_t
  {
    Literal,
    Date,
    DateCustom,
    LevelShort,
    LevelFull,
    Tag,
    Message
  };

  struct FlattenOp
  {
    OpType type;
    std::string text;  // literal text or strftime format
  };

  std::string pattern_;
  bool use_utc_;
  std::vector<FlattenOp> ops_;

  void CompilePattern();
  void AppendDate(std::string& out, uint64_t wall_clock_ns, const std::string& format) const;
};

// "<timestamp> <L>/<tag>: <message>", the default for console and file sinks.
class ClassicFlattener : public PatternFlattener
{
 public:
  static constexpr const char* kPattern = "{d} {l}/{t}: {m}";

  explicit ClassicFlattener(bool use_utc = false) : PatternFlattener(kPattern, use_utc) {}
};

}  // namespace ilog
