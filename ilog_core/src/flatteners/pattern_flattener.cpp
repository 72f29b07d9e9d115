#include "ilog/flatteners/pattern_flattener.hpp"

#include <fmt/format.h>

#include <ctime>

#include "ilog/timestamp.hpp"

namespace ilog
{

PatternFlattener::PatternFlattener(std::string_view pattern, bool use_utc)
    : pattern_(pattern), use_utc_(use_utc)
{
  CompilePattern();
}

void PatternFlattener::CompilePattern()
{
  ops_.clear();
  std::string literal_buf;

  auto flush_literal = [&]()
  {
    if (!literal_buf.empty())
    {
      ops_.push_back({OpType::Literal, std::move(literal_buf)});
      literal_buf.clear();
    }
  };

  size_t i = 0;
  while (i < pattern_.size())
  {
    if (pattern_[i] != '{')
    {
      literal_buf += pattern_[i];
      ++i;
      continue;
    }

    size_t close = pattern_.find('}', i + 1);
    if (close == std::string::npos)
    {
      literal_buf.append(pattern_, i, std::string::npos);
      break;
    }

    std::string body = pattern_.substr(i + 1, close - i - 1);
    bool is_op = true;
    FlattenOp op{OpType::Literal, {}};

    if (body == "d")
    {
      op.type = OpType::Date;
    }
    else if (body.size() > 2 && body[0] == 'd' && body[1] == ' ')
    {
      op.type = OpType::DateCustom;
      op.text = body.substr(2);
    }
    else if (body == "l")
    {
      op.type = OpType::LevelShort;
    }
    else if (body == "L")
    {
      op.type = OpType::LevelFull;
    }
    else if (body == "t")
    {
      op.type = OpType::Tag;
    }
    else if (body == "m")
    {
      op.type = OpType::Message;
    }
    else
    {
      is_op = false;
    }

    if (is_op)
    {
      flush_literal();
      ops_.push_back(std::move(op));
    }
    else
    {
      literal_buf.append(pattern_, i, close - i + 1);
    }
    i = close + 1;
  }
  flush_literal();
}

void PatternFlattener::AppendDate(std::string& out, uint64_t wall_clock_ns,
                                  const std::string& format) const
{
  // Expand %3N (milliseconds) ourselves, strftime has no sub-second field
  std::string expanded;
  expanded.reserve(format.size());
  for (size_t i = 0; i < format.size(); ++i)
  {
    if (format.compare(i, 2, "%%") == 0)
    {
      expanded += "%%";
      ++i;
    }
    else if (format.compare(i, 3, "%3N") == 0)
    {
      expanded += fmt::format("{:03}", (wall_clock_ns / 1'000'000ULL) % 1000ULL);
      i += 2;
    }
    else
    {
      expanded += format[i];
    }
  }

  std::tm tm_val = to_calendar(wall_clock_ns, use_utc_);
  char buf[256];
  size_t n = std::strftime(buf, sizeof(buf), expanded.c_str(), &tm_val);
  if (n == 0 && !expanded.empty())
  {
    // Result did not fit; the default date keeps the line timestamped
    n = format_timestamp(wall_clock_ns, buf, sizeof(buf), use_utc_);
  }
  out.append(buf, n);
}

std::string PatternFlattener::Flatten(uint64_t wall_clock_ns, LogLevel level,
                                      std::string_view tag, std::string_view message) const
{
  std::string out;
  out.reserve(pattern_.size() + tag.size() + message.size() + 32);
  char tmp[64];

  for (const auto& op : ops_)
  {
    switch (op.type)
    {
      case OpType::Literal:
        out += op.text;
        break;

      case OpType::Date:
      {
        size_t n = format_timestamp(wall_clock_ns, tmp, sizeof(tmp), use_utc_);
        out.append(tmp, n);
        break;
      }

      case OpType::DateCustom:
        AppendDate(out, wall_clock_ns, op.text);
        break;

      case OpType::LevelShort:
        out += ToShortChar(level);
        break;

      case OpType::LevelFull:
        out += ToString(level);
        break;

      case OpType::Tag:
        out += tag;
        break;

      case OpType::Message:
        out += message;
        break;
    }
  }
  return out;
}

}  // namespace ilog
