#pragma once
#include <cstdint>

namespace lvl_logger
{

// Bitmask selecting the segments of a line prefix.
enum class FormatOptions : uint32_t
{
  None = 0,
  DateTime = 1u << 0,       // "YYYY-MM-DD HH:MM:SS "
  Loglevel = 1u << 1,       // "INFO "
  ShortFileName = 1u << 2,  // "main.cpp:42 "
  LongFileName = 1u << 3    // "/src/app/main.cpp:42 "; ShortFileName wins if both are set
};

constexpr FormatOptions operator|(FormatOptions a, FormatOptions b)
{
  return static_cast<FormatOptions>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr FormatOptions operator&(FormatOptions a, FormatOptions b)
{
  return static_cast<FormatOptions>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

constexpr FormatOptions operator~(FormatOptions a)
{
  return static_cast<FormatOptions>(~static_cast<uint32_t>(a) & 0xFu);
}

inline FormatOptions& operator|=(FormatOptions& a, FormatOptions b)
{
  a = a | b;
  return a;
}

constexpr bool HasOption(FormatOptions options, FormatOptions flag)
{
  return (options & flag) != FormatOptions::None;
}

// Prefix used by a logger built without a config.
constexpr FormatOptions kDefaultFormat =
    FormatOptions::DateTime | FormatOptions::Loglevel | FormatOptions::ShortFileName;

// When the prefix of a writer is computed.
enum class PrefixMode : uint8_t
{
  Frozen,  // once, at logger construction; timestamp and file:line never change
  PerLine  // on every line, from the current clock and the call site of the log call
};

}  // namespace lvl_logger
