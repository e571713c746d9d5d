#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace lvl_logger
{

// No ordering is implied: every level always emits.
enum class SeverityLevel : uint8_t
{
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
  Trace = 4
};

constexpr std::size_t kLevelCount = 5;

constexpr std::array<SeverityLevel, kLevelCount> kAllLevels = {
    SeverityLevel::Debug, SeverityLevel::Info, SeverityLevel::Warn, SeverityLevel::Error,
    SeverityLevel::Trace};

constexpr std::string_view to_string(SeverityLevel level)
{
  switch (level)
  {
    case SeverityLevel::Debug:
      return "DEBUG";
    case SeverityLevel::Info:
      return "INFO";
    case SeverityLevel::Warn:
      return "WARN";
    case SeverityLevel::Error:
      return "ERROR";
    case SeverityLevel::Trace:
      return "TRACE";
  }
  return "UNKNOWN";
}

constexpr std::size_t to_index(SeverityLevel level) { return static_cast<std::size_t>(level); }

}  // namespace lvl_logger
