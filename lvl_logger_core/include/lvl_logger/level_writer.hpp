#pragma once
#include <fmt/format.h>
#include <fmt/printf.h>

#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

#include "format_options.hpp"
#include "log_level.hpp"
#include "sinks/multi_sink.hpp"
#include "source_location.hpp"

namespace lvl_logger
{

namespace detail
{

template <typename T>
struct IsStringLike
    : std::integral_constant<bool, std::is_same<std::decay_t<T>, std::string>::value ||
                                       std::is_same<std::decay_t<T>, std::string_view>::value ||
                                       std::is_same<std::decay_t<T>, const char*>::value ||
                                       std::is_same<std::decay_t<T>, char*>::value>
{
};

template <typename T>
void AppendOperand(std::string& out, const T& arg, bool& first, bool& prev_is_string)
{
  constexpr bool is_string = IsStringLike<T>::value;
  if (!first && !is_string && !prev_is_string)
  {
    out += ' ';
  }
  fmt::format_to(std::back_inserter(out), "{}", arg);
  first = false;
  prev_is_string = is_string;
}

// Operands back to back; a space only between two non-string operands.
template <typename... Args>
std::string Sprint(const Args&... args)
{
  std::string out;
  bool first = true;
  bool prev_is_string = false;
  (AppendOperand(out, args, first, prev_is_string), ...);
  return out;
}

// Operands separated by single spaces.
template <typename... Args>
std::string Sprintln(const Args&... args)
{
  std::string out;
  bool first = true;
  auto append = [&out, &first](const auto& arg)
  {
    if (!first) out += ' ';
    fmt::format_to(std::back_inserter(out), "{}", arg);
    first = false;
  };
  (append(args), ...);
  return out;
}

// printf-style formatting; a malformed format is reported inline instead of thrown.
template <typename... Args>
std::string Sprintf(const char* format, const Args&... args)
{
  try
  {
    return fmt::sprintf(format, args...);
  }
  catch (const fmt::format_error& e)
  {
    return fmt::format("{} %!({})", format, e.what());
  }
}

}  // namespace detail

// A printf format string together with the place it was written.
struct LocatedFormat
{
  LocatedFormat(const char* str, const SourceLocation& site = SourceLocation::Current())
      : format(str), loc(site)
  {
  }

  const char* format;
  SourceLocation loc;
};

class LocatedWriter;

// A severity writer: one level, one shared fan-out sink, one prefix policy.
// Every write is a single MultiSink::Write of a complete line.
class LevelWriter
{
 public:
  // origin is the call site recorded in a Frozen prefix.
  LevelWriter(std::shared_ptr<MultiSink> sink, SeverityLevel level, FormatOptions options,
              PrefixMode mode, const SourceLocation& origin);

  // Writes prefix + msg, appending '\n' unless msg already ends with one.
  // loc is used for the file:line segment in PerLine mode.
  void Output(std::string_view msg, const SourceLocation& loc = SourceLocation::Current()) const;
  void Output(const SourceLocation& loc, std::string_view msg) const;

  template <typename... Args>
  void Printf(LocatedFormat format, const Args&... args) const
  {
    Output(format.loc, detail::Sprintf(format.format, args...));
  }

  template <typename... Args>
  void PrintfAt(const SourceLocation& loc, const char* format, const Args&... args) const
  {
    Output(loc, detail::Sprintf(format, args...));
  }

  // Println and Print carry no call site; use Here() or the Logger accessors for one.
  template <typename... Args>
  void Println(const Args&... args) const
  {
    Output(SourceLocation{}, detail::Sprintln(args...));
  }

  template <typename... Args>
  void PrintlnAt(const SourceLocation& loc, const Args&... args) const
  {
    Output(loc, detail::Sprintln(args...));
  }

  template <typename... Args>
  void Print(const Args&... args) const
  {
    Output(SourceLocation{}, detail::Sprint(args...));
  }

  template <typename... Args>
  void PrintAt(const SourceLocation& loc, const Args&... args) const
  {
    Output(loc, detail::Sprint(args...));
  }

  // This writer bound to the caller's file and line.
  LocatedWriter Here(const SourceLocation& loc = SourceLocation::Current()) const;

  SeverityLevel Level() const { return level_; }
  FormatOptions Options() const { return options_; }
  PrefixMode Mode() const { return mode_; }

  // The precomputed prefix; empty in PerLine mode.
  const std::string& Prefix() const { return prefix_; }

  const std::shared_ptr<MultiSink>& Sink() const { return sink_; }

 private:
  std::shared_ptr<MultiSink> sink_;
  SeverityLevel level_;
  FormatOptions options_;
  PrefixMode mode_;
  std::string prefix_;
};

// A LevelWriter plus the call site every plain write reports.
// Short-lived: refers to a writer owned elsewhere.
class LocatedWriter
{
 public:
  LocatedWriter(const LevelWriter& writer, const SourceLocation& loc)
      : writer_(writer), loc_(loc)
  {
  }

  void Output(std::string_view msg) const { writer_.Output(loc_, msg); }

  template <typename... Args>
  void Printf(const char* format, const Args&... args) const
  {
    writer_.PrintfAt(loc_, format, args...);
  }

  template <typename... Args>
  void Println(const Args&... args) const
  {
    writer_.PrintlnAt(loc_, args...);
  }

  template <typename... Args>
  void Print(const Args&... args) const
  {
    writer_.PrintAt(loc_, args...);
  }

  template <typename... Args>
  void PrintfAt(const SourceLocation& loc, const char* format, const Args&... args) const
  {
    writer_.PrintfAt(loc, format, args...);
  }

  template <typename... Args>
  void PrintlnAt(const SourceLocation& loc, const Args&... args) const
  {
    writer_.PrintlnAt(loc, args...);
  }

  template <typename... Args>
  void PrintAt(const SourceLocation& loc, const Args&... args) const
  {
    writer_.PrintAt(loc, args...);
  }

  const SourceLocation& Location() const { return loc_; }
  const LevelWriter& Writer() const { return writer_; }
  operator const LevelWriter&() const { return writer_; }

  SeverityLevel Level() const { return writer_.Level(); }
  PrefixMode Mode() const { return writer_.Mode(); }
  const std::string& Prefix() const { return writer_.Prefix(); }

 private:
  const LevelWriter& writer_;
  SourceLocation loc_;
};

inline LocatedWriter LevelWriter::Here(const SourceLocation& loc) const
{
  return LocatedWriter(*this, loc);
}

}  // namespace lvl_logger

// Log calls that record their own call site (used by the file:line segment in PerLine
// mode).
#define LVL_LOGF(writer, fmt_str, ...) \
  (writer).PrintfAt(LVL_LOG_CURRENT_LOCATION(), fmt_str, ##__VA_ARGS__)
#define LVL_LOGLN(writer, ...) (writer).PrintlnAt(LVL_LOG_CURRENT_LOCATION(), __VA_ARGS__)
#define LVL_LOG(writer, ...) (writer).PrintAt(LVL_LOG_CURRENT_LOCATION(), __VA_ARGS__)
