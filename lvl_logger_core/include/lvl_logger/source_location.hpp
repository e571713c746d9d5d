#pragma once
#include <cstdint>

#if __cplusplus >= 202002L && __has_include(<source_location>)
#include <source_location>
#define LVL_LOG_HAS_SOURCE_LOCATION 1
#else
#define LVL_LOG_HAS_SOURCE_LOCATION 0
#endif

namespace lvl_logger
{

struct SourceLocation
{
  const char* file_path = nullptr;
  const char* file_name = nullptr;
  const char* function_name = nullptr;
  uint32_t line = 0;

  // False when no call site could be captured.
  constexpr bool Resolved() const
  {
    return file_path != nullptr && *file_path != '\0' && line > 0;
  }

  static constexpr const char* ExtractFilename(const char* path)
  {
    const char* name = path;
    for (const char* p = path; *p != '\0'; ++p)
    {
      if (*p == '/' || *p == '\\') name = p + 1;
    }
    return name;
  }

  // Used as a default argument, resolves to the caller's file and line.
#if LVL_LOG_HAS_SOURCE_LOCATION
  static SourceLocation Current(std::source_location loc = std::source_location::current())
  {
    return SourceLocation{loc.file_name(), ExtractFilename(loc.file_name()),
                          loc.function_name(), static_cast<uint32_t>(loc.line())};
  }
#else
  static constexpr SourceLocation Current(const char* file = __builtin_FILE(),
                                          const char* function = __builtin_FUNCTION(),
                                          uint32_t line = __builtin_LINE())
  {
    return SourceLocation{file, ExtractFilename(file), function, line};
  }
#endif
};

}  // namespace lvl_logger

#if LVL_LOG_HAS_SOURCE_LOCATION
#define LVL_LOG_CURRENT_LOCATION()                                                     \
  ::lvl_logger::SourceLocation                                                         \
  {                                                                                    \
    std::source_location::current().file_name(),                                       \
        ::lvl_logger::SourceLocation::ExtractFilename(                                 \
            std::source_location::current().file_name()),                              \
        std::source_location::current().function_name(),                               \
        static_cast<uint32_t>(std::source_location::current().line())                  \
  }
#else
#define LVL_LOG_CURRENT_LOCATION()                                                     \
  ::lvl_logger::SourceLocation                                                         \
  {                                                                                    \
    __FILE__, ::lvl_logger::SourceLocation::ExtractFilename(__FILE__), __func__,       \
        static_cast<uint32_t>(__LINE__)                                                \
  }
#endif
