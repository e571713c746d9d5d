#pragma once
#include <cstdint>
#include <string>

#include "../format_options.hpp"
#include "../log_level.hpp"
#include "../source_location.hpp"

namespace lvl_logger
{

// Builds "<timestamp> <LEVEL> <file>:<line> " keeping only the segments selected by
// options. Segments keep that order. No options gives an empty prefix. The file:line
// segment is dropped when caller is unresolved. The caller is captured at the call
// expression (SourceLocation::Current()) rather than by walking stack frames.
std::string BuildPrefix(FormatOptions options, SeverityLevel level,
                        const SourceLocation& caller, uint64_t wall_ns);

// Same, stamped with the current wall clock.
std::string BuildPrefix(FormatOptions options, SeverityLevel level,
                        const SourceLocation& caller);

}  // namespace lvl_logger
