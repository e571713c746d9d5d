#pragma once
#include <cstddef>
#include <cstdint>

namespace lvl_logger
{

uint64_t wall_clock_now_ns();

// Local time as "YYYY-MM-DD HH:MM:SS". Returns the number of chars written.
size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size);

}  // namespace lvl_logger
