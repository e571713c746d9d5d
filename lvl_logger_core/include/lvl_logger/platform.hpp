#pragma once

// ===== Platform detection =====
#if defined(__linux__)
    #define LVL_LOG_PLATFORM_LINUX 1
#elif defined(__APPLE__)
    #define LVL_LOG_PLATFORM_MACOS 1
#endif

#if !defined(LVL_LOG_PLATFORM_LINUX) && !defined(LVL_LOG_PLATFORM_MACOS)
    #error "lvl_logger requires a POSIX platform (open/write/mkdir/getcwd)"
#endif

// ===== Buffer for "YYYY-MM-DD HH:MM:SS" =====
#ifndef LVL_LOG_TIMESTAMP_LEN
    #define LVL_LOG_TIMESTAMP_LEN 32
#endif

// ===== Permissions for created directories / log files =====
#ifndef LVL_LOG_DIR_MODE
    #define LVL_LOG_DIR_MODE 0755
#endif
#ifndef LVL_LOG_FILE_MODE
    #define LVL_LOG_FILE_MODE 0644
#endif
