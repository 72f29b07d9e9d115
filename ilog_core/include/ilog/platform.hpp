#pragma once

// ===== Platform detection =====
#if defined(__linux__)
#define ILOG_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define ILOG_PLATFORM_MACOS 1
#endif

#if defined(ILOG_PLATFORM_LINUX) || defined(ILOG_PLATFORM_MACOS)
#define ILOG_PLATFORM_POSIX 1
#endif

// ===== Defaults used by LogConfiguration::Builder and FileSinkOptions =====
#ifndef ILOG_DEFAULT_TAG
#define ILOG_DEFAULT_TAG "ILog"
#endif

#ifndef ILOG_DEFAULT_FILE_NAME
#define ILOG_DEFAULT_FILE_NAME "log"
#endif

// 1 MiB
#ifndef ILOG_DEFAULT_MAX_FILE_SIZE
#define ILOG_DEFAULT_MAX_FILE_SIZE (1024 * 1024)
#endif

#ifndef ILOG_DEFAULT_MAX_BACKUP_INDEX
#define ILOG_DEFAULT_MAX_BACKUP_INDEX 10
#endif

#ifndef ILOG_DEFAULT_STACK_TRACE_DEPTH
#define ILOG_DEFAULT_STACK_TRACE_DEPTH 0
#endif

// Line separator used for continuation lines and file output
#ifndef ILOG_LINE_SEPARATOR
#define ILOG_LINE_SEPARATOR "\n"
#endif
