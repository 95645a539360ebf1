// ql/common.h - global type definitions and globally available functions
#ifndef QL_COMMON_H
#define QL_COMMON_H

#include "ql/config.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <string.h>

#define QL_SOFT_ASSERT(msg, condition)                                                                                 \
  do {                                                                                                                 \
    if (!(condition)) {                                                                                                \
      qprintf("SOFT-ASSERT: %s\n", msg);                                                                               \
    }                                                                                                                  \
  } while (0)

// These are common C stdlib-like functions, callable from anywhere

// Quill-specific wrappers
void qprintf(const char *fmt, ...) __attribute__((format(printf, 1, 2)));
int qvsnprintf(char *str, size_t size, const char *format, va_list args);
int qsnprintf(char *str, size_t size, const char *format, ...) __attribute__((format(printf, 3, 4)));
int qputsn(const char *str, int n);
void *qmemset(void *buf, int c, size_t n);

// qputchar -- returns 0 in case of failure, 1 otherwise
int qputchar(char);

#define QL_PAGE_ORDER 12
#define QL_PAGE_SIZE (1 << QL_PAGE_ORDER)

/** a page sized scratch buffer for formatting -- not safe to use around any
 * other function that formats output */
extern char *ql_scratch_buffer;

#ifdef __cplusplus
} // extern "C"

// Include C++ headers outside of extern "C"
#include "ql/lib/result.hpp"

#endif

#endif
