// std.cpp - standard library like functions

#include "ql/common.h"

#if defined(QL_POSIX)
// Host builds format with the system libc
#include <stdio.h>

#elif defined(USE_PICOLIBC)
// Picolibc provides vsnprintf via tinystdio
#include <stdio.h>

// The put function signature: int (*put)(char c, FILE *stream)
static int _ql_stdout_put(char c, FILE *stream) {
  (void)stream;
  return qputchar(c);
}

static FILE _ql_stdout_file = FDEV_SETUP_STREAM(_ql_stdout_put, NULL, NULL, __SWR);

// Export as stdout (picolibc expects this)
FILE *const stdout = &_ql_stdout_file;

#else
// Freestanding builds without picolibc format with mpaland/printf
extern "C" {
int vsnprintf_(char *buffer, size_t count, const char *format, va_list va);

// Required by mpaland/printf for its direct output functions, which are unused
void _putchar(char character) { (void)character; }

// The compiler may emit calls to these even in freestanding code
void *memset(void *buf, int c, size_t n) { return qmemset(buf, c, n); }

void *memcpy(void *dst, const void *src, size_t n) {
  uint8_t *d = (uint8_t *)dst;
  const uint8_t *s = (const uint8_t *)src;
  while (n--) {
    *d++ = *s++;
  }
  return dst;
}
}

#endif

static char _ql_scratch_buffer[QL_PAGE_SIZE];
extern "C" char *ql_scratch_buffer = _ql_scratch_buffer;

int qvsnprintf(char *str, size_t size, const char *format, va_list args) {
#if defined(QL_POSIX) || defined(USE_PICOLIBC)
  return vsnprintf(str, size, format, args);
#else
  return vsnprintf_(str, size, format, args);
#endif
}

int qsnprintf(char *str, size_t size, const char *format, ...) {
  va_list args;
  va_start(args, format);
  int r = qvsnprintf(str, size, format, args);
  va_end(args);
  return r;
}

int qputsn(const char *str, int n) {
  for (int i = 0; i < n; i++) {
    if (!qputchar(str[i])) {
      return 0;
    }
  }
  return 1;
}

void qprintf(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  int len = qvsnprintf(ql_scratch_buffer, QL_PAGE_SIZE, fmt, args);
  va_end(args);
  if (len < 0) {
    return;
  }
  // vsnprintf reports the untruncated length
  if (len >= QL_PAGE_SIZE) {
    len = QL_PAGE_SIZE - 1;
  }
  qputsn(ql_scratch_buffer, len);
}

void *qmemset(void *buf, int c, size_t n) {
  uint8_t *p = (uint8_t *)buf;
  while (n--) {
    *p++ = (uint8_t)c;
  }
  return buf;
}
