// panic.cpp - fatal error path

#include "ql/core/kernel.hpp"

char panic_message[256];

void kernel_panic(const char *file, int line, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  qvsnprintf(panic_message, sizeof(panic_message), fmt, args);
  va_end(args);

  qprintf("PANIC: %s:%d: %s\n", file, line, panic_message);
  kernel_halt();
}
