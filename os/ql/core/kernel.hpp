#ifndef QL_KERNEL_HPP
#define QL_KERNEL_HPP

#include "ql/common.h"
#include "ql/lib/address.hpp"

/**
 * Prints a diagnostic and halts the machine. Never returns.
 */
[[noreturn]] void kernel_panic(const char *file, int line, const char *fmt, ...) __attribute__((format(printf, 3, 4)));

#define PANIC(fmt, ...) kernel_panic(__FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define QL_ASSERT(msg, condition)                                                                                      \
  do {                                                                                                                 \
    if (!(condition)) {                                                                                                \
      PANIC("assertion failed: %s (%s)", msg, #condition);                                                             \
    }                                                                                                                  \
  } while (0)

#define TRACE(level, fmt, ...)                                                                                         \
  do {                                                                                                                 \
    if (LOG_GENERAL >= (level)) {                                                                                      \
      qprintf("[dbg] %s:%d: " fmt "\n", __FILE__, __LINE__, ##__VA_ARGS__);                                            \
    }                                                                                                                  \
  } while (0)

#define TRACE_MEM(level, fmt, ...)                                                                                     \
  do {                                                                                                                 \
    if (LOG_MEM >= (level)) {                                                                                          \
      qprintf("[mem] %s:%d: " fmt "\n", __FILE__, __LINE__, ##__VA_ARGS__);                                            \
    }                                                                                                                  \
  } while (0)

/** Message of the most recent panic, for post-mortem inspection */
extern char panic_message[256];

// platform specific functions

/** Stops the hart for good. On hardware this is a wfi loop. */
[[noreturn]] void kernel_halt(void);

// memory management

/**
 * Physical heap region, set up by the boot code from the linker script.
 * HEAP_START is page aligned and HEAP_SIZE is a multiple of QL_PAGE_SIZE.
 */
extern "C" const uintptr_t HEAP_START;
extern "C" const uintptr_t HEAP_SIZE;

void memory_init();
PageAddr page_alloc(size_t pages);
PageAddr page_zalloc(size_t pages);
void page_dealloc(PageAddr ptr);
void memory_dump();
void memory_report();

// startup

void kernel_common(void);
[[noreturn]] void kernel_start(void);

#endif
