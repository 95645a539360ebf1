#include "ql/core/kernel.hpp"

#ifndef QL_POSIX
extern "C" char __bss[], __bss_end[];
#endif

// Common kernel initialization
void kernel_common(void) {
#ifndef QL_POSIX
  qmemset(__bss, 0, (size_t)__bss_end - (size_t)__bss);
#endif
  TRACE(LSOFT, "hello from kernel_common");
  // Physical addressing only; satp stays zero and no page tables exist
  TRACE(LSOFT, "Physical memory mode - no MMU");
}
