// main.cpp - Kernel startup logic

#include "ql/core/drivers/uart.hpp"
#include "ql/core/echo.hpp"
#include "ql/core/kernel.hpp"

#if KERNEL_PROG == KERNEL_PROG_TEST_MEM
/**
 * exercises the page allocator end to end and prints the allocation table
 */
static void kernel_prog_test_mem() {
  qprintf("TEST: Starting page allocator test\n");

  PageAddr one = page_zalloc(1);
  PageAddr three = page_alloc(3);
  PageAddr two = page_zalloc(2);
  QL_SOFT_ASSERT("page allocation failed", one && three && two);

  TRACE(LSOFT, "allocated 0x%lx (1 page), 0x%lx (3 pages), 0x%lx (2 pages)", one.raw(), three.raw(), two.raw());
  memory_dump();

  // Adjacent runs coalesce once both are free
  page_dealloc(one);
  page_dealloc(three);
  PageAddr four = page_alloc(4);
  QL_SOFT_ASSERT("freed runs were not coalesced", four == one);
  memory_dump();

  page_dealloc(two);
  page_dealloc(four);
  memory_dump();
  memory_report();

  qprintf("TEST: Page allocator test complete\n");
}
#endif

// Kernel startup - initializes memory and the console, then echoes input
void kernel_start(void) {
  kernel_common();

  memory_init();

  const Uart &uart = console_uart();
  uart.init();

  qprintf("This is my operating system!\n");
  qprintf("I'm so awesome. If you start typing something, I'll show you what you typed!\n");

#if KERNEL_PROG == KERNEL_PROG_TEST_MEM
  kernel_prog_test_mem();
#endif

  echo_loop();
}
