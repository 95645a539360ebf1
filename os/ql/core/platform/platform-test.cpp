#include "ql/core/platform/platform-test.hpp"
#include "ql/core/kernel.hpp"

#include <stdio.h>

// Test heap - 256 pages of ordinary memory stand in for the physical heap
alignas(QL_PAGE_SIZE) static char test_heap[256 * QL_PAGE_SIZE];
extern "C" const uintptr_t HEAP_START = (uintptr_t)test_heap;
extern "C" const uintptr_t HEAP_SIZE = sizeof(test_heap);

static char capture_buffer[64 * 1024];
static size_t capture_len = 0;
static bool capturing = false;

void console_capture_begin() {
  capture_len = 0;
  capture_buffer[0] = '\0';
  capturing = true;
}

const char *console_capture() { return capture_buffer; }

void console_capture_end() { capturing = false; }

extern "C" int qputchar(char ch) {
  if (!capturing) {
    return fputc(ch, stdout) != EOF;
  }
  if (capture_len + 1 >= sizeof(capture_buffer)) {
    return 0;
  }
  capture_buffer[capture_len++] = ch;
  capture_buffer[capture_len] = '\0';
  return 1;
}

// In tests a panic unwinds back into the test case instead of spinning
void kernel_halt(void) { throw KernelHalted(); }
