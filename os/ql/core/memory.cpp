// memory.cpp - kernel page manager

#include "ql/core/kernel.hpp"
#include "ql/core/page-allocator.hpp"

static PageAllocator kernel_pages;
static bool memory_initialized = false;

void memory_init() {
  if (memory_initialized) {
    return;
  }

  TRACE(LSOFT, "Initializing memory management system");
  TRACE(LSOFT, "Heap: 0x%lx (%lu pages)", HEAP_START, HEAP_SIZE / QL_PAGE_SIZE);

  kernel_pages.init(PageAddr(HEAP_START), HEAP_SIZE);
  memory_initialized = true;

  TRACE(LSOFT, "Memory initialization complete. %lu usable pages from 0x%lx", kernel_pages.frame_count(),
        kernel_pages.alloc_start().raw());
}

PageAddr page_alloc(size_t pages) {
  if (!memory_initialized) {
    PANIC("page_alloc called before memory_init");
  }
  return kernel_pages.alloc(pages);
}

PageAddr page_zalloc(size_t pages) {
  if (!memory_initialized) {
    PANIC("page_zalloc called before memory_init");
  }
  return kernel_pages.zalloc(pages);
}

void page_dealloc(PageAddr ptr) {
  if (!memory_initialized) {
    PANIC("page_dealloc called before memory_init");
  }
  kernel_pages.dealloc(ptr);
}

void memory_dump() { kernel_pages.dump(); }

void memory_report() { kernel_pages.report(); }
