// page-allocator.cpp - first-fit page frame allocator

#include "ql/core/page-allocator.hpp"
#include "ql/core/kernel.hpp"

void PageAllocator::init(PageAddr heap_start, size_t heap_size) {
  if (!heap_start.aligned(QL_PAGE_SIZE) || heap_size % QL_PAGE_SIZE != 0) {
    PANIC("heap 0x%lx (0x%lx bytes) is not page aligned", heap_start.raw(), heap_size);
  }

  heap_start_ = heap_start;
  heap_size_ = heap_size;

  // One descriptor byte per frame of the whole region. The frames the table
  // itself lands on are never described.
  table_ = heap_start.as<uint8_t>();
  table_size_ = heap_size / QL_PAGE_SIZE;
  qmemset(table_, PAGE_FREE, table_size_);

  PageAddr heap_end = heap_start + heap_size;
  alloc_start_ = (heap_start + table_size_).align_up(QL_PAGE_SIZE);
  if (alloc_start_ >= heap_end) {
    PANIC("heap 0x%lx (0x%lx bytes) has no room for usable frames", heap_start.raw(), heap_size);
  }

  frame_count_ = (heap_end - alloc_start_) / QL_PAGE_SIZE;

  stats_ = {frame_count_, 0, 0, 0, 0, 0};

  TRACE_MEM(LSOFT, "descriptor table at 0x%lx (%lu bytes), %lu usable frames from 0x%lx", heap_start.raw(),
            table_size_, frame_count_, alloc_start_.raw());
}

bool PageAllocator::run_is_free(size_t first, size_t pages) const {
  for (size_t i = first; i < first + pages; i++) {
    if (table_[i] & PAGE_TAKEN) {
      return false;
    }
  }
  return true;
}

PageAddr PageAllocator::alloc(size_t pages) {
  QL_ASSERT("cannot allocate 0 pages", pages > 0);

  TRACE_MEM(LLOUD, "alloc: %lu pages", pages);

  if (pages <= frame_count_) {
    // The last candidate start is frame_count_ - pages, so a request can end
    // exactly on the last usable frame.
    for (size_t i = 0; i <= frame_count_ - pages; i++) {
      if (!run_is_free(i, pages)) {
        continue;
      }

      for (size_t k = i; k < i + pages - 1; k++) {
        table_[k] = PAGE_TAKEN;
      }
      table_[i + pages - 1] = PAGE_TAKEN | PAGE_LAST;

      stats_.allocated_pages += pages;
      stats_.allocations++;
      if (stats_.allocated_pages > stats_.peak_usage_pages) {
        stats_.peak_usage_pages = stats_.allocated_pages;
      }

      TRACE_MEM(LLOUD, "allocated frames %lu..%lu at 0x%lx", i, i + pages - 1, frame_addr(i).raw());
      return frame_addr(i);
    }
  }

  stats_.failed_allocations++;
  TRACE_MEM(LLOUD, "out of memory - no run of %lu free frames (%lu free in total)", pages, free_pages());
  return PageAddr();
}

PageAddr PageAllocator::zalloc(size_t pages) {
  PageAddr run = alloc(pages);
  if (run.is_null()) {
    return run;
  }

  // QL_PAGE_SIZE is a multiple of 8, so doubleword stores cover the run exactly
  uint64_t *words = run.as<uint64_t>();
  size_t count = (pages * QL_PAGE_SIZE) / sizeof(uint64_t);
  for (size_t i = 0; i < count; i++) {
    words[i] = 0;
  }
  return run;
}

void PageAllocator::dealloc(PageAddr ptr) {
  QL_ASSERT("cannot free a null pointer", !ptr.is_null());

  if (!ptr.aligned(QL_PAGE_SIZE) || ptr < alloc_start_) {
    PANIC("dealloc of 0x%lx: not a page allocation", ptr.raw());
  }

  size_t first = (ptr - alloc_start_) / QL_PAGE_SIZE;
  if (first >= frame_count_) {
    PANIC("dealloc of 0x%lx: descriptor 0x%lx lies outside the heap", ptr.raw(), heap_start_.raw() + first);
  }

  size_t i = first;
  while (i < frame_count_ && table_[i] == PAGE_TAKEN) {
    table_[i] = PAGE_FREE;
    i++;
  }

  if (i == frame_count_ || table_[i] != (PAGE_TAKEN | PAGE_LAST)) {
    PANIC("possible double-free detected at 0x%lx (not taken found before last)", ptr.raw());
  }
  table_[i] = PAGE_FREE;

  size_t freed = i - first + 1;
  stats_.allocated_pages -= freed;
  stats_.deallocations++;

  TRACE_MEM(LLOUD, "freed frames %lu..%lu at 0x%lx", first, i, ptr.raw());
}

void PageAllocator::dump() const {
  PageAddr table_start = heap_start_;
  PageAddr table_end = heap_start_ + table_size_;
  PageAddr phys_end = frame_addr(frame_count_);

  qprintf("\nPAGE ALLOCATION TABLE\nMETA: 0x%lx -> 0x%lx\nPHYS: 0x%lx -> 0x%lx\n", table_start.raw(), table_end.raw(),
          alloc_start_.raw(), phys_end.raw());
  qprintf("~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~\n");

  size_t taken = 0;
  for (size_t i = 0; i < frame_count_; i++) {
    if (!(table_[i] & PAGE_TAKEN)) {
      continue;
    }

    size_t first = i;
    while (table_[i] == PAGE_TAKEN && i + 1 < frame_count_ && (table_[i + 1] & PAGE_TAKEN)) {
      i++;
    }

    size_t run = i - first + 1;
    taken += run;
    qprintf("0x%lx => 0x%lx: %3lu page(s).\n", frame_addr(first).raw(), frame_addr(i).raw() + QL_PAGE_SIZE - 1, run);
  }

  size_t free_count = frame_count_ - taken;
  qprintf("~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~\n");
  qprintf("Allocated: %6lu pages (%10lu bytes).\n", taken, taken * QL_PAGE_SIZE);
  qprintf("Free     : %6lu pages (%10lu bytes).\n\n", free_count, free_count * QL_PAGE_SIZE);
}

void PageAllocator::report() const {
  qprintf("\n=== Memory Statistics ===\n");
  qprintf("Total pages: %lu\n", stats_.total_pages);
  qprintf("Current allocated pages: %lu\n", stats_.allocated_pages);
  qprintf("Peak memory usage: %lu pages\n", stats_.peak_usage_pages);
  qprintf("Allocations: %lu (%lu failed)\n", stats_.allocations, stats_.failed_allocations);
  qprintf("Deallocations: %lu\n", stats_.deallocations);
  qprintf("Current memory usage: %lu KB\n", (stats_.allocated_pages * QL_PAGE_SIZE) / 1024);
  qprintf("=========================\n");
}
