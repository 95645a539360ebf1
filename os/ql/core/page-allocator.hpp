// page-allocator.hpp - physical page frame allocator
#ifndef QL_CORE_PAGE_ALLOCATOR_HPP
#define QL_CORE_PAGE_ALLOCATOR_HPP

#include "ql/common.h"
#include "ql/lib/address.hpp"

/**
 * Descriptor flags, one descriptor byte per usable frame.
 * A descriptor without PAGE_TAKEN is free and must not carry PAGE_LAST.
 */
enum PageFlags : uint8_t {
  PAGE_FREE = 0,
  PAGE_TAKEN = 1 << 0, // frame belongs to a live allocation
  PAGE_LAST = 1 << 1,  // frame is the final frame of its allocation run
};

struct MemoryStats {
  size_t total_pages;        // usable frames
  size_t allocated_pages;    // frames currently taken
  size_t peak_usage_pages;   // high water mark of allocated_pages
  size_t allocations;        // successful alloc/zalloc calls
  size_t deallocations;      // successful dealloc calls
  size_t failed_allocations; // alloc/zalloc calls that found no run
};

/**
 * PageAllocator - first-fit contiguous page frame allocator
 *
 * Carves the heap region [heap_start, heap_start + heap_size) into
 * QL_PAGE_SIZE frames. The descriptor table sits at heap_start, one byte per
 * frame of the whole region; usable frames start at the first page boundary
 * above it (alloc_start). Descriptor i describes the frame at
 * alloc_start + i * QL_PAGE_SIZE, so no descriptor ever covers the table.
 *
 * An allocation is a run of TAKEN descriptors whose final descriptor is also
 * LAST. dealloc() finds the end of a run from the pointer alone.
 *
 * Not thread safe. init() must run before anything else.
 */
class PageAllocator {
public:
  /**
   * Zeroes the descriptor table and computes alloc_start. Panics if the region
   * is not page aligned or cannot hold the table plus one usable frame.
   */
  void init(PageAddr heap_start, size_t heap_size);

  /**
   * Allocates `pages` contiguous frames. Returns a null PageAddr if no free run
   * is long enough. Frame contents are left as they were.
   * Panics if pages == 0.
   */
  PageAddr alloc(size_t pages);

  /** Like alloc(), but zeroes the run. */
  PageAddr zalloc(size_t pages);

  /**
   * Frees the run starting at `ptr`, which must come from alloc() or zalloc()
   * and not have been freed since. Panics on null, misaligned or out of range
   * pointers and on a run that ends without a LAST descriptor (double free).
   */
  void dealloc(PageAddr ptr);

  /** Prints every allocation run and the allocated/free totals. */
  void dump() const;

  /** Prints allocation statistics. */
  void report() const;

  PageAddr heap_start() const { return heap_start_; }
  size_t heap_size() const { return heap_size_; }
  PageAddr alloc_start() const { return alloc_start_; }
  size_t table_size() const { return table_size_; }
  size_t frame_count() const { return frame_count_; }
  uint8_t descriptor(size_t index) const { return table_[index]; }

  size_t allocated_pages() const { return stats_.allocated_pages; }
  size_t free_pages() const { return frame_count_ - stats_.allocated_pages; }
  const MemoryStats &stats() const { return stats_; }

private:
  PageAddr heap_start_;
  size_t heap_size_ = 0;
  uint8_t *table_ = nullptr;
  size_t table_size_ = 0;
  PageAddr alloc_start_;
  size_t frame_count_ = 0;
  MemoryStats stats_ = {0, 0, 0, 0, 0, 0};

  bool run_is_free(size_t first, size_t pages) const;
  PageAddr frame_addr(size_t index) const { return alloc_start_ + index * QL_PAGE_SIZE; }
};

#endif
