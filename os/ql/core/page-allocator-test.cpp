// page-allocator-test.cpp - page frame allocator tests
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "ql/core/kernel.hpp"
#include "ql/core/page-allocator.hpp"
#include "ql/core/platform/platform-test.hpp"

#include <string.h>

// 1 MiB heap: 256 frames, a 256 byte descriptor table and 255 usable frames
// starting one page above the heap base.
static constexpr size_t SCENARIO_HEAP_SIZE = 0x100000;
alignas(QL_PAGE_SIZE) static uint8_t scenario_heap[SCENARIO_HEAP_SIZE];

static const uint8_t TAKEN_LAST = PAGE_TAKEN | PAGE_LAST;

static uintptr_t heap_base() { return (uintptr_t)scenario_heap; }

static void init_scenario_heap(PageAllocator &pages) { pages.init(PageAddr(scenario_heap), sizeof(scenario_heap)); }

static bool descriptors_valid(const PageAllocator &pages) {
  for (size_t i = 0; i < pages.frame_count(); i++) {
    uint8_t d = pages.descriptor(i);
    if ((d & ~TAKEN_LAST) != 0) {
      return false;
    }
    if ((d & PAGE_LAST) && !(d & PAGE_TAKEN)) {
      return false;
    }
  }
  return true;
}

TEST_CASE("page allocator layout") {
  PageAllocator pages;
  init_scenario_heap(pages);

  CHECK(pages.heap_start().raw() == heap_base());
  CHECK(pages.table_size() == 256);
  CHECK(pages.alloc_start().raw() == heap_base() + 0x1000);
  CHECK(pages.alloc_start().aligned(QL_PAGE_SIZE));
  CHECK(pages.frame_count() == 255);
  CHECK(pages.free_pages() == 255);
  CHECK(pages.allocated_pages() == 0);

  for (size_t i = 0; i < pages.table_size(); i++) {
    CHECK(scenario_heap[i] == PAGE_FREE);
  }
}

TEST_CASE("page allocator scenarios") {
  PageAllocator pages;
  init_scenario_heap(pages);

  SUBCASE("single page") {
    PageAddr p = pages.alloc(1);
    CHECK(p.raw() == heap_base() + 0x1000);
    CHECK(pages.descriptor(0) == TAKEN_LAST);
    CHECK(pages.descriptor(1) == PAGE_FREE);
  }

  SUBCASE("two runs, free, reuse") {
    PageAddr a = pages.alloc(3);
    PageAddr b = pages.alloc(2);
    CHECK(a.raw() == heap_base() + 0x1000);
    CHECK(b.raw() == heap_base() + 0x4000);
    CHECK(pages.descriptor(0) == PAGE_TAKEN);
    CHECK(pages.descriptor(1) == PAGE_TAKEN);
    CHECK(pages.descriptor(2) == TAKEN_LAST);
    CHECK(pages.descriptor(3) == PAGE_TAKEN);
    CHECK(pages.descriptor(4) == TAKEN_LAST);
    CHECK(pages.descriptor(5) == PAGE_FREE);

    pages.dealloc(a);
    PageAddr c = pages.alloc(2);
    CHECK(c.raw() == heap_base() + 0x1000);
    CHECK(pages.descriptor(0) == PAGE_TAKEN);
    CHECK(pages.descriptor(1) == TAKEN_LAST);
    CHECK(pages.descriptor(2) == PAGE_FREE);
    CHECK(pages.descriptor(3) == PAGE_TAKEN);
    CHECK(pages.descriptor(4) == TAKEN_LAST);
  }

  SUBCASE("single pages until exhausted") {
    for (size_t i = 0; i < 255; i++) {
      PageAddr p = pages.alloc(1);
      REQUIRE(!p.is_null());
      CHECK(p.raw() == heap_base() + 0x1000 + i * QL_PAGE_SIZE);
    }
    CHECK(pages.alloc(1).is_null());
    CHECK(pages.free_pages() == 0);
    CHECK(pages.stats().failed_allocations == 1);
  }

  SUBCASE("zalloc clears previous contents") {
    PageAddr dirty = pages.alloc(2);
    memset(dirty.as_ptr(), 0xab, 2 * QL_PAGE_SIZE);
    pages.dealloc(dirty);

    PageAddr p = pages.zalloc(2);
    REQUIRE(p == dirty);
    const uint8_t *bytes = p.as<uint8_t>();
    bool all_zero = true;
    for (size_t i = 0; i < 2 * QL_PAGE_SIZE; i++) {
      all_zero = all_zero && bytes[i] == 0;
    }
    CHECK(all_zero);
    // the frame after the run is untouched
    CHECK(p.as<uint8_t>()[2 * QL_PAGE_SIZE] != 0xab);
  }

  SUBCASE("double free panics") {
    PageAddr p = pages.alloc(1);
    pages.dealloc(p);
    CHECK_THROWS_AS(pages.dealloc(p), KernelHalted);
    CHECK(strstr(panic_message, "double-free") != nullptr);
  }
}

TEST_CASE("page allocator search bound") {
  PageAllocator pages;
  init_scenario_heap(pages);

  SUBCASE("a request can fill the whole heap") {
    PageAddr p = pages.alloc(255);
    CHECK(p.raw() == heap_base() + 0x1000);
    CHECK(pages.descriptor(254) == TAKEN_LAST);
    CHECK(pages.alloc(1).is_null());
    pages.dealloc(p);
    CHECK(pages.free_pages() == 255);
  }

  SUBCASE("a run can end on the last frame") {
    PageAddr head = pages.alloc(250);
    PageAddr tail = pages.alloc(5);
    CHECK(tail.raw() == heap_base() + 0x1000 + 250 * QL_PAGE_SIZE);
    CHECK(pages.descriptor(254) == TAKEN_LAST);
    pages.dealloc(head);
    pages.dealloc(tail);
  }

  SUBCASE("requests larger than the heap fail") {
    CHECK(pages.alloc(256).is_null());
    CHECK(pages.alloc(100000).is_null());
    CHECK(pages.stats().failed_allocations == 2);
    CHECK(pages.allocated_pages() == 0);
  }

  SUBCASE("no run long enough") {
    PageAddr a = pages.alloc(100);
    PageAddr b = pages.alloc(100);
    PageAddr c = pages.alloc(55);
    REQUIRE(!c.is_null());
    pages.dealloc(b);
    // 100 free frames in the middle, nothing else
    CHECK(pages.alloc(101).is_null());
    CHECK(pages.alloc(100) == b);
    pages.dealloc(a);
  }
}

TEST_CASE("page allocator round trip restores descriptors") {
  PageAllocator pages;
  init_scenario_heap(pages);

  PageAddr guard = pages.alloc(1);
  for (size_t n = 1; n <= 8; n++) {
    PageAddr p = pages.alloc(n);
    REQUIRE(!p.is_null());
    size_t first = (p - pages.alloc_start()) / QL_PAGE_SIZE;
    pages.dealloc(p);
    for (size_t i = first; i < first + n; i++) {
      CHECK(pages.descriptor(i) == PAGE_FREE);
    }
  }
  CHECK(pages.descriptor(0) == TAKEN_LAST);
  pages.dealloc(guard);
  CHECK(pages.allocated_pages() == 0);
}

TEST_CASE("page allocator coalesces adjacent runs") {
  PageAllocator pages;
  init_scenario_heap(pages);

  PageAddr a = pages.alloc(3);
  PageAddr b = pages.alloc(4);
  PageAddr fence = pages.alloc(1);

  pages.dealloc(b);
  pages.dealloc(a);

  PageAddr merged = pages.alloc(7);
  CHECK(merged == a);
  CHECK(pages.descriptor(6) == TAKEN_LAST);
  CHECK(pages.descriptor(7) == TAKEN_LAST);

  pages.dealloc(merged);
  pages.dealloc(fence);
}

TEST_CASE("page allocator exhaustion accounts for every usable frame") {
  PageAllocator pages;
  init_scenario_heap(pages);

  size_t live = 0;
  for (size_t k = 0;; k++) {
    size_t n = (k % 5) + 1;
    PageAddr p = pages.alloc(n);
    if (p.is_null()) {
      break;
    }
    live += n;
  }
  while (!pages.alloc(1).is_null()) {
    live++;
  }

  size_t usable = (SCENARIO_HEAP_SIZE - pages.table_size()) / QL_PAGE_SIZE;
  CHECK(live == usable);
  CHECK(live == pages.frame_count());
  CHECK(pages.allocated_pages() == live);
  CHECK(descriptors_valid(pages));
}

TEST_CASE("page allocator invariants under mixed workload") {
  PageAllocator pages;
  init_scenario_heap(pages);

  struct Live {
    PageAddr addr;
    size_t pages;
  };
  Live live[64];
  size_t live_count = 0;
  uint32_t seed = 12345;

  for (int step = 0; step < 2000; step++) {
    seed = seed * 1103515245 + 12345;
    uint32_t r = (seed >> 16) & 0x7fff;

    if (live_count < 64 && (r % 3 != 0 || live_count == 0)) {
      size_t n = (r % 9) + 1;
      PageAddr p = pages.alloc(n);
      if (p.is_null()) {
        continue;
      }
      CHECK(p.aligned(QL_PAGE_SIZE));
      CHECK(p >= pages.alloc_start());
      CHECK(p + n * QL_PAGE_SIZE <= pages.heap_start() + pages.heap_size());
      for (size_t j = 0; j < live_count; j++) {
        bool disjoint = p + n * QL_PAGE_SIZE <= live[j].addr || live[j].addr + live[j].pages * QL_PAGE_SIZE <= p;
        CHECK(disjoint);
      }
      live[live_count++] = {p, n};
    } else {
      size_t victim = r % live_count;
      pages.dealloc(live[victim].addr);
      live[victim] = live[--live_count];
    }

    REQUIRE(descriptors_valid(pages));
  }

  size_t expected = 0;
  for (size_t j = 0; j < live_count; j++) {
    expected += live[j].pages;
    pages.dealloc(live[j].addr);
  }
  CHECK(pages.stats().peak_usage_pages >= expected);
  CHECK(pages.allocated_pages() == 0);
  CHECK(pages.free_pages() == pages.frame_count());
}

TEST_CASE("page allocator preconditions") {
  PageAllocator pages;
  init_scenario_heap(pages);

  SUBCASE("zero pages") {
    CHECK_THROWS_AS(pages.alloc(0), KernelHalted);
    CHECK(strstr(panic_message, "0 pages") != nullptr);
  }

  SUBCASE("null pointer") {
    CHECK_THROWS_AS(pages.dealloc(PageAddr()), KernelHalted);
    CHECK(strstr(panic_message, "null") != nullptr);
  }

  SUBCASE("misaligned pointer") {
    PageAddr p = pages.alloc(1);
    CHECK_THROWS_AS(pages.dealloc(p + 8), KernelHalted);
    CHECK(pages.descriptor(0) == TAKEN_LAST);
  }

  SUBCASE("pointer into the descriptor table") {
    CHECK_THROWS_AS(pages.dealloc(PageAddr(scenario_heap)), KernelHalted);
  }

  SUBCASE("pointer past the heap") {
    PageAddr end = pages.heap_start() + pages.heap_size();
    CHECK_THROWS_AS(pages.dealloc(end), KernelHalted);
    CHECK(strstr(panic_message, "outside the heap") != nullptr);
  }

  SUBCASE("pointer to a free frame") {
    PageAddr p = pages.alloc(2);
    CHECK_THROWS_AS(pages.dealloc(p + 2 * QL_PAGE_SIZE), KernelHalted);
    CHECK(strstr(panic_message, "double-free") != nullptr);
  }
}

TEST_CASE("page allocator init rejects unusable heaps") {
  PageAllocator pages;

  SUBCASE("misaligned start") {
    CHECK_THROWS_AS(pages.init(PageAddr(scenario_heap + 16), 4 * QL_PAGE_SIZE), KernelHalted);
  }

  SUBCASE("size not a page multiple") {
    CHECK_THROWS_AS(pages.init(PageAddr(scenario_heap), 4 * QL_PAGE_SIZE + 100), KernelHalted);
  }

  SUBCASE("no room after the descriptor table") {
    CHECK_THROWS_AS(pages.init(PageAddr(scenario_heap), QL_PAGE_SIZE), KernelHalted);
    CHECK(strstr(panic_message, "no room") != nullptr);
  }

  SUBCASE("smallest usable heap") {
    pages.init(PageAddr(scenario_heap), 2 * QL_PAGE_SIZE);
    CHECK(pages.frame_count() == 1);
    PageAddr p = pages.alloc(1);
    CHECK(p.raw() == heap_base() + QL_PAGE_SIZE);
    CHECK(pages.alloc(1).is_null());
    pages.dealloc(p);
  }
}

TEST_CASE("page allocator dump") {
  PageAllocator pages;
  init_scenario_heap(pages);

  pages.alloc(3);
  pages.alloc(2);

  console_capture_begin();
  pages.dump();
  console_capture_end();
  const char *out = console_capture();

  char expected[128];
  CHECK(strstr(out, "PAGE ALLOCATION TABLE") != nullptr);

  qsnprintf(expected, sizeof(expected), "META: 0x%lx -> 0x%lx", heap_base(), heap_base() + 256);
  CHECK(strstr(out, expected) != nullptr);

  qsnprintf(expected, sizeof(expected), "PHYS: 0x%lx -> 0x%lx", heap_base() + 0x1000, heap_base() + SCENARIO_HEAP_SIZE);
  CHECK(strstr(out, expected) != nullptr);

  qsnprintf(expected, sizeof(expected), "0x%lx => 0x%lx:   3 page(s).", heap_base() + 0x1000, heap_base() + 0x3fff);
  CHECK(strstr(out, expected) != nullptr);

  qsnprintf(expected, sizeof(expected), "0x%lx => 0x%lx:   2 page(s).", heap_base() + 0x4000, heap_base() + 0x5fff);
  CHECK(strstr(out, expected) != nullptr);

  CHECK(strstr(out, "Allocated:      5 pages (     20480 bytes).") != nullptr);
  CHECK(strstr(out, "Free     :    250 pages (   1024000 bytes).") != nullptr);
}

TEST_CASE("page allocator statistics") {
  PageAllocator pages;
  init_scenario_heap(pages);

  PageAddr a = pages.alloc(4);
  PageAddr b = pages.zalloc(6);
  pages.dealloc(a);
  pages.alloc(300);

  const MemoryStats &stats = pages.stats();
  CHECK(stats.total_pages == 255);
  CHECK(stats.allocated_pages == 6);
  CHECK(stats.peak_usage_pages == 10);
  CHECK(stats.allocations == 2);
  CHECK(stats.deallocations == 1);
  CHECK(stats.failed_allocations == 1);

  console_capture_begin();
  pages.report();
  console_capture_end();
  CHECK(strstr(console_capture(), "Total pages: 255") != nullptr);
  CHECK(strstr(console_capture(), "Peak memory usage: 10 pages") != nullptr);

  pages.dealloc(b);
}

TEST_CASE("kernel page manager") {
  memory_init();

  PageAddr p = page_zalloc(2);
  REQUIRE(!p.is_null());
  CHECK(p.raw() >= HEAP_START + QL_PAGE_SIZE);
  CHECK(p.raw() + 2 * QL_PAGE_SIZE <= HEAP_START + HEAP_SIZE);

  PageAddr q = page_alloc(1);
  CHECK(q == p + 2 * QL_PAGE_SIZE);

  console_capture_begin();
  memory_dump();
  memory_report();
  console_capture_end();
  CHECK(strstr(console_capture(), "Allocated:      3 pages") != nullptr);
  CHECK(strstr(console_capture(), "Total pages: 255") != nullptr);

  page_dealloc(q);
  page_dealloc(p);
  CHECK_THROWS_AS(page_dealloc(p), KernelHalted);
}
