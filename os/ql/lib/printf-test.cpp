// printf-test.cpp - formatting through the kernel printf wrappers

#include "ql/common.h"
#include "ql/core/platform/platform-test.hpp"
#include "doctest/doctest.h"

TEST_CASE("qsnprintf formats the allocation table fields") {
  char buf[128];

  SUBCASE("hex address") {
    qsnprintf(buf, sizeof(buf), "0x%lx", 0x80201000UL);
    CHECK(strcmp(buf, "0x80201000") == 0);
  }

  SUBCASE("padded page count") {
    qsnprintf(buf, sizeof(buf), "%3lu page(s).", 2UL);
    CHECK(strcmp(buf, "  2 page(s).") == 0);
  }

  SUBCASE("padded totals") {
    qsnprintf(buf, sizeof(buf), "%6lu pages (%10lu bytes).", 5UL, 20480UL);
    CHECK(strcmp(buf, "     5 pages (     20480 bytes).") == 0);
  }

  SUBCASE("truncation") {
    int r = qsnprintf(buf, 4, "%s", "abcdef");
    CHECK(r == 6);
    CHECK(strcmp(buf, "abc") == 0);
  }
}

TEST_CASE("qprintf writes through qputchar") {
  console_capture_begin();
  qprintf("pages: %d\n", 12);
  qputsn("xyz", 2);
  console_capture_end();
  CHECK(strcmp(console_capture(), "pages: 12\nxy") == 0);
}

TEST_CASE("qmemset") {
  uint8_t bytes[16];
  qmemset(bytes, 0x5a, sizeof(bytes));
  CHECK(bytes[0] == 0x5a);
  CHECK(bytes[15] == 0x5a);
}
