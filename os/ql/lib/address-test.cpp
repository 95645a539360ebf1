// address-test.cpp - Address<Tag> arithmetic and alignment

#include "ql/lib/address.hpp"
#include "doctest/doctest.h"

TEST_CASE("Address basics") {
  PageAddr null;
  CHECK(null.is_null());
  CHECK(!null);

  PageAddr a(0x80201000UL);
  CHECK(!a.is_null());
  CHECK(a.raw() == 0x80201000UL);
  CHECK((uintptr_t)a.as<uint8_t>() == 0x80201000UL);

  uint64_t word = 0;
  PageAddr from_ptr(&word);
  CHECK(from_ptr.as<uint64_t>() == &word);
}

TEST_CASE("Address arithmetic and comparison") {
  PageAddr a(0x1000);
  PageAddr b = a + 0x2000;
  CHECK(b.raw() == 0x3000);
  CHECK(b - a == 0x2000);
  CHECK(a < b);
  CHECK(b >= a);
  CHECK(a != b);

  a += 0x2000;
  CHECK(a == b);
}

TEST_CASE("Address alignment") {
  PageAddr p(0x1001);
  CHECK(!p.aligned(QL_PAGE_SIZE));
  CHECK(p.align_up(QL_PAGE_SIZE).raw() == 0x2000);
  CHECK(p.align_down(QL_PAGE_SIZE).raw() == 0x1000);

  PageAddr q(0x4000);
  CHECK(q.aligned(QL_PAGE_SIZE));
  CHECK(q.align_up(QL_PAGE_SIZE) == q);
}
