// result-test.cpp - Unit tests for Result<T,E> type

#include "ql/common.h"
#include "doctest/doctest.h"

TEST_CASE("Result basic operations") {
  SUBCASE("ok() creates success result") {
    auto result = BoolResult<int>::ok(42);
    CHECK(result.is_ok());
    CHECK(!result.is_err());
    CHECK(result);
    CHECK(result.value() == 42);
    CHECK(*result == 42);
  }

  SUBCASE("err() creates error result") {
    auto result = BoolResult<int>::err(false);
    CHECK(!result.is_ok());
    CHECK(result.is_err());
    CHECK(!result);
    CHECK(result.error() == false);
  }

  SUBCASE("value_or() picks the value or the default") {
    CHECK(BoolResult<int>::ok(42).value_or(100) == 42);
    CHECK(BoolResult<int>::err(false).value_or(100) == 100);
  }
}

TEST_CASE("Result with custom error type") {
  enum ErrorCode { INVALID_INPUT = 1, OUT_OF_RANGE = 2 };

  auto bad = Result<uint8_t, ErrorCode>::err(OUT_OF_RANGE);
  CHECK(bad.is_err());
  CHECK(bad.error() == OUT_OF_RANGE);

  auto good = Result<uint8_t, ErrorCode>::ok(7);
  CHECK(good.is_ok());
  CHECK(good.value() == 7);
}

TEST_CASE("Result is usable in constant expressions") {
  constexpr auto result = BoolResult<int>::ok(5);
  static_assert(result.is_ok(), "ok result");
  static_assert(*result == 5, "ok value");
  CHECK(result.value_or(0) == 5);
}
