// echo-test.cpp - echo console byte handling
#include "doctest/doctest.h"

#include "ql/core/echo.hpp"

#include <string.h>

static char echoed[512];
static size_t echoed_len = 0;

static void record(uint8_t byte) {
  if (echoed_len + 1 < sizeof(echoed)) {
    echoed[echoed_len++] = (char)byte;
    echoed[echoed_len] = '\0';
  }
}

static void reset_echoed() {
  echoed_len = 0;
  echoed[0] = '\0';
}

static void feed_all(EchoConsole &console, const char *bytes) {
  while (*bytes) {
    console.feed((uint8_t)*bytes++);
  }
}

TEST_CASE("echo console plain bytes") {
  reset_echoed();
  EchoConsole console(record);

  feed_all(console, "hi there");
  CHECK(strcmp(echoed, "hi there") == 0);
  CHECK(!console.in_sequence());
}

TEST_CASE("echo console line endings") {
  reset_echoed();
  EchoConsole console(record);

  SUBCASE("carriage return") {
    console.feed(ECHO_CR);
    CHECK(strcmp(echoed, "\r\n") == 0);
  }

  SUBCASE("line feed") {
    console.feed(ECHO_LF);
    CHECK(strcmp(echoed, "\r\n") == 0);
  }
}

TEST_CASE("echo console backspace erases a cell") {
  reset_echoed();
  EchoConsole console(record);

  console.feed('a');
  console.feed(ECHO_BS);
  CHECK(strcmp(echoed, "a\b \b") == 0);
}

TEST_CASE("echo console arrow keys") {
  reset_echoed();
  EchoConsole console(record);

  SUBCASE("up") {
    feed_all(console, "\x1b[A");
    CHECK(strcmp(echoed, "That's the up arrow!\r\n") == 0);
  }

  SUBCASE("down") {
    feed_all(console, "\x1b[B");
    CHECK(strcmp(echoed, "That's the down arrow!\r\n") == 0);
  }

  SUBCASE("right") {
    feed_all(console, "\x1b[C");
    CHECK(strcmp(echoed, "That's the right arrow!\r\n") == 0);
  }

  SUBCASE("left") {
    feed_all(console, "\x1b[D");
    CHECK(strcmp(echoed, "That's the left arrow!\r\n") == 0);
  }

  CHECK(!console.in_sequence());
}

TEST_CASE("echo console sequences split across polls") {
  reset_echoed();
  EchoConsole console(record);

  console.feed(ECHO_ESC);
  CHECK(console.in_sequence());
  CHECK(echoed_len == 0);

  console.feed(ECHO_CSI_BRACKET);
  CHECK(console.in_sequence());
  CHECK(echoed_len == 0);

  console.feed('A');
  CHECK(!console.in_sequence());
  CHECK(strcmp(echoed, "That's the up arrow!\r\n") == 0);
}

TEST_CASE("echo console unknown sequences") {
  reset_echoed();
  EchoConsole console(record);

  SUBCASE("unknown final byte") {
    feed_all(console, "\x1b[Z");
    CHECK(strcmp(echoed, "That's something else.....\r\n") == 0);
  }

  SUBCASE("escape without bracket is dropped") {
    feed_all(console, "\x1bO");
    CHECK(echoed_len == 0);
  }

  SUBCASE("normal echo resumes afterwards") {
    feed_all(console, "\x1bOP");
    CHECK(strcmp(echoed, "P") == 0);
  }

  CHECK(!console.in_sequence());
}
