// uart-test.cpp - 16550 driver against an in-memory register block
#include "doctest/doctest.h"

#include "ql/core/drivers/uart.hpp"

// The fake block has no DLAB banking, so divisor writes land on RBR/THR and
// IER directly.
struct FakeRegisters {
  alignas(8) volatile uint8_t regs[8] = {};

  MmioAddr base() { return MmioAddr((uintptr_t)regs); }
  uint8_t reg(uintptr_t offset) const { return regs[offset]; }
  void set(uintptr_t offset, uint8_t value) { regs[offset] = value; }
};

TEST_CASE("uart init programs line control, fifo and divisor") {
  FakeRegisters fake;
  Uart uart(fake.base());

  uart.init();

  CHECK(fake.reg(Uart::REG_LCR) == Uart::LCR_WORD_8BIT);
  CHECK(fake.reg(Uart::REG_FCR) == Uart::FCR_FIFO_ENABLE);
  CHECK(fake.reg(Uart::REG_DLL) == (592 & 0xff));
  CHECK(fake.reg(Uart::REG_DLM) == (592 >> 8));
  CHECK(uart.base() == fake.base());
}

TEST_CASE("uart put") {
  FakeRegisters fake;
  Uart uart(fake.base());
  fake.set(Uart::REG_LSR, Uart::LSR_THR_EMPTY);

  uart.put('x');
  CHECK(fake.reg(Uart::REG_THR) == 'x');

  uart.put('y');
  CHECK(fake.reg(Uart::REG_THR) == 'y');
}

TEST_CASE("uart get") {
  FakeRegisters fake;
  Uart uart(fake.base());

  SUBCASE("nothing waiting") {
    fake.set(Uart::REG_LSR, Uart::LSR_THR_EMPTY);
    fake.set(Uart::REG_RBR, 'q');
    BoolResult<uint8_t> byte = uart.get();
    CHECK(byte.is_err());
  }

  SUBCASE("byte ready") {
    fake.set(Uart::REG_LSR, Uart::LSR_THR_EMPTY | Uart::LSR_DATA_READY);
    fake.set(Uart::REG_RBR, 'q');
    BoolResult<uint8_t> byte = uart.get();
    REQUIRE(byte.is_ok());
    CHECK(*byte == 'q');
  }
}

TEST_CASE("console uart sits at the configured base") {
  CHECK(console_uart().base().raw() == (uintptr_t)QL_UART_BASE);
}
