// uart.cpp - NS16550A compatible UART driver

#include "ql/core/drivers/uart.hpp"

void Uart::init() const {
  // Word length 8 bits, no parity, one stop bit
  write_reg(REG_LCR, LCR_WORD_8BIT);
  write_reg(REG_FCR, FCR_FIFO_ENABLE);
  // The device raises its line on received data; the hart keeps interrupts
  // disabled and polls instead
  write_reg(REG_IER, IER_RX_AVAILABLE);

  // The divisor latch shares offsets with RBR/THR and IER while DLAB is set
  write_reg(REG_LCR, LCR_WORD_8BIT | LCR_DLAB);
  write_reg(REG_DLL, (uint8_t)(DIVISOR & 0xff));
  write_reg(REG_DLM, (uint8_t)(DIVISOR >> 8));
  write_reg(REG_LCR, LCR_WORD_8BIT);
}

void Uart::put(uint8_t byte) const {
  while ((read_reg(REG_LSR) & LSR_THR_EMPTY) == 0) {
    // wait for the transmitter holding register to drain
  }
  write_reg(REG_THR, byte);
}

BoolResult<uint8_t> Uart::get() const {
  if ((read_reg(REG_LSR) & LSR_DATA_READY) == 0) {
    return BoolResult<uint8_t>::err(false);
  }
  return BoolResult<uint8_t>::ok(read_reg(REG_RBR));
}

Uart &console_uart() {
  static Uart uart(MmioAddr((uintptr_t)QL_UART_BASE));
  return uart;
}
