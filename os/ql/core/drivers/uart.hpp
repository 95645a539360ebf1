// uart.hpp - NS16550A compatible UART driver
#ifndef QL_CORE_DRIVERS_UART_HPP
#define QL_CORE_DRIVERS_UART_HPP

#include "ql/common.h"
#include "ql/lib/address.hpp"

/**
 * Byte-oriented polled driver for a 16550 UART. All register accesses are
 * volatile 8-bit MMIO.
 */
class Uart {
public:
  // Register offsets from the base address
  static constexpr uintptr_t REG_RBR = 0x00; // receiver buffer (read)
  static constexpr uintptr_t REG_THR = 0x00; // transmit holding (write)
  static constexpr uintptr_t REG_DLL = 0x00; // divisor latch low (DLAB=1)
  static constexpr uintptr_t REG_IER = 0x01; // interrupt enable
  static constexpr uintptr_t REG_DLM = 0x01; // divisor latch high (DLAB=1)
  static constexpr uintptr_t REG_FCR = 0x02; // FIFO control (write)
  static constexpr uintptr_t REG_LCR = 0x03; // line control
  static constexpr uintptr_t REG_LSR = 0x05; // line status

  static constexpr uint8_t LCR_WORD_8BIT = 0x03;
  static constexpr uint8_t LCR_DLAB = 0x80;
  static constexpr uint8_t FCR_FIFO_ENABLE = 0x01;
  static constexpr uint8_t IER_RX_AVAILABLE = 0x01;
  static constexpr uint8_t LSR_DATA_READY = 0x01;
  static constexpr uint8_t LSR_THR_EMPTY = 0x20;

  // 2400 baud from the 22.729 MHz reference clock: ceil(22729000 / (2400 * 16))
  static constexpr uint16_t DIVISOR = 592;

  constexpr explicit Uart(MmioAddr base) : base_(base) {}

  Uart(const Uart &) = delete;
  Uart &operator=(const Uart &) = delete;

  /** Sets 8-bit words, enables the FIFO and programs the baud divisor. */
  void init() const;

  /** Blocking write of one byte. */
  void put(uint8_t byte) const;

  /** Non-blocking read. Returns an error result if no byte is waiting. */
  BoolResult<uint8_t> get() const;

  MmioAddr base() const { return base_; }

private:
  MmioAddr base_;

  uint8_t read_reg(uintptr_t offset) const { return *(base_ + offset).as<volatile uint8_t>(); }
  void write_reg(uintptr_t offset, uint8_t value) const { *(base_ + offset).as<volatile uint8_t>() = value; }
};

/** The console UART at QL_UART_BASE */
Uart &console_uart();

#endif
