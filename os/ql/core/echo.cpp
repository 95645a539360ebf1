// echo.cpp - interactive byte echo console

#include "ql/core/echo.hpp"
#include "ql/core/drivers/uart.hpp"

void EchoConsole::emit(const char *str) {
  while (*str) {
    sink_((uint8_t)*str++);
  }
}

void EchoConsole::feed_csi(uint8_t byte) {
  switch (byte) {
  case 'A':
    emit("That's the up arrow!\r\n");
    break;
  case 'B':
    emit("That's the down arrow!\r\n");
    break;
  case 'C':
    emit("That's the right arrow!\r\n");
    break;
  case 'D':
    emit("That's the left arrow!\r\n");
    break;
  default:
    emit("That's something else.....\r\n");
    break;
  }
}

void EchoConsole::feed(uint8_t byte) {
  switch (state_) {
  case STATE_ESCAPE:
    if (byte == ECHO_CSI_BRACKET) {
      state_ = STATE_CSI;
    } else {
      // Not a CSI sequence; the byte is consumed without output
      state_ = STATE_NORMAL;
    }
    return;
  case STATE_CSI:
    feed_csi(byte);
    state_ = STATE_NORMAL;
    return;
  case STATE_NORMAL:
    break;
  }

  switch (byte) {
  case ECHO_BS:
    // Back up, blank the cell, back up again
    sink_(ECHO_BS);
    sink_(' ');
    sink_(ECHO_BS);
    break;
  case ECHO_LF:
  case ECHO_CR:
    emit("\r\n");
    break;
  case ECHO_ESC:
    state_ = STATE_ESCAPE;
    break;
  default:
    sink_(byte);
    break;
  }
}

static void echo_to_console(uint8_t byte) { console_uart().put(byte); }

void echo_loop(void) {
  EchoConsole console(echo_to_console);
  const Uart &uart = console_uart();

  for (;;) {
    BoolResult<uint8_t> byte = uart.get();
    if (byte) {
      console.feed(*byte);
    }
  }
}
