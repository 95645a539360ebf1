// echo.hpp - interactive byte echo console
#ifndef QL_CORE_ECHO_HPP
#define QL_CORE_ECHO_HPP

#include "ql/common.h"

#define ECHO_BS 0x08
#define ECHO_LF 0x0a
#define ECHO_CR 0x0d
#define ECHO_ESC 0x1b
#define ECHO_CSI_BRACKET 0x5b

/** Receives every byte the console writes back */
typedef void (*EchoSink)(uint8_t byte);

/**
 * Echoes typed bytes back to the terminal.
 *
 * Backspace erases the previous cell, CR and LF both become CRLF, and the CSI
 * arrow key sequences ESC [ A..D are reported by name. An ESC followed by
 * anything but '[' swallows that byte silently. Escape sequences are decoded
 * one byte per feed() call, so a sequence that arrives across several polls
 * is still recognised.
 */
class EchoConsole {
public:
  explicit EchoConsole(EchoSink sink) : sink_(sink) {}

  void feed(uint8_t byte);

  /** True while part of an escape sequence has been consumed */
  bool in_sequence() const { return state_ != STATE_NORMAL; }

private:
  enum State { STATE_NORMAL, STATE_ESCAPE, STATE_CSI };

  EchoSink sink_;
  State state_ = STATE_NORMAL;

  void emit(const char *str);
  void feed_csi(uint8_t byte);
};

/** Polls the console UART forever, echoing what it receives. */
[[noreturn]] void echo_loop(void);

#endif
