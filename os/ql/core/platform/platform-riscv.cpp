// platform-riscv.cpp - rv64 QEMU virt specific functionality

#include "ql/core/drivers/uart.hpp"
#include "ql/core/kernel.hpp"

#define SSTATUS_SIE (1 << 1)

extern "C" char __stack_top[];

#define WRITE_CSR(reg, value)                                                                                          \
  do {                                                                                                                 \
    unsigned long __tmp = (value);                                                                                     \
    __asm__ __volatile__("csrw " #reg ", %0" ::"r"(__tmp));                                                            \
  } while (0)

#define CLEAR_CSR(reg, mask)                                                                                           \
  do {                                                                                                                 \
    unsigned long __tmp = (mask);                                                                                      \
    __asm__ __volatile__("csrc " #reg ", %0" ::"r"(__tmp));                                                            \
  } while (0)

// The heap bounds come from the linker script. Publishing them as data words
// lets C++ read them as plain integers.
__asm__(".pushsection .rodata\n"
        ".balign 8\n"
        ".global HEAP_START\n"
        "HEAP_START: .dword __heap_start\n"
        ".global HEAP_SIZE\n"
        "HEAP_SIZE: .dword __heap_size\n"
        ".popsection\n");

extern "C" {

int qputchar(char ch) {
  const Uart &uart = console_uart();
  if (ch == '\n') {
    uart.put('\r');
  }
  uart.put((uint8_t)ch);
  return 1;
}

} // extern "C"

void kernel_halt(void) {
  for (;;) {
    __asm__ __volatile__("wfi");
  }
}

extern "C" [[noreturn]] void kernel_main(void) {
  // Nothing here takes traps or interrupts
  CLEAR_CSR(sstatus, SSTATUS_SIE);
  WRITE_CSR(sie, 0);
  kernel_start();
}

__attribute__((section(".text.boot"))) __attribute__((naked)) extern "C" void boot(void) {
  __asm__ __volatile__("mv sp, %[stack_top]\n" // Set the stack pointer
                       "j kernel_main\n"       // Jump to the kernel main function
                       :
                       : [stack_top] "r"(__stack_top) // Pass the stack top address as %[stack_top]
  );
}
