#ifndef QL_CONFIG_H
#define QL_CONFIG_H

// Available kernel program modes

// Runs the interactive echo console only
#define KERNEL_PROG_ECHO 0

// Allocates and frees a few page runs, dumps the allocation table, then runs
// the echo console
#define KERNEL_PROG_TEST_MEM 1

// Selected kernel program (can be overridden by the build system)
#ifndef KERNEL_PROG
#define KERNEL_PROG KERNEL_PROG_ECHO
#endif

// Log levels
#define LSILENT 0
#define LSOFT 1
#define LLOUD 2

// Subsystem log levels
#ifndef LOG_GENERAL
#define LOG_GENERAL LSOFT
#endif
#ifndef LOG_MEM
#define LOG_MEM LSOFT
#endif

// MMIO base of the 16550 UART on the QEMU virt machine
#ifndef QL_UART_BASE
#define QL_UART_BASE 0x10000000
#endif

#endif
