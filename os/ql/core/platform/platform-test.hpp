// platform-test.hpp - host test platform hooks
#ifndef QL_CORE_PLATFORM_TEST_HPP
#define QL_CORE_PLATFORM_TEST_HPP

#include "ql/common.h"

/** Thrown by kernel_halt() on the test platform so tests can observe panics */
struct KernelHalted {};

/** Starts collecting qputchar output instead of writing it to stdout */
void console_capture_begin();

/** Output collected since console_capture_begin(); capture stays active */
const char *console_capture();

/** Stops collecting output */
void console_capture_end();

#endif
