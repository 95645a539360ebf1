// address.hpp - a type safe address container and relevant types
#ifndef QL_LIB_ADDRESS_HPP
#define QL_LIB_ADDRESS_HPP

#include "ql/common.h"

template <typename Tag> class Address {
private:
  uintptr_t addr;

public:
  // Default constructor - null address
  constexpr Address() : addr(0) {}

  // Constructor from raw address value
  constexpr explicit Address(uintptr_t raw_addr) : addr(raw_addr) {}

  // Constructor from typed pointer
  template <typename T> explicit Address(T *ptr) : addr(reinterpret_cast<uintptr_t>(ptr)) {}

  uintptr_t raw() const { return addr; }

  // Convert to pointer of specified type
  template <typename T> T *as() const { return reinterpret_cast<T *>(addr); }

  void *as_ptr() const { return reinterpret_cast<void *>(addr); }

  bool is_null() const { return addr == 0; }

  explicit operator bool() const { return addr != 0; }

  Address operator+(uintptr_t offset) const { return Address(addr + offset); }

  Address &operator+=(uintptr_t offset) {
    addr += offset;
    return *this;
  }

  // Distance between addresses (same type only)
  uintptr_t operator-(const Address &other) const { return addr - other.addr; }

  bool operator==(const Address &other) const { return addr == other.addr; }
  bool operator!=(const Address &other) const { return addr != other.addr; }
  bool operator<(const Address &other) const { return addr < other.addr; }
  bool operator<=(const Address &other) const { return addr <= other.addr; }
  bool operator>(const Address &other) const { return addr > other.addr; }
  bool operator>=(const Address &other) const { return addr >= other.addr; }

  // Alignment check, alignment must be a power of two
  bool aligned(size_t alignment) const { return (addr & (alignment - 1)) == 0; }

  Address align_up(size_t alignment) const {
    uintptr_t mask = alignment - 1;
    return Address((addr + mask) & ~mask);
  }

  Address align_down(size_t alignment) const {
    uintptr_t mask = alignment - 1;
    return Address(addr & ~mask);
  }
};

/** Physical address of a page frame handed out by the page allocator */
struct PageTag {};
typedef Address<PageTag> PageAddr;

/** Physical address of a memory-mapped device register block */
struct MmioTag {};
typedef Address<MmioTag> MmioAddr;

#endif
