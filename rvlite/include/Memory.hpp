// **********************************************************************
// rvlite/include/Memory.hpp
// **********************************************************************
// rvlite maintainers Oct 19 2026
/*
Memory subsystem seen by the hart.

MemoryPort is just a protocol: byte load/store are the only primitives, and
half/word accesses are built from them low byte first.  Memory backs the port
with a flat byte array and owns the address-space policy:

  bit 31 set   -> physical, offset = addr & 0x7fffffff, bounds-checked
  bit 31 clear -> unmapped I/O, loads read 0 and stores are dropped
*/
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace rvlite {

// Thrown for a physical access past the end of the backing store
class AccessFault : public std::out_of_range {
public:
  AccessFault(uint32_t addr, bool write);

  uint32_t addr()     const { return addr_; }
  bool     is_write() const { return write_; }

private:
  uint32_t addr_;
  bool     write_;
};

class MemoryPort {
public:
  virtual         ~MemoryPort()                      = default;
  virtual uint8_t read8(uint32_t addr)               = 0;
  virtual void    write8(uint32_t addr, uint8_t val) = 0;
  // throws AccessFault if any byte of [addr, addr+size) cannot be accessed
  virtual void    check(uint32_t addr, uint32_t size, bool write) const = 0;

  uint16_t read16(uint32_t addr);
  uint32_t read32(uint32_t addr);
  void     write16(uint32_t addr, uint16_t val);
  void     write32(uint32_t addr, uint32_t val);
};

class Memory : public MemoryPort {
public:
  static constexpr uint32_t    PHYS_BASE    = 0x80000000u;
  static constexpr uint32_t    OFFSET_MASK  = 0x7fffffffu;
  static constexpr std::size_t DEFAULT_SIZE = 16u * 1024u * 1024u; // 16 MiB

  explicit Memory(std::size_t bytes = DEFAULT_SIZE);

  uint8_t read8(uint32_t addr) override;
  void    write8(uint32_t addr, uint8_t val) override;
  void    check(uint32_t addr, uint32_t size, bool write) const override;

  // copy an image to offset 0 and zero the rest; false if it does not fit
  bool load(const std::vector<uint8_t>& image);

  std::size_t size() const { return bytes_.size(); }
  static bool is_physical(uint32_t addr) { return (addr & PHYS_BASE) != 0; }

private:
  std::vector<uint8_t> bytes_;
};

} // namespace rvlite
