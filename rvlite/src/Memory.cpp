// **********************************************************************
// rvlite/src/Memory.cpp
// **********************************************************************
// rvlite maintainers Oct 19 2026
/*
Byte-level backing store and the composed little-endian accessors.
*/

#include "Memory.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>

namespace rvlite {

namespace {
std::string fault_message(uint32_t addr, bool write) {
  std::ostringstream oss;
  oss << (write ? "store" : "load") << " access fault @0x"
      << std::hex << std::setw(8) << std::setfill('0') << addr;
  return oss.str();
}
} // namespace

AccessFault::AccessFault(uint32_t addr, bool write)
  : std::out_of_range(fault_message(addr, write)), addr_(addr), write_(write) {
}

// ******************
// Composed accessors (check whole span first so a faulting store writes nothing)
// ******************
uint16_t MemoryPort::read16(uint32_t addr) {
  check(addr, 2, false);
  return static_cast<uint16_t>(read8(addr) | (read8(addr + 1u) << 8));
}

uint32_t MemoryPort::read32(uint32_t addr) {
  check(addr, 4, false);
  return  static_cast<uint32_t>(read8(addr))
       | (static_cast<uint32_t>(read8(addr + 1u)) <<  8)
       | (static_cast<uint32_t>(read8(addr + 2u)) << 16)
       | (static_cast<uint32_t>(read8(addr + 3u)) << 24);
}

void MemoryPort::write16(uint32_t addr, uint16_t val) {
  check(addr, 2, true);
  write8(addr,      static_cast<uint8_t>(val));
  write8(addr + 1u, static_cast<uint8_t>(val >> 8));
}

void MemoryPort::write32(uint32_t addr, uint32_t val) {
  check(addr, 4, true);
  write8(addr,      static_cast<uint8_t>(val));
  write8(addr + 1u, static_cast<uint8_t>(val >>  8));
  write8(addr + 2u, static_cast<uint8_t>(val >> 16));
  write8(addr + 3u, static_cast<uint8_t>(val >> 24));
}

// ******************
// Flat memory
// ******************
Memory::Memory(std::size_t bytes) : bytes_(bytes, 0) {}

uint8_t Memory::read8(uint32_t addr) {
  if (!is_physical(addr)) return 0; // unmapped I/O reads as zero
  const std::size_t offset = addr & OFFSET_MASK;
  if (offset >= bytes_.size()) throw AccessFault(addr, false);
  return bytes_[offset];
}

void Memory::write8(uint32_t addr, uint8_t val) {
  if (!is_physical(addr)) return;   // unmapped I/O swallows stores
  const std::size_t offset = addr & OFFSET_MASK;
  if (offset >= bytes_.size()) throw AccessFault(addr, true);
  bytes_[offset] = val;
}

void Memory::check(uint32_t addr, uint32_t size, bool write) const {
  for (uint32_t i = 0; i < size; ++i) {
    const uint32_t a = addr + i; // wraps like the hart's address adder
    if (is_physical(a) && (a & OFFSET_MASK) >= bytes_.size()) {
      throw AccessFault(a, write);
    }
  }
}

bool Memory::load(const std::vector<uint8_t>& image) {
  if (image.size() > bytes_.size()) return false;
  std::copy(image.begin(), image.end(), bytes_.begin());
  std::fill(bytes_.begin() + static_cast<std::ptrdiff_t>(image.size()), bytes_.end(), 0);
  return true;
}

} // namespace rvlite
