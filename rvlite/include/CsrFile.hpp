// **********************************************************************
// rvlite/include/CsrFile.hpp
// **********************************************************************
// rvlite maintainers Oct 19 2026
/*
Flat CSR store: 4096 plain 32b slots indexed by the 12b CSR field.
No CSR has side effects here, the instructions define all the behaviour.
*/
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace rvlite {

class CsrFile {
public:
  static constexpr std::size_t COUNT = 4096;

  uint32_t read(uint32_t addr) const { return slots_[addr & 0xfffu]; }
  void     write(uint32_t addr, uint32_t value);
  void     reset();

private:
  std::array<uint32_t, COUNT> slots_{};
};

} // namespace rvlite
