// **********************************************************************
// rvlite/src/CsrFile.cpp
// **********************************************************************
// rvlite maintainers Oct 19 2026

#include "CsrFile.hpp"

namespace rvlite {

void CsrFile::write(uint32_t addr, uint32_t value) {
  slots_[addr & 0xfffu] = value;
}

void CsrFile::reset() {
  slots_.fill(0);
}

} // namespace rvlite
