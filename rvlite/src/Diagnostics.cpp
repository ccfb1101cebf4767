// **********************************************************************
// rvlite/src/Diagnostics.cpp
// **********************************************************************
// rvlite maintainers Oct 19 2026

#include "Diagnostics.hpp"

#include <iomanip>

namespace rvlite {

const char* trap_cause_name(Hart::TrapCause cause) {
  switch (cause) {
    case Hart::TrapCause::InstructionAccessFault:   return "instruction access fault";
    case Hart::TrapCause::IllegalInstruction:       return "illegal instruction";
    case Hart::TrapCause::Breakpoint:               return "breakpoint";
    case Hart::TrapCause::LoadAccessFault:          return "load access fault";
    case Hart::TrapCause::StoreAccessFault:         return "store access fault";
    case Hart::TrapCause::EnvironmentCallFromMMode: return "environment call (not implemented)";
  }
  return "unknown";
}

void print_breakpoint_report(const Hart& hart, std::ostream& os) {
  std::ios_base::fmtflags old_flags = os.flags();

  os << "Hit EBREAK" << std::endl;
  os << "Cycle count: " << std::dec << hart.cycle_count() << std::endl;
  os << "Register state:" << std::endl;
  for (uint32_t r = 0; r < 32; ++r) {
    const uint32_t val = hart.reg(r);
    os << " x" << std::dec << r << ": "
       << std::hex << val << " ("
       << std::dec << val << ")" << std::endl;
  }

  os.flags(old_flags);
}

void report_halt(const Hart& hart, std::ostream& os) {
  std::ios_base::fmtflags old_flags = os.flags();
  char old_fill = os.fill('0');

  os << "[HALT] " << trap_cause_name(hart.trap_cause())
     << " (mcause=" << std::dec << static_cast<uint32_t>(hart.trap_cause()) << ")"
     << " pc=0x" << std::hex << std::setw(8) << hart.last_pc()
     << " instr=0x" << std::setw(8) << hart.last_instr()
     << std::dec << " cycles=" << hart.cycle_count();
  if (!hart.trap_detail().empty()) {
    os << ": " << hart.trap_detail();
  }
  os << std::endl;

  os.fill(old_fill);
  os.flags(old_flags);
}

int exit_status(const Hart& hart) {
  if (!hart.halted()) return 0;
  return hart.trap_cause() == Hart::TrapCause::Breakpoint ? 0 : 1;
}

} // namespace rvlite
