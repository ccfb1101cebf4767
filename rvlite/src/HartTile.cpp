// **********************************************************************
// rvlite/src/HartTile.cpp
// **********************************************************************
// rvlite maintainers Oct 19 2026

#include "HartTile.hpp"
#include "Diagnostics.hpp"

HartTile::HartTile(std::string /*name*/, uint32_t mem_bytes, IMPL_CTOR)
  : hart_(mem_bytes) {
}

void HartTile::tick() {
  if (hart_.halted()) return; // stop stepping once EBREAK/ECALL/fault halted the hart

  last_status_ = hart_.step();
  trace("pc=0x%08x instr=0x%08x %s\n", hart_.last_pc(), hart_.last_instr(),
        rvlite::op_class_name(hart_.last_op()));

  switch (last_status_) {
    case rvlite::Hart::StepStatus::Retired:
      break;
    case rvlite::Hart::StepStatus::Stalled:
      trace("stall: %s\n", hart_.stall_detail().c_str());
      break;
    case rvlite::Hart::StepStatus::Halted:
      trace("halted: %s (%s)\n", rvlite::trap_cause_name(hart_.trap_cause()),
            hart_.trap_detail().c_str());
      break;
  }
}

// Sim::reset() lands here; memory is left alone so a preloaded image survives
void HartTile::reset() {
  hart_.reset();
  last_status_ = rvlite::Hart::StepStatus::Retired;
}
