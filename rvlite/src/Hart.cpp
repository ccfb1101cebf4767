// **********************************************************************
// rvlite/src/Hart.cpp
// **********************************************************************
// rvlite maintainers Oct 19 2026
/*
How the hart steps through instructions and owns its state.
*/
#include "Hart.hpp"
#include "Hart_exec.hpp"

#include <cstdint>

namespace rvlite {

Hart::Hart(std::size_t mem_bytes) : mem_(mem_bytes) {
  reset();
}

// Registers, CSRs, pc and counters only; memory keeps whatever was loaded
void Hart::reset() {
  regs_.fill(0);
  csrs_.reset();
  pc_           = RESET_PC;
  cycle_count_  = 0;
  halted_       = false;
  trap_cause_   = TrapCause::IllegalInstruction;
  trap_detail_.clear();
  stall_detail_.clear();
  last_pc_      = 0;
  last_instr_   = 0;
  last_op_      = OpClass::Unknown;
}

bool Hart::load_image(const std::vector<uint8_t>& image) {
  if (!mem_.load(image)) return false;
  reset();
  return true;
}

Hart::StepStatus Hart::step() {

  // ******************
  // 0. Some checks
  // ******************
  if (halted_) return StepStatus::Halted;

  // ******************
  // 1. FETCH
  // ******************
  const uint32_t curr_pc = pc_;
  last_pc_ = curr_pc;
  uint32_t instr = 0;
  try {
    instr = mem_.read32(curr_pc);
  } catch (const AccessFault& fault) {
    last_instr_ = 0;
    last_op_    = OpClass::Unknown;
    raise_trap(TrapCause::InstructionAccessFault, fault.what());
    return StepStatus::Halted;
  }
  last_instr_ = instr;

  // ******************
  // 2. DECODE
  // ******************
  const Instruction decoded(instr);
  last_op_ = decoded.op;

  ExecContext ctx;
  ctx.pc      = curr_pc;
  ctx.next_pc = curr_pc + 4u;
  ctx.rs1_val = regs_[decoded.rs1];
  ctx.rs2_val = regs_[decoded.rs2];

  // ******************
  // 3. EXECUTE
  // ******************
  ExecResult result = ExecResult::Halt;
  try {
    result = execute(*this, decoded, ctx);
  } catch (const AccessFault& fault) {
    raise_trap(fault.is_write() ? TrapCause::StoreAccessFault : TrapCause::LoadAccessFault,
               fault.what());
    return StepStatus::Halted;
  }

  switch (result) {
    case ExecResult::Retire:
      break;
    case ExecResult::Stall:
      if (stall_policy_ == StallPolicy::Halt) {
        raise_trap(TrapCause::IllegalInstruction, stall_detail_);
        return StepStatus::Halted;
      }
      return StepStatus::Stalled;
    case ExecResult::Halt:
      return StepStatus::Halted;
  }

  // ******************
  // 4. RETIRE
  // ******************
  pc_ = ctx.next_pc;
  ++cycle_count_;
  regs_[0] = 0; // writes to x0 are discarded
  return StepStatus::Retired;
}

uint64_t Hart::run(uint64_t max_steps) {
  uint64_t steps = 0;
  while (!halted_ && (max_steps == 0 || steps < max_steps)) {
    step();
    ++steps;
  }
  return steps;
}

void Hart::write_reg(uint32_t idx, uint32_t value) {
  regs_[idx & 0x1fu] = value; // x0 is cleared again at retirement
}

void Hart::write_csr(uint32_t addr, uint32_t value) {
  csrs_.write(addr, value);
}

void Hart::raise_trap(TrapCause cause, const std::string& detail) {
  halted_      = true;
  trap_cause_  = cause;
  trap_detail_ = detail;
}

} // namespace rvlite
