// **********************************************************************
// rvlite/include/Hart.hpp
// **********************************************************************
// rvlite maintainers Oct 19 2026
/*
Single RV32 hart: register file, pc, CSR file, memory and the cycle counter,
plus the fetch/decode/execute/retire step.  All state lives in the instance so
any number of harts can exist side by side (the testbench makes one per case).
HartTile wraps one of these as a Cascade component.
*/
#pragma once

#include "CsrFile.hpp"
#include "Instruction.hpp"
#include "Memory.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rvlite {

class Hart {
public:
  static constexpr uint32_t RESET_PC = Memory::PHYS_BASE;

  // mcause-style codes for whatever stopped the hart
  enum class TrapCause : uint32_t {
    InstructionAccessFault   =  1u,
    IllegalInstruction       =  2u,
    Breakpoint               =  3u,
    LoadAccessFault          =  5u,
    StoreAccessFault         =  7u,
    EnvironmentCallFromMMode = 11u,
  };
  enum class StepStatus {
    Retired, // pc, registers and cycle count committed
    Stalled, // step abandoned, same pc will be refetched
    Halted,  // hart stopped, see trap_cause()
  };
  // what to do with an unsupported funct3 inside LOAD/STORE/BRANCH
  enum class StallPolicy {
    Refetch, // leave pc alone and try again next step
    Halt,    // treat as an illegal instruction
  };

  explicit Hart(std::size_t mem_bytes = Memory::DEFAULT_SIZE);

  void       reset();
  bool       load_image(const std::vector<uint8_t>& image); // false if image too big
  StepStatus step();
  uint64_t   run(uint64_t max_steps = 0);                    // 0 = until halted

  // architectural state
  uint32_t pc()                   const { return pc_; }
  void     set_pc(uint32_t pc)          { pc_ = pc; }
  uint32_t reg(uint32_t idx)      const { return regs_[idx & 0x1fu]; }
  void     write_reg(uint32_t idx, uint32_t value);
  uint32_t read_csr(uint32_t addr) const { return csrs_.read(addr); }
  void     write_csr(uint32_t addr, uint32_t value);
  uint64_t cycle_count()          const { return cycle_count_; }
  Memory&       memory()       { return mem_; }
  const Memory& memory() const { return mem_; }

  // halt bookkeeping
  bool               halted()       const { return halted_; }
  TrapCause          trap_cause()   const { return trap_cause_; }
  const std::string& trap_detail()  const { return trap_detail_; }
  void               raise_trap(TrapCause cause, const std::string& detail);

  // stall bookkeeping
  const std::string& stall_detail() const { return stall_detail_; }
  void               note_stall(const std::string& detail) { stall_detail_ = detail; }
  StallPolicy        stall_policy() const { return stall_policy_; }
  void               set_stall_policy(StallPolicy policy) { stall_policy_ = policy; }

  // book-keeping for tracing/diagnostics
  uint32_t last_pc()    const { return last_pc_; }
  uint32_t last_instr() const { return last_instr_; }
  OpClass  last_op()    const { return last_op_; }

private:
  Memory                   mem_;
  CsrFile                  csrs_;
  std::array<uint32_t, 32> regs_{};
  uint32_t                 pc_          = RESET_PC;
  uint64_t                 cycle_count_ = 0;
  bool                     halted_      = false;
  TrapCause                trap_cause_  = TrapCause::IllegalInstruction;
  std::string              trap_detail_;
  std::string              stall_detail_;
  StallPolicy              stall_policy_ = StallPolicy::Refetch;
  uint32_t                 last_pc_     = 0;
  uint32_t                 last_instr_  = 0;
  OpClass                  last_op_     = OpClass::Unknown;
};

} // namespace rvlite
