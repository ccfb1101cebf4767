// **********************************************************************
// rvlite/include/Hart_exec.hpp
// **********************************************************************
// rvlite maintainers Oct 19 2026

// Per-opcode-class execution helpers for Hart.

#pragma once

#include "Instruction.hpp"

#include <cstdint>

namespace rvlite {

class Hart;

// operands are sampled once before execution, next_pc is committed on retire
struct ExecContext {
  uint32_t pc      = 0;
  uint32_t next_pc = 0;
  uint32_t rs1_val = 0;
  uint32_t rs2_val = 0;
};

enum class ExecResult {
  Retire,
  Stall,
  Halt,
};

ExecResult execute(Hart& hart, const Instruction& instr, ExecContext& ctx);

ExecResult exec_load(Hart& hart, const Instruction& instr, ExecContext& ctx);
ExecResult exec_store(Hart& hart, const Instruction& instr, ExecContext& ctx);
ExecResult exec_branch(Hart& hart, const Instruction& instr, ExecContext& ctx);
ExecResult exec_jalr(Hart& hart, const Instruction& instr, ExecContext& ctx);
ExecResult exec_jal(Hart& hart, const Instruction& instr, ExecContext& ctx);
ExecResult exec_op_imm(Hart& hart, const Instruction& instr, ExecContext& ctx);
ExecResult exec_op(Hart& hart, const Instruction& instr, ExecContext& ctx);
ExecResult exec_system(Hart& hart, const Instruction& instr, ExecContext& ctx);
ExecResult exec_csr(Hart& hart, const Instruction& instr, ExecContext& ctx);
ExecResult exec_auipc(Hart& hart, const Instruction& instr, ExecContext& ctx);
ExecResult exec_lui(Hart& hart, const Instruction& instr, ExecContext& ctx);
ExecResult exec_amo(Hart& hart, const Instruction& instr, ExecContext& ctx);

// shared by OP and OP-IMM; alt selects SUB/SRA
uint32_t alu(uint32_t funct3, bool alt, uint32_t lhs, uint32_t rhs);

} // namespace rvlite
