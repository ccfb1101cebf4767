// **********************************************************************
// rvlite/src/Hart_exec.cpp
// **********************************************************************
// rvlite maintainers Oct 19 2026
/*
How to execute each RV32 opcode class.  Every helper reads its register
operands from ctx (sampled before anything was written this step), writes rd
through the hart, and sets ctx.next_pc.  Returning Stall or Halt means the
step does not retire.
*/

#include "Hart_exec.hpp"
#include "Hart.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

namespace rvlite {

namespace {
inline uint32_t sext8(uint32_t v)  { return static_cast<uint32_t>(static_cast<int32_t>(static_cast<int8_t>(v))); }
inline uint32_t sext16(uint32_t v) { return static_cast<uint32_t>(static_cast<int32_t>(static_cast<int16_t>(v))); }

ExecResult illegal(Hart& hart, const std::string& what) {
  hart.raise_trap(Hart::TrapCause::IllegalInstruction, what);
  return ExecResult::Halt;
}

ExecResult stall(Hart& hart, const std::string& what) {
  hart.note_stall(what);
  return ExecResult::Stall;
}
} // namespace

ExecResult execute(Hart& hart, const Instruction& instr, ExecContext& ctx) {
  switch (instr.op) {
    case OpClass::Load:    return exec_load(hart, instr, ctx);
    case OpClass::Store:   return exec_store(hart, instr, ctx);
    case OpClass::Branch:  return exec_branch(hart, instr, ctx);
    case OpClass::Jalr:    return exec_jalr(hart, instr, ctx);
    case OpClass::Jal:     return exec_jal(hart, instr, ctx);
    case OpClass::MiscMem: return ExecResult::Retire; // FENCE: one hart, nothing to order
    case OpClass::OpImm:   return exec_op_imm(hart, instr, ctx);
    case OpClass::Op:      return exec_op(hart, instr, ctx);
    case OpClass::System:  return exec_system(hart, instr, ctx);
    case OpClass::Auipc:   return exec_auipc(hart, instr, ctx);
    case OpClass::Lui:     return exec_lui(hart, instr, ctx);
    case OpClass::Amo:     return exec_amo(hart, instr, ctx);
    case OpClass::Unknown: break;
  }
  return illegal(hart, "unknown opcode class " + std::to_string((instr.raw >> 2) & 0x1fu));
}

// ******************
// Memory
// ******************
ExecResult exec_load(Hart& hart, const Instruction& instr, ExecContext& ctx) {
  Memory& mem = hart.memory();
  const uint32_t addr = ctx.rs1_val + imm_i(instr.raw);
  uint32_t value = 0;
  switch (instr.funct3) {
    case 0x0: value = sext8(mem.read8(addr));   break; // LB
    case 0x1: value = sext16(mem.read16(addr)); break; // LH
    case 0x2: value = mem.read32(addr);         break; // LW
    case 0x4: value = mem.read8(addr);          break; // LBU
    case 0x5: value = mem.read16(addr);         break; // LHU
    default:
      return stall(hart, "invalid load width " + std::to_string(instr.funct3));
  }
  hart.write_reg(instr.rd, value);
  return ExecResult::Retire;
}

ExecResult exec_store(Hart& hart, const Instruction& instr, ExecContext& ctx) {
  Memory& mem = hart.memory();
  const uint32_t addr = ctx.rs1_val + imm_s(instr.raw);
  switch (instr.funct3) {
    case 0x0: mem.write8(addr, static_cast<uint8_t>(ctx.rs2_val));   break; // SB
    case 0x1: mem.write16(addr, static_cast<uint16_t>(ctx.rs2_val)); break; // SH
    case 0x2: mem.write32(addr, ctx.rs2_val);                        break; // SW
    default:
      return stall(hart, "invalid store width " + std::to_string(instr.funct3));
  }
  return ExecResult::Retire;
}

// ******************
// Control transfer
// ******************
ExecResult exec_branch(Hart& hart, const Instruction& instr, ExecContext& ctx) {
  const uint32_t lhs = ctx.rs1_val;
  const uint32_t rhs = ctx.rs2_val;
  bool taken = false;
  switch (instr.funct3) {
    case 0x0: taken = lhs == rhs; break;                                             // BEQ
    case 0x1: taken = lhs != rhs; break;                                             // BNE
    case 0x4: taken = static_cast<int32_t>(lhs) <  static_cast<int32_t>(rhs); break; // BLT
    case 0x5: taken = static_cast<int32_t>(lhs) >= static_cast<int32_t>(rhs); break; // BGE
    case 0x6: taken = lhs <  rhs; break;                                             // BLTU
    case 0x7: taken = lhs >= rhs; break;                                             // BGEU
    default:
      return stall(hart, "invalid branch condition " + std::to_string(instr.funct3));
  }
  if (taken) ctx.next_pc = ctx.pc + imm_b(instr.raw);
  return ExecResult::Retire;
}

ExecResult exec_jalr(Hart& hart, const Instruction& instr, ExecContext& ctx) {
  ctx.next_pc = (ctx.rs1_val + imm_i(instr.raw)) & ~1u;
  hart.write_reg(instr.rd, ctx.pc + 4u);
  return ExecResult::Retire;
}

ExecResult exec_jal(Hart& hart, const Instruction& instr, ExecContext& ctx) {
  ctx.next_pc = ctx.pc + imm_j(instr.raw);
  hart.write_reg(instr.rd, ctx.pc + 4u);
  return ExecResult::Retire;
}

// ******************
// ALU
// ******************
uint32_t alu(uint32_t funct3, bool alt, uint32_t lhs, uint32_t rhs) {
  const uint32_t shamt = rhs & 0x1fu;
  switch (funct3 & 0x7u) {
    case 0x0: return alt ? lhs - rhs : lhs + rhs;                                           // ADD/SUB
    case 0x1: return lhs << shamt;                                                          // SLL
    case 0x2: return static_cast<int32_t>(lhs) < static_cast<int32_t>(rhs) ? 1u : 0u;       // SLT
    case 0x3: return lhs < rhs ? 1u : 0u;                                                   // SLTU
    case 0x4: return lhs ^ rhs;                                                             // XOR
    case 0x5: return alt ? static_cast<uint32_t>(static_cast<int32_t>(lhs) >> shamt)        // SRA
                         : lhs >> shamt;                                                    // SRL
    case 0x6: return lhs | rhs;                                                             // OR
    default:  return lhs & rhs;                                                             // AND
  }
}

ExecResult exec_op_imm(Hart& hart, const Instruction& instr, ExecContext& ctx) {
  const uint32_t imm = imm_i(instr.raw);
  const bool     sra = instr.funct3 == 0x5 && (imm & (1u << 10)) != 0; // SRAI vs SRLI
  hart.write_reg(instr.rd, alu(instr.funct3, sra, ctx.rs1_val, imm));
  return ExecResult::Retire;
}

ExecResult exec_op(Hart& hart, const Instruction& instr, ExecContext& ctx) {
  const bool alt = (instr.funct7 & (1u << 5)) != 0; // SUB/SRA
  hart.write_reg(instr.rd, alu(instr.funct3, alt, ctx.rs1_val, ctx.rs2_val));
  return ExecResult::Retire;
}

ExecResult exec_auipc(Hart& hart, const Instruction& instr, ExecContext& ctx) {
  hart.write_reg(instr.rd, ctx.pc + imm_u(instr.raw));
  return ExecResult::Retire;
}

ExecResult exec_lui(Hart& hart, const Instruction& instr, ExecContext& /*ctx*/) {
  hart.write_reg(instr.rd, imm_u(instr.raw));
  return ExecResult::Retire;
}

// ******************
// SYSTEM
// ******************
ExecResult exec_system(Hart& hart, const Instruction& instr, ExecContext& ctx) {
  if (instr.funct3 == 0x0) {
    switch (instr.funct12()) {
      case 0x000: // ECALL
        hart.raise_trap(Hart::TrapCause::EnvironmentCallFromMMode, "ECALL is not implemented");
        return ExecResult::Halt;
      case 0x001: // EBREAK
        hart.raise_trap(Hart::TrapCause::Breakpoint, "EBREAK");
        return ExecResult::Halt;
      default:
        return illegal(hart, "unsupported SYSTEM function " + std::to_string(instr.funct12()));
    }
  }
  if (instr.funct3 == 0x4) {
    return illegal(hart, "unsupported SYSTEM funct3 4");
  }
  return exec_csr(hart, instr, ctx);
}

// CSRRW/CSRRS/CSRRC take rs1's value, the I forms take the rs1 field as zimm
ExecResult exec_csr(Hart& hart, const Instruction& instr, ExecContext& ctx) {
  const uint32_t csr     = instr.funct12();
  const uint32_t operand = (instr.funct3 & 0x4u) ? instr.rs1 : ctx.rs1_val;
  const uint32_t old     = hart.read_csr(csr);
  uint32_t updated = old;
  switch (instr.funct3 & 0x3u) {
    case 0x1: updated = operand;        break; // RW
    case 0x2: updated = old | operand;  break; // RS
    case 0x3: updated = old & ~operand; break; // RC
    default:
      return illegal(hart, "unsupported CSR funct3 " + std::to_string(instr.funct3));
  }
  hart.write_reg(instr.rd, old);
  hart.write_csr(csr, updated);
  return ExecResult::Retire;
}

// ******************
// AMO (.W only).  One hart, so a plain load then store is already atomic.
// ******************
ExecResult exec_amo(Hart& hart, const Instruction& instr, ExecContext& ctx) {
  if (instr.funct3 != 0x2) {
    return illegal(hart, "invalid AMO width " + std::to_string(instr.funct3));
  }
  Memory& mem = hart.memory();
  const uint32_t addr  = ctx.rs1_val;
  const uint32_t src   = ctx.rs2_val;
  const uint32_t funct5 = instr.funct7 >> 2;

  switch (funct5) {
    case 0x02: // LR.W
      hart.write_reg(instr.rd, mem.read32(addr));
      return ExecResult::Retire;
    case 0x03: // SC.W, no reservation tracking so it always succeeds
      mem.write32(addr, src);
      hart.write_reg(instr.rd, 0);
      return ExecResult::Retire;
    case 0x01: // AMOSWAP.W
    case 0x00: // AMOADD.W
    case 0x04: // AMOXOR.W
    case 0x0c: // AMOAND.W
    case 0x08: // AMOOR.W
    case 0x10: // AMOMIN.W
    case 0x14: // AMOMAX.W
    case 0x18: // AMOMINU.W
    case 0x1c: // AMOMAXU.W
      break;
    default:
      return illegal(hart, "unsupported AMO " + std::to_string(funct5));
  }

  const uint32_t old = mem.read32(addr);
  const int32_t  s_old = static_cast<int32_t>(old);
  const int32_t  s_src = static_cast<int32_t>(src);
  uint32_t updated = src; // AMOSWAP
  switch (funct5) {
    case 0x00: updated = old + src;                                   break;
    case 0x04: updated = old ^ src;                                   break;
    case 0x0c: updated = old & src;                                   break;
    case 0x08: updated = old | src;                                   break;
    case 0x10: updated = static_cast<uint32_t>(std::min(s_old, s_src)); break;
    case 0x14: updated = static_cast<uint32_t>(std::max(s_old, s_src)); break;
    case 0x18: updated = std::min(old, src);                          break;
    case 0x1c: updated = std::max(old, src);                          break;
    default: break;
  }
  mem.write32(addr, updated);
  hart.write_reg(instr.rd, old);
  return ExecResult::Retire;
}

} // namespace rvlite
