// **********************************************************************
// rvlite/include/Instruction.hpp
// **********************************************************************
// rvlite maintainers Oct 19 2026
/*
RV32 decoder.  Pass a raw 32b word in and get the opcode class and the raw
fields back (decoded.op, decoded.rd, decoded.funct3, etc.).  Nothing here is
kept between steps, the hart builds a fresh Instruction on every fetch.
*/
#pragma once

#include <cstdint>

namespace rvlite {

// Coarse instruction category, selected by bits [6:2] of the word
enum class OpClass {
  Load,
  Store,
  Branch,
  Jalr,
  Jal,
  MiscMem,
  OpImm,
  Op,
  System,
  Auipc,
  Lui,
  Amo,
  Unknown,
};

OpClass     decode_op_class(uint32_t raw);
const char* op_class_name(OpClass op);

// Immediate reconstruction.  All return the value as an unsigned 32b pattern
// (already sign-extended where the format is signed) so callers can add it to
// a register with ordinary wrap-around arithmetic.
uint32_t imm_i(uint32_t raw);
uint32_t imm_s(uint32_t raw);
uint32_t imm_b(uint32_t raw);
uint32_t imm_u(uint32_t raw);
uint32_t imm_j(uint32_t raw);

struct Instruction {
  explicit Instruction(uint32_t raw_instr); // call it like: Instruction decoded(instr)

  uint32_t funct12() const { return raw >> 20; } // SYSTEM function field / CSR address
  bool     valid()   const { return op != OpClass::Unknown; }

  uint32_t raw    = 0; // full 32b instruction
  OpClass  op     = OpClass::Unknown;
  uint32_t funct3 = 0;
  uint32_t funct7 = 0;
  uint32_t rd     = 0;
  uint32_t rs1    = 0;
  uint32_t rs2    = 0;
};

} // namespace rvlite
