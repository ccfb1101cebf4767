// **********************************************************************
// rvlite/src/Instruction.cpp
// **********************************************************************
// rvlite maintainers Oct 19 2026
/*
Opcode-class table and the I/S/B/U/J immediate laws.  The immediates are
rebuilt from the sign-extended I-type high bits so the sign always lands in
bit 31 without a separate sign_extend per format.
*/

#include "Instruction.hpp"

namespace rvlite {

OpClass decode_op_class(uint32_t raw) {
  switch ((raw >> 2) & 0x1fu) { // bits [6:2]
    case 0x00: return OpClass::Load;    // 00000
    case 0x08: return OpClass::Store;   // 01000
    case 0x18: return OpClass::Branch;  // 11000
    case 0x19: return OpClass::Jalr;    // 11001
    case 0x1b: return OpClass::Jal;     // 11011
    case 0x03: return OpClass::MiscMem; // 00011
    case 0x04: return OpClass::OpImm;   // 00100
    case 0x0c: return OpClass::Op;      // 01100
    case 0x1c: return OpClass::System;  // 11100
    case 0x05: return OpClass::Auipc;   // 00101
    case 0x0d: return OpClass::Lui;     // 01101
    case 0x0b: return OpClass::Amo;     // 01011
    default:   return OpClass::Unknown;
  }
}

const char* op_class_name(OpClass op) {
  switch (op) {
    case OpClass::Load:    return "LOAD";
    case OpClass::Store:   return "STORE";
    case OpClass::Branch:  return "BRANCH";
    case OpClass::Jalr:    return "JALR";
    case OpClass::Jal:     return "JAL";
    case OpClass::MiscMem: return "MISC-MEM";
    case OpClass::OpImm:   return "OP-IMM";
    case OpClass::Op:      return "OP";
    case OpClass::System:  return "SYSTEM";
    case OpClass::Auipc:   return "AUIPC";
    case OpClass::Lui:     return "LUI";
    case OpClass::Amo:     return "AMO";
    case OpClass::Unknown: break;
  }
  return "UNKNOWN";
}

uint32_t imm_i(uint32_t raw) {
  return static_cast<uint32_t>(static_cast<int32_t>(raw) >> 20); // bits [31:20], sign-extended
}

uint32_t imm_s(uint32_t raw) {
  return (imm_i(raw) & ~0x1fu) | ((raw >> 7) & 0x1fu);
}

uint32_t imm_b(uint32_t raw) {
  const uint32_t low  = (raw >> 7) & 0x1eu;                   // [4:1] from [11:8]
  const uint32_t mid  = (raw << 4) & (1u << 11);              // [11] from bit 7
  const uint32_t high = imm_i(raw) & ~0x1fu & ~(1u << 11);    // [12] sign and [10:5] from [31:25]
  return low | mid | high;
}

uint32_t imm_u(uint32_t raw) {
  return raw & ~0xfffu;
}

uint32_t imm_j(uint32_t raw) {
  const uint32_t sign_and_low = imm_i(raw) & 0xfff007feu; // [31:20] sign, [10:1] from [30:21]
  const uint32_t page         = raw & 0x000ff000u;        // [19:12] in place
  const uint32_t bit11        = (raw & (1u << 20)) >> 9;  // [11] from bit 20
  return sign_and_low | page | bit11;
}

// Constructor written in member initializer syntax
Instruction::Instruction(uint32_t raw_instr) : raw(raw_instr) {
  op     = decode_op_class(raw);
  rd     = (raw >>  7) & 0x1fu; // 5b
  funct3 = (raw >> 12) & 0x07u; // 3b
  rs1    = (raw >> 15) & 0x1fu; // 5b
  rs2    = (raw >> 20) & 0x1fu; // 5b
  funct7 = (raw >> 25) & 0x7fu; // 7b
}

} // namespace rvlite
