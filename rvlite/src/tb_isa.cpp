// **********************************************************************
// rvlite/src/tb_isa.cpp
// **********************************************************************
// rvlite maintainers Oct 19 2026
/*
Self-checking ISA testbench.  Each suite builds a tiny hand-encoded program,
steps a private Hart and checks architectural state with assert_always.
Pick one with -suite=<name>; -suite=all runs every suite that does not need
the Cascade clock.  CTest runs each suite as its own process.

% ./build/tb_isa -suite=amo
*/

#include <descore/Parameter.hpp>
#include "Hart.hpp"
#include "HartTile.hpp"
#include "Debugger.hpp"
#include "Diagnostics.hpp"
#include "util/FlatBinLoader.hpp"

#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using rvlite::Hart;
using rvlite::Instruction;
using rvlite::Memory;
using rvlite::OpClass;

// **************
// Parameters (CLI flags): name, default value, help text
// **************
StringParameter(suite, "all", "Suite: all|decode|imm|addi|alu|upper|mem|unmapped|bounds|branch|jump|csr|amo|system|stall|illegal|x0|loader|tile|debugger");

namespace {

const uint32_t BASE = Memory::PHYS_BASE;

// **************
// Encoders (only what the suites need)
// **************
enum : uint32_t {
  OPC_LOAD   = 0x03,
  OPC_MISC   = 0x0f,
  OPC_OPIMM  = 0x13,
  OPC_AUIPC  = 0x17,
  OPC_STORE  = 0x23,
  OPC_AMO    = 0x2f,
  OPC_OP     = 0x33,
  OPC_LUI    = 0x37,
  OPC_BRANCH = 0x63,
  OPC_JALR   = 0x67,
  OPC_JAL    = 0x6f,
  OPC_SYSTEM = 0x73,
};

uint32_t enc_r(uint32_t f7, uint32_t rs2, uint32_t rs1, uint32_t f3, uint32_t rd, uint32_t opc) {
  return (f7 << 25) | (rs2 << 20) | (rs1 << 15) | (f3 << 12) | (rd << 7) | opc;
}
uint32_t enc_i(int32_t imm, uint32_t rs1, uint32_t f3, uint32_t rd, uint32_t opc) {
  return ((static_cast<uint32_t>(imm) & 0xfffu) << 20) | (rs1 << 15) | (f3 << 12) | (rd << 7) | opc;
}
uint32_t enc_s(int32_t imm, uint32_t rs2, uint32_t rs1, uint32_t f3) {
  const uint32_t u = static_cast<uint32_t>(imm);
  return (((u >> 5) & 0x7fu) << 25) | (rs2 << 20) | (rs1 << 15) | (f3 << 12) | ((u & 0x1fu) << 7) | OPC_STORE;
}
uint32_t enc_b(int32_t imm, uint32_t rs2, uint32_t rs1, uint32_t f3) {
  const uint32_t u = static_cast<uint32_t>(imm);
  return (((u >> 12) & 0x1u) << 31) | (((u >> 5) & 0x3fu) << 25) | (rs2 << 20) | (rs1 << 15) |
         (f3 << 12) | (((u >> 1) & 0xfu) << 8) | (((u >> 11) & 0x1u) << 7) | OPC_BRANCH;
}
uint32_t enc_u(uint32_t imm20, uint32_t rd, uint32_t opc) {
  return (imm20 << 12) | (rd << 7) | opc;
}
uint32_t enc_j(int32_t imm, uint32_t rd) {
  const uint32_t u = static_cast<uint32_t>(imm);
  return (((u >> 20) & 0x1u) << 31) | (((u >> 1) & 0x3ffu) << 21) | (((u >> 11) & 0x1u) << 20) |
         (((u >> 12) & 0xffu) << 12) | (rd << 7) | OPC_JAL;
}

uint32_t addi(uint32_t rd, uint32_t rs1, int32_t imm) { return enc_i(imm, rs1, 0, rd, OPC_OPIMM); }
uint32_t lui(uint32_t rd, uint32_t imm20)             { return enc_u(imm20, rd, OPC_LUI); }
uint32_t amo(uint32_t funct5, uint32_t rd, uint32_t rs1, uint32_t rs2) {
  return enc_r(funct5 << 2, rs2, rs1, 0x2, rd, OPC_AMO);
}
uint32_t csr_op(uint32_t f3, uint32_t rd, uint32_t csr, uint32_t rs1_or_zimm) {
  return enc_i(static_cast<int32_t>(csr), rs1_or_zimm, f3, rd, OPC_SYSTEM);
}
const uint32_t ECALL  = 0x00000073u;
const uint32_t EBREAK = 0x00100073u;

// **************
// Helpers
// **************
void load_program(Hart& hart, const std::vector<uint32_t>& words) {
  std::vector<uint8_t> bytes;
  for (uint32_t w : words) {
    for (int i = 0; i < 4; ++i) bytes.push_back(static_cast<uint8_t>(w >> (8 * i)));
  }
  bool ok = hart.load_image(bytes);
  assert_always(ok, "program does not fit");
}

void retire(Hart& hart, int n) {
  for (int i = 0; i < n; ++i) {
    assert_always(hart.step() == Hart::StepStatus::Retired, "step did not retire");
  }
}

// run a lone branch with rs1=a, rs2=b, offset +16; true if it was taken
bool branch_taken(uint32_t f3, uint32_t a, uint32_t b) {
  Hart hart(4096);
  load_program(hart, {enc_b(16, 2, 1, f3)});
  hart.write_reg(1, a);
  hart.write_reg(2, b);
  retire(hart, 1);
  assert_always(hart.pc() == BASE + 16 || hart.pc() == BASE + 4, "branch landed off both paths");
  return hart.pc() == BASE + 16;
}

// **************
// Suites
// **************
void suite_decode() {
  assert_always(rvlite::decode_op_class(0x00002083u) == OpClass::Load,    "lw");
  assert_always(rvlite::decode_op_class(0x00112023u) == OpClass::Store,   "sw");
  assert_always(rvlite::decode_op_class(0xfe000ee3u) == OpClass::Branch,  "beq");
  assert_always(rvlite::decode_op_class(0x00008067u) == OpClass::Jalr,    "ret");
  assert_always(rvlite::decode_op_class(0xffdff06fu) == OpClass::Jal,     "jal");
  assert_always(rvlite::decode_op_class(0x0ff0000fu) == OpClass::MiscMem, "fence");
  assert_always(rvlite::decode_op_class(0x00500093u) == OpClass::OpImm,   "addi");
  assert_always(rvlite::decode_op_class(0x002081b3u) == OpClass::Op,      "add");
  assert_always(rvlite::decode_op_class(EBREAK)      == OpClass::System,  "ebreak");
  assert_always(rvlite::decode_op_class(0x00001117u) == OpClass::Auipc,   "auipc");
  assert_always(rvlite::decode_op_class(0x123450b7u) == OpClass::Lui,     "lui");
  assert_always(rvlite::decode_op_class(0x0020a1afu) == OpClass::Amo,     "amoadd.w");
  assert_always(rvlite::decode_op_class(0x0000007fu) == OpClass::Unknown, "bits[6:2]=11111 is not mapped");
  assert_always(rvlite::decode_op_class(0x0000005bu) == OpClass::Unknown, "bits[6:2]=10110 is not mapped");

  const Instruction sub(0x403100b3u); // sub x1, x2, x3
  assert_always(sub.valid(), "sub should decode");
  assert_always(sub.rd == 1 && sub.rs1 == 2 && sub.rs2 == 3, "sub register fields");
  assert_always(sub.funct3 == 0 && sub.funct7 == 0x20, "sub funct fields");

  const Instruction csrrs(0x34202573u); // csrrs x10, mcause, x0
  assert_always(csrrs.funct12() == 0x342 && csrrs.funct3 == 2 && csrrs.rd == 10, "csr fields");
  assert_always(!Instruction(0xffffffffu).valid(), "all-ones word is not an instruction");
}

void suite_imm() {
  assert_always(rvlite::imm_i(0xfff00093u) == 0xffffffffu, "addi x1,x0,-1");
  assert_always(rvlite::imm_i(0x7ff00093u) == 0x000007ffu, "addi x1,x0,2047");
  assert_always(rvlite::imm_i(0x80000093u) == 0xfffff800u, "addi x1,x0,-2048");
  assert_always(rvlite::imm_s(enc_s(-4, 1, 2, 2)) == 0xfffffffcu, "sw -4");
  assert_always(rvlite::imm_s(enc_s(0x7ff, 1, 2, 2)) == 0x7ffu, "sw 2047");
  assert_always(rvlite::imm_s(enc_s(0x21, 1, 2, 2)) == 0x21u, "sw 33 splits across both fields");
  assert_always(rvlite::imm_u(0x12345037u) == 0x12345000u, "lui low bits cleared");
  assert_always(rvlite::imm_u(0xfffff0b7u) == 0xfffff000u, "lui keeps bit 31");

  // words from a real assembler
  assert_always(rvlite::imm_b(0xfe000ee3u) == 0xfffffffcu, "beq x0,x0,-4");
  assert_always(rvlite::imm_j(0xffdff06fu) == 0xfffffffcu, "jal x0,-4");
  assert_always(rvlite::imm_j(0x0080006fu) == 0x00000008u, "jal x0,8");

  // every 13b signed even offset survives the B-type packing
  for (int32_t v = -4096; v <= 4094; v += 2) {
    assert_always(rvlite::imm_b(enc_b(v, 7, 9, 1)) == static_cast<uint32_t>(v), "B-immediate round trip");
  }
  const int32_t j_cases[] = {0, 2, -2, 0x7fe, 0x800, -0x800, 0xff000, 0x7fffe, -(1 << 20), (1 << 20) - 2};
  for (int32_t v : j_cases) {
    assert_always(rvlite::imm_j(enc_j(v, 1)) == static_cast<uint32_t>(v), "J-immediate round trip");
  }
}

void suite_addi() {
  Hart hart(4096);
  load_program(hart, {
    addi(1, 0, 5),     // x1 = 5
    addi(2, 1, -3),    // x2 = 2
    addi(0, 1, 7),     // discarded
    addi(3, 0, -2048), // most negative imm12
    addi(4, 3, 2047),
  });
  retire(hart, 1);
  assert_always(hart.reg(1) == 5 && hart.pc() == BASE + 4, "addi x1");
  retire(hart, 1);
  assert_always(hart.reg(2) == 2 && hart.pc() == BASE + 8, "addi negative imm");
  retire(hart, 1);
  assert_always(hart.reg(0) == 0 && hart.pc() == BASE + 12, "rd=x0 stays zero");
  retire(hart, 2);
  assert_always(hart.reg(3) == 0xfffff800u, "addi -2048");
  assert_always(hart.reg(4) == 0xffffffffu, "addi wraps through sign");
  assert_always(hart.cycle_count() == 5, "five retirements");
}

void suite_alu() {
  Hart hart(4096);
  load_program(hart, {
    lui(1, 0x80000),                        // x1  = 0x80000000
    addi(2, 0, 3),                          // x2  = 3
    addi(3, 0, -1),                         // x3  = 0xffffffff
    enc_r(0x20, 3, 2, 0x0, 4, OPC_OP),      // sub  x4  = 3 - -1
    enc_r(0x20, 2, 1, 0x5, 5, OPC_OP),      // sra  x5  = x1 >>a 3
    enc_r(0x00, 2, 1, 0x5, 6, OPC_OP),      // srl  x6  = x1 >> 3
    enc_r(0x00, 2, 2, 0x1, 7, OPC_OP),      // sll  x7  = 3 << 3
    enc_r(0x00, 2, 3, 0x2, 8, OPC_OP),      // slt  x8  = -1 < 3
    enc_r(0x00, 2, 3, 0x3, 9, OPC_OP),      // sltu x9  = 0xffffffff < 3
    enc_r(0x00, 2, 3, 0x4, 10, OPC_OP),     // xor
    enc_r(0x00, 2, 1, 0x6, 11, OPC_OP),     // or
    enc_r(0x00, 2, 3, 0x7, 12, OPC_OP),     // and
    enc_i(0x400 | 4, 1, 0x5, 13, OPC_OPIMM),// srai x13 = x1 >>a 4
    enc_i(4, 1, 0x5, 14, OPC_OPIMM),        // srli
    enc_i(31, 2, 0x1, 15, OPC_OPIMM),       // slli
    enc_i(0, 3, 0x2, 16, OPC_OPIMM),        // slti  -1 < 0
    enc_i(-1, 2, 0x3, 17, OPC_OPIMM),       // sltiu 3 < 0xffffffff
    enc_i(0x0f, 3, 0x4, 18, OPC_OPIMM),     // xori
    enc_i(-2048, 0, 0x6, 19, OPC_OPIMM),    // ori
    enc_i(0x7f0, 3, 0x7, 20, OPC_OPIMM),    // andi
    enc_r(0x00, 2, 3, 0x0, 21, OPC_OP),     // add wraps
    addi(22, 0, 33),
    enc_r(0x00, 22, 2, 0x1, 23, OPC_OP),    // sll by 33 uses only 5 bits
  });
  retire(hart, 23);
  assert_always(hart.reg(4)  == 4u,          "sub");
  assert_always(hart.reg(5)  == 0xf0000000u, "sra");
  assert_always(hart.reg(6)  == 0x10000000u, "srl");
  assert_always(hart.reg(7)  == 24u,         "sll");
  assert_always(hart.reg(8)  == 1u,          "slt signed");
  assert_always(hart.reg(9)  == 0u,          "sltu unsigned");
  assert_always(hart.reg(10) == 0xfffffffcu, "xor");
  assert_always(hart.reg(11) == 0x80000003u, "or");
  assert_always(hart.reg(12) == 3u,          "and");
  assert_always(hart.reg(13) == 0xf8000000u, "srai");
  assert_always(hart.reg(14) == 0x08000000u, "srli");
  assert_always(hart.reg(15) == 0x80000000u, "slli");
  assert_always(hart.reg(16) == 1u,          "slti");
  assert_always(hart.reg(17) == 1u,          "sltiu compares against sign-extended imm");
  assert_always(hart.reg(18) == 0xfffffff0u, "xori");
  assert_always(hart.reg(19) == 0xfffff800u, "ori");
  assert_always(hart.reg(20) == 0x7f0u,      "andi");
  assert_always(hart.reg(21) == 2u,          "add");
  assert_always(hart.reg(23) == 6u,          "shift amount masked");
}

void suite_upper() {
  Hart hart(4096);
  load_program(hart, {
    lui(1, 0xfffff),
    enc_u(0x1, 2, OPC_AUIPC),       // at BASE+4
    enc_u(0xfffff, 3, OPC_AUIPC),   // at BASE+8, pc - 0x1000
    enc_i(0x0ff, 0, 0x0, 0, OPC_MISC), // fence
  });
  retire(hart, 4);
  assert_always(hart.reg(1) == 0xfffff000u, "lui");
  assert_always(hart.reg(2) == BASE + 4 + 0x1000, "auipc");
  assert_always(hart.reg(3) == BASE + 8 - 0x1000, "auipc negative");
  assert_always(hart.pc() == BASE + 16, "fence only advances pc");
}

void suite_mem() {
  // straight at the port first
  Memory mem(4096);
  mem.write32(BASE, 0xdeadbeefu);
  assert_always(mem.read32(BASE) == 0xdeadbeefu, "word round trip at 0x80000000");
  assert_always(mem.read8(BASE) == 0xef && mem.read8(BASE + 3) == 0xde, "little endian bytes");
  assert_always(mem.read16(BASE + 1) == 0xadbeu, "unaligned half composes bytes");

  Hart hart(4096);
  load_program(hart, {
    lui(1, 0x80000),                 // x1 = 0x80000000
    lui(2, 0x12345),
    addi(2, 2, 0x678),               // x2 = 0x12345678
    enc_s(0x100, 2, 1, 0x2),         // sw  x2, 0x100(x1)
    enc_i(0x100, 1, 0x2, 3, OPC_LOAD), // lw x3
    addi(4, 0, -1),
    enc_s(0x200, 4, 1, 0x0),         // sb  0xff
    enc_i(0x200, 1, 0x0, 5, OPC_LOAD), // lb
    enc_i(0x200, 1, 0x4, 6, OPC_LOAD), // lbu
    addi(7, 0, -2),
    enc_s(0x300, 7, 1, 0x1),         // sh  0xfffe
    enc_i(0x300, 1, 0x1, 8, OPC_LOAD), // lh
    enc_i(0x300, 1, 0x5, 9, OPC_LOAD), // lhu
    enc_i(0x101, 1, 0x4, 10, OPC_LOAD), // lbu byte 1 of the word
  });
  retire(hart, 14);
  assert_always(hart.reg(3) == 0x12345678u, "sw/lw round trip");
  assert_always(hart.reg(5) == 0xffffffffu, "lb sign-extends");
  assert_always(hart.reg(6) == 0x000000ffu, "lbu zero-extends");
  assert_always(hart.reg(8) == 0xfffffffeu, "lh sign-extends");
  assert_always(hart.reg(9) == 0x0000fffeu, "lhu zero-extends");
  assert_always(hart.reg(10) == 0x56u, "word stored low byte first");
  assert_always(hart.memory().read8(BASE + 0x201) == 0, "sb touches one byte");
}

void suite_unmapped() {
  Memory mem(4096);
  assert_always(mem.read32(0x00000000u) == 0, "unmapped load reads zero");
  mem.write32(0x00000000u, 0xffffffffu);
  mem.write8(0x7fffffffu, 0xaa);
  assert_always(mem.read32(0x00000000u) == 0, "unmapped store has no effect");
  assert_always(mem.read8(0x7fffffffu) == 0, "top of unmapped window");

  Hart hart(4096);
  load_program(hart, {
    addi(1, 0, 9),
    enc_i(0, 0, 0x2, 1, OPC_LOAD), // lw x1, 0(x0)
    enc_s(0, 1, 0, 0x2),           // sw x1, 0(x0)
    addi(2, 0, 9),
    enc_s(0x10, 2, 0, 0x0),        // sb to 0x10
  });
  retire(hart, 5);
  assert_always(hart.reg(1) == 0, "load from 0x00000000 returns 0");
  assert_always(!hart.halted(), "unmapped access never faults");
  for (uint32_t i = 0; i < 64; ++i) {
    assert_always(hart.memory().read8(BASE + 20 + i) == 0, "unmapped stores do not alias physical memory");
  }
}

void suite_bounds() {
  Memory mem(4096);
  bool faulted = false;
  try {
    (void)mem.read8(BASE + 4096);
  } catch (const rvlite::AccessFault& fault) {
    faulted = fault.addr() == BASE + 4096 && !fault.is_write();
  }
  assert_always(faulted, "read past the end faults");

  mem.write8(BASE + 4094, 0x11);
  mem.write8(BASE + 4095, 0x22);
  faulted = false;
  try {
    mem.write32(BASE + 4094, 0xaabbccddu);
  } catch (const rvlite::AccessFault& fault) {
    faulted = fault.is_write() && fault.addr() == BASE + 4096;
  }
  assert_always(faulted, "straddling store faults");
  assert_always(mem.read8(BASE + 4094) == 0x11 && mem.read8(BASE + 4095) == 0x22,
                "faulting store leaves memory untouched");

  // high alias: offset masks to 31 bits, so 0xffff_ffff is far out of range
  faulted = false;
  try {
    (void)mem.read8(0xffffffffu);
  } catch (const rvlite::AccessFault&) {
    faulted = true;
  }
  assert_always(faulted, "0xffffffff does not wrap into the array");

  Hart hart(64 * 1024);
  load_program(hart, {
    lui(1, 0x80010),               // x1 = BASE + 64 KiB
    enc_i(0, 1, 0x2, 2, OPC_LOAD), // lw x2, 0(x1)
  });
  retire(hart, 1);
  assert_always(hart.step() == Hart::StepStatus::Halted, "out-of-range load halts");
  assert_always(hart.trap_cause() == Hart::TrapCause::LoadAccessFault, "load access fault cause");
  assert_always(hart.pc() == BASE + 4 && hart.cycle_count() == 1, "faulting load does not retire");
  assert_always(rvlite::exit_status(hart) == 1, "faults exit non-zero");

  Hart store_hart(64 * 1024);
  load_program(store_hart, {
    lui(1, 0x80010),
    enc_s(-4, 1, 1, 0x2),          // sw x1, -4(x1) is the last word, fine
    enc_s(-2, 1, 1, 0x2),          // sw x1, -2(x1) straddles the end
  });
  retire(store_hart, 2);
  assert_always(store_hart.memory().read32(BASE + 64 * 1024 - 4) == BASE + 64 * 1024, "last word writable");
  assert_always(store_hart.step() == Hart::StepStatus::Halted, "straddling store halts");
  assert_always(store_hart.trap_cause() == Hart::TrapCause::StoreAccessFault, "store access fault cause");

  Hart fetch_hart(4096);
  fetch_hart.set_pc(BASE + 4096);
  assert_always(fetch_hart.step() == Hart::StepStatus::Halted, "fetch past the end halts");
  assert_always(fetch_hart.trap_cause() == Hart::TrapCause::InstructionAccessFault, "fetch fault cause");
}

void suite_branch() {
  assert_always( branch_taken(0x0, 7, 7), "beq equal");
  assert_always(!branch_taken(0x0, 7, 8), "beq unequal");
  assert_always( branch_taken(0x1, 7, 8), "bne");
  assert_always(!branch_taken(0x1, 7, 7), "bne equal");
  assert_always( branch_taken(0x4, 0xffffffffu, 1), "blt signed");
  assert_always(!branch_taken(0x4, 1, 0xffffffffu), "blt signed reversed");
  assert_always( branch_taken(0x5, 1, 0xffffffffu), "bge signed");
  assert_always( branch_taken(0x5, 5, 5), "bge equal");
  assert_always(!branch_taken(0x6, 0xffffffffu, 1), "bltu unsigned");
  assert_always( branch_taken(0x6, 1, 0xffffffffu), "bltu");
  assert_always( branch_taken(0x7, 0xffffffffu, 1), "bgeu");
  assert_always(!branch_taken(0x7, 0, 1), "bgeu not taken");

  Hart hart(4096);
  load_program(hart, {
    addi(1, 0, 1),
    enc_b(8, 1, 1, 0x0),           // beq x1,x1,+8
    addi(2, 0, 99),                // skipped
    enc_b(-12, 0, 1, 0x1),         // bne x1,x0,-12 back to the first addi
  });
  retire(hart, 2);
  assert_always(hart.pc() == BASE + 12, "taken branch adds offset");
  retire(hart, 1);
  assert_always(hart.pc() == BASE, "backward branch");
  assert_always(hart.reg(2) == 0, "skipped instruction did not run");
}

void suite_jump() {
  Hart hart(4096);
  load_program(hart, {
    enc_j(12, 1),                        // jal x1, +12
    0, 0,
    enc_i(3, 5, 0x0, 5, OPC_JALR),       // jalr x5, 3(x5), rd == rs1
  });
  retire(hart, 1);
  assert_always(hart.reg(1) == BASE + 4 && hart.pc() == BASE + 12, "jal links and jumps");
  hart.write_reg(5, BASE + 0x21);
  retire(hart, 1);
  assert_always(hart.pc() == BASE + 0x24, "jalr clears bit 0 of the target");
  assert_always(hart.reg(5) == BASE + 16, "jalr link uses old pc, target uses old rs1");

  // bit 0 is cleared after the add, so an odd base with an even offset still lands even
  Hart odd(4096);
  load_program(odd, {enc_i(2, 5, 0x0, 1, OPC_JALR)}); // jalr x1, 2(x5)
  odd.write_reg(5, BASE + 0x101);
  retire(odd, 1);
  assert_always(odd.pc() == BASE + 0x102, "jalr masks the sum, not the offset");
  assert_always(odd.reg(1) == BASE + 4, "jalr link");

  Hart back(4096);
  load_program(back, {
    addi(6, 0, 0),
    enc_j(-4, 0),                        // jal x0, -4
  });
  retire(back, 2);
  assert_always(back.pc() == BASE && back.reg(0) == 0, "jal x0 backward");
}

void suite_csr() {
  Hart hart(4096);
  load_program(hart, {
    csr_op(0x1, 1, 0x340, 2),    // csrrw  x1, mscratch, x2
    csr_op(0x2, 3, 0x340, 4),    // csrrs  x3, mscratch, x4
    csr_op(0x3, 5, 0x340, 6),    // csrrc  x5, mscratch, x6
    csr_op(0x5, 7, 0x341, 0x1f), // csrrwi x7, 0x341, 31
    csr_op(0x6, 0, 0x341, 0x0),  // csrrsi x0, 0x341, 0
    csr_op(0x7, 8, 0x341, 0x0f), // csrrci x8, 0x341, 15
    csr_op(0x1, 9, 0xfff, 0),    // csrrw  x9, 0xfff, x0
  });
  hart.write_reg(2, 0x42);
  hart.write_reg(4, 0x1);
  hart.write_reg(6, 0x3);
  hart.write_csr(0xfff, 0x5a5a5a5au);

  retire(hart, 1);
  assert_always(hart.reg(1) == 0 && hart.read_csr(0x340) == 0x42, "csrrw");
  retire(hart, 1);
  assert_always(hart.reg(3) == 0x42 && hart.read_csr(0x340) == 0x43, "csrrs");
  retire(hart, 1);
  assert_always(hart.reg(5) == 0x43 && hart.read_csr(0x340) == 0x40, "csrrc");
  retire(hart, 1);
  assert_always(hart.reg(7) == 0 && hart.read_csr(0x341) == 0x1f, "csrrwi zero-extends rs1 field");
  retire(hart, 1);
  assert_always(hart.reg(0) == 0 && hart.read_csr(0x341) == 0x1f, "csrrsi with rd=x0");
  retire(hart, 1);
  assert_always(hart.reg(8) == 0x1f && hart.read_csr(0x341) == 0x10, "csrrci");
  retire(hart, 1);
  assert_always(hart.reg(9) == 0x5a5a5a5au && hart.read_csr(0xfff) == 0, "last CSR slot");
  assert_always(hart.read_csr(0x342) == 0, "untouched CSRs stay zero");
}

void suite_amo() {
  const uint32_t data = BASE + 0x400;
  Hart hart(4096);
  load_program(hart, {
    amo(0x00, 3, 1, 2),   // amoadd.w  x3, x2, (x1)
    amo(0x01, 4, 1, 5),   // amoswap.w x4, x5, (x1)
    amo(0x02, 6, 1, 0),   // lr.w      x6, (x1)
    amo(0x03, 7, 1, 8),   // sc.w      x7, x8, (x1)
    amo(0x04, 9, 1, 2),   // amoxor.w
    amo(0x0c, 10, 1, 2),  // amoand.w
    amo(0x08, 11, 1, 8),  // amoor.w
  });
  hart.write_reg(1, data);
  hart.write_reg(2, 3);
  hart.write_reg(5, 0x1234);
  hart.write_reg(7, 0xdead);
  hart.write_reg(8, 0xabcd);
  hart.memory().write32(data, 5);

  retire(hart, 1);
  assert_always(hart.reg(3) == 5 && hart.memory().read32(data) == 8, "amoadd returns old value");
  retire(hart, 1);
  assert_always(hart.reg(4) == 8 && hart.memory().read32(data) == 0x1234, "amoswap");
  retire(hart, 1);
  assert_always(hart.reg(6) == 0x1234, "lr.w");
  retire(hart, 1);
  assert_always(hart.reg(7) == 0 && hart.memory().read32(data) == 0xabcd, "sc.w always succeeds");
  retire(hart, 1);
  assert_always(hart.reg(9) == 0xabcd && hart.memory().read32(data) == (0xabcdu ^ 3u), "amoxor");
  retire(hart, 1);
  assert_always(hart.reg(10) == (0xabcdu ^ 3u) && hart.memory().read32(data) == ((0xabcdu ^ 3u) & 3u), "amoand");
  retire(hart, 1);
  assert_always(hart.memory().read32(data) == (((0xabcdu ^ 3u) & 3u) | 0xabcdu), "amoor");

  Hart minmax(4096);
  load_program(minmax, {
    amo(0x10, 3, 1, 2),   // amomin.w  signed
    amo(0x14, 4, 1, 2),   // amomax.w  signed
    amo(0x18, 5, 1, 6),   // amominu.w
    amo(0x1c, 7, 1, 6),   // amomaxu.w
  });
  minmax.write_reg(1, data);
  minmax.write_reg(2, 3);
  minmax.write_reg(6, 0xffffffffu);
  minmax.memory().write32(data, static_cast<uint32_t>(-5));
  retire(minmax, 1);
  assert_always(minmax.reg(3) == static_cast<uint32_t>(-5) && minmax.memory().read32(data) == static_cast<uint32_t>(-5), "amomin keeps -5");
  retire(minmax, 1);
  assert_always(minmax.memory().read32(data) == 3u, "amomax picks 3 over -5");
  retire(minmax, 1);
  assert_always(minmax.reg(5) == 3u && minmax.memory().read32(data) == 3u, "amominu");
  retire(minmax, 1);
  assert_always(minmax.reg(7) == 3u && minmax.memory().read32(data) == 0xffffffffu, "amomaxu");

  Hart bad_width(4096);
  load_program(bad_width, {enc_r(0, 2, 1, 0x3, 3, OPC_AMO)}); // amoadd.d
  assert_always(bad_width.step() == Hart::StepStatus::Halted, "AMO width other than W is fatal");
  assert_always(bad_width.trap_cause() == Hart::TrapCause::IllegalInstruction, "illegal AMO width");

  Hart bad_op(4096);
  load_program(bad_op, {amo(0x05, 3, 1, 2)});
  bad_op.write_reg(1, data);
  bad_op.memory().write32(data, 77);
  assert_always(bad_op.step() == Hart::StepStatus::Halted, "unknown AMO subtype is fatal");
  assert_always(bad_op.reg(3) == 0 && bad_op.memory().read32(data) == 77, "unknown AMO has no effect");
}

void suite_system() {
  // EBREAK after exactly N retirements reports N
  Hart hart(4096);
  load_program(hart, {
    addi(1, 0, 1),
    addi(5, 0, 255),
    addi(6, 0, -1),
    addi(7, 0, 10),
    addi(0, 0, 3),
    EBREAK,
    addi(8, 0, 1),
  });
  const uint64_t attempted = hart.run();
  assert_always(attempted == 6, "run stops at the halt");
  assert_always(hart.halted() && hart.trap_cause() == Hart::TrapCause::Breakpoint, "ebreak halts");
  assert_always(hart.cycle_count() == 5, "ebreak does not retire");
  assert_always(hart.pc() == BASE + 20, "pc parked on ebreak");
  assert_always(hart.step() == Hart::StepStatus::Halted, "halted hart stays halted");
  assert_always(rvlite::exit_status(hart) == 0, "breakpoint halt is success");

  std::ostringstream expected;
  expected << "Hit EBREAK\nCycle count: 5\nRegister state:\n";
  for (int r = 0; r < 32; ++r) {
    const char* val = "0 (0)";
    if (r == 1) val = "1 (1)";
    if (r == 5) val = "ff (255)";
    if (r == 6) val = "ffffffff (4294967295)";
    if (r == 7) val = "a (10)";
    expected << " x" << r << ": " << val << "\n";
  }
  std::ostringstream dump;
  rvlite::print_breakpoint_report(hart, dump);
  assert_always(dump.str() == expected.str(), "debug-halt dump format");

  // ECALL is reported as its own not-implemented condition
  Hart ecall(4096);
  load_program(ecall, {addi(1, 0, 1), ECALL});
  retire(ecall, 1);
  assert_always(ecall.step() == Hart::StepStatus::Halted, "ecall halts");
  assert_always(ecall.trap_cause() == Hart::TrapCause::EnvironmentCallFromMMode, "ecall cause");
  assert_always(!ecall.trap_detail().empty(), "ecall says it is unimplemented");
  assert_always(ecall.cycle_count() == 1 && ecall.pc() == BASE + 4, "ecall does not retire");
  assert_always(rvlite::exit_status(ecall) == 1, "ecall exits non-zero");

  // bounded run leaves a live hart
  Hart spin(4096);
  load_program(spin, {enc_j(0, 0)}); // jal x0, 0
  assert_always(spin.run(100) == 100 && !spin.halted() && spin.cycle_count() == 100, "bounded run");
}

void suite_stall() {
  Hart hart(4096);
  load_program(hart, {enc_i(0, 0, 0x3, 1, OPC_LOAD)}); // ld is RV64 only
  for (int i = 0; i < 3; ++i) {
    assert_always(hart.step() == Hart::StepStatus::Stalled, "bad load width stalls");
    assert_always(hart.pc() == BASE && hart.cycle_count() == 0, "stall keeps pc and cycle count");
  }
  assert_always(!hart.halted() && !hart.stall_detail().empty(), "stall is not a halt");

  Hart store(4096);
  load_program(store, {enc_s(0, 1, 0, 0x3)});
  assert_always(store.step() == Hart::StepStatus::Stalled, "bad store width stalls");

  Hart branch(4096);
  load_program(branch, {enc_b(8, 0, 0, 0x2)});
  assert_always(branch.step() == Hart::StepStatus::Stalled, "bad branch condition stalls");
  assert_always(branch.pc() == BASE, "stalled branch keeps pc");

  Hart strict(4096);
  strict.set_stall_policy(Hart::StallPolicy::Halt);
  load_program(strict, {enc_i(0, 0, 0x6, 1, OPC_LOAD)});
  assert_always(strict.step() == Hart::StepStatus::Halted, "strict policy halts");
  assert_always(strict.trap_cause() == Hart::TrapCause::IllegalInstruction, "strict cause");
}

void suite_illegal() {
  const uint32_t words[] = {
    0x0000007fu,              // unmapped opcode class
    0x30200073u,              // mret, not supported
    0x00004073u,              // SYSTEM funct3 4
    0x00200073u,              // uret-style funct12 2
  };
  for (uint32_t w : words) {
    Hart hart(4096);
    load_program(hart, {w});
    assert_always(hart.step() == Hart::StepStatus::Halted, "illegal word halts");
    assert_always(hart.trap_cause() == Hart::TrapCause::IllegalInstruction, "illegal cause");
    assert_always(hart.cycle_count() == 0 && hart.pc() == BASE, "illegal word does not retire");
    assert_always(hart.last_instr() == w, "halt records the word");
    std::ostringstream line;
    rvlite::report_halt(hart, line);
    assert_always(line.str().find("illegal instruction") != std::string::npos, "fault line names cause");
  }

  // an all-zero word decodes as LOAD (lb x0, 0(x0)) and is harmless
  Hart zero(4096);
  load_program(zero, {0x00000000u});
  assert_always(zero.step() == Hart::StepStatus::Retired, "zero word is lb x0,0(x0)");
}

void suite_x0() {
  Hart hart(4096);
  load_program(hart, {
    addi(0, 0, 5),
    lui(0, 0x12345),
    enc_j(4, 0),
    csr_op(0x5, 0, 0x340, 7),
    addi(1, 0, 0),               // reads x0
    amo(0x00, 0, 2, 3),          // amoadd.w x0
  });
  hart.write_reg(2, BASE + 0x800);
  hart.write_reg(3, 1);
  for (int i = 0; i < 6; ++i) {
    retire(hart, 1);
    assert_always(hart.reg(0) == 0, "x0 reads zero after every step");
  }
  assert_always(hart.reg(1) == 0, "x0 operand is zero");
  assert_always(hart.read_csr(0x340) == 7, "csr still written when rd is x0");
  assert_always(hart.memory().read32(BASE + 0x800) == 1, "amo still writes memory when rd is x0");
}

void suite_loader() {
  Hart hart(256);
  std::vector<uint8_t> too_big(257, 0x13);
  assert_always(!hart.load_image(too_big), "oversized image rejected");

  hart.memory().write8(BASE + 100, 0xee);
  hart.write_reg(9, 1234);
  hart.set_pc(BASE + 0x40);
  assert_always(hart.load_image({0x13, 0x00, 0x00, 0x00}), "nop image loads");
  assert_always(hart.memory().read8(BASE + 100) == 0, "tail zero-padded");
  assert_always(hart.memory().read32(BASE) == 0x00000013u, "image at offset 0");
  assert_always(hart.reg(9) == 0 && hart.pc() == Hart::RESET_PC, "load resets the hart");

  const char* path = "tb_isa_loader.bin";
  {
    std::ofstream out(path, std::ios::binary);
    const uint32_t words[] = {addi(1, 0, 42), EBREAK};
    for (uint32_t w : words) {
      for (int i = 0; i < 4; ++i) out.put(static_cast<char>(w >> (8 * i)));
    }
  }
  Hart file_hart(4096);
  uint32_t nbytes = 0;
  bool ok = rvlite::load_flat_bin(path, &file_hart, &nbytes);
  std::remove(path);
  assert_always(ok && nbytes == 8, "load_flat_bin");
  file_hart.run();
  assert_always(file_hart.reg(1) == 42 && file_hart.trap_cause() == Hart::TrapCause::Breakpoint, "loaded program runs");

  Hart missing(4096);
  assert_always(!rvlite::load_flat_bin("does/not/exist.bin", &missing, nullptr), "missing file fails");
}

// clock the hart through Cascade like the simulator does
void suite_tile() {
  HartTile tile("hart0", 64 * 1024);
  Clock clk;
  tile.clk << clk;
  clk.generateClock();
  Sim::init();
  Sim::reset();

  load_program(tile.hart(), {
    addi(1, 0, 10),              // loop counter
    addi(2, 0, 0),
    addi(2, 2, 3),               // loop: x2 += 3
    addi(1, 1, -1),
    enc_b(-8, 0, 1, 0x1),        // bne x1, x0, loop
    EBREAK,
  });
  int cycles = 0;
  while (!tile.hart().halted() && cycles < 1000) {
    Sim::run();
    ++cycles;
  }
  const Hart& hart = tile.hart();
  assert_always(hart.halted() && hart.trap_cause() == Hart::TrapCause::Breakpoint, "clocked run reaches ebreak");
  assert_always(hart.reg(2) == 30, "loop result");
  assert_always(hart.cycle_count() == 2 + 3 * 10, "retired count");
  assert_always(cycles == 2 + 3 * 10 + 1, "one step per clock");
}

// feed a command script to the REPL and capture what it prints
std::string run_script(rvlite::DebuggerState& dbg, const std::string& script) {
  std::istringstream in(script);
  std::ostringstream out;
  std::streambuf* old_in  = std::cin.rdbuf(in.rdbuf());
  std::streambuf* old_out = std::cout.rdbuf(out.rdbuf());
  rvlite::run_debugger(dbg);
  std::cin.rdbuf(old_in);
  std::cout.rdbuf(old_out);
  return out.str();
}

// breakpoints, step/cont and the bounded auto_run, all clocked through Sim::run()
void suite_debugger() {
  HartTile tile("hart0", 64 * 1024);
  Clock clk;
  tile.clk << clk;
  clk.generateClock();
  Sim::init();
  Sim::reset();

  const std::vector<uint32_t> prog = {
    addi(1, 0, 1),
    addi(2, 0, 2),
    addi(3, 0, 3),               // BASE+8
    addi(4, 0, 4),               // BASE+12, breakpoint
    EBREAK,                      // BASE+16
  };
  Hart& hart = tile.hart();
  load_program(hart, prog);
  rvlite::DebuggerState dbg(tile);
  const std::string::size_type npos = std::string::npos;

  std::string out = run_script(dbg, "break 0x8000000c\ncont\n");
  assert_always(out.find("stopped at breakpoint 0x8000000c") != npos, "cont reports the breakpoint");
  assert_always(hart.pc() == BASE + 12 && dbg.cycle == 3, "cont stops in front of the breakpoint");
  assert_always(hart.reg(3) == 3 && hart.reg(4) == 0, "breakpointed instruction has not run");
  assert_always(dbg.user_quit && dbg.breakpoints.size() == 1, "end of script quits, breakpoint kept");

  out = run_script(dbg, "step\ncont\nquit\n");
  assert_always(hart.halted() && hart.trap_cause() == Hart::TrapCause::Breakpoint, "cont runs into ebreak");
  assert_always(dbg.cycle == 5 && hart.cycle_count() == 4, "ebreak clocked but not retired");
  assert_always(out.find("Hit EBREAK\nCycle count: 4\nRegister state:\n") != npos, "halt prints the dump");
  assert_always(out.find(" x4: 4 (4)\n") != npos, "dump shows the last write");

  out = run_script(dbg, "cont\nquit\n");
  assert_always(out.find("hart halted, nothing to run") != npos && dbg.cycle == 5, "halted hart does not clock");

  load_program(hart, prog);
  dbg.reset();
  rvlite::auto_run(dbg, 2);
  assert_always(dbg.cycle == 2 && hart.pc() == BASE + 8 && !hart.halted(), "auto_run honours the bound");
  rvlite::auto_run(dbg, 0);
  assert_always(hart.halted() && dbg.cycle == 5 && hart.cycle_count() == 4, "auto_run 0 runs to the halt");
  rvlite::auto_run(dbg, 0);
  assert_always(dbg.cycle == 5, "auto_run on a halted hart is a no-op");
}

struct SuiteEntry {
  const char* name;
  void (*fn)();
  bool needs_sim;
};

const SuiteEntry SUITES[] = {
  {"decode",   suite_decode,   false},
  {"imm",      suite_imm,      false},
  {"addi",     suite_addi,     false},
  {"alu",      suite_alu,      false},
  {"upper",    suite_upper,    false},
  {"mem",      suite_mem,      false},
  {"unmapped", suite_unmapped, false},
  {"bounds",   suite_bounds,   false},
  {"branch",   suite_branch,   false},
  {"jump",     suite_jump,     false},
  {"csr",      suite_csr,      false},
  {"amo",      suite_amo,      false},
  {"system",   suite_system,   false},
  {"stall",    suite_stall,    false},
  {"illegal",  suite_illegal,  false},
  {"x0",       suite_x0,       false},
  {"loader",   suite_loader,   false},
  {"tile",     suite_tile,     true},
  {"debugger", suite_debugger, true},
};

} // namespace

int main(int argc, char *argv[]) {
  descore::parseTraces(argc, argv);
  Parameter::parseCommandLine(argc, argv);

  const std::string S = std::string(suite);
  bool found = false;
  for (const SuiteEntry& entry : SUITES) {
    const bool selected = (S == "all") ? !entry.needs_sim : (S == entry.name);
    if (!selected) continue;
    entry.fn();
    std::cout << "PASS " << entry.name << std::endl;
    found = true;
  }
  assert_always(found, "unknown -suite");
  return 0;
}
