// **********************************************************************
// rvlite/src/Debugger.cpp
// **********************************************************************
// rvlite maintainers Oct 19 2026

#include "Debugger.hpp"
#include "Diagnostics.hpp"

#include <cascade/SimGlobals.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace rvlite {
namespace {

struct CycleInfo {
  uint32_t begin_pc = 0;
  bool executed = false;
  bool stalled = false;
  bool halted = false;
  bool user_breakpoint_hit = false;
};

static constexpr const char* COLOR_RESET = "\033[0m";
static constexpr const char* COLOR_BP    = "\033[33m";
static constexpr const char* COLOR_EXIT  = "\033[32m";
static constexpr const char* COLOR_ERR   = "\033[31m";

static std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

static bool parse_u32(const std::string& text, uint32_t* value) {
  try {
    size_t idx = 0;
    const unsigned long parsed = std::stoul(text, &idx, 0);
    if (idx != text.size() || parsed > std::numeric_limits<uint32_t>::max()) {
      return false;
    }
    *value = static_cast<uint32_t>(parsed);
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

static std::string hex32(uint32_t value) {
  std::ostringstream oss;
  oss << std::hex << std::setw(8) << std::setfill('0') << value;
  return oss.str();
}

static void print_cycle_trace(const DebuggerState& state, const CycleInfo& info) {
  std::ios_base::fmtflags old_flags = std::cout.flags();
  char old_fill = std::cout.fill('0');

  std::cout << "cycle " << state.cycle
            << " pc=0x" << std::hex << std::setw(8) << info.begin_pc
            << " instr=0x" << std::setw(8) << state.hart.last_instr()
            << std::dec << " " << op_class_name(state.hart.last_op());
  if (info.stalled) {
    std::cout << " [stall: " << state.hart.stall_detail() << "]";
  }
  std::cout << std::endl;

  std::cout.fill(old_fill);
  std::cout.flags(old_flags);
}

static void print_registers(const DebuggerState& state) {
  std::ios_base::fmtflags old_flags = std::cout.flags();
  char old_fill = std::cout.fill('0');

  std::cout << "pc=0x" << std::hex << std::setw(8) << state.hart.pc()
            << std::dec << " retired=" << state.hart.cycle_count()
            << " halted=" << (state.hart.halted() ? "yes" : "no")
            << std::endl;
  for (uint32_t r = 0; r < 32; ++r) {
    std::cout << "  x" << std::setw(2) << std::dec << r << "=0x"
              << std::hex << std::setw(8) << state.hart.reg(r)
              << std::dec;
    if ((r % 4) == 3) {
      std::cout << std::endl;
    } else {
      std::cout << ' ';
    }
  }

  std::cout.fill(old_fill);
  std::cout.flags(old_flags);
}

static void dump_memory(MemoryPort& mem, uint32_t addr, std::size_t count) {
  std::ios_base::fmtflags old_flags = std::cout.flags();
  char old_fill = std::cout.fill('0');

  for (std::size_t i = 0; i < count; ++i) {
    const uint32_t current = addr + static_cast<uint32_t>(i * 4u);
    try {
      const uint32_t value = mem.read32(current);
      std::cout << "  [0x" << std::hex << std::setw(8) << current
                << "] = 0x" << std::setw(8) << value
                << std::dec << std::endl;
    } catch (const AccessFault& fault) {
      std::cout << COLOR_ERR << "  " << fault.what() << COLOR_RESET << std::endl;
      break;
    }
  }

  std::cout.fill(old_fill);
  std::cout.flags(old_flags);
}

static void print_halt(const DebuggerState& state) {
  if (state.hart.trap_cause() == Hart::TrapCause::Breakpoint) {
    std::cout << COLOR_EXIT;
    print_breakpoint_report(state.hart, std::cout);
    std::cout << COLOR_RESET;
  } else {
    std::cout << COLOR_ERR;
    report_halt(state.hart, std::cout);
    std::cout << COLOR_RESET;
  }
}

/* execute 1 cycle unless a user breakpoint sits on the current pc */
static CycleInfo execute_cycle(DebuggerState& state, bool honor_breakpoints) {
  CycleInfo info;
  if (state.hart.halted()) {
    return info;
  }

  info.begin_pc = state.hart.pc();
  if (honor_breakpoints &&
      std::find(state.breakpoints.begin(), state.breakpoints.end(), info.begin_pc) != state.breakpoints.end()) {
    info.user_breakpoint_hit = true;
    return info;
  }

  Sim::run(); // <--------------------------- EXECUTE 1 CYCLE
  state.cycle++;

  info.executed = true;
  info.stalled  = state.tile.last_status() == Hart::StepStatus::Stalled;
  info.halted   = state.hart.halted();
  return info;
}

} // namespace

DebuggerState::DebuggerState(HartTile& t)
  : tile(t), hart(t.hart()) {
  reset();
}

void DebuggerState::reset() {
  cycle = 0;
  user_quit = false;
  trace_enabled = false;
  breakpoints.clear();
}

void auto_run(DebuggerState& state, uint64_t max_cycles) {
  while (max_cycles == 0 || state.cycle < max_cycles) {
    CycleInfo info = execute_cycle(state, false);
    if (!info.executed || info.halted) {
      break;
    }
  }
}

namespace {

// ******************
// REPL commands, each takes the rest of the line
// ******************
void cmd_step(DebuggerState& state, std::istringstream& args) {
  uint32_t count = 1;
  std::string token;
  if ((args >> token) && (!parse_u32(token, &count) || count == 0)) {
    std::cout << COLOR_ERR << "step: bad count '" << token << "'" << COLOR_RESET << std::endl;
    return;
  }
  while (count-- > 0) {
    const CycleInfo info = execute_cycle(state, false);
    if (!info.executed) {
      std::cout << "hart halted, nothing to step" << std::endl;
      return;
    }
    print_cycle_trace(state, info);
    if (info.halted) {
      print_halt(state);
      return;
    }
  }
}

// first cycle ignores breakpoints so cont can leave the one we stopped on
void cmd_cont(DebuggerState& state) {
  for (bool first = true;; first = false) {
    const CycleInfo info = execute_cycle(state, !first);
    if (info.user_breakpoint_hit) {
      std::cout << COLOR_BP << "stopped at breakpoint 0x" << hex32(info.begin_pc)
                << COLOR_RESET << std::endl;
      return;
    }
    if (!info.executed) {
      std::cout << "hart halted, nothing to run" << std::endl;
      return;
    }
    if (state.trace_enabled) print_cycle_trace(state, info);
    if (info.halted) {
      print_halt(state);
      return;
    }
  }
}

void list_breakpoints(const DebuggerState& state) {
  if (state.breakpoints.empty()) {
    std::cout << "no breakpoints" << std::endl;
    return;
  }
  for (std::size_t i = 0; i < state.breakpoints.size(); ++i) {
    std::cout << "  #" << i << " 0x" << hex32(state.breakpoints[i]) << std::endl;
  }
}

void cmd_break(DebuggerState& state, std::istringstream& args) {
  std::string token;
  if (!(args >> token)) {
    list_breakpoints(state);
    return;
  }
  uint32_t pc = 0;
  if (!parse_u32(token, &pc) || (pc & 0x3u) != 0) {
    std::cout << COLOR_ERR << "break: need a word-aligned pc" << COLOR_RESET << std::endl;
    return;
  }
  auto it = std::find(state.breakpoints.begin(), state.breakpoints.end(), pc);
  if (it == state.breakpoints.end()) state.breakpoints.push_back(pc);
  std::cout << "break at 0x" << hex32(pc) << std::endl;
}

void cmd_delete(DebuggerState& state, std::istringstream& args) {
  std::string token;
  uint32_t pc = 0;
  if (!(args >> token) || !parse_u32(token, &pc)) {
    std::cout << "usage: delete <pc>" << std::endl;
    return;
  }
  auto it = std::find(state.breakpoints.begin(), state.breakpoints.end(), pc);
  if (it == state.breakpoints.end()) {
    std::cout << "no break at 0x" << hex32(pc) << std::endl;
    return;
  }
  state.breakpoints.erase(it);
  std::cout << "deleted 0x" << hex32(pc) << std::endl;
}

void cmd_csr(const DebuggerState& state, std::istringstream& args) {
  std::string token;
  uint32_t csr = 0;
  if (!(args >> token) || !parse_u32(token, &csr) || csr >= CsrFile::COUNT) {
    std::cout << "usage: csr <0..0xfff>" << std::endl;
    return;
  }
  std::cout << "csr 0x" << std::hex << csr << std::dec
            << " = 0x" << hex32(state.hart.read_csr(csr)) << std::endl;
}

void cmd_mem(DebuggerState& state, std::istringstream& args) {
  std::string token;
  uint32_t addr = 0;
  if (!(args >> token) || !parse_u32(token, &addr)) {
    std::cout << "usage: mem <addr> [words]" << std::endl;
    return;
  }
  uint32_t words = 4;
  if ((args >> token) && (!parse_u32(token, &words) || words == 0)) {
    std::cout << COLOR_ERR << "mem: bad word count '" << token << "'" << COLOR_RESET << std::endl;
    return;
  }
  dump_memory(state.hart.memory(), addr, words);
}

void cmd_trace(DebuggerState& state, std::istringstream& args) {
  std::string mode;
  if (!(args >> mode)) {
    state.trace_enabled = !state.trace_enabled;
  } else if (to_lower(mode) == "on" || to_lower(mode) == "off") {
    state.trace_enabled = to_lower(mode) == "on";
  } else {
    std::cout << "usage: trace [on|off]" << std::endl;
    return;
  }
  std::cout << "cont tracing " << (state.trace_enabled ? "on" : "off") << std::endl;
}

void cmd_help() {
  std::cout << "  s, step [N]          run N cycles (1)\n"
               "  c, cont              run to a breakpoint or halt\n"
               "  br, break [pc]       add a breakpoint, or list them\n"
               "  del, delete <pc>     drop a breakpoint\n"
               "  clear                drop every breakpoint\n"
               "  regs                 pc, retired count, x0-x31\n"
               "  csr <n>              read one CSR\n"
               "  mem <addr> [words]   dump memory (4 words)\n"
               "  trace [on|off]       per-cycle lines during cont\n"
               "  q, quit              leave\n";
}

} // namespace

void run_debugger(DebuggerState& state) {
  std::cout << "rvlite debugger, pc=0x" << hex32(state.hart.pc()) << " ('help' lists commands)" << std::endl;
  std::string line;
  state.user_quit = false;
  while (!state.user_quit) {
    std::cout << "rvlite> " << std::flush;
    if (!std::getline(std::cin, line)) {
      state.user_quit = true;
      break;
    }
    std::istringstream args(line);
    std::string word;
    if (!(args >> word)) continue;

    const std::string cmd = to_lower(word);
    if      (cmd == "s"   || cmd == "step")   cmd_step(state, args);
    else if (cmd == "c"   || cmd == "cont" || cmd == "continue") cmd_cont(state);
    else if (cmd == "br"  || cmd == "break")  cmd_break(state, args);
    else if (cmd == "del" || cmd == "delete") cmd_delete(state, args);
    else if (cmd == "clear") { state.breakpoints.clear(); std::cout << "breakpoints cleared" << std::endl; }
    else if (cmd == "regs")  print_registers(state);
    else if (cmd == "csr")   cmd_csr(state, args);
    else if (cmd == "mem")   cmd_mem(state, args);
    else if (cmd == "trace") cmd_trace(state, args);
    else if (cmd == "q"   || cmd == "quit")   state.user_quit = true;
    else if (cmd == "help")  cmd_help();
    else std::cout << COLOR_ERR << "unknown command '" << word << "'" << COLOR_RESET << std::endl;
  }
}

} // namespace rvlite
