// **********************************************************************
// rvlite/include/Debugger.hpp
// **********************************************************************
// rvlite maintainers Oct 19 2026
/*
Debugger REPL for the rvlite simulator.  Cycles are advanced with Sim::run()
so the hart is clocked exactly as in a batch run.
*/
#pragma once

#include "HartTile.hpp"

#include <cstdint>
#include <vector>

namespace rvlite {

struct DebuggerState {
  HartTile &tile;
  Hart &hart;
  uint64_t cycle;
  bool user_quit;
  bool trace_enabled;
  std::vector<uint32_t> breakpoints;

  explicit DebuggerState(HartTile &t);
  void reset();
};

// run until the hart halts or max_cycles clocks have elapsed (0 = no limit)
void auto_run(DebuggerState &state, uint64_t max_cycles);
void run_debugger(DebuggerState &state);

} // namespace rvlite
