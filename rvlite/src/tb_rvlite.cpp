// **********************************************************************
// rvlite/src/tb_rvlite.cpp
// **********************************************************************
// rvlite maintainers Oct 19 2026
/*
rvlite simulator: load a flat RV32 image at 0x8000_0000 and clock the hart
until it halts.  EBREAK prints the register dump and exits 0; any other halt
prints a fault line and exits 1.

to configure, build, and run:
% cmake -S . -B build
% cmake --build build --target rvlite -j
% ./build/rvlite -prog=test/image.bin
*/

#include <descore/Parameter.hpp>
#include "HartTile.hpp"
#include "Debugger.hpp"
#include "Diagnostics.hpp"
#include "util/FlatBinLoader.hpp"

#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>

#include <cstdint>
#include <iostream>
#include <string>

// **************
// Parameters (CLI flags): name, default value, help text
// **************
BoolParameter(showcontexts, false, "List component instance names (contexts) and exit");
StringParameter(prog, "test/image.bin", "Flat binary (.bin) to load at 0x80000000, relative to the working directory");
IntParameter(mem_size, 16777216, "Physical memory size in bytes");
IntParameter(steps, 0, "Cycles to run; 0 runs until the hart halts");
BoolParameter(debug, false, "Enter the interactive debugger instead of running");
BoolParameter(strict, false, "Halt on unsupported LOAD/STORE/BRANCH funct3 instead of refetching");

int main(int argc, char *argv[])
{
  // **************
  // Step 1: Parse tracing, parameters, and dump options
  // **************
  descore::parseTraces(argc, argv);        // scans argv for trace options (-trace=hart0 for per-instr lines)
  Parameter::parseCommandLine(argc, argv); // parses cmd line flags and fills *Parameter() globals (above)
  Sim::parseDumps(argc, argv);

  assert_always((int)mem_size > 0, "-mem_size must be positive");

  // **************
  // Step 2: Create components
  // **************
  HartTile tile("hart0", static_cast<uint32_t>((int)mem_size));
  rvlite::Hart &hart = tile.hart();
  hart.set_stall_policy(strict ? rvlite::Hart::StallPolicy::Halt
                               : rvlite::Hart::StallPolicy::Refetch);

  // **************
  // Step 3: Optional: list component instance names & exit
  // **************
  if (showcontexts) {
    Sim::dumpComponentNames();
    return 0;
  }

  // **************
  // Step 4: Hook clock and initialize & reset simulator
  // **************
  Clock clk;
  tile.clk << clk;
  clk.generateClock();
  Sim::init();
  Sim::reset();

  // **************
  // Step 5: Load program (a flat .bin file), this also resets the hart
  // **************
  const std::string prog_path = std::string(prog);
  uint32_t nbytes = 0;
  bool ok = rvlite::load_flat_bin(prog_path, &hart, &nbytes);
  assert_always(ok, "Program load failed");
  std::cout << "Loaded " << nbytes << " bytes from " << prog_path << std::endl;

  // **************
  // Step 6: Run simulation
  // **************
  rvlite::DebuggerState dbg(tile);
  if (debug) {
    run_debugger(dbg);
    return dbg.user_quit ? 0 : rvlite::exit_status(hart);
  }
  auto_run(dbg, static_cast<uint64_t>((int)steps < 0 ? 0 : (int)steps));

  // **************
  // Step 7: Report
  // **************
  if (!hart.halted()) {
    std::cout << "Stopped after " << dbg.cycle << " cycles without halting" << std::endl;
    return 0;
  }
  if (hart.trap_cause() == rvlite::Hart::TrapCause::Breakpoint) {
    rvlite::print_breakpoint_report(hart, std::cout);
  } else {
    rvlite::report_halt(hart, std::cerr);
  }
  return rvlite::exit_status(hart);
}
