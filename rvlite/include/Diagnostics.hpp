// **********************************************************************
// rvlite/include/Diagnostics.hpp
// **********************************************************************
// rvlite maintainers Oct 19 2026
/*
What to print when the hart stops: the EBREAK register dump (kept byte-for-byte
compatible with the old golden outputs) or a one-line fault report.
*/
#pragma once

#include "Hart.hpp"

#include <ostream>

namespace rvlite {

const char* trap_cause_name(Hart::TrapCause cause);

void print_breakpoint_report(const Hart& hart, std::ostream& os);
void report_halt(const Hart& hart, std::ostream& os);

// 0 for a breakpoint halt (or no halt at all), 1 for any fault
int exit_status(const Hart& hart);

} // namespace rvlite
