// **********************************************************************
// rvlite/include/HartTile.hpp
// **********************************************************************
// rvlite maintainers Oct 19 2026
/*
Wrapper that plugs a Hart into the Cascade simulator: one step per clock
tick, with the per-instruction trace going through the component trace().
*/
#pragma once

#include <cascade/Cascade.hpp>
#include "Hart.hpp"

#include <cstdint>
#include <string>

class HartTile : public Component { // inherit from Component,
  DECLARE_COMPONENT(HartTile);      // macro boilerplate to plug Component into sim engine

public:
  HartTile(std::string name, uint32_t mem_bytes, COMPONENT_CTOR);
  Clock(clk);
  void tick();
  void reset();

  rvlite::Hart&       hart()       { return hart_; }
  const rvlite::Hart& hart() const { return hart_; }
  rvlite::Hart::StepStatus last_status() const { return last_status_; }

private:
  rvlite::Hart             hart_;
  rvlite::Hart::StepStatus last_status_ = rvlite::Hart::StepStatus::Retired;
};
