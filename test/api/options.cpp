#include "../../src/trisat.hpp"
#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

int main () {

  TriSAT::Solver solver;

  assert (TriSAT::Solver::is_valid_option ("algorithm"));
  assert (TriSAT::Solver::is_valid_option ("check"));
  assert (TriSAT::Solver::is_valid_option ("strict"));
  assert (TriSAT::Solver::is_valid_option ("witness"));
  assert (!TriSAT::Solver::is_valid_option ("restart"));
  assert (!TriSAT::Solver::is_valid_option (""));

  // Defaults.

  assert (solver.get ("algorithm") == TriSAT::DPLL);
  assert (solver.get ("check") == 1);
  assert (solver.get ("realtime") == 1);
  assert (solver.get ("strict") == 0);
  assert (solver.get ("witness") == 0);

  // Explicit setting with clipping to the valid range.

  assert (solver.set ("algorithm", 1));
  assert (solver.get ("algorithm") == 1);
  assert (solver.set ("algorithm", 7));
  assert (solver.get ("algorithm") == 3);
  assert (solver.set ("algorithm", -1));
  assert (solver.get ("algorithm") == 0);
  assert (!solver.set ("no-such-option", 1));

  // Long options.

  assert (solver.set_long_option ("--algorithm=2"));
  assert (solver.get ("algorithm") == 2);
  assert (solver.set_long_option ("--no-check"));
  assert (solver.get ("check") == 0);
  assert (solver.set_long_option ("--check"));
  assert (solver.get ("check") == 1);
  assert (solver.set_long_option ("--witness=true"));
  assert (solver.get ("witness") == 1);
  assert (solver.set_long_option ("--witness=false"));
  assert (solver.get ("witness") == 0);
  assert (solver.set_long_option ("--algorithm=1e3"));
  assert (solver.get ("algorithm") == 3);

  assert (!solver.set_long_option ("--no-algorithm=2"));
  assert (!solver.set_long_option ("--algorithm=two"));
  assert (!solver.set_long_option ("--algorithm=2x"));
  assert (!solver.set_long_option ("--unknown"));
  assert (!solver.set_long_option ("-algorithm=2"));
  assert (!solver.set_long_option ("algorithm"));
  assert (solver.get ("algorithm") == 3);

#ifndef QUIET
  assert (solver.set_long_option ("--verbose=9"));
  assert (solver.get ("verbose") == 3);
  assert (solver.set ("verbose", 0));
#endif

  return 0;
}
