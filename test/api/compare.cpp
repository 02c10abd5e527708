#include "../../src/trisat.hpp"
#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <algorithm>
#include <iostream>
#include <vector>

using namespace std;

// Generate small random formulas and check that all three algorithms agree
// and that 'dpll' assignments satisfy the formula.  The generator is
// seeded explicitly so that failures can be reproduced.

class Random {
  uint64_t state;
public:
  Random (uint64_t seed) : state (seed) { }
  uint64_t next () {
    state *= 6364136223846793005ull;
    state += 1442695040888963407ull;
    return state;
  }
  int pick (int l, int r) {
    assert (l <= r);
    return l + (int) ((next () >> 32) % (uint64_t) (r - l + 1));
  }
};

typedef vector<vector<int> > Clauses;

// Clauses have distinct variables.  Otherwise the later literal would
// overwrite the earlier one and the check below would be wrong.

static Clauses generate (Random & random, int vars) {
  Clauses res;
  const int clauses = random.pick (1, 3 * vars);
  for (int i = 0; i < clauses; i++) {
    vector<int> c;
    const int size = min (random.pick (1, 3), vars);
    while ((int) c.size () < size) {
      const int idx = random.pick (1, vars);
      bool found = false;
      for (const auto & lit : c)
        if (abs (lit) == idx) found = true;
      if (found) continue;
      c.push_back (random.pick (0, 1) ? idx : -idx);
    }
    res.push_back (c);
  }
  return res;
}

static int solve (const Clauses & clauses, int vars, int algorithm) {
  TriSAT::Solver solver;
  solver.set ("algorithm", algorithm);
  solver.reserve (vars);
  for (const auto & c : clauses) {
    for (const auto & lit : c) solver.add (lit);
    solver.add (0);
  }
  const int res = solver.solve ();
  assert (res == 10 || res == 20);
  if (algorithm == TriSAT::DPLL) {
    assert (solver.has_model () == (res == 10));
    if (res == 10)
      for (const auto & c : clauses) {
        bool satisfied = false;
        for (const auto & lit : c)
          if (solver.val (lit) > 0) satisfied = true;
        assert (satisfied);
      }
  }
  return res;
}

int main () {
  Random random (42);
  int sat = 0, unsat = 0;
  for (int round = 0; round < 200; round++) {
    const int vars = random.pick (1, 4);
    const Clauses clauses = generate (random, vars);
    const int a = solve (clauses, vars, TriSAT::DP);
    const int b = solve (clauses, vars, TriSAT::RESOLUTION);
    const int c = solve (clauses, vars, TriSAT::DPLL);
    if (a != b || b != c)
      cout << "round " << round << ": dp " << a << " resolution " << b
           << " dpll " << c << endl << flush;
    assert (a == b);
    assert (b == c);
    if (a == 10) sat++; else unsat++;
  }
  cout << sat << " satisfiable and " << unsat << " unsatisfiable" << endl;
  return 0;
}
