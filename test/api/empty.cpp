#include "../../src/trisat.hpp"
#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

// Corner cases: no clauses at all is satisfiable with an empty assignment
// and the empty clause is unsatisfiable, whatever else is there.

int main () {

  for (int algorithm = TriSAT::ALL; algorithm <= TriSAT::DPLL; algorithm++) {

    TriSAT::Solver empty_formula;
    empty_formula.set ("algorithm", algorithm);
    int res = empty_formula.solve ();
    assert (res == 10);
    if (algorithm == TriSAT::DPLL || algorithm == TriSAT::ALL) {
      assert (empty_formula.has_model ());
      assert (!empty_formula.val (1));
    }

    TriSAT::Solver empty_clause;
    empty_clause.set ("algorithm", algorithm);
    empty_clause.add (0);
    res = empty_clause.solve ();
    assert (res == 20);
    assert (!empty_clause.has_model ());

    TriSAT::Solver with_empty_clause;
    with_empty_clause.set ("algorithm", algorithm);
    with_empty_clause.reserve (3);
    with_empty_clause.add (1), with_empty_clause.add (2);
    with_empty_clause.add (0);
    with_empty_clause.add (-3), with_empty_clause.add (0);
    with_empty_clause.add (0);
    res = with_empty_clause.solve ();
    assert (res == 20);

    // Declared but unused variables stay unassigned.

    TriSAT::Solver unused;
    unused.set ("algorithm", algorithm);
    unused.reserve (10);
    unused.add (7), unused.add (0);
    res = unused.solve ();
    assert (res == 10);
    if (unused.has_model ()) {
      assert (unused.val (7) == 7);
      assert (unused.val (-7) == 7);
      for (int idx = 1; idx <= 10; idx++)
        if (idx != 7) assert (!unused.val (idx));
    }
  }

  return 0;
}
