#include "../../src/trisat.hpp"
#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>
#include <climits>
#include <cstdio>

// Variable indices up to 'INT_MAX' are valid and the memory needed only
// depends on the number of variables actually used.

int main () {

  for (int algorithm = TriSAT::ALL; algorithm <= TriSAT::DPLL; algorithm++) {

    FILE * file = tmpfile ();
    assert (file);
    fputs ("p cnf 2147483647 2\n2147483647 -5 0\n-2147483647 0\n", file);
    rewind (file);

    TriSAT::Solver solver;
    solver.set ("algorithm", algorithm);
    const char * err = solver.read_dimacs (file, "<large>");
    fclose (file);
    assert (!err);
    assert (solver.vars () == INT_MAX);

    int res = solver.solve ();
    assert (res == 10);
    if (solver.has_model ()) {
      assert (solver.val (INT_MAX) == -INT_MAX);
      assert (solver.val (-INT_MAX) == INT_MAX);
      assert (solver.val (5) == -5);
      assert (!solver.val (1));
      assert (!solver.val (INT_MAX - 1));
    }

    solver.add (INT_MAX), solver.add (0);
    res = solver.solve ();
    assert (res == 20);
  }

  // Same through the API.

  TriSAT::Solver solver;
  solver.reserve (INT_MAX);
  solver.add (INT_MAX - 1), solver.add (INT_MAX), solver.add (0);
  solver.add (-INT_MAX), solver.add (0);
  int res = solver.solve ();
  assert (res == 10);
  assert (solver.val (INT_MAX - 1) > 0);
  assert (solver.val (INT_MAX) < 0);

  return 0;
}
