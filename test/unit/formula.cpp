#include "../../src/internal.hpp"
#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

using namespace TriSAT;

static Clause clause (const vector<int> & lits) { return Clause (lits); }

static bool same (const Formula & f, const Formula & g) {
  if (f.symbols != g.symbols) return false;
  if (f.clauses.size () != g.clauses.size ()) return false;
  for (size_t i = 0; i < f.clauses.size (); i++)
    if (!f.clauses[i].equivalent (g.clauses[i])) return false;
  return true;
}

int main () {

  Formula f;
  assert (f.empty ());
  assert (!f.inconsistent ());
  assert (!f.find_unit ());
  assert (f.satisfied (Assignment ()));

  f.add (clause ({ 10, -2 }));
  f.add (clause ({ 2, 3 }));
  f.add (clause ({ -3 }));
  f.add (clause ({ 1 }));

  // Symbols are sorted numerically.

  const vector<int> symbols = { 1, 2, 3, 10 };
  assert (f.symbols == symbols);

  // First unit clause in insertion order.

  const Clause * unit = f.find_unit ();
  assert (unit);
  assert ((*unit)[0] == -3);

  Assignment a;
  assert (!f.satisfied (a));
  a.assign (-3);
  a.assign (2);
  assert (!f.satisfied (a));
  a.assign (10);
  a.assign (1);
  assert (f.satisfied (a));
  assert (a.size () == 4);
  assert (a.val (-3) == 1);
  assert (a.val (3) == -1);
  assert (!a.val (4));

  // Simplification by '-3' removes the unit clause and shortens '2 3'.

  Assignment b;
  b.assign (-3);
  Formula g;
  assert (f.simplify (b, g));
  assert (g.clauses.size () == 3);
  assert (g.clauses[0].format () == "x10 -x2");
  assert (g.clauses[1].format () == "x2");
  assert (g.clauses[2].format () == "x1");
  const vector<int> remaining = { 1, 2, 10 };
  assert (g.symbols == remaining);
  assert (f.clauses.size () == 4);

  // Simplifying again with the same assignment does not change anything.

  Formula h;
  assert (g.simplify (b, h));
  assert (same (g, h));

  // Simplifying by a single literal gives the same as by an assignment
  // with only that literal.

  for (int idx = 1; idx <= 10; idx++)
    for (int lit = -idx; lit <= idx; lit += 2 * idx) {
      Assignment single;
      single.assign (lit);
      Formula by_assignment, by_literal;
      const bool ok = f.simplify (single, by_assignment);
      assert (ok == f.simplify (lit, by_literal));
      if (ok) assert (same (by_assignment, by_literal));
    }

  Formula l;
  assert (!f.simplify (3, l));
  assert (f.simplify (-3, l));
  assert (same (l, g));

  // Large variable indices do not need more memory.

  Assignment large;
  large.assign (-INT_MAX);
  large.assign (7);
  assert (large.size () == 2);
  assert (large[INT_MAX] == -1);
  assert (large.val (-7) == -1);
  assert (!large[8]);
  large.assign (INT_MAX);
  assert (large.size () == 2);
  assert (large.val (INT_MAX) == 1);

  // Falsifying a clause is a contradiction.

  Assignment c;
  c.assign (-2), c.assign (3);
  Formula i;
  assert (!f.simplify (c, i));

  // Satisfying all clauses gives the empty formula.

  Formula j;
  assert (f.simplify (a, j));
  assert (j.empty ());
  assert (j.symbols.empty ());

  Formula k;
  k.add (Clause ());
  assert (k.inconsistent ());
  assert (!k.satisfied (a));

  return 0;
}
