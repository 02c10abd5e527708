#include "../../src/internal.hpp"
#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

using namespace TriSAT;

static void add (Internal & internal, const vector<int> & lits) {
  for (const auto & lit : lits) internal.add_original_lit (lit);
  internal.add_original_lit (0);
}

// Repeated conflicting units: only two distinct clauses are known and
// resolving them in the first pass gives the empty clause.

static void repeated_units (Internal & internal) {
  internal.reserve (1);
  for (int i = 0; i < 3; i++)
    add (internal, { 1 }), add (internal, { -1 });
}

int main () {

  {
    Internal internal;
    repeated_units (internal);
    internal.opts.set ("algorithm", RESOLUTION);
    assert (internal.solve () == 20);
    assert (internal.stats.resolution.passes == 1);
    assert (internal.stats.resolution.pairs == 1);
    assert (internal.stats.resolution.resolved == 1);
    assert (internal.stats.resolution.known == 2);
    assert (!internal.has_model);
  }

  {
    Internal internal;
    repeated_units (internal);
    internal.opts.set ("algorithm", DP);
    assert (internal.solve () == 20);
    assert (internal.stats.dp.eliminated == 1);
    assert (internal.stats.dp.resolved == 1);
    assert (!internal.stats.dp.resolvents);
  }

  // A variable occurring in both phases of a binary clause pair gives a
  // tautological resolvent which is dropped.

  {
    Internal internal;
    internal.reserve (2);
    add (internal, { 1, 2 });
    add (internal, { -1, -2 });
    internal.opts.set ("algorithm", DP);
    assert (internal.solve () == 10);
    assert (internal.stats.dp.eliminated == 1);
    assert (internal.stats.dp.tautologies == 1);
    assert (!internal.stats.dp.resolvents);
  }

  // First decision 'TIE' fails by propagating 'SHIRT', the second one
  // succeeds after propagating 'SHIRT' again.

  {
    Internal internal;
    internal.reserve (2);
    add (internal, { -1, 2 });
    add (internal, { 1, 2 });
    add (internal, { -1, -2 });
    assert (internal.solve () == 10);
    assert (internal.stats.dpll.calls == 3);
    assert (internal.stats.dpll.decisions == 2);
    assert (internal.stats.dpll.propagations == 2);
    assert (internal.stats.dpll.conflicts == 1);
    assert (internal.stats.dpll.maxdepth == 1);
    assert (internal.has_model);
    assert (internal.model.val (-1) > 0);
    assert (internal.model.val (2) > 0);
    assert (internal.stats.solved == 1);
  }

  return 0;
}
