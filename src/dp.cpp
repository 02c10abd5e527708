#include "internal.hpp"

namespace TriSAT {

/*------------------------------------------------------------------------*/

// The original Davis-Putnam procedure eliminates one variable after the
// other by replacing all clauses containing it by all their resolvents on
// that variable.  The formula is satisfiable if and only if no step
// produces the empty clause.  The number of clauses can grow exponentially
// and nothing is done against it (no subsumption, no memoization), except
// that tautological resolvents are dropped.  Those are always satisfied and
// keeping them would bring back the eliminated variable.
//
// Each recursive call works on its own copy of the clauses and thus the
// recursion depth is bounded by the number of variables.

/*------------------------------------------------------------------------*/

// We always eliminate the smallest variable, which is deterministic but
// otherwise arbitrary (no elimination scheduling heuristics).

int Internal::pick_elimination_variable (const CNF & clauses) {
  int res = 0;
  for (const auto & c : clauses)
    for (const auto & lit : c) {
      const int idx = abs (lit);
      if (!res || idx < res) res = idx;
    }
  return res;
}

/*------------------------------------------------------------------------*/

bool Internal::dp (const CNF & clauses) {

  for (const auto & c : clauses)
    if (c.empty ()) {
      LOG (c, "found");
      return false;
    }

  if (clauses.empty ()) {
    LOG ("no clauses left");
    return true;
  }

  if ((int64_t) clauses.size () > stats.dp.maxclauses)
    stats.dp.maxclauses = clauses.size ();

  const int pivot = pick_elimination_variable (clauses);
  assert (pivot > 0);

  CNF pos, neg, rest;
  for (const auto & c : clauses) {
    const bool positive = binary_search (c.begin (), c.end (), pivot,
                                         clause_lit_less_than ());
    const bool negative = binary_search (c.begin (), c.end (), -pivot,
                                         clause_lit_less_than ());
    assert (!positive || !negative);
    if (positive) pos.push_back (c);
    else if (negative) neg.push_back (c);
    else rest.push_back (c);
  }

  LOG ("eliminating %d occurring %zu times positively "
       "and %zu times negatively in %zu clauses",
       pivot, pos.size (), neg.size (), clauses.size ());
  VERBOSE (3, "[dp-%d] eliminating variable %d with %zu x %zu resolutions",
    level, pivot, pos.size (), neg.size ());

  stats.dp.eliminated++;

  Literals resolvent;
  for (const auto & c : pos)
    for (const auto & d : neg) {
      stats.dp.resolved++;
      resolve (c, d, pivot, resolvent);
      if (resolvent.empty ()) {
        LOG (resolvent, "resolved");
        return false;
      }
      if (tautological (resolvent)) {
        stats.dp.tautologies++;
        continue;
      }
      LOG (resolvent, "resolvent");
      stats.dp.resolvents++;
      rest.push_back (resolvent);
    }

  level++;
  const bool res = dp (rest);
  level--;

  return res;
}

/*------------------------------------------------------------------------*/

int Internal::dp () {
  SECTION ("davis putnam");
  const CNF clauses = flatten (original);
  MSG ("eliminating %zu variables in %zu clauses",
    original.symbols.size (), clauses.size ());
  const int res = dp (clauses) ? 10 : 20;
  MSG ("eliminated %" PRId64 " variables with %" PRId64 " resolvents",
    stats.dp.eliminated, stats.dp.resolvents);
  return res;
}

}
