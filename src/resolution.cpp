#include "internal.hpp"

namespace TriSAT {

/*------------------------------------------------------------------------*/

// Saturation of the clause set under resolution.  In each pass all pairs
// of known clauses are resolved (on the first clashing literal only) and
// all new resolvents are collected.  If the empty clause is derived the
// formula is unsatisfiable.  If a pass does not produce any new clause the
// clause set is saturated and the formula is satisfiable.  This terminates
// since there are only finitely many clauses over the variables, but the
// 'known' clauses are never reduced (no subsumption, no eviction) and thus
// memory is the limiting resource.

bool Internal::resolution (const CNF & clauses) {

  // The clauses in 'known' are kept in the order in which they are first
  // derived, while 'seen' is used to check whether a clause is new.
  //
  CNF known;
  set<Literals> seen;

  for (const auto & c : clauses) {
    if (c.empty ()) {
      LOG (c, "found");
      return false;
    }
    if (seen.insert (c).second) known.push_back (c);
  }

  Literals resolvent;
  for (;;) {

    stats.resolution.passes++;
    level = stats.resolution.passes;

    const size_t size = known.size ();
    CNF added;

    for (size_t i = 0; i < size; i++)
      for (size_t j = i + 1; j < size; j++) {
        stats.resolution.pairs++;
        if (!resolve (known[i], known[j], resolvent)) continue;
        stats.resolution.resolved++;
        if (resolvent.empty ()) {
          LOG (resolvent, "resolved");
          stats.resolution.known = known.size () + added.size ();
          level = 0;
          return false;
        }
        if (!seen.insert (resolvent).second) continue;
        LOG (resolvent, "new resolvent");
        added.push_back (resolvent);
      }

    VERBOSE (2, "[resolution-%" PRId64 "] %zu new resolvents from %zu clauses",
      stats.resolution.passes, added.size (), size);

    if (added.empty ()) break;

    stats.resolution.resolvents += added.size ();
    known.insert (known.end (), added.begin (), added.end ());
  }

  level = 0;
  stats.resolution.known = known.size ();
  LOG ("saturated with %zu known clauses", known.size ());

  return true;
}

/*------------------------------------------------------------------------*/

int Internal::resolution () {
  SECTION ("resolution");
  const CNF clauses = flatten (original);
  MSG ("saturating %zu clauses over %zu variables",
    clauses.size (), original.symbols.size ());
  const int res = resolution (clauses) ? 10 : 20;
  MSG ("%" PRId64 " resolvents in %" PRId64 " passes",
    stats.resolution.resolvents, stats.resolution.passes);
  return res;
}

}
