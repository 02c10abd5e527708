#include "internal.hpp"

namespace TriSAT {

/*------------------------------------------------------------------------*/

// Classical recursive DPLL without clause learning, restarts or decision
// heuristics.  Each call first propagates unit clauses until there are
// none left, then branches on the first unassigned symbol of the formula
// in the order of the sorted symbols, trying 'true' before 'false'.
//
//   PROPAGATE -> CONFLICT | ALL-SATISFIED | BRANCH
//   BRANCH -> TRY-TRUE -> SUCCESS | TRY-FALSE -> SUCCESS | FAIL
//
// Formulas and assignments are values.  Every branch works on its own
// simplified copy of the formula and its own copy of the assignment, so
// nothing has to be undone when backtracking.  Conflicts are not errors
// but just make the current call return 'false'.

/*------------------------------------------------------------------------*/

// Assign and simplify unit clauses until there are none left.  Returns
// 'false' on a conflict, i.e., if a unit is already assigned the other way
// or simplification produces an empty clause.

bool Internal::propagate (Formula & formula, Assignment & assignment) {
  const Clause * unit;
  while ((unit = formula.find_unit ())) {
    const int lit = (*unit)[0];
    stats.dpll.propagations++;
    if (assignment.val (lit) < 0) {
      LOG (*unit, "conflicting");
      return false;
    }
    LOG (*unit, "propagating");
    assignment.assign (lit);
    Formula simplified;
    if (!formula.simplify (lit, simplified)) {
      LOG ("propagating %d falsifies a clause", lit);
      return false;
    }
    swap (formula, simplified);
    if (formula.empty ()) break;
  }
  return true;
}

// The first symbol in the sorted list which is not assigned yet.  Since
// simplification removes all assigned symbols this is usually just the
// first symbol of the formula.

int Internal::pick_branching_variable (const Formula & formula,
                                       const Assignment & assignment) {
  for (const auto & idx : formula.symbols)
    if (!assignment[idx]) return idx;
  return 0;
}

/*------------------------------------------------------------------------*/

bool Internal::dpll (const Formula & formula, Assignment & assignment) {

  stats.dpll.calls++;
  if (level > stats.dpll.maxdepth) stats.dpll.maxdepth = level;

  if (formula.inconsistent ()) {
    LOG ("formula contains the empty clause");
    stats.dpll.conflicts++;
    return false;
  }

  Formula simplified = formula;
  if (!propagate (simplified, assignment)) {
    stats.dpll.conflicts++;
    return false;
  }

  if (simplified.empty ()) {
    LOG ("all clauses satisfied with %d assigned variables",
      assignment.size ());
    return true;
  }

  const int idx = pick_branching_variable (simplified, assignment);
  assert (idx);
  if (!idx) return true;

  for (int sign = 1; sign >= -1; sign -= 2) {

    const int decision = sign * idx;
    stats.dpll.decisions++;
    LOG ("deciding %d with %zu remaining clauses",
      decision, simplified.clauses.size ());

    Assignment branch = assignment;
    branch.assign (decision);

    Formula reduced;
    if (!simplified.simplify (decision, reduced)) {
      LOG ("decision %d falsifies a clause", decision);
      stats.dpll.conflicts++;
      continue;
    }

    level++;
    const bool res = dpll (reduced, branch);
    level--;

    if (res) {
      assignment = branch;
      return true;
    }
  }

  LOG ("both branches on %d failed", idx);

  return false;
}

/*------------------------------------------------------------------------*/

int Internal::dpll () {
  SECTION ("dpll");
  MSG ("searching over %zu symbols in %zu clauses",
    original.symbols.size (), original.clauses.size ());
  Assignment assignment;
  level = 0;
  if (!dpll (original, assignment)) {
    MSG ("exhausted search after %" PRId64 " decisions",
      stats.dpll.decisions);
    return 20;
  }
  MSG ("found assignment of %d variables after %" PRId64 " decisions",
    assignment.size (), stats.dpll.decisions);
  model = assignment;
  has_model = true;
  return 10;
}

}
