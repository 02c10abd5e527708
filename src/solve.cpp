#include "internal.hpp"

namespace TriSAT {

/*------------------------------------------------------------------------*/

Internal::Internal ()
:
  max_var (0),
  adding (false),
  has_model (false),
  status (0),
  level (0),
  internal (this),
  opts (this),
  prefix ("c ")
{
}

/*------------------------------------------------------------------------*/

void Internal::reserve (int new_max_var) {
  assert (new_max_var >= 0);
  if (new_max_var <= max_var) return;
  LOG ("declaring variables %d to %d", max_var + 1, new_max_var);
  max_var = new_max_var;
}

void Internal::reset_model () {
  if (!has_model) return;
  LOG ("resetting assignment");
  model = Assignment ();
  has_model = false;
}

// Literals are collected in 'clause' until the terminating zero is added.
// Only then 'Clause::add' merges literals over the same variable.

void Internal::add_original_lit (int lit) {
  assert (abs (lit) <= max_var);
  reset_model ();
  status = 0;
  if (lit) {
    clause.push_back (lit);
    adding = true;
    return;
  }
  const Clause c (clause);
  LOG (c, "adding original");
  original.add (c);
  clause.clear ();
  adding = false;
}

/*------------------------------------------------------------------------*/

// Parse into a separate formula first, which is simply dropped on a parse
// error.  Thus after a parse error the original formula is unchanged.

const char * Internal::read_dimacs (File * file, bool strict) {
  Formula formula;
  int vars;
  Parser parser (this, file, strict);
  const char * err = parser.parse_dimacs (formula, vars);
  if (err) return err;
  reset_model ();
  status = 0;
  reserve (vars);
  for (const auto & c : formula.clauses)
    original.add (c);
  return 0;
}

/*------------------------------------------------------------------------*/

void Internal::check_model () {
  assert (has_model);
  if (!original.satisfied (model))
    FATAL ("assignment does not satisfy all %zu original clauses",
      original.clauses.size ());
  VERBOSE (2, "checked that assignment of %d variables satisfies "
    "all %zu original clauses", model.size (), original.clauses.size ());
}

// Run all three algorithms and make sure they agree.  The assignment of
// the last one, 'dpll', is kept.

int Internal::compare () {
  const int a = dp ();
  const int b = resolution ();
  const int c = dpll ();
  if (a != b || b != c)
    FATAL ("algorithms disagree: 'dp' returns %d, "
      "'resolution' %d and 'dpll' %d", a, b, c);
  MSG ("all three algorithms agree");
  return c;
}

int Internal::solve () {
  assert (!adding);
  reset_model ();
  stats.solved++;
  const double start = time ();
  int res;
  switch (opts.algorithm) {
    case DP: res = dp (); break;
    case RESOLUTION: res = resolution (); break;
    case DPLL: res = dpll (); break;
    default:
      assert (opts.algorithm == ALL);
      res = compare ();
      break;
  }
  stats.solving += time () - start;
  if (has_model && opts.check) check_model ();
  status = res;
  return res;
}

}
