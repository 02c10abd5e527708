#include "internal.hpp"

namespace TriSAT {

/*------------------------------------------------------------------------*/

void Formula::add (const Clause & c) {
  clauses.push_back (c);
  for (const auto & lit : c) {
    const int idx = abs (lit);
    auto pos = lower_bound (symbols.begin (), symbols.end (), idx);
    if (pos == symbols.end () || *pos != idx) symbols.insert (pos, idx);
  }
}

bool Formula::inconsistent () const {
  for (const auto & c : clauses)
    if (c.empty ()) return true;
  return false;
}

/*------------------------------------------------------------------------*/

// Literals over unassigned symbols do not count.  Note that this makes the
// check work for partial assignments as produced by 'dpll' too.

bool Formula::satisfied (const Assignment & assignment) const {
  for (const auto & c : clauses) {
    bool satisfied = false;
    for (const auto & lit : c)
      if (assignment.val (lit) > 0) { satisfied = true; break; }
    if (!satisfied) return false;
  }
  return true;
}

const Clause * Formula::find_unit () const {
  for (const auto & c : clauses)
    if (c.unit ()) return &c;
  return 0;
}

/*------------------------------------------------------------------------*/

bool Formula::simplify (const Assignment & assignment, Formula & res) const
{
  res.clear ();
  vector<int> lits;
  for (const auto & c : clauses) {
    bool satisfied = false;
    lits.clear ();
    for (const auto & lit : c) {
      const int tmp = assignment.val (lit);
      if (tmp > 0) { satisfied = true; break; }
      if (!tmp) lits.push_back (lit);
    }
    if (satisfied) continue;
    if (lits.empty ()) return false;
    res.clauses.push_back (Clause (lits));
    for (const auto & lit : lits) res.symbols.push_back (abs (lit));
  }
  sort (res.symbols.begin (), res.symbols.end ());
  auto end = unique (res.symbols.begin (), res.symbols.end ());
  res.symbols.resize (end - res.symbols.begin ());
  return true;
}

// The symbols are recomputed since dropping satisfied clauses might remove
// other symbols too.  As above an empty clause is a contradiction.

bool Formula::simplify (int lit, Formula & res) const {
  assert (lit), assert (lit != INT_MIN);
  const int idx = abs (lit), s = sign (lit);
  res.clear ();
  vector<int> lits;
  for (const auto & c : clauses) {
    if (c.empty ()) return false;
    const int tmp = c.sign (idx);
    if (tmp == s) continue;
    if (!tmp) { res.clauses.push_back (c); continue; }
    if (c.unit ()) return false;
    lits.clear ();
    for (const auto & other : c)
      if (other != -lit) lits.push_back (other);
    res.clauses.push_back (Clause (lits));
  }
  for (const auto & c : res.clauses)
    for (const auto & other : c) res.symbols.push_back (abs (other));
  sort (res.symbols.begin (), res.symbols.end ());
  auto end = unique (res.symbols.begin (), res.symbols.end ());
  res.symbols.resize (end - res.symbols.begin ());
  return true;
}

}
