#include "internal.hpp"

namespace TriSAT {

/*------------------------------------------------------------------------*/

static bool contains (const Literals & c, int lit) {
  return binary_search (c.begin (), c.end (), lit, clause_lit_less_than ());
}

static void sort_and_flush (Literals & c) {
  sort (c.begin (), c.end (), clause_lit_less_than ());
  auto end = unique (c.begin (), c.end ());
  c.resize (end - c.begin ());
}

/*------------------------------------------------------------------------*/

CNF flatten (const Formula & formula) {
  CNF res;
  res.reserve (formula.clauses.size ());
  const auto & symbols = formula.symbols;
  for (const auto & c : formula.clauses) {
    Literals lits;
    for (const auto & lit : c) {
      auto pos = lower_bound (symbols.begin (), symbols.end (), abs (lit));
      assert (pos != symbols.end () && *pos == abs (lit));
      const int idx = 1 + (pos - symbols.begin ());
      lits.push_back (lit < 0 ? -idx : idx);
    }
    sort_and_flush (lits);
    res.push_back (lits);
  }
  return res;
}

/*------------------------------------------------------------------------*/

void resolve (const Literals & c, const Literals & d, int pivot,
              Literals & res) {
  assert (contains (c, pivot));
  assert (contains (d, -pivot));
  res.clear ();
  for (const auto & lit : c)
    if (lit != pivot) res.push_back (lit);
  for (const auto & lit : d)
    if (lit != -pivot) res.push_back (lit);
  sort_and_flush (res);
}

bool resolve (const Literals & c, const Literals & d, Literals & res) {
  for (const auto & lit : c)
    if (contains (d, -lit)) { resolve (c, d, lit, res); return true; }
  return false;
}

bool tautological (const Literals & c) {
  for (size_t i = 1; i < c.size (); i++)
    if (c[i - 1] == -c[i]) return true;
  return false;
}

}
