#ifndef _formula_hpp_INCLUDED
#define _formula_hpp_INCLUDED

namespace TriSAT {

using namespace std;

// A formula in conjunctive normal form.  The clauses are kept in insertion
// order, which determines which unit clause 'find_unit' returns.  The
// symbols are all variables occurring in at least one clause, sorted by
// their index, i.e., 'x1 < x2 < x10'.  This is the branching order used
// in 'dpll' and the enumeration order used for flattening.
//
// Formulas are treated as values.  Simplification produces a new formula
// and leaves the original untouched, which is what the recursive solvers
// rely on when they backtrack.

struct Formula {

  vector<Clause> clauses;
  vector<int> symbols;

  void add (const Clause &);
  void clear () { clauses.clear (); symbols.clear (); }

  bool empty () const { return clauses.empty (); }
  bool inconsistent () const;           // contains the empty clause

  // Check that every clause contains a literal assigned to true.
  //
  bool satisfied (const Assignment &) const;

  // First clause with exactly one symbol or zero if there is none.
  //
  const Clause * find_unit () const;

  // Remove clauses satisfied by the assignment and remove falsified
  // literals from the remaining clauses.  The result is written to 'res'.
  // Returns 'false' if a clause became empty, i.e., the assignment
  // falsifies the formula.  Then 'res' is not usable.
  //
  bool simplify (const Assignment &, Formula & res) const;

  // Same for assigning the single literal 'lit' to true, which is what
  // propagation and decisions in 'dpll' need.
  //
  bool simplify (int lit, Formula & res) const;
};

}

#endif
