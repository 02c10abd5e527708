#ifndef _clause_hpp_INCLUDED
#define _clause_hpp_INCLUDED

namespace TriSAT {

using namespace std;

// A clause records for each of its symbols (variables) the sign of the
// literal in which it occurs.  Literals are kept in the order in which
// their variables were first added.  Adding a literal over a variable which
// already occurs in the clause overwrites the recorded sign at the old
// position.  Thus adding 'x1' and then '-x1' yields the unit clause '-x1'
// and not a tautology.  The empty clause is the contradiction.

class Clause {

  vector<int> literals;

public:

  typedef vector<int>::const_iterator const_iterator;

  Clause () { }
  Clause (const vector<int> & lits) { for (const auto & lit : lits) add (lit); }

  void add (int lit);

  // Sign of the literal over 'idx' in this clause or zero if 'idx' does
  // not occur.
  //
  int sign (int idx) const;

  // Same symbol to sign mapping irrespective of the order.
  //
  bool equivalent (const Clause &) const;

  size_t size () const { return literals.size (); }
  bool empty () const { return literals.empty (); }
  bool unit () const { return literals.size () == 1; }

  int operator [] (size_t i) const { return literals[i]; }

  const_iterator begin () const { return literals.begin (); }
  const_iterator end () const { return literals.end (); }

  // Symbolic form, e.g., 'x1 -x2 x3' (the empty clause gives "").
  //
  string format () const;
};

}

#endif
