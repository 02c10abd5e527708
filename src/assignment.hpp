#ifndef _assignment_hpp_INCLUDED
#define _assignment_hpp_INCLUDED

namespace TriSAT {

using namespace std;

// A partial truth assignment mapping symbols (variables) to a sign, which
// is '1' for true and '-1' for false.  Unassigned symbols map to '0'.
//
// Only the true literals are stored, sorted by variable.  Thus the size
// only depends on the number of assigned variables and not on their
// indices, which matters since 'dpll' copies the assignment at every
// branch and variable indices can be as large as 'INT_MAX'.

class Assignment {

  vector<int> lits;             // true literals sorted by variable

  struct var_less_than {
    bool operator () (int lit, int idx) const { return abs (lit) < idx; }
  };

  vector<int>::const_iterator find (int idx) const {
    return lower_bound (lits.begin (), lits.end (), idx, var_less_than ());
  }

public:

  // Assigned sign of variable 'idx' or zero.
  //
  int operator [] (int idx) const {
    assert (idx > 0);
    auto pos = find (idx);
    if (pos == lits.end () || abs (*pos) != idx) return 0;
    return TriSAT::sign (*pos);
  }

  // Value of a literal: '1' if true, '-1' if false, and '0' if unassigned.
  //
  int val (int lit) const {
    assert (lit), assert (lit != INT_MIN);
    const int tmp = (*this)[abs (lit)];
    return lit < 0 ? -tmp : tmp;
  }

  void assign (int idx, int sign) {
    assert (idx > 0);
    assert (sign == 1 || sign == -1);
    const size_t i = find (idx) - lits.cbegin ();
    const auto pos = lits.begin () + i;
    if (pos != lits.end () && abs (*pos) == idx) *pos = sign * idx;
    else lits.insert (pos, sign * idx);
  }

  // Make literal 'lit' true.
  //
  void assign (int lit) { assign (abs (lit), TriSAT::sign (lit)); }

  int size () const { return (int) lits.size (); }
  bool empty () const { return lits.empty (); }
};

}

#endif
