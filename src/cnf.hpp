#ifndef _cnf_hpp_INCLUDED
#define _cnf_hpp_INCLUDED

namespace TriSAT {

using namespace std;

// Flat clauses used by 'dp' and 'resolution'.  A flat clause is a vector
// of integer literals sorted with 'clause_lit_less_than' and without
// duplicates, which makes it usable as a set and as a key in 'set'.

typedef vector<int> Literals;
typedef vector<Literals> CNF;

// Variables are renumbered by enumerating the sorted symbols of the
// formula, i.e., the 'k'-th symbol becomes variable 'k'.  Thus the same
// symbol maps to the same integer in every clause.
//
CNF flatten (const Formula &);

// Resolve 'c' and 'd' on the first literal of 'c' (in sorted order) whose
// negation occurs in 'd'.  If there is no such clashing literal 'false' is
// returned.  Otherwise the resolvent is stored in 'res'.
//
bool resolve (const Literals & c, const Literals & d, Literals & res);

// Resolve 'c' and 'd' on the given pivot, where 'pivot' occurs in 'c' and
// its negation in 'd'.
//
void resolve (const Literals & c, const Literals & d, int pivot,
              Literals & res);

// Contains a literal and its negation.
//
bool tautological (const Literals &);

}

#endif
