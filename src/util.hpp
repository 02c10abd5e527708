#ifndef _util_hpp_INCLUDED
#define _util_hpp_INCLUDED

namespace TriSAT {

using namespace std;

// Common simple utility functions independent from 'Internal'.

/*------------------------------------------------------------------------*/

inline double relative (double a, double b) { return b ? a / b : 0; }
inline double percent (double a, double b) { return relative (100 * a, b); }
inline int sign (int lit) { return (lit > 0) - (lit < 0); }

/*------------------------------------------------------------------------*/

bool parse_int_str (const char * str, int &);

/*------------------------------------------------------------------------*/

// Place literals over the same variable close to each other.  This is the
// canonical order of literals in flat clauses, e.g., '-1 2 -3 3 5'.

struct clause_lit_less_than {
  bool operator () (int a, int b) const {
    int s = abs (a), t = abs (b);
    return s < t || (s == t && a < b);
  }
};

/*------------------------------------------------------------------------*/

}

#endif
