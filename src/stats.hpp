#ifndef _stats_hpp_INCLUDED
#define _stats_hpp_INCLUDED

namespace TriSAT {

struct Internal;

struct Stats {

  int64_t sections;     // printed section headers
  int64_t solved;       // calls to 'solve'

  struct {
    int64_t eliminated; // eliminated variables
    int64_t resolved;   // resolved clause pairs
    int64_t resolvents; // kept non-tautological resolvents
    int64_t tautologies;// dropped tautological resolvents
    int64_t maxclauses; // maximum number of clauses in one step
  } dp;

  struct {
    int64_t passes;     // saturation passes
    int64_t pairs;      // tried clause pairs
    int64_t resolved;   // clashing pairs (resolvents computed)
    int64_t resolvents; // new resolvents added to 'known'
    int64_t known;      // final number of known clauses
  } resolution;

  struct {
    int64_t calls;      // recursive calls
    int64_t decisions;  // branching decisions
    int64_t propagations; // assigned units
    int64_t conflicts;  // failed branches
    int64_t maxdepth;   // maximum recursion depth
  } dpll;

  struct { double process, real; } time;       // at initialization
  double solving;                               // accumulated in 'solve'

  Stats ();

  void print (Internal *);
};

}

#endif
