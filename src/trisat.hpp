#ifndef _trisat_hpp_INCLUDED
#define _trisat_hpp_INCLUDED

#include <cstdio>

/*------------------------------------------------------------------------*/

#if defined(__GNUC__) || defined(__clang__)
#define TRISAT_ATTRIBUTE_FORMAT(FORMAT_POSITION,VARIADIC_ARGUMENT_POSITION) \
  __attribute__ ((format (printf, FORMAT_POSITION, VARIADIC_ARGUMENT_POSITION)))
#else
#define TRISAT_ATTRIBUTE_FORMAT(FORMAT_POSITION,VARIADIC_ARGUMENT_POSITION) /**/
#endif

/*------------------------------------------------------------------------*/

namespace TriSAT {

/*========================================================================*/

// This provides the API of the TriSAT library, which is implemented in the
// class 'Solver' below.  The library decides satisfiability of formulas in
// conjunctive normal form with one of three classical procedures:
//
//   1 = Davis-Putnam variable elimination ('dp')
//   2 = saturation by resolution ('resolution')
//   3 = Davis-Putnam-Logemann-Loveland search ('dpll')
//
// selected with the option 'algorithm'.  With 'algorithm=0' all three are
// run and have to agree.  Only 'dpll' produces a satisfying assignment.
//
// Consider the following code (from 'test/api/example.cpp'):
//
//   TriSAT::Solver * solver = new TriSAT::Solver;
//
//   enum { TIE = 1, SHIRT = 2 };
//
//   solver->reserve (2);           // Declare 'x1' and 'x2'.
//
//   solver->add (-TIE), solver->add (SHIRT),  solver->add (0);
//   solver->add (TIE),  solver->add (SHIRT),  solver->add (0);
//   solver->add (-TIE), solver->add (-SHIRT), solver->add (0);
//
//   int res = solver->solve ();    // Solve instance with 'dpll'.
//   assert (res == 10);            // Check it is 'SATISFIABLE'.
//
//   res = solver->val (TIE);       // Obtain assignment of 'TIE'.
//   assert (res < 0);              // Check 'TIE' assigned to 'false'.
//
//   res = solver->val (SHIRT);     // Obtain assignment of 'SHIRT'.
//   assert (res > 0);              // Check 'SHIRT' assigned to 'true'.
//
//   delete solver;
//
// All literals have to be valid literals, i.e., 32-bit integers different
// from 'INT_MIN' over declared variables.  If any of these requirements is
// violated the solver aborts with an 'invalid API usage' message.

/*========================================================================*/

enum Status {
  UNKNOWN = 0,
  SATISFIABLE = 10,
  UNSATISFIABLE = 20,
};

enum Algorithm {
  ALL = 0,
  DP = 1,
  RESOLUTION = 2,
  DPLL = 3,
};

/*------------------------------------------------------------------------*/

struct Internal;

class Solver {

public:

  Solver ();
  ~Solver ();

  // Declare the variables '1' to 'max_var' similar to the 'p cnf' header
  // of a DIMACS file.  Can be called repeatedly to increase the number of
  // declared variables but never decreases it.
  //
  void reserve (int max_var);

  // Add valid literals to the current clause, which is terminated and
  // added to the formula by adding zero.  Adding a zero without literals
  // adds the empty clause.  If a variable is added twice to the same
  // clause the later literal overwrites the earlier one.  Adding a clause
  // resets a previously found satisfying assignment.
  //
  //   require (VALID)
  //   ensure (VALID)
  //
  void add (int lit);

  // Run the algorithm selected by the option 'algorithm' and return
  // '10' = SATISFIABLE or '20' = UNSATISFIABLE.
  //
  //   require (READY)
  //   ensure (SATISFIED | UNSATISFIED)
  //
  int solve ();

  // Get value of valid non-zero literal after 'dpll' found a satisfying
  // assignment, which might be partial.  Returns 'lit' if it is true,
  // '-lit' if false and zero if the variable is unassigned.
  //
  //   require (SATISFIED)
  //   ensure (SATISFIED)
  //
  int val (int lit);

  // Result of the last call to 'solve' (or zero).
  //
  int status () const;

  // Whether 'val' can be called, i.e., the last 'solve' was satisfiable
  // and produced an assignment (only 'dpll' does).
  //
  bool has_model () const;

  /*----------------------------------------------------------------------*/

  // Option handling.  See 'options.hpp' for the list of options.

  static bool is_valid_option (const char * name);

  // Explicit version of setting an option.  Values are clipped to the
  // range of the option.  Returns 'false' if there is no such option.
  //
  bool set (const char * name, int val);

  // Set option through long option argument '--<name>=<val>', '--<name>'
  // or '--no-<name>'.  Returns 'false' if parsing fails.
  //
  bool set_long_option (const char * arg);

  int get (const char * name);

  // Print usage information for long options.
  //
  static void usage ();

  // Print option values different from their default.
  //
  void options ();

  /*----------------------------------------------------------------------*/

  int vars ();          // number of declared variables
  int clauses ();       // number of added clauses

  // Read DIMACS formula from a file (or a 'FILE' with the given name).
  // Returns zero if successful and otherwise an error message (which
  // can not be read or a parse error).  After an error the formula is left
  // unchanged.  With 'strict' set the number of clauses in the header is
  // checked (default is the value of the option 'strict').
  //
  //   require (READY)
  //   ensure (UNKNOWN)
  //
  const char * read_dimacs (const char * path, int strict = -1);
  const char * read_dimacs (FILE * file, const char * name, int strict = -1);

  /*----------------------------------------------------------------------*/

  // Messages in the form of DIMACS comments 'c <message>' printed if the
  // option 'verbose' is positive.
  //
  void section (const char *);          // print section header
  void message (const char *, ...)      // ordinary message
    TRISAT_ATTRIBUTE_FORMAT (2, 3);
  void message ();                      // empty line

  void verbose (int level, const char *, ...)
    TRISAT_ATTRIBUTE_FORMAT (3, 4);

  // Always printed to '<stderr>'.
  //
  void error (const char *, ...) TRISAT_ATTRIBUTE_FORMAT (2, 3);
  void warning (const char *, ...) TRISAT_ATTRIBUTE_FORMAT (2, 3);

  void statistics ();                   // print statistics

  double time ();                       // time since creation

  static const char * signature ();     // name and version
  static const char * version ();

private:

  Internal * internal;                  // hidden internal solver

  // The solver is not copyable.
  //
  Solver (const Solver &);
  Solver & operator = (const Solver &);
};

}

#endif
