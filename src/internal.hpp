#ifndef _internal_hpp_INCLUDED
#define _internal_hpp_INCLUDED

/*------------------------------------------------------------------------*/

// Common 'C' headers.

#include <cassert>
#include <cctype>
#include <cinttypes>
#include <climits>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

/*------------------------------------------------------------------------*/

// Common 'C++' headers.

#include <algorithm>
#include <set>
#include <string>
#include <vector>

/*------------------------------------------------------------------------*/

// All internal headers are included here.  This gives a nice overview on
// what is needed altogether.  Implementation files then only need to
// include this header.  Unlike in the public header the order matters,
// since some of the headers use inline functions of earlier ones.

#include "trisat.hpp"
#include "util.hpp"
#include "clause.hpp"
#include "assignment.hpp"
#include "formula.hpp"
#include "cnf.hpp"
#include "file.hpp"
#include "format.hpp"
#include "logging.hpp"
#include "message.hpp"
#include "options.hpp"
#include "parse.hpp"
#include "resources.hpp"
#include "stats.hpp"

/*------------------------------------------------------------------------*/

namespace TriSAT {

using namespace std;

struct Internal {

  /*----------------------------------------------------------------------*/

  int max_var;                  // declared variables '1..max_var'
  Formula original;             // added or parsed clauses
  vector<int> clause;           // clause being added
  bool adding;                  // 'clause' not terminated by zero yet
  Assignment model;             // satisfying assignment found by 'dpll'
  bool has_model;               // 'model' valid
  int status;                   // '10' or '20' after 'solve' or zero
  int level;                    // recursion depth of 'dp' and 'dpll'
  Internal * internal;          // proxy to 'this' in macros
  Options opts;                 // run-time options
  Stats stats;                  // statistic counters
  Format error_message;         // provide persistent error message
  string prefix;                // verbose messages prefix

  Internal ();

  /*----------------------------------------------------------------------*/

  // Adding clauses in 'Solver::add' style and declaring variables.

  void reserve (int max_var);
  void add_original_lit (int lit);
  void reset_model ();

  // Parsing in 'parse.cpp' through 'File'.

  const char * read_dimacs (File *, bool strict);

  /*----------------------------------------------------------------------*/

  // Davis-Putnam variable elimination in 'dp.cpp'.

  int pick_elimination_variable (const CNF &);
  bool dp (const CNF &);
  int dp ();

  // Saturation by resolution in 'resolution.cpp'.

  bool resolution (const CNF &);
  int resolution ();

  // Davis-Putnam-Logemann-Loveland search in 'dpll.cpp'.

  bool propagate (Formula &, Assignment &);
  int pick_branching_variable (const Formula &, const Assignment &);
  bool dpll (const Formula &, Assignment &);
  int dpll ();

  // Running one or all algorithms in 'solve.cpp'.

  int solve ();
  int compare ();
  void check_model ();

  /*----------------------------------------------------------------------*/

  double process_time ();       // since solver was initialized
  double real_time ();          // since solver was initialized

  double time () {
    return opts.realtime ? real_time () : process_time ();
  }

  void print_statistics () { stats.print (this); }

  /*----------------------------------------------------------------------*/

#ifndef QUIET

  bool verbosity (int level) const;

  void print_prefix ();

  // Non-verbose messages, i.e., printed if 'opts.verbose' is positive.
  //
  void vmessage (const char *, va_list &);
  void message (const char *, ...) TRISAT_ATTRIBUTE_FORMAT (2, 3);
  void message ();                              // empty line

  // Verbose messages with explicit verbose 'level' controlled by
  // 'opts.verbose' (verbose level '1' gives the same as 'message').
  //
  void vverbose (int level, const char * fmt, va_list &);
  void verbose (int level, const char * fmt, ...)
                TRISAT_ATTRIBUTE_FORMAT (3, 4);

  // This is for printing section headers in the form
  //
  //  c ---- [ <title> ] ---------------------
  //
  void section (const char * title);

#endif

  // Print error messages which are really always printed.
  //
  void error_message_start ();
  void error_message_end ();
  void verror (const char *, va_list &);
  void error (const char *, ...) TRISAT_ATTRIBUTE_FORMAT (2, 3);

  // Warning messages.
  //
  void vwarning (const char *, va_list &);
  void warning (const char *, ...) TRISAT_ATTRIBUTE_FORMAT (2, 3);
};

// Fatal internal error which leads to abort.
//
void fatal_message_start ();
void fatal_message_end ();
void fatal (const char *, ...) TRISAT_ATTRIBUTE_FORMAT (1, 2);

}

#endif
