#ifndef _logging_hpp_INCLUDED
#define _logging_hpp_INCLUDED

/*------------------------------------------------------------------------*/
#ifdef LOGGING
/*------------------------------------------------------------------------*/

namespace TriSAT {

// For debugging purposes and to help understanding what the solvers are
// doing there is a logging facility which is compiled in by configuring
// with '-DTRISAT_LOGGING=ON'.  It still has to be enabled at run-time
// though (using '-l' or '--log' in the stand alone solver).  Every line
// shows the current recursion depth of 'dp' and 'dpll' (and the pass
// number for 'resolution').

using namespace std;

class Clause;
struct Internal;

struct Logger {

  static void print_log_prefix (Internal *);

  // Simple logging of a C-style format string.
  //
  static void log (Internal *, const char * fmt, ...)
    TRISAT_ATTRIBUTE_FORMAT (2, 3);

  // Prints the format string (with its arguments) and then the clause in
  // symbolic form.
  //
  static void log (Internal *, const Clause &, const char * fmt, ...)
    TRISAT_ATTRIBUTE_FORMAT (3, 4);

  // Same for flat clauses of 'dp' and 'resolution'.
  //
  static void log (Internal *, const vector<int> &, const char * fmt, ...)
    TRISAT_ATTRIBUTE_FORMAT (3, 4);
};

}

/*------------------------------------------------------------------------*/

// Make sure that 'logging' code is really not included (second case of the
// '#ifdef') if logging code is not included.

#define LOG(...) \
do { \
  if (!internal->opts.log) break; \
  Logger::log (internal, __VA_ARGS__); \
} while (0)

/*------------------------------------------------------------------------*/
#else // ifdef LOGGING
/*------------------------------------------------------------------------*/

#define LOG(...) do { } while (0)

/*------------------------------------------------------------------------*/
#endif // ifdef LOGGING
/*------------------------------------------------------------------------*/

#endif
