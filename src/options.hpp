#ifndef _options_hpp_INCLUDED
#define _options_hpp_INCLUDED

/*------------------------------------------------------------------------*/

// In order to add a new option, simply add a new line below. Make sure that
// options are sorted correctly (with '!}sort -k 2' in 'vi').  Otherwise
// initializing the options will trigger an internal error.

#define OPTIONS \
\
/*      NAME         DEFAULT, LO, HI, USAGE */ \
\
OPTION( algorithm,         3,  0,  3, "0=all, 1=dp, 2=resolution, 3=dpll") \
OPTION( check,             1,  0,  1, "check satisfying assignments") \
LOGOPT( log,               0,  0,  1, "enable logging") \
OPTION( realtime,          1,  0,  1, "real instead of process time") \
OPTION( strict,            0,  0,  1, "check number of clauses in header") \
QUTOPT( verbose,           0,  0,  3, "more verbose messages") \
OPTION( witness,           0,  0,  1, "print satisfying assignment") \

// Note, keep an empty line right before this line because of the last '\'!
// Also keep those single spaces after 'OPTION(' for proper sorting.

/*------------------------------------------------------------------------*/

// Some of the 'OPTION' macros above should only be included if certain
// compile time options are enabled.  This has the effect, that for instance
// if 'LOGGING' is defined, and thus logging code is included, then also the
// 'log' option is defined.  Otherwise the 'log' option is not included.

#ifdef LOGGING
#define LOGOPT OPTION
#else
#define LOGOPT(...) /**/
#endif

#ifdef QUIET
#define QUTOPT(...) /**/
#else
#define QUTOPT OPTION
#endif

/*------------------------------------------------------------------------*/

namespace TriSAT {

struct Internal;
class Options;

struct Option {
  const char * name;
  int def, lo, hi;
  const char * description;
  int & val (Options *);
};

/*------------------------------------------------------------------------*/

// Produce a compile time constant for the number of options.

static const size_t number_of_options =
#define OPTION(N,V,L,H,D) 1 +
OPTIONS
#undef OPTION
+ 0;

/*------------------------------------------------------------------------*/

class Options {

  Internal * internal;

  void set (Option *, int val); // Force to [lo,hi] interval.

  friend struct Option;
  static Option table[];

  static bool parse_option_value (const char * val_str, int & val);

public:

  Options (Internal *);

  // Makes options directly accessible, e.g., for instance declares the
  // member 'int algorithm' here.  This gives fast access to option values
  // internally in the solver.
  //
private:
  int __start_of_options__;             // Used by 'val' below.
public:
# define OPTION(N,V,L,H,D) \
  int N;                                // Access option values by name.
  OPTIONS
# undef OPTION

  // We rely on '__start_of_options__' and that the options are allocated
  // directly after it, in the same order as in 'table'.
  //
  inline int & val (size_t idx) {
    assert (idx < number_of_options);
    return (&__start_of_options__ + 1)[idx];
  }

  // Binary search over the sorted option 'table' which is shared among
  // different solver instances.  Returns zero if there is no such option.
  //
  static Option * has (const char * name);

  bool set (const char * name, int);    // Explicit version.
  int  get (const char * name);         // Get current value.

  void print ();             // Print current values in command line form
  static void usage ();      // Print usage message for all options.

  // Parse long option argument
  //
  //   --<name>
  //   --<name>=<val>
  //   --no-<name>
  //
  // where '<val>' is '<int>', 'true', 'false' or an integer with positive
  // exponent such as '1e3'.  If parsing succeeds, 'true' is returned and
  // the string will be set to the name of the option.  Additionally the
  // parsed value is set (last argument).
  //
  static bool parse_long_option (const char *, string &, int &);
};

inline int & Option::val (Options * options) {
  assert (options);
  return options->val (this - Options::table);
}

}

#endif
