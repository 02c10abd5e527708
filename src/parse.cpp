#include "internal.hpp"

/*------------------------------------------------------------------------*/

namespace TriSAT {

/*------------------------------------------------------------------------*/

// Parse error.

#define PER(...) \
do { \
  internal->error_message.init (\
    "%s:%d: parse error: ", \
    file->name (), (int) lineno); \
  return internal->error_message.append (__VA_ARGS__); \
} while (0)

/*------------------------------------------------------------------------*/

// Parsing utilities.

inline int Parser::parse_char () { return file->get (); }

static inline bool is_blank (int ch) {
  return ch == ' ' || ch == '\t' || ch == '\r';
}

// Return an non zero error string if a parse error occurred.

inline const char *
Parser::parse_string (const char * str, char prev) {
  for (const char * p = str; *p; p++)
    if (parse_char () == *p) prev = *p;
    else PER ("expected '%c' after '%c'", *p, prev);
  return 0;
}

inline const char *
Parser::parse_positive_int (int & ch, int & res, const char * name) {
  assert (isdigit (ch));
  res = ch - '0';
  while (isdigit (ch = parse_char ())) {
    int digit = ch - '0';
    if (INT_MAX/10 < res || INT_MAX - digit < 10*res)
      PER ("too large '%s' in header", name);
    res = 10*res + digit;
  }
  return 0;
}

// Literals are decimal integers with an optional '+' or '-' sign and are
// separated by white space.  The character following the literal is
// returned in 'ch'.

inline const char *
Parser::parse_lit (int & ch, int & lit) {
  int sign = 1;
  if (ch == '-' || ch == '+') {
    const char prev = ch;
    if (!isdigit (ch = parse_char ()))
      PER ("expected digit after '%c'", prev);
    if (prev == '-') sign = -1;
  } else if (!isdigit (ch)) PER ("expected digit or sign");
  lit = ch - '0';
  while (isdigit (ch = parse_char ())) {
    int digit = ch - '0';
    if (INT_MAX/10 < lit || INT_MAX - digit < 10*lit)
      PER ("literal too large");
    lit = 10*lit + digit;
  }
  if (!is_blank (ch) && ch != '\n' && ch != EOF)
    PER ("expected white space after '%d'", sign*lit);
  lit *= sign;
  return 0;
}

/*------------------------------------------------------------------------*/

// Parse the rest of the 'p cnf <vars> <clauses>' header after the 'p'.

const char * Parser::parse_header (int & ch, int & vars, int & clauses) {
  ch = parse_char ();
  if (!is_blank (ch)) PER ("expected space after 'p'");
  do ch = parse_char (); while (is_blank (ch));
  if (ch != 'c') PER ("expected 'c' after 'p '");
  const char * err = parse_string ("nf", 'c');
  if (err) return err;
  ch = parse_char ();
  if (!is_blank (ch)) PER ("expected space after 'p cnf'");
  do ch = parse_char (); while (is_blank (ch));
  if (!isdigit (ch)) PER ("expected digit after 'p cnf '");
  err = parse_positive_int (ch, vars, "<max-var>");
  if (err) return err;
  if (!is_blank (ch)) PER ("expected space after 'p cnf %d'", vars);
  do ch = parse_char (); while (is_blank (ch));
  if (!isdigit (ch)) PER ("expected digit after 'p cnf %d '", vars);
  err = parse_positive_int (ch, clauses, "<num-clauses>");
  if (err) return err;
  while (is_blank (ch)) ch = parse_char ();
  if (ch != '\n' && ch != EOF)
    PER ("expected new-line after 'p cnf %d %d'", vars, clauses);
  return 0;
}

/*------------------------------------------------------------------------*/

// Parsing CNF in DIMACS format.

const char *
Parser::parse_dimacs_non_timed (Formula & formula, int & vars) {

  int ch, clauses = 0, parsed = 0;
  bool header = false;
  vector<int> lits;
  vars = 0;

  for (;;) {

    lineno = file->lineno ();
    do ch = parse_char (); while (is_blank (ch));
    if (ch == EOF) break;
    if (ch == '\n') continue;

    if (ch == 'c') {
      while ((ch = parse_char ()) != '\n' && ch != EOF)
        ;
      if (ch == EOF) break;
      continue;
    }

    if (ch == 'p') {
      if (header) PER ("duplicated 'p cnf' header");
      const char * err = parse_header (ch, vars, clauses);
      if (err) return err;
      header = true;
      MSG ("found 'p cnf %d %d' header", vars, clauses);
      if (ch == EOF) break;
      continue;
    }

    // Otherwise the line is a clause.
    //
    lits.clear ();
    while (ch != '\n' && ch != EOF) {
      if (is_blank (ch)) { ch = parse_char (); continue; }
      int lit;
      const char * err = parse_lit (ch, lit);
      if (err) return err;
      if (!lit) continue;
      if (abs (lit) > vars)
        PER ("literal %d refers to an undefined variable", lit);
      lits.push_back (lit);
    }
    if (!lits.empty ()) {
      Clause c (lits);
      LOG (c, "parsed");
      formula.add (c);
      parsed++;
    }
    if (ch == EOF) break;
  }

  if (!header) PER ("missing 'p cnf <vars> <clauses>' header");
  if (strict && parsed != clauses)
    PER ("found %d clauses but header specifies %d", parsed, clauses);

  VERBOSE (2, "found %d symbols in clauses out of %d declared variables",
    (int) formula.symbols.size (), vars);

  return 0;
}

/*------------------------------------------------------------------------*/

// Wrapper to time parsing and at the same time use the convenient
// implicit 'return' in PER in the non-timed version.

const char * Parser::parse_dimacs (Formula & formula, int & vars) {
#ifndef QUIET
  const double start = internal->time ();
#endif
  const char * err = parse_dimacs_non_timed (formula, vars);
#ifndef QUIET
  if (!err)
    MSG ("parsed %d clauses in %.2f seconds %s time",
      (int) formula.clauses.size (), internal->time () - start,
      internal->opts.realtime ? "real" : "process");
#endif
  return err;
}

}
