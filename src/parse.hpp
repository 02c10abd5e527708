#ifndef _parse_hpp_INCLUDED
#define _parse_hpp_INCLUDED

namespace TriSAT {

// Line oriented parser of CNF in DIMACS format.  Comment lines start with
// 'c', there has to be exactly one 'p cnf <vars> <clauses>' header and every
// other non-empty line is one clause of white space separated literals.
// The '0' literals are dropped and thus a line with only '0' does not add a
// clause.  The header declares the variables '1' to '<vars>' and literals
// over other variables are rejected.  The number of clauses in the header
// is only checked if 'strict' is set.

class File;
struct Formula;
struct Internal;

class Parser {

  Internal * internal;
  File * file;
  bool strict;
  uint64_t lineno;      // line of the last parsed token

  int parse_char ();

  const char * parse_string (const char * str, char prev);
  const char * parse_positive_int (int & ch, int & res, const char * name);
  const char * parse_lit (int & ch, int & lit);
  const char * parse_header (int & ch, int & vars, int & clauses);
  const char * parse_dimacs_non_timed (Formula &, int & vars);

public:

  Parser (Internal * i, File * f, bool s) :
    internal (i), file (f), strict (s), lineno (1)
  { }

  // Parse a DIMACS file.  Return zero if successful.  Otherwise a string
  // is returned describing the parse error.  The parsed clauses are added
  // to the given formula which is not usable after a parse error.
  //
  const char * parse_dimacs (Formula &, int & vars);
};

}

#endif
