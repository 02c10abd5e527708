#include "../../src/internal.hpp"
#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>
#include <iostream>

using namespace TriSAT;

// Parse the given DIMACS text and return the error message or zero.

static const char * parse (Internal & internal, const char * text,
                           Formula & formula, int & vars,
                           bool strict = false) {
  FILE * tmp = tmpfile ();
  assert (tmp);
  fputs (text, tmp);
  rewind (tmp);
  File * file = File::read (&internal, tmp, "<test>");
  Parser parser (&internal, file, strict);
  formula.clear ();
  const char * err = parser.parse_dimacs (formula, vars);
  delete file;
  fclose (tmp);
  if (err) cout << err << endl << flush;
  return err;
}

static void error (const char * text, const char * expected,
                   bool strict = false) {
  Internal internal;
  Formula formula;
  int vars;
  const char * err = parse (internal, text, formula, vars, strict);
  assert (err);
  assert (!strcmp (err, expected));
}

// Writing random clauses as DIMACS lines and parsing them again gives
// clauses with the same symbol to sign mapping.  Variables may repeat
// within a clause, in which case the last literal has to win on both
// sides.

static void round_trip (uint64_t seed) {
  uint64_t state = seed;
  auto pick = [&] (int l, int r) -> int {
    state = state * 6364136223846793005ull + 1442695040888963407ull;
    return l + (int) ((state >> 33) % (uint64_t) (r - l + 1));
  };
  const int vars = pick (1, 20);
  const int clauses = pick (1, 30);
  vector<Clause> expected;
  string text = "p cnf " + to_string (vars) + " " + to_string (clauses);
  text += "\n";
  for (int i = 0; i < clauses; i++) {
    vector<int> lits;
    const int size = pick (1, 6);
    for (int j = 0; j < size; j++) {
      const int idx = pick (1, vars);
      lits.push_back (pick (0, 1) ? idx : -idx);
    }
    for (const auto & lit : lits) text += to_string (lit) + " ";
    text += "0\n";
    expected.push_back (Clause (lits));
  }
  Internal internal;
  Formula formula;
  int parsed_vars;
  const char * err = parse (internal, text.c_str (), formula, parsed_vars,
                            true);
  assert (!err);
  assert (parsed_vars == vars);
  assert (formula.clauses.size () == expected.size ());
  for (size_t i = 0; i < expected.size (); i++) {
    assert (formula.clauses[i].equivalent (expected[i]));
    assert (formula.clauses[i].format () == expected[i].format ());
  }
}

int main () {

  for (uint64_t seed = 1; seed <= 100; seed++)
    round_trip (seed);

  {
    Internal internal;
    Formula formula;
    int vars;
    const char * err = parse (internal,
      "c comment line\n"
      "p cnf 12 4\n"
      "c another comment\n"
      "1 -2 0\n"
      "\n"
      "  10\t2 0\n"
      "0\n"
      "-10 0\n"
      "3 -3 0\n",
      formula, vars);
    assert (!err);
    assert (vars == 12);
    assert (formula.clauses.size () == 4);
    assert (formula.clauses[0].format () == "x1 -x2");
    assert (formula.clauses[1].format () == "x10 x2");
    assert (formula.clauses[2].format () == "-x10");
    assert (formula.clauses[3].format () == "-x3");
    const vector<int> symbols = { 1, 2, 3, 10 };
    assert (formula.symbols == symbols);
  }

  // Zero terminators are optional and a clause ends at the end of line.

  {
    Internal internal;
    Formula formula;
    int vars;
    const char * err = parse (internal, "p cnf 3 2\n1 2\n-3", formula, vars);
    assert (!err);
    assert (formula.clauses.size () == 2);
    assert (formula.clauses[1].format () == "-x3");
  }

  // An explicit '+' sign is allowed.

  {
    Internal internal;
    Formula formula;
    int vars;
    const char * err = parse (internal, "p cnf 3 1\n+1 -2 +3 0\n",
                              formula, vars);
    assert (!err);
    assert (formula.clauses.size () == 1);
    assert (formula.clauses[0].format () == "x1 -x2 x3");
  }

  // Variables up to 'INT_MAX' can be declared and used.

  {
    Internal internal;
    Formula formula;
    int vars;
    const char * err = parse (internal,
      "p cnf 2147483647 1\n-2147483647 1 0\n", formula, vars);
    assert (!err);
    assert (vars == INT_MAX);
    assert (formula.clauses[0].sign (INT_MAX) == -1);
    err = parse (internal, "p cnf 2147483648 0\n", formula, vars);
    assert (err);
    assert (!strcmp (err,
      "<test>:1: parse error: too large '<max-var>' in header"));
  }

  {
    Internal internal;
    Formula formula;
    int vars;
    const char * err = parse (internal, "p cnf 0 0\n", formula, vars);
    assert (!err);
    assert (!vars);
    assert (formula.empty ());
    err = parse (internal, "p cnf 2 1\n1 2 0\n", formula, vars, true);
    assert (!err);
  }

  error ("",
    "<test>:1: parse error: missing 'p cnf <vars> <clauses>' header");
  error ("c only a comment\n",
    "<test>:2: parse error: missing 'p cnf <vars> <clauses>' header");
  error ("1 2 0\np cnf 2 1\n",
    "<test>:1: parse error: literal 1 refers to an undefined variable");
  error ("p cnf 2 1\np cnf 2 1\n",
    "<test>:2: parse error: duplicated 'p cnf' header");
  error ("p cnf 2 1\n1 -3 0\n",
    "<test>:2: parse error: literal -3 refers to an undefined variable");
  error ("p cnf 2 1\n1 x 0\n",
    "<test>:2: parse error: expected digit or sign");
  error ("p cnf 2 1\n1 2a 0\n",
    "<test>:2: parse error: expected white space after '2'");
  error ("p cnf 2 1\n- 1 0\n",
    "<test>:2: parse error: expected digit after '-'");
  error ("p cnf 2 1\n1 +x 0\n",
    "<test>:2: parse error: expected digit after '+'");
  error ("p cnf 2 1\n99999999999 0\n",
    "<test>:2: parse error: literal too large");
  error ("p dnf 2 1\n",
    "<test>:1: parse error: expected 'c' after 'p '");
  error ("p cnf x 1\n",
    "<test>:1: parse error: expected digit after 'p cnf '");
  error ("p cnf 2\n",
    "<test>:1: parse error: expected space after 'p cnf 2'");
  error ("p cnf 2 1 0\n",
    "<test>:1: parse error: expected new-line after 'p cnf 2 1'");
  error ("p cnf 2 2\n1 2 0\n",
    "<test>:3: parse error: found 1 clauses but header specifies 2", true);

  return 0;
}
