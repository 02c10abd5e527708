/*------------------------------------------------------------------------*/

// Do include 'internal.hpp' but try to minimize internal dependencies.

#include "internal.hpp"

/*------------------------------------------------------------------------*/

namespace TriSAT {

// A wrapper app which makes up the TriSAT stand alone solver.  It in
// essence only consists of the 'App::main' function.  It parses the
// command line, reads the DIMACS file, runs the selected algorithm and
// prints the verdict and the time spent solving.  Everything else is
// provided by the library interface in the class 'Solver' (defined in
// 'trisat.hpp').

class App {

  Solver * solver;

  // Printing.
  //
  void print_usage (bool all = false);
  void print_witness (FILE *);

  // Option handling.
  //
  bool set (const char *);
  bool set (const char *, int);
  int  get (const char *);

public:

  App () : solver (new Solver ()) { }
  ~App () { delete solver; }

  // Parse the arguments and run the solver.
  //
  int main (int argc, char ** argv);
};

/*------------------------------------------------------------------------*/

void App::print_usage (bool all) {
  printf (
"usage: trisat [ <option> ... ] <dimacs>\n"
"\n"
"where '<option>' is one of the following common options:\n"
"\n"
"  -h             print this short list of common options\n"
"  --help         print complete list of all options\n"
"  --version      print version\n"
"\n"
"  --dp           use Davis-Putnam variable elimination\n"
"  --resolution   use saturation by resolution\n"
"  --dpll         use DPLL search (default)\n"
"  --all          run all three and check that they agree\n"
"\n"
"  -n             do not print witness (default)\n"
"  -w             print witness of 'dpll' in 'v' lines\n"
#ifndef QUIET
"  -v             increase verbosity\n"
#endif
#ifdef LOGGING
"  -l             enable logging messages (same as '--log')\n"
#endif
  );

  if (all) {
    printf (
"\n"
"Or '<option>' is one of the following advanced internal options:\n"
"\n");
    Solver::usage ();
    fputs (
"\n"
"The internal options have their default value printed in brackets\n"
"after their description.  They can also be used in the form\n"
"'--<name>' which is equivalent to '--<name>=1' and in the form\n"
"'--no-<name>' which is equivalent to '--<name>=0'.  One can also\n"
"use 'true' instead of '1', 'false' instead of '0', as well as\n"
"numbers with positive exponent such as '1e3' instead of '1000'.\n",
      stdout);
  }

  fputs (
"\n"
"The input is read from '<dimacs>' assumed to be in DIMACS format.\n"
"The result is printed as 'Satisfiable' or 'Unsatisfiable' followed\n"
"by the time spent solving.\n",
    stdout);
}

/*------------------------------------------------------------------------*/

// Print the (possibly partial) assignment of 'dpll' in competition format
// with 'v' lines.  Unassigned variables are skipped.

void App::print_witness (FILE * file) {
  const int max_var = solver->vars ();
  int c = 0, i = 0, tmp;
  do {
    if (i == max_var) tmp = 0;
    else if (!(tmp = solver->val (++i))) continue;
    char str[20];
    snprintf (str, sizeof str, " %d", tmp);
    int l = strlen (str);
    if (!c) fputc ('v', file), c = 1;
    else if (c + l > 78) fputs ("\nv", file), c = 1;
    fputs (str, file);
    c += l;
  } while (tmp || i < max_var);
  fputc ('\n', file);
}

/*------------------------------------------------------------------------*/

// Wrapper around option setting.

int App::get (const char * o) { return solver->get (o); }
bool App::set (const char * o, int v) { return solver->set (o, v); }
bool App::set (const char * arg) { return solver->set_long_option (arg); }

/*------------------------------------------------------------------------*/

// Short-cut for errors to avoid a hard 'exit'.

#define APPERR(...) \
do { solver->error (__VA_ARGS__); } while (0)

/*------------------------------------------------------------------------*/

int App::main (int argc, char ** argv) {

  // Handle options which lead to immediate exit first.

  if (argc == 2) {
    const char * arg = argv[1];
    if (!strcmp (arg, "-h")) {
      print_usage ();
      return 0;
    } else if (!strcmp (arg, "--help")) {
      print_usage (true);
      return 0;
    } else if (!strcmp (arg, "--version")) {
      printf ("%s\n", Solver::version ());
      return 0;
    }
  }

  const char * input_path = 0;

  for (int i = 1; i < argc; i++) {
    const char * arg = argv[i];
    if (!strcmp (arg, "-h") ||
        !strcmp (arg, "--help") ||
        !strcmp (arg, "--version")) {
      APPERR ("can only use '%s' as single first option", arg);
      return 1;
    }
    else if (!strcmp (arg, "-n")) set ("witness", 0);
    else if (!strcmp (arg, "-w")) set ("witness", 1);
#ifndef QUIET
    else if (!strcmp (arg, "-v")) set ("verbose", get ("verbose") + 1);
#endif
#ifdef LOGGING
    else if (!strcmp (arg, "-l")) set ("log", 1);
#endif
    else if (!strcmp (arg, "--all")) set ("algorithm", ALL);
    else if (!strcmp (arg, "--dp")) set ("algorithm", DP);
    else if (!strcmp (arg, "--resolution")) set ("algorithm", RESOLUTION);
    else if (!strcmp (arg, "--dpll")) set ("algorithm", DPLL);
    else if (set (arg)) { /* nothing do be done */ }
    else if (arg[0] == '-' && arg[1]) {
      APPERR ("invalid option '%s' (try '-h')", arg);
      return 1;
    } else if (input_path) {
      fputs ("usage: trisat [ <option> ... ] <dimacs>\n", stderr);
      return 1;
    } else input_path = arg;
  }

  if (!input_path) {
    fputs ("usage: trisat [ <option> ... ] <dimacs>\n", stderr);
    return 1;
  }

  // Failing to read or parse the input is reported but it is not a usage
  // error and thus does not change the exit code.

  if (!File::exists (input_path)) {
    APPERR ("input file '%s' not found", input_path);
    return 0;
  }

  solver->section ("banner");
  solver->message ("TriSAT DP, Resolution and DPLL SAT Solver");
  solver->message ("Version %s (%s)",
    Solver::version (), Solver::signature ());

  solver->section ("parsing input");
  solver->message ("reading DIMACS file from '%s'", input_path);
  const char * err = solver->read_dimacs (input_path);
  if (err) {
    APPERR ("%s", err);
    return 0;
  }

  solver->section ("options");
  solver->options ();

  const double start = solver->time ();
  const int res = solver->solve ();
  const double solving = solver->time () - start;

  solver->section ("result");
  if (res == SATISFIABLE) {
    fputs ("Satisfiable\n", stdout);
    if (get ("witness")) {
      if (solver->has_model ()) print_witness (stdout);
      else solver->warning ("only 'dpll' produces a witness");
    }
  } else {
    assert (res == UNSATISFIABLE);
    fputs ("Unsatisfiable\n", stdout);
  }
  printf ("Time: %.4fs\n", solving);
  fflush (stdout);

  solver->statistics ();
  solver->message ("exit %d", res);

  return 0;
}

}

/*------------------------------------------------------------------------*/

// The actual app is allocated on the stack and then its 'main' function is
// called.

int main (int argc, char ** argv) {
  TriSAT::App app;
  return app.main (argc, argv);
}
