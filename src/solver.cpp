#include "internal.hpp"
#include "contract.hpp"

/*------------------------------------------------------------------------*/

namespace TriSAT {

/*------------------------------------------------------------------------*/

Solver::Solver () {
  internal = new Internal ();
}

Solver::~Solver () {
  REQUIRE_INITIALIZED ();
  delete internal;
}

/*------------------------------------------------------------------------*/

void Solver::reserve (int max_var) {
  REQUIRE_INITIALIZED ();
  REQUIRE (max_var >= 0, "negative number of variables '%d'", max_var);
  internal->reserve (max_var);
}

void Solver::add (int lit) {
  REQUIRE_INITIALIZED ();
  REQUIRE (lit != INT_MIN, "invalid literal '%d'", lit);
  REQUIRE (abs (lit) <= internal->max_var,
    "literal '%d' refers to undeclared variable (maximum variable '%d')",
    lit, internal->max_var);
  internal->add_original_lit (lit);
}

int Solver::solve () {
  REQUIRE_READY_STATE ();
  return internal->solve ();
}

int Solver::val (int lit) {
  REQUIRE_INITIALIZED ();
  REQUIRE_VALID_LIT (lit);
  REQUIRE (internal->status == SATISFIABLE && internal->has_model,
    "no satisfying assignment available");
  const int tmp = internal->model.val (lit);
  return tmp < 0 ? -lit : tmp > 0 ? lit : 0;
}

int Solver::status () const { return internal->status; }
bool Solver::has_model () const { return internal->has_model; }

/*------------------------------------------------------------------------*/

bool Solver::is_valid_option (const char * name) {
  return Options::has (name);
}

bool Solver::set (const char * name, int val) {
  REQUIRE_INITIALIZED ();
  return internal->opts.set (name, val);
}

bool Solver::set_long_option (const char * arg) {
  REQUIRE_INITIALIZED ();
  string name;
  int val;
  if (!Options::parse_long_option (arg, name, val)) return false;
  return set (name.c_str (), val);
}

int Solver::get (const char * name) {
  REQUIRE_INITIALIZED ();
  return internal->opts.get (name);
}

void Solver::usage () { Options::usage (); }

void Solver::options () {
  REQUIRE_INITIALIZED ();
  internal->opts.print ();
}

/*------------------------------------------------------------------------*/

int Solver::vars () {
  REQUIRE_INITIALIZED ();
  return internal->max_var;
}

int Solver::clauses () {
  REQUIRE_INITIALIZED ();
  return (int) internal->original.clauses.size ();
}

const char * Solver::read_dimacs (const char * path, int strict) {
  REQUIRE_READY_STATE ();
  REQUIRE (path, "zero path");
  File * file = File::read (internal, path);
  if (!file)
    return internal->error_message.init (
             "failed to read DIMACS file '%s'", path);
  if (strict < 0) strict = internal->opts.strict;
  const char * err = internal->read_dimacs (file, strict);
  delete file;
  return err;
}

const char *
Solver::read_dimacs (FILE * external_file, const char * name, int strict) {
  REQUIRE_READY_STATE ();
  REQUIRE (external_file, "zero file");
  REQUIRE (name, "zero name");
  File * file = File::read (internal, external_file, name);
  assert (file);
  if (strict < 0) strict = internal->opts.strict;
  const char * err = internal->read_dimacs (file, strict);
  delete file;
  return err;
}

/*------------------------------------------------------------------------*/

#ifndef QUIET

void Solver::section (const char * title) {
  REQUIRE_INITIALIZED ();
  internal->section (title);
}

void Solver::message (const char * fmt, ...) {
  REQUIRE_INITIALIZED ();
  va_list ap;
  va_start (ap, fmt);
  internal->vmessage (fmt, ap);
  va_end (ap);
}

void Solver::message () {
  REQUIRE_INITIALIZED ();
  internal->message ();
}

void Solver::verbose (int level, const char * fmt, ...) {
  REQUIRE_INITIALIZED ();
  va_list ap;
  va_start (ap, fmt);
  internal->vverbose (level, fmt, ap);
  va_end (ap);
}

#else

void Solver::section (const char *) { }
void Solver::message (const char *, ...) { }
void Solver::message () { }
void Solver::verbose (int, const char *, ...) { }

#endif

void Solver::error (const char * fmt, ...) {
  REQUIRE_INITIALIZED ();
  va_list ap;
  va_start (ap, fmt);
  internal->verror (fmt, ap);
  va_end (ap);
}

void Solver::warning (const char * fmt, ...) {
  REQUIRE_INITIALIZED ();
  va_list ap;
  va_start (ap, fmt);
  internal->vwarning (fmt, ap);
  va_end (ap);
}

void Solver::statistics () {
  REQUIRE_INITIALIZED ();
  internal->print_statistics ();
}

double Solver::time () {
  REQUIRE_INITIALIZED ();
  return internal->time ();
}

}
