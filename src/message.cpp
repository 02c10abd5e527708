#include "internal.hpp"

namespace TriSAT {

/*------------------------------------------------------------------------*/
#ifndef QUIET
/*------------------------------------------------------------------------*/

// Messages are 'c ' prefixed comment lines as in the DIMACS format and are
// only printed if 'opts.verbose' is large enough.  Enabling logging forces
// all of them.

bool Internal::verbosity (int level) const {
#ifdef LOGGING
  if (opts.log) return true;
#endif
  return opts.verbose >= level;
}

void Internal::print_prefix () { fputs (prefix.c_str (), stdout); }

void Internal::vmessage (const char * fmt, va_list & ap) {
  if (!verbosity (1)) return;
  print_prefix ();
  vprintf (fmt, ap);
  fputc ('\n', stdout);
  fflush (stdout);
}

void Internal::message (const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  vmessage (fmt, ap);
  va_end (ap);
}

void Internal::message () {
  if (!verbosity (1)) return;
  print_prefix ();
  fputc ('\n', stdout);
  fflush (stdout);
}

/*------------------------------------------------------------------------*/

void Internal::vverbose (int level, const char * fmt, va_list & ap) {
  if (!verbosity (level)) return;
  print_prefix ();
  vprintf (fmt, ap);
  fputc ('\n', stdout);
  fflush (stdout);
}

void Internal::verbose (int level, const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  vverbose (level, fmt, ap);
  va_end (ap);
}

/*------------------------------------------------------------------------*/

// Prints a section header of the form
//
//  c ---- [ <title> ] ---------------------
//
// nicely aligned.

void Internal::section (const char * title) {
  if (!verbosity (1)) return;
  char line[160];
  snprintf (line, sizeof line, "---- [ %s ] ", title);
  size_t i = strlen (line);
  while (i < 76) line[i++] = '-';
  line[i] = 0;
  if (stats.sections++) message ();
  message ("%s", line);
  message ();
}

/*------------------------------------------------------------------------*/
#endif // ifndef QUIET
/*------------------------------------------------------------------------*/

// Error messages and warnings are always printed (to 'stderr').

void Internal::error_message_start () {
  fflush (stdout);
  fputs ("trisat: error: ", stderr);
}

void Internal::error_message_end () {
  fputc ('\n', stderr);
  fflush (stderr);
}

void Internal::verror (const char * fmt, va_list & ap) {
  error_message_start ();
  vfprintf (stderr, fmt, ap);
  error_message_end ();
}

void Internal::error (const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  verror (fmt, ap);
  va_end (ap);
}

void Internal::vwarning (const char * fmt, va_list & ap) {
  fflush (stdout);
  fputs ("trisat: warning: ", stderr);
  vfprintf (stderr, fmt, ap);
  fputc ('\n', stderr);
  fflush (stderr);
}

void Internal::warning (const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  vwarning (fmt, ap);
  va_end (ap);
}

/*------------------------------------------------------------------------*/

// Fatal internal errors abort (used for inconsistent option tables and
// API contract violations).

void fatal_message_start () {
  fflush (stdout);
  fputs ("trisat: fatal error: ", stderr);
}

void fatal_message_end () {
  fputc ('\n', stderr);
  fflush (stderr);
  abort ();
}

void fatal (const char * fmt, ...) {
  fatal_message_start ();
  va_list ap;
  va_start (ap, fmt);
  vfprintf (stderr, fmt, ap);
  va_end (ap);
  fatal_message_end ();
}

}
