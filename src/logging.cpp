#ifdef LOGGING

#include "internal.hpp"

namespace TriSAT {

void Logger::print_log_prefix (Internal * internal) {
  fputs (internal->prefix.c_str (), stdout);
  printf ("LOG %d ", internal->level);
}

void Logger::log (Internal * internal, const char * fmt, ...) {
  print_log_prefix (internal);
  va_list ap;
  va_start (ap, fmt);
  vprintf (fmt, ap);
  va_end (ap);
  fputc ('\n', stdout);
  fflush (stdout);
}

void Logger::log (Internal * internal, const Clause & c,
                  const char * fmt, ...) {
  print_log_prefix (internal);
  va_list ap;
  va_start (ap, fmt);
  vprintf (fmt, ap);
  va_end (ap);
  if (c.empty ()) fputs (" empty clause", stdout);
  else printf (" size %d clause %s", (int) c.size (), c.format ().c_str ());
  fputc ('\n', stdout);
  fflush (stdout);
}

void Logger::log (Internal * internal, const vector<int> & c,
                  const char * fmt, ...) {
  print_log_prefix (internal);
  va_list ap;
  va_start (ap, fmt);
  vprintf (fmt, ap);
  va_end (ap);
  if (c.empty ()) fputs (" empty clause", stdout);
  else {
    printf (" size %d clause", (int) c.size ());
    for (const auto & lit : c)
      printf (" %d", lit);
  }
  fputc ('\n', stdout);
  fflush (stdout);
}

}

#endif
