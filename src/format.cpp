#include "internal.hpp"

namespace TriSAT {

const char * Format::add (const char * fmt, va_list & ap) {
  const char * p = fmt;
  char ch, tmp[16];
  while ((ch = *p++)) {
    if (ch != '%') buffer.push_back (ch);
    else if (*p == 'c') buffer.push_back (va_arg (ap, int)), p++;
    else if (*p == 'd') {
      sprintf (tmp, "%d", va_arg (ap, int));
      buffer += tmp, p++;
    } else if (*p == 's') buffer += va_arg (ap, const char *), p++;
    else { buffer.push_back ('%'); buffer.push_back (*p); break; }
  }
  return buffer.c_str ();
}

const char * Format::init (const char * fmt, ...) {
  buffer.clear ();
  va_list ap;
  va_start (ap, fmt);
  const char * res = add (fmt, ap);
  va_end (ap);
  return res;
}

const char * Format::append (const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  const char * res = add (fmt, ap);
  va_end (ap);
  return res;
}

}
