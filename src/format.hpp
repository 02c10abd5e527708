#ifndef _format_hpp_INCLUDED
#define _format_hpp_INCLUDED

#include <cstdarg>

namespace TriSAT {

// This class provides a 'printf' style formatting utility used to capture
// and save error messages, in particular parse errors, which are returned
// as 'const char *' to the caller.  Only '%c', '%d', '%s' are supported.

class Format {
  string buffer;
  const char * add (const char * fmt, va_list &);
public:
  const char * init (const char * fmt, ...);
  const char * append (const char * fmt, ...);
  operator const char * () const {
    return buffer.empty () ? 0 : buffer.c_str ();
  }
};

}

#endif
