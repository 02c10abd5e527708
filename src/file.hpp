#ifndef _file_hpp_INCLUDED
#define _file_hpp_INCLUDED

#include <cstdio>
#include <cassert>
#include <cstdlib>

/*------------------------------------------------------------------------*/
#ifndef NUNLOCKED
#define trisat_getc_unlocked getc_unlocked
#else
#define trisat_getc_unlocked getc
#endif
/*------------------------------------------------------------------------*/

namespace TriSAT {

// Wraps a 'C' file 'FILE' opened for reading with a name and keeps track
// of line numbers for parse error messages.

struct Internal;

class File {

  Internal * internal;
  bool close_file;      // need to close file (not for '<stdin>')
  FILE * file;
  string _name;
  uint64_t _lineno;
  uint64_t _bytes;

  File (Internal *, bool, FILE *, const char *);

public:

  static bool exists (const char * path);  // file exists and is readable?
  static size_t size (const char * path);  // file size in bytes

  // Read from existing file. Assume given name.
  //
  static File * read (Internal *, FILE * f, const char * name);

  // Open file from path name for reading.  Returns zero on failure.
  //
  static File * read (Internal *, const char * path);

  ~File ();

  // Using the 'unlocked' version here is way faster but not thread safe if
  // the same file is used by different threads, which on the other hand
  // currently is impossible.

  int get () {
    assert (file);
    int res = trisat_getc_unlocked (file);
    if (res == '\n') _lineno++;
    if (res != EOF) _bytes++;
    return res;
  }

  const char * name () const { return _name.c_str (); }
  uint64_t lineno () const { return _lineno; }

  void close ();
};

}

#endif
