#include "internal.hpp"

/*------------------------------------------------------------------------*/

// Some more low-level 'C' headers.

extern "C" {
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
}

/*------------------------------------------------------------------------*/

namespace TriSAT {

/*------------------------------------------------------------------------*/

// Private constructor.

File::File (Internal * i, bool c, FILE * f, const char * n)
:
  internal (i),
  close_file (c), file (f),
  _name (n), _lineno (1), _bytes (0)
{
  assert (f), assert (n);
}

/*------------------------------------------------------------------------*/

bool File::exists (const char * path) {
  struct stat buf;
  if (stat (path, &buf)) return false;
  if (S_ISDIR (buf.st_mode)) return false;
  if (access (path, R_OK)) return false;
  return true;
}

size_t File::size (const char * path) {
  struct stat buf;
  if (stat (path, &buf)) return 0;
  return (size_t) buf.st_size;
}

/*------------------------------------------------------------------------*/

File * File::read (Internal * internal, FILE * f, const char * n) {
  return new File (internal, false, f, n);
}

File * File::read (Internal * internal, const char * path) {
  FILE * file = fopen (path, "r");
  if (!file) return 0;
  VERBOSE (2, "opened file to read '%s' of %zu bytes", path, size (path));
  return new File (internal, true, file, path);
}

/*------------------------------------------------------------------------*/

void File::close () {
  assert (file);
  if (close_file) {
    VERBOSE (2, "closing input file '%s' after reading %" PRIu64 " bytes",
      name (), _bytes);
    fclose (file);
  }
  file = 0;
}

File::~File () {
  if (file) close ();
}

}
