#include "internal.hpp"

namespace TriSAT {

/*------------------------------------------------------------------------*/

// Option values are '<int>', 'true', 'false' or integers with a single
// digit positive exponent like '1e3'.  Too large values are clipped to the
// 'int' range instead of failing.

bool parse_int_str (const char * str, int & res) {

  if (!strcmp (str, "true")) { res = 1; return true; }
  if (!strcmp (str, "false")) { res = 0; return true; }

  const char * p = str;
  const bool negative = (*p == '-');
  if (negative) p++;
  if (!isdigit (*p)) return false;

  const int64_t limit = negative ? - (int64_t) INT_MIN : INT_MAX;
  int64_t tmp = 0;

  while (isdigit (*p)) {
    tmp = 10 * tmp + (*p++ - '0');
    if (tmp > limit) tmp = limit;
  }

  if (*p == 'e') {
    p++;
    if (!isdigit (*p)) return false;
    int exponent = *p++ - '0';
    if (*p) return false;
    while (exponent-- && tmp < limit)
      if ((tmp *= 10) > limit) tmp = limit;
  } else if (*p) return false;

  res = negative ? (int) -tmp : (int) tmp;
  return true;
}

}
