#include "internal.hpp"

namespace TriSAT {

/*------------------------------------------------------------------------*/

// Static option table shared by all solvers.  Its entries are written
// again by every 'Options' constructor (with the same values), since we
// can not rely on the initialization order of static objects.

Option Options::table [] = {
#define OPTION(N,V,L,H,D) \
  { #N, (int) V, (int) L, (int) H, D },
  OPTIONS
#undef OPTION
};

/*------------------------------------------------------------------------*/

// The table is sorted by name (checked in the constructor).

Option * Options::has (const char * name) {
  Option * begin = table, * end = table + number_of_options;
  while (begin < end) {
    Option * mid = begin + (end - begin)/2;
    const int cmp = strcmp (name, mid->name);
    if (!cmp) return mid;
    if (cmp < 0) end = mid;
    else begin = mid + 1;
  }
  return 0;
}

/*------------------------------------------------------------------------*/

bool Options::parse_option_value (const char * val_str, int & val) {
  return parse_int_str (val_str, val);
}

// Splits '--[no-]<name>[=<val>]' into name and value.  The negated form
// does not take a value.

bool Options::parse_long_option (const char * arg,
                                 string & name, int & val) {
  if (strncmp (arg, "--", 2)) return false;
  arg += 2;
  const bool negated = !strncmp (arg, "no-", 3);
  if (negated) arg += 3;
  const char * eq = strchr (arg, '=');
  if (eq) name.assign (arg, eq - arg);
  else name = arg;
  if (!has (name.c_str ())) return false;
  if (!eq) { val = !negated; return true; }
  if (negated) return false;
  return parse_option_value (eq + 1, val);
}

/*------------------------------------------------------------------------*/

// Sets all options to their default values and checks the table.  An
// inconsistent table is an internal error.

Options::Options (Internal * s) : internal (s)
{
  assert (number_of_options == sizeof Options::table / sizeof (Option));

  const char * prev = "";
  size_t i = 0;
# define OPTION(N,V,L,H,D) \
  do { \
    if ((L) > (V) || (V) > (H)) \
      FATAL ("default value '" #V "' of option '" #N "' " \
        "not in range '" #L ".." #H "' in 'options.hpp'"); \
    if (strcmp (prev, #N) >= 0)  \
      FATAL ("option '" #N "' not sorted after '%s' in 'options.hpp'", \
        prev); \
    N = (int)(V); \
    assert (&val (i) == &N); \
    table[i] = { #N, (int)(V), (int)(L), (int)(H), D }; \
    prev = #N; \
    i++; \
  } while (0);
  OPTIONS
# undef OPTION

  assert (i == number_of_options);
}

/*------------------------------------------------------------------------*/

void Options::set (Option * o, int new_val) {
  assert (o);
  int & val = o->val (this);
  if (new_val < o->lo) {
    LOG ("option '%s' value '%d' raised to minimum '%d'",
      o->name, new_val, o->lo);
    new_val = o->lo;
  } else if (new_val > o->hi) {
    LOG ("option '%s' value '%d' lowered to maximum '%d'",
      o->name, new_val, o->hi);
    new_val = o->hi;
  }
  if (val == new_val) return;
  LOG ("option '%s' changed from '%d' to '%d'", o->name, val, new_val);
  val = new_val;
}

bool Options::set (const char * name, int val) {
  Option * o = has (name);
  if (!o) return false;
  set (o, val);
  return true;
}

int Options::get (const char * name) {
  Option * o = has (name);
  return o ? o->val (this) : 0;
}

/*------------------------------------------------------------------------*/

// Prints options in command line form, all of them with 'verbose' larger
// than one and otherwise only those which differ from their default.

void Options::print () {
#ifndef QUIET
  const bool all = internal->verbosity (2);
  unsigned changed = 0;
  char buffer[80];
  for (size_t i = 0; i < number_of_options; i++) {
    const Option & o = table[i];
    const int v = val (i);
    if (v != o.def) changed++;
    else if (!all) continue;
    if (!o.lo && o.hi == 1)
      snprintf (buffer, sizeof buffer, "--%s=%s",
        o.name, v ? "true" : "false");
    else snprintf (buffer, sizeof buffer, "--%s=%d", o.name, v);
    MSG ("  %-30s (%s default '%d')", buffer,
      v == o.def ? "same as" : "different from", o.def);
  }
  if (!changed) MSG ("all options are set to their default value");
#endif
}

void Options::usage () {
  char buffer[80];
  for (size_t i = 0; i < number_of_options; i++) {
    const Option & o = table[i];
    if (!o.lo && o.hi == 1) {
      snprintf (buffer, sizeof buffer, "--%s=bool", o.name);
      printf ("  %-26s %s [%s]\n",
        buffer, o.description, o.def ? "true" : "false");
    } else {
      snprintf (buffer, sizeof buffer, "--%s=%d..%d", o.name, o.lo, o.hi);
      printf ("  %-26s %s [%d]\n", buffer, o.description, o.def);
    }
  }
}

}
