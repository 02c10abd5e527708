#include "internal.hpp"

/*------------------------------------------------------------------------*/

// Time and memory usage for messages and statistics.  This relies on
// POSIX 'clock_gettime' and 'getrusage' and thus is Unix only.

extern "C" {
#include <sys/resource.h>
#include <sys/time.h>
#include <time.h>
}

namespace TriSAT {

/*------------------------------------------------------------------------*/

// Wall clock time from a monotonic clock, which is only used for
// differences, i.e., the time since the solver was initialized.

double absolute_real_time () {
  struct timespec ts;
  if (clock_gettime (CLOCK_MONOTONIC, &ts)) return 0;
  return ts.tv_sec + 1e-9 * ts.tv_nsec;
}

// User plus system time of this process.

double absolute_process_time () {
  struct rusage u;
  if (getrusage (RUSAGE_SELF, &u)) return 0;
  double res = u.ru_utime.tv_sec + 1e-6 * u.ru_utime.tv_usec;
  res += u.ru_stime.tv_sec + 1e-6 * u.ru_stime.tv_usec;
  return res;
}

// On Linux 'ru_maxrss' is given in kilobytes.

uint64_t maximum_resident_set_size () {
  struct rusage u;
  if (getrusage (RUSAGE_SELF, &u)) return 0;
  return ((uint64_t) u.ru_maxrss) << 10;
}

/*------------------------------------------------------------------------*/

double Internal::real_time () {
  return absolute_real_time () - stats.time.real;
}

double Internal::process_time () {
  return absolute_process_time () - stats.time.process;
}

}
