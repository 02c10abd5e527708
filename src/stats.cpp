#include "internal.hpp"

namespace TriSAT {

/*------------------------------------------------------------------------*/

Stats::Stats () {
  memset (this, 0, sizeof *this);
  time.real = absolute_real_time ();
  time.process = absolute_process_time ();
}

/*------------------------------------------------------------------------*/

#define PRT(FMT,...) \
do { \
  if (FMT[0] == ' ' && !all) break; \
  MSG (FMT, __VA_ARGS__); \
} while (0)

/*------------------------------------------------------------------------*/

void Stats::print (Internal * internal) {

#ifdef QUIET
  (void) internal;
#else

  Stats & stats = internal->stats;

  const bool all = internal->verbosity (2);

  SECTION ("statistics");

  if (all || stats.dp.resolved) {
  PRT ("dp-eliminated:   %15" PRId64 "   %10.2f    per solve", stats.dp.eliminated, relative (stats.dp.eliminated, stats.solved));
  PRT ("  resolved:      %15" PRId64 "   %10.2f    per eliminated", stats.dp.resolved, relative (stats.dp.resolved, stats.dp.eliminated));
  PRT ("  resolvents:    %15" PRId64 "   %10.2f %%  of resolved", stats.dp.resolvents, percent (stats.dp.resolvents, stats.dp.resolved));
  PRT ("  tautologies:   %15" PRId64 "   %10.2f %%  of resolved", stats.dp.tautologies, percent (stats.dp.tautologies, stats.dp.resolved));
  PRT ("  maxclauses:    %15" PRId64 "   %10s    clauses", stats.dp.maxclauses, "");
  }
  if (all || stats.resolution.passes) {
  PRT ("res-passes:      %15" PRId64 "   %10.2f    per solve", stats.resolution.passes, relative (stats.resolution.passes, stats.solved));
  PRT ("  pairs:         %15" PRId64 "   %10.2f    per pass", stats.resolution.pairs, relative (stats.resolution.pairs, stats.resolution.passes));
  PRT ("  resolved:      %15" PRId64 "   %10.2f %%  of pairs", stats.resolution.resolved, percent (stats.resolution.resolved, stats.resolution.pairs));
  PRT ("  resolvents:    %15" PRId64 "   %10.2f %%  of resolved", stats.resolution.resolvents, percent (stats.resolution.resolvents, stats.resolution.resolved));
  PRT ("  known:         %15" PRId64 "   %10s    clauses", stats.resolution.known, "");
  }
  if (all || stats.dpll.calls) {
  PRT ("dpll-calls:      %15" PRId64 "   %10.2f    per solve", stats.dpll.calls, relative (stats.dpll.calls, stats.solved));
  PRT ("  decisions:     %15" PRId64 "   %10.2f    per call", stats.dpll.decisions, relative (stats.dpll.decisions, stats.dpll.calls));
  PRT ("  propagations:  %15" PRId64 "   %10.2f    per call", stats.dpll.propagations, relative (stats.dpll.propagations, stats.dpll.calls));
  PRT ("  conflicts:     %15" PRId64 "   %10.2f %%  of calls", stats.dpll.conflicts, percent (stats.dpll.conflicts, stats.dpll.calls));
  PRT ("  maxdepth:      %15" PRId64 "   %10s    levels", stats.dpll.maxdepth, "");
  }

  MSG ();
  MSG ("solving time:    %15.2f   %10.2f %%  %s time", stats.solving, percent (stats.solving, internal->time ()), internal->opts.realtime ? "real" : "process");
  MSG ("total time:      %15.2f   %10.2f MB  maximum resident set", internal->time (), maximum_resident_set_size () / (double) (1l << 20));

#endif // ifndef QUIET
}

}
