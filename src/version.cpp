/*------------------------------------------------------------------------*/

// The version is passed on from the build system, e.g., through
// '-DVERSION="0.3.0"' and otherwise set to 'unknown'.

#ifndef VERSION
#define VERSION "unknown"
#endif

/*------------------------------------------------------------------------*/

#include "trisat.hpp"

namespace TriSAT {

static const char * SIGNATURE = "trisat-" VERSION;

const char * Solver::signature () { return SIGNATURE; }
const char * Solver::version () { return VERSION; }

}
