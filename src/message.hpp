#ifndef _message_hpp_INCLUDED
#define _message_hpp_INCLUDED

/*------------------------------------------------------------------------*/

// Macros for compact message code.  They all assume that 'internal' is in
// scope, which inside 'Internal' is a proxy to 'this'.

#ifndef QUIET

#define MSG(...) internal->message (__VA_ARGS__)
#define VERBOSE(...) internal->verbose (__VA_ARGS__)
#define SECTION(...) internal->section (__VA_ARGS__)

#else

#define MSG(...) do { } while (0)
#define VERBOSE(...) do { } while (0)
#define SECTION(...) do { } while (0)

#endif

#define FATAL fatal

/*------------------------------------------------------------------------*/

#endif
