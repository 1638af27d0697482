#ifndef _LOX_H_
#define _LOX_H_

// The full name of the scanner front end.
#define LOX_NAME "lox"

// The current lox version string.
#define LOX_VERSION "0.1.0"

/* -------------------------------------------------------------------------- */

// Exit status for command-line usage errors.
#define LOX_EXIT_USAGE 64

// Exit status for source text containing lexical errors.
#define LOX_EXIT_DATAERR 65

// Exit status for a script file which could not be read.
#define LOX_EXIT_NOINPUT 66

// Exit status for a file which could not be written.
#define LOX_EXIT_IOERR 74

#endif
