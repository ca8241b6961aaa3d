/**
 * @file constants.h
 * @brief Core constants for the latexerr library
 */

#ifndef LATEXERR_CONSTANTS_H
#define LATEXERR_CONSTANTS_H

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.0.0"
#endif

#ifdef LATEXERR_VERSION
#undef LATEXERR_VERSION
#endif
#define LATEXERR_VERSION PROJECT_VERSION

#define LATEXERR_FILE "latexerr.toml"
#define LATEXERR_LOG_EXTENSION ".log"

/* Column at which TeX hard-wraps its log output (max_print_line) */
#define LATEXERR_MAX_PRINT_LINE 79

/* How far past an error header a rule looks for the l.<N> context line */
#define LATEXERR_CONTEXT_LOOKAHEAD 8

/* How many box-content lines an under/overfull warning may carry */
#define LATEXERR_BOX_LOOKAHEAD 8

#ifdef _MSC_VER
#pragma warning(disable : 4996)
#endif

#endif
