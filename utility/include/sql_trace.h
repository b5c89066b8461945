#pragma once

/*
 * sql_trace.h
 *
 * Macros for tracing pager I/O and tree restructuring. Normally turned off.
 * Build with -DPAGEDB_TRACE (CMake option PAGEDB_ENABLE_TRACE) to have them
 * print to stderr.
 */

#include <cstdio>

#ifdef PAGEDB_TRACE
#define PAGEDB_TRACE1(X) fprintf(stderr, X)
#define PAGEDB_TRACE2(X, Y) fprintf(stderr, X, Y)
#define PAGEDB_TRACE3(X, Y, Z) fprintf(stderr, X, Y, Z)
#else
#define PAGEDB_TRACE1(X)
#define PAGEDB_TRACE2(X, Y)
#define PAGEDB_TRACE3(X, Y, Z)
#endif
