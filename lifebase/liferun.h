// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

/**
 *   One run of the program: the options the user picked, the checks
 *   that reject a bad run before anything is rendered, and the
 *   driver that seeds a grid and hands it to the engine.
 */
#ifndef LIFERUN_H
#define LIFERUN_H
#include "lifegrid.h"
#include "lifepoll.h"
#include <climits>
#include <iostream>

const int NO_ORIGIN = INT_MIN ;       // center the pattern
const char *const DEFAULT_PATTERN = "glider" ;

struct runoptions {
   runoptions() ;
   // at most one of these three pattern sources; none means DEFAULT_PATTERN
   const char *patname ;
   const char *patfile ;
   const char *celltext ;
   int width, height ;
   int generations ;
   int delay ;                  // milliseconds between generations
   const char *output ;         // "console" or "html"
   const char *htmlfile ;
   int originrow, origincol ;   // top left of the pattern, or NO_ORIGIN
   int inplace ;
   int quiet ;                  // compute without console output
} ;

/*
 *   Reject bad dimensions, counts, output modes and conflicting
 *   pattern sources.  Returns an error message or 0.
 */
const char *checkoptions(const runoptions &opts) ;

/*
 *   Fill grid (which must already have the requested size) with the
 *   selected pattern.  Fails if the pattern is unknown, can't be read,
 *   or doesn't fit.  The grid is left empty on error.
 */
const char *seedgrid(const runoptions &opts, lifegrid &grid) ;

/*
 *   HTML refresh period for a delay in milliseconds: whole seconds,
 *   rounded up, at least 1.
 */
int refreshseconds(int delay) ;

/*
 *   Check, seed and run to completion, rendering to os or to the HTML
 *   file.  Nothing is rendered unless all the checks pass.
 */
const char *runlife(const runoptions &opts, lifepoll *poller, std::ostream &os) ;

#endif
