// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

/**
 *   The built-in pattern library: a fixed table of well-known
 *   patterns, looked up by name.  Coordinates come from the
 *   LifeWiki pattern pages.
 */
#ifndef PATTERNS_H
#define PATTERNS_H
#include "lifegrid.h"

struct lifepattern {
   const char *name ;
   const char *desc ;
   const char *rows ;   // row shorthand, eg. ".X/..X/XXX"
} ;

/*
 *   The table ends with an entry whose name is 0.
 */
extern const lifepattern builtinpatterns[] ;

struct patternalias {
   const char *alias ;
   const char *name ;   // entry in builtinpatterns
} ;
extern const patternalias patternaliases[] ;

/*
 *   Look up a pattern by its name or one of its aliases.
 */
const lifepattern *findpattern(const char *name) ;

/*
 *   All pattern names in table order.
 */
void patternnames(vector<const char *> &names) ;

/*
 *   Live cells of the named pattern relative to its top left corner.
 *   Returns an error message if the name is not registered.
 */
const char *patterncells(const char *name, vector<cellpos> &cells) ;

/*
 *   Size of the named pattern's bounding box.
 */
const char *patternextent(const char *name, int *wd, int *ht) ;

/*
 *   Translate relative cells by the origin and check they all land
 *   in a wd x ht grid.  A pattern that doesn't fit is rejected, never
 *   clipped; on error cells is left empty.
 */
const char *placecells(const vector<cellpos> &relcells,
                       int originrow, int origincol, int wd, int ht,
                       vector<cellpos> &cells) ;

/*
 *   The named pattern's cells translated by the given origin.
 *   Fails if the name is unknown or the pattern doesn't fit.
 */
const char *instantiate(const char *name, int originrow, int origincol,
                        int wd, int ht, vector<cellpos> &cells) ;

/*
 *   Origin that puts the relative cells in the middle of the grid.
 */
void centerorigin(const vector<cellpos> &relcells, int wd, int ht,
                  int *originrow, int *origincol) ;

#endif
