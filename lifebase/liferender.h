// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

/**
 *   Encapsulate a class capable of displaying a life grid, one
 *   generation at a time.  The engine calls begin() once before
 *   generation 0, render() for every generation, and end() once
 *   after the last generation it rendered (also when the run was
 *   interrupted).
 *
 *   begin() and render() return an error message or 0; an error
 *   stops the run.
 */
#ifndef LIFERENDER_H
#define LIFERENDER_H
#include "lifegrid.h"
#include <iostream>

class liferender {
public:
   liferender() {}
   virtual ~liferender() ;
   virtual const char *begin(const lifegrid &grid) ;
   virtual const char *render(int gen, const lifegrid &grid) = 0 ;
   virtual void end(int lastgen, const lifegrid &grid) ;
} ;

/*
 *   This is a "renderer" that is just stubs, for performance testing.
 */
class nullrender : public liferender {
public:
   nullrender() {}
   virtual ~nullrender() {}
   virtual const char *render(int, const lifegrid &) { return 0 ; }
} ;

const char LIVE_GLYPH = 'X' ;
const char DEAD_GLYPH = '.' ;

/*
 *   Text output: one line of glyphs per grid row followed by a
 *   "Generation N: population P" line.  With inplace set, each
 *   generation clears the terminal first instead of appending.
 */
class consolerender : public liferender {
public:
   consolerender(std::ostream &osarg, int inplacearg = 0) :
                 os(osarg), inplace(inplacearg) {}
   virtual ~consolerender() {}
   virtual const char *render(int gen, const lifegrid &grid) ;
private:
   std::ostream &os ;
   int inplace ;
} ;
#endif
