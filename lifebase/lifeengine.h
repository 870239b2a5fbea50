// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

/**
 *   Drives a grid through a fixed number of generations and hands
 *   every generation to a renderer.  There is no convergence
 *   detection: a still life or oscillator runs to the end.
 */
#ifndef LIFEENGINE_H
#define LIFEENGINE_H
#include "lifegrid.h"
#include "liferender.h"
#include "lifepoll.h"

class lifeengine {
public:
   lifeengine() : poller(&default_poller), delay(0), generation(0) {}
   void setpoll(lifepoll *pollerarg) { poller = pollerarg ; }
   // pause between two generations, in milliseconds
   void setdelay(int millis) { delay = millis ; }
   int getdelay() const { return delay ; }
   /*
    *   Render generations 0 (the initial grid) through generations
    *   inclusive.  Returns an error message from the renderer or 0.
    *   If the poller interrupts the run, it stops after the current
    *   generation and still returns 0; see getGeneration().
    */
   const char *run(const lifegrid &initial, int generations,
                   liferender &renderer) ;
   // last generation rendered by the latest run
   int getGeneration() const { return generation ; }
   int wasInterrupted() { return poller->isInterrupted() ; }
private:
   lifepoll *poller ;
   int delay ;
   int generation ;
} ;
#endif
