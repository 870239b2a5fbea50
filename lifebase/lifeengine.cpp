// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

#include "lifeengine.h"
#include "util.h"       // for lifesleep

const char *lifeengine::run(const lifegrid &initial, int generations,
                            liferender &renderer) {
   generation = 0 ;
   poller->resetInterrupted() ;
   const char *err = renderer.begin(initial) ;
   if (err)
      return err ;
   lifegrid current = initial ;
   err = renderer.render(0, current) ;
   if (err)
      return err ;
   while (generation < generations) {
      lifesleep(delay) ;
      if (poller->poll())
         break ;
      current = current.nextgeneration() ;
      generation++ ;
      err = renderer.render(generation, current) ;
      if (err)
         return err ;
   }
   renderer.end(generation, current) ;
   return 0 ;
}
