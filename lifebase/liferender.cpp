// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

#include "liferender.h"
#include <string>
liferender::~liferender() {}
const char *liferender::begin(const lifegrid &) {
   return 0 ;
}
void liferender::end(int, const lifegrid &) {}

const char *consolerender::render(int gen, const lifegrid &grid) {
   if (inplace)
      os << "\033[H\033[2J" ;   // cursor home, clear screen
   std::string line ;
   for (int row=0; row<grid.getheight(); row++) {
      line.clear() ;
      for (int col=0; col<grid.getwidth(); col++)
         line += grid.isalive(row, col) > 0 ? LIVE_GLYPH : DEAD_GLYPH ;
      os << line << '\n' ;
   }
   os << "Generation " << gen << ": population " << grid.getPopulation()
      << std::endl ;
   if (!os)
      return "Error writing to console" ;
   return 0 ;
}
