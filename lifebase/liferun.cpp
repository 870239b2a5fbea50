// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

#include "liferun.h"
#include "patterns.h"
#include "readpattern.h"
#include "liferender.h"
#include "htmlrender.h"
#include "lifeengine.h"
#include <cstring>
#include <cstdio>

runoptions::runoptions() :
   patname(0), patfile(0), celltext(0),
   width(25), height(25), generations(60), delay(1000),
   output("console"), htmlfile(DEFAULT_HTML_FILE),
   originrow(NO_ORIGIN), origincol(NO_ORIGIN), inplace(0), quiet(0) {}

static int ishtml(const runoptions &opts) {
   return strcmp(opts.output, "html") == 0 ;
}

const char *checkoptions(const runoptions &opts) {
   static char size_err_str[128] ;
   if (opts.width <= 0 || opts.height <= 0)
      return "Grid width and height must be positive" ;
   if (opts.width > MAX_GRID_SIZE || opts.height > MAX_GRID_SIZE) {
      snprintf(size_err_str, sizeof(size_err_str),
               "Grid width and height must not exceed %d", MAX_GRID_SIZE) ;
      return size_err_str ;
   }
   if (opts.generations < 0)
      return "Generation count must not be negative" ;
   if (opts.delay < 0)
      return "Delay must not be negative" ;
   if (opts.output == 0 ||
       (strcmp(opts.output, "console") != 0 && !ishtml(opts)))
      return "Output must be console or html" ;
   if (ishtml(opts) && (opts.htmlfile == 0 || opts.htmlfile[0] == 0))
      return "HTML file name must not be empty" ;
   int sources = (opts.patname != 0) + (opts.patfile != 0) +
                 (opts.celltext != 0) ;
   if (sources > 1)
      return "Give only one of pattern name, pattern file or cells" ;
   return 0 ;
}

const char *seedgrid(const runoptions &opts, lifegrid &grid) {
   vector<cellpos> relcells ;
   const char *err ;
   grid.clearall() ;
   if (opts.patfile)
      err = readpattern(opts.patfile, relcells) ;
   else if (opts.celltext)
      err = parsepattern(opts.celltext, relcells) ;
   else
      err = patterncells(opts.patname ? opts.patname : DEFAULT_PATTERN,
                         relcells) ;
   if (err)
      return err ;
   int wd = grid.getwidth() ;
   int ht = grid.getheight() ;
   int originrow, origincol ;
   centerorigin(relcells, wd, ht, &originrow, &origincol) ;
   if (opts.originrow != NO_ORIGIN)
      originrow = opts.originrow ;
   if (opts.origincol != NO_ORIGIN)
      origincol = opts.origincol ;
   vector<cellpos> cells ;
   err = placecells(relcells, originrow, origincol, wd, ht, cells) ;
   if (err)
      return err ;
   for (size_t i=0; i<cells.size(); i++) {
      if (grid.setcell(cells[i].first, cells[i].second, 1) < 0) {
         grid.clearall() ;
         return "Impossible; set cell error for state 1" ;
      }
   }
   return 0 ;
}

int refreshseconds(int delay) {
   int secs = delay / 1000 + (delay % 1000 != 0) ;
   return secs < 1 ? 1 : secs ;
}

const char *runlife(const runoptions &opts, lifepoll *poller, std::ostream &os) {
   const char *err = checkoptions(opts) ;
   if (err)
      return err ;
   lifegrid grid(opts.width, opts.height) ;
   err = seedgrid(opts, grid) ;
   if (err)
      return err ;
   const char *title = opts.patfile ? opts.patfile :
                       opts.celltext ? "custom pattern" :
                       opts.patname ? opts.patname : DEFAULT_PATTERN ;
   lifeengine engine ;
   if (poller)
      engine.setpoll(poller) ;
   engine.setdelay(opts.delay) ;
   if (ishtml(opts)) {
      htmlrender renderer(opts.htmlfile, refreshseconds(opts.delay), title) ;
      return engine.run(grid, opts.generations, renderer) ;
   }
   if (opts.quiet) {
      nullrender renderer ;
      return engine.run(grid, opts.generations, renderer) ;
   }
   consolerender renderer(os, opts.inplace) ;
   return engine.run(grid, opts.generations, renderer) ;
}
