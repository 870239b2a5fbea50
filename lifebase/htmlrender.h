// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

#ifndef HTMLRENDER_H
#define HTMLRENDER_H
#include "liferender.h"
#include <string>

/**
 *   Renders each generation into one HTML file which asks the browser
 *   to reload itself every refreshsecs seconds.  The file is replaced,
 *   not appended to, so a browser pointed at it follows the run.  Once
 *   the run ends the page is written one last time without the reload
 *   directive.
 */
class htmlrender : public liferender {
public:
   htmlrender(const char *filenamearg, int refreshsecsarg,
              const char *titlearg) ;
   virtual ~htmlrender() {}
   virtual const char *begin(const lifegrid &grid) ;
   virtual const char *render(int gen, const lifegrid &grid) ;
   virtual void end(int lastgen, const lifegrid &grid) ;
   const char *getfilename() const { return filename.c_str() ; }
private:
   const char *writepage(int gen, const lifegrid &grid, int refresh) ;
   std::string filename ;
   std::string title ;
   int refreshsecs ;
} ;

/*
 *   Default output file, relative to the current directory.
 */
const char *const DEFAULT_HTML_FILE = "tinylife.html" ;
#endif
