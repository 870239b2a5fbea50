// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

#include "htmlrender.h"
#include "util.h"          // for lifestatus and lifewarning
#include <fstream>
#include <cstdio>

htmlrender::htmlrender(const char *filenamearg, int refreshsecsarg,
                       const char *titlearg) :
   filename(filenamearg ? filenamearg : DEFAULT_HTML_FILE),
   title(titlearg ? titlearg : "tinylife"),
   refreshsecs(refreshsecsarg < 1 ? 1 : refreshsecsarg) {}

const char *htmlrender::begin(const lifegrid &) {
   std::string msg = "Writing generations to " + filename ;
   lifestatus(msg.c_str()) ;
   return 0 ;
}

const char *htmlrender::render(int gen, const lifegrid &grid) {
   return writepage(gen, grid, 1) ;
}

void htmlrender::end(int lastgen, const lifegrid &grid) {
   const char *err = writepage(lastgen, grid, 0) ;
   if (err)
      lifewarning(err) ;
}

// escape the few characters that matter inside <title> and <h1>
static std::string escapehtml(const std::string &s) {
   std::string r ;
   for (size_t i=0; i<s.size(); i++) {
      switch (s[i]) {
         case '&': r += "&amp;" ; break ;
         case '<': r += "&lt;" ; break ;
         case '>': r += "&gt;" ; break ;
         case '"': r += "&quot;" ; break ;
         default: r += s[i] ; break ;
      }
   }
   return r ;
}

/*
 *   Write the page to a temporary file beside the target and rename
 *   it into place, so a reload never sees a half-written page.
 */
const char *htmlrender::writepage(int gen, const lifegrid &grid, int refresh) {
   std::string tmpname = filename + ".tmp" ;
   std::filebuf filebuf ;
   if (!filebuf.open(tmpname.c_str(), std::ios_base::out | std::ios_base::trunc))
      return "Can't create HTML file!" ;
   std::ostream os(&filebuf) ;
   std::string t = escapehtml(title) ;

   os << "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n" ;
   if (refresh)
      os << "<meta http-equiv=\"refresh\" content=\"" << refreshsecs << "\">\n" ;
   os << "<title>" << t << " - generation " << gen << "</title>\n"
      << "<style>\n"
      << "table { border-collapse: collapse; }\n"
      << "td { width: 10px; height: 10px; padding: 0; border: 1px solid #ddd; }\n"
      << "td.live { background: #000; }\n"
      << "td.dead { background: #fff; }\n"
      << "</style>\n</head>\n<body>\n"
      << "<h1>" << t << "</h1>\n<table>\n" ;
   for (int row=0; row<grid.getheight(); row++) {
      os << "<tr>" ;
      for (int col=0; col<grid.getwidth(); col++)
         os << (grid.isalive(row, col) > 0 ? "<td class=\"live\">"
                                           : "<td class=\"dead\">")
            << "&nbsp;</td>" ;
      os << "</tr>\n" ;
   }
   os << "</table>\n<p>Generation " << gen << ": population "
      << grid.getPopulation() << "</p>\n</body>\n</html>\n" ;

   if (!os.flush() || filebuf.close() == 0) {
      std::remove(tmpname.c_str()) ;
      return "Error occurred writing HTML file; maybe disk is full?" ;
   }
#ifdef _WIN32
   // rename won't replace an existing file on Windows
   std::remove(filename.c_str()) ;
#endif
   if (std::rename(tmpname.c_str(), filename.c_str()) != 0) {
      std::remove(tmpname.c_str()) ;
      return "Can't replace HTML file!" ;
   }
   return 0 ;
}
