// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

#include "patterns.h"
#include "readpattern.h"
#include <cstdio>
#include <cstring>

const lifepattern builtinpatterns[] = {
  { "block", "2x2 still life",
    "XX/XX" },
  { "blinker", "period 2 oscillator",
    "XXX" },
  { "beacon", "period 2 oscillator",
    "XX/XX/..XX/..XX" },
  { "toad", "period 2 oscillator",
    ".XXX/XXX" },
  { "glider", "moves one cell down and right every 4 generations",
    ".X/..X/XXX" },
  { "lwss", "lightweight spaceship, moves two cells right every 4 generations",
    ".XXXX/X...X/....X/X..X" },
  { "pulsar", "period 3 oscillator",
    "..XXX...XXX../"
    "/"
    "X....X.X....X/"
    "X....X.X....X/"
    "X....X.X....X/"
    "..XXX...XXX../"
    "/"
    "..XXX...XXX../"
    "X....X.X....X/"
    "X....X.X....X/"
    "X....X.X....X/"
    "/"
    "..XXX...XXX.." },
  { "rpentomino", "methuselah, stabilizes after 1103 generations",
    ".XX/XX/.X" },
  { "diehard", "methuselah, vanishes after 130 generations",
    "......X/XX/.X...XXX" },
  { "acorn", "methuselah, stabilizes after 5206 generations",
    ".X/...X/XX..XXX" },
  { "expanding", "10-cell infinite growth pattern",
    "......X/....X.XX/....X.X/....X/..X/X.X" },
  { 0, 0, 0 }
} ;

// other names the patterns go by
const patternalias patternaliases[] = {
  { "blink", "blinker" },
  { "bounce", "beacon" },
  { "spaceship", "lwss" },
  { 0, 0 }
} ;

static const lifepattern *findbuiltin(const char *name) {
   for (int i=0; builtinpatterns[i].name; i++)
      if (strcmp(builtinpatterns[i].name, name) == 0)
         return &builtinpatterns[i] ;
   return 0 ;
}

const lifepattern *findpattern(const char *name) {
   if (name == 0)
      return 0 ;
   const lifepattern *pat = findbuiltin(name) ;
   if (pat)
      return pat ;
   for (int i=0; patternaliases[i].alias; i++)
      if (strcmp(patternaliases[i].alias, name) == 0)
         return findbuiltin(patternaliases[i].name) ;
   return 0 ;
}

void patternnames(vector<const char *> &names) {
   names.clear() ;
   for (int i=0; builtinpatterns[i].name; i++)
      names.push_back(builtinpatterns[i].name) ;
}

static const char *unknown_err_str(const char *name) {
   static char unknown_str[256] ;
   snprintf(unknown_str, sizeof(unknown_str), "Unknown pattern: %s",
            name ? name : "(null)") ;
   return unknown_str ;
}

const char *patterncells(const char *name, vector<cellpos> &cells) {
   cells.clear() ;
   const lifepattern *pat = findpattern(name) ;
   if (pat == 0)
      return unknown_err_str(name) ;
   return parsepattern(pat->rows, cells) ;
}

const char *patternextent(const char *name, int *wd, int *ht) {
   vector<cellpos> cells ;
   const char *err = patterncells(name, cells) ;
   if (err)
      return err ;
   cellextent(cells, wd, ht) ;
   return 0 ;
}

const char *placecells(const vector<cellpos> &relcells,
                       int originrow, int origincol, int wd, int ht,
                       vector<cellpos> &cells) {
   static char fit_err_str[256] ;
   cells.clear() ;
   for (size_t i=0; i<relcells.size(); i++) {
      int relrow = relcells[i].first ;
      int relcol = relcells[i].second ;
      // compare against the origin so huge origins can't overflow
      if (originrow < -relrow || originrow > ht - 1 - relrow ||
          origincol < -relcol || origincol > wd - 1 - relcol) {
         int patwd, patht ;
         cellextent(relcells, &patwd, &patht) ;
         snprintf(fit_err_str, sizeof(fit_err_str),
                  "Pattern does not fit: %dx%d pattern at row %d, col %d"
                  " in a %dx%d grid", patwd, patht, originrow, origincol,
                  wd, ht) ;
         cells.clear() ;
         return fit_err_str ;
      }
      cells.push_back(cellpos(relrow + originrow, relcol + origincol)) ;
   }
   return 0 ;
}

const char *instantiate(const char *name, int originrow, int origincol,
                        int wd, int ht, vector<cellpos> &cells) {
   vector<cellpos> relcells ;
   const char *err = patterncells(name, relcells) ;
   if (err) {
      cells.clear() ;
      return err ;
   }
   return placecells(relcells, originrow, origincol, wd, ht, cells) ;
}

void centerorigin(const vector<cellpos> &relcells, int wd, int ht,
                  int *originrow, int *origincol) {
   int patwd, patht ;
   cellextent(relcells, &patwd, &patht) ;
   *originrow = (ht - patht) / 2 ;
   *origincol = (wd - patwd) / 2 ;
}
