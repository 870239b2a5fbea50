// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

#include "readpattern.h"
#include <zlib.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cctype>
#include <algorithm>

#define LINESIZE 20000
#define CR 13
#define LF 10

#ifdef __APPLE__
#define BUFFSIZE 4096      // 4K is best for Mac OS X
#else
#define BUFFSIZE 8192      // 8K is best for Windows and other platforms???
#endif

// a pattern comes either from a (possibly compressed) file
// or from a string given on the command line
static gzFile zinstream ;
static const char *textptr ;

static char filebuff[BUFFSIZE];
static int buffpos, bytesread, prevchar;
static bool readfailed, linetoolong;

// use buffered getchar instead of slow fgetc
// don't override the "getchar" name which is likely to be a macro
static int mgetchar() {
   if (textptr) {
      if (*textptr == 0) return EOF;
      return (unsigned char)*textptr++;
   }
   if (buffpos == BUFFSIZE) {
      bytesread = gzread(zinstream, filebuff, BUFFSIZE);
      if (bytesread < 0) {
         readfailed = true;
         bytesread = 0;
      }
      buffpos = 0;
   }
   if (buffpos >= bytesread) return EOF;
   return (unsigned char)filebuff[buffpos++];
}

// use getpatternline instead of fgets so we can handle DOS/Mac/Unix
// line endings
char *getpatternline(char *line, int maxlinelen) {
   int i = 0;
   while (i < maxlinelen) {
      int ch = mgetchar();
      switch (ch) {
         case CR:
            prevchar = CR;
            line[i] = 0;
            return line;
         case LF:
            if (prevchar != CR) {
               prevchar = LF;
               line[i] = 0;
               return line;
            }
            // if CR+LF (DOS) then ignore the LF
            prevchar = LF;
            break;
         case EOF:
            if (i == 0) return NULL;
            line[i] = 0;
            return line;
         default:
            prevchar = ch;
            line[i++] = (char) ch;
            break;
      }
   }
   line[i] = 0;      // truncate long line; loadpattern reports it
   linetoolong = true;
   return line;
}

static const char *UNSUPPORTEDRULE = "Only Conway's Life (B3/S23) is supported" ;

// run counts and coordinates past MAX_GRID_SIZE can't fit any grid
static const char *toobig_err_str() {
   static char toobig_str[128] ;
   snprintf(toobig_str, sizeof(toobig_str),
            "Pattern does not fit: larger than %dx%d", MAX_GRID_SIZE,
            MAX_GRID_SIZE) ;
   return toobig_str ;
}

// accept the usual spellings of Conway's Life
static bool islife(const char *rule) {
   char buf[32];
   int n = 0;
   for (const char *p = rule; *p && n < 31; p++)
      buf[n++] = (char)tolower((unsigned char)*p);
   buf[n] = 0;
   return strcmp(buf, "b3/s23") == 0 || strcmp(buf, "23/3") == 0 ||
          strcmp(buf, "life") == 0 || strcmp(buf, "s23/b3") == 0;
}

// Read a text pattern like ".X/..X/XXX" or a plain text (.cells) grid
// where '.', ',' and chars <= ' ' represent dead cells, '/' ends a row,
// and all other chars represent live cells.  Lines starting with '!'
// are comments.
static const char *readtextpattern(vector<cellpos> &cells, char *line) {
   int row=0, col=0;
   char *p;

   do {
      if (line[0] == '!')
         continue;
      for (p = line; *p; p++) {
         if (*p == '/') {
            row++;
            col = 0;
         } else if (*p == '.' || *p == ',' || (unsigned char)*p <= ' ') {
            col++;
         } else {
            if (row >= MAX_GRID_SIZE || col >= MAX_GRID_SIZE)
               return toobig_err_str();
            cells.push_back(cellpos(row, col));
            col++;
         }
      }
      row++;
      col = 0;
   } while (getpatternline(line, LINESIZE));

   return 0;
}

/*
 *   Read an RLE pattern.  Only two-state data is accepted.
 */
static const char *readrle(vector<cellpos> &cells, char *line) {
   int n=0, x=0, y=0 ;
   char *p ;
   char *ruleptr;

   do {
      if (line[0] == '#') {
         if (line[1] == 'r') {
            ruleptr = line;
            ruleptr += 2;
            while (*ruleptr && *ruleptr <= ' ') ruleptr++;
            p = ruleptr;
            while (*p > ' ') p++;
            *p = 0;
            if (!islife(ruleptr)) return UNSUPPORTEDRULE;
         }
         // there's a slight ambiguity here for extended RLE when a line
         // starts with 'x'; we only treat it as a dimension line if the
         // next char is whitespace or '=', since 'x' will only otherwise
         // occur as a two-char token followed by an upper case alphabetic.
      } else if (line[0] == 'x' && (line[1] <= ' ' || line[1] == '=')) {
         // the pattern is normalized afterwards so the size is ignored;
         // only the rule matters
         p = line;
         while (*p && *p != 'r') p++;
         if (strncmp(p, "rule", 4) == 0) {
            p += 4;
            while (*p && (*p <= ' ' || *p == '=')) p++;
            ruleptr = p;
            while (*p > ' ') p++;
            // remove any comma at end of rule
            if (p > ruleptr && p[-1] == ',') p--;
            *p = 0;
            if (!islife(ruleptr)) return UNSUPPORTEDRULE;
         }
      } else {
         for (p=line; *p; p++) {
            char c = *p ;
            if ('0' <= c && c <= '9') {
               n = n * 10 + c - '0' ;
               if (n > MAX_GRID_SIZE)
                  return toobig_err_str() ;
            } else if (c <= ' ') {
               // whitespace between tokens
            } else {
               if (n == 0)
                  n = 1 ;
               if (c == 'b' || c == '.') {
                  x += n ;
                  if (x > MAX_GRID_SIZE)
                     return toobig_err_str() ;
               } else if (c == '$') {
                  x = 0 ;
                  y += n ;
                  if (y > MAX_GRID_SIZE)
                     return toobig_err_str() ;
               } else if (c == '!') {
                  return 0;
               } else if (c == 'o' || c == 'A') {
                  if (y >= MAX_GRID_SIZE || x + n > MAX_GRID_SIZE)
                     return toobig_err_str() ;
                  while (n-- > 0)
                     cells.push_back(cellpos(y, x++)) ;
               } else {
                  return "Multi-state RLE data is not supported" ;
               }
               n = 0 ;
            }
         }
      }
   } while (getpatternline(line, LINESIZE));

   return 0;
}

/*
 *   Read Life 1.06 format: a "#Life 1.06" header then one "x y"
 *   pair per line.
 */
static const char *readlife106(vector<cellpos> &cells, char *line) {
   while (getpatternline(line, LINESIZE)) {
      if (line[0] == '#' || line[0] == 0)
         continue;
      char *p = line, *end;
      long x = strtol(p, &end, 10);
      if (end == p)
         return "Bad coordinate line in Life 1.06 pattern";
      p = end;
      long y = strtol(p, &end, 10);
      if (end == p)
         return "Bad coordinate line in Life 1.06 pattern";
      if (x < -MAX_GRID_SIZE || x > MAX_GRID_SIZE ||
          y < -MAX_GRID_SIZE || y > MAX_GRID_SIZE)
         return toobig_err_str();
      cells.push_back(cellpos((int)y, (int)x));
   }
   return 0;
}

// This function guesses whether `line' is the start of a headerless Life RLE
// pattern.  It is used to distinguish headerless RLE from plain text patterns.
static bool isplainrle(const char *line) {

   // Find end of line, or terminating '!' character, whichever comes first:
   const char *end = line;
   while (*end && *end != '!') ++end;

   // Verify that '!' (if present) is the final printable character:
   if (*end == '!') {
      for (const char *p = end + 1; *p; ++p) {
         if ((unsigned)*p > ' ') {
            return false;
         }
      }
   }

   // Ensure line consists of valid tokens:
   bool prev_digit = false, have_digit = false;
   for (const char *p = line; p != end; ++p) {
      if ((unsigned)*p <= ' ') {
         if (prev_digit) return false;  // space inside token!
      } else if (*p >= '0' && *p <= '9') {
         prev_digit = have_digit = true;
      } else if (*p == 'b' || *p == 'o' || *p == '$') {
         prev_digit = false;
      } else {
         return false;  // unsupported printable character encountered!
      }
   }
   if (prev_digit) return false;  // end of line inside token!

   // Everything seems parseable; assume this is RLE if either we saw some
   // digits, or the pattern ends with a '!', both of which are unlikely to
   // occur in plain text patterns:
   return have_digit || *end == '!';
}

static const char *loadpattern(vector<cellpos> &cells) {
   char line[LINESIZE + 1] ;
   const char *errmsg = 0;

   cells.clear() ;
   readfailed = false ;
   linetoolong = false ;

   // skip any blank lines at start
   bool gotline = false ;
   while ((gotline = getpatternline(line, LINESIZE) != 0) && line[0] == 0) ;
   if (!gotline)
      return readfailed ? "Error reading pattern file" : 0 ;

   if (strncmp(line, "#Life 1.06", 10) == 0) {
      errmsg = readlife106(cells, line) ;
   } else if (strncmp(line, "#Life", 5) == 0) {
      errmsg = "Only version 1.06 of the Life format is supported" ;
   } else if (line[0] == '#' || (line[0] == 'x' && (line[1] <= ' ' || line[1] == '='))) {
      errmsg = readrle(cells, line) ;
   } else if (isplainrle(line)) {
      errmsg = readrle(cells, line) ;
   } else {
      // read a text pattern like ".X/..X/XXX", or a .cells file
      errmsg = readtextpattern(cells, line) ;
   }

   if (errmsg == 0 && linetoolong)
      errmsg = "Pattern line longer than 20000 characters" ;
   if (errmsg == 0 && readfailed)
      errmsg = "Error reading pattern file" ;
   if (errmsg == 0)
      normalizecells(cells) ;
   return errmsg ;
}

static const char *build_err_str(const char *filename) {
   static char file_err_str[2048];
   snprintf(file_err_str, sizeof(file_err_str),
            "Can't open pattern file:\n%s", filename);
   return file_err_str;
}

const char *readpattern(const char *filename, vector<cellpos> &cells) {
   // gzread passes uncompressed files straight through
   zinstream = gzopen(filename, "rb") ;      // rb needed on Windows
   if (zinstream == 0)
      return build_err_str(filename) ;
   textptr = 0 ;
   buffpos = BUFFSIZE;                       // for 1st getchar call
   prevchar = 0;                             // for 1st getline call
   const char *errmsg = loadpattern(cells) ;
   gzclose(zinstream) ;
   zinstream = 0 ;
   return errmsg ;
}

const char *parsepattern(const char *text, vector<cellpos> &cells) {
   textptr = text ;
   prevchar = 0 ;
   const char *errmsg = loadpattern(cells) ;
   textptr = 0 ;
   return errmsg ;
}

void normalizecells(vector<cellpos> &cells) {
   if (cells.empty())
      return ;
   int minrow = cells[0].first, mincol = cells[0].second ;
   for (size_t i=1; i<cells.size(); i++) {
      if (cells[i].first < minrow) minrow = cells[i].first ;
      if (cells[i].second < mincol) mincol = cells[i].second ;
   }
   for (size_t i=0; i<cells.size(); i++) {
      cells[i].first -= minrow ;
      cells[i].second -= mincol ;
   }
   std::sort(cells.begin(), cells.end()) ;
   cells.erase(std::unique(cells.begin(), cells.end()), cells.end()) ;
}

void cellextent(const vector<cellpos> &cells, int *wd, int *ht) {
   int maxrow = -1, maxcol = -1 ;
   for (size_t i=0; i<cells.size(); i++) {
      if (cells[i].first > maxrow) maxrow = cells[i].first ;
      if (cells[i].second > maxcol) maxcol = cells[i].second ;
   }
   *wd = maxcol + 1 ;
   *ht = maxrow + 1 ;
}
