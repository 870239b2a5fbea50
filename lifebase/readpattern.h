// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

#ifndef READPATTERN_H
#define READPATTERN_H
#include "lifegrid.h"

/*
 *   Read a pattern file into a list of live cells.  The file can be
 *   RLE, plain text (.cells), Life 1.06 or row shorthand, optionally
 *   gzip compressed.  Returns an error message or 0.  The cells are
 *   normalized (see normalizecells).  Lines may be at most 20000
 *   characters long, and run counts or coordinates larger than
 *   MAX_GRID_SIZE are rejected as not fitting.
 */
const char *readpattern(const char *filename, vector<cellpos> &cells) ;

/*
 *   Same as readpattern but the pattern is given as text, like
 *   ".X/..X/XXX" or "bo$2bo$3o!".
 */
const char *parsepattern(const char *text, vector<cellpos> &cells) ;

/*
 *   Get next line from current pattern source.  Longer lines are
 *   truncated to maxlinelen and the rest comes back as the next line;
 *   the readers above treat that as an error.
 */
char *getpatternline(char *line, int maxlinelen) ;

/*
 *   Translate cells so the topmost row and leftmost column are 0,
 *   then sort them in row-major order and drop duplicates.
 */
void normalizecells(vector<cellpos> &cells) ;

/*
 *   Size of the bounding box of normalized cells; 0x0 if empty.
 */
void cellextent(const vector<cellpos> &cells, int *wd, int *ht) ;

#endif
