// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

/**
 *   A finite rectangular universe of two-state cells.  Cells outside
 *   the grid are permanently dead; there is no wraparound.
 *
 *   Coordinates are (row, col) with row 0 at the top.  The next
 *   generation is always built into a fresh grid so a step never
 *   reads cells it has already written.
 */
#ifndef LIFEGRID_H
#define LIFEGRID_H
#include <stddef.h>
#include <vector>
#include <utility>
using std::vector;
using std::pair;

typedef pair<int, int> cellpos ;   // (row, col)

const int MAX_GRID_SIZE = 4096 ;      // per side

class lifegrid {
public:
   // non-positive dimensions give an empty 0x0 grid
   lifegrid(int wd, int ht) ;
   int getwidth() const { return wd ; }
   int getheight() const { return ht ; }
   int inside(int row, int col) const {
      return row >= 0 && row < ht && col >= 0 && col < wd ;
   }
   // returns <0 if (row, col) is out of bounds, else the cell state
   int isalive(int row, int col) const ;
   // returns <0 if error
   int setcell(int row, int col, int newstate) ;
   void clearall() ;
   // live cells among the 8 neighbors; (row, col) itself need not be inside
   int liveneighbors(int row, int col) const ;
   lifegrid nextgeneration() const ;
   int getPopulation() const { return population ; }
   int isEmpty() const { return population == 0 ; }
   // bounding box of the live cells; returns 0 (and leaves the
   // arguments alone) if the grid is empty
   int findedges(int *t, int *l, int *b, int *r) const ;
   // live cells in row-major order
   void getcells(vector<cellpos> &cells) const ;
   bool operator==(const lifegrid &other) const ;
   bool operator!=(const lifegrid &other) const { return !(*this == other) ; }
private:
   int idx(int row, int col) const { return row * wd + col ; }
   int wd, ht ;
   int population ;
   vector<unsigned char> cells ;
} ;
#endif
