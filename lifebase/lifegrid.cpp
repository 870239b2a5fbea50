// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

#include "lifegrid.h"

lifegrid::lifegrid(int wdarg, int htarg) {
   if (wdarg <= 0 || htarg <= 0)
      wdarg = htarg = 0 ;
   wd = wdarg ;
   ht = htarg ;
   population = 0 ;
   cells.assign((size_t)wd * ht, 0) ;
}

int lifegrid::isalive(int row, int col) const {
   if (!inside(row, col))
      return -1 ;
   return cells[idx(row, col)] ;
}

int lifegrid::setcell(int row, int col, int newstate) {
   if (!inside(row, col) || newstate < 0 || newstate > 1)
      return -1 ;
   unsigned char &c = cells[idx(row, col)] ;
   population += newstate - c ;
   c = (unsigned char)newstate ;
   return 0 ;
}

void lifegrid::clearall() {
   cells.assign(cells.size(), 0) ;
   population = 0 ;
}

int lifegrid::liveneighbors(int row, int col) const {
   int n = 0 ;
   for (int r=row-1; r<=row+1; r++) {
      if (r < 0 || r >= ht)
         continue ;
      for (int c=col-1; c<=col+1; c++) {
         if (c < 0 || c >= wd || (r == row && c == col))
            continue ;
         n += cells[idx(r, c)] ;
      }
   }
   return n ;
}

/*
 *   B3/S23: a live cell survives with 2 or 3 live neighbors, a dead
 *   cell comes alive with exactly 3.
 */
lifegrid lifegrid::nextgeneration() const {
   lifegrid next(wd, ht) ;
   for (int row=0; row<ht; row++) {
      for (int col=0; col<wd; col++) {
         int n = liveneighbors(row, col) ;
         if (n == 3 || (n == 2 && cells[idx(row, col)])) {
            next.cells[idx(row, col)] = 1 ;
            next.population++ ;
         }
      }
   }
   return next ;
}

int lifegrid::findedges(int *t, int *l, int *b, int *r) const {
   if (population == 0)
      return 0 ;
   int top = ht, left = wd, bottom = -1, right = -1 ;
   for (int row=0; row<ht; row++) {
      for (int col=0; col<wd; col++) {
         if (cells[idx(row, col)]) {
            if (row < top) top = row ;
            if (row > bottom) bottom = row ;
            if (col < left) left = col ;
            if (col > right) right = col ;
         }
      }
   }
   *t = top ;
   *l = left ;
   *b = bottom ;
   *r = right ;
   return 1 ;
}

void lifegrid::getcells(vector<cellpos> &out) const {
   out.clear() ;
   for (int row=0; row<ht; row++)
      for (int col=0; col<wd; col++)
         if (cells[idx(row, col)])
            out.push_back(cellpos(row, col)) ;
}

bool lifegrid::operator==(const lifegrid &other) const {
   return wd == other.wd && ht == other.ht && cells == other.cells ;
}
