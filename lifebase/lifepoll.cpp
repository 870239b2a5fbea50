// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

#include "lifepoll.h"
lifepoll::lifepoll() {
  interrupted = 0 ;
}
int lifepoll::checkevents() {
  return 0 ;
}
int lifepoll::poll() {
  if (!interrupted)
    interrupted = checkevents() ;
  return interrupted ;
}
lifepoll default_poller ;
