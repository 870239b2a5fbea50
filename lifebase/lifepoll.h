// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

/**
 *   This interface is called by the engine between generations to
 *   find out whether the run should stop early.  The default class
 *   does nothing (never interrupts); the user of this class should
 *   override checkevents() to do the right thing.
 */
#ifndef LIFEPOLL_H
#define LIFEPOLL_H
class lifepoll {
public:
   lifepoll() ;
   virtual ~lifepoll() {}
   /**
    *   This is what should be overridden; it should check events,
    *   and return 0 if all is okay or 1 if the existing run
    *   should be interrupted.
    */
   virtual int checkevents() ;
   /**
    *   Was an interrupt requested?
    */
   int isInterrupted() { return interrupted ; }
   /**
    *   Before a run begins, call this to reset the
    *   interrupted flag.
    */
   void resetInterrupted() { interrupted = 0 ; }
   /**
    *   Call this to stop the current run.
    */
   void setInterrupted() { interrupted = 1 ; }
   /**
    *   This is the routine called by the engine once per generation.
    *   It calls checkevents() and stashes the result; once set, the
    *   interrupted flag stays set until resetInterrupted().
    */
   int poll() ;
private:
   int interrupted ;
} ;
extern lifepoll default_poller ;
#endif
