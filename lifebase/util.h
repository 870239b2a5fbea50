// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

/**
 *   Basic utility classes for things like fatal errors.
 */
#ifndef UTIL_H
#define UTIL_H

void lifefatal(const char *s) ;
void lifewarning(const char *s) ;
void lifestatus(const char *s) ;
/**
 *   To substitute your own routines, use the following class.
 *   The default handler writes everything to stderr; fatal()
 *   exits with FATAL_EXIT_CODE.
 */
class lifeerrors {
public:
   virtual ~lifeerrors() {}
   virtual void fatal(const char *s) = 0 ;
   virtual void warning(const char *s) = 0 ;
   virtual void status(const char *s) = 0 ;
   static void seterrorhandler(lifeerrors *obj) ;
} ;
const int FATAL_EXIT_CODE = 10 ;
/**
 *   A routine to get the number of seconds elapsed since an arbitrary
 *   point, as a double.
 */
double lifeSecondCount() ;
/**
 *   Block the caller for the given number of milliseconds.
 */
void lifesleep(int millis) ;
#endif
