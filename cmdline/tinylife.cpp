// This file is part of TinyLife.
// See docs/License.html for the copyright notice.

#include "liferun.h"
#include "patterns.h"
#include "htmlrender.h"
#include "lifepoll.h"
#include "util.h"
#include <stdlib.h>
#include <iostream>
#include <cstdio>
#include <string.h>
#include <errno.h>
#include <limits.h>
#include <signal.h>

using namespace std ;

double start ;
double timestamp() {
   double now = lifeSecondCount() ;
   double r = now - start ;
   if (start == 0)
      start = now ;
   return r ;
}

int benchmark ; // show timing?
/*
 *   This is our standard lifeerrors.
 */
class stderrors : public lifeerrors {
public:
   stderrors() {}
   virtual void fatal(const char *s) { cout << "Fatal error: " << s << endl ; exit(FATAL_EXIT_CODE) ; }
   virtual void warning(const char *s) { cout << "Warning: " << s << endl ; }
   virtual void status(const char *s) {
      if (benchmark)
         cout << timestamp() << " " << s << endl ;
      else {
         timestamp() ;
         cout << s << endl ;
      }
   }
} ;
stderrors stderrors_instance ;

/*
 *   Ctrl-C stops the run at the next generation.
 */
static volatile sig_atomic_t gotinterrupt = 0 ;
extern "C" void oninterrupt(int) {
   gotinterrupt = 1 ;
}
class sigpoll : public lifepoll {
public:
   virtual int checkevents() { return gotinterrupt != 0 ; }
} ;
sigpoll sigpoll_instance ;

runoptions opts ;
int showhelp, showlist ;
struct options {
  const char *shortopt ;
  const char *longopt ;
  const char *desc ;
  char opttype ;
  void *data ;
} ;
options options[] = {
  { "-p", "--pattern", "Built-in pattern to run (see --list)", 's', &opts.patname },
  { "-f", "--file", "Pattern file (*.rle, *.cells, *.lif, optionally .gz)", 's',
                                                                  &opts.patfile },
  { "-c", "--cells", "Pattern given as text, eg. \".X/..X/XXX\"", 's', &opts.celltext },
  { "-W", "--width", "Grid width", 'i', &opts.width },
  { "-H", "--height", "Grid height", 'i', &opts.height },
  { "-g", "--generations", "How many generations to compute", 'i', &opts.generations },
  { "-o", "--output", "Where to render: console or html", 's', &opts.output },
  { "",   "--html-file", "HTML file to write (default tinylife.html)", 's',
                                                                  &opts.htmlfile },
  { "-d", "--delay", "Milliseconds between generations", 'i', &opts.delay },
  { "",   "--row", "Row of the pattern's top left corner", 'i', &opts.originrow },
  { "",   "--col", "Column of the pattern's top left corner", 'i', &opts.origincol },
  { "",   "--inplace", "Redraw the console in place", 'b', &opts.inplace },
  { "-q", "--quiet", "Don't show the generations on the console", 'b', &opts.quiet },
  { "-b", "--benchmark", "Show timestamps", 'b', &benchmark },
  { "-l", "--list", "List built-in patterns", 'b', &showlist },
  { "-h", "--help", "Show this help", 'b', &showhelp },
  { 0, 0, 0, 0, 0 }
} ;

void listpatterns() {
   for (int i=0; builtinpatterns[i].name; i++)
      printf("   %-12s %s\n", builtinpatterns[i].name, builtinpatterns[i].desc) ;
   for (int i=0; patternaliases[i].alias; i++)
      printf("   %-12s same as %s\n", patternaliases[i].alias,
             patternaliases[i].name) ;
}

void usage(const char *s) {
  if (s)
    lifefatal(s) ;
  printf("Usage:  tinylife [options]\n") ;
  for (int i=0; options[i].shortopt; i++)
    printf("%3s %-15s %s\n", options[i].shortopt, options[i].longopt,
           options[i].desc) ;
  printf("Patterns:\n") ;
  listpatterns() ;
  exit(0) ;
}

// strict integer parse
const char *parseint(const char *s, int *result) {
   static char int_err_str[256] ;
   char *end = 0 ;
   errno = 0 ;
   long v = strtol(s, &end, 10) ;
   if (end == s || *end != 0 || errno == ERANGE || v < INT_MIN || v > INT_MAX) {
      snprintf(int_err_str, sizeof(int_err_str), "Bad integer value: %s", s) ;
      return int_err_str ;
   }
   *result = (int)v ;
   return 0 ;
}

#define STRINGIFY(ARG) STR2(ARG)
#define STR2(ARG) #ARG

int main(int argc, char *argv[]) {
   cout << "This is tinylife " STRINGIFY(VERSION) "." << endl ;
   lifeerrors::seterrorhandler(&stderrors_instance) ;
   while (argc > 1) {
      argc-- ;
      argv++ ;
      char *opt = argv[0] ;
      int hit = 0 ;
      for (int i=0; options[i].shortopt; i++) {
        if ((options[i].shortopt[0] && strcmp(opt, options[i].shortopt) == 0) ||
            strcmp(opt, options[i].longopt) == 0) {
          switch (options[i].opttype) {
case 'i':
             {
                if (argc < 2)
                   lifefatal("Bad option argument") ;
                const char *err = parseint(argv[1], (int *)options[i].data) ;
                if (err)
                   lifefatal(err) ;
                argc-- ;
                argv++ ;
             }
             break ;
case 'b':
             (*(int *)options[i].data) += 1 ;
             break ;
case 's':
             if (argc < 2)
                lifefatal("Bad option argument") ;
             *(const char **)options[i].data = argv[1] ;
             argc-- ;
             argv++ ;
             break ;
          }
          hit++ ;
          break ;
        }
      }
      if (!hit)
         usage("Bad option given") ;
   }
   if (showhelp)
      usage(0) ;
   if (showlist) {
      listpatterns() ;
      exit(0) ;
   }
   signal(SIGINT, oninterrupt) ;
   timestamp() ;
   const char *err = runlife(opts, &sigpoll_instance, cout) ;
   if (err)
      lifefatal(err) ;
   if (sigpoll_instance.isInterrupted())
      lifestatus("Interrupted.") ;
   else if (benchmark)
      lifestatus("Done.") ;
   exit(0) ;
}
