#ifndef TESTUTILS_H_INCLUDED
#define TESTUTILS_H_INCLUDED

#include <sys/time.h>
#include <time.h>
#include <iostream>
#include "Utils/pvcommutils.h"

#define MYTIMEVAL( tv_ )			\
  ((tv_.tv_sec) + (tv_.tv_usec) * 1.0e-6)

#define TIMESTAMP( time_ )				\
  {							\
    static struct timeval tv;				\
    gettimeofday( &tv, NULL );				\
    time_ = MYTIMEVAL( tv );				\
  }

/// Reference module of the tests: ELGIN ELG590-M72HEP.
inline ModuleSpec elg590Module()
{
  return { 52.0, 14.31, 43.55, 13.55, 2.648, 144, 0.046/100.0, -0.26/100.0 };
}

inline DiodeParams elg590Diode()
{
  return { 1.3, 0.2, 1000.0 };
}

#endif /* TESTUTILS_H_INCLUDED */
