#pragma once

// On platforms supporting OpenMP, this file includes the omp.h header file. On other platforms,
// this file provides stubs for the runtime library routines used by the simulator and the
// progress bar, so that the code runs single-threaded.

#ifdef _OPENMP

#include <omp.h>

#else

inline int omp_get_max_threads(void)
{
  return 1;
}

inline int omp_get_thread_num(void)
{
  return 0;
}

#endif
