/*=============================================================================

  DIVSIM - Diversification simulator
  Common constants, random numbers and math

=============================================================================*/

#ifndef DIVSIM_COMMON_H
#define DIVSIM_COMMON_H

#include <math.h>
#include <stdlib.h>


namespace divsim {

//=============================================================================
// constants

// waiting time returned by fast sampling when the event misses the horizon
// is tmax + BD_NO_EVENT_PAD
const double BD_NO_EVENT_PAD = 0.01;

// exported extinction time of survivors without a recorded extinction
const double BD_EXTANT_TIME = -0.01;

// exported speciation time of root lineages is tmax + BD_ROOT_PAD
const double BD_ROOT_PAD = 0.01;

// parent of a root lineage
const int BD_NO_PARENT = -1;

// maximum number of retries of the rejection loop
const int BD_MAX_RETRIES = 100000;

// quadrature subdivision limit
const int BD_INTEGRATION_LIMIT = 2000;

// number of times a root bracket may be doubled before giving up
const int BD_MAX_BRACKET_EXPANSIONS = 64;

// step of the grid on which rates are checked for negative values
const double BD_CHECK_STEP = 0.1;

// largest number of grid steps used for that check
const int BD_MAX_CHECK_STEPS = 1000000;


//=============================================================================
// random numbers
//
// all draws use the process-wide C random source; seed it with srand()

// uniform on [0, 1)
inline double frand()
{ return rand() / (double(RAND_MAX) + 1.0); }

// uniform on [0, max)
inline double frand(double max)
{ return max * frand(); }

// uniform on [min, max)
inline double frand(double min, double max)
{ return min + (max - min) * frand(); }

double ofrand();
double expovariate(double lambda);


} // namespace divsim

#endif // DIVSIM_COMMON_H
