/*=============================================================================

  DIVSIM - Diversification simulator
  Common random numbers

=============================================================================*/

// c++ headers
#include <math.h>
#include <stdlib.h>

// divsim headers
#include "common.h"


namespace divsim {


// uniform on the open interval (0, 1)
double ofrand()
{
    double u = 0.0;
    while (u <= 0.0)
        u = frand();
    return u;
}


// Exponential distribution with rate 'lambda'.
// A zero rate never fires, so the waiting time is infinite.
double expovariate(double lambda)
{
    if (lambda <= 0.0)
        return INFINITY;
    return -log(ofrand()) / lambda;
}


} // namespace divsim
