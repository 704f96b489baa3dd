/*=============================================================================

  DIVSIM - Diversification simulator
  Birth-death simulation engines

=============================================================================*/

#ifndef DIVSIM_BDSIM_ENGINE_H
#define DIVSIM_BDSIM_ENGINE_H

#include <math.h>

#include "common.h"
#include "lineage.h"
#include "rate.h"


namespace divsim {


// Settings shared by all birth-death simulations
class BdSimParams
{
public:
    BdSimParams() :
        nmin(0),
        nmax(INFINITY),
        extantOnly(false),
        fast(true),
        trueExt(false),
        maxretries(BD_MAX_RETRIES)
    {}

    // accepted range of the final number of lineages
    double nmin;
    double nmax;

    // count only extant lineages against [nmin, nmax]
    bool extantOnly;

    // do not locate events that fall after tmax
    bool fast;

    // record the drawn extinction time of lineages surviving past tmax
    bool trueExt;

    // retries of the rejection loop after the first attempt
    int maxretries;
};


bool checkBdSimParams(int n0, double tmax, const BdSimParams &params);


// Simulate with constant speciation 'lambda' and extinction 'mu' rates.
// Returns BDSIM_OK, BDSIM_INVALID or BDSIM_EXHAUSTED.
int bdSimConstant(int n0, double lambda, double mu, double tmax,
                  const BdSimParams &params, BdSim *sim);


// Simulate with general speciation 'lambda' and extinction 'mu' rates.
// A non-NULL shape makes the corresponding rate the scale of an
// age-dependent Weibull process.
// Returns BDSIM_OK, BDSIM_INVALID or BDSIM_EXHAUSTED.
int bdSimGeneral(int n0, const Rate &lambda, const Rate &mu, double tmax,
                 const Rate *lshape, const Rate *mshape,
                 const BdSimParams &params, BdSim *sim);


} // namespace divsim

#endif // DIVSIM_BDSIM_ENGINE_H
