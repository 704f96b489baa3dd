/*=============================================================================

  DIVSIM - Diversification simulator
  Birth-death simulation of lineages

=============================================================================*/

#ifndef DIVSIM_BDSIM_H
#define DIVSIM_BDSIM_H

#include <vector>

#include "bdsim_engine.h"
#include "lineage.h"
#include "rate.h"


namespace divsim {

using namespace std;


// Optional modifiers of a speciation or extinction rate
class RateOptions
{
public:
    RateOptions(const RateSpec *_shape=NULL, const EnvTable *_env=NULL,
                const vector<double> *_shifts=NULL) :
        shape(_shape),
        env(_env),
        shifts(_shifts)
    {}

    bool empty() const
    { return !shape && !env && !shifts; }

    // Weibull shape; makes the rate a Weibull scale
    const RateSpec *shape;

    // environmental data for a rate of time and environment
    const EnvTable *env;

    // shift times for a vector of rates
    const vector<double> *shifts;
};


// true if the constant-rate engine can run the simulation
bool useConstantEngine(const RateSpec &pp, const RateSpec &qq,
                       const RateOptions &popts, const RateOptions &qopts);


// Simulate a birth-death process with speciation 'pp' and extinction 'qq'
// for 'tmax' time units starting from 'n0' lineages.
//
// Scalar rates without options run on the constant-rate engine; all others
// are normalized with makeRate() and run on the general engine.
//
// Returns BDSIM_OK, BDSIM_INVALID or BDSIM_EXHAUSTED.
int bdSim(int n0, const RateSpec &pp, const RateSpec &qq, double tmax,
          const BdSimParams &params, BdSim *sim,
          const RateOptions &popts=RateOptions(),
          const RateOptions &qopts=RateOptions());


} // namespace divsim

#endif // DIVSIM_BDSIM_H
