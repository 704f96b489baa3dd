/*=============================================================================

  DIVSIM - Diversification simulator
  Expected diversity under a diversification rate

=============================================================================*/

#ifndef DIVSIM_DIVERSITY_H
#define DIVSIM_DIVERSITY_H

#include <vector>

#include "rate.h"


namespace divsim {

using namespace std;


// Expected number of lineages at time t starting from n0 lineages at time 0
// under diversification rate r (speciation minus extinction):
//
//   n0 * exp(int_0^t r(x) dx)
double expectedDiversity(const Rate &rate, int n0, double t);

void expectedDiversity(const Rate &rate, int n0, const double *times,
                       int ntimes, double *div);

// Same, normalizing a rate specification first. Shift times must start at
// 0. Returns false if the specification is invalid.
bool expectedDiversity(const RateSpec &spec, int n0, const double *times,
                       int ntimes, double *div,
                       const EnvTable *env=NULL,
                       const vector<double> *shifts=NULL);


} // namespace divsim

#endif // DIVSIM_DIVERSITY_H
