/*=============================================================================

  DIVSIM - Diversification simulator
  Expected diversity under a diversification rate

=============================================================================*/

// c++ headers
#include <math.h>

// divsim headers
#include "diversity.h"
#include "integrate.h"
#include "logging.h"


namespace divsim {


double expectedDiversity(const Rate &rate, int n0, double t)
{
    if (rate.isConstant())
        return n0 * exp(rate.value * t);

    RateIntegrator integ;
    return n0 * exp(integ.integrate(rate, 0.0, t));
}


void expectedDiversity(const Rate &rate, int n0, const double *times,
                       int ntimes, double *div)
{
    if (rate.isConstant()) {
        for (int i=0; i<ntimes; i++)
            div[i] = n0 * exp(rate.value * times[i]);
        return;
    }

    RateIntegrator integ;
    for (int i=0; i<ntimes; i++)
        div[i] = n0 * exp(integ.integrate(rate, 0.0, times[i]));
}


bool expectedDiversity(const RateSpec &spec, int n0, const double *times,
                       int ntimes, double *div,
                       const EnvTable *env, const vector<double> *shifts)
{
    Rate rate;
    if (!makeRate(spec, INFINITY, env, shifts, &rate)) {
        printError("invalid diversification rate");
        return false;
    }

    expectedDiversity(rate, n0, times, ntimes, div);
    return true;
}


} // namespace divsim
