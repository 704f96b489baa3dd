/*=============================================================================

  DIVSIM - Diversification simulator
  Waiting times under time-varying and age-dependent rates

=============================================================================*/

#ifndef DIVSIM_WAITTIME_H
#define DIVSIM_WAITTIME_H

// 3rd party
#include <gsl/gsl_roots.h>

// divsim headers
#include "common.h"
#include "integrate.h"
#include "rate.h"


namespace divsim {


// Draws event waiting times by inverting the cumulative hazard.
//
// Without a shape, 'rate' is the hazard of an inhomogeneous Poisson process
// and the waiting time t solves
//
//   1 - p = exp(- int_now^(now+t) rate(x) dx),        p ~ U(0, 1)
//
// With a shape, 'rate' is the scale of a Weibull process in the age of a
// lineage born at 'origin'. With age0 = now - origin the waiting time t
// solves
//
//   1 - p = exp(- (int_age0^u 1/rate(x + origin) dx) ^ shape(u)),  u = age0+t
//
// The shape is a function of the lineage age u, also when checking whether
// the event happens before the horizon.
//
// In fast mode, an event whose probability of happening before tmax is
// lower than p is not located; noEventTime(tmax) is returned instead.
class WaitTimeSampler
{
public:
    WaitTimeSampler(int limit=BD_INTEGRATION_LIMIT);
    ~WaitTimeSampler();

    // Draw 'n' waiting times into 'times'.
    // Returns false if now < origin, or fast is requested with an
    // infinite tmax.
    bool sample(int n, const Rate &rate, double now, double tmax,
                const Rate *shape, double origin, bool fast,
                double *times);

    // Draw one waiting time. Arguments are not checked.
    double sampleOne(const Rate &rate, double now, double tmax,
                     const Rate *shape, double origin, bool fast);

    // Waiting time for the uniform quantile p in (0, 1).
    double quantile(double p, const Rate &rate, double now, double tmax,
                    const Rate *shape, double origin, bool fast);

    // Cumulative hazard between 'now' and time 't'
    double cumHazard(const Rate &rate, double now, double t);

    // Weibull cumulative hazard between ages 'age0' and 'age' of a lineage
    // born at 'origin'
    double cumAgeHazard(const Rate &scale, const Rate &shape, double origin,
                        double age0, double age);

    // waiting time of an event that does not happen before tmax
    static double noEventTime(double tmax)
    { return tmax + BD_NO_EVENT_PAD; }

    // upper bound of the initial root bracket
    static double horizon(double now, double tmax)
    { return isinf(tmax) ? 10.0 * now + 10.0 : tmax; }


    // root finding settings
    int maxiter;
    int maxexpand;
    double epsabs;
    double epsrel;

protected:
    // cumulative hazard of the current problem at x
    double cumulative(double x);

    double findRoot(double lower, double upper, double fupper);

    static double root_f(double x, void *params);

    RateIntegrator integ;
    gsl_root_fsolver *solver;

    // current problem
    const Rate *currate;
    const Rate *curshape;
    double curorigin;
    double curstart;
    double curtarget;

private:
    // not copyable: owns the solver
    WaitTimeSampler(const WaitTimeSampler &other);
    WaitTimeSampler &operator=(const WaitTimeSampler &other);
};


} // namespace divsim

#endif // DIVSIM_WAITTIME_H
