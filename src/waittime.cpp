/*=============================================================================

  DIVSIM - Diversification simulator
  Waiting times under time-varying and age-dependent rates

=============================================================================*/

// c++ headers
#include <math.h>

// 3rd party
#include <gsl/gsl_errno.h>
#include <gsl/gsl_roots.h>

// divsim headers
#include "waittime.h"
#include "logging.h"


namespace divsim {


// stand-in for cumulative hazards that overflow
static const double HUGE_HAZARD = 1e300;


WaitTimeSampler::WaitTimeSampler(int limit) :
    maxiter(100),
    maxexpand(BD_MAX_BRACKET_EXPANSIONS),
    epsabs(1e-10),
    epsrel(1e-9),
    integ(limit),
    solver(NULL),
    currate(NULL),
    curshape(NULL),
    curorigin(0.0),
    curstart(0.0),
    curtarget(0.0)
{
    gsl_set_error_handler_off();
    solver = gsl_root_fsolver_alloc(gsl_root_fsolver_brent);
}


WaitTimeSampler::~WaitTimeSampler()
{
    gsl_root_fsolver_free(solver);
}


bool WaitTimeSampler::sample(int n, const Rate &rate, double now,
                             double tmax, const Rate *shape, double origin,
                             bool fast, double *times)
{
    if (n < 0) {
        printError("number of waiting times cannot be negative (%d)", n);
        return false;
    }

    if (fast && isinf(tmax)) {
        printError("fast sampling needs a finite tmax");
        return false;
    }

    if (now < origin) {
        printError("current time %f is before the lineage origin %f",
                   now, origin);
        return false;
    }

    for (int i=0; i<n; i++)
        times[i] = sampleOne(rate, now, tmax, shape, origin, fast);

    return true;
}


double WaitTimeSampler::sampleOne(const Rate &rate, double now, double tmax,
                                  const Rate *shape, double origin,
                                  bool fast)
{
    return quantile(ofrand(), rate, now, tmax, shape, origin, fast);
}


double WaitTimeSampler::quantile(double p, const Rate &rate, double now,
                                 double tmax, const Rate *shape,
                                 double origin, bool fast)
{
    const double upper = horizon(now, tmax);

    // set up the problem; age-dependent problems live in age space
    currate = &rate;
    curshape = shape;
    curorigin = origin;
    curtarget = -log(1.0 - p);

    double lower, top;
    if (shape) {
        lower = now - origin;
        top = upper - origin;
    } else {
        lower = now;
        top = upper;
    }
    curstart = lower;

    // probability that the event happens at all before the horizon
    const double cumtop = cumulative(top);
    const double total = 1.0 - exp(-cumtop);

    // a tie (total == p) places the event at the horizon
    if (fast && total < p)
        return noEventTime(tmax);

    const double root = findRoot(lower, top, cumtop - curtarget);
    const double wait = root - lower;
    return (wait > 0.0) ? wait : 0.0;
}


double WaitTimeSampler::cumHazard(const Rate &rate, double now, double t)
{
    return integ.integrate(rate, now, t);
}


double WaitTimeSampler::cumAgeHazard(const Rate &scale, const Rate &shape,
                                     double origin, double age0, double age)
{
    const double base = integ.integrateInverse(scale, origin, age0, age);
    return pow(base, shape.eval(age));
}


double WaitTimeSampler::cumulative(double x)
{
    double cum;
    if (curshape)
        cum = cumAgeHazard(*currate, *curshape, curorigin, curstart, x);
    else
        cum = cumHazard(*currate, curstart, x);

    // extreme rates overflow the quadrature
    if (isnan(cum) || cum > HUGE_HAZARD)
        return HUGE_HAZARD;
    return cum;
}


double WaitTimeSampler::root_f(double x, void *params)
{
    WaitTimeSampler *sampler = (WaitTimeSampler*) params;
    return sampler->cumulative(x) - sampler->curtarget;
}


// Find x in [lower, upper] where the cumulative hazard reaches the target.
// The cumulative hazard is zero at 'lower'; 'fupper' is the root function
// at 'upper'.
double WaitTimeSampler::findRoot(double lower, double upper, double fupper)
{
    if (fupper == 0.0)
        return upper;

    // extend the bracket until it contains the root
    const double start = lower;
    double width = upper - start;
    if (width <= 0.0)
        width = 1.0;

    int expand = 0;
    while (fupper < 0.0 && expand < maxexpand) {
        // the old upper bound is still below the root
        lower = upper;
        width *= 2.0;
        upper = start + width;
        fupper = root_f(upper, this);
        if (fupper == 0.0)
            return upper;
        expand++;
    }

    // hazard too low to ever reach the target: the bound stands in for
    // the root
    if (fupper < 0.0) {
        printLog(LOG_HIGH, "waittime: root not bracketed after %d "
                 "expansions, using %e\n", expand, upper);
        return upper;
    }

    gsl_function func;
    func.function = &root_f;
    func.params = this;

    int status = gsl_root_fsolver_set(solver, &func, lower, upper);
    if (status != GSL_SUCCESS) {
        printLog(LOG_HIGH, "waittime: cannot start solver on [%e, %e]: %s\n",
                 lower, upper, gsl_strerror(status));
        return upper;
    }

    double root = upper;
    for (int iter=0; iter<maxiter; iter++) {
        status = gsl_root_fsolver_iterate(solver);
        root = gsl_root_fsolver_root(solver);
        if (status != GSL_SUCCESS)
            break;

        const double lo = gsl_root_fsolver_x_lower(solver);
        const double hi = gsl_root_fsolver_x_upper(solver);
        if (gsl_root_test_interval(lo, hi, epsabs, epsrel) == GSL_SUCCESS)
            break;
    }

    return root;
}


} // namespace divsim
