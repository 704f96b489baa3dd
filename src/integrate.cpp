/*=============================================================================

  DIVSIM - Diversification simulator
  Integration of rates

=============================================================================*/

// c++ headers
#include <math.h>

// 3rd party
#include <gsl/gsl_errno.h>
#include <gsl/gsl_integration.h>

// divsim headers
#include "integrate.h"
#include "logging.h"


namespace divsim {


RateIntegrator::RateIntegrator(int limit) :
    epsabs(1e-10),
    epsrel(1e-7),
    limit(limit),
    work(NULL),
    currate(NULL),
    curorigin(0.0)
{
    // GSL failures are reported through return codes instead
    gsl_set_error_handler_off();
    work = gsl_integration_workspace_alloc(limit);
}


RateIntegrator::~RateIntegrator()
{
    gsl_integration_workspace_free(work);
}


double RateIntegrator::rate_f(double x, void *params)
{
    RateIntegrator *integ = (RateIntegrator*) params;
    return integ->currate->eval(x);
}


double RateIntegrator::inv_rate_f(double x, void *params)
{
    RateIntegrator *integ = (RateIntegrator*) params;
    return 1.0 / integ->currate->eval(x + integ->curorigin);
}


double RateIntegrator::integrate(gsl_function *func, double a, double b)
{
    if (a == b)
        return 0.0;
    if (a > b)
        return -integrate(func, b, a);

    double result = 0.0, abserr = 0.0;
    int status = gsl_integration_qag(func, a, b, epsabs, epsrel, limit,
                                     GSL_INTEG_GAUSS21, work,
                                     &result, &abserr);

    if (status != GSL_SUCCESS) {
        printLog(LOG_HIGH, "integrate [%f, %f]: %s (result=%e, err=%e)\n",
                 a, b, gsl_strerror(status), result, abserr);
    }

    // integrands are nonnegative; NaN only arises from infinite rates
    if (isnan(result))
        return INFINITY;
    return result;
}


double RateIntegrator::integrate(const Rate &rate, double a, double b)
{
    if (rate.isConstant())
        return rate.value * (b - a);

    gsl_function func;
    func.function = &rate_f;
    func.params = this;
    currate = &rate;

    return integrate(&func, a, b);
}


double RateIntegrator::integrateInverse(const Rate &scale, double origin,
                                        double a, double b)
{
    if (scale.isConstant()) {
        if (a == b)
            return 0.0;
        return (b - a) / scale.value;
    }

    gsl_function func;
    func.function = &inv_rate_f;
    func.params = this;
    currate = &scale;
    curorigin = origin;

    return integrate(&func, a, b);
}


} // namespace divsim
