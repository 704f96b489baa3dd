/*=============================================================================

  DIVSIM - Diversification simulator
  Integration of rates

=============================================================================*/

#ifndef DIVSIM_INTEGRATE_H
#define DIVSIM_INTEGRATE_H

// 3rd party
#include <gsl/gsl_integration.h>

// divsim headers
#include "common.h"
#include "rate.h"


namespace divsim {


// Adaptive Gauss-Kronrod quadrature of rates over time.
// Each integrator owns a GSL workspace of 'limit' subintervals.
class RateIntegrator
{
public:
    RateIntegrator(int limit=BD_INTEGRATION_LIMIT);
    ~RateIntegrator();

    // integral of rate(x) for x in [a, b]
    double integrate(const Rate &rate, double a, double b);

    // integral of 1 / scale(x + origin) for x in [a, b]
    double integrateInverse(const Rate &scale, double origin,
                            double a, double b);

    int getLimit() const { return limit; }

    // quadrature tolerances
    double epsabs;
    double epsrel;

protected:
    double integrate(gsl_function *func, double a, double b);

    static double rate_f(double x, void *params);
    static double inv_rate_f(double x, void *params);

    int limit;
    gsl_integration_workspace *work;

    // integrand currently being evaluated
    const Rate *currate;
    double curorigin;

private:
    // not copyable: owns the workspace
    RateIntegrator(const RateIntegrator &other);
    RateIntegrator &operator=(const RateIntegrator &other);
};


} // namespace divsim

#endif // DIVSIM_INTEGRATE_H
