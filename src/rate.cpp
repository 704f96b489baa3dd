/*=============================================================================

  DIVSIM - Diversification simulator
  Rates: user specifications and normalized hazards

=============================================================================*/

// c++ headers
#include <math.h>

// 3rd party
#include <gsl/gsl_interp.h>

// divsim headers
#include "rate.h"
#include "logging.h"


namespace divsim {


//=============================================================================
// environmental data

bool EnvTable::load(const double *_times, const double *_values, int n)
{
    times.clear();
    values.clear();

    for (int i=0; i<n; i++) {
        if (!append(_times[i], _values[i])) {
            times.clear();
            values.clear();
            return false;
        }
    }
    return true;
}


bool EnvTable::append(double time, double value)
{
    if (!times.empty() && time <= times.back()) {
        printError("environment times must be strictly increasing (%f after %f)",
                   time, times.back());
        return false;
    }

    times.push_back(time);
    values.push_back(value);
    return true;
}


double EnvTable::eval(double t) const
{
    const int n = size();

    if (n == 0)
        return 0.0;
    if (n == 1 || t <= times[0])
        return values[0];
    if (t >= times[n-1])
        return values[n-1];

    // find i such that times[i] <= t < times[i+1]
    size_t i = gsl_interp_bsearch(&times[0], t, 0, n - 1);
    const double x1 = times[i], x2 = times[i+1];
    const double y1 = values[i], y2 = values[i+1];
    return y1 + (y2 - y1) * (t - x1) / (x2 - x1);
}


//=============================================================================
// normalized rates

double Rate::eval(double t) const
{
    switch (kind) {
    case RATE_CONST:
        return value;

    case RATE_TIME:
        return timefunc(t, userdata);

    case RATE_ENV:
        return envfunc(t, env.eval(t), userdata);

    case RATE_STEP: {
        // last shift at or before t
        const int n = shifts.size();
        if (n == 1 || t < shifts[1])
            return steps[0];
        if (t >= shifts[n-1])
            return steps[n-1];
        size_t i = gsl_interp_bsearch(&shifts[0], t, 0, n - 1);
        return steps[i];
    }

    default:
        return NAN;
    }
}


// convert shift times into increasing times from 0
static bool normalizeShifts(const vector<double> &shifts, double tmax,
                            vector<double> *out)
{
    const int n = shifts.size();
    out->assign(shifts.begin(), shifts.end());

    if (shifts[0] != 0.0) {
        if (isinf(tmax) || shifts[0] != tmax) {
            printError("first rate shift must be at 0 or at tmax (got %f)",
                       shifts[0]);
            return false;
        }

        // shifts are given backwards from tmax
        for (int i=0; i<n; i++)
            (*out)[i] = tmax - shifts[i];
    }

    for (int i=1; i<n; i++) {
        if ((*out)[i] <= (*out)[i-1]) {
            printError("rate shift times must be strictly monotonic");
            return false;
        }
    }

    return true;
}


bool makeRate(const RateSpec &spec, double tmax, const EnvTable *env,
              const vector<double> *shifts, Rate *rate)
{
    // shifts only make sense with a vector of rates
    if (spec.kind == SPEC_VECTOR) {
        if (!shifts) {
            printError("a vector of rates requires shift times");
            return false;
        }
    } else if (shifts) {
        printError("shift times given without a vector of rates");
        return false;
    }

    // environment only makes sense with an environment-aware function
    if (spec.kind == SPEC_ENV) {
        if (!env) {
            printError("rate function of time and environment requires "
                       "environmental data");
            return false;
        }
    } else if (env) {
        printError("environmental data given for a rate that does not "
                   "accept it");
        return false;
    }


    switch (spec.kind) {
    case SPEC_CONST:
        *rate = Rate(spec.value);
        return true;

    case SPEC_TIME:
        if (!spec.timefunc) {
            printError("rate function is missing");
            return false;
        }
        *rate = Rate(spec.timefunc, spec.userdata);
        return true;

    case SPEC_ENV:
        if (!spec.envfunc) {
            printError("rate function is missing");
            return false;
        }
        if (env->size() == 0) {
            printError("environmental data is empty");
            return false;
        }
        *rate = Rate();
        rate->kind = RATE_ENV;
        rate->envfunc = spec.envfunc;
        rate->userdata = spec.userdata;
        rate->env = *env;
        return true;

    case SPEC_VECTOR: {
        if (spec.values.size() == 0 ||
            spec.values.size() != shifts->size())
        {
            printError("number of rates (%d) and shift times (%d) differ",
                       int(spec.values.size()), int(shifts->size()));
            return false;
        }

        vector<double> times;
        if (!normalizeShifts(*shifts, tmax, &times))
            return false;

        *rate = Rate();
        rate->kind = RATE_STEP;
        rate->shifts = times;
        rate->steps = spec.values;
        return true;
    }

    default:
        printError("unknown rate specification");
        return false;
    }
}


} // namespace divsim
