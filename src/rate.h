/*=============================================================================

  DIVSIM - Diversification simulator
  Rates: user specifications and normalized hazards

=============================================================================*/

#ifndef DIVSIM_RATE_H
#define DIVSIM_RATE_H

#include <vector>


namespace divsim {

using namespace std;


// rate as a function of time
typedef double (*TimeRateFunc) (double t, void *userdata);

// rate as a function of time and an environmental variable
typedef double (*EnvRateFunc) (double t, double env, void *userdata);


//=============================================================================
// environmental data

// (time, value) samples of an environmental variable on the simulation clock.
// Evaluated by linear interpolation, clamped outside of the sampled range.
class EnvTable
{
public:
    EnvTable() {}

    // Replace the table with 'n' samples. On error the table is left empty
    // and false is returned.
    bool load(const double *_times, const double *_values, int n);

    // times must be appended in strictly increasing order
    bool append(double time, double value);
    double eval(double t) const;

    int size() const { return int(times.size()); }

    vector<double> times;
    vector<double> values;
};


//=============================================================================
// user rate specification

// kinds of rate specifications
enum {
    SPEC_CONST,
    SPEC_VECTOR,
    SPEC_TIME,
    SPEC_ENV
};


class RateSpec
{
public:
    // constant rate
    RateSpec(double _value=0.0) :
        kind(SPEC_CONST),
        value(_value),
        timefunc(NULL),
        envfunc(NULL),
        userdata(NULL)
    {}

    // rates of a step function, paired with shift times in makeRate()
    RateSpec(const vector<double> &_values) :
        kind(SPEC_VECTOR),
        value(0.0),
        values(_values),
        timefunc(NULL),
        envfunc(NULL),
        userdata(NULL)
    {}

    RateSpec(TimeRateFunc func, void *_userdata) :
        kind(SPEC_TIME),
        value(0.0),
        timefunc(func),
        envfunc(NULL),
        userdata(_userdata)
    {}

    RateSpec(EnvRateFunc func, void *_userdata) :
        kind(SPEC_ENV),
        value(0.0),
        timefunc(NULL),
        envfunc(func),
        userdata(_userdata)
    {}

    bool isScalar() const { return kind == SPEC_CONST; }

    int kind;
    double value;
    vector<double> values;
    TimeRateFunc timefunc;
    EnvRateFunc envfunc;
    void *userdata;
};


//=============================================================================
// normalized rate

// kinds of normalized rates
enum {
    RATE_CONST,
    RATE_TIME,
    RATE_ENV,
    RATE_STEP
};


class Rate
{
public:
    Rate(double _value=0.0) :
        kind(RATE_CONST),
        value(_value),
        timefunc(NULL),
        envfunc(NULL),
        userdata(NULL)
    {}

    Rate(TimeRateFunc func, void *_userdata) :
        kind(RATE_TIME),
        value(0.0),
        timefunc(func),
        envfunc(NULL),
        userdata(_userdata)
    {}

    double eval(double t) const;

    inline double operator()(double t) const
    { return eval(t); }

    bool isConstant() const { return kind == RATE_CONST; }

    int kind;

    // RATE_CONST
    double value;

    // RATE_TIME, RATE_ENV
    TimeRateFunc timefunc;
    EnvRateFunc envfunc;
    void *userdata;
    EnvTable env;

    // RATE_STEP: value steps[i] holds on [shifts[i], shifts[i+1])
    vector<double> shifts;
    vector<double> steps;
};


// Normalize a rate specification into a Rate.
//
// env    - environmental data, required by (and only allowed for) SPEC_ENV
// shifts - shift times, required by (and only allowed for) SPEC_VECTOR.
//          Either increasing from 0, or decreasing from tmax.
//
// Returns false on an invalid combination.
bool makeRate(const RateSpec &spec, double tmax, const EnvTable *env,
              const vector<double> *shifts, Rate *rate);


} // namespace divsim

#endif // DIVSIM_RATE_H
