/*=============================================================================

  DIVSIM - Diversification simulator
  Birth-death simulation engines

=============================================================================*/

// c++ headers
#include <math.h>

// divsim headers
#include "bdsim_engine.h"
#include "common.h"
#include "logging.h"
#include "waittime.h"


namespace divsim {


//=============================================================================
// waiting time drawers

// draws the waiting times of one lineage
class WaitDrawer
{
public:
    WaitDrawer() {}
    virtual ~WaitDrawer() {}

    virtual double speciationWait(double now, double origin) = 0;
    virtual double extinctionWait(double now, double origin) = 0;
};


class ConstantWaitDrawer : public WaitDrawer
{
public:
    ConstantWaitDrawer(double lambda, double mu) :
        lambda(lambda),
        mu(mu)
    {}

    virtual double speciationWait(double now, double origin)
    {
        return expovariate(lambda);
    }

    virtual double extinctionWait(double now, double origin)
    {
        return expovariate(mu);
    }

    double lambda;
    double mu;
};


class GeneralWaitDrawer : public WaitDrawer
{
public:
    GeneralWaitDrawer(const Rate &lambda, const Rate &mu,
                      const Rate *lshape, const Rate *mshape,
                      double tmax, const BdSimParams &params) :
        lambda(lambda),
        mu(mu),
        lshape(lshape),
        mshape(mshape),
        tmax(tmax),
        fastSpec(params.fast),
        fastExt(params.fast && !params.trueExt)
    {}

    virtual double speciationWait(double now, double origin)
    {
        return draw(lambda, lshape, now, origin, fastSpec);
    }

    virtual double extinctionWait(double now, double origin)
    {
        return draw(mu, mshape, now, origin, fastExt);
    }

    double draw(const Rate &rate, const Rate *shape, double now,
                double origin, bool fast)
    {
        if (!shape && rate.isConstant())
            return expovariate(rate.value);

        // a vanishing rate (or scale) does not fire from here
        if (rate.eval(now) <= 0.0)
            return INFINITY;

        return sampler.sampleOne(rate, now, tmax, shape, origin, fast);
    }

    const Rate &lambda;
    const Rate &mu;
    const Rate *lshape;
    const Rate *mshape;
    double tmax;
    bool fastSpec;
    bool fastExt;
    WaitTimeSampler sampler;
};


//=============================================================================
// validation

bool checkBdSimParams(int n0, double tmax, const BdSimParams &params)
{
    if (n0 <= 0) {
        printError("initial number of species must be positive (got %d)", n0);
        return false;
    }

    if (!(tmax > 0.0) || isinf(tmax)) {
        printError("tmax must be positive and finite (got %f)", tmax);
        return false;
    }

    if (isnan(params.nmin) || isnan(params.nmax) ||
        params.nmin < 0 || params.nmin > params.nmax)
    {
        printError("invalid range of final species counts [%f, %f]",
                   params.nmin, params.nmax);
        return false;
    }

    if (params.maxretries < 0) {
        printError("maximum number of retries cannot be negative (%d)",
                   params.maxretries);
        return false;
    }

    return true;
}


// Check a rate for negative values on a grid over [0, tmax].
// Long horizons use a coarser grid of at most BD_MAX_CHECK_STEPS steps.
static bool checkRate(const Rate &rate, double tmax, const char *name,
                      bool positive=false)
{
    double step = BD_CHECK_STEP;
    if (tmax / step > BD_MAX_CHECK_STEPS)
        step = tmax / BD_MAX_CHECK_STEPS;
    const int n = int(floor(tmax / step + 1e-9));

    for (int i=0; i<=n; i++) {
        const double t = i * step;
        const double val = rate.eval(t);

        if (isnan(val) || val < 0.0 || (positive && val == 0.0)) {
            printError("%s cannot be %s (%f at time %f)", name,
                       positive ? "non-positive" : "negative", val, t);
            return false;
        }
    }

    return true;
}


//=============================================================================
// simulation

// Run one pass of the process forward from time 0.
// Returns false if the pass was abandoned for exceeding 'maxsize' lineages.
static bool simulateOnce(int n0, double tmax, bool trueExt, double maxsize,
                         WaitDrawer *drawer, ExtendArray<Lineage> *lineages)
{
    lineages->clear();
    for (int i=0; i<n0; i++)
        lineages->append(Lineage(i + 1, 0.0, BD_NO_PARENT));

    // lineages are processed in birth order, so parents precede children
    for (int i=0; i<lineages->size(); i++) {
        const int id = i + 1;
        const double origin = (*lineages)[i].speciation;
        double tnow = origin;

        double waitS = drawer->speciationWait(tnow, origin);
        const double texp = tnow + drawer->extinctionWait(tnow, origin);
        const double tend = (texp < tmax) ? texp : tmax;

        // speciate until the lineage dies or time runs out
        while (tnow + waitS < tend) {
            tnow += waitS;
            lineages->append(Lineage(lineages->size() + 1, tnow, id));
            waitS = drawer->speciationWait(tnow, origin);
        }

        if (lineages->size() > maxsize)
            return false;

        Lineage &lin = (*lineages)[i];
        if (texp > tmax) {
            lin.extant = true;
            lin.hasExtinction = trueExt && !isinf(texp);
        } else {
            lin.extant = false;
            lin.hasExtinction = true;
        }
        lin.extinction = texp;
    }

    return true;
}


// convert times so that tmax is the origin and 0 the present
static void invertTimes(double tmax, ExtendArray<Lineage> *lineages)
{
    for (int i=0; i<lineages->size(); i++) {
        Lineage &lin = (*lineages)[i];
        lin.speciation = tmax - lin.speciation;
        if (lin.hasExtinction)
            lin.extinction = tmax - lin.extinction;
    }
}


// rejection loop shared by all engines
static int runBdSim(int n0, double tmax, const BdSimParams &params,
                    WaitDrawer *drawer, BdSim *sim)
{
    Timer timer;

    sim->clear();
    sim->tmax = tmax;

    // passes counted on all lineages can stop growing at nmax
    const double maxsize = params.extantOnly ? INFINITY : params.nmax;

    for (int attempt=0; attempt<=params.maxretries; attempt++) {
        sim->attempts = attempt + 1;

        if (!simulateOnce(n0, tmax, params.trueExt, maxsize, drawer,
                          &sim->lineages))
        {
            printLog(LOG_HIGH, "bdsim: attempt %d abandoned at %d lineages\n",
                     sim->attempts, sim->lineages.size());
            continue;
        }

        const int size = params.extantOnly ? sim->countExtant() :
                                             sim->size();
        printLog(LOG_HIGH, "bdsim: attempt %d has %d lineages\n",
                 sim->attempts, size);

        if (size >= params.nmin && size <= params.nmax) {
            invertTimes(tmax, &sim->lineages);
            sim->status = BDSIM_OK;
            printLog(LOG_MEDIUM, "bdsim: %d lineages after %d attempts "
                     "(%f s)\n", sim->size(), sim->attempts, timer.time());
            return BDSIM_OK;
        }
    }

    sim->lineages.clear();
    sim->status = BDSIM_EXHAUSTED;
    printWarning("no simulation reached between %g and %g species in %d "
                 "attempts", params.nmin, params.nmax, sim->attempts);
    return BDSIM_EXHAUSTED;
}


int bdSimConstant(int n0, double lambda, double mu, double tmax,
                  const BdSimParams &params, BdSim *sim)
{
    if (!checkBdSimParams(n0, tmax, params) ||
        !checkRate(Rate(lambda), tmax, "speciation rate") ||
        !checkRate(Rate(mu), tmax, "extinction rate"))
    {
        sim->clear();
        sim->status = BDSIM_INVALID;
        return BDSIM_INVALID;
    }

    ConstantWaitDrawer drawer(lambda, mu);
    return runBdSim(n0, tmax, params, &drawer, sim);
}


int bdSimGeneral(int n0, const Rate &lambda, const Rate &mu, double tmax,
                 const Rate *lshape, const Rate *mshape,
                 const BdSimParams &params, BdSim *sim)
{
    if (!checkBdSimParams(n0, tmax, params) ||
        !checkRate(lambda, tmax, "speciation rate") ||
        !checkRate(mu, tmax, "extinction rate") ||
        (lshape && !checkRate(*lshape, tmax, "speciation shape", true)) ||
        (mshape && !checkRate(*mshape, tmax, "extinction shape", true)))
    {
        sim->clear();
        sim->status = BDSIM_INVALID;
        return BDSIM_INVALID;
    }

    if (lshape)
        printLog(LOG_LOW, "bdsim: speciation shape given, speciation rate "
                 "is a Weibull scale (1/rate)\n");
    if (mshape)
        printLog(LOG_LOW, "bdsim: extinction shape given, extinction rate "
                 "is a Weibull scale (1/rate)\n");

    GeneralWaitDrawer drawer(lambda, mu, lshape, mshape, tmax, params);
    return runBdSim(n0, tmax, params, &drawer, sim);
}


} // namespace divsim
