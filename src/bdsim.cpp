/*=============================================================================

  DIVSIM - Diversification simulator
  Birth-death simulation of lineages

=============================================================================*/

// divsim headers
#include "bdsim.h"
#include "logging.h"


namespace divsim {


bool useConstantEngine(const RateSpec &pp, const RateSpec &qq,
                       const RateOptions &popts, const RateOptions &qopts)
{
    return pp.isScalar() && qq.isScalar() && popts.empty() && qopts.empty();
}


// normalize one rate and its optional shape
static bool buildRate(const RateSpec &spec, const RateOptions &opts,
                      double tmax, const char *name,
                      Rate *rate, Rate *shape)
{
    if (!makeRate(spec, tmax, opts.env, opts.shifts, rate)) {
        printError("invalid %s rate", name);
        return false;
    }

    if (opts.shape && !makeRate(*opts.shape, tmax, NULL, NULL, shape)) {
        printError("invalid %s shape", name);
        return false;
    }

    return true;
}


int bdSim(int n0, const RateSpec &pp, const RateSpec &qq, double tmax,
          const BdSimParams &params, BdSim *sim,
          const RateOptions &popts, const RateOptions &qopts)
{
    if (useConstantEngine(pp, qq, popts, qopts)) {
        printLog(LOG_MEDIUM, "bdsim: constant rates %f %f\n",
                 pp.value, qq.value);
        return bdSimConstant(n0, pp.value, qq.value, tmax, params, sim);
    }

    Rate lambda, mu, lshape, mshape;
    if (!buildRate(pp, popts, tmax, "speciation", &lambda, &lshape) ||
        !buildRate(qq, qopts, tmax, "extinction", &mu, &mshape))
    {
        sim->clear();
        sim->status = BDSIM_INVALID;
        return BDSIM_INVALID;
    }

    printLog(LOG_MEDIUM, "bdsim: general rates (kinds %d %d)\n",
             lambda.kind, mu.kind);
    return bdSimGeneral(n0, lambda, mu, tmax,
                        popts.shape ? &lshape : NULL,
                        qopts.shape ? &mshape : NULL,
                        params, sim);
}


} // namespace divsim
