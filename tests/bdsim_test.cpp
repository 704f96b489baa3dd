/*=============================================================================

  DIVSIM - Diversification simulator
  Tests for birth-death simulation

=============================================================================*/

#include <assert.h>
#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <vector>

#include "bdsim.h"
#include "bdsim_engine.h"
#include "lineage.h"
#include "logging.h"
#include "rate.h"
#include "test_util.h"

using namespace divsim;


namespace {

double risingRate(double t, void *userdata)
{
    return 0.03 + 0.005 * t;
}

double fallingRate(double t, void *userdata)
{
    // negative after t = 5
    return 0.1 - 0.02 * t;
}

double zeroRate(double t, void *userdata)
{
    return 0.0;
}

double envRate(double t, double env, void *userdata)
{
    return 0.02 * env;
}


// structural checks of a finished simulation
void CheckSim(const BdSim &sim, int n0)
{
    const double tmax = sim.tmax;

    assert(sim.status == BDSIM_OK);
    assert(sim.size() >= n0);
    assert(isParentOrdered(sim));

    for (int i=0; i<sim.size(); i++) {
        const Lineage &lin = sim.lineages[i];

        assert(lin.speciation >= 0.0 && lin.speciation <= tmax);
        if (i < n0) {
            assert(lin.isRoot());
            assert(lin.speciation == tmax);
        } else {
            assert(!lin.isRoot());
        }

        if (!lin.extant) {
            assert(lin.hasExtinction);
            assert(lin.extinction >= 0.0);
            assert(lin.extinction <= lin.speciation);
        } else if (lin.hasExtinction) {
            assert(lin.extinction < 0.0);
        }

        // born while the parent was alive
        if (!lin.isRoot()) {
            const Lineage &par = sim.getLineage(lin.parent);
            assert(lin.speciation <= par.speciation);
            if (!par.extant)
                assert(lin.speciation >= par.extinction);
        }
    }
}


// every lineage descends from lineage 1
bool IsSingleTree(const BdSim &sim)
{
    for (int i=0; i<sim.size(); i++) {
        int id = sim.lineages[i].id;
        while (!sim.getLineage(id).isRoot())
            id = sim.getLineage(id).parent;
        if (id != 1)
            return false;
    }
    return true;
}


void TestConstantEndToEnd()
{
    srand(42);
    BdSimParams params;
    params.nmin = 2;

    BdSim sim;
    assert(bdSim(1, RateSpec(0.11), RateSpec(0.08), 40.0, params, &sim) ==
           BDSIM_OK);
    assert(sim.size() >= 2);
    assert(sim.attempts >= 1);
    assert(sim.tmax == 40.0);
    CheckSim(sim, 1);
    assert(IsSingleTree(sim));
}


void TestGeneralEndToEnd()
{
    srand(43);
    BdSimParams params;
    params.nmin = 2;

    // constant rates on the general engine
    BdSim sim;
    assert(bdSimGeneral(1, Rate(0.11), Rate(0.08), 40.0, NULL, NULL,
                        params, &sim) == BDSIM_OK);
    assert(sim.size() >= 2);
    CheckSim(sim, 1);
    assert(IsSingleTree(sim));

    // time-varying speciation through the dispatcher
    assert(bdSim(1, RateSpec(risingRate, NULL), RateSpec(0.05), 40.0,
                 params, &sim) == BDSIM_OK);
    assert(sim.size() >= 2);
    CheckSim(sim, 1);
    assert(IsSingleTree(sim));
}


void TestStepFunctionRates()
{
    srand(44);
    const double m[] = {0.06, 0.09, 0.11};
    const double s[] = {0.0, 15.0, 25.0};
    vector<double> mus(m, m + 3);
    vector<double> shifts(s, s + 3);

    BdSimParams params;
    params.nmin = 2;

    BdSim sim;
    assert(bdSim(1, RateSpec(0.12), RateSpec(mus), 40.0, params, &sim,
                 RateOptions(), RateOptions(NULL, NULL, &shifts)) ==
           BDSIM_OK);
    CheckSim(sim, 1);

    // the same shifts measured from the origin
    const double sb[] = {40.0, 25.0, 15.0};
    vector<double> back(sb, sb + 3);
    assert(bdSim(1, RateSpec(0.12), RateSpec(mus), 40.0, params, &sim,
                 RateOptions(), RateOptions(NULL, NULL, &back)) ==
           BDSIM_OK);
    CheckSim(sim, 1);
}


void TestEnvironmentalRates()
{
    srand(45);
    const double t[] = {0.0, 20.0, 40.0};
    const double v[] = {5.0, 10.0, 5.0};
    EnvTable env;
    assert(env.load(t, v, 3));

    BdSimParams params;
    params.nmin = 2;

    BdSim sim;
    assert(bdSim(1, RateSpec(envRate, NULL), RateSpec(0.05), 40.0, params,
                 &sim, RateOptions(NULL, &env)) == BDSIM_OK);
    CheckSim(sim, 1);
}


void TestMultipleRoots()
{
    srand(46);
    BdSimParams params;

    BdSim sim;
    assert(bdSim(5, RateSpec(0.1), RateSpec(0.1), 10.0, params, &sim) ==
           BDSIM_OK);
    CheckSim(sim, 5);

    vector<Clade> clades;
    assert(findLineages(sim, vector<int>(), &clades));
    assert(clades.size() == 5);

    int total = 0;
    for (unsigned int i=0; i<clades.size(); i++)
        total += clades[i].sim.size();
    assert(total == sim.size());
}


void TestSizeRange()
{
    srand(47);
    BdSimParams params;
    params.nmin = 5;
    params.nmax = 15;

    BdSim sim;
    for (int i=0; i<10; i++) {
        assert(bdSimConstant(1, 0.2, 0.05, 20.0, params, &sim) == BDSIM_OK);
        assert(sim.size() >= 5 && sim.size() <= 15);
        CheckSim(sim, 1);
    }

    params.extantOnly = true;
    params.nmin = 3;
    params.nmax = 10;
    for (int i=0; i<10; i++) {
        assert(bdSimConstant(1, 0.2, 0.05, 20.0, params, &sim) == BDSIM_OK);
        assert(sim.countExtant() >= 3 && sim.countExtant() <= 10);
        CheckSim(sim, 1);
    }
}


void TestRetriesExhausted()
{
    srand(48);
    BdSimParams params;
    params.nmin = 1000;
    params.maxretries = 5;

    BdSim sim;
    assert(bdSimConstant(2, 0.0, 0.1, 10.0, params, &sim) ==
           BDSIM_EXHAUSTED);
    assert(sim.status == BDSIM_EXHAUSTED);
    assert(sim.attempts == 6);
    assert(sim.size() == 0);

    Rate zero(zeroRate, NULL);
    assert(bdSimGeneral(2, zero, Rate(0.1), 10.0, NULL, NULL, params,
                        &sim) == BDSIM_EXHAUSTED);
    assert(sim.attempts == 6);
    assert(sim.size() == 0);

    // no retries at all
    params.maxretries = 0;
    assert(bdSimConstant(2, 0.0, 0.1, 10.0, params, &sim) ==
           BDSIM_EXHAUSTED);
    assert(sim.attempts == 1);
}


void TestOversizedPassesAbandoned()
{
    // pure birth at rate 1 would reach e^20 lineages
    srand(49);
    BdSimParams params;
    params.nmax = 50;
    params.maxretries = 3;

    BdSim sim;
    assert(bdSimConstant(1, 1.0, 0.0, 20.0, params, &sim) ==
           BDSIM_EXHAUSTED);
    assert(sim.attempts == 4);
    assert(sim.size() == 0);
}


void TestInvalidInput()
{
    BdSimParams params;
    BdSim sim;

    assert(bdSimConstant(0, 0.1, 0.05, 10.0, params, &sim) == BDSIM_INVALID);
    assert(sim.status == BDSIM_INVALID);
    assert(sim.size() == 0);

    assert(bdSimConstant(1, 0.1, 0.05, -1.0, params, &sim) ==
           BDSIM_INVALID);
    assert(bdSimConstant(1, 0.1, 0.05, INFINITY, params, &sim) ==
           BDSIM_INVALID);
    assert(bdSimConstant(1, -0.1, 0.05, 10.0, params, &sim) ==
           BDSIM_INVALID);

    // rate turning negative
    assert(bdSim(1, RateSpec(fallingRate, NULL), RateSpec(0.05), 10.0,
                 params, &sim) == BDSIM_INVALID);

    // zero shape
    RateSpec zeroShape(0.0);
    assert(bdSim(1, RateSpec(0.1), RateSpec(10.0), 10.0, params, &sim,
                 RateOptions(), RateOptions(&zeroShape)) == BDSIM_INVALID);

    // vector of rates without shift times
    vector<double> mus(2, 0.05);
    assert(bdSim(1, RateSpec(0.1), RateSpec(mus), 10.0, params, &sim) ==
           BDSIM_INVALID);

    // malformed range
    BdSimParams bad;
    bad.nmin = 10;
    bad.nmax = 5;
    assert(bdSimConstant(1, 0.1, 0.05, 10.0, bad, &sim) == BDSIM_INVALID);

    bad = BdSimParams();
    bad.nmin = NAN;
    assert(!checkBdSimParams(1, 10.0, bad));

    bad = BdSimParams();
    bad.maxretries = -1;
    assert(!checkBdSimParams(1, 10.0, bad));

    assert(checkBdSimParams(1, 10.0, BdSimParams()));
}


void TestLongHorizon()
{
    // rates are checked on a coarser grid when tmax is very long
    BdSimParams params;
    BdSim sim;

    assert(bdSimConstant(1, 0.0, 0.0, 1e12, params, &sim) == BDSIM_OK);
    assert(sim.size() == 1);
    assert(sim.getLineage(1).extant);
    assert(sim.getLineage(1).speciation == 1e12);

    assert(bdSimConstant(1, -0.1, 0.0, 1e12, params, &sim) ==
           BDSIM_INVALID);

    // negative only late in the horizon, still on the grid
    assert(bdSim(1, RateSpec(fallingRate, NULL), RateSpec(0.0), 1e9,
                 params, &sim) == BDSIM_INVALID);
}


void TestEngineChoice()
{
    vector<double> rates(2, 0.1);
    vector<double> shifts(2, 0.0);
    RateSpec shape(1.0);

    assert(useConstantEngine(RateSpec(0.1), RateSpec(0.05), RateOptions(),
                             RateOptions()));
    assert(!useConstantEngine(RateSpec(risingRate, NULL), RateSpec(0.05),
                              RateOptions(), RateOptions()));
    assert(!useConstantEngine(RateSpec(0.1), RateSpec(rates), RateOptions(),
                              RateOptions(NULL, NULL, &shifts)));
    assert(!useConstantEngine(RateSpec(0.1), RateSpec(10.0), RateOptions(),
                              RateOptions(&shape)));
}


void TestAgeDependentExtinction()
{
    // with shape 1 and scale 10, lifespans are exponential with rate 0.1
    srand(50);
    RateSpec shape(1.0);
    BdSimParams params;
    params.trueExt = true;

    const int n = 1000;
    vector<double> lifespans;
    BdSim sim;

    while (int(lifespans.size()) < n) {
        assert(bdSim(20, RateSpec(0.1), RateSpec(10.0), 20.0, params, &sim,
                     RateOptions(), RateOptions(&shape)) == BDSIM_OK);
        CheckSim(sim, 20);

        for (int i=0; i<sim.size() && int(lifespans.size()) < n; i++) {
            const Lineage &lin = sim.lineages[i];
            assert(lin.hasExtinction);
            lifespans.push_back(lin.speciation - lin.extinction);
        }
    }

    double rate = 0.1;
    assert(ksDistance(lifespans, expCdf, &rate) < ksCritical(n));
}


void TestTrueExtinction()
{
    srand(51);
    BdSimParams params;
    params.nmin = 2;

    // survivors keep their drawn extinction time, past the present
    params.trueExt = true;
    BdSim sim;
    assert(bdSimConstant(1, 0.2, 0.05, 20.0, params, &sim) == BDSIM_OK);
    CheckSim(sim, 1);
    for (int i=0; i<sim.size(); i++) {
        const Lineage &lin = sim.lineages[i];
        assert(lin.hasExtinction);
        if (lin.extant)
            assert(lin.extinction < 0.0);
    }

    // otherwise survivors have no extinction time
    params.trueExt = false;
    assert(bdSimConstant(1, 0.2, 0.05, 20.0, params, &sim) == BDSIM_OK);
    BdColumns cols;
    getColumns(sim, &cols);
    assert(cols.ts[0] == 20.0 + BD_ROOT_PAD);
    assert(cols.par[0] == BD_NO_PARENT);
    for (int i=0; i<sim.size(); i++) {
        const Lineage &lin = sim.lineages[i];
        assert(lin.hasExtinction == !lin.extant);
        if (lin.extant)
            assert(cols.te[i] == BD_EXTANT_TIME);
        else
            assert(cols.te[i] == lin.extinction);
    }
}


void TestLogging()
{
    FILE *stream = tmpfile();
    assert(stream != NULL);

    openLogFile(stream);
    setLogLevel(LOG_MEDIUM);
    assert(isLogLevel(LOG_LOW));
    assert(!isLogLevel(LOG_HIGH));

    srand(52);
    BdSim sim;
    assert(bdSim(1, RateSpec(0.1), RateSpec(0.05), 10.0, BdSimParams(),
                 &sim) == BDSIM_OK);
    assert(ftell(stream) > 0);

    closeLogFile();
    assert(getLogFile() == stderr);
    fclose(stream);
    setLogLevel(LOG_QUIET);
}

} // namespace


int main()
{
    setLogLevel(LOG_QUIET);

    TestConstantEndToEnd();
    TestGeneralEndToEnd();
    TestStepFunctionRates();
    TestEnvironmentalRates();
    TestMultipleRoots();
    TestSizeRange();
    TestRetriesExhausted();
    TestOversizedPassesAbandoned();
    TestInvalidInput();
    TestLongHorizon();
    TestEngineChoice();
    TestAgeDependentExtinction();
    TestTrueExtinction();
    TestLogging();

    printf("bdsim_test: pass\n");
    return 0;
}
