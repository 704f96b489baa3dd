/*=============================================================================

  DIVSIM - Diversification simulator
  Lineages and simulation results

=============================================================================*/

// c++ headers
#include <algorithm>

// divsim headers
#include "lineage.h"
#include "logging.h"


namespace divsim {


int BdSim::countExtant() const
{
    int count = 0;
    for (int i=0; i<lineages.size(); i++)
        count += int(lineages[i].extant);
    return count;
}


void getColumns(const BdSim &sim, BdColumns *cols)
{
    const int n = sim.size();

    cols->te.resize(n);
    cols->ts.resize(n);
    cols->par.resize(n);
    cols->extant.resize(n);

    for (int i=0; i<n; i++) {
        const Lineage &lin = sim.lineages[i];
        cols->te[i] = lin.hasExtinction ? lin.extinction : BD_EXTANT_TIME;
        const bool atOrigin = lin.isRoot() && lin.speciation == sim.tmax;
        cols->ts[i] = atOrigin ? sim.tmax + BD_ROOT_PAD : lin.speciation;
        cols->par[i] = lin.parent;
        cols->extant[i] = lin.extant;
    }
}


bool isParentOrdered(const BdSim &sim)
{
    for (int i=0; i<sim.size(); i++) {
        const Lineage &lin = sim.lineages[i];
        if (lin.id != i + 1)
            return false;
        if (!lin.isRoot() && (lin.parent < 1 || lin.parent >= lin.id))
            return false;
    }
    return true;
}


//=============================================================================
// clades

bool findLineage(const BdSim &sim, int s, Clade *clade)
{
    const int n = sim.size();

    if (s < 1 || s > n) {
        printError("lineage %d is not in the simulation (%d lineages)", s, n);
        return false;
    }

    // children of each lineage, in birth order
    vector<vector<int> > children(n + 1);
    for (int i=0; i<n; i++) {
        const Lineage &lin = sim.lineages[i];
        if (!lin.isRoot())
            children[lin.parent].push_back(lin.id);
    }

    // collect the clade one generation at a time
    vector<int> &lin = clade->lin;
    lin.clear();
    lin.push_back(s);

    vector<int> gen(1, s);
    vector<int> next;
    while (gen.size() > 0) {
        next.clear();
        for (unsigned int i=0; i<gen.size(); i++)
            next.insert(next.end(), children[gen[i]].begin(),
                        children[gen[i]].end());
        sort(next.begin(), next.end());
        lin.insert(lin.end(), next.begin(), next.end());
        gen.swap(next);
    }

    // position of each original id within the clade
    vector<int> pos(n + 1, 0);
    for (unsigned int i=0; i<lin.size(); i++)
        pos[lin[i]] = i + 1;

    BdSim &sub = clade->sim;
    sub.clear();
    sub.tmax = sim.tmax;
    sub.attempts = sim.attempts;
    sub.status = sim.status;

    for (unsigned int i=0; i<lin.size(); i++) {
        Lineage l = sim.getLineage(lin[i]);
        l.id = i + 1;
        l.parent = (i == 0) ? BD_NO_PARENT : pos[l.parent];
        sub.lineages.append(l);
    }

    return true;
}


bool findLineages(const BdSim &sim, const vector<int> &ids,
                  vector<Clade> *clades)
{
    vector<int> starts(ids);

    // default to every root lineage
    if (starts.size() == 0) {
        for (int i=0; i<sim.size(); i++) {
            if (sim.lineages[i].isRoot())
                starts.push_back(sim.lineages[i].id);
        }
    }

    clades->clear();
    clades->resize(starts.size());
    for (unsigned int i=0; i<starts.size(); i++) {
        if (!findLineage(sim, starts[i], &(*clades)[i])) {
            clades->clear();
            return false;
        }
    }

    return true;
}


} // namespace divsim
