/*=============================================================================

  DIVSIM - Diversification simulator
  Lineages and simulation results

=============================================================================*/

#ifndef DIVSIM_LINEAGE_H
#define DIVSIM_LINEAGE_H

#include <vector>

#include "common.h"
#include "ExtendArray.h"


namespace divsim {

using namespace std;


// simulation outcomes
enum {
    BDSIM_OK = 0,
    BDSIM_INVALID,
    BDSIM_EXHAUSTED
};


// One species of a simulation.
// Ids follow birth order starting at 1. In a finished simulation times are
// measured backwards from tmax (the origin) to 0 (the present).
class Lineage
{
public:
    Lineage(int _id=0, double _speciation=0.0, int _parent=BD_NO_PARENT) :
        id(_id),
        speciation(_speciation),
        extinction(0.0),
        hasExtinction(false),
        parent(_parent),
        extant(true)
    {}

    bool isRoot() const { return parent == BD_NO_PARENT; }

    int id;
    double speciation;
    double extinction;     // only meaningful when hasExtinction is set
    bool hasExtinction;
    int parent;
    bool extant;
};


// result of a birth-death simulation
class BdSim
{
public:
    BdSim() :
        tmax(0.0),
        attempts(0),
        status(BDSIM_OK)
    {}

    void clear()
    {
        lineages.clear();
        attempts = 0;
        status = BDSIM_OK;
    }

    int size() const { return lineages.size(); }
    int countExtant() const;

    // lineage by 1-based id
    Lineage &getLineage(int id) { return lineages[id - 1]; }
    const Lineage &getLineage(int id) const { return lineages[id - 1]; }

    ExtendArray<Lineage> lineages;
    double tmax;
    int attempts;
    int status;
};


// Aligned columns of a simulation, with the conventional sentinels:
// survivors without a recorded extinction have te = BD_EXTANT_TIME,
// lineages born at the origin (tmax) have ts = tmax + BD_ROOT_PAD, and
// roots have par = BD_NO_PARENT. The founder of an extracted clade is a
// root but keeps its own speciation time.
class BdColumns
{
public:
    vector<double> te;
    vector<double> ts;
    vector<int> par;
    vector<bool> extant;
};

void getColumns(const BdSim &sim, BdColumns *cols);


// true if every parent precedes its child
bool isParentOrdered(const BdSim &sim);


//=============================================================================
// clades

// a clade of a simulation, with the original ids of its lineages
class Clade
{
public:
    BdSim sim;
    vector<int> lin;
};

// Extract lineage 's' and all of its descendants.
bool findLineage(const BdSim &sim, int s, Clade *clade);

// Extract the clades of the given lineages. With no ids, the clades of all
// root lineages are extracted.
bool findLineages(const BdSim &sim, const vector<int> &ids,
                  vector<Clade> *clades);


} // namespace divsim

#endif // DIVSIM_LINEAGE_H
