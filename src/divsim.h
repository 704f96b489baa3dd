/*=============================================================================

  DIVSIM - Diversification simulator

=============================================================================*/

#ifndef DIVSIM_DIVSIM_H
#define DIVSIM_DIVSIM_H

#include "common.h"
#include "logging.h"
#include "rate.h"
#include "integrate.h"
#include "waittime.h"
#include "lineage.h"
#include "bdsim_engine.h"
#include "bdsim.h"
#include "diversity.h"

#endif // DIVSIM_DIVSIM_H
