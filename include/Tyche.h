#ifndef TYCHE_LIBRARY_H
#define TYCHE_LIBRARY_H

#include "../src/core.hpp"
#include "../src/numeric/numeric.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/lrscheduler/lrscheduler.hpp"

#include "../src/model/model.hpp"
#include "../src/data/data.hpp"
#include "../src/variational/variational.hpp"

#include "../src/inference/inference.hpp"
#include "../src/inference/mfvi.hpp"
#include "../src/inference/klpq.hpp"
#include "../src/inference/map.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Re-exports the inference algorithms (MFVI, KLpq, MAP, Laplace) together
//    with the collaborators they are built from: model interface, variational
//    families, data sources, optimizer and learning-rate schedule descriptors.
//  - Header-only; the only link-time dependency is LibTorch.

#endif // TYCHE_LIBRARY_H
