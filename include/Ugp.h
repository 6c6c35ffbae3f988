#ifndef UGP_LIBRARY_H
#define UGP_LIBRARY_H

#include "../src/core.hpp"
#include "../src/kernel/kernel.hpp"
#include "../src/likelihood/likelihood.hpp"
#include "../src/inference/inference.hpp"
#include "../src/optimizer/optimizer.hpp"

#include "../src/data/dataset.hpp"
#include "../src/metric/metric.hpp"
#include "../src/evaluation/evaluation.hpp"
#include "../src/common/save_load.hpp"
#include "../src/common/config.hpp"
#include "../src/training/training.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
// Intention:
//  - Re-export the API surface downstream applications need: the Model container,
//    the kernel / likelihood / inference descriptors and the training loop.
//  - Include-only components; implementation lives in header-only modules under
//    src/, composed at compile time.

#endif // UGP_LIBRARY_H
