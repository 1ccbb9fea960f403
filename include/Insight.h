#ifndef INSIGHT_LIBRARY_H
#define INSIGHT_LIBRARY_H

#include "../src/common/options.hpp"
#include "../src/common/save_load.hpp"
#include "../src/data/data.hpp"
#include "../src/decoder.hpp"
#include "../src/evaluation/evaluation.hpp"
#include "../src/layer/layer.hpp"
#include "../src/loss/loss.hpp"
#include "../src/regularization/regularization.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Re-exports the decoding surface: configuration, dataset views, the decoder
//    and its losses, evaluation and persistence.
//  - Header-only; implementation lives in the modules under src/.

#endif // INSIGHT_LIBRARY_H
