#ifndef HYDRA_LIBRARY_H
#define HYDRA_LIBRARY_H

#include "../src/common/config.hpp"
#include "../src/common/error.hpp"
#include "../src/common/hyperparameters.hpp"
#include "../src/utils/log.hpp"

#include "../src/activation/activation.hpp"
#include "../src/initialization/initialization.hpp"
#include "../src/layer/layer.hpp"
#include "../src/block/block.hpp"
#include "../src/loss/loss.hpp"

#include "../src/forecast/horizon.hpp"
#include "../src/model/backbone.hpp"
#include "../src/model/recurrent.hpp"
#include "../src/model/attention.hpp"
#include "../src/model/nbeats.hpp"
#include "../src/model/registry.hpp"
#include "../src/task/task.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
// Intention:
//  - Re-export the API surface used by training loops and metric callbacks
//    (backbones, task views, configuration, horizon extension).
//  - Header-only: every component lives under src/ and is composed at compile
//    time by the including translation unit.

#endif // HYDRA_LIBRARY_H
