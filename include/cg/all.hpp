#pragma once
// Umbrella header to simplify includes from bindings and tests.

// Core
#include "cg/core/config.hpp"
#include "cg/core/errors.hpp"
#include "cg/core/logger.hpp"
#include "cg/core/tensor.hpp"
#include "cg/core/node.hpp"

// Ops
#include "cg/ops/activations.hpp"
#include "cg/ops/elementwise.hpp"
#include "cg/ops/linalg.hpp"
#include "cg/ops/loss.hpp"

// Graph driver
#include "cg/graph/graph.hpp"
#include "cg/graph/graph_function.hpp"
#include "cg/graph/gradcheck.hpp"
