#pragma once
// Umbrella header to simplify includes from bindings, examples and tests.

// Core
#include "pv/core/errors.hpp"
#include "pv/core/value.hpp"
#include "pv/core/foreign.hpp"
#include "pv/core/registry.hpp"
#include "pv/core/config.hpp"
#include "pv/core/trace.hpp"

// Ops
#include "pv/ops/shape.hpp"
#include "pv/ops/construct.hpp"
#include "pv/ops/validate.hpp"
#include "pv/ops/indexing.hpp"
#include "pv/ops/slice.hpp"
#include "pv/ops/broadcast.hpp"
#include "pv/ops/elementwise.hpp"
#include "pv/ops/linalg.hpp"
#include "pv/ops/equality.hpp"
#include "pv/ops/export.hpp"
#include "pv/ops/mathsops.hpp"

// Random sampling
#include "pv/random/sampling.hpp"

// End of umbrella
