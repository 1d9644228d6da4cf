#pragma once

/// Convenience umbrella header for the drain library.

#include <drain/aggregation/aggregation.hpp>
#include <drain/aggregation/simple_aggregation.hpp>
#include <drain/aggregation/spacetime_aggregation.hpp>
#include <drain/core/column.hpp>
#include <drain/core/time.hpp>
#include <drain/runtime/aggregator.hpp>
#include <drain/runtime/csv.hpp>
#include <drain/runtime/ops.hpp>
#include <drain/runtime/table.hpp>
