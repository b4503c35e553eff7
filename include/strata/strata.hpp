#pragma once

/// Convenience umbrella header for the Strata library.

#include <strata/core/accumulator.hpp>
#include <strata/core/column_type.hpp>
#include <strata/parser/literal.hpp>
#include <strata/runtime/analyzer.hpp>
#include <strata/runtime/csv.hpp>
#include <strata/runtime/group_router.hpp>
#include <strata/runtime/report.hpp>
#include <strata/runtime/type_detector.hpp>
