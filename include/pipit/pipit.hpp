#pragma once

/// Convenience umbrella header for the pipit library.

#include <pipit/codegen/pandas_emitter.hpp>
#include <pipit/codegen/sql_emitter.hpp>
#include <pipit/expr/identifiers.hpp>
#include <pipit/expr/parser.hpp>
#include <pipit/graph/exchange.hpp>
#include <pipit/graph/graph.hpp>
#include <pipit/graph/topology.hpp>
#include <pipit/graph/validate.hpp>
#include <pipit/runtime/csv.hpp>
#include <pipit/runtime/interpreter.hpp>
#include <pipit/runtime/ops.hpp>
