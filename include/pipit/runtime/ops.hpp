#pragma once

#include <pipit/graph/graph.hpp>
#include <pipit/runtime/eval.hpp>
#include <pipit/runtime/row.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace pipit::ops {

// ─── Row-set operations ───────────────────────────────────────────────────────
//  One function per node kind; the interpreter dispatches to these.

/// Restrict to the listed columns (missing ones read as null), then apply
/// the schema casts. An empty column list keeps every column.
[[nodiscard]] auto project(const runtime::RowSet& rows, const graph::ProjectConfig& config)
    -> runtime::RowSet;

/// Keep rows for which the predicate is truthy. Text fields that read as
/// numbers are handed to the predicate as numbers; a row whose evaluation
/// fails is dropped.
[[nodiscard]] auto filter(const runtime::RowSet& rows, const runtime::CompiledExpr& predicate)
    -> runtime::RowSet;

/// Group by the exact tuple of group-by values, in first-seen group order.
[[nodiscard]] auto aggregate(const runtime::RowSet& rows, const graph::AggregateConfig& config)
    -> runtime::RowSet;

/// Append (or overwrite) `column` with the expression value; null where the
/// evaluation fails.
[[nodiscard]] auto compute(const runtime::RowSet& rows, const std::string& column,
                           const runtime::CompiledExpr& formula) -> runtime::RowSet;

/// Stable multi-key sort. Nulls sort first ascending and last descending.
[[nodiscard]] auto order(const runtime::RowSet& rows, const std::vector<graph::SortKey>& keys)
    -> runtime::RowSet;

/// Row-count mode shuffles and takes the first N; fraction mode keeps each
/// row independently with probability p.
[[nodiscard]] auto sample(const runtime::RowSet& rows, const graph::SampleConfig& config,
                          std::uint64_t seed) -> runtime::RowSet;

/// Keep one row per key tuple. With an order column the rows are first
/// sorted by it (ascending for First, descending for Last); otherwise the
/// first or last occurrence in input order survives.
[[nodiscard]] auto dedupe(const runtime::RowSet& rows, const std::vector<std::string>& keys,
                          graph::DedupePick pick, const std::string& order_column)
    -> runtime::RowSet;

/// Hash join on positional key pairs. Text keys are compared trimmed.
[[nodiscard]] auto join(const runtime::RowSet& left, const runtime::RowSet& right,
                        const graph::JoinConfig& config) -> runtime::RowSet;

void print(const runtime::RowSet& rows, std::ostream& out = std::cout, std::size_t max_rows = 10);

}  // namespace pipit::ops
