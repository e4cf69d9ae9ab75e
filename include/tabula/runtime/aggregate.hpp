#pragma once

#include <tabula/runtime/exec.hpp>
#include <tabula/runtime/partition.hpp>
#include <tabula/runtime/table.hpp>

#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace tabula::runtime {

/// Reducer: maps the rows of one group to a single scalar.
using ReduceFn = std::function<ScalarValue(const Table&)>;

struct AggSpec {
    std::string alias;
    ReduceFn fn;
};

/// Reduce every group to one row.
///
/// Output columns are the group keys (GroupSpec order) followed by one column
/// per AggSpec (declaration order). Rows are ascending by key tuple. With an
/// empty GroupSpec the whole table is one group and the result has one row.
///
/// Errors: MissingReducer for an unbound AggSpec, DuplicateColumnName when an
/// alias repeats or shadows a key, ReducerFailure when a reducer throws,
/// TypeMismatch when a reducer's results have no common kind.
[[nodiscard]] auto aggregate_table(const Table& input, const GroupSpec& groups,
                                   const std::vector<AggSpec>& aggregations,
                                   const ExecOptions& options = {})
    -> std::expected<Table, Error>;

}  // namespace tabula::runtime
