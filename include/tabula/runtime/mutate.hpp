#pragma once

#include <tabula/runtime/exec.hpp>
#include <tabula/runtime/partition.hpp>
#include <tabula/runtime/table.hpp>

#include <concepts>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tabula::runtime {

/// Output of a per-group transform. A plain column converts implicitly and
/// means every value is valid.
struct MutateColumn {
    ColumnValue values;
    // Same length as `values` when set; false marks a missing cell.
    std::optional<Validity> validity;

    template <typename T>
        requires std::constructible_from<ColumnValue, T>
    MutateColumn(T&& column)  // NOLINT(google-explicit-constructor)
        : values(std::forward<T>(column)) {}

    MutateColumn(ColumnValue column, std::optional<Validity> bits)
        : values(std::move(column)), validity(std::move(bits)) {}
};

/// Per-group transform: receives the rows of one group and returns a column
/// with exactly that many values.
using MutateFn = std::function<MutateColumn(const Table&)>;

struct FieldSpec {
    std::string alias;
    MutateFn fn;
};

/// Add or overwrite the `fields` columns, evaluated in declaration order.
///
/// With a non-empty GroupSpec each field runs once per group and its values
/// are scattered back to the group's original row positions, so the row
/// order of the result equals the input's. Later fields see earlier ones.
[[nodiscard]] auto mutate_table(const Table& input, const GroupSpec& groups,
                                const std::vector<FieldSpec>& fields,
                                const ExecOptions& options = {}) -> std::expected<Table, Error>;

/// Combine per-group columns into one column of `rows` values, writing group
/// i's values and validity at partitioning.groups[i].rows. Lengths must
/// already match.
[[nodiscard]] auto scatter_columns(const std::vector<MutateColumn>& parts,
                                   const Partitioning& partitioning, std::size_t rows,
                                   ScalarKind kind) -> MutateColumn;

}  // namespace tabula::runtime
