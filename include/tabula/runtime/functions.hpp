#pragma once

#include <tabula/runtime/aggregate.hpp>
#include <tabula/runtime/mutate.hpp>
#include <tabula/runtime/ops.hpp>
#include <tabula/runtime/table.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/// Ready-made building blocks for the function arguments of mutate, agg and
/// filter. Reducers skip missing cells.
namespace tabula::fn {

enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

// ─── Column access inside user functions ──────────────────────────────────────

/// Column entry by name; throws std::out_of_range if absent.
[[nodiscard]] auto entry(const runtime::Table& t, const std::string& name)
    -> const runtime::ColumnEntry&;

/// Typed column by name; throws std::invalid_argument on a kind mismatch.
template <ColumnElement T>
[[nodiscard]] auto values(const runtime::Table& t, const std::string& name) -> const Column<T>& {
    const auto* col = std::get_if<Column<T>>(entry(t, name).column.get());
    if (col == nullptr) {
        throw std::invalid_argument("column '" + name + "' has a different element type");
    }
    return *col;
}

/// Numeric column widened to double; missing cells become NaN.
[[nodiscard]] auto numeric(const runtime::Table& t, const std::string& name)
    -> std::vector<double>;

// ─── Reducers ─────────────────────────────────────────────────────────────────

/// Sum of the valid cells; Int columns throw std::overflow_error when the
/// total leaves the int64 range.
[[nodiscard]] auto sum(std::string name) -> runtime::ReduceFn;
/// Mean of the valid cells; NaN when there are none.
[[nodiscard]] auto mean(std::string name) -> runtime::ReduceFn;
[[nodiscard]] auto min(std::string name) -> runtime::ReduceFn;
[[nodiscard]] auto max(std::string name) -> runtime::ReduceFn;
[[nodiscard]] auto first(std::string name) -> runtime::ReduceFn;
[[nodiscard]] auto last(std::string name) -> runtime::ReduceFn;
/// Number of rows in the group.
[[nodiscard]] auto count() -> runtime::ReduceFn;
/// Number of valid cells of `name` in the group.
[[nodiscard]] auto count(std::string name) -> runtime::ReduceFn;
[[nodiscard]] auto n_distinct(std::string name) -> runtime::ReduceFn;

// ─── Mutations ────────────────────────────────────────────────────────────────

/// Copy of column `name`, missing cells included.
[[nodiscard]] auto col(std::string name) -> runtime::MutateFn;

// ─── Predicates ───────────────────────────────────────────────────────────────

/// `name <op> rhs` per row; missing cells never match.
[[nodiscard]] auto compare(std::string name, CompareOp op, runtime::ScalarValue rhs)
    -> runtime::PredicateFn;

}  // namespace tabula::fn
