#include <tabula/runtime/functions.hpp>
#include <tabula/runtime/key.hpp>

#include <fmt/format.h>
#include <robin_hood.h>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace tabula::fn {

using runtime::Cell;
using runtime::ColumnEntry;
using runtime::ScalarKind;
using runtime::ScalarValue;
using runtime::Table;

namespace {

auto is_nan(const ScalarValue& value) -> bool {
    const auto* d = std::get_if<double>(&value);
    return d != nullptr && std::isnan(*d);
}

auto require_numeric(const ColumnEntry& e, std::string_view what) -> ScalarKind {
    auto kind = runtime::column_kind(*e.column);
    if (kind == ScalarKind::String) {
        throw std::invalid_argument(fmt::format("{}: column '{}' is not numeric", what, e.name));
    }
    return kind;
}

/// Fold the valid cells of a column, keeping the cell that `better` prefers.
template <typename Better>
auto select_cell(const ColumnEntry& e, Better better, std::string_view what) -> ScalarValue {
    Cell best;
    for (std::size_t row = 0; row < runtime::column_size(*e.column); ++row) {
        auto cell = runtime::cell_at(e, row);
        if (!cell.has_value() || is_nan(*cell)) {
            continue;
        }
        if (!best.has_value() || better(*cell, *best)) {
            best = std::move(cell);
        }
    }
    if (!best.has_value()) {
        throw std::domain_error(fmt::format("{}: column '{}' has no valid values", what, e.name));
    }
    return *best;
}

auto matches(CompareOp op, std::weak_ordering order) -> bool {
    switch (op) {
        case CompareOp::Eq:
            return order == 0;
        case CompareOp::Ne:
            return order != 0;
        case CompareOp::Lt:
            return order < 0;
        case CompareOp::Le:
            return order <= 0;
        case CompareOp::Gt:
            return order > 0;
        case CompareOp::Ge:
            return order >= 0;
    }
    return false;
}

}  // namespace

auto entry(const Table& t, const std::string& name) -> const ColumnEntry& {
    const auto* e = t.find_entry(name);
    if (e == nullptr) {
        throw std::out_of_range("column not found: " + name);
    }
    return *e;
}

auto numeric(const Table& t, const std::string& name) -> std::vector<double> {
    const auto& e = entry(t, name);
    require_numeric(e, "numeric");
    std::vector<double> out;
    out.reserve(t.rows());
    std::visit(
        [&](const auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (!std::is_same_v<T, std::string>) {
                for (std::size_t row = 0; row < col.size(); ++row) {
                    out.push_back(runtime::is_null(e, row)
                                      ? std::numeric_limits<double>::quiet_NaN()
                                      : static_cast<double>(col[row]));
                }
            }
        },
        *e.column);
    return out;
}

auto sum(std::string name) -> runtime::ReduceFn {
    return [name = std::move(name)](const Table& t) -> ScalarValue {
        const auto& e = entry(t, name);
        if (require_numeric(e, "sum") == ScalarKind::Int) {
            const auto& col = std::get<Column<std::int64_t>>(*e.column);
            std::int64_t total = 0;
            for (std::size_t row = 0; row < col.size(); ++row) {
                if (!runtime::is_null(e, row) && __builtin_add_overflow(total, col[row], &total)) {
                    throw std::overflow_error(
                        fmt::format("sum: int64 overflow in column '{}'", name));
                }
            }
            return total;
        }
        double total = 0.0;
        for (double v : numeric(t, name)) {
            if (!std::isnan(v)) {
                total += v;
            }
        }
        return total;
    };
}

auto mean(std::string name) -> runtime::ReduceFn {
    return [name = std::move(name)](const Table& t) -> ScalarValue {
        double total = 0.0;
        std::size_t n = 0;
        for (double v : numeric(t, name)) {
            if (!std::isnan(v)) {
                total += v;
                ++n;
            }
        }
        if (n == 0) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return total / static_cast<double>(n);
    };
}

auto min(std::string name) -> runtime::ReduceFn {
    return [name = std::move(name)](const Table& t) -> ScalarValue {
        return select_cell(
            entry(t, name),
            [](const ScalarValue& a, const ScalarValue& b) {
                return runtime::compare_cells(a, b) < 0;
            },
            "min");
    };
}

auto max(std::string name) -> runtime::ReduceFn {
    return [name = std::move(name)](const Table& t) -> ScalarValue {
        return select_cell(
            entry(t, name),
            [](const ScalarValue& a, const ScalarValue& b) {
                return runtime::compare_cells(a, b) > 0;
            },
            "max");
    };
}

auto first(std::string name) -> runtime::ReduceFn {
    return [name = std::move(name)](const Table& t) -> ScalarValue {
        return select_cell(
            entry(t, name), [](const ScalarValue&, const ScalarValue&) { return false; }, "first");
    };
}

auto last(std::string name) -> runtime::ReduceFn {
    return [name = std::move(name)](const Table& t) -> ScalarValue {
        return select_cell(
            entry(t, name), [](const ScalarValue&, const ScalarValue&) { return true; }, "last");
    };
}

auto count() -> runtime::ReduceFn {
    return [](const Table& t) -> ScalarValue { return static_cast<std::int64_t>(t.rows()); };
}

auto count(std::string name) -> runtime::ReduceFn {
    return [name = std::move(name)](const Table& t) -> ScalarValue {
        const auto& e = entry(t, name);
        std::int64_t n = 0;
        for (std::size_t row = 0; row < t.rows(); ++row) {
            if (!runtime::is_null(e, row)) {
                ++n;
            }
        }
        return n;
    };
}

auto n_distinct(std::string name) -> runtime::ReduceFn {
    return [name = std::move(name)](const Table& t) -> ScalarValue {
        const auto& e = entry(t, name);
        robin_hood::unordered_flat_set<runtime::Key, runtime::KeyHash, runtime::KeyEq> seen;
        for (std::size_t row = 0; row < t.rows(); ++row) {
            auto cell = runtime::cell_at(e, row);
            if (cell.has_value() && !is_nan(*cell)) {
                seen.insert(runtime::Key{.values = {std::move(cell)}});
            }
        }
        return static_cast<std::int64_t>(seen.size());
    };
}

auto col(std::string name) -> runtime::MutateFn {
    return [name = std::move(name)](const Table& t) -> runtime::MutateColumn {
        const auto& e = entry(t, name);
        return runtime::MutateColumn{*e.column, e.validity};
    };
}

auto compare(std::string name, CompareOp op, ScalarValue rhs) -> runtime::PredicateFn {
    return [name = std::move(name), op, rhs = std::move(rhs)](const Table& t) -> runtime::Mask {
        const auto& e = entry(t, name);
        const bool column_is_text = runtime::column_kind(*e.column) == ScalarKind::String;
        const bool literal_is_text = runtime::scalar_kind(rhs) == ScalarKind::String;
        if (column_is_text != literal_is_text) {
            throw std::invalid_argument(
                fmt::format("cannot compare {} column '{}' with {} literal",
                            runtime::kind_name(runtime::column_kind(*e.column)), name,
                            runtime::kind_name(runtime::scalar_kind(rhs))));
        }
        const Cell literal{rhs};
        runtime::Mask mask(t.rows(), 0);
        for (std::size_t row = 0; row < t.rows(); ++row) {
            auto cell = runtime::cell_at(e, row);
            if (cell.has_value() && !is_nan(*cell)) {
                mask[row] = matches(op, runtime::compare_cells(cell, literal)) ? 1 : 0;
            }
        }
        return mask;
    };
}

}  // namespace tabula::fn
