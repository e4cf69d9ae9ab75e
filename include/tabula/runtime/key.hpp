#pragma once

#include <tabula/runtime/table.hpp>

#include <compare>
#include <cstddef>
#include <vector>

namespace tabula::runtime {

/// A key tuple: one cell per key column.
struct Key {
    std::vector<Cell> values;
};

struct KeyHash {
    auto operator()(const Key& key) const -> std::size_t;
};

struct KeyEq {
    auto operator()(const Key& a, const Key& b) const -> bool;
};

/// Lexicographic key order built on compare_cells.
[[nodiscard]] auto compare_keys(const Key& lhs, const Key& rhs) -> std::weak_ordering;

/// Read the key tuple of `row` from the given key columns.
[[nodiscard]] auto key_at(const std::vector<const ColumnEntry*>& key_columns, std::size_t row)
    -> Key;

}  // namespace tabula::runtime
