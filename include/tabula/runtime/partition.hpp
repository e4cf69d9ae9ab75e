#pragma once

#include <tabula/runtime/key.hpp>
#include <tabula/runtime/table.hpp>

#include <expected>
#include <string>
#include <vector>

namespace tabula::runtime {

/// Ordered list of key column names; empty means "not grouped".
using GroupSpec = std::vector<std::string>;

/// One group: its key tuple and the ascending row positions sharing it.
struct Partition {
    Key key;
    std::vector<std::size_t> rows;
};

/// A complete, disjoint split of a table's rows by key tuple.
struct Partitioning {
    GroupSpec keys;
    std::vector<Partition> groups;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return groups.size(); }
};

/// Fails with InvalidGroupColumn naming every key absent from `table`.
[[nodiscard]] auto validate_group_columns(const Table& table, const GroupSpec& keys)
    -> std::expected<void, Error>;

/// Split `table` by the key columns. Groups are listed in order of first
/// appearance; rows within a group are ascending. An empty GroupSpec yields a
/// single group covering every row (also for an empty table).
[[nodiscard]] auto partition_table(const Table& table, const GroupSpec& keys)
    -> std::expected<Partitioning, Error>;

/// Reorder groups ascending by key tuple.
void sort_partitions(Partitioning& partitioning);

/// Materialize the rows of one group as a sub-table.
[[nodiscard]] auto partition_view(const Table& table, const Partition& partition) -> Table;

}  // namespace tabula::runtime
