#pragma once

#include <tabula/runtime/table.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace tabula::runtime {

enum class JoinKind : std::uint8_t {
    Inner,
    Left,
};

/// Resolve the join keys. Without `by` the keys are the column names both
/// tables share, in left-table order. Fails with EmptyJoinKey when nothing
/// remains and with UnknownJoinColumn when a key is missing on either side.
[[nodiscard]] auto resolve_join_keys(const Table& left, const Table& right,
                                     const std::optional<std::vector<std::string>>& by)
    -> std::expected<std::vector<std::string>, Error>;

/// Join two tables on `keys`.
///
/// Output columns are every left column followed by the right non-key
/// columns; a right name that clashes gets `_right` appended until unique.
/// Rows follow left order, and within one left row the matching right rows
/// follow right order. Unmatched left rows of a Left join carry missing
/// right-side cells.
[[nodiscard]] auto join_tables(const Table& left, const Table& right, JoinKind kind,
                               const std::vector<std::string>& keys)
    -> std::expected<Table, Error>;

}  // namespace tabula::runtime
