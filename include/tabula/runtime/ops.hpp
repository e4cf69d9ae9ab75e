#pragma once

#include <tabula/runtime/table.hpp>

#include <algorithm>
#include <cstdint>
#include <expected>
#include <functional>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace tabula::runtime {

// ─── Column-level operations ──────────────────────────────────────────────────

[[nodiscard]] auto project_table(const Table& t, const std::vector<std::string>& col_names)
    -> std::expected<Table, Error>;

[[nodiscard]] auto drop_columns(const Table& t, const std::vector<std::string>& col_names)
    -> std::expected<Table, Error>;

using RenameMap = std::vector<std::pair<std::string, std::string>>;

/// Rename columns `old -> new`. Unknown sources fail with UnknownColumn,
/// a source listed twice with InvalidArgument, clashing results with
/// DuplicateColumnName.
[[nodiscard]] auto rename_columns(const Table& t, const RenameMap& mapping)
    -> std::expected<Table, Error>;

/// Replace every column name positionally.
[[nodiscard]] auto set_column_names(const Table& t, const std::vector<std::string>& names)
    -> std::expected<Table, Error>;

// ─── Row-level operations ─────────────────────────────────────────────────────

struct SortKey {
    std::string name;
    bool ascending = true;
};

/// Stable sort by `keys`; missing cells sort last regardless of direction.
[[nodiscard]] auto order_table(const Table& t, const std::vector<SortKey>& keys)
    -> std::expected<Table, Error>;

/// Row predicate: returns one mask entry per row (non-zero keeps it).
using PredicateFn = std::function<Mask(const Table&)>;

[[nodiscard]] auto filter_table(const Table& t, const PredicateFn& predicate)
    -> std::expected<Table, Error>;

[[nodiscard]] auto head_rows(const Table& t, std::size_t n) -> Table;
[[nodiscard]] auto tail_rows(const Table& t, std::size_t n) -> Table;

/// Keep the rows at `positions`, in the given order (repeats allowed).
[[nodiscard]] auto slice_rows(const Table& t, const std::vector<std::size_t>& positions)
    -> std::expected<Table, Error>;

/// Wide-to-long reshape. Every column not in `keep` is stacked (table order,
/// all rows per column) into a `key` column holding its name and a `value`
/// column holding its cells; `keep` columns are repeated alongside.
[[nodiscard]] auto gather_columns(const Table& t, const std::string& key,
                                  const std::string& value, const std::vector<std::string>& keep)
    -> std::expected<Table, Error>;

/// Draw `n` row positions out of `rows` using the caller's random source.
template <std::uniform_random_bit_generator Rng>
[[nodiscard]] auto sample_positions(std::size_t rows, std::size_t n, bool replace, Rng& rng)
    -> std::expected<std::vector<std::size_t>, Error> {
    if (!replace && n > rows) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "cannot sample " + std::to_string(n) + " rows without replacement from " +
                std::to_string(rows)));
    }
    std::vector<std::size_t> positions;
    if (n == 0) {
        return positions;
    }
    if (replace) {
        if (rows == 0) {
            return std::unexpected(
                make_error(ErrorCode::InvalidArgument, "cannot sample from an empty table"));
        }
        std::uniform_int_distribution<std::size_t> dist(0, rows - 1);
        positions.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            positions.push_back(dist(rng));
        }
        return positions;
    }
    positions.resize(rows);
    std::iota(positions.begin(), positions.end(), std::size_t{0});
    std::shuffle(positions.begin(), positions.end(), rng);
    positions.resize(n);
    return positions;
}

/// Render up to `max_rows` rows as an aligned text table.
void print(const Table& t, std::ostream& out = std::cout, std::size_t max_rows = 10);

}  // namespace tabula::runtime
