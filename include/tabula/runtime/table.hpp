#pragma once

#include <tabula/core/column.hpp>
#include <tabula/core/error.hpp>

#include <compare>
#include <cstdint>
#include <expected>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace tabula::runtime {

enum class ScalarKind : std::uint8_t {
    Int,
    Double,
    String,
};

using ColumnValue = std::variant<Column<std::int64_t>, Column<double>, Column<std::string>>;
using ScalarValue = std::variant<std::int64_t, double, std::string>;

/// A single table cell; std::nullopt is the missing marker.
using Cell = std::optional<ScalarValue>;

/// Validity bitmap: true = valid, false = missing.
using Validity = std::vector<bool>;

/// Row selection mask returned by filter predicates (non-zero keeps the row).
using Mask = std::vector<std::uint8_t>;

/// Row position that gathers as a missing cell (used for unmatched join rows).
inline constexpr std::size_t kNullRow = std::numeric_limits<std::size_t>::max();

struct ColumnEntry {
    std::string name;
    // Column storage is immutable once published; tables share it freely.
    std::shared_ptr<const ColumnValue> column;
    // nullopt means every row is valid, the common case.
    std::optional<Validity> validity;
};

/// Returns true if row `row` of `entry` is missing.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

/// An ordered collection of equally long, uniquely named columns.
///
/// Copying a Table copies column pointers only. Operations never write into
/// a published column; replacing a column reseats its pointer.
struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    /// Add or replace a column.
    void add_column(std::string name, ColumnValue column);
    /// Add or replace a column with an explicit validity bitmap.
    void add_column(std::string name, ColumnValue column, Validity validity);
    /// Add or replace a column, sharing the storage of `entry`.
    void add_entry(ColumnEntry entry);

    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return index.contains(name);
    }
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;
};

/// Build a table from named columns, checking name uniqueness and lengths.
[[nodiscard]] auto make_table(std::vector<std::pair<std::string, ColumnValue>> columns)
    -> std::expected<Table, Error>;

/// Check the Table invariants on an already assembled table.
[[nodiscard]] auto validate_table(const Table& table) -> std::expected<void, Error>;

[[nodiscard]] auto column_size(const ColumnValue& column) -> std::size_t;
[[nodiscard]] auto column_kind(const ColumnValue& column) -> ScalarKind;
[[nodiscard]] auto scalar_kind(const ScalarValue& value) -> ScalarKind;
[[nodiscard]] auto kind_name(ScalarKind kind) -> std::string_view;

/// Common kind of a set of kinds: identical kinds stay, Int mixed with Double
/// widens to Double, anything else has no common kind.
[[nodiscard]] auto common_kind(std::span<const ScalarKind> kinds) -> std::optional<ScalarKind>;

/// Convert a column to `kind`; only identity and Int -> Double are supported.
[[nodiscard]] auto convert_column(const ColumnValue& column, ScalarKind kind) -> ColumnValue;

[[nodiscard]] auto cell_at(const ColumnEntry& entry, std::size_t row) -> Cell;

/// Gather `rows` of one column; kNullRow positions become missing cells.
[[nodiscard]] auto take_entry(const ColumnEntry& entry, std::span<const std::size_t> rows)
    -> ColumnEntry;

/// Gather `rows` of every column into a new table.
[[nodiscard]] auto take_rows(const Table& table, std::span<const std::size_t> rows) -> Table;

/// Total order used for keys and sorting: values ascending, NaN after every
/// number, missing after everything.
[[nodiscard]] auto compare_cells(const Cell& lhs, const Cell& rhs) -> std::weak_ordering;

/// Key equality: missing equals missing and NaN equals NaN.
[[nodiscard]] auto cells_equal(const Cell& lhs, const Cell& rhs) -> bool;

[[nodiscard]] auto format_cell(const Cell& cell) -> std::string;

/// Comma separated column listing used in error messages.
[[nodiscard]] auto format_columns(const Table& table) -> std::string;

/// Incrementally assembles a typed column (with missing cells) from scalars.
class ColumnBuilder {
   public:
    explicit ColumnBuilder(ScalarKind kind, std::size_t capacity = 0);

    /// Append a cell. Int values widen into a Double column; other kind
    /// mismatches throw std::invalid_argument.
    void append(const Cell& cell);
    void append_null();

    [[nodiscard]] auto kind() const noexcept -> ScalarKind { return kind_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return validity_.size(); }

    [[nodiscard]] auto finish(std::string name) && -> ColumnEntry;

   private:
    ScalarKind kind_;
    ColumnValue values_;
    Validity validity_;
    bool has_nulls_ = false;
};

}  // namespace tabula::runtime
