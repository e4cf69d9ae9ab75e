#include <tabula/runtime/table.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

namespace tabula::runtime {

namespace {

auto is_simple_identifier(std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(name.front());
    if (std::isalpha(first) == 0 && first != '_') {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(), [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return std::isalnum(c) != 0 || c == '_';
    });
}

auto normalize_validity(Validity validity) -> std::optional<Validity> {
    if (std::all_of(validity.begin(), validity.end(), [](bool v) { return v; })) {
        return std::nullopt;
    }
    return validity;
}

auto empty_column(ScalarKind kind) -> ColumnValue {
    switch (kind) {
        case ScalarKind::Int:
            return Column<std::int64_t>{};
        case ScalarKind::Double:
            return Column<double>{};
        case ScalarKind::String:
            return Column<std::string>{};
    }
    return Column<std::int64_t>{};
}

auto is_nan(const ScalarValue& value) -> bool {
    const auto* d = std::get_if<double>(&value);
    return d != nullptr && std::isnan(*d);
}

auto compare_values(const ScalarValue& lhs, const ScalarValue& rhs) -> std::weak_ordering {
    const bool lnan = is_nan(lhs);
    const bool rnan = is_nan(rhs);
    if (lnan || rnan) {
        if (lnan && rnan) {
            return std::weak_ordering::equivalent;
        }
        return lnan ? std::weak_ordering::greater : std::weak_ordering::less;
    }
    auto as_double = [](const ScalarValue& v) -> std::optional<double> {
        if (const auto* i = std::get_if<std::int64_t>(&v)) {
            return static_cast<double>(*i);
        }
        if (const auto* d = std::get_if<double>(&v)) {
            return *d;
        }
        return std::nullopt;
    };
    if (lhs.index() == rhs.index()) {
        return std::visit(
            [&](const auto& l) -> std::weak_ordering {
                using T = std::decay_t<decltype(l)>;
                const auto& r = std::get<T>(rhs);
                if (l < r) {
                    return std::weak_ordering::less;
                }
                if (r < l) {
                    return std::weak_ordering::greater;
                }
                return std::weak_ordering::equivalent;
            },
            lhs);
    }
    auto ld = as_double(lhs);
    auto rd = as_double(rhs);
    if (ld && rd) {
        if (*ld < *rd) {
            return std::weak_ordering::less;
        }
        if (*rd < *ld) {
            return std::weak_ordering::greater;
        }
        return std::weak_ordering::equivalent;
    }
    // Numbers order before strings.
    return lhs.index() < rhs.index() ? std::weak_ordering::less : std::weak_ordering::greater;
}

}  // namespace

void Table::add_column(std::string name, ColumnValue column) {
    add_entry(ColumnEntry{.name = std::move(name),
                          .column = std::make_shared<const ColumnValue>(std::move(column)),
                          .validity = std::nullopt});
}

void Table::add_column(std::string name, ColumnValue column, Validity validity) {
    add_entry(ColumnEntry{.name = std::move(name),
                          .column = std::make_shared<const ColumnValue>(std::move(column)),
                          .validity = normalize_validity(std::move(validity))});
}

void Table::add_entry(ColumnEntry entry) {
    if (auto it = index.find(entry.name); it != index.end()) {
        columns[it->second] = std::move(entry);
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(std::move(entry));
    index[columns.back().name] = pos;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_size(*columns.front().column);
}

auto Table::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& entry : columns) {
        names.push_back(entry.name);
    }
    return names;
}

auto make_table(std::vector<std::pair<std::string, ColumnValue>> columns)
    -> std::expected<Table, Error> {
    Table table;
    table.columns.reserve(columns.size());
    for (auto& [name, column] : columns) {
        if (table.contains(name)) {
            return std::unexpected(
                make_error(ErrorCode::DuplicateColumnName, "duplicate column name", {name}));
        }
        table.add_column(std::move(name), std::move(column));
    }
    if (auto valid = validate_table(table); !valid) {
        return std::unexpected(valid.error());
    }
    return table;
}

auto validate_table(const Table& table) -> std::expected<void, Error> {
    if (table.index.size() != table.columns.size()) {
        std::unordered_set<std::string> seen;
        for (const auto& entry : table.columns) {
            if (!seen.insert(entry.name).second) {
                return std::unexpected(make_error(ErrorCode::DuplicateColumnName,
                                                  "duplicate column name", {entry.name}));
            }
        }
    }
    const std::size_t rows = table.rows();
    for (const auto& entry : table.columns) {
        const std::size_t n = column_size(*entry.column);
        if (n != rows || (entry.validity.has_value() && entry.validity->size() != n)) {
            return std::unexpected(make_error(
                ErrorCode::ColumnLengthMismatch,
                fmt::format("column has {} rows, expected {}", n, rows), {entry.name}));
        }
    }
    return {};
}

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto column_kind(const ColumnValue& column) -> ScalarKind {
    if (std::holds_alternative<Column<std::int64_t>>(column)) {
        return ScalarKind::Int;
    }
    if (std::holds_alternative<Column<double>>(column)) {
        return ScalarKind::Double;
    }
    return ScalarKind::String;
}

auto scalar_kind(const ScalarValue& value) -> ScalarKind {
    if (std::holds_alternative<std::int64_t>(value)) {
        return ScalarKind::Int;
    }
    if (std::holds_alternative<double>(value)) {
        return ScalarKind::Double;
    }
    return ScalarKind::String;
}

auto kind_name(ScalarKind kind) -> std::string_view {
    switch (kind) {
        case ScalarKind::Int:
            return "Int";
        case ScalarKind::Double:
            return "Double";
        case ScalarKind::String:
            return "String";
    }
    return "?";
}

auto common_kind(std::span<const ScalarKind> kinds) -> std::optional<ScalarKind> {
    if (kinds.empty()) {
        return std::nullopt;
    }
    ScalarKind result = kinds.front();
    for (auto kind : kinds.subspan(1)) {
        if (kind == result) {
            continue;
        }
        if ((kind == ScalarKind::Int && result == ScalarKind::Double) ||
            (kind == ScalarKind::Double && result == ScalarKind::Int)) {
            result = ScalarKind::Double;
            continue;
        }
        return std::nullopt;
    }
    return result;
}

auto convert_column(const ColumnValue& column, ScalarKind kind) -> ColumnValue {
    if (column_kind(column) == kind) {
        return column;
    }
    const auto* ints = std::get_if<Column<std::int64_t>>(&column);
    if (ints == nullptr || kind != ScalarKind::Double) {
        throw std::invalid_argument(fmt::format("cannot convert {} column to {}",
                                                kind_name(column_kind(column)), kind_name(kind)));
    }
    return ints->transform([](std::int64_t v) { return static_cast<double>(v); });
}

auto cell_at(const ColumnEntry& entry, std::size_t row) -> Cell {
    if (is_null(entry, row)) {
        return std::nullopt;
    }
    return std::visit([row](const auto& col) -> Cell { return ScalarValue{col[row]}; },
                      *entry.column);
}

auto take_entry(const ColumnEntry& entry, std::span<const std::size_t> rows) -> ColumnEntry {
    const bool any_null_row = std::find(rows.begin(), rows.end(), kNullRow) != rows.end();
    if (!any_null_row && !entry.validity.has_value()) {
        auto gathered = std::visit([&](const auto& col) -> ColumnValue { return col.take(rows); },
                                   *entry.column);
        return ColumnEntry{.name = entry.name,
                           .column = std::make_shared<const ColumnValue>(std::move(gathered)),
                           .validity = std::nullopt};
    }

    Validity validity(rows.size(), true);
    auto gathered = std::visit(
        [&](const auto& col) -> ColumnValue {
            using ColT = std::decay_t<decltype(col)>;
            using T = typename ColT::value_type;
            std::vector<T> out;
            out.reserve(rows.size());
            for (std::size_t i = 0; i < rows.size(); ++i) {
                const std::size_t row = rows[i];
                if (row == kNullRow) {
                    out.push_back(T{});
                    validity[i] = false;
                    continue;
                }
                out.push_back(col[row]);
                validity[i] = !is_null(entry, row);
            }
            return ColT{std::move(out)};
        },
        *entry.column);
    return ColumnEntry{.name = entry.name,
                       .column = std::make_shared<const ColumnValue>(std::move(gathered)),
                       .validity = normalize_validity(std::move(validity))};
}

auto take_rows(const Table& table, std::span<const std::size_t> rows) -> Table {
    Table output;
    output.columns.reserve(table.columns.size());
    for (const auto& entry : table.columns) {
        output.add_entry(take_entry(entry, rows));
    }
    return output;
}

auto compare_cells(const Cell& lhs, const Cell& rhs) -> std::weak_ordering {
    if (!lhs.has_value() || !rhs.has_value()) {
        if (lhs.has_value() == rhs.has_value()) {
            return std::weak_ordering::equivalent;
        }
        return lhs.has_value() ? std::weak_ordering::less : std::weak_ordering::greater;
    }
    return compare_values(*lhs, *rhs);
}

auto cells_equal(const Cell& lhs, const Cell& rhs) -> bool {
    if (!lhs.has_value() || !rhs.has_value()) {
        return lhs.has_value() == rhs.has_value();
    }
    if (is_nan(*lhs) || is_nan(*rhs)) {
        return is_nan(*lhs) && is_nan(*rhs);
    }
    return *lhs == *rhs;
}

auto format_cell(const Cell& cell) -> std::string {
    if (!cell.has_value()) {
        return "null";
    }
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v)) {
                    return "nan";
                }
                if (std::isinf(v)) {
                    return v > 0 ? "inf" : "-inf";
                }
                return fmt::format("{:g}", v);
            } else {
                return fmt::format("{}", v);
            }
        },
        *cell);
}

auto format_columns(const Table& table) -> std::string {
    if (table.columns.empty()) {
        return "<none>";
    }
    std::string out;
    for (std::size_t i = 0; i < table.columns.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        const auto& name = table.columns[i].name;
        if (is_simple_identifier(name)) {
            out.append(name);
        } else {
            out.push_back('`');
            out.append(name);
            out.push_back('`');
        }
    }
    return out;
}

ColumnBuilder::ColumnBuilder(ScalarKind kind, std::size_t capacity)
    : kind_(kind), values_(empty_column(kind)) {
    std::visit([&](auto& col) { col.reserve(capacity); }, values_);
    validity_.reserve(capacity);
}

void ColumnBuilder::append(const Cell& cell) {
    if (!cell.has_value()) {
        append_null();
        return;
    }
    const ScalarValue& value = *cell;
    std::visit(
        [&](auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, double>) {
                if (const auto* i = std::get_if<std::int64_t>(&value)) {
                    col.push_back(static_cast<double>(*i));
                    return;
                }
            }
            const auto* v = std::get_if<T>(&value);
            if (v == nullptr) {
                throw std::invalid_argument(
                    fmt::format("cannot append {} value to {} column",
                                kind_name(scalar_kind(value)), kind_name(kind_)));
            }
            col.push_back(*v);
        },
        values_);
    validity_.push_back(true);
}

void ColumnBuilder::append_null() {
    std::visit(
        [](auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            col.push_back(T{});
        },
        values_);
    validity_.push_back(false);
    has_nulls_ = true;
}

auto ColumnBuilder::finish(std::string name) && -> ColumnEntry {
    std::optional<Validity> validity;
    if (has_nulls_) {
        validity = std::move(validity_);
    }
    return ColumnEntry{.name = std::move(name),
                       .column = std::make_shared<const ColumnValue>(std::move(values_)),
                       .validity = std::move(validity)};
}

}  // namespace tabula::runtime
