#include <tabula/runtime/ops.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <exception>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace tabula::runtime {

namespace {

auto unknown_columns(const Table& t, const std::vector<std::string>& names)
    -> std::vector<std::string> {
    std::vector<std::string> missing;
    for (const auto& name : names) {
        if (!t.contains(name)) {
            missing.push_back(name);
        }
    }
    return missing;
}

auto unknown_column_error(const Table& t, std::vector<std::string> missing) -> Error {
    return make_error(ErrorCode::UnknownColumn,
                      "column not found (available: " + format_columns(t) + ")",
                      std::move(missing));
}

auto iota_rows(std::size_t begin, std::size_t end) -> std::vector<std::size_t> {
    std::vector<std::size_t> rows(end - begin);
    std::iota(rows.begin(), rows.end(), begin);
    return rows;
}

}  // namespace

auto project_table(const Table& t, const std::vector<std::string>& col_names)
    -> std::expected<Table, Error> {
    if (auto missing = unknown_columns(t, col_names); !missing.empty()) {
        return std::unexpected(unknown_column_error(t, std::move(missing)));
    }
    Table output;
    for (const auto& name : col_names) {
        if (output.contains(name)) {
            continue;
        }
        output.add_entry(*t.find_entry(name));
    }
    return output;
}

auto drop_columns(const Table& t, const std::vector<std::string>& col_names)
    -> std::expected<Table, Error> {
    if (auto missing = unknown_columns(t, col_names); !missing.empty()) {
        return std::unexpected(unknown_column_error(t, std::move(missing)));
    }
    std::unordered_set<std::string> dropped(col_names.begin(), col_names.end());
    Table output;
    for (const auto& entry : t.columns) {
        if (!dropped.contains(entry.name)) {
            output.add_entry(entry);
        }
    }
    return output;
}

auto rename_columns(const Table& t, const RenameMap& mapping) -> std::expected<Table, Error> {
    std::unordered_map<std::string, std::string> renames;
    for (const auto& [from, to] : mapping) {
        if (!t.contains(from)) {
            return std::unexpected(unknown_column_error(t, {from}));
        }
        if (!renames.emplace(from, to).second) {
            return std::unexpected(
                make_error(ErrorCode::InvalidArgument, "column renamed more than once", {from}));
        }
    }
    std::vector<std::string> names;
    names.reserve(t.columns.size());
    for (const auto& entry : t.columns) {
        auto it = renames.find(entry.name);
        names.push_back(it == renames.end() ? entry.name : it->second);
    }
    return set_column_names(t, names);
}

auto set_column_names(const Table& t, const std::vector<std::string>& names)
    -> std::expected<Table, Error> {
    if (names.size() != t.columns.size()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            fmt::format("expected {} column names, got {}", t.columns.size(), names.size())));
    }
    Table output;
    output.columns.reserve(names.size());
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (output.contains(names[i])) {
            return std::unexpected(
                make_error(ErrorCode::DuplicateColumnName, "duplicate column name", {names[i]}));
        }
        ColumnEntry entry = t.columns[i];
        entry.name = names[i];
        output.add_entry(std::move(entry));
    }
    return output;
}

auto order_table(const Table& t, const std::vector<SortKey>& keys) -> std::expected<Table, Error> {
    enum class FlatKind : std::uint8_t { I64, F64, Str };
    struct FlatKey {
        FlatKind kind = FlatKind::I64;
        const ColumnEntry* entry = nullptr;
        std::span<const std::int64_t> i64;
        std::span<const double> f64;
        std::span<const std::string> str;
        bool ascending = true;
    };

    std::vector<FlatKey> flat_keys;
    flat_keys.reserve(keys.size());
    for (const auto& key : keys) {
        const auto* entry = t.find_entry(key.name);
        if (entry == nullptr) {
            return std::unexpected(unknown_column_error(t, {key.name}));
        }
        FlatKey fk;
        fk.entry = entry;
        fk.ascending = key.ascending;
        std::visit(
            [&](const auto& col) {
                using T = typename std::decay_t<decltype(col)>::value_type;
                if constexpr (std::is_same_v<T, std::int64_t>) {
                    fk.kind = FlatKind::I64;
                    fk.i64 = col.span();
                } else if constexpr (std::is_same_v<T, double>) {
                    fk.kind = FlatKind::F64;
                    fk.f64 = col.span();
                } else {
                    fk.kind = FlatKind::Str;
                    fk.str = col.span();
                }
            },
            *entry->column);
        flat_keys.push_back(fk);
    }

    const std::size_t rows = t.rows();
    if (rows <= 1 || flat_keys.empty()) {
        return t;
    }

    auto compare_row = [&](std::size_t lhs, std::size_t rhs) -> bool {
        for (const auto& fk : flat_keys) {
            const bool lnull = is_null(*fk.entry, lhs);
            const bool rnull = is_null(*fk.entry, rhs);
            if (lnull || rnull) {
                if (lnull != rnull) {
                    return rnull;
                }
                continue;
            }
            switch (fk.kind) {
                case FlatKind::I64: {
                    auto l = fk.i64[lhs], r = fk.i64[rhs];
                    if (l != r)
                        return fk.ascending ? (l < r) : (l > r);
                    break;
                }
                case FlatKind::F64: {
                    auto l = fk.f64[lhs], r = fk.f64[rhs];
                    const bool lnan = std::isnan(l);
                    const bool rnan = std::isnan(r);
                    if (lnan || rnan) {
                        if (lnan != rnan)
                            return rnan;
                        break;
                    }
                    if (l != r)
                        return fk.ascending ? (l < r) : (l > r);
                    break;
                }
                case FlatKind::Str: {
                    std::string_view l = fk.str[lhs], r = fk.str[rhs];
                    if (l != r)
                        return fk.ascending ? (l < r) : (l > r);
                    break;
                }
            }
        }
        return false;
    };

    std::vector<std::size_t> idx(rows);
    std::iota(idx.begin(), idx.end(), std::size_t{0});
    std::stable_sort(idx.begin(), idx.end(), compare_row);
    return take_rows(t, idx);
}

auto filter_table(const Table& t, const PredicateFn& predicate) -> std::expected<Table, Error> {
    if (!predicate) {
        return std::unexpected(make_error(ErrorCode::MissingReducer, "no predicate bound to filter"));
    }
    Mask mask;
    try {
        mask = predicate(t);
    } catch (const std::exception& e) {
        return std::unexpected(
            make_error(ErrorCode::ReducerFailure, fmt::format("filter predicate failed: {}", e.what())));
    }
    const std::size_t n = t.rows();
    if (mask.size() != n) {
        return std::unexpected(make_error(
            ErrorCode::PartitionLengthMismatch,
            fmt::format("filter predicate returned {} values for {} rows", mask.size(), n)));
    }

    std::vector<std::size_t> selected;
    selected.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (mask[i] != 0) {
            selected.push_back(i);
        }
    }
    spdlog::debug("filter kept {} of {} rows", selected.size(), n);
    return take_rows(t, selected);
}

auto head_rows(const Table& t, std::size_t n) -> Table {
    const std::size_t rows = t.rows();
    return take_rows(t, iota_rows(0, std::min(n, rows)));
}

auto tail_rows(const Table& t, std::size_t n) -> Table {
    const std::size_t rows = t.rows();
    return take_rows(t, iota_rows(rows - std::min(n, rows), rows));
}

auto slice_rows(const Table& t, const std::vector<std::size_t>& positions)
    -> std::expected<Table, Error> {
    const std::size_t rows = t.rows();
    for (auto pos : positions) {
        if (pos >= rows) {
            return std::unexpected(make_error(
                ErrorCode::IndexOutOfRange,
                fmt::format("row position {} is out of range for {} rows", pos, rows)));
        }
    }
    return take_rows(t, positions);
}

auto gather_columns(const Table& t, const std::string& key, const std::string& value,
                    const std::vector<std::string>& keep) -> std::expected<Table, Error> {
    if (auto missing = unknown_columns(t, keep); !missing.empty()) {
        return std::unexpected(unknown_column_error(t, std::move(missing)));
    }
    std::unordered_set<std::string> kept(keep.begin(), keep.end());
    if (key == value || kept.contains(key) || kept.contains(value)) {
        return std::unexpected(make_error(ErrorCode::DuplicateColumnName,
                                          "gather output names clash", {key, value}));
    }

    std::vector<const ColumnEntry*> stacked;
    std::vector<ScalarKind> kinds;
    for (const auto& entry : t.columns) {
        if (!kept.contains(entry.name)) {
            stacked.push_back(&entry);
            kinds.push_back(column_kind(*entry.column));
        }
    }

    const std::size_t rows = t.rows();
    const std::size_t out_rows = rows * stacked.size();
    std::vector<std::size_t> repeated;
    repeated.reserve(out_rows);
    for (std::size_t s = 0; s < stacked.size(); ++s) {
        for (std::size_t r = 0; r < rows; ++r) {
            repeated.push_back(r);
        }
    }

    Table output;
    for (const auto& name : keep) {
        if (!output.contains(name)) {
            output.add_entry(take_entry(*t.find_entry(name), repeated));
        }
    }

    Column<std::string> names;
    names.reserve(out_rows);
    auto kind = common_kind(kinds);
    const bool as_text = !kind.has_value();
    ColumnBuilder values(as_text ? ScalarKind::String : *kind, out_rows);
    for (const auto* entry : stacked) {
        for (std::size_t r = 0; r < rows; ++r) {
            names.push_back(entry->name);
            auto cell = cell_at(*entry, r);
            if (as_text && cell.has_value()) {
                values.append(ScalarValue{format_cell(cell)});
            } else {
                values.append(cell);
            }
        }
    }
    output.add_column(key, std::move(names));
    output.add_entry(std::move(values).finish(value));
    return output;
}

void print(const Table& t, std::ostream& out, std::size_t max_rows) {
    if (t.columns.empty()) {
        out << "(empty table)\n";
        return;
    }

    const std::size_t rows = std::min(t.rows(), max_rows);

    // Collect all cell strings and compute column widths.
    std::vector<std::vector<std::string>> cells(t.columns.size());
    std::vector<std::size_t> widths(t.columns.size());

    for (std::size_t c = 0; c < t.columns.size(); ++c) {
        widths[c] = t.columns[c].name.size();
        cells[c].reserve(rows);
        for (std::size_t r = 0; r < rows; ++r) {
            auto s = format_cell(cell_at(t.columns[c], r));
            widths[c] = std::max(widths[c], s.size());
            cells[c].push_back(std::move(s));
        }
    }

    for (std::size_t c = 0; c < t.columns.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << fmt::format("{:<{}}", t.columns[c].name, widths[c]);
    }
    out << "\n";

    for (std::size_t c = 0; c < t.columns.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << std::string(widths[c], '-');
    }
    out << "\n";

    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < t.columns.size(); ++c) {
            if (c > 0)
                out << "  ";
            out << fmt::format("{:<{}}", cells[c][r], widths[c]);
        }
        out << "\n";
    }
}

}  // namespace tabula::runtime
