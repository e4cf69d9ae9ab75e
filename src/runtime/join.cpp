#include <tabula/runtime/join.hpp>
#include <tabula/runtime/key.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace tabula::runtime {

auto resolve_join_keys(const Table& left, const Table& right,
                       const std::optional<std::vector<std::string>>& by)
    -> std::expected<std::vector<std::string>, Error> {
    std::vector<std::string> keys;
    if (by.has_value()) {
        for (const auto& name : *by) {
            if (std::find(keys.begin(), keys.end(), name) == keys.end()) {
                keys.push_back(name);
            }
        }
    } else {
        for (const auto& entry : left.columns) {
            if (right.contains(entry.name)) {
                keys.push_back(entry.name);
            }
        }
    }

    if (keys.empty()) {
        return std::unexpected(make_error(
            ErrorCode::EmptyJoinKey,
            fmt::format("no join columns (left: {}; right: {})", format_columns(left),
                        format_columns(right))));
    }
    std::vector<std::string> missing;
    for (const auto& key : keys) {
        if (!left.contains(key) || !right.contains(key)) {
            missing.push_back(key);
        }
    }
    if (!missing.empty()) {
        return std::unexpected(make_error(ErrorCode::UnknownJoinColumn,
                                          "join column does not exist in both tables",
                                          std::move(missing)));
    }
    return keys;
}

auto join_tables(const Table& left, const Table& right, JoinKind kind,
                 const std::vector<std::string>& keys) -> std::expected<Table, Error> {
    if (keys.empty()) {
        return std::unexpected(make_error(ErrorCode::EmptyJoinKey, "join requires at least one key"));
    }

    std::vector<const ColumnEntry*> left_keys;
    std::vector<const ColumnEntry*> right_keys;
    left_keys.reserve(keys.size());
    right_keys.reserve(keys.size());
    for (const auto& key : keys) {
        const auto* left_col = left.find_entry(key);
        if (left_col == nullptr) {
            return std::unexpected(make_error(
                ErrorCode::UnknownJoinColumn,
                "join key not found in left (available: " + format_columns(left) + ")", {key}));
        }
        const auto* right_col = right.find_entry(key);
        if (right_col == nullptr) {
            return std::unexpected(make_error(
                ErrorCode::UnknownJoinColumn,
                "join key not found in right (available: " + format_columns(right) + ")", {key}));
        }
        if (column_kind(*left_col->column) != column_kind(*right_col->column)) {
            return std::unexpected(make_error(
                ErrorCode::TypeMismatch,
                fmt::format("join key type mismatch ({} vs {})",
                            kind_name(column_kind(*left_col->column)),
                            kind_name(column_kind(*right_col->column))),
                {key}));
        }
        left_keys.push_back(left_col);
        right_keys.push_back(right_col);
    }

    std::unordered_map<Key, std::vector<std::size_t>, KeyHash, KeyEq> right_index;
    right_index.reserve(right.rows());
    for (std::size_t r = 0; r < right.rows(); ++r) {
        right_index[key_at(right_keys, r)].push_back(r);
    }

    std::vector<std::size_t> left_rows;
    std::vector<std::size_t> right_rows;
    left_rows.reserve(left.rows());
    right_rows.reserve(left.rows());
    for (std::size_t l = 0; l < left.rows(); ++l) {
        auto it = right_index.find(key_at(left_keys, l));
        if (it == right_index.end()) {
            if (kind == JoinKind::Left) {
                left_rows.push_back(l);
                right_rows.push_back(kNullRow);
            }
            continue;
        }
        for (auto r : it->second) {
            left_rows.push_back(l);
            right_rows.push_back(r);
        }
    }

    std::unordered_set<std::string> key_set(keys.begin(), keys.end());
    std::unordered_set<std::string> out_names;
    out_names.reserve(left.columns.size() + right.columns.size());

    Table output;
    output.columns.reserve(left.columns.size() + right.columns.size());
    for (const auto& entry : left.columns) {
        out_names.insert(entry.name);
        output.add_entry(take_entry(entry, left_rows));
    }
    for (const auto& entry : right.columns) {
        if (key_set.contains(entry.name)) {
            continue;
        }
        auto gathered = take_entry(entry, right_rows);
        while (out_names.contains(gathered.name)) {
            gathered.name += "_right";
        }
        out_names.insert(gathered.name);
        output.add_entry(std::move(gathered));
    }

    spdlog::debug("{} join on {} key(s): {} x {} rows -> {} rows",
                  kind == JoinKind::Inner ? "inner" : "left", keys.size(), left.rows(),
                  right.rows(), output.rows());
    return output;
}

}  // namespace tabula::runtime
