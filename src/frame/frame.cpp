#include <tabula/frame.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace tabula {

namespace {

auto contains(const std::vector<std::string>& names, const std::string& name) -> bool {
    return std::find(names.begin(), names.end(), name) != names.end();
}

}  // namespace

Frame::Frame(runtime::Table table, runtime::ExecOptions options)
    : Frame(std::move(table), GroupSpec{}, options) {}

Frame::Frame(runtime::Table table, GroupSpec groups, runtime::ExecOptions options)
    : table_(std::move(table)), groups_(std::move(groups)), options_(options) {
    if (auto valid = runtime::validate_table(table_); !valid) {
        throw FrameError(std::move(valid.error()));
    }
    if (auto valid = runtime::validate_group_columns(table_, groups_); !valid) {
        throw FrameError(std::move(valid.error()));
    }
}

auto Frame::from_columns(std::vector<std::pair<std::string, runtime::ColumnValue>> columns)
    -> Frame {
    return Frame(unwrap(runtime::make_table(std::move(columns))));
}

auto Frame::derive(runtime::Table table, GroupSpec groups) const -> Frame {
    Frame out;
    out.table_ = std::move(table);
    out.groups_ = std::move(groups);
    out.options_ = options_;
    return out;
}

auto Frame::with_options(runtime::ExecOptions options) const -> Frame {
    Frame out = *this;
    out.options_ = options;
    return out;
}

auto Frame::select(const std::vector<std::string>& names) const -> Frame {
    std::vector<std::string> columns;
    for (const auto& key : groups_) {
        if (!contains(names, key)) {
            columns.push_back(key);
        }
    }
    if (!columns.empty()) {
        spdlog::info("select: keeping grouping column(s) [{}]", fmt::join(columns, ", "));
    }
    columns.insert(columns.end(), names.begin(), names.end());
    return derive(unwrap(runtime::project_table(table_, columns)), groups_);
}

auto Frame::drop(const std::vector<std::string>& names) const -> Frame {
    std::vector<std::string> grouped;
    for (const auto& name : names) {
        if (contains(groups_, name)) {
            grouped.push_back(name);
        }
    }
    if (!grouped.empty()) {
        throw FrameError(make_error(ErrorCode::GroupColumnDropped,
                                    "cannot drop a grouping column; ungroup first",
                                    std::move(grouped)));
    }
    return derive(unwrap(runtime::drop_columns(table_, names)), groups_);
}

auto Frame::rename(const runtime::RenameMap& mapping) const -> Frame {
    auto table = unwrap(runtime::rename_columns(table_, mapping));
    // Renaming keeps column positions, so keys follow their column.
    GroupSpec groups;
    groups.reserve(groups_.size());
    for (const auto& key : groups_) {
        groups.push_back(table.columns[table_.index.at(key)].name);
    }
    return derive(std::move(table), std::move(groups));
}

auto Frame::set_names(const std::vector<std::string>& names) const -> Frame {
    auto table = unwrap(runtime::set_column_names(table_, names));
    GroupSpec groups;
    groups.reserve(groups_.size());
    for (const auto& key : groups_) {
        groups.push_back(names[table_.index.at(key)]);
    }
    return derive(std::move(table), std::move(groups));
}

auto Frame::sort(const std::vector<std::string>& names, bool ascending) const -> Frame {
    std::vector<runtime::SortKey> keys;
    keys.reserve(names.size());
    for (const auto& name : names) {
        keys.push_back(runtime::SortKey{.name = name, .ascending = ascending});
    }
    return sort_by(keys);
}

auto Frame::sort_by(const std::vector<runtime::SortKey>& keys) const -> Frame {
    std::vector<runtime::SortKey> resolved;
    resolved.reserve(groups_.size() + keys.size());
    for (const auto& key : groups_) {
        resolved.push_back(runtime::SortKey{.name = key, .ascending = true});
    }
    for (const auto& key : keys) {
        if (!contains(groups_, key.name)) {
            resolved.push_back(key);
        }
    }
    return derive(unwrap(runtime::order_table(table_, resolved)), groups_);
}

auto Frame::filter(const runtime::PredicateFn& predicate) const -> Frame {
    return derive(unwrap(runtime::filter_table(table_, predicate)), groups_);
}

auto Frame::filter(const std::vector<runtime::PredicateFn>& predicates) const -> Frame {
    runtime::Table table = table_;
    for (const auto& predicate : predicates) {
        table = unwrap(runtime::filter_table(table, predicate));
    }
    return derive(std::move(table), groups_);
}

auto Frame::head(std::size_t n) const -> Frame {
    return derive(runtime::head_rows(table_, n), groups_);
}

auto Frame::tail(std::size_t n) const -> Frame {
    return derive(runtime::tail_rows(table_, n), groups_);
}

auto Frame::slice(const std::vector<std::size_t>& positions) const -> Frame {
    return derive(unwrap(runtime::slice_rows(table_, positions)), groups_);
}

auto Frame::sample_n(std::size_t n, bool replace) const -> Frame {
    std::random_device seed;
    std::mt19937_64 rng(seed());
    return sample_n(n, rng, replace);
}

auto Frame::group_by(const GroupSpec& keys) const -> Frame {
    if (auto valid = runtime::validate_group_columns(table_, keys); !valid) {
        throw FrameError(std::move(valid.error()));
    }
    return derive(table_, keys);
}

auto Frame::ungroup() const -> Frame {
    return derive(table_, {});
}

auto Frame::mutate(const std::vector<runtime::FieldSpec>& fields) const -> Frame {
    return derive(unwrap(runtime::mutate_table(table_, groups_, fields, options_)), groups_);
}

auto Frame::agg(const std::vector<runtime::AggSpec>& aggregations) const -> Frame {
    return derive(unwrap(runtime::aggregate_table(table_, groups_, aggregations, options_)), {});
}

auto Frame::gather(const std::string& key, const std::string& value,
                   const std::vector<std::string>& keep) const -> Frame {
    return derive(unwrap(runtime::gather_columns(table_, key, value, keep)), {});
}

auto Frame::join(const Frame& other, runtime::JoinKind kind,
                 const std::optional<std::vector<std::string>>& by) const -> Frame {
    auto keys = unwrap(runtime::resolve_join_keys(table_, other.table_, by));
    return derive(unwrap(runtime::join_tables(table_, other.table_, kind, keys)), {});
}

auto Frame::left_join(const Frame& other, const std::optional<std::vector<std::string>>& by) const
    -> Frame {
    return join(other, runtime::JoinKind::Left, by);
}

auto Frame::inner_join(const Frame& other, const std::optional<std::vector<std::string>>& by) const
    -> Frame {
    return join(other, runtime::JoinKind::Inner, by);
}

auto Frame::to_string(std::size_t n) const -> std::string {
    std::ostringstream out;
    out << fmt::format("Frame [{} x {}]\n", rows(), table_.columns.size());
    if (is_grouped()) {
        out << fmt::format("With groups [{}]\n", fmt::join(groups_, ", "));
    }
    out << "\n";
    runtime::print(table_, out, n);
    if (rows() > n) {
        out << fmt::format(" only showing top {} rows.\n", n);
    }
    return out.str();
}

void Frame::show(std::size_t n) const {
    std::cout << to_string(n);
}

auto operator<<(std::ostream& out, const Frame& frame) -> std::ostream& {
    return out << frame.to_string();
}

}  // namespace tabula
