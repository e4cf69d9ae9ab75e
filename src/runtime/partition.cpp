#include <tabula/runtime/partition.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>

namespace tabula::runtime {

auto validate_group_columns(const Table& table, const GroupSpec& keys)
    -> std::expected<void, Error> {
    std::vector<std::string> missing;
    for (const auto& key : keys) {
        if (!table.contains(key)) {
            missing.push_back(key);
        }
    }
    if (!missing.empty()) {
        return std::unexpected(
            make_error(ErrorCode::InvalidGroupColumn,
                       fmt::format("group column not found (available: {})", format_columns(table)),
                       std::move(missing)));
    }
    return {};
}

auto partition_table(const Table& table, const GroupSpec& keys)
    -> std::expected<Partitioning, Error> {
    if (auto valid = validate_group_columns(table, keys); !valid) {
        return std::unexpected(valid.error());
    }

    const std::size_t rows = table.rows();
    Partitioning result;
    result.keys = keys;

    if (keys.empty()) {
        Partition whole;
        whole.rows.resize(rows);
        std::iota(whole.rows.begin(), whole.rows.end(), std::size_t{0});
        result.groups.push_back(std::move(whole));
        return result;
    }

    std::vector<const ColumnEntry*> key_columns;
    key_columns.reserve(keys.size());
    for (const auto& key : keys) {
        key_columns.push_back(table.find_entry(key));
    }

    robin_hood::unordered_flat_map<Key, std::size_t, KeyHash, KeyEq> group_ids;
    group_ids.reserve(std::min<std::size_t>(rows, 1024));
    for (std::size_t row = 0; row < rows; ++row) {
        Key key = key_at(key_columns, row);
        auto [it, inserted] = group_ids.try_emplace(key, result.groups.size());
        if (inserted) {
            result.groups.push_back(Partition{.key = std::move(key), .rows = {}});
        }
        result.groups[it->second].rows.push_back(row);
    }
    spdlog::debug("partitioned {} rows by [{}] into {} groups", rows, fmt::join(keys, ", "),
                  result.groups.size());
    return result;
}

void sort_partitions(Partitioning& partitioning) {
    std::sort(partitioning.groups.begin(), partitioning.groups.end(),
              [](const Partition& lhs, const Partition& rhs) {
                  return compare_keys(lhs.key, rhs.key) < 0;
              });
}

auto partition_view(const Table& table, const Partition& partition) -> Table {
    return take_rows(table, partition.rows);
}

}  // namespace tabula::runtime
