#include <tabula/runtime/aggregate.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <optional>
#include <unordered_set>

namespace tabula::runtime {

namespace {

auto check_aliases(const GroupSpec& groups, const std::vector<AggSpec>& aggregations)
    -> std::expected<void, Error> {
    std::unordered_set<std::string> names(groups.begin(), groups.end());
    for (const auto& agg : aggregations) {
        if (!agg.fn) {
            return std::unexpected(make_error(ErrorCode::MissingReducer,
                                              "no reducer bound to aggregate column", {agg.alias}));
        }
        if (!names.insert(agg.alias).second) {
            return std::unexpected(make_error(ErrorCode::DuplicateColumnName,
                                              "aggregate output name is already in use",
                                              {agg.alias}));
        }
    }
    return {};
}

}  // namespace

auto aggregate_table(const Table& input, const GroupSpec& groups,
                     const std::vector<AggSpec>& aggregations, const ExecOptions& options)
    -> std::expected<Table, Error> {
    if (auto valid = validate_group_columns(input, groups); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = check_aliases(groups, aggregations); !valid) {
        return std::unexpected(valid.error());
    }

    auto partitioning = partition_table(input, groups);
    if (!partitioning) {
        return std::unexpected(partitioning.error());
    }
    sort_partitions(*partitioning);

    const bool grouped = !groups.empty();
    const std::size_t count = partitioning->size();
    const std::size_t width = aggregations.size();

    // results[g * width + a] is reducer a applied to group g.
    std::vector<std::optional<ScalarValue>> results(count * width);
    std::vector<std::optional<Error>> failures(count);

    for_each_index(count, options, [&](std::size_t g) {
        const auto& partition = partitioning->groups[g];
        Table sub = grouped ? partition_view(input, partition) : input;
        for (std::size_t a = 0; a < width; ++a) {
            try {
                results[g * width + a] = aggregations[a].fn(sub);
            } catch (const std::exception& e) {
                std::vector<std::string> parts;
                for (const auto& cell : partition.key.values) {
                    parts.push_back(format_cell(cell));
                }
                failures[g] = make_error(
                    ErrorCode::ReducerFailure,
                    grouped ? fmt::format("reducer failed for group ({}): {}",
                                          fmt::join(parts, ", "), e.what())
                            : fmt::format("reducer failed: {}", e.what()),
                    {aggregations[a].alias});
                return;
            }
        }
    });
    for (auto& failure : failures) {
        if (failure.has_value()) {
            return std::unexpected(std::move(*failure));
        }
    }

    Table output;
    output.columns.reserve(groups.size() + width);
    for (std::size_t k = 0; k < groups.size(); ++k) {
        const auto* source = input.find_entry(groups[k]);
        ColumnBuilder builder(column_kind(*source->column), count);
        for (const auto& partition : partitioning->groups) {
            builder.append(partition.key.values[k]);
        }
        output.add_entry(std::move(builder).finish(groups[k]));
    }

    for (std::size_t a = 0; a < width; ++a) {
        std::vector<ScalarKind> kinds;
        kinds.reserve(count);
        for (std::size_t g = 0; g < count; ++g) {
            kinds.push_back(scalar_kind(*results[g * width + a]));
        }
        // No groups means no values; such a column is typed Double.
        auto kind = count == 0 ? std::optional<ScalarKind>{ScalarKind::Double} : common_kind(kinds);
        if (!kind.has_value()) {
            return std::unexpected(make_error(ErrorCode::TypeMismatch,
                                              "reducer returned values of incompatible types",
                                              {aggregations[a].alias}));
        }
        ColumnBuilder builder(*kind, count);
        for (std::size_t g = 0; g < count; ++g) {
            builder.append(results[g * width + a]);
        }
        output.add_entry(std::move(builder).finish(aggregations[a].alias));
    }

    spdlog::debug("aggregate: {} group(s) x {} reducer(s)", count, width);
    return output;
}

}  // namespace tabula::runtime
