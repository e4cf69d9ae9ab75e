#include <tabula/runtime/mutate.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <optional>

namespace tabula::runtime {

namespace {

auto describe_key(const Key& key) -> std::string {
    std::vector<std::string> parts;
    parts.reserve(key.values.size());
    for (const auto& cell : key.values) {
        parts.push_back(format_cell(cell));
    }
    return fmt::format("({})", fmt::join(parts, ", "));
}

auto evaluate_field(const Table& table, const Partitioning& partitioning, const FieldSpec& field,
                    const ExecOptions& options) -> std::expected<MutateColumn, Error> {
    const bool grouped = !partitioning.keys.empty();
    const std::size_t count = partitioning.size();
    std::vector<std::optional<MutateColumn>> parts(count);
    std::vector<std::optional<Error>> failures(count);

    for_each_index(count, options, [&](std::size_t i) {
        const auto& partition = partitioning.groups[i];
        try {
            if (grouped) {
                parts[i] = field.fn(partition_view(table, partition));
            } else {
                parts[i] = field.fn(table);
            }
        } catch (const std::exception& e) {
            failures[i] = make_error(
                ErrorCode::ReducerFailure,
                grouped ? fmt::format("mutate function failed for group {}: {}",
                                      describe_key(partition.key), e.what())
                        : fmt::format("mutate function failed: {}", e.what()),
                {field.alias});
        }
    });

    std::vector<MutateColumn> values;
    std::vector<ScalarKind> kinds;
    values.reserve(count);
    kinds.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        if (failures[i].has_value()) {
            return std::unexpected(std::move(*failures[i]));
        }
        const auto& partition = partitioning.groups[i];
        const std::size_t n = column_size(parts[i]->values);
        if (n != partition.rows.size()) {
            return std::unexpected(make_error(
                ErrorCode::PartitionLengthMismatch,
                grouped ? fmt::format("mutate returned {} values for group {} of {} rows", n,
                                      describe_key(partition.key), partition.rows.size())
                        : fmt::format("mutate returned {} values for {} rows", n,
                                      partition.rows.size()),
                {field.alias}));
        }
        if (parts[i]->validity.has_value() && parts[i]->validity->size() != n) {
            return std::unexpected(make_error(
                ErrorCode::PartitionLengthMismatch,
                fmt::format("mutate returned {} validity flags for {} values",
                            parts[i]->validity->size(), n),
                {field.alias}));
        }
        kinds.push_back(column_kind(parts[i]->values));
        values.push_back(std::move(*parts[i]));
    }

    if (count == 0) {
        return MutateColumn{Column<double>{}};
    }
    auto kind = common_kind(kinds);
    if (!kind.has_value()) {
        return std::unexpected(make_error(ErrorCode::TypeMismatch,
                                          "mutate returned columns of incompatible types across groups",
                                          {field.alias}));
    }
    if (!grouped) {
        auto& only = values.front();
        return MutateColumn{convert_column(only.values, *kind), std::move(only.validity)};
    }
    return scatter_columns(values, partitioning, table.rows(), *kind);
}

}  // namespace

auto scatter_columns(const std::vector<MutateColumn>& parts, const Partitioning& partitioning,
                     std::size_t rows, ScalarKind kind) -> MutateColumn {
    ColumnValue output;
    switch (kind) {
        case ScalarKind::Int:
            output = Column<std::int64_t>{};
            break;
        case ScalarKind::Double:
            output = Column<double>{};
            break;
        case ScalarKind::String:
            output = Column<std::string>{};
            break;
    }
    const bool any_validity = std::any_of(parts.begin(), parts.end(), [](const auto& part) {
        return part.validity.has_value();
    });
    std::optional<Validity> validity;
    if (any_validity) {
        validity.emplace(rows, true);
    }
    std::visit(
        [&](auto& out) {
            using ColT = std::decay_t<decltype(out)>;
            out.resize(rows);
            for (std::size_t g = 0; g < parts.size(); ++g) {
                const auto converted = convert_column(parts[g].values, kind);
                const auto& src = std::get<ColT>(converted);
                const auto& positions = partitioning.groups[g].rows;
                for (std::size_t j = 0; j < positions.size(); ++j) {
                    out[positions[j]] = src[j];
                }
                if (parts[g].validity.has_value()) {
                    const auto& bits = *parts[g].validity;
                    for (std::size_t j = 0; j < positions.size(); ++j) {
                        (*validity)[positions[j]] = bits[j];
                    }
                }
            }
        },
        output);
    return MutateColumn{std::move(output), std::move(validity)};
}

auto mutate_table(const Table& input, const GroupSpec& groups, const std::vector<FieldSpec>& fields,
                  const ExecOptions& options) -> std::expected<Table, Error> {
    for (const auto& field : fields) {
        if (!field.fn) {
            return std::unexpected(make_error(ErrorCode::MissingReducer,
                                              "no function bound to mutate field", {field.alias}));
        }
    }

    auto partitioning = partition_table(input, groups);
    if (!partitioning) {
        return std::unexpected(partitioning.error());
    }

    Table output = input;
    for (const auto& field : fields) {
        auto column = evaluate_field(output, *partitioning, field, options);
        if (!column) {
            return std::unexpected(column.error());
        }
        if (column->validity.has_value()) {
            output.add_column(field.alias, std::move(column->values), std::move(*column->validity));
        } else {
            output.add_column(field.alias, std::move(column->values));
        }

        // Overwriting a key column changes group membership for later fields.
        if (std::find(groups.begin(), groups.end(), field.alias) != groups.end()) {
            partitioning = partition_table(output, groups);
            if (!partitioning) {
                return std::unexpected(partitioning.error());
            }
        }
    }
    spdlog::debug("mutate: {} field(s) over {} group(s)", fields.size(), partitioning->size());
    return output;
}

}  // namespace tabula::runtime
