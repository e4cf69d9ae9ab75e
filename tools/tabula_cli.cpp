#include <tabula/frame.hpp>
#include <tabula/runtime/csv.hpp>
#include <tabula/runtime/functions.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <expected>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using tabula::runtime::AggSpec;
using tabula::runtime::ReduceFn;
using tabula::runtime::SortKey;

auto trim(std::string_view input) -> std::string_view {
    auto start = input.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = input.find_last_not_of(" \t\n\r");
    return input.substr(start, end - start + 1);
}

auto make_reducer(std::string_view func, const std::string& column)
    -> std::expected<ReduceFn, std::string> {
    namespace fn = tabula::fn;
    if (func == "count") {
        return column.empty() ? fn::count() : fn::count(column);
    }
    if (column.empty()) {
        return std::unexpected(fmt::format("{}() needs a column argument", func));
    }
    if (func == "sum") {
        return fn::sum(column);
    }
    if (func == "mean") {
        return fn::mean(column);
    }
    if (func == "min") {
        return fn::min(column);
    }
    if (func == "max") {
        return fn::max(column);
    }
    if (func == "first") {
        return fn::first(column);
    }
    if (func == "last") {
        return fn::last(column);
    }
    if (func == "n_distinct") {
        return fn::n_distinct(column);
    }
    return std::unexpected(fmt::format("unknown reducer '{}'", func));
}

/// Parse `out=func(col)`; `count()` takes no column.
auto parse_agg(std::string_view text) -> std::expected<AggSpec, std::string> {
    auto eq = text.find('=');
    auto open = text.find('(', eq == std::string_view::npos ? 0 : eq);
    auto close = text.rfind(')');
    if (eq == std::string_view::npos || open == std::string_view::npos ||
        close == std::string_view::npos || close < open) {
        return std::unexpected(
            fmt::format("malformed --agg '{}', expected out=func(column)", text));
    }
    auto alias = std::string(trim(text.substr(0, eq)));
    auto func = trim(text.substr(eq + 1, open - eq - 1));
    auto column = std::string(trim(text.substr(open + 1, close - open - 1)));
    if (alias.empty()) {
        return std::unexpected(fmt::format("--agg '{}' has no output name", text));
    }
    auto reducer = make_reducer(func, column);
    if (!reducer) {
        return std::unexpected(reducer.error());
    }
    return AggSpec{std::move(alias), std::move(*reducer)};
}

/// Parse `col` or `col:desc` / `col:asc`.
auto parse_sort_key(std::string_view text) -> std::expected<SortKey, std::string> {
    auto colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        return SortKey{std::string(trim(text)), true};
    }
    auto direction = trim(text.substr(colon + 1));
    if (direction != "asc" && direction != "desc") {
        return std::unexpected(fmt::format("bad sort direction in '{}'", text));
    }
    return SortKey{std::string(trim(text.substr(0, colon))), direction == "asc"};
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"tabula: group, aggregate and sort a CSV file"};

    std::string csv_path;
    std::string null_spec = "<empty>,NA";
    std::vector<std::string> group_by;
    std::vector<std::string> agg_args;
    std::vector<std::string> sort_args;
    std::size_t head = 10;
    std::size_t threads = 0;
    bool verbose = false;

    app.add_option("csv", csv_path, "Input CSV file with a header row")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("--nulls", null_spec,
                   "Comma separated tokens read as missing; <empty> matches empty fields");
    app.add_option("-g,--group-by", group_by, "Grouping columns")->delimiter(',');
    app.add_option("-a,--agg", agg_args, "Aggregation out=func(column), repeatable");
    app.add_option("-s,--sort", sort_args, "Sort key column[:asc|:desc], repeatable");
    app.add_option("-n,--head", head, "Number of rows to print")->check(CLI::NonNegativeNumber);
    auto* threads_opt = app.add_option(
        "-j,--threads", threads,
        "Worker threads for per-group work (0 = all cores). Defaults to TABULA_THREADS.");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);
    const bool threads_set = threads_opt->count() > 0;

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }

    auto options = tabula::runtime::ExecOptions::from_env();
    if (threads_set) {
        options.max_threads = threads;
    }

    std::vector<AggSpec> aggs;
    for (const auto& arg : agg_args) {
        auto spec = parse_agg(arg);
        if (!spec) {
            fmt::print(stderr, "error: {}\n", spec.error());
            return 2;
        }
        aggs.push_back(std::move(*spec));
    }
    std::vector<SortKey> sort_keys;
    for (const auto& arg : sort_args) {
        auto key = parse_sort_key(arg);
        if (!key) {
            fmt::print(stderr, "error: {}\n", key.error());
            return 2;
        }
        sort_keys.push_back(std::move(*key));
    }

    auto table = tabula::runtime::read_csv(csv_path, tabula::runtime::parse_null_spec(null_spec));
    if (!table) {
        fmt::print(stderr, "error: {}\n", table.error().format());
        return 1;
    }
    spdlog::info("loaded {} rows x {} columns from {}", table->rows(), table->columns.size(),
                 csv_path);

    try {
        tabula::Frame frame(std::move(*table), options);
        if (!group_by.empty()) {
            frame = frame.group_by(group_by);
        }
        if (!aggs.empty()) {
            frame = frame.agg(aggs);
        }
        if (!sort_keys.empty()) {
            frame = frame.sort_by(sort_keys);
        }
        std::cout << frame.to_string(head);
    } catch (const tabula::FrameError& e) {
        fmt::print(stderr, "error: {}\n", e.error().format());
        return 1;
    }
    return 0;
}
