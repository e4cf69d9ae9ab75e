#include <tabula/runtime/functions.hpp>
#include <tabula/runtime/mutate.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tabula;

namespace {

auto col_i64(const runtime::Table& t, const std::string& name) -> std::vector<std::int64_t> {
    const auto* col = t.find(name);
    REQUIRE(col != nullptr);
    const auto* values = std::get_if<Column<std::int64_t>>(col);
    REQUIRE(values != nullptr);
    return {values->begin(), values->end()};
}

auto col_f64(const runtime::Table& t, const std::string& name) -> std::vector<double> {
    const auto* col = t.find(name);
    REQUIRE(col != nullptr);
    const auto* values = std::get_if<Column<double>>(col);
    REQUIRE(values != nullptr);
    return {values->begin(), values->end()};
}

auto sample_table() -> runtime::Table {
    runtime::Table t;
    t.add_column("g", Column<std::string>{"b", "a", "b", "a", "c"});
    t.add_column("x", Column<std::int64_t>{1, 2, 3, 4, 5});
    return t;
}

auto missing_rows(const runtime::Table& t, const std::string& name) -> std::vector<bool> {
    const auto* entry = t.find_entry(name);
    REQUIRE(entry != nullptr);
    std::vector<bool> out;
    for (std::size_t row = 0; row < t.rows(); ++row) {
        out.push_back(runtime::is_null(*entry, row));
    }
    return out;
}

/// g/x table where x is missing at rows 1 and 4.
auto sparse_table() -> runtime::Table {
    runtime::Table t;
    t.add_column("g", Column<std::string>{"b", "a", "b", "a", "c"});
    t.add_column("x", Column<std::int64_t>{1, 0, 3, 4, 0}, {true, false, true, true, false});
    return t;
}

/// Running sum of x within the sub-table it is given.
auto cumsum_x(const runtime::Table& t) -> runtime::ColumnValue {
    const auto& x = fn::values<std::int64_t>(t, "x");
    Column<std::int64_t> out;
    std::int64_t total = 0;
    for (auto v : x) {
        total += v;
        out.push_back(total);
    }
    return out;
}

/// Group size broadcast to every row of the group.
auto group_size(const runtime::Table& t) -> runtime::ColumnValue {
    return Column<std::int64_t>(std::vector<std::int64_t>(t.rows(), static_cast<std::int64_t>(t.rows())));
}

}  // namespace

TEST_CASE("mutate: ungrouped field sees the whole table", "[mutate]") {
    auto t = sample_table();

    auto out = runtime::mutate_table(t, {}, {{"cs", cumsum_x}});

    REQUIRE(out.has_value());
    CHECK(col_i64(*out, "cs") == std::vector<std::int64_t>{1, 3, 6, 10, 15});
    CHECK(out->column_names() == std::vector<std::string>{"g", "x", "cs"});
}

TEST_CASE("mutate: grouped values scatter back to original rows", "[mutate]") {
    auto t = sample_table();

    auto out = runtime::mutate_table(t, {"g"}, {{"cs", cumsum_x}, {"n", group_size}});

    REQUIRE(out.has_value());
    CHECK(out->rows() == t.rows());
    CHECK(col_i64(*out, "x") == std::vector<std::int64_t>{1, 2, 3, 4, 5});
    CHECK(col_i64(*out, "cs") == std::vector<std::int64_t>{1, 2, 4, 6, 5});
    CHECK(col_i64(*out, "n") == std::vector<std::int64_t>{2, 2, 2, 2, 1});
}

TEST_CASE("mutate: a single group matches the ungrouped result", "[mutate]") {
    runtime::Table t;
    t.add_column("g", Column<std::string>{"k", "k", "k", "k"});
    t.add_column("x", Column<std::int64_t>{4, 3, 2, 1});

    auto grouped = runtime::mutate_table(t, {"g"}, {{"cs", cumsum_x}});
    auto plain = runtime::mutate_table(t, {}, {{"cs", cumsum_x}});

    REQUIRE(grouped.has_value());
    REQUIRE(plain.has_value());
    CHECK(col_i64(*grouped, "cs") == col_i64(*plain, "cs"));
}

TEST_CASE("mutate: later fields see earlier ones", "[mutate]") {
    auto t = sample_table();

    auto doubled = [](const runtime::Table& sub) -> runtime::ColumnValue {
        return fn::values<std::int64_t>(sub, "cs").transform(
            [](std::int64_t v) { return v * 2; });
    };
    auto out = runtime::mutate_table(t, {"g"}, {{"cs", cumsum_x}, {"cs2", doubled}});

    REQUIRE(out.has_value());
    CHECK(col_i64(*out, "cs2") == std::vector<std::int64_t>{2, 4, 8, 12, 10});
}

TEST_CASE("mutate: overwriting a column keeps its position", "[mutate]") {
    auto t = sample_table();

    auto out = runtime::mutate_table(t, {}, {{"x", cumsum_x}});

    REQUIRE(out.has_value());
    CHECK(out->column_names() == std::vector<std::string>{"g", "x"});
    CHECK(col_i64(*out, "x") == std::vector<std::int64_t>{1, 3, 6, 10, 15});
    CHECK(col_i64(t, "x") == std::vector<std::int64_t>{1, 2, 3, 4, 5});
}

TEST_CASE("mutate: Int and Double group results widen to Double", "[mutate]") {
    auto t = sample_table();

    auto mixed = [](const runtime::Table& sub) -> runtime::ColumnValue {
        const auto& g = fn::values<std::string>(sub, "g");
        if (g[0] == "a") {
            return Column<double>(std::vector<double>(sub.rows(), 0.5));
        }
        return Column<std::int64_t>(std::vector<std::int64_t>(sub.rows(), 1));
    };
    auto out = runtime::mutate_table(t, {"g"}, {{"m", mixed}});

    REQUIRE(out.has_value());
    CHECK(col_f64(*out, "m") == std::vector<double>{1.0, 0.5, 1.0, 0.5, 1.0});
}

TEST_CASE("mutate: incompatible group result types fail", "[mutate]") {
    auto t = sample_table();

    auto mixed = [](const runtime::Table& sub) -> runtime::ColumnValue {
        const auto& g = fn::values<std::string>(sub, "g");
        if (g[0] == "a") {
            return Column<std::string>(std::vector<std::string>(sub.rows(), "s"));
        }
        return Column<std::int64_t>(std::vector<std::int64_t>(sub.rows(), 1));
    };
    auto out = runtime::mutate_table(t, {"g"}, {{"m", mixed}});

    REQUIRE_FALSE(out.has_value());
    CHECK(out.error().code == ErrorCode::TypeMismatch);
    CHECK(out.error().columns == std::vector<std::string>{"m"});
}

TEST_CASE("mutate: wrong result length fails with PartitionLengthMismatch", "[mutate]") {
    auto t = sample_table();

    auto too_short = [](const runtime::Table&) -> runtime::ColumnValue {
        return Column<std::int64_t>{1};
    };
    auto out = runtime::mutate_table(t, {"g"}, {{"bad", too_short}});

    REQUIRE_FALSE(out.has_value());
    CHECK(out.error().code == ErrorCode::PartitionLengthMismatch);
    CHECK(out.error().columns == std::vector<std::string>{"bad"});
}

TEST_CASE("mutate: a throwing function is reported as ReducerFailure", "[mutate]") {
    auto t = sample_table();

    auto boom = [](const runtime::Table&) -> runtime::ColumnValue {
        throw std::runtime_error("boom");
    };
    auto out = runtime::mutate_table(t, {"g"}, {{"bad", boom}});

    REQUIRE_FALSE(out.has_value());
    CHECK(out.error().code == ErrorCode::ReducerFailure);
    CHECK(out.error().message.find("boom") != std::string::npos);
}

TEST_CASE("mutate: empty function is MissingReducer", "[mutate]") {
    auto t = sample_table();

    auto out = runtime::mutate_table(t, {}, {{"none", runtime::MutateFn{}}});

    REQUIRE_FALSE(out.has_value());
    CHECK(out.error().code == ErrorCode::MissingReducer);
}

TEST_CASE("mutate: overwriting a group key regroups later fields", "[mutate]") {
    auto t = sample_table();

    auto constant_key = [](const runtime::Table& sub) -> runtime::ColumnValue {
        return Column<std::string>(std::vector<std::string>(sub.rows(), "all"));
    };
    auto out = runtime::mutate_table(t, {"g"}, {{"g", constant_key}, {"n", group_size}});

    REQUIRE(out.has_value());
    CHECK(col_i64(*out, "n") == std::vector<std::int64_t>(5, 5));
}

TEST_CASE("mutate: copied columns keep their missing cells", "[mutate][null]") {
    auto t = sparse_table();

    auto flat = runtime::mutate_table(t, {}, {{"y", fn::col("x")}});
    REQUIRE(flat.has_value());
    CHECK(missing_rows(*flat, "y") == std::vector<bool>{false, true, false, false, true});
    CHECK(col_i64(*flat, "y") == std::vector<std::int64_t>{1, 0, 3, 4, 0});

    auto grouped = runtime::mutate_table(t, {"g"}, {{"y", fn::col("x")}});
    REQUIRE(grouped.has_value());
    CHECK(missing_rows(*grouped, "y") == std::vector<bool>{false, true, false, false, true});
    CHECK(col_i64(*grouped, "y") == std::vector<std::int64_t>{1, 0, 3, 4, 0});
}

TEST_CASE("mutate: overwriting in place keeps missing cells", "[mutate][null]") {
    auto t = sparse_table();

    auto out = runtime::mutate_table(t, {"g"}, {{"x", fn::col("x")}});

    REQUIRE(out.has_value());
    CHECK(missing_rows(*out, "x") == std::vector<bool>{false, true, false, false, true});
}

TEST_CASE("mutate: functions can return their own validity", "[mutate][null]") {
    auto t = sample_table();

    // Marks the first row of each group missing.
    auto blank_first = [](const runtime::Table& sub) -> runtime::MutateColumn {
        runtime::Validity bits(sub.rows(), true);
        bits[0] = false;
        return {Column<std::int64_t>(std::vector<std::int64_t>(sub.rows(), 1)), std::move(bits)};
    };
    auto out = runtime::mutate_table(t, {"g"}, {{"y", blank_first}});

    REQUIRE(out.has_value());
    CHECK(missing_rows(*out, "y") == std::vector<bool>{true, true, false, false, true});
}

TEST_CASE("mutate: validity of the wrong length fails", "[mutate][null]") {
    auto t = sample_table();

    auto short_bits = [](const runtime::Table& sub) -> runtime::MutateColumn {
        return {Column<std::int64_t>(std::vector<std::int64_t>(sub.rows(), 1)),
                runtime::Validity{true}};
    };
    auto out = runtime::mutate_table(t, {}, {{"y", short_bits}});

    REQUIRE_FALSE(out.has_value());
    CHECK(out.error().code == ErrorCode::PartitionLengthMismatch);
    CHECK(out.error().columns == std::vector<std::string>{"y"});
}

TEST_CASE("mutate: parallel execution gives the sequential result", "[mutate][parallel]") {
    runtime::Table t;
    Column<std::int64_t> g;
    Column<std::int64_t> x;
    for (std::int64_t i = 0; i < 1000; ++i) {
        g.push_back(i % 97);
        x.push_back(i);
    }
    t.add_column("g", std::move(g));
    t.add_column("x", std::move(x));

    runtime::ExecOptions parallel{.max_threads = 4, .parallel_min_partitions = 2};
    auto seq = runtime::mutate_table(t, {"g"}, {{"cs", cumsum_x}});
    auto par = runtime::mutate_table(t, {"g"}, {{"cs", cumsum_x}}, parallel);

    REQUIRE(seq.has_value());
    REQUIRE(par.has_value());
    CHECK(col_i64(*seq, "cs") == col_i64(*par, "cs"));
}

TEST_CASE("exec: worker exceptions are rethrown after join", "[exec][parallel]") {
    runtime::ExecOptions parallel{.max_threads = 4, .parallel_min_partitions = 2};
    std::vector<int> touched(16, 0);

    CHECK_THROWS_AS(runtime::for_each_index(16, parallel,
                                            [&](std::size_t i) {
                                                touched[i] = 1;
                                                if (i == 5) {
                                                    throw std::logic_error("bad partition");
                                                }
                                            }),
                    std::logic_error);
}

TEST_CASE("exec: default options stay on the calling thread", "[exec]") {
    CHECK(runtime::worker_count(1000, runtime::ExecOptions{}) == 1);
    runtime::ExecOptions wide{.max_threads = 8, .parallel_min_partitions = 64};
    CHECK(runtime::worker_count(10, wide) == 1);
    CHECK(runtime::worker_count(100, wide) == 8);
}
