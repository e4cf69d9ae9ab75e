#include <tabula/frame.hpp>
#include <tabula/runtime/functions.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <random>
#include <sstream>
#include <string>
#include <vector>

using namespace tabula;
using Catch::Approx;

namespace {

auto col_i64(const Frame& f, const std::string& name) -> std::vector<std::int64_t> {
    const auto* col = f.table().find(name);
    REQUIRE(col != nullptr);
    const auto* values = std::get_if<Column<std::int64_t>>(col);
    REQUIRE(values != nullptr);
    return {values->begin(), values->end()};
}

auto col_f64(const Frame& f, const std::string& name) -> std::vector<double> {
    const auto* col = f.table().find(name);
    REQUIRE(col != nullptr);
    const auto* values = std::get_if<Column<double>>(col);
    REQUIRE(values != nullptr);
    return {values->begin(), values->end()};
}

auto col_str(const Frame& f, const std::string& name) -> std::vector<std::string> {
    const auto* col = f.table().find(name);
    REQUIRE(col != nullptr);
    const auto* values = std::get_if<Column<std::string>>(col);
    REQUIRE(values != nullptr);
    return {values->begin(), values->end()};
}

template <typename F>
auto error_code(F&& call) -> ErrorCode {
    try {
        (void)call();
    } catch (const FrameError& e) {
        return e.code();
    }
    FAIL("expected a FrameError");
    return ErrorCode::InvalidArgument;
}

auto scores() -> Frame {
    return Frame::from_columns({
        {"id", Column<std::int64_t>{1, 1, 2}},
        {"x", Column<std::int64_t>{10, 20, 30}},
    });
}

auto demeaned(const runtime::Table& t) -> runtime::ColumnValue {
    auto x = fn::numeric(t, "x");
    double total = 0.0;
    for (double v : x) {
        total += v;
    }
    const double mean = total / static_cast<double>(x.size());
    Column<double> out;
    for (double v : x) {
        out.push_back(v - mean);
    }
    return out;
}

}  // namespace

// ─── Scenarios ────────────────────────────────────────────────────────────────

TEST_CASE("frame: grouped mean per id", "[frame]") {
    auto out = scores().group_by({"id"}).agg({{"m", fn::mean("x")}});

    CHECK_FALSE(out.is_grouped());
    CHECK(out.columns() == std::vector<std::string>{"id", "m"});
    CHECK(col_i64(out, "id") == std::vector<std::int64_t>{1, 2});
    CHECK(col_f64(out, "m") == std::vector<double>{15.0, 30.0});
}

TEST_CASE("frame: left join fills unmatched rows with missing", "[frame][join]") {
    auto a = Frame::from_columns({
        {"id", Column<std::int64_t>{1, 2}},
        {"v", Column<std::string>{"a", "b"}},
    });
    auto b = Frame::from_columns({
        {"id", Column<std::int64_t>{1, 3}},
        {"w", Column<std::string>{"x", "y"}},
    });

    auto out = a.left_join(b, std::vector<std::string>{"id"});

    CHECK(out.columns() == std::vector<std::string>{"id", "v", "w"});
    CHECK(col_i64(out, "id") == std::vector<std::int64_t>{1, 2});
    CHECK(col_str(out, "v") == std::vector<std::string>{"a", "b"});
    const auto* w = out.table().find_entry("w");
    CHECK(runtime::cell_at(*w, 0) == runtime::Cell{runtime::ScalarValue{std::string{"x"}}});
    CHECK_FALSE(runtime::cell_at(*w, 1).has_value());
}

TEST_CASE("frame: mutate after a left join keeps missing cells", "[frame][join][mutate]") {
    auto a = Frame::from_columns({{"id", Column<std::int64_t>{1, 2}}});
    auto b = Frame::from_columns({
        {"id", Column<std::int64_t>{1, 3}},
        {"w", Column<std::int64_t>{7, 9}},
    });
    auto joined = a.left_join(b, std::vector<std::string>{"id"});

    auto copied = joined.mutate({{"w2", fn::col("w")}});
    const auto* w2 = copied.table().find_entry("w2");
    REQUIRE(w2 != nullptr);
    CHECK(runtime::cell_at(*w2, 0) == runtime::Cell{runtime::ScalarValue{std::int64_t{7}}});
    CHECK_FALSE(runtime::cell_at(*w2, 1).has_value());

    auto grouped = joined.group_by({"id"}).mutate({{"w2", fn::col("w")}});
    const auto* gw2 = grouped.table().find_entry("w2");
    REQUIRE(gw2 != nullptr);
    CHECK_FALSE(runtime::cell_at(*gw2, 1).has_value());

    // A missing key stays its own group instead of merging with 0.
    auto counts =
        joined.mutate({{"w", fn::col("w")}}).group_by({"w"}).agg({{"n", fn::count()}});
    CHECK(counts.rows() == 2);
    const auto* key = counts.table().find_entry("w");
    REQUIRE(key != nullptr);
    CHECK(runtime::cell_at(*key, 0) == runtime::Cell{runtime::ScalarValue{std::int64_t{7}}});
    CHECK_FALSE(runtime::cell_at(*key, 1).has_value());
    CHECK(col_i64(counts, "n") == std::vector<std::int64_t>{1, 1});
}

TEST_CASE("frame: filter keeps rows in original order", "[frame][filter]") {
    auto out = scores().filter(fn::compare("x", fn::CompareOp::Gt, std::int64_t{15}));

    CHECK(col_i64(out, "id") == std::vector<std::int64_t>{1, 2});
    CHECK(col_i64(out, "x") == std::vector<std::int64_t>{20, 30});
}

// ─── Grouping lifecycle ───────────────────────────────────────────────────────

TEST_CASE("frame: grouping carries through row and column operations", "[frame][groups]") {
    auto grouped = scores().group_by({"id"});

    CHECK(grouped.filter(fn::compare("x", fn::CompareOp::Gt, std::int64_t{0})).groups() ==
          GroupSpec{"id"});
    CHECK(grouped.sort({"x"}).groups() == GroupSpec{"id"});
    CHECK(grouped.mutate({{"y", fn::col("x")}}).groups() == GroupSpec{"id"});
    CHECK(grouped.head(1).groups() == GroupSpec{"id"});
    CHECK(grouped.slice({0}).groups() == GroupSpec{"id"});
    CHECK(grouped.rename({{"x", "value"}}).groups() == GroupSpec{"id"});
}

TEST_CASE("frame: agg, gather, joins and ungroup clear grouping", "[frame][groups]") {
    auto grouped = scores().group_by({"id"});

    CHECK_FALSE(grouped.agg({{"n", fn::count()}}).is_grouped());
    CHECK_FALSE(grouped.gather("key", "value", {"id"}).is_grouped());
    CHECK_FALSE(grouped.inner_join(scores().select({"id"})).is_grouped());
    CHECK_FALSE(grouped.ungroup().is_grouped());
}

TEST_CASE("frame: group_by rejects unknown columns", "[frame][groups]") {
    try {
        (void)scores().group_by({"id", "region"});
        FAIL("expected a FrameError");
    } catch (const FrameError& e) {
        CHECK(e.code() == ErrorCode::InvalidGroupColumn);
        CHECK(e.columns() == std::vector<std::string>{"region"});
    }
}

TEST_CASE("frame: group_by replaces the previous grouping", "[frame][groups]") {
    auto f = Frame::from_columns({
        {"a", Column<std::int64_t>{1}},
        {"b", Column<std::int64_t>{2}},
    });

    CHECK(f.group_by({"a"}).group_by({"b"}).groups() == GroupSpec{"b"});
}

TEST_CASE("frame: rename follows grouping columns", "[frame][groups]") {
    auto out = scores().group_by({"id"}).rename({{"id", "key"}});

    CHECK(out.groups() == GroupSpec{"key"});
    CHECK(out.columns() == std::vector<std::string>{"key", "x"});
}

TEST_CASE("frame: rename rejects a grouping column renamed twice", "[frame][groups]") {
    auto grouped = scores().group_by({"id"});

    CHECK(error_code([&] { return grouped.rename({{"id", "x1"}, {"id", "y1"}}); }) ==
          ErrorCode::InvalidArgument);
    CHECK(grouped.groups() == GroupSpec{"id"});
    CHECK(grouped.columns() == std::vector<std::string>{"id", "x"});
}

TEST_CASE("frame: rename of a swapped grouping column follows its position", "[frame][groups]") {
    auto out = scores().group_by({"id"}).rename({{"id", "x"}, {"x", "id"}});

    CHECK(out.groups() == GroupSpec{"x"});
    CHECK(out.columns() == std::vector<std::string>{"x", "id"});
    CHECK(col_i64(out, "x") == std::vector<std::int64_t>{1, 1, 2});
}

TEST_CASE("frame: set_names maps grouping columns by position", "[frame][groups]") {
    auto out = scores().group_by({"x"}).set_names({"a", "b"});

    CHECK(out.groups() == GroupSpec{"b"});
    CHECK(out.columns() == std::vector<std::string>{"a", "b"});
}

// ─── select / drop with grouping ──────────────────────────────────────────────

TEST_CASE("frame: select retains unlisted grouping columns in front", "[frame][select]") {
    auto f = Frame::from_columns({
        {"g", Column<std::string>{"a", "b"}},
        {"x", Column<std::int64_t>{1, 2}},
        {"y", Column<std::int64_t>{3, 4}},
    });

    auto out = f.group_by({"g"}).select({"y"});

    CHECK(out.columns() == std::vector<std::string>{"g", "y"});
    CHECK(out.groups() == GroupSpec{"g"});
}

TEST_CASE("frame: select keeps the caller's position for listed grouping columns",
          "[frame][select]") {
    auto f = Frame::from_columns({
        {"g", Column<std::string>{"a", "b"}},
        {"x", Column<std::int64_t>{1, 2}},
    });

    CHECK(f.group_by({"g"}).select({"x", "g"}).columns() == std::vector<std::string>{"x", "g"});
    CHECK(f.select({"x"}).columns() == std::vector<std::string>{"x"});
}

TEST_CASE("frame: select of an unknown column fails", "[frame][select]") {
    CHECK(error_code([] { return scores().select({"z"}); }) == ErrorCode::UnknownColumn);
}

TEST_CASE("frame: drop of a grouping column fails until ungrouped", "[frame][select]") {
    auto grouped = scores().group_by({"id"});

    try {
        (void)grouped.drop({"x", "id"});
        FAIL("expected a FrameError");
    } catch (const FrameError& e) {
        CHECK(e.code() == ErrorCode::GroupColumnDropped);
        CHECK(e.columns() == std::vector<std::string>{"id"});
    }

    CHECK(grouped.drop({"x"}).columns() == std::vector<std::string>{"id"});
    CHECK(grouped.ungroup().drop({"id"}).columns() == std::vector<std::string>{"x"});
}

// ─── mutate ───────────────────────────────────────────────────────────────────

TEST_CASE("frame: grouped mutate preserves row count and order", "[frame][mutate]") {
    auto f = Frame::from_columns({
        {"g", Column<std::string>{"b", "a", "b", "a"}},
        {"x", Column<std::int64_t>{1, 2, 5, 8}},
    });

    auto out = f.group_by({"g"}).mutate({{"d", demeaned}});

    CHECK(out.rows() == f.rows());
    CHECK(col_str(out, "g") == std::vector<std::string>{"b", "a", "b", "a"});
    CHECK(col_f64(out, "d") == std::vector<double>{-2.0, -3.0, 2.0, 3.0});
}

TEST_CASE("frame: single-group mutate equals ungrouped mutate", "[frame][mutate]") {
    auto f = Frame::from_columns({
        {"g", Column<std::string>{"k", "k", "k"}},
        {"x", Column<std::int64_t>{1, 2, 6}},
    });

    auto grouped = f.group_by({"g"}).mutate({{"d", demeaned}});
    auto plain = f.mutate({{"d", demeaned}});

    CHECK(col_f64(grouped, "d") == col_f64(plain, "d"));
}

TEST_CASE("frame: mutate length mismatch surfaces as FrameError", "[frame][mutate]") {
    auto bad = [](const runtime::Table&) -> runtime::ColumnValue { return Column<double>{}; };

    CHECK(error_code([&] { return scores().group_by({"id"}).mutate({{"bad", bad}}); }) ==
          ErrorCode::PartitionLengthMismatch);
}

TEST_CASE("frame: failed calls leave the frame unchanged", "[frame]") {
    auto f = scores();
    auto before = f.columns();

    CHECK(error_code([&] { return f.agg({{"x", runtime::ReduceFn{}}}); }) ==
          ErrorCode::MissingReducer);
    CHECK(f.columns() == before);
    CHECK(col_i64(f, "x") == std::vector<std::int64_t>{10, 20, 30});
}

// ─── sort ─────────────────────────────────────────────────────────────────────

TEST_CASE("frame: sort puts grouping columns first", "[frame][sort]") {
    auto f = Frame::from_columns({
        {"g", Column<std::string>{"b", "a", "b", "a"}},
        {"x", Column<std::int64_t>{1, 2, 5, 8}},
    });

    auto grouped = f.group_by({"g"}).sort({"x"}, false);
    CHECK(col_str(grouped, "g") == std::vector<std::string>{"a", "a", "b", "b"});
    CHECK(col_i64(grouped, "x") == std::vector<std::int64_t>{8, 2, 5, 1});

    auto plain = f.sort({"x"}, false);
    CHECK(col_i64(plain, "x") == std::vector<std::int64_t>{8, 5, 2, 1});
}

TEST_CASE("frame: sort_by takes per-key directions", "[frame][sort]") {
    auto f = Frame::from_columns({
        {"a", Column<std::int64_t>{1, 2, 1, 2}},
        {"b", Column<std::string>{"w", "x", "y", "z"}},
    });

    auto out = f.sort_by({{"a", false}, {"b", true}});

    CHECK(col_str(out, "b") == std::vector<std::string>{"x", "z", "w", "y"});
}

// ─── rows ─────────────────────────────────────────────────────────────────────

TEST_CASE("frame: filter applies predicates one after another", "[frame][filter]") {
    auto f = Frame::from_columns({{"x", Column<std::int64_t>{1, 2, 3, 4, 5, 6}}});

    auto out = f.filter(std::vector<runtime::PredicateFn>{
        fn::compare("x", fn::CompareOp::Gt, std::int64_t{1}),
        [](const runtime::Table& t) {
            // Positional: keep every other row of what survived the first step.
            runtime::Mask mask(t.rows(), 0);
            for (std::size_t i = 0; i < mask.size(); i += 2) {
                mask[i] = 1;
            }
            return mask;
        },
    });

    CHECK(col_i64(out, "x") == std::vector<std::int64_t>{2, 4, 6});
}

TEST_CASE("frame: head, tail and slice", "[frame][rows]") {
    auto f = Frame::from_columns({{"x", Column<std::int64_t>{1, 2, 3, 4, 5, 6, 7}}});

    CHECK(col_i64(f.head(), "x") == std::vector<std::int64_t>{1, 2, 3, 4, 5});
    CHECK(col_i64(f.tail(2), "x") == std::vector<std::int64_t>{6, 7});
    CHECK(col_i64(f.slice({6, 0}), "x") == std::vector<std::int64_t>{7, 1});
    CHECK(error_code([&] { return f.slice({7}); }) == ErrorCode::IndexOutOfRange);
}

TEST_CASE("frame: sample_n with a seeded generator", "[frame][sample]") {
    auto f = Frame::from_columns({{"x", Column<std::int64_t>{1, 2, 3, 4, 5, 6, 7, 8}}});
    std::mt19937_64 a(99);
    std::mt19937_64 b(99);

    auto first = f.sample_n(4, a);
    auto second = f.sample_n(4, b);

    CHECK(first.rows() == 4);
    CHECK(col_i64(first, "x") == col_i64(second, "x"));
    CHECK(f.sample_n(20, true).rows() == 20);
    CHECK(error_code([&] { return f.sample_n(9); }) == ErrorCode::InvalidArgument);
}

// ─── gather / joins ───────────────────────────────────────────────────────────

TEST_CASE("frame: gather with custom names", "[frame][gather]") {
    auto f = Frame::from_columns({
        {"a", Column<double>{0.1, 0.2}},
        {"b", Column<double>{3.0, 6.0}},
        {"c", Column<std::string>{"u", "v"}},
    });

    auto out = f.gather("var", "val", {"c"});

    CHECK(out.columns() == std::vector<std::string>{"c", "var", "val"});
    CHECK(out.rows() == 4);
    CHECK(col_str(out, "var") == std::vector<std::string>{"a", "a", "b", "b"});
    CHECK(col_f64(out, "val")[3] == Approx(6.0));
}

TEST_CASE("frame: inner join with auto-detected keys", "[frame][join]") {
    auto a = Frame::from_columns({
        {"k", Column<std::string>{"x", "y", "x"}},
        {"v", Column<std::int64_t>{1, 2, 3}},
    });
    auto b = Frame::from_columns({
        {"k", Column<std::string>{"x", "z"}},
        {"v", Column<std::int64_t>{10, 20}},
    });

    auto out = a.inner_join(b, std::vector<std::string>{"k"});
    CHECK(out.columns() == std::vector<std::string>{"k", "v", "v_right"});
    CHECK(col_i64(out, "v_right") == std::vector<std::int64_t>{10, 10});

    CHECK(a.inner_join(b).rows() == 0);
}

TEST_CASE("frame: join key errors", "[frame][join]") {
    auto a = Frame::from_columns({{"a", Column<std::int64_t>{1}}});
    auto b = Frame::from_columns({{"b", Column<std::int64_t>{1}}});

    CHECK(error_code([&] { return a.left_join(b); }) == ErrorCode::EmptyJoinKey);
    CHECK(error_code([&] { return a.inner_join(b, std::vector<std::string>{"a"}); }) ==
          ErrorCode::UnknownJoinColumn);
}

// ─── pipe / display ───────────────────────────────────────────────────────────

TEST_CASE("frame: pipe passes the frame and extra arguments", "[frame][pipe]") {
    auto top = [](const Frame& f, std::size_t n) { return f.sort({"x"}, false).head(n); };

    auto out = scores().pipe(top, std::size_t{2});

    CHECK(col_i64(out, "x") == std::vector<std::int64_t>{30, 20});
}

TEST_CASE("frame: to_string shows header, groups and truncation", "[frame][show]") {
    Column<std::int64_t> x;
    for (std::int64_t i = 0; i < 12; ++i) {
        x.push_back(i);
    }
    auto f = Frame::from_columns({{"x", std::move(x)}}).group_by({"x"});

    auto text = f.to_string(3);
    CHECK(text.find("Frame [12 x 1]") == 0);
    CHECK(text.find("With groups [x]") != std::string::npos);
    CHECK(text.find(" only showing top 3 rows.") != std::string::npos);

    std::ostringstream out;
    out << scores();
    CHECK(out.str().find("only showing") == std::string::npos);
    CHECK(out.str().find("With groups") == std::string::npos);
}

TEST_CASE("frame: construction validates the table", "[frame]") {
    runtime::Table ragged;
    ragged.add_column("a", Column<std::int64_t>{1, 2});
    ragged.add_column("b", Column<std::int64_t>{1});

    CHECK(error_code([&] { return Frame(ragged); }) == ErrorCode::ColumnLengthMismatch);

    runtime::Table ok;
    ok.add_column("a", Column<std::int64_t>{1});
    CHECK(error_code([&] { return Frame(ok, GroupSpec{"b"}); }) == ErrorCode::InvalidGroupColumn);
}
