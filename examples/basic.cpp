#include <tabula/tabula.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <iostream>
#include <random>
#include <string>

using tabula::Column;
using tabula::Frame;
namespace fn = tabula::fn;
namespace rt = tabula::runtime;

auto main() -> int {
    auto trades = Frame::from_columns({
        {"symbol", Column<std::string>{"AAPL", "MSFT", "AAPL", "GOOG", "MSFT", "AAPL"}},
        {"price", Column<double>{180.5, 410.2, 181.0, 140.3, 409.8, 179.9}},
        {"qty", Column<std::int64_t>{100, 50, 200, 75, 25, 300}},
    });

    fmt::print("=== Trades ===\n");
    std::cout << trades << "\n";

    // Notional per trade, then each trade's share of its symbol's notional.
    auto notional = trades.mutate({
        {"notional",
         [](const rt::Table& t) -> rt::ColumnValue {
             const auto& price = fn::values<double>(t, "price");
             const auto& qty = fn::values<std::int64_t>(t, "qty");
             Column<double> out;
             out.reserve(price.size());
             for (std::size_t i = 0; i < price.size(); ++i) {
                 out.push_back(price[i] * static_cast<double>(qty[i]));
             }
             return out;
         }},
    });

    auto shares = notional.group_by({"symbol"}).mutate({
        {"share",
         [](const rt::Table& t) -> rt::ColumnValue {
             const auto& values = fn::values<double>(t, "notional");
             double total = 0.0;
             for (double v : values) {
                 total += v;
             }
             return values.transform([total](double v) { return v / total; });
         }},
    });

    fmt::print("\n=== Share of symbol notional ===\n");
    shares.show();

    auto summary = notional.group_by({"symbol"})
                       .agg({
                           {"trades", fn::count()},
                           {"qty", fn::sum("qty")},
                           {"avg_price", fn::mean("price")},
                       })
                       .sort_by({rt::SortKey{"qty", false}});

    fmt::print("\n=== Per-symbol summary ===\n");
    summary.show();

    auto sectors = Frame::from_columns({
        {"symbol", Column<std::string>{"AAPL", "MSFT"}},
        {"sector", Column<std::string>{"hardware", "software"}},
    });
    fmt::print("\n=== Left join on symbol ===\n");
    summary.left_join(sectors).show();

    std::mt19937_64 rng(42);
    fmt::print("\n=== Two random trades ===\n");
    trades.sample_n(2, rng).show();

    try {
        (void)trades.group_by({"venue"});
    } catch (const tabula::FrameError& e) {
        fmt::print("\nexpected failure: {}\n", e.error().format());
    }
    return 0;
}
