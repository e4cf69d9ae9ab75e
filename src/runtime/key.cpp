#include <tabula/runtime/key.hpp>

#include <algorithm>
#include <cmath>
#include <functional>
#include <string>

namespace tabula::runtime {

namespace {

constexpr std::size_t kNullHash = 0x6e756c6cULL;
constexpr std::size_t kNanHash = 0x6e616eULL;

auto hash_cell(const Cell& cell) -> std::size_t {
    if (!cell.has_value()) {
        return kNullHash;
    }
    return std::visit(
        [](const auto& v) -> std::size_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v)) {
                    return kNanHash;
                }
            }
            return std::hash<T>{}(v);
        },
        *cell);
}

}  // namespace

auto KeyHash::operator()(const Key& key) const -> std::size_t {
    std::size_t seed = 0;
    for (const auto& value : key.values) {
        seed ^= hash_cell(value) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

auto KeyEq::operator()(const Key& a, const Key& b) const -> bool {
    if (a.values.size() != b.values.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.values.size(); ++i) {
        if (!cells_equal(a.values[i], b.values[i])) {
            return false;
        }
    }
    return true;
}

auto compare_keys(const Key& lhs, const Key& rhs) -> std::weak_ordering {
    const std::size_t n = std::min(lhs.values.size(), rhs.values.size());
    for (std::size_t i = 0; i < n; ++i) {
        auto order = compare_cells(lhs.values[i], rhs.values[i]);
        if (order != 0) {
            return order;
        }
    }
    return lhs.values.size() <=> rhs.values.size();
}

auto key_at(const std::vector<const ColumnEntry*>& key_columns, std::size_t row) -> Key {
    Key key;
    key.values.reserve(key_columns.size());
    for (const auto* entry : key_columns) {
        key.values.push_back(cell_at(*entry, row));
    }
    return key;
}

}  // namespace tabula::runtime
