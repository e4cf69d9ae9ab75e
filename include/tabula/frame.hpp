#pragma once

#include <tabula/core/error.hpp>
#include <tabula/runtime/aggregate.hpp>
#include <tabula/runtime/exec.hpp>
#include <tabula/runtime/join.hpp>
#include <tabula/runtime/mutate.hpp>
#include <tabula/runtime/ops.hpp>
#include <tabula/runtime/partition.hpp>
#include <tabula/runtime/table.hpp>

#include <concepts>
#include <cstddef>
#include <expected>
#include <functional>
#include <iosfwd>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace tabula {

using runtime::GroupSpec;

/// A Table together with its active grouping.
///
/// Every method returns a new Frame and leaves `*this` untouched; failures
/// throw FrameError. Grouping carries through select, rename, filter, sort,
/// mutate and the row-subset methods, and is cleared by agg, gather, the
/// joins and ungroup.
class Frame {
   public:
    Frame() = default;

    /// Wrap a table; throws FrameError if the table breaks its invariants.
    explicit Frame(runtime::Table table, runtime::ExecOptions options = {});

    /// Wrap a grouped table; throws InvalidGroupColumn for unknown keys.
    Frame(runtime::Table table, GroupSpec groups, runtime::ExecOptions options = {});

    [[nodiscard]] static auto from_columns(
        std::vector<std::pair<std::string, runtime::ColumnValue>> columns) -> Frame;

    [[nodiscard]] auto table() const noexcept -> const runtime::Table& { return table_; }
    [[nodiscard]] auto groups() const noexcept -> const GroupSpec& { return groups_; }
    [[nodiscard]] auto options() const noexcept -> const runtime::ExecOptions& { return options_; }
    [[nodiscard]] auto rows() const noexcept -> std::size_t { return table_.rows(); }
    [[nodiscard]] auto columns() const -> std::vector<std::string> { return table_.column_names(); }
    [[nodiscard]] auto is_grouped() const noexcept -> bool { return !groups_.empty(); }

    [[nodiscard]] auto with_options(runtime::ExecOptions options) const -> Frame;

    // ─── Columns ─────────────────────────────────────────────────────────────

    /// Keep `names` in the given order. Grouping columns that are not listed
    /// are retained in front of them.
    [[nodiscard]] auto select(const std::vector<std::string>& names) const -> Frame;

    /// Remove `names`; removing a grouping column fails with GroupColumnDropped.
    [[nodiscard]] auto drop(const std::vector<std::string>& names) const -> Frame;

    [[nodiscard]] auto rename(const runtime::RenameMap& mapping) const -> Frame;
    [[nodiscard]] auto set_names(const std::vector<std::string>& names) const -> Frame;

    // ─── Rows ────────────────────────────────────────────────────────────────

    /// Sort by the grouping columns, then by `names`.
    [[nodiscard]] auto sort(const std::vector<std::string>& names, bool ascending = true) const
        -> Frame;
    /// Sort by the grouping columns, then by `keys` with per-key direction.
    [[nodiscard]] auto sort_by(const std::vector<runtime::SortKey>& keys) const -> Frame;

    [[nodiscard]] auto filter(const runtime::PredicateFn& predicate) const -> Frame;
    /// Apply predicates one after another.
    [[nodiscard]] auto filter(const std::vector<runtime::PredicateFn>& predicates) const -> Frame;

    [[nodiscard]] auto head(std::size_t n = 5) const -> Frame;
    [[nodiscard]] auto tail(std::size_t n = 5) const -> Frame;
    [[nodiscard]] auto slice(const std::vector<std::size_t>& positions) const -> Frame;

    template <std::uniform_random_bit_generator Rng>
    [[nodiscard]] auto sample_n(std::size_t n, Rng& rng, bool replace = false) const -> Frame {
        return slice(unwrap(runtime::sample_positions(rows(), n, replace, rng)));
    }
    /// Sample with an internally seeded generator.
    [[nodiscard]] auto sample_n(std::size_t n, bool replace = false) const -> Frame;

    // ─── Grouping ────────────────────────────────────────────────────────────

    [[nodiscard]] auto group_by(const GroupSpec& keys) const -> Frame;
    [[nodiscard]] auto ungroup() const -> Frame;

    [[nodiscard]] auto mutate(const std::vector<runtime::FieldSpec>& fields) const -> Frame;
    [[nodiscard]] auto agg(const std::vector<runtime::AggSpec>& aggregations) const -> Frame;

    // ─── Reshape and join ────────────────────────────────────────────────────

    [[nodiscard]] auto gather(const std::string& key = "key", const std::string& value = "value",
                              const std::vector<std::string>& keep = {}) const -> Frame;

    [[nodiscard]] auto left_join(const Frame& other,
                                 const std::optional<std::vector<std::string>>& by = std::nullopt)
        const -> Frame;
    [[nodiscard]] auto inner_join(const Frame& other,
                                  const std::optional<std::vector<std::string>>& by = std::nullopt)
        const -> Frame;

    /// Pass the whole frame through `func(frame, args...)`.
    template <typename F, typename... Args>
        requires std::invocable<F, const Frame&, Args...>
    [[nodiscard]] auto pipe(F&& func, Args&&... args) const -> Frame {
        return std::invoke(std::forward<F>(func), *this, std::forward<Args>(args)...);
    }

    // ─── Display ─────────────────────────────────────────────────────────────

    [[nodiscard]] auto to_string(std::size_t n = 10) const -> std::string;
    void show(std::size_t n = 10) const;

   private:
    template <typename T>
    static auto unwrap(std::expected<T, Error> result) -> T {
        if (!result) {
            throw FrameError(std::move(result.error()));
        }
        return std::move(*result);
    }

    [[nodiscard]] auto derive(runtime::Table table, GroupSpec groups) const -> Frame;
    [[nodiscard]] auto join(const Frame& other, runtime::JoinKind kind,
                            const std::optional<std::vector<std::string>>& by) const -> Frame;

    runtime::Table table_;
    GroupSpec groups_;
    runtime::ExecOptions options_;
};

auto operator<<(std::ostream& out, const Frame& frame) -> std::ostream&;

}  // namespace tabula
