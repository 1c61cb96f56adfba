#pragma once

#include <kdeflow/kde/error.hpp>
#include <kdeflow/runtime/table.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace kdeflow::runtime {

/// Call-scoped assignment of rows to groups.
///
/// Groups are numbered in the order their key first appears in the key column,
/// which is the canonical output order of every grouped call. Rows with a null
/// key all land in one group, numbered where the first null key appears.
struct Partition {
    /// Group id of every input row.
    std::vector<std::uint32_t> row_groups;
    /// Row of the first occurrence of each group's key.
    std::vector<std::size_t> first_rows;
    std::optional<std::uint32_t> null_group;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return first_rows.size(); }
};

/// Assign group ids for an Int64, Float64 or String key column.
/// Float64 keys compare by value, with -0.0 == 0.0 and all NaNs equal.
[[nodiscard]] auto partition_by_key(const ColumnEntry& keys) -> std::expected<Partition, KdeError>;

/// One key per group, in group order; the null-key group is marked null.
[[nodiscard]] auto gather_keys(const ColumnEntry& keys, const Partition& partition) -> ColumnEntry;

/// Collect each group's non-null values into one list row per group, in group
/// order and in input order within a group. `values` must be a Float32 or
/// Float64 column with the same number of rows as the partitioned key column.
template <typename Out>
[[nodiscard]] auto collect_groups(const ColumnEntry& values, const Partition& partition)
    -> std::expected<ListColumn<Out>, KdeError>;

extern template auto collect_groups<float>(const ColumnEntry&, const Partition&)
    -> std::expected<ListColumn<float>, KdeError>;
extern template auto collect_groups<double>(const ColumnEntry&, const Partition&)
    -> std::expected<ListColumn<double>, KdeError>;

/// Render the key at `row` for error messages ("null" for null keys).
[[nodiscard]] auto format_key(const ColumnEntry& keys, std::size_t row) -> std::string;

}  // namespace kdeflow::runtime
