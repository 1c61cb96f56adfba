#pragma once

#include <kdeflow/kde/error.hpp>
#include <kdeflow/runtime/kde_options.hpp>
#include <kdeflow/runtime/table.hpp>

#include <expected>
#include <optional>
#include <vector>

namespace kdeflow::runtime {

/// Result of the aggregating call: one row per distinct key, first-seen order.
struct GroupedDensity {
    ColumnEntry keys;
    ColumnEntry density;
};

/// Aggregating mode.
///
/// Partitions the Float32/Float64 `values` column by `keys` (Int64, Float64 or
/// String) and evaluates each group's density at the shared `eval_points`.
/// Null values are dropped from their group; null keys form one group whose
/// output key is null. Output entries have `eval_points->size()` elements.
[[nodiscard]] auto kde(const ColumnEntry& values, const ColumnEntry& keys,
                       const std::optional<std::vector<double>>& eval_points,
                       const KdeOptions& options = {}) -> std::expected<GroupedDensity, KdeError>;

/// Static mode: every row of the list column `populations` is one population,
/// evaluated at the shared `eval_points`. Output row i belongs to input row i.
[[nodiscard]] auto kde_static_evals(const ColumnEntry& populations,
                                    const std::optional<std::vector<double>>& eval_points,
                                    const KdeOptions& options = {})
    -> std::expected<ColumnEntry, KdeError>;

/// Dynamic mode: row i of `populations` is evaluated at row i of `eval_points`.
/// Both list columns need the same row count (ShapeMismatch otherwise); the
/// per-row point counts are independent and no output row is padded.
[[nodiscard]] auto kde_dynamic_evals(const ColumnEntry& populations, const ColumnEntry& eval_points,
                                     const KdeOptions& options = {})
    -> std::expected<ColumnEntry, KdeError>;

}  // namespace kdeflow::runtime
