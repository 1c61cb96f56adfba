#pragma once

#include <kdeflow/kde/error.hpp>
#include <kdeflow/runtime/table.hpp>

#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace kdeflow::runtime {

/// One evaluation-point sequence used for every group. Immutable once
/// resolved, so workers read it concurrently without locking.
struct SharedEvalPoints {
    std::vector<double> points;

    [[nodiscard]] auto view() const noexcept -> std::span<const double> { return points; }
};

/// One evaluation-point sequence per row, read from a list column. Rows are
/// sized independently; row i's length is the length of row i's result.
class PerRowEvalPoints {
   public:
    explicit PerRowEvalPoints(const ColumnEntry& column) : column_(&column) {}

    [[nodiscard]] auto size() const -> std::size_t { return column_size(*column_->column); }

    /// Points of `row` as doubles (converted into `scratch` for Float32 lists).
    /// A null entry is MissingInput for that row only.
    [[nodiscard]] auto row(std::size_t row, std::vector<double>& scratch) const
        -> std::expected<std::span<const double>, KdeError>;

   private:
    const ColumnEntry* column_;
};

/// Aggregating and static modes: the shared sequence must be present and finite.
[[nodiscard]] auto resolve_shared(const std::optional<std::vector<double>>& points)
    -> std::expected<SharedEvalPoints, KdeError>;

/// Dynamic mode: both columns must be float list columns with the same number
/// of rows. Per-row lengths are not compared.
[[nodiscard]] auto resolve_per_row(const ColumnEntry& populations, const ColumnEntry& points)
    -> std::expected<PerRowEvalPoints, KdeError>;

/// Check that `column` is a List(Float32) or List(Float64) column.
[[nodiscard]] auto require_list_column(const ColumnEntry& column) -> std::expected<void, KdeError>;

}  // namespace kdeflow::runtime
