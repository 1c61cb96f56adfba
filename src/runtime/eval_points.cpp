#include <kdeflow/kde/density.hpp>
#include <kdeflow/runtime/eval_points.hpp>

#include <fmt/format.h>

#include <initializer_list>

namespace kdeflow::runtime {

auto PerRowEvalPoints::row(std::size_t row, std::vector<double>& scratch) const
    -> std::expected<std::span<const double>, KdeError> {
    if (is_null(*column_, row)) {
        return std::unexpected(KdeError{.kind = KdeErrorKind::MissingInput,
                                        .message = "evaluation points are null"});
    }
    return list_row_as_double(*column_->column, row, scratch);
}

auto resolve_shared(const std::optional<std::vector<double>>& points)
    -> std::expected<SharedEvalPoints, KdeError> {
    if (!points.has_value()) {
        return std::unexpected(KdeError{.kind = KdeErrorKind::MissingInput,
                                        .message = "shared evaluation points are null"});
    }
    if (auto bad = kde::find_non_finite(*points)) {
        return std::unexpected(KdeError{
            .kind = KdeErrorKind::InvalidInput,
            .message = fmt::format("non-finite shared evaluation point {} at position {}",
                                   (*points)[*bad], *bad)});
    }
    return SharedEvalPoints{.points = *points};
}

auto require_list_column(const ColumnEntry& column) -> std::expected<void, KdeError> {
    if (!is_list_column(*column.column)) {
        return std::unexpected(KdeError{
            .kind = KdeErrorKind::InvalidInput,
            .message = fmt::format("expected `{}` to be List(Float32) or List(Float64), got {}",
                                   column.name, column_kind_name(*column.column))});
    }
    return {};
}

auto resolve_per_row(const ColumnEntry& populations, const ColumnEntry& points)
    -> std::expected<PerRowEvalPoints, KdeError> {
    const std::size_t pop_rows = column_size(*populations.column);
    const std::size_t eval_rows = column_size(*points.column);
    if (pop_rows != eval_rows) {
        return std::unexpected(KdeError{
            .kind = KdeErrorKind::ShapeMismatch,
            .message = fmt::format("`{}` has {} rows but evaluation points `{}` have {}",
                                   populations.name, pop_rows, points.name, eval_rows)});
    }
    for (const ColumnEntry* entry : {&populations, &points}) {
        if (auto ok = check_validity(*entry); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
    }
    if (auto ok = require_list_column(populations); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    if (auto ok = require_list_column(points); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    return PerRowEvalPoints(points);
}

}  // namespace kdeflow::runtime
