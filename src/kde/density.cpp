#include <kdeflow/kde/density.hpp>
#include <kdeflow/kde/evaluator.hpp>

#include <fmt/format.h>

#include <cmath>

namespace kdeflow::kde {

auto find_non_finite(std::span<const double> values) noexcept -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            return i;
        }
    }
    return std::nullopt;
}

auto density_for_population(std::span<const double> sample, std::span<const double> points,
                            const DensitySettings& settings)
    -> std::expected<std::vector<double>, KdeError> {
    if (auto bad = find_non_finite(points)) {
        return std::unexpected(KdeError{
            .kind = KdeErrorKind::InvalidInput,
            .message = fmt::format("non-finite evaluation point {} at position {}",
                                   points[*bad], *bad)});
    }

    // The rule path validates the sample itself; a fixed bandwidth still needs
    // the same sample checks so both paths reject the same inputs.
    auto estimated = estimate_bandwidth(sample, settings.rule);
    if (!estimated) {
        return std::unexpected(std::move(estimated.error()));
    }
    double bandwidth = *estimated;
    if (bandwidth == 0.0) {
        if (settings.degenerate == DegeneratePolicy::Reject) {
            return std::unexpected(KdeError{
                .kind = KdeErrorKind::InvalidInput,
                .message = fmt::format("degenerate population ({} value(s), no spread)",
                                       sample.size())});
        }
        return std::vector<double>(points.size(), 0.0);
    }
    if (settings.bandwidth.has_value()) {
        bandwidth = *settings.bandwidth;
        if (!std::isfinite(bandwidth) || bandwidth <= 0.0) {
            return std::unexpected(
                KdeError{.kind = KdeErrorKind::InvalidInput,
                         .message = fmt::format("bandwidth must be positive, got {}", bandwidth)});
        }
    }
    return evaluate_density(sample, bandwidth, points, settings.kernel);
}

}  // namespace kdeflow::kde
