#pragma once

#include <kdeflow/kde/bandwidth.hpp>
#include <kdeflow/kde/error.hpp>
#include <kdeflow/kde/kernel.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace kdeflow::kde {

/// What to do with a population whose bandwidth is 0 (one value, or no spread).
enum class DegeneratePolicy : std::uint8_t {
    /// Emit an all-zero density.
    Zeros,
    /// Report InvalidInput for the group.
    Reject,
};

struct DensitySettings {
    BandwidthRule rule = BandwidthRule::Scott;
    KernelKind kernel = KernelKind::Gaussian;
    /// Fixed bandwidth; when set, `rule` is ignored. Must be finite and > 0.
    std::optional<double> bandwidth;
    DegeneratePolicy degenerate = DegeneratePolicy::Zeros;
};

/// Index of the first NaN/Inf in `values`, if any.
[[nodiscard]] auto find_non_finite(std::span<const double> values) noexcept
    -> std::optional<std::size_t>;

/// Checked estimator + evaluator pipeline for one population.
///
/// Validates the sample and points, picks the bandwidth (fixed or by rule),
/// applies the degenerate policy and evaluates the kernel. The returned error
/// carries no row or group; the caller attaches that context.
[[nodiscard]] auto density_for_population(std::span<const double> sample,
                                          std::span<const double> points,
                                          const DensitySettings& settings)
    -> std::expected<std::vector<double>, KdeError>;

}  // namespace kdeflow::kde
