#pragma once

#include <kdeflow/kde/error.hpp>

#include <cstdint>
#include <expected>
#include <span>

namespace kdeflow::kde {

/// Rule-of-thumb bandwidth selectors for one-dimensional samples.
enum class BandwidthRule : std::uint8_t {
    /// h = s * n^(-1/5)
    Scott,
    /// h = s * (4 / (3n))^(1/5), about 1.06 * s * n^(-1/5)
    Silverman,
};

/// Unbiased sample standard deviation (n - 1 denominator), two-pass.
/// Requires at least two values. Scaled by the largest magnitude, so finite
/// samples give a finite result up to about 1e308.
[[nodiscard]] auto sample_std_dev(std::span<const double> sample) noexcept -> double;

/// Estimate a smoothing bandwidth for `sample`.
///
/// Returns EmptyPopulation for an empty sample and InvalidInput when a value is
/// NaN or infinite, or when the spread is too wide for a finite bandwidth. A
/// single value, or a sample whose values are all equal, has no spread and
/// yields a bandwidth of exactly 0; the evaluator turns a zero bandwidth into
/// an all-zero density.
[[nodiscard]] auto estimate_bandwidth(std::span<const double> sample,
                                      BandwidthRule rule = BandwidthRule::Scott)
    -> std::expected<double, KdeError>;

}  // namespace kdeflow::kde
