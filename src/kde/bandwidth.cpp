#include <kdeflow/kde/bandwidth.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace kdeflow::kde {

auto sample_std_dev(std::span<const double> sample) noexcept -> double {
    // Work in units of the largest magnitude so sums and squares of finite
    // values stay finite, however large the values are.
    double m = 0.0;
    for (double v : sample) {
        m = std::max(m, std::abs(v));
    }
    if (m == 0.0) {
        return 0.0;
    }
    const auto n = static_cast<double>(sample.size());
    double sum = 0.0;
    for (double v : sample) {
        sum += v / m;
    }
    const double mean = sum / n;
    double ss = 0.0;
    for (double v : sample) {
        const double d = v / m - mean;
        ss += d * d;
    }
    return m * std::sqrt(ss / (n - 1.0));
}

auto estimate_bandwidth(std::span<const double> sample, BandwidthRule rule)
    -> std::expected<double, KdeError> {
    if (sample.empty()) {
        return std::unexpected(KdeError{.kind = KdeErrorKind::EmptyPopulation,
                                        .message = "bandwidth needs at least one value"});
    }

    double lo = sample.front();
    double hi = sample.front();
    for (std::size_t i = 0; i < sample.size(); ++i) {
        const double v = sample[i];
        if (!std::isfinite(v)) {
            return std::unexpected(KdeError{
                .kind = KdeErrorKind::InvalidInput,
                .message = fmt::format("non-finite sample value {} at position {}", v, i)});
        }
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }

    // No spread: single value or all values identical.
    if (sample.size() == 1 || lo == hi) {
        return 0.0;
    }

    const double s = sample_std_dev(sample);
    const auto n = static_cast<double>(sample.size());
    const double h = rule == BandwidthRule::Silverman ? s * std::pow(4.0 / (3.0 * n), 0.2)
                                                      : s * std::pow(n, -0.2);
    if (!std::isfinite(h)) {
        return std::unexpected(KdeError{
            .kind = KdeErrorKind::InvalidInput,
            .message = fmt::format("sample spread [{}, {}] is too wide for a finite bandwidth",
                                   lo, hi)});
    }
    return h;
}

}  // namespace kdeflow::kde
