#include <kdeflow/kde/evaluator.hpp>

#include <algorithm>
#include <stdexcept>

namespace kdeflow::kde {

namespace {

// Hot loop: O(|sample| * |points|). The sample is contiguous and the body has no
// data-dependent branches, so the inner reduction auto-vectorises.
template <typename Kernel, typename Out>
void accumulate(const double* __restrict__ sp, std::size_t n, double bandwidth,
                std::span<const double> points, std::span<Out> out) {
    const double inv_h = 1.0 / bandwidth;
    // Divide in two steps: n * bandwidth can overflow where the quotient does not.
    const double scale = Kernel::kNorm / bandwidth / static_cast<double>(n);
    for (std::size_t i = 0; i < points.size(); ++i) {
        const double x = points[i];
        double acc = 0.0;
        for (std::size_t j = 0; j < n; ++j) {
            acc += Kernel::shape((x - sp[j]) * inv_h);
        }
        out[i] = static_cast<Out>(acc * scale);
    }
}

}  // namespace

template <typename Out>
void evaluate_density_into(std::span<const double> sample, double bandwidth,
                           std::span<const double> points, KernelKind kernel, std::span<Out> out) {
    if (out.size() != points.size()) {
        throw std::invalid_argument("evaluate_density_into: output size must match points");
    }
    // Degenerate: no spread, no mass spread over the points.
    if (!(bandwidth > 0.0) || sample.empty()) {
        std::fill(out.begin(), out.end(), Out{0});
        return;
    }
    with_kernel(kernel, [&](auto k) {
        using Kernel = decltype(k);
        accumulate<Kernel, Out>(sample.data(), sample.size(), bandwidth, points, out);
    });
}

template void evaluate_density_into<double>(std::span<const double>, double,
                                            std::span<const double>, KernelKind,
                                            std::span<double>);
template void evaluate_density_into<float>(std::span<const double>, double,
                                           std::span<const double>, KernelKind, std::span<float>);

auto evaluate_density(std::span<const double> sample, double bandwidth,
                      std::span<const double> points, KernelKind kernel) -> std::vector<double> {
    std::vector<double> out(points.size());
    evaluate_density_into<double>(sample, bandwidth, points, kernel, out);
    return out;
}

}  // namespace kdeflow::kde
