#pragma once

#include <kdeflow/kde/kernel.hpp>

#include <span>
#include <vector>

namespace kdeflow::kde {

/// Evaluate the kernel density estimate of `sample` at every point of `points`.
///
///   density(x) = 1 / (n * h) * sum_i K((x - sample_i) / h)
///
/// Accumulation is done in double; `out` (same length as `points`) receives the
/// result narrowed to its element type. A bandwidth that is not strictly
/// positive (0 for degenerate samples) yields an all-zero result, as does an
/// empty sample. Neither input is modified and repeated calls with the same
/// arguments give bit-identical output.
template <typename Out>
void evaluate_density_into(std::span<const double> sample, double bandwidth,
                           std::span<const double> points, KernelKind kernel, std::span<Out> out);

extern template void evaluate_density_into<double>(std::span<const double>, double,
                                                   std::span<const double>, KernelKind,
                                                   std::span<double>);
extern template void evaluate_density_into<float>(std::span<const double>, double,
                                                  std::span<const double>, KernelKind,
                                                  std::span<float>);

/// Convenience overload returning a freshly allocated result.
[[nodiscard]] auto evaluate_density(std::span<const double> sample, double bandwidth,
                                    std::span<const double> points,
                                    KernelKind kernel = KernelKind::Gaussian)
    -> std::vector<double>;

}  // namespace kdeflow::kde
