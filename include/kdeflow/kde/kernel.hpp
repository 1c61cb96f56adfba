#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <utility>

namespace kdeflow::kde {

enum class KernelKind : std::uint8_t {
    Gaussian,
    Epanechnikov,
    Biweight,
    Triangular,
    Uniform,
};

// Each kernel is split into an unnormalised shape and a constant factor so the
// hot loop only accumulates shape(u); the factor is applied once per point.
// Compact kernels are written branch-free (clamped) to keep the loop vectorisable.

struct GaussianKernel {
    static constexpr double kNorm = 0.5 * std::numbers::inv_sqrtpi * std::numbers::sqrt2;
    [[nodiscard]] static auto shape(double u) noexcept -> double { return std::exp(-0.5 * u * u); }
};

struct EpanechnikovKernel {
    static constexpr double kNorm = 0.75;
    [[nodiscard]] static auto shape(double u) noexcept -> double {
        return std::max(0.0, 1.0 - u * u);
    }
};

struct BiweightKernel {
    static constexpr double kNorm = 0.9375;  // 15/16
    [[nodiscard]] static auto shape(double u) noexcept -> double {
        const double t = std::max(0.0, 1.0 - u * u);
        return t * t;
    }
};

struct TriangularKernel {
    static constexpr double kNorm = 1.0;
    [[nodiscard]] static auto shape(double u) noexcept -> double {
        return std::max(0.0, 1.0 - std::abs(u));
    }
};

struct UniformKernel {
    static constexpr double kNorm = 0.5;
    [[nodiscard]] static auto shape(double u) noexcept -> double {
        return std::abs(u) <= 1.0 ? 1.0 : 0.0;
    }
};

/// Invoke `fn` with the kernel type selected by `kind`. The choice is made once
/// and `fn` is instantiated per kernel, so callers get a monomorphic inner loop.
template <typename F>
decltype(auto) with_kernel(KernelKind kind, F&& fn) {
    switch (kind) {
        case KernelKind::Epanechnikov:
            return std::forward<F>(fn)(EpanechnikovKernel{});
        case KernelKind::Biweight:
            return std::forward<F>(fn)(BiweightKernel{});
        case KernelKind::Triangular:
            return std::forward<F>(fn)(TriangularKernel{});
        case KernelKind::Uniform:
            return std::forward<F>(fn)(UniformKernel{});
        case KernelKind::Gaussian:
            break;
    }
    return std::forward<F>(fn)(GaussianKernel{});
}

}  // namespace kdeflow::kde
