#include <kdeflow/kde/density.hpp>
#include <kdeflow/kde/evaluator.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <numbers>
#include <vector>

using namespace kdeflow;
using Catch::Approx;

namespace {

auto grid(double lo, double hi, std::size_t n) -> std::vector<double> {
    std::vector<double> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = lo + (hi - lo) * static_cast<double>(i) / static_cast<double>(n - 1);
    }
    return out;
}

// Trapezoidal integral over an evenly spaced grid.
auto integrate(const std::vector<double>& xs, const std::vector<double>& ys) -> double {
    double sum = 0.0;
    for (std::size_t i = 1; i < xs.size(); ++i) {
        sum += 0.5 * (ys[i] + ys[i - 1]) * (xs[i] - xs[i - 1]);
    }
    return sum;
}

}  // namespace

TEST_CASE("evaluator: Gaussian density matches the closed form", "[kde][evaluator]") {
    const std::vector<double> sample{0.0};
    const std::vector<double> points{0.0, 1.0, -2.0};
    auto out = kde::evaluate_density(sample, 1.0, points);

    const double inv_sqrt_2pi = 1.0 / std::sqrt(2.0 * std::numbers::pi);
    REQUIRE(out.size() == 3);
    REQUIRE(out[0] == Approx(inv_sqrt_2pi));
    REQUIRE(out[1] == Approx(inv_sqrt_2pi * std::exp(-0.5)));
    REQUIRE(out[2] == Approx(inv_sqrt_2pi * std::exp(-2.0)));
}

TEST_CASE("evaluator: averaging over the sample and bandwidth scaling", "[kde][evaluator]") {
    const std::vector<double> sample{-1.0, 1.0};
    const std::vector<double> points{0.0};
    const double h = 2.0;
    auto out = kde::evaluate_density(sample, h, points);

    // Both samples sit at u = 0.5 from the query point.
    const double expected = std::exp(-0.125) / (h * std::sqrt(2.0 * std::numbers::pi));
    REQUIRE(out[0] == Approx(expected));
}

TEST_CASE("evaluator: result length follows the points", "[kde][evaluator]") {
    const std::vector<double> sample{1.0, 2.0, 4.0};

    SECTION("empty points give an empty result") {
        const std::vector<double> points;
        REQUIRE(kde::evaluate_density(sample, 0.5, points).empty());
    }

    SECTION("one value per point") {
        const auto points = grid(-3.0, 3.0, 17);
        REQUIRE(kde::evaluate_density(sample, 0.5, points).size() == 17);
    }
}

TEST_CASE("evaluator: densities are non-negative", "[kde][evaluator]") {
    const std::vector<double> sample{1.0, 1.5, 2.0, 7.0, 7.5};
    const auto points = grid(-50.0, 50.0, 201);
    for (auto kernel : {kde::KernelKind::Gaussian, kde::KernelKind::Epanechnikov,
                        kde::KernelKind::Biweight, kde::KernelKind::Triangular,
                        kde::KernelKind::Uniform}) {
        for (double v : kde::evaluate_density(sample, 0.8, points, kernel)) {
            REQUIRE(v >= 0.0);
        }
    }
}

TEST_CASE("evaluator: every kernel integrates to one", "[kde][evaluator]") {
    const std::vector<double> sample{-0.7, 0.0, 0.4, 1.3, 2.2};
    const auto points = grid(-12.0, 14.0, 26001);
    for (auto kernel : {kde::KernelKind::Gaussian, kde::KernelKind::Epanechnikov,
                        kde::KernelKind::Biweight, kde::KernelKind::Triangular,
                        kde::KernelKind::Uniform}) {
        auto density = kde::evaluate_density(sample, 0.9, points, kernel);
        REQUIRE(integrate(points, density) == Approx(1.0).margin(2e-3));
    }
}

TEST_CASE("evaluator: symmetric sample gives a symmetric density", "[kde][evaluator]") {
    const std::vector<double> sample{-2.0, -1.0, 0.0, 1.0, 2.0};
    const std::vector<double> left{-3.0, -1.5, -0.25};
    const std::vector<double> right{3.0, 1.5, 0.25};
    auto l = kde::evaluate_density(sample, 0.7, left);
    auto r = kde::evaluate_density(sample, 0.7, right);
    for (std::size_t i = 0; i < l.size(); ++i) {
        REQUIRE(l[i] == Approx(r[i]));
    }
}

TEST_CASE("evaluator: repeated calls are bit-identical", "[kde][evaluator]") {
    const std::vector<double> sample{0.3, 1.7, 2.9, 3.1, 8.4};
    const auto points = grid(0.0, 10.0, 33);
    auto first = kde::evaluate_density(sample, 0.6, points);
    auto second = kde::evaluate_density(sample, 0.6, points);
    REQUIRE(first == second);
}

TEST_CASE("evaluator: zero bandwidth yields zeros", "[kde][evaluator]") {
    const std::vector<double> sample{2.0};
    const std::vector<double> points{1.0, 2.0, 3.0};
    auto out = kde::evaluate_density(sample, 0.0, points);
    REQUIRE(out == std::vector<double>{0.0, 0.0, 0.0});
}

TEST_CASE("evaluator: float output narrows the double result", "[kde][evaluator]") {
    const std::vector<double> sample{1.0, 2.0, 3.0, 4.0, 5.0};
    const std::vector<double> points{1.0, 2.5, 5.0};
    auto wide = kde::evaluate_density(sample, 0.9, points);
    std::vector<float> narrow(points.size());
    kde::evaluate_density_into<float>(sample, 0.9, points, kde::KernelKind::Gaussian, narrow);
    for (std::size_t i = 0; i < points.size(); ++i) {
        REQUIRE(narrow[i] == static_cast<float>(wide[i]));
    }
}

TEST_CASE("evaluator: mismatched output span is rejected", "[kde][evaluator]") {
    const std::vector<double> sample{1.0, 2.0};
    const std::vector<double> points{1.0, 2.0};
    std::vector<double> out(1);
    REQUIRE_THROWS_AS(kde::evaluate_density_into<double>(sample, 1.0, points,
                                                         kde::KernelKind::Gaussian, out),
                      std::invalid_argument);
}

TEST_CASE("density: checked pipeline for one population", "[kde][density]") {
    const std::vector<double> points{1.0, 2.0, 3.0};
    kde::DensitySettings settings;

    SECTION("regular population") {
        const std::vector<double> sample{1.0, 2.0, 3.0};
        auto out = kde::density_for_population(sample, points, settings);
        REQUIRE(out.has_value());
        auto h = kde::estimate_bandwidth(sample);
        REQUIRE(*out == kde::evaluate_density(sample, *h, points));
    }

    SECTION("degenerate population yields zeros by default") {
        const std::vector<double> sample{2.0};
        auto out = kde::density_for_population(sample, points, settings);
        REQUIRE(out.has_value());
        REQUIRE(*out == std::vector<double>{0.0, 0.0, 0.0});
    }

    SECTION("degenerate population can be rejected") {
        settings.degenerate = kde::DegeneratePolicy::Reject;
        const std::vector<double> sample{2.0, 2.0};
        auto out = kde::density_for_population(sample, points, settings);
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == KdeErrorKind::InvalidInput);
    }

    SECTION("empty population") {
        const std::vector<double> sample;
        auto out = kde::density_for_population(sample, points, settings);
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == KdeErrorKind::EmptyPopulation);
    }

    SECTION("non-finite evaluation point") {
        const std::vector<double> sample{1.0, 2.0};
        const std::vector<double> bad{1.0, std::numeric_limits<double>::infinity()};
        auto out = kde::density_for_population(sample, bad, settings);
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == KdeErrorKind::InvalidInput);
    }

    SECTION("fixed bandwidth overrides the rule") {
        settings.bandwidth = 0.25;
        const std::vector<double> sample{1.0, 2.0, 3.0};
        auto out = kde::density_for_population(sample, points, settings);
        REQUIRE(out.has_value());
        REQUIRE(*out == kde::evaluate_density(sample, 0.25, points));
    }
}

TEST_CASE("density: large-magnitude population is not flattened to zero", "[kde][density]") {
    kde::DensitySettings settings;

    SECTION("values around 1e200") {
        const std::vector<double> sample{1e200, 2e200, 3e200};
        const std::vector<double> points{1e200, 2e200, 3e200};
        auto out = kde::density_for_population(sample, points, settings);
        REQUIRE(out.has_value());
        for (double v : *out) {
            REQUIRE(std::isfinite(v));
            REQUIRE(v > 0.0);
        }
    }

    SECTION("values spanning most of the double range") {
        const std::vector<double> sample{-1e308, 1e308};
        const std::vector<double> points{-1e308, 0.0, 1e308};
        auto out = kde::density_for_population(sample, points, settings);
        REQUIRE(out.has_value());
        for (double v : *out) {
            REQUIRE(v > 0.0);
        }
    }
}
