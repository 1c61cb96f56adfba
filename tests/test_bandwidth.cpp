#include <kdeflow/kde/bandwidth.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <vector>

using namespace kdeflow;
using Catch::Approx;

TEST_CASE("bandwidth: Scott's rule", "[kde][bandwidth]") {
    const std::vector<double> sample{1.0, 2.0, 3.0, 4.0, 5.0};

    // mean 3, sum of squared deviations 10, s = sqrt(10 / 4)
    REQUIRE(kde::sample_std_dev(sample) == Approx(std::sqrt(2.5)));

    auto h = kde::estimate_bandwidth(sample);
    REQUIRE(h.has_value());
    REQUIRE(*h == Approx(std::sqrt(2.5) * std::pow(5.0, -0.2)));
}

TEST_CASE("bandwidth: Silverman's rule", "[kde][bandwidth]") {
    const std::vector<double> sample{0.5, 1.5, 1.0, 4.0, 2.0, 3.5};

    auto scott = kde::estimate_bandwidth(sample, kde::BandwidthRule::Scott);
    auto silverman = kde::estimate_bandwidth(sample, kde::BandwidthRule::Silverman);
    REQUIRE(scott.has_value());
    REQUIRE(silverman.has_value());
    REQUIRE(*silverman == Approx(*scott * std::pow(4.0 / 3.0, 0.2)));
}

TEST_CASE("bandwidth: order of the sample does not matter", "[kde][bandwidth]") {
    const std::vector<double> a{3.0, 1.0, 2.0, 5.0};
    const std::vector<double> b{5.0, 2.0, 1.0, 3.0};
    REQUIRE(*kde::estimate_bandwidth(a) == Approx(*kde::estimate_bandwidth(b)));
}

TEST_CASE("bandwidth: degenerate samples give zero", "[kde][bandwidth]") {
    SECTION("single value") {
        const std::vector<double> sample{42.0};
        auto h = kde::estimate_bandwidth(sample);
        REQUIRE(h.has_value());
        REQUIRE(*h == 0.0);
    }

    SECTION("identical values") {
        const std::vector<double> sample{0.1, 0.1, 0.1, 0.1, 0.1, 0.1, 0.1};
        auto h = kde::estimate_bandwidth(sample);
        REQUIRE(h.has_value());
        REQUIRE(*h == 0.0);
    }
}

TEST_CASE("bandwidth: empty sample is an error", "[kde][bandwidth]") {
    const std::vector<double> sample;
    auto h = kde::estimate_bandwidth(sample);
    REQUIRE_FALSE(h.has_value());
    REQUIRE(h.error().kind == KdeErrorKind::EmptyPopulation);
}

TEST_CASE("bandwidth: non-finite values are rejected", "[kde][bandwidth]") {
    std::vector<double> sample{1.0, 2.0, std::numeric_limits<double>::quiet_NaN()};
    auto h = kde::estimate_bandwidth(sample);
    REQUIRE_FALSE(h.has_value());
    REQUIRE(h.error().kind == KdeErrorKind::InvalidInput);

    sample[2] = std::numeric_limits<double>::infinity();
    h = kde::estimate_bandwidth(sample);
    REQUIRE_FALSE(h.has_value());
    REQUIRE(h.error().kind == KdeErrorKind::InvalidInput);
}

TEST_CASE("bandwidth: large-magnitude samples stay finite", "[kde][bandwidth]") {
    const std::vector<double> sample{1e200, 2e200, 3e200};
    REQUIRE(kde::sample_std_dev(sample) == Approx(1e200));

    auto h = kde::estimate_bandwidth(sample);
    REQUIRE(h.has_value());
    REQUIRE(std::isfinite(*h));
    REQUIRE(*h == Approx(1e200 * std::pow(3.0, -0.2)));

    const std::vector<double> wide{-1e308, 1e308};
    auto hw = kde::estimate_bandwidth(wide);
    REQUIRE(hw.has_value());
    REQUIRE(std::isfinite(*hw));
    REQUIRE(*hw > 0.0);
}

TEST_CASE("bandwidth: spread beyond double range is rejected", "[kde][bandwidth]") {
    const double big = std::numeric_limits<double>::max();
    const std::vector<double> sample{-big, big};
    auto h = kde::estimate_bandwidth(sample);
    REQUIRE_FALSE(h.has_value());
    REQUIRE(h.error().kind == KdeErrorKind::InvalidInput);
}
