#include <kdeflow/runtime/kde_options.hpp>

#include <fmt/format.h>

#include <array>
#include <cmath>
#include <utility>

namespace kdeflow::runtime {

namespace {

template <typename E, std::size_t N>
auto lookup(const std::array<std::pair<std::string_view, E>, N>& table, std::string_view name)
    -> std::optional<E> {
    for (const auto& [key, value] : table) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

template <typename E, std::size_t N>
auto name_of(const std::array<std::pair<std::string_view, E>, N>& table, E value)
    -> std::string_view {
    for (const auto& [key, v] : table) {
        if (v == value) {
            return key;
        }
    }
    return "unknown";
}

constexpr std::array<std::pair<std::string_view, kde::KernelKind>, 5> kKernels{{
    {"gaussian", kde::KernelKind::Gaussian},
    {"epanechnikov", kde::KernelKind::Epanechnikov},
    {"biweight", kde::KernelKind::Biweight},
    {"triangular", kde::KernelKind::Triangular},
    {"uniform", kde::KernelKind::Uniform},
}};

constexpr std::array<std::pair<std::string_view, kde::BandwidthRule>, 2> kRules{{
    {"scott", kde::BandwidthRule::Scott},
    {"silverman", kde::BandwidthRule::Silverman},
}};

constexpr std::array<std::pair<std::string_view, FailurePolicy>, 2> kFailurePolicies{{
    {"fail-fast", FailurePolicy::FailFast},
    {"partial", FailurePolicy::Partial},
}};

constexpr std::array<std::pair<std::string_view, kde::DegeneratePolicy>, 2> kDegeneratePolicies{{
    {"zeros", kde::DegeneratePolicy::Zeros},
    {"reject", kde::DegeneratePolicy::Reject},
}};

}  // namespace

auto validate(const KdeOptions& options) -> std::expected<void, KdeError> {
    if (options.bandwidth.has_value()) {
        double h = *options.bandwidth;
        if (!std::isfinite(h) || h <= 0.0) {
            return std::unexpected(
                KdeError{.kind = KdeErrorKind::InvalidInput,
                         .message = fmt::format("fixed bandwidth must be finite and > 0, got {}", h)});
        }
    }
    return {};
}

auto density_settings(const KdeOptions& options) -> kde::DensitySettings {
    return kde::DensitySettings{.rule = options.bandwidth_rule,
                                .kernel = options.kernel,
                                .bandwidth = options.bandwidth,
                                .degenerate = options.degenerate_policy};
}

auto parse_kernel(std::string_view name) -> std::optional<kde::KernelKind> {
    return lookup(kKernels, name);
}

auto parse_bandwidth_rule(std::string_view name) -> std::optional<kde::BandwidthRule> {
    return lookup(kRules, name);
}

auto parse_failure_policy(std::string_view name) -> std::optional<FailurePolicy> {
    return lookup(kFailurePolicies, name);
}

auto parse_degenerate_policy(std::string_view name) -> std::optional<kde::DegeneratePolicy> {
    return lookup(kDegeneratePolicies, name);
}

auto to_string(kde::KernelKind kind) -> std::string_view {
    return name_of(kKernels, kind);
}

auto to_string(kde::BandwidthRule rule) -> std::string_view {
    return name_of(kRules, rule);
}

auto to_string(FailurePolicy policy) -> std::string_view {
    return name_of(kFailurePolicies, policy);
}

auto to_string(kde::DegeneratePolicy policy) -> std::string_view {
    return name_of(kDegeneratePolicies, policy);
}

}  // namespace kdeflow::runtime
