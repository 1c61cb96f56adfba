#pragma once

#include <kdeflow/kde/density.hpp>
#include <kdeflow/kde/error.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>

namespace kdeflow::runtime {

/// How per-group failures surface to the caller.
enum class FailurePolicy : std::uint8_t {
    /// The first failing group aborts the whole call.
    FailFast,
    /// A failing group becomes a null entry; the others still compute.
    Partial,
};

/// Element type of the result lists. Float32 values above the largest finite
/// float are stored as that maximum.
enum class OutputType : std::uint8_t {
    Float64,
    Float32,
};

/// Configuration for one kde call.
struct KdeOptions {
    FailurePolicy failure_policy = FailurePolicy::Partial;
    kde::DegeneratePolicy degenerate_policy = kde::DegeneratePolicy::Zeros;
    kde::BandwidthRule bandwidth_rule = kde::BandwidthRule::Scott;
    kde::KernelKind kernel = kde::KernelKind::Gaussian;
    /// Fixed bandwidth overriding `bandwidth_rule`.
    std::optional<double> bandwidth;
    /// Element type of the result lists; computation is always double.
    OutputType output_type = OutputType::Float64;
    /// Worker threads; 0 selects std::thread::hardware_concurrency().
    std::size_t threads = 0;
    /// Calls with fewer groups run on the calling thread.
    std::size_t min_parallel_groups = 64;
};

/// Reject options that can never produce a result (e.g. a non-positive fixed bandwidth).
[[nodiscard]] auto validate(const KdeOptions& options) -> std::expected<void, KdeError>;

[[nodiscard]] auto density_settings(const KdeOptions& options) -> kde::DensitySettings;

// Lower-case names, as accepted on the command line.
[[nodiscard]] auto parse_kernel(std::string_view name) -> std::optional<kde::KernelKind>;
[[nodiscard]] auto parse_bandwidth_rule(std::string_view name)
    -> std::optional<kde::BandwidthRule>;
[[nodiscard]] auto parse_failure_policy(std::string_view name) -> std::optional<FailurePolicy>;
[[nodiscard]] auto parse_degenerate_policy(std::string_view name)
    -> std::optional<kde::DegeneratePolicy>;

[[nodiscard]] auto to_string(kde::KernelKind kind) -> std::string_view;
[[nodiscard]] auto to_string(kde::BandwidthRule rule) -> std::string_view;
[[nodiscard]] auto to_string(FailurePolicy policy) -> std::string_view;
[[nodiscard]] auto to_string(kde::DegeneratePolicy policy) -> std::string_view;

}  // namespace kdeflow::runtime
