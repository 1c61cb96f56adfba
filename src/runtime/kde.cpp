#include <kdeflow/kde/density.hpp>
#include <kdeflow/runtime/eval_points.hpp>
#include <kdeflow/runtime/kde.hpp>
#include <kdeflow/runtime/parallel.hpp>
#include <kdeflow/runtime/partition.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <string_view>
#include <type_traits>
#include <variant>

namespace kdeflow::runtime {

namespace {

// ─── Call shapes ──────────────────────────────────────────────────────────────
//  A call is one of three closed shapes, chosen once by the public entry point.
//  run_call() visits the variant a single time; from there each shape runs
//  through its own instantiation of run_groups(), so the per-group loop never
//  branches on the mode.

struct AggregatingCall {
    ListColumn<double> populations;  // one row per group
    SharedEvalPoints points;
    const ColumnEntry* keys = nullptr;
    const Partition* partition = nullptr;
};

struct StaticCall {
    const ColumnEntry* populations = nullptr;
    SharedEvalPoints points;
};

struct DynamicCall {
    const ColumnEntry* populations = nullptr;
    PerRowEvalPoints points;
};

using KdeCall = std::variant<AggregatingCall, StaticCall, DynamicCall>;

auto mode_name(const AggregatingCall& /*call*/) -> std::string_view {
    return "kde";
}
auto mode_name(const StaticCall& /*call*/) -> std::string_view {
    return "kde_static_evals";
}
auto mode_name(const DynamicCall& /*call*/) -> std::string_view {
    return "kde_dynamic_evals";
}

auto group_count(const AggregatingCall& call) -> std::size_t {
    return call.populations.size();
}
auto group_count(const StaticCall& call) -> std::size_t {
    return column_size(*call.populations->column);
}
auto group_count(const DynamicCall& call) -> std::size_t {
    return call.points.size();
}

auto missing_population() -> KdeError {
    return KdeError{.kind = KdeErrorKind::MissingInput, .message = "population is null"};
}

using GroupResult = std::expected<std::vector<double>, KdeError>;

auto compute_group(const AggregatingCall& call, std::size_t g,
                   const kde::DensitySettings& settings) -> GroupResult {
    return kde::density_for_population(call.populations[g], call.points.view(), settings);
}

auto compute_group(const StaticCall& call, std::size_t g, const kde::DensitySettings& settings)
    -> GroupResult {
    if (is_null(*call.populations, g)) {
        return std::unexpected(missing_population());
    }
    std::vector<double> scratch;
    auto sample = list_row_as_double(*call.populations->column, g, scratch);
    return kde::density_for_population(sample, call.points.view(), settings);
}

auto compute_group(const DynamicCall& call, std::size_t g, const kde::DensitySettings& settings)
    -> GroupResult {
    if (is_null(*call.populations, g)) {
        return std::unexpected(missing_population());
    }
    std::vector<double> point_scratch;
    auto points = call.points.row(g, point_scratch);
    if (!points) {
        return std::unexpected(std::move(points.error()));
    }
    std::vector<double> sample_scratch;
    auto sample = list_row_as_double(*call.populations->column, g, sample_scratch);
    return kde::density_for_population(sample, *points, settings);
}

void attach_context(const AggregatingCall& call, std::size_t g, KdeError& error) {
    error.group_key = format_key(*call.keys, call.partition->first_rows[g]);
}
void attach_context(const StaticCall& /*call*/, std::size_t g, KdeError& error) {
    error.row = g;
}
void attach_context(const DynamicCall& /*call*/, std::size_t g, KdeError& error) {
    error.row = g;
}

// Narrowing to the output element type happens here and nowhere else. Float32
// results saturate at the largest finite float rather than becoming inf.
template <typename Out>
auto assemble(const std::vector<std::optional<std::vector<double>>>& results) -> ListColumn<Out> {
    std::size_t total = 0;
    for (const auto& r : results) {
        total += r.has_value() ? r->size() : 0;
    }
    ListColumn<Out> out;
    out.reserve(results.size(), total);
    for (const auto& r : results) {
        if (!r.has_value()) {
            out.push_null();
            continue;
        }
        auto dst = out.append_row(r->size());
        std::transform(r->begin(), r->end(), dst.begin(), [](double v) {
            if constexpr (std::is_same_v<Out, float>) {
                v = std::min(v, static_cast<double>(std::numeric_limits<float>::max()));
            }
            return static_cast<Out>(v);
        });
    }
    return out;
}

template <typename Call>
auto run_groups(const Call& call, const KdeOptions& options) -> std::expected<ColumnValue, KdeError> {
    const std::size_t n = group_count(call);
    const auto settings = density_settings(options);
    const bool fail_fast = options.failure_policy == FailurePolicy::FailFast;
    const std::size_t threads =
        n < options.min_parallel_groups ? 1 : resolve_thread_count(options.threads, n);
    spdlog::debug("{}: {} group(s), {} worker(s), policy={}", mode_name(call), n, threads,
                  to_string(options.failure_policy));

    // One slot per group, each written only by the worker that owns the group.
    std::vector<std::optional<std::vector<double>>> results(n);
    std::vector<std::optional<KdeError>> errors(n);

    parallel_for(n, threads, [&](std::size_t g) -> bool {
        auto density = compute_group(call, g, settings);
        if (!density) {
            attach_context(call, g, density.error());
            errors[g] = std::move(density.error());
            return !fail_fast;
        }
        results[g] = std::move(*density);
        return true;
    });

    // Lowest failing group first, so fail-fast reports the same group a
    // sequential run would have stopped at.
    std::size_t failed = 0;
    for (std::size_t g = 0; g < n; ++g) {
        if (!errors[g].has_value()) {
            continue;
        }
        if (fail_fast) {
            return std::unexpected(std::move(*errors[g]));
        }
        spdlog::debug("{}: null result, {}", mode_name(call), errors[g]->format());
        ++failed;
    }
    if (failed > 0) {
        spdlog::warn("{}: {} of {} group(s) produced null results", mode_name(call), failed, n);
    }

    if (options.output_type == OutputType::Float32) {
        return ColumnValue{assemble<float>(results)};
    }
    return ColumnValue{assemble<double>(results)};
}

auto run_call(const KdeCall& call, const KdeOptions& options)
    -> std::expected<ColumnValue, KdeError> {
    return std::visit([&](const auto& shape) { return run_groups(shape, options); }, call);
}

}  // namespace

auto kde(const ColumnEntry& values, const ColumnEntry& keys,
         const std::optional<std::vector<double>>& eval_points, const KdeOptions& options)
    -> std::expected<GroupedDensity, KdeError> {
    if (auto ok = validate(options); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    const std::size_t value_rows = column_size(*values.column);
    const std::size_t key_rows = column_size(*keys.column);
    if (value_rows != key_rows) {
        return std::unexpected(KdeError{
            .kind = KdeErrorKind::ShapeMismatch,
            .message = fmt::format("value column `{}` has {} rows, group-by column `{}` has {}",
                                   values.name, value_rows, keys.name, key_rows)});
    }
    auto points = resolve_shared(eval_points);
    if (!points) {
        return std::unexpected(std::move(points.error()));
    }
    auto partition = partition_by_key(keys);
    if (!partition) {
        return std::unexpected(std::move(partition.error()));
    }
    auto populations = collect_groups<double>(values, *partition);
    if (!populations) {
        return std::unexpected(std::move(populations.error()));
    }

    auto density = run_call(AggregatingCall{.populations = std::move(*populations),
                                            .points = std::move(*points),
                                            .keys = &keys,
                                            .partition = &*partition},
                            options);
    if (!density) {
        return std::unexpected(std::move(density.error()));
    }
    return GroupedDensity{.keys = gather_keys(keys, *partition),
                          .density = make_entry(values.name, std::move(*density))};
}

auto kde_static_evals(const ColumnEntry& populations,
                      const std::optional<std::vector<double>>& eval_points,
                      const KdeOptions& options) -> std::expected<ColumnEntry, KdeError> {
    if (auto ok = validate(options); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    if (auto ok = check_validity(populations); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    if (auto ok = require_list_column(populations); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    auto points = resolve_shared(eval_points);
    if (!points) {
        return std::unexpected(std::move(points.error()));
    }

    auto density =
        run_call(StaticCall{.populations = &populations, .points = std::move(*points)}, options);
    if (!density) {
        return std::unexpected(std::move(density.error()));
    }
    return make_entry(populations.name, std::move(*density));
}

auto kde_dynamic_evals(const ColumnEntry& populations, const ColumnEntry& eval_points,
                       const KdeOptions& options) -> std::expected<ColumnEntry, KdeError> {
    if (auto ok = validate(options); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    auto points = resolve_per_row(populations, eval_points);
    if (!points) {
        return std::unexpected(std::move(points.error()));
    }

    auto density =
        run_call(DynamicCall{.populations = &populations, .points = *points}, options);
    if (!density) {
        return std::unexpected(std::move(density.error()));
    }
    return make_entry(populations.name, std::move(*density));
}

}  // namespace kdeflow::runtime
