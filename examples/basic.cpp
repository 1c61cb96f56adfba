#include <kdeflow/core/column.hpp>
#include <kdeflow/kde/bandwidth.hpp>
#include <kdeflow/kde/evaluator.hpp>
#include <kdeflow/runtime/ops.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <vector>

auto main() -> int {
    // Five observations split over two groups.
    kdeflow::runtime::Table df;
    df.add_column("a", kdeflow::Column<float>{1.0F, 2.0F, 3.0F, 4.0F, 5.0F});
    df.add_column("id", kdeflow::Column<std::int64_t>{0, 0, 1, 1, 1});

    const std::vector<double> eval_points{1.0, 2.0, 3.0, 4.0, 5.0};

    fmt::print("=== Single population ===\n");
    const std::vector<double> sample{1.0, 2.0, 3.0, 4.0, 5.0};
    auto h = kdeflow::kde::estimate_bandwidth(sample);
    if (!h) {
        fmt::print("error: {}\n", h.error().format());
        return 1;
    }
    auto density = kdeflow::kde::evaluate_density(sample, *h, eval_points);
    fmt::print("bandwidth: {:.6f}\n", *h);
    for (std::size_t i = 0; i < density.size(); ++i) {
        fmt::print("  f({}) = {:.6f}\n", eval_points[i], density[i]);
    }

    fmt::print("\n=== Aggregating: kde by id ===\n");
    kdeflow::ops::print(kdeflow::ops::kde(df, "id", "a", eval_points));

    fmt::print("\n=== Static: one shared grid per row ===\n");
    auto grouped = kdeflow::ops::group_list(df, "id", "a");
    kdeflow::ops::print(kdeflow::ops::with_kde_static(grouped, "a", eval_points));

    fmt::print("\n=== Dynamic: a grid per row ===\n");
    grouped.add_column("eval_points", kdeflow::ListColumn<double>{{1.0, 2.0, 3.0}, {4.0, 5.0}});
    kdeflow::ops::print(kdeflow::ops::with_kde_dynamic(grouped, "a", "eval_points"));

    return 0;
}
