#pragma once
// gen_kde_data: synthetic grouped samples for the kde benchmarks.
//
// Each group g draws `rows_per_group` Float32 values from N(g, 1 + g % 3);
// rows are interleaved across groups so the partitioner sees unsorted keys.

#include <kdeflow/core/column.hpp>
#include <kdeflow/runtime/table.hpp>

#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

inline auto gen_kde_data(std::int64_t groups, std::int64_t rows_per_group, std::uint64_t seed = 42)
    -> kdeflow::runtime::Table {
    if (groups < 0 || rows_per_group < 0)
        throw std::invalid_argument("gen_kde_data: sizes must be non-negative");
    auto n_groups = static_cast<std::size_t>(groups);
    auto per_group = static_cast<std::size_t>(rows_per_group);

    std::mt19937_64 rng(seed);
    std::vector<std::normal_distribution<double>> dists;
    dists.reserve(n_groups);
    for (std::size_t g = 0; g < n_groups; ++g) {
        dists.emplace_back(static_cast<double>(g), 1.0 + static_cast<double>(g % 3));
    }

    kdeflow::Column<std::int64_t> id_col;
    kdeflow::Column<float> value_col;
    id_col.reserve(n_groups * per_group);
    value_col.reserve(n_groups * per_group);

    for (std::size_t i = 0; i < per_group; ++i) {
        for (std::size_t g = 0; g < n_groups; ++g) {
            id_col.push_back(static_cast<std::int64_t>(g));
            value_col.push_back(static_cast<float>(dists[g](rng)));
        }
    }

    kdeflow::runtime::Table t;
    t.add_column("id", std::move(id_col));
    t.add_column("value", std::move(value_col));
    return t;
}

/// Evenly spaced points covering [lo, hi].
inline auto linspace(double lo, double hi, std::size_t n) -> std::vector<double> {
    std::vector<double> out(n);
    if (n == 1) {
        out[0] = lo;
        return out;
    }
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = lo + (hi - lo) * static_cast<double>(i) / static_cast<double>(n - 1);
    }
    return out;
}
