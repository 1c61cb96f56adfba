#pragma once

#include <kdeflow/runtime/kde_options.hpp>
#include <kdeflow/runtime/table.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace kdeflow::ops {

// ─── Table-level KDE operations ───────────────────────────────────────────────
//  Thin wrappers over the runtime calls: look columns up by name, run the call
//  and package the result as a Table. Failures throw KdeException.

/// Group `table` by `group_by` and estimate the density of `column` per group.
/// Returns the key column followed by `alias`, one row per key (first-seen order).
[[nodiscard]] auto kde(const runtime::Table& table, const std::string& group_by,
                       const std::string& column, std::vector<double> eval_points,
                       const std::string& alias = "kde",
                       const runtime::KdeOptions& options = {}) -> runtime::Table;

/// Copy of `table` with `alias` added: the density of each row of the list
/// column `column` at the shared `eval_points`.
[[nodiscard]] auto with_kde_static(const runtime::Table& table, const std::string& column,
                                   std::vector<double> eval_points,
                                   const std::string& alias = "kde",
                                   const runtime::KdeOptions& options = {}) -> runtime::Table;

/// Copy of `table` with `alias` added: row i of `column` evaluated at row i of
/// the list column `eval_column`.
[[nodiscard]] auto with_kde_dynamic(const runtime::Table& table, const std::string& column,
                                    const std::string& eval_column,
                                    const std::string& alias = "kde",
                                    const runtime::KdeOptions& options = {}) -> runtime::Table;

/// Collect the non-null values of `column` into one list per `group_by` key.
[[nodiscard]] auto group_list(const runtime::Table& table, const std::string& group_by,
                              const std::string& column) -> runtime::Table;

void print(const runtime::Table& t, std::ostream& out = std::cout);

}  // namespace kdeflow::ops
