#include <kdeflow/runtime/kde.hpp>
#include <kdeflow/runtime/ops.hpp>
#include <kdeflow/runtime/partition.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <type_traits>

namespace kdeflow::ops {

namespace {

auto format_columns(const runtime::Table& table) -> std::string {
    if (table.columns.empty()) {
        return "<none>";
    }
    std::string out;
    for (std::size_t i = 0; i < table.columns.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(table.columns[i].name);
    }
    return out;
}

auto require_entry(const runtime::Table& table, const std::string& name)
    -> const runtime::ColumnEntry& {
    const auto* entry = table.find_entry(name);
    if (entry == nullptr) {
        throw KdeException(KdeError{
            .kind = KdeErrorKind::InvalidInput,
            .message = fmt::format("column not found: {} (available: {})", name,
                                   format_columns(table))});
    }
    return *entry;
}

template <typename T>
auto unwrap(std::expected<T, KdeError> result) -> T {
    if (!result) {
        throw KdeException(std::move(result.error()));
    }
    return std::move(*result);
}

auto format_double(double v) -> std::string {
    if (std::isnan(v))
        return "nan";
    if (std::isinf(v))
        return v > 0 ? "inf" : "-inf";
    return fmt::format("{:g}", v);
}

auto format_value(const runtime::ColumnEntry& entry, std::size_t row) -> std::string {
    if (runtime::is_null(entry, row)) {
        return "null";
    }
    return std::visit(
        [row](const auto& c) -> std::string {
            using ColT = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<ColT, Column<std::string>>) {
                return c[row];
            } else if constexpr (std::is_same_v<ColT, Column<float>> ||
                                 std::is_same_v<ColT, Column<double>>) {
                return format_double(static_cast<double>(c[row]));
            } else if constexpr (std::is_same_v<ColT, ListColumn<float>> ||
                                 std::is_same_v<ColT, ListColumn<double>>) {
                std::string s = "[";
                auto values = c[row];
                for (std::size_t i = 0; i < values.size(); ++i) {
                    if (i > 0)
                        s.append(", ");
                    s.append(format_double(static_cast<double>(values[i])));
                }
                s.push_back(']');
                return s;
            } else {
                return std::to_string(c[row]);
            }
        },
        *entry.column);
}

}  // namespace

auto kde(const runtime::Table& table, const std::string& group_by, const std::string& column,
         std::vector<double> eval_points, const std::string& alias,
         const runtime::KdeOptions& options) -> runtime::Table {
    const auto& keys = require_entry(table, group_by);
    const auto& values = require_entry(table, column);
    auto grouped = unwrap(runtime::kde(values, keys, std::move(eval_points), options));

    runtime::Table out;
    out.add_entry(std::move(grouped.keys));
    grouped.density.name = alias;
    out.add_entry(std::move(grouped.density));
    return out;
}

auto with_kde_static(const runtime::Table& table, const std::string& column,
                     std::vector<double> eval_points, const std::string& alias,
                     const runtime::KdeOptions& options) -> runtime::Table {
    const auto& populations = require_entry(table, column);
    auto density =
        unwrap(runtime::kde_static_evals(populations, std::move(eval_points), options));

    runtime::Table out = table;
    density.name = alias;
    out.add_entry(std::move(density));
    return out;
}

auto with_kde_dynamic(const runtime::Table& table, const std::string& column,
                      const std::string& eval_column, const std::string& alias,
                      const runtime::KdeOptions& options) -> runtime::Table {
    const auto& populations = require_entry(table, column);
    const auto& points = require_entry(table, eval_column);
    auto density = unwrap(runtime::kde_dynamic_evals(populations, points, options));

    runtime::Table out = table;
    density.name = alias;
    out.add_entry(std::move(density));
    return out;
}

auto group_list(const runtime::Table& table, const std::string& group_by,
                const std::string& column) -> runtime::Table {
    const auto& keys = require_entry(table, group_by);
    const auto& values = require_entry(table, column);
    auto partition = unwrap(runtime::partition_by_key(keys));

    runtime::ColumnValue lists;
    if (std::holds_alternative<Column<float>>(*values.column)) {
        lists = unwrap(runtime::collect_groups<float>(values, partition));
    } else {
        lists = unwrap(runtime::collect_groups<double>(values, partition));
    }

    runtime::Table out;
    out.add_entry(runtime::gather_keys(keys, partition));
    out.add_column(column, std::move(lists));
    return out;
}

void print(const runtime::Table& t, std::ostream& out) {
    if (t.columns.empty()) {
        out << "(empty table)\n";
        return;
    }

    std::size_t rows = t.rows();

    // Collect all cell strings and compute column widths.
    std::vector<std::vector<std::string>> cells(t.columns.size());
    std::vector<std::size_t> widths(t.columns.size());

    for (std::size_t c = 0; c < t.columns.size(); ++c) {
        widths[c] = t.columns[c].name.size();
        cells[c].reserve(rows);
        for (std::size_t r = 0; r < rows; ++r) {
            auto s = format_value(t.columns[c], r);
            widths[c] = std::max(widths[c], s.size());
            cells[c].push_back(std::move(s));
        }
    }

    // Header row.
    for (std::size_t c = 0; c < t.columns.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << fmt::format("{:<{}}", t.columns[c].name, widths[c]);
    }
    out << "\n";

    // Separator.
    for (std::size_t c = 0; c < t.columns.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << std::string(widths[c], '-');
    }
    out << "\n";

    // Data rows.
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < t.columns.size(); ++c) {
            if (c > 0)
                out << "  ";
            out << fmt::format("{:<{}}", cells[c][r], widths[c]);
        }
        out << "\n";
    }
}

}  // namespace kdeflow::ops
