#include <kdeflow/runtime/partition.hpp>

#include <fmt/format.h>
#include <robin_hood.h>

#include <bit>
#include <cmath>
#include <string_view>
#include <type_traits>

namespace kdeflow::runtime {

namespace {

auto canonical_bits(double v) noexcept -> std::uint64_t {
    if (std::isnan(v)) {
        return 0x7ff8000000000000ULL;
    }
    if (v == 0.0) {
        return 0;
    }
    return std::bit_cast<std::uint64_t>(v);
}

// Pass over the key column assigning dense group ids in first-seen order. One
// hash lookup per row, with a sorted-run shortcut that skips the lookup
// whenever the current key equals the previous one.
template <typename Key, typename KeyAt>
void assign_groups(const ColumnEntry& keys, std::size_t rows, KeyAt key_at, Partition& out) {
    robin_hood::unordered_flat_map<Key, std::uint32_t> key_to_gid;
    key_to_gid.reserve(64);
    out.row_groups.resize(rows);

    bool have_prev = false;
    Key prev_key{};
    std::uint32_t prev_gid = 0;
    for (std::size_t row = 0; row < rows; ++row) {
        if (keys.validity.has_value() && !(*keys.validity)[row]) {
            if (!out.null_group.has_value()) {
                out.null_group = static_cast<std::uint32_t>(out.first_rows.size());
                out.first_rows.push_back(row);
            }
            out.row_groups[row] = *out.null_group;
            continue;
        }
        Key key = key_at(row);
        if (have_prev && key == prev_key) {
            out.row_groups[row] = prev_gid;
            continue;
        }
        std::uint32_t gid;
        auto it = key_to_gid.find(key);
        if (it == key_to_gid.end()) {
            gid = static_cast<std::uint32_t>(out.first_rows.size());
            key_to_gid.emplace(key, gid);
            out.first_rows.push_back(row);
        } else {
            gid = it->second;
        }
        have_prev = true;
        prev_key = key;
        prev_gid = gid;
        out.row_groups[row] = gid;
    }
}

}  // namespace

auto partition_by_key(const ColumnEntry& keys) -> std::expected<Partition, KdeError> {
    if (auto ok = check_validity(keys); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    Partition out;
    const ColumnValue& column = *keys.column;
    const std::size_t rows = column_size(column);

    if (const auto* ints = std::get_if<Column<std::int64_t>>(&column)) {
        const auto* data = ints->data();
        assign_groups<std::int64_t>(keys, rows, [data](std::size_t r) { return data[r]; }, out);
        return out;
    }
    if (const auto* dbls = std::get_if<Column<double>>(&column)) {
        const auto* data = dbls->data();
        assign_groups<std::uint64_t>(
            keys, rows, [data](std::size_t r) { return canonical_bits(data[r]); }, out);
        return out;
    }
    if (const auto* strs = std::get_if<Column<std::string>>(&column)) {
        assign_groups<std::string_view>(
            keys, rows, [strs](std::size_t r) { return std::string_view((*strs)[r]); }, out);
        return out;
    }
    return std::unexpected(KdeError{
        .kind = KdeErrorKind::InvalidInput,
        .message = fmt::format("group-by column `{}` must be Int64, Float64 or String, got {}",
                               keys.name, column_kind_name(column))});
}

auto gather_keys(const ColumnEntry& keys, const Partition& partition) -> ColumnEntry {
    ColumnValue out = make_empty_like(*keys.column);
    for (std::size_t row : partition.first_rows) {
        append_value(out, *keys.column, row);
    }
    std::optional<std::vector<bool>> validity;
    if (partition.null_group.has_value()) {
        validity.emplace(partition.size(), true);
        (*validity)[*partition.null_group] = false;
    }
    return make_entry(keys.name, std::move(out), std::move(validity));
}

template <typename Out>
auto collect_groups(const ColumnEntry& values, const Partition& partition)
    -> std::expected<ListColumn<Out>, KdeError> {
    if (auto ok = check_validity(values); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    return std::visit(
        [&](const auto& col) -> std::expected<ListColumn<Out>, KdeError> {
            using ColT = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColT, Column<float>> ||
                          std::is_same_v<ColT, Column<double>>) {
                const std::size_t rows = col.size();
                if (rows != partition.row_groups.size()) {
                    return std::unexpected(KdeError{
                        .kind = KdeErrorKind::ShapeMismatch,
                        .message = fmt::format("value column `{}` has {} rows, group keys have {}",
                                               values.name, rows, partition.row_groups.size())});
                }
                auto valid = [&](std::size_t r) {
                    return !values.validity.has_value() || (*values.validity)[r];
                };

                // Counting sort by group id: stable, so each group keeps input order.
                const std::size_t n_groups = partition.size();
                std::vector<std::size_t> offsets(n_groups + 1, 0);
                for (std::size_t r = 0; r < rows; ++r) {
                    if (valid(r)) {
                        ++offsets[partition.row_groups[r] + 1];
                    }
                }
                for (std::size_t g = 0; g < n_groups; ++g) {
                    offsets[g + 1] += offsets[g];
                }
                std::vector<Out> flat(offsets.back());
                std::vector<std::size_t> cursor(offsets.begin(), offsets.end() - 1);
                for (std::size_t r = 0; r < rows; ++r) {
                    if (valid(r)) {
                        flat[cursor[partition.row_groups[r]]++] = static_cast<Out>(col[r]);
                    }
                }
                return ListColumn<Out>(std::move(flat), std::move(offsets));
            } else {
                return std::unexpected(KdeError{
                    .kind = KdeErrorKind::InvalidInput,
                    .message = fmt::format("value column `{}` must be Float32 or Float64, got {}",
                                           values.name, column_kind_name(*values.column))});
            }
        },
        *values.column);
}

template auto collect_groups<float>(const ColumnEntry&, const Partition&)
    -> std::expected<ListColumn<float>, KdeError>;
template auto collect_groups<double>(const ColumnEntry&, const Partition&)
    -> std::expected<ListColumn<double>, KdeError>;

auto format_key(const ColumnEntry& keys, std::size_t row) -> std::string {
    if (keys.validity.has_value() && !(*keys.validity)[row]) {
        return "null";
    }
    return std::visit(
        [row](const auto& col) -> std::string {
            using ColT = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColT, ListColumn<float>> ||
                          std::is_same_v<ColT, ListColumn<double>>) {
                return fmt::format("row {}", row);
            } else {
                return fmt::format("{}", col[row]);
            }
        },
        *keys.column);
}

}  // namespace kdeflow::runtime
