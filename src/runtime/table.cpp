#include <kdeflow/runtime/table.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <type_traits>

namespace kdeflow::runtime {

auto make_entry(std::string name, ColumnValue column, std::optional<std::vector<bool>> validity)
    -> ColumnEntry {
    return ColumnEntry{.name = std::move(name),
                       .column = std::make_shared<ColumnValue>(std::move(column)),
                       .validity = std::move(validity)};
}

auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    if (entry.validity.has_value() && !(*entry.validity)[row]) {
        return true;
    }
    if (const auto* list = std::get_if<ListColumn<float>>(entry.column.get())) {
        return list->is_null(row);
    }
    if (const auto* list = std::get_if<ListColumn<double>>(entry.column.get())) {
        return list->is_null(row);
    }
    return false;
}

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto check_validity(const ColumnEntry& entry) -> std::expected<void, KdeError> {
    if (!entry.validity.has_value()) {
        return {};
    }
    const std::size_t rows = column_size(*entry.column);
    if (entry.validity->size() != rows) {
        return std::unexpected(KdeError{
            .kind = KdeErrorKind::ShapeMismatch,
            .message = fmt::format("validity bitmap of `{}` has {} entries, column has {} rows",
                                   entry.name, entry.validity->size(), rows)});
    }
    return {};
}

auto column_kind_name(const ColumnValue& column) -> std::string_view {
    return std::visit(
        [](const auto& col) -> std::string_view {
            using ColT = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColT, Column<std::int64_t>>) {
                return "Int64";
            } else if constexpr (std::is_same_v<ColT, Column<float>>) {
                return "Float32";
            } else if constexpr (std::is_same_v<ColT, Column<double>>) {
                return "Float64";
            } else if constexpr (std::is_same_v<ColT, Column<std::string>>) {
                return "String";
            } else if constexpr (std::is_same_v<ColT, ListColumn<float>>) {
                return "List(Float32)";
            } else {
                return "List(Float64)";
            }
        },
        column);
}

auto is_list_column(const ColumnValue& column) noexcept -> bool {
    return std::holds_alternative<ListColumn<float>>(column) ||
           std::holds_alternative<ListColumn<double>>(column);
}

auto list_row_as_double(const ColumnValue& column, std::size_t row, std::vector<double>& scratch)
    -> std::span<const double> {
    if (const auto* dbls = std::get_if<ListColumn<double>>(&column)) {
        return (*dbls)[row];
    }
    if (const auto* flts = std::get_if<ListColumn<float>>(&column)) {
        auto src = (*flts)[row];
        scratch.assign(src.begin(), src.end());
        return scratch;
    }
    throw std::invalid_argument("list_row_as_double: not a float list column");
}

auto make_empty_like(const ColumnValue& src) -> ColumnValue {
    return std::visit(
        [](const auto& col) -> ColumnValue {
            using ColType = std::decay_t<decltype(col)>;
            return ColType{};
        },
        src);
}

void append_value(ColumnValue& out, const ColumnValue& src, std::size_t index) {
    std::visit(
        [&](auto& dst_col) {
            using ColType = std::decay_t<decltype(dst_col)>;
            const auto* src_col = std::get_if<ColType>(&src);
            if (src_col == nullptr) {
                throw std::runtime_error("column type mismatch");
            }
            if constexpr (std::is_same_v<ColType, ListColumn<float>> ||
                          std::is_same_v<ColType, ListColumn<double>>) {
                if (src_col->is_null(index)) {
                    dst_col.push_null();
                } else {
                    dst_col.push_back((*src_col)[index]);
                }
            } else {
                dst_col.push_back((*src_col)[index]);
            }
        },
        out);
}

void Table::add_column(std::string name, ColumnValue column) {
    add_entry(ColumnEntry{.name = std::move(name),
                          .column = std::make_shared<ColumnValue>(std::move(column))});
}

void Table::add_column(std::string name, ColumnValue column, std::vector<bool> validity) {
    add_entry(ColumnEntry{.name = std::move(name),
                          .column = std::make_shared<ColumnValue>(std::move(column)),
                          .validity = std::move(validity)});
}

void Table::add_entry(ColumnEntry entry) {
    if (auto ok = check_validity(entry); !ok) {
        throw std::invalid_argument(ok.error().message);
    }
    if (auto it = index.find(entry.name); it != index.end()) {
        // Reseat the shared_ptr rather than mutating shared data (copy-on-write).
        columns[it->second] = std::move(entry);
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(std::move(entry));
    index[columns.back().name] = pos;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_size(*columns.front().column);
}

}  // namespace kdeflow::runtime
