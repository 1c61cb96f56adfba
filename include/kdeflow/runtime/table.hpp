#pragma once

#include <kdeflow/core/column.hpp>
#include <kdeflow/core/list_column.hpp>
#include <kdeflow/kde/error.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace kdeflow::runtime {

using ColumnValue =
    std::variant<Column<std::int64_t>, Column<float>, Column<double>, Column<std::string>,
                 ListColumn<float>, ListColumn<double>>;

struct ColumnEntry {
    std::string name;
    std::shared_ptr<ColumnValue> column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid, the common case, with zero overhead.
    std::optional<std::vector<bool>> validity;
};

/// Build a standalone entry (used for column-level calls outside a Table).
[[nodiscard]] auto make_entry(std::string name, ColumnValue column,
                              std::optional<std::vector<bool>> validity = std::nullopt)
    -> ColumnEntry;

/// Returns true if row `row` of `entry` is null, either through the entry's
/// bitmap or, for list columns, through the list's own bitmap.
[[nodiscard]] auto is_null(const ColumnEntry& entry, std::size_t row) -> bool;

/// Number of rows held by a column of any kind.
[[nodiscard]] auto column_size(const ColumnValue& column) -> std::size_t;

/// ShapeMismatch when `entry` carries a validity bitmap whose length differs
/// from the column's row count.
[[nodiscard]] auto check_validity(const ColumnEntry& entry) -> std::expected<void, KdeError>;

/// Human-readable kind name, e.g. "List(Float32)".
[[nodiscard]] auto column_kind_name(const ColumnValue& column) -> std::string_view;

[[nodiscard]] auto is_list_column(const ColumnValue& column) noexcept -> bool;

/// Row `row` of a List(Float32) or List(Float64) column widened to double.
/// Float64 rows are returned as a view into the column; Float32 rows are
/// converted into `scratch`, which must outlive the returned span.
[[nodiscard]] auto list_row_as_double(const ColumnValue& column, std::size_t row,
                                      std::vector<double>& scratch) -> std::span<const double>;

/// Empty column of the same kind as `src`.
[[nodiscard]] auto make_empty_like(const ColumnValue& src) -> ColumnValue;

/// Append row `index` of `src` to `out`; both must hold the same kind.
void append_value(ColumnValue& out, const ColumnValue& src, std::size_t index);

struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    void add_column(std::string name, ColumnValue column);
    /// Add a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnValue column, std::vector<bool> validity);
    /// Add (or replace, when the name exists) a prepared entry. Throws
    /// std::invalid_argument when its validity bitmap and column lengths differ.
    void add_entry(ColumnEntry entry);
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
};

}  // namespace kdeflow::runtime
