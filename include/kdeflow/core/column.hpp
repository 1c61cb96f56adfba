#pragma once

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <utility>
#include <vector>

namespace kdeflow {

/// Element types a column can hold: copyable, comparable values.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// Scalar column: one contiguous buffer of T, one value per row.
///
/// Key columns and flat value columns use this type; nulls are tracked by the
/// owning runtime::ColumnEntry, not here.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;

    static_assert(ColumnElement<T>, "Column<T> requires T to satisfy ColumnElement.");

    Column() = default;
    explicit Column(std::vector<T> values) : values_(std::move(values)) {}
    Column(std::initializer_list<T> values) : values_(values) {}

    [[nodiscard]] auto size() const noexcept -> size_type { return values_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return values_.empty(); }

    [[nodiscard]] auto operator[](size_type row) const noexcept -> const T& {
        return values_[row];
    }

    [[nodiscard]] auto data() const noexcept -> const T* { return values_.data(); }
    [[nodiscard]] auto span() const noexcept -> std::span<const T> { return values_; }

    void push_back(T value) { values_.push_back(std::move(value)); }
    void reserve(size_type rows) { values_.reserve(rows); }

   private:
    std::vector<T> values_;
};

}  // namespace kdeflow
