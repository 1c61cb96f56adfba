#pragma once

#include <kdeflow/core/column.hpp>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <span>
#include <vector>

namespace kdeflow {

/// A column whose rows are variable-length sequences of T.
///
/// Rows are stored back to back in one flat values buffer; `offsets_[i]` and
/// `offsets_[i + 1]` delimit row i. A null row occupies an empty slice and is
/// marked in the validity bitmap (true = valid). The bitmap is materialised
/// lazily, so a column without nulls carries no bitmap at all.
template <typename T>
class ListColumn {
   public:
    using value_type = T;
    using size_type = std::size_t;

    static_assert(ColumnElement<T>, "ListColumn<T> requires T to satisfy ColumnElement.");

    ListColumn() : offsets_{0} {}

    /// Build from nested rows; every row is valid.
    ListColumn(std::initializer_list<std::initializer_list<T>> rows) : offsets_{0} {
        for (const auto& row : rows) {
            push_back(std::span<const T>(row.begin(), row.size()));
        }
    }

    /// Adopt a prepared flat buffer; `offsets` has one more entry than there are
    /// rows, starts at 0 and ends at `values.size()`.
    ListColumn(std::vector<T> values, std::vector<size_type> offsets)
        : values_(std::move(values)), offsets_(std::move(offsets)) {}

    explicit ListColumn(const std::vector<std::vector<T>>& rows) : offsets_{0} {
        offsets_.reserve(rows.size() + 1);
        for (const auto& row : rows) {
            push_back(std::span<const T>(row));
        }
    }

    /// Number of rows.
    [[nodiscard]] auto size() const noexcept -> size_type { return offsets_.size() - 1; }

    [[nodiscard]] auto empty() const noexcept -> bool { return size() == 0; }

    /// Row `idx` as a read-only view (empty for null rows).
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> std::span<const T> {
        return {values_.data() + offsets_[idx], offsets_[idx + 1] - offsets_[idx]};
    }

    /// Length of row `idx`.
    [[nodiscard]] auto row_size(size_type idx) const noexcept -> size_type {
        return offsets_[idx + 1] - offsets_[idx];
    }

    [[nodiscard]] auto is_null(size_type idx) const noexcept -> bool {
        return validity_.has_value() && !(*validity_)[idx];
    }

    [[nodiscard]] auto null_count() const noexcept -> size_type {
        if (!validity_.has_value()) {
            return 0;
        }
        return static_cast<size_type>(std::count(validity_->begin(), validity_->end(), false));
    }

    /// Append a copy of `row`.
    void push_back(std::span<const T> row) {
        values_.insert(values_.end(), row.begin(), row.end());
        offsets_.push_back(values_.size());
        if (validity_.has_value()) {
            validity_->push_back(true);
        }
    }

    void push_back(std::initializer_list<T> row) {
        push_back(std::span<const T>(row.begin(), row.size()));
    }

    /// Append a row of `count` value-initialised elements and return a view to fill it.
    [[nodiscard]] auto append_row(size_type count) -> std::span<T> {
        const size_type start = values_.size();
        values_.resize(start + count);
        offsets_.push_back(values_.size());
        if (validity_.has_value()) {
            validity_->push_back(true);
        }
        return {values_.data() + start, count};
    }

    /// Append a null row.
    void push_null() {
        if (!validity_.has_value()) {
            validity_.emplace(size(), true);
        }
        offsets_.push_back(values_.size());
        validity_->push_back(false);
    }

    void reserve(size_type rows, size_type values) {
        offsets_.reserve(rows + 1);
        values_.reserve(values);
    }

    /// Flat values buffer shared by all rows.
    [[nodiscard]] auto values() const noexcept -> std::span<const T> { return values_; }

    [[nodiscard]] auto offsets() const noexcept -> std::span<const size_type> { return offsets_; }

    [[nodiscard]] auto validity() const noexcept -> const std::optional<std::vector<bool>>& {
        return validity_;
    }

   private:
    std::vector<T> values_;
    std::vector<size_type> offsets_;
    std::optional<std::vector<bool>> validity_;
};

}  // namespace kdeflow
