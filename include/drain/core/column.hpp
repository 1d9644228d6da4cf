#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace drain {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// Element types that support arithmetic aggregates (sum, mean).
template <typename T>
concept NumericElement = std::same_as<T, std::int64_t> || std::same_as<T, double>;

/// A typed, owning columnar storage container.
///
/// Column<T> owns a contiguous vector of homogeneously typed values.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;

    static_assert(ColumnElement<T>,
                  "Column<T> requires T to satisfy ColumnElement (regular + totally ordered).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {}

    Column(std::initializer_list<T> init) : data_(init) {}

    /// Column of `count` copies of `value`.
    [[nodiscard]] static auto filled(size_type count, const T& value) -> Column<T> {
        return Column<T>{std::vector<T>(count, value)};
    }

    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const T& { return data_[idx]; }

    void push_back(const T& value) { data_.push_back(value); }
    void push_back(T&& value) { data_.push_back(std::move(value)); }

    /// Append every element of `other`.
    void append(const Column<T>& other) {
        data_.insert(data_.end(), other.data_.begin(), other.data_.end());
    }

    void reserve(size_type capacity) { data_.reserve(capacity); }

    /// Gather the elements at `rows` into a new column.
    [[nodiscard]] auto take(std::span<const std::size_t> rows) const -> Column<T> {
        std::vector<T> out;
        out.reserve(rows.size());
        for (auto row : rows) {
            out.push_back(data_[row]);
        }
        return Column<T>{std::move(out)};
    }

    [[nodiscard]] auto operator==(const Column<T>& other) const -> bool = default;

    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

   private:
    std::vector<T> data_;
};

}  // namespace drain
