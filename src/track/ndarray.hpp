#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "core/errors.hpp"

namespace genotrack {

// Validate a requested shape and return its element count.
// Throws InvalidArgumentError on a negative extent or size_t overflow.
size_t checked_element_count(const std::vector<int64_t>& shape);

// Element count of an unsigned shape; throws InvalidArgumentError if the
// product overflows size_t.
size_t checked_product(const std::vector<size_t>& shape);

// "(3, 2)" style rendering for error messages.
std::string shape_to_string(const std::vector<size_t>& shape);

// Dense row-major array. A shape of {} is a 0-d array holding one element.
template <typename T>
class NdArray {
public:
    using value_type = T;

    NdArray() = default;

    // Throws InvalidArgumentError if values.size() does not match shape.
    NdArray(std::vector<size_t> shape, std::vector<T> values)
        : shape_(std::move(shape)), values_(std::move(values)) {
        size_t n = checked_product(shape_);
        if (n != values_.size()) {
            throw InvalidArgumentError("array of " + std::to_string(values_.size())
                                       + " values does not fit shape "
                                       + shape_to_string(shape_));
        }
    }

    // rows x cols array from nested rows; all rows must have equal length.
    static NdArray from_rows(const std::vector<std::vector<T>>& rows) {
        size_t cols = rows.empty() ? 0 : rows[0].size();
        std::vector<T> values;
        values.reserve(rows.size() * cols);
        for (const auto& row : rows) {
            if (row.size() != cols) {
                throw InvalidArgumentError("ragged rows: expected "
                                           + std::to_string(cols) + " columns, got "
                                           + std::to_string(row.size()));
            }
            values.insert(values.end(), row.begin(), row.end());
        }
        return NdArray({rows.size(), cols}, std::move(values));
    }

    const std::vector<size_t>& shape() const { return shape_; }
    size_t ndim() const { return shape_.size(); }
    size_t size() const { return values_.size(); }

    T* data() { return values_.data(); }
    const T* data() const { return values_.data(); }
    const std::vector<T>& values() const { return values_; }

    T& operator[](size_t i) { return values_[i]; }
    const T& operator[](size_t i) const { return values_[i]; }

    // 2-D element access (row-major).
    T& at(size_t row, size_t col) { return values_[row * shape_[1] + col]; }
    const T& at(size_t row, size_t col) const { return values_[row * shape_[1] + col]; }

    bool operator==(const NdArray& other) const {
        return shape_ == other.shape_ && values_ == other.values_;
    }
    bool operator!=(const NdArray& other) const { return !(*this == other); }

private:
    std::vector<size_t> shape_;
    std::vector<T> values_;
};

} // namespace genotrack
