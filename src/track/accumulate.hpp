#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "track/ndarray.hpp"

namespace genotrack {

enum class Reduction { kMin, kMax };

const char* reduction_name(Reduction op);

// True if scalar converts to T without changing its value.
template <typename T, typename S>
bool representable_as(S scalar) {
    if constexpr (std::is_floating_point_v<T>) {
        return true;
    } else if constexpr (std::is_floating_point_v<S>) {
        if (!std::isfinite(scalar)) return false;
        if (static_cast<long double>(scalar) <
                static_cast<long double>(std::numeric_limits<T>::lowest()) ||
            static_cast<long double>(scalar) >
                static_cast<long double>(std::numeric_limits<T>::max()))
            return false;
        return static_cast<S>(static_cast<T>(scalar)) == scalar;
    } else {
        T t = static_cast<T>(scalar);
        return static_cast<S>(t) == scalar && ((t < T{}) == (scalar < S{}));
    }
}

// New array of the given shape with every element equal to scalar,
// stored as T. Throws InvalidArgumentError on a bad shape or if scalar
// is not representable in T (e.g. 1.5 or NaN as an integer type).
template <typename T, typename S>
NdArray<T> fill_array_as(S scalar, const std::vector<int64_t>& shape) {
    static_assert(std::is_arithmetic_v<T> && std::is_arithmetic_v<S>,
                  "fill_array requires arithmetic types");

    size_t count = checked_element_count(shape);
    if (!representable_as<T>(scalar)) {
        throw InvalidArgumentError("fill value " + std::to_string(scalar)
                                   + " is not representable in the requested type");
    }

    std::vector<size_t> dims(shape.begin(), shape.end());
    return NdArray<T>(std::move(dims), std::vector<T>(count, static_cast<T>(scalar)));
}

// Element type is the scalar's own type: fill_array(7, {3}) is an
// NdArray<int>, fill_array(1.5, {2, 2}) an NdArray<double>.
template <typename S>
NdArray<S> fill_array(S scalar, const std::vector<int64_t>& shape) {
    return fill_array_as<S>(scalar, shape);
}

// Observation count (column count) of a 2-D track array, checked against
// the count already established for the session, if any.
template <typename T>
size_t init_num_obs(std::optional<size_t> num_obs, const NdArray<T>& continuous) {
    if (continuous.ndim() != 2) {
        throw InvalidArgumentError("expected a 2-D array, got shape "
                                   + shape_to_string(continuous.shape()));
    }

    size_t curr_num_obs = continuous.shape()[1];
    if (num_obs && *num_obs != curr_num_obs) {
        throw InconsistentShapeError("observation count " + std::to_string(curr_num_obs)
                                     + " does not match previous count "
                                     + std::to_string(*num_obs));
    }
    return curr_num_obs;
}

namespace detail {

// Keeps a parameter out of template argument deduction, so std::nullopt
// can be passed where an optional array is expected.
template <typename T>
struct nondeduced {
    using type = T;
};

// NaN is treated as missing: it loses against any real value.
template <typename T>
T combine(Reduction op, T a, T b) {
    if constexpr (std::is_floating_point_v<T>) {
        if (std::isnan(a)) return b;
        if (std::isnan(b)) return a;
    }
    if (op == Reduction::kMin) return b < a ? b : a;
    return a < b ? b : a;
}

} // namespace detail

// Reduce data along axis 0. The result has shape data.shape()[1:].
template <typename T>
NdArray<T> reduce_axis0(Reduction op, const NdArray<T>& data) {
    if (data.ndim() == 0 || data.shape()[0] == 0) {
        throw InvalidArgumentError(std::string("cannot take ") + reduction_name(op)
                                   + " of empty batch with shape "
                                   + shape_to_string(data.shape()));
    }

    size_t rows = data.shape()[0];
    size_t inner = data.size() / rows;
    std::vector<T> out(data.data(), data.data() + inner);
    for (size_t r = 1; r < rows; r++) {
        const T* row = data.data() + r * inner;
        for (size_t i = 0; i < inner; i++)
            out[i] = detail::combine(op, out[i], row[i]);
    }

    std::vector<size_t> dims(data.shape().begin() + 1, data.shape().end());
    return NdArray<T>(std::move(dims), std::move(out));
}

// Fold a new batch into a running extremum: reduce the batch along axis 0,
// then combine element-wise with the previous extremum if there is one.
template <typename T>
NdArray<T> new_extrema(
    Reduction op, const NdArray<T>& data,
    const typename detail::nondeduced<std::optional<NdArray<T>>>::type& extrema) {
    NdArray<T> curr = reduce_axis0(op, data);
    if (!extrema) return curr;

    if (extrema->shape() != curr.shape()) {
        throw InconsistentShapeError(std::string("running ") + reduction_name(op)
                                     + " has shape " + shape_to_string(extrema->shape())
                                     + " but batch reduces to "
                                     + shape_to_string(curr.shape()));
    }
    for (size_t i = 0; i < curr.size(); i++)
        curr[i] = detail::combine(op, (*extrema)[i], curr[i]);
    return curr;
}

// Running state of one accumulation session. Owned by the caller; add()
// leaves it untouched if any check fails.
template <typename T>
struct TrackAccumulator {
    std::optional<size_t> num_obs;
    std::optional<NdArray<T>> mins;
    std::optional<NdArray<T>> maxs;
    size_t num_batches = 0;
    size_t num_rows = 0;

    void add(const NdArray<T>& continuous) {
        size_t n = init_num_obs(num_obs, continuous);
        NdArray<T> new_mins = new_extrema(Reduction::kMin, continuous, mins);
        NdArray<T> new_maxs = new_extrema(Reduction::kMax, continuous, maxs);

        num_obs = n;
        mins = std::move(new_mins);
        maxs = std::move(new_maxs);
        num_batches++;
        num_rows += continuous.shape()[0];
    }
};

} // namespace genotrack
