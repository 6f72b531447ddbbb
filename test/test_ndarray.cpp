#include "test_util.hpp"
#include "track/ndarray.hpp"
#include "core/errors.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace genotrack;

static void test_element_count() {
    std::fprintf(stderr, "-- test_element_count\n");

    CHECK_EQ(checked_element_count({}), 1u);
    CHECK_EQ(checked_element_count({3}), 3u);
    CHECK_EQ(checked_element_count({2, 3, 4}), 24u);
    CHECK_EQ(checked_element_count({5, 0}), 0u);

    CHECK_THROWS(checked_element_count({-1}), InvalidArgumentError);
    CHECK_THROWS(checked_element_count({4, -2}), InvalidArgumentError);

    int64_t big = std::numeric_limits<int64_t>::max();
    CHECK_THROWS(checked_element_count({big, big}), InvalidArgumentError);
}

static void test_shape_to_string() {
    std::fprintf(stderr, "-- test_shape_to_string\n");

    CHECK_STR_EQ(shape_to_string({}), "()");
    CHECK_STR_EQ(shape_to_string({3}), "(3,)");
    CHECK_STR_EQ(shape_to_string({2, 5}), "(2, 5)");
}

static void test_from_rows() {
    std::fprintf(stderr, "-- test_from_rows\n");

    auto a = NdArray<int>::from_rows({{1, 2, 3}, {4, 5, 6}});
    CHECK_EQ(a.ndim(), 2u);
    CHECK_EQ(a.shape()[0], 2u);
    CHECK_EQ(a.shape()[1], 3u);
    CHECK_EQ(a.size(), 6u);
    CHECK_EQ(a.at(1, 0), 4);
    CHECK_EQ(a[2], 3);

    a.at(0, 1) = 9;
    CHECK_EQ(a[1], 9);

    CHECK_THROWS(NdArray<int>::from_rows({{1, 2}, {3}}), InvalidArgumentError);
}

static void test_shape_mismatch() {
    std::fprintf(stderr, "-- test_shape_mismatch\n");

    CHECK_THROWS(NdArray<double>({2, 2}, {1.0, 2.0, 3.0}), InvalidArgumentError);

    NdArray<double> scalar({}, {2.5});
    CHECK_EQ(scalar.ndim(), 0u);
    CHECK_EQ(scalar.size(), 1u);
}

static void test_constructor_overflow() {
    std::fprintf(stderr, "-- test_constructor_overflow\n");

    // 2^63 * 2 wraps to 0 in size_t; must not be taken as an empty array
    size_t half = size_t(1) << (std::numeric_limits<size_t>::digits - 1);
    CHECK_THROWS(NdArray<int>({half, 2}, {}), InvalidArgumentError);
    CHECK_THROWS(checked_product({half, 2}), InvalidArgumentError);
    CHECK_EQ(checked_product({half, 1}), half);
    CHECK_EQ(checked_product({half, 0}), 0u);
    CHECK_EQ(checked_product({}), 1u);
}

static void test_equality() {
    std::fprintf(stderr, "-- test_equality\n");

    NdArray<int> a({2, 2}, {1, 2, 3, 4});
    NdArray<int> b({4}, {1, 2, 3, 4});
    NdArray<int> c({2, 2}, {1, 2, 3, 4});
    CHECK(a == c);
    CHECK(a != b);
}

int main() {
    test_element_count();
    test_shape_to_string();
    test_from_rows();
    test_shape_mismatch();
    test_constructor_overflow();
    test_equality();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
