#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "common/array.hpp"
#include "test_util.hpp"

using namespace shardcat;
using shardcat::test::iota64;

namespace {

    SliceSpec slice(std::optional<int64_t> start, std::optional<int64_t> stop, std::optional<int64_t> step = std::nullopt) {
        SliceSpec s;
        s.start = start;
        s.stop = stop;
        s.step = step;
        return s;
    }

    std::vector<int64_t> sliced(int64_t n, const SliceSpec& s) {
        return array_to_vector<int64_t>(slice_rows(array_from_vector(iota64(n)), s));
    }

} // namespace

TEST(DTypeTest, NumpyStrings) {
    EXPECT_EQ(dtype_str(DType::Float64), "<f8");
    EXPECT_EQ(dtype_str(DType::Bool), "|b1");
    EXPECT_EQ(dtype_from_str("<i4"), DType::Int32);
    EXPECT_EQ(dtype_from_str("<b1"), DType::Bool);
    EXPECT_EQ(dtype_from_str("=f4"), DType::Float32);
    EXPECT_EQ(dtype_from_str("|u1"), DType::UInt8);
    EXPECT_THROW(dtype_from_str("<U8"), std::runtime_error);
    EXPECT_EQ(dtype_size(DType::UInt16), 2u);
}

TEST(ArrayTest, ShapesAndFactories) {
    Array a = make_array(DType::Int32, get_shape(4, { 2, 3 }));
    EXPECT_EQ(a.n_rows(), 4);
    EXPECT_EQ(a.row_elems(), 6);
    EXPECT_EQ(a.bytes.size(), 4u * 6u * 4u);
    EXPECT_EQ(shape_str(a.shape), "(4, 2, 3)");
    EXPECT_EQ(shape_str({ 5 }), "(5,)");

    Array empty = make_array(DType::Float64, {});
    EXPECT_EQ(empty.shape, std::vector<int64_t>{ 0 });

    Array t = full_array(DType::Bool, { 3 }, 7.0);
    EXPECT_EQ(array_to_vector<uint8_t>(t), (std::vector<uint8_t>{ 1, 1, 1 }));
}

TEST(ArrayTest, PythonSliceSemantics) {
    EXPECT_EQ(sliced(10, slice(2, 5)), (std::vector<int64_t>{ 2, 3, 4 }));
    EXPECT_EQ(sliced(10, slice(-3, std::nullopt)), (std::vector<int64_t>{ 7, 8, 9 }));
    EXPECT_EQ(sliced(10, slice(2, 100, 3)), (std::vector<int64_t>{ 2, 5, 8 }));
    EXPECT_EQ(sliced(10, slice(std::nullopt, std::nullopt, -3)), (std::vector<int64_t>{ 9, 6, 3, 0 }));
    EXPECT_EQ(sliced(5, slice(std::nullopt, std::nullopt, -1)), (std::vector<int64_t>{ 4, 3, 2, 1, 0 }));
    EXPECT_EQ(sliced(10, slice(-100, 2)), (std::vector<int64_t>{ 0, 1 }));
    EXPECT_TRUE(sliced(10, slice(5, 2)).empty());
    EXPECT_TRUE(sliced(0, slice(0, 3)).empty());
    EXPECT_THROW(sliced(3, slice(0, 3, 0)), std::runtime_error);

    ResolvedSlice r = resolve_slice(slice(8, 1, -2), 10);
    EXPECT_EQ(r.start, 8);
    EXPECT_EQ(r.count, 4);
}

TEST(ArrayTest, TakeAndMask) {
    Array a = array_from_vector(iota64(5, 10));
    EXPECT_EQ(array_to_vector<int64_t>(take_rows(a, { 4, 0, -1 })), (std::vector<int64_t>{ 14, 10, 14 }));
    EXPECT_THROW(take_rows(a, { 5 }), std::out_of_range);
    EXPECT_EQ(array_to_vector<int64_t>(mask_rows(a, { 1, 0, 1, 0, 0 })), (std::vector<int64_t>{ 10, 12 }));
    EXPECT_THROW(mask_rows(a, { 1, 0 }), std::runtime_error);
}

TEST(ArrayTest, ConcatKeepsItemShape) {
    Array a = array_from_vector(std::vector<double>{ 1, 2, 3, 4 }, { 2 });
    Array b = array_from_vector(std::vector<double>{ 5, 6 }, { 2 });
    Array c = concat_rows({ a, b });
    EXPECT_EQ(c.shape, (std::vector<int64_t>{ 3, 2 }));
    EXPECT_EQ(array_to_vector<double>(c), (std::vector<double>{ 1, 2, 3, 4, 5, 6 }));

    Array flat = array_from_vector(std::vector<double>{ 1, 2 });
    EXPECT_THROW(concat_rows({ a, flat }), std::runtime_error);
    EXPECT_THROW(concat_rows({ a, cast(b, DType::Float32) }), std::runtime_error);
}

TEST(ArrayTest, StackPromotesMixedTypes) {
    Array i = array_from_vector(std::vector<int64_t>{ 1, 2 });
    Array f = array_from_vector(std::vector<double>{ 0.5, 1.5 });
    Array s = stack({ i, f });
    EXPECT_EQ(s.dtype, DType::Float64);
    EXPECT_EQ(s.shape, (std::vector<int64_t>{ 2, 2 }));
    EXPECT_EQ(array_to_vector<double>(s), (std::vector<double>{ 1, 2, 0.5, 1.5 }));
}

TEST(ArrayTest, EqualityTreatsNanAsUnequal) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    Array a = array_from_vector(std::vector<double>{ 1, nan });
    EXPECT_FALSE(array_equal(a, a));
    Array b = array_from_vector(std::vector<double>{ 1, 2 });
    EXPECT_TRUE(array_equal(b, array_from_vector(std::vector<double>{ 1, 2 })));
    EXPECT_TRUE(array_equal(b, array_from_vector(std::vector<int64_t>{ 1, 2 })));
    EXPECT_FALSE(array_equal(b, array_from_vector(std::vector<double>{ 1, 2 }, { 2 })));
}

TEST(ArrayTest, CastToBool) {
    Array a = array_from_vector(std::vector<double>{ 0.0, -2.5, 3.0 });
    Array b = cast(a, DType::Bool);
    EXPECT_EQ(b.dtype, DType::Bool);
    EXPECT_EQ(array_to_vector<uint8_t>(b), (std::vector<uint8_t>{ 0, 1, 1 }));
    EXPECT_DOUBLE_EQ(element_as_double(a, 1), -2.5);
}
