#include <gtest/gtest.h>

#include <cstdint>
#include <numeric>
#include <vector>

#include "ndcopy/copy.hpp"
#include "ndcopy/core/errors.hpp"

using namespace ndcopy;

template<typename T>
static std::vector<T> iota_buffer(size_t n) {
    std::vector<T> result(n);
    std::iota(result.begin(), result.end(), T {1});
    return result;
}

// Copies one element at a time. Used as the ground truth for the row-based copies.
template<typename T>
static void copy_elementwise(
    const RuntimeIndex& extent,
    const T* src,
    const RuntimeShape& src_shape,
    const RuntimeIndex& src_min,
    T* dst,
    const RuntimeShape& dst_shape,
    const RuntimeIndex& dst_min) {
    RuntimeShape region = extent;

    for (size_t i = 0; i < region.total_size(); i++) {
        RuntimeIndex offset = region.delinearize(i);
        RuntimeIndex src_index = src_min;
        RuntimeIndex dst_index = dst_min;

        for (size_t axis = 0; axis < offset.size(); axis++) {
            src_index[axis] += offset[axis];
            dst_index[axis] += offset[axis];
        }

        dst[dst_shape.linearize(dst_index)] = src[src_shape.linearize(src_index)];
    }
}

TEST(Copy, identity) {
    using S = StaticShape<3, 4, 5>;
    auto src = iota_buffer<int>(S::total_size());
    std::vector<int> dst(S::total_size(), -1);

    copy3(S::sizes(), src.data(), S {}, Index(0, 0, 0), dst.data(), S {}, Index(0, 0, 0));

    ASSERT_EQ(dst, src);
}

TEST(Copy, identity_dynamic) {
    DynamicShape<2> shape = {13, 17};
    auto src = iota_buffer<double>(shape.total_size());
    std::vector<double> dst(shape.total_size(), 0.0);

    copy2(shape.sizes(), src.data(), shape, Index(0, 0), dst.data(), shape, Index(0, 0));

    ASSERT_EQ(dst, src);
}

TEST(Copy, subregion_2d) {
    StaticShape<10, 11> src_shape;
    StaticShape<11, 12> dst_shape;
    auto src = iota_buffer<uint16_t>(src_shape.total_size());
    std::vector<uint16_t> dst(dst_shape.total_size(), 0);

    copy2(Size(2, 3), src.data(), src_shape, Index(3, 4), dst.data(), dst_shape, Index(4, 5));

    for (size_t i = 0; i < 11; i++) {
        for (size_t j = 0; j < 12; j++) {
            uint16_t expected = 0;

            if (i >= 4 && i < 6 && j >= 5 && j < 8) {
                expected = src[src_shape.linearize(Index(i - 4 + 3, j - 5 + 4))];
            }

            ASSERT_EQ(dst[dst_shape.linearize(Index(i, j))], expected) << "at " << Index(i, j);
        }
    }
}

TEST(Copy, subregion_3d_into_smaller_array) {
    using SrcShape = StaticShape<100, 100, 100>;
    using DstShape = StaticShape<50, 50, 50>;

    std::vector<uint8_t> src(SrcShape::total_size());
    for (size_t i = 0; i < src.size(); i++) {
        src[i] = static_cast<uint8_t>(i % 251);
    }

    std::vector<uint8_t> dst(DstShape::total_size(), 0);
    auto extent = Size(20, 20, 20);
    auto src_min = Index(1, 2, 3);
    auto dst_min = Index(2, 3, 4);

    copy3(extent, src.data(), SrcShape {}, src_min, dst.data(), DstShape {}, dst_min);

    size_t cells_written = 0;

    for (size_t offset = 0; offset < dst.size(); offset++) {
        auto p = DstShape::delinearize(offset);
        bool inside = true;

        for (size_t axis = 0; axis < 3; axis++) {
            inside &= p[axis] >= dst_min[axis] && p[axis] < dst_min[axis] + extent[axis];
        }

        if (inside) {
            auto q = p - dst_min + src_min;
            ASSERT_EQ(dst[offset], src[SrcShape::linearize(q)]) << "at " << p;
            cells_written++;
        } else {
            ASSERT_EQ(dst[offset], 0) << "at " << p;
        }
    }

    ASSERT_EQ(cells_written, 8000);
}

TEST(Copy, one_and_four_axes) {
    auto src1 = iota_buffer<int64_t>(10);
    std::vector<int64_t> dst1(6, 0);

    DynamicShape<1> shape1 = {6};
    copy1(Size(4), src1.data(), StaticShape<10> {}, Index(5), dst1.data(), shape1, Index(1));

    ASSERT_EQ(dst1, (std::vector<int64_t> {0, 6, 7, 8, 9, 0}));

    DynamicShape<4> shape4 = {3, 4, 5, 6};
    auto src4 = iota_buffer<int>(shape4.total_size());
    std::vector<int> dst4(shape4.total_size(), 0);
    std::vector<int> expected4(shape4.total_size(), 0);

    copy4(
        Size(2, 2, 3, 4),
        src4.data(),
        shape4,
        Index(1, 2, 2, 1),
        dst4.data(),
        shape4,
        Index(0, 1, 0, 2));
    copy_elementwise<int>(
        {2, 2, 3, 4},
        src4.data(),
        shape4,
        {1, 2, 2, 1},
        expected4.data(),
        shape4,
        {0, 1, 0, 2});

    ASSERT_EQ(dst4, expected4);
}

TEST(Copy, mixed_shape_kinds) {
    StaticShape<6, 7> src_shape;
    DynamicShape<2> dst_shape = {8, 9};
    auto src = iota_buffer<float>(src_shape.total_size());
    std::vector<float> dst(dst_shape.total_size(), 0.0F);
    std::vector<float> expected(dst_shape.total_size(), 0.0F);

    copy2(Size(5, 6), src.data(), src_shape, Index(1, 0), dst.data(), dst_shape, Index(3, 2));
    copy_elementwise<float>(
        {5, 6},
        src.data(),
        src_shape,
        {1, 0},
        expected.data(),
        dst_shape,
        {3, 2});

    ASSERT_EQ(dst, expected);

    std::vector<float> dst_u32(dst_shape.total_size(), 0.0F);
    copy2(
        Size(5, 6),
        src.data(),
        src_shape,
        Index(1, 0),
        dst_u32.data(),
        StaticShapeU32<8, 9> {},
        Index(3, 2));

    ASSERT_EQ(dst_u32, expected);
}

TEST(Copy, unchecked_matches_checked) {
    StaticShape<9, 9, 9> shape;
    auto src = iota_buffer<int>(shape.total_size());
    std::vector<int> checked(shape.total_size(), 0);
    std::vector<int> unchecked(shape.total_size(), 0);

    auto extent = Size(4, 5, 6);
    auto src_min = Index(5, 4, 3);
    auto dst_min = Index(0, 1, 2);

    copy3(extent, src.data(), shape, src_min, checked.data(), shape, dst_min);
    copy3_unchecked(extent, src.data(), shape, src_min, unchecked.data(), shape, dst_min);

    ASSERT_EQ(checked, unchecked);
}

TEST(Copy, number_of_rows) {
    // Both paths issue one row per combination of the outer coordinates, never more.
    auto count_rows = [](const RuntimeIndex& extent, const RuntimeShape& shape) {
        RuntimeIndex zero(extent.size(), 0);
        return CopyDef::from_shapes(1, extent, shape, zero, shape, zero).number_of_rows();
    };

    ASSERT_EQ(count_rows({20, 20, 20}, StaticShape<100, 100, 100> {}), 400);
    ASSERT_EQ(count_rows({7}, StaticShape<100> {}), 1);
    ASSERT_EQ(count_rows({3, 7}, StaticShape<10, 10> {}), 3);
    ASSERT_EQ(count_rows({2, 3, 4, 5}, StaticShape<5, 5, 5, 5> {}), 24);
    ASSERT_EQ(count_rows({2, 3, 4, 5, 6}, RuntimeShape {6, 6, 6, 6, 6}), 120);
    ASSERT_EQ(count_rows({1, 1, 1}, StaticShape<4, 4, 4> {}), 1);
    ASSERT_EQ(count_rows({0, 4, 4}, StaticShape<4, 4, 4> {}), 0);

    size_t rows = 0;
    for_each_row(Size(20, 20, 20), [&](const Index<3>&) { rows++; });
    ASSERT_EQ(rows, 400);
}

template<size_t N, typename CopyFun>
static void check_runtime_path_agrees(
    const Size<N>& src_sizes,
    const Size<N>& dst_sizes,
    const Size<N>& extent,
    const Index<N>& src_min,
    const Index<N>& dst_min,
    CopyFun copy_fixed) {
    DynamicShape<N> src_shape = src_sizes;
    DynamicShape<N> dst_shape = dst_sizes;

    auto src = iota_buffer<int32_t>(src_shape.total_size());
    std::vector<int32_t> fixed_dst(dst_shape.total_size(), -1);
    std::vector<int32_t> runtime_dst(dst_shape.total_size(), -1);
    std::vector<int32_t> expected(dst_shape.total_size(), -1);

    copy_fixed(extent, src.data(), src_shape, src_min, fixed_dst.data(), dst_shape, dst_min);

    ndcopy::copy_n(
        to_runtime_index(extent),
        src.data(),
        src_shape,
        to_runtime_index(src_min),
        runtime_dst.data(),
        dst_shape,
        to_runtime_index(dst_min));

    copy_elementwise(
        to_runtime_index(extent),
        src.data(),
        src_shape,
        to_runtime_index(src_min),
        expected.data(),
        dst_shape,
        to_runtime_index(dst_min));

    ASSERT_EQ(fixed_dst, expected);
    ASSERT_EQ(runtime_dst, expected);
}

TEST(Copy, fixed_and_runtime_rank_agree) {
    check_runtime_path_agrees<1>(
        Size(31), Size(17), Size(9), Index(20), Index(8),
        [](auto&&... args) { copy1(args...); });

    check_runtime_path_agrees<2>(
        Size(12, 15), Size(9, 20), Size(5, 11), Index(7, 2), Index(1, 9),
        [](auto&&... args) { copy2(args...); });

    check_runtime_path_agrees<3>(
        Size(8, 9, 10), Size(10, 7, 12), Size(4, 6, 5), Index(3, 1, 5), Index(6, 0, 2),
        [](auto&&... args) { copy3(args...); });

    check_runtime_path_agrees<4>(
        Size(5, 6, 4, 7), Size(6, 4, 5, 8), Size(3, 2, 4, 6), Index(2, 3, 0, 1), Index(0, 2, 1, 2),
        [](auto&&... args) { copy4(args...); });
}

TEST(Copy, runtime_rank_beyond_four) {
    RuntimeShape src_shape = {3, 4, 3, 4, 5, 6};
    RuntimeShape dst_shape = {4, 3, 4, 3, 6, 5};
    RuntimeIndex extent = {2, 3, 2, 3, 4, 5};

    auto src = iota_buffer<uint32_t>(src_shape.total_size());
    std::vector<uint32_t> dst(dst_shape.total_size(), 0);
    std::vector<uint32_t> expected(dst_shape.total_size(), 0);

    RuntimeIndex src_min = {1, 1, 0, 1, 1, 0};
    RuntimeIndex dst_min = {2, 0, 1, 0, 0, 0};

    ndcopy::copy_n(extent, src.data(), src_shape, src_min, dst.data(), dst_shape, dst_min);
    copy_elementwise(extent, src.data(), src_shape, src_min, expected.data(), dst_shape, dst_min);

    ASSERT_EQ(dst, expected);
}

TEST(Copy, empty_extent_is_noop) {
    StaticShape<10, 10, 10> shape;
    auto src = iota_buffer<int>(shape.total_size());
    std::vector<int> dst(shape.total_size(), -1);
    auto before = dst;

    copy3(Size(0, 5, 5), src.data(), shape, Index(0, 0, 0), dst.data(), shape, Index(0, 0, 0));
    copy3(Size(5, 5, 0), src.data(), shape, Index(0, 0, 0), dst.data(), shape, Index(0, 0, 0));

    // The minimum corners of an empty region are not checked.
    copy3(Size(5, 0, 5), src.data(), shape, Index(100, 100, 0), dst.data(), shape, Index(50, 9, 9));
    ndcopy::copy_n({5, 5, 0}, src.data(), shape, {100, 0, 0}, dst.data(), shape, {0, 0, 100});

    ASSERT_EQ(dst, before);
}

TEST(Copy, out_of_bounds_source) {
    using SrcShape = StaticShape<100, 100, 100>;
    using DstShape = StaticShape<50, 50, 50>;

    SrcShape s;
    DstShape d;
    auto extent = Size(20, 20, 20);

    std::vector<uint8_t> src(s.total_size(), 7);
    std::vector<uint8_t> dst(d.total_size(), 0);
    auto before = dst;

    ASSERT_THROW(
        copy3(extent, src.data(), s, Index(81, 0, 0), dst.data(), d, Index(0, 0, 0)),
        BoundsViolation);
    ASSERT_EQ(dst, before);

    try {
        copy3(extent, src.data(), s, Index(0, 0, 90), dst.data(), d, Index(0, 0, 0));
        FAIL() << "expected BoundsViolation";
    } catch (const BoundsViolation& e) {
        ASSERT_EQ(e.axis(), 2);
    }

    ASSERT_EQ(dst, before);
}

TEST(Copy, out_of_bounds_destination) {
    using SrcShape = StaticShape<100, 100, 100>;
    using DstShape = StaticShape<50, 50, 50>;

    SrcShape s;
    DstShape d;
    auto extent = Size(20, 20, 20);

    std::vector<uint8_t> src(s.total_size(), 7);
    std::vector<uint8_t> dst(d.total_size(), 0);
    auto before = dst;

    // The first rows would fit; nothing may be written before the violation is detected.
    try {
        copy3(extent, src.data(), s, Index(0, 0, 0), dst.data(), d, Index(0, 31, 0));
        FAIL() << "expected BoundsViolation";
    } catch (const BoundsViolation& e) {
        ASSERT_EQ(e.axis(), 1);
    }

    ASSERT_EQ(dst, before);

    ASSERT_THROW(
        ndcopy::copy_n({20, 20, 20}, src.data(), s, {0, 0, 0}, dst.data(), d, {0, 0, 31}),
        BoundsViolation);
    ASSERT_EQ(dst, before);

    // Exactly touching the upper bound is allowed.
    ASSERT_NO_THROW(
        copy3(extent, src.data(), s, Index(80, 80, 80), dst.data(), d, Index(30, 30, 30)));
}

TEST(Copy, dimension_mismatch) {
    StaticShape<4, 4, 4> shape;
    StaticShape<16, 4> flat;
    std::vector<int> src(shape.total_size(), 1);
    std::vector<int> dst(shape.total_size(), 0);

    ASSERT_THROW(
        ndcopy::copy_n({2, 2}, src.data(), shape, {0, 0}, dst.data(), shape, {0, 0}),
        DimensionMismatch);
    ASSERT_THROW(
        ndcopy::copy_n({2, 2, 2}, src.data(), shape, {0, 0}, dst.data(), shape, {0, 0, 0}),
        DimensionMismatch);
    ASSERT_THROW(
        ndcopy::copy_n({2, 2, 2}, src.data(), shape, {0, 0, 0}, dst.data(), flat, {0, 0, 0}),
        DimensionMismatch);

    try {
        ndcopy::copy_n({2, 2}, src.data(), shape, {0, 0}, dst.data(), shape, {0, 0});
        FAIL() << "expected DimensionMismatch";
    } catch (const DimensionMismatch& e) {
        ASSERT_EQ(e.expected(), 2);
        ASSERT_EQ(e.actual(), 3);
    }

    ASSERT_EQ(dst, std::vector<int>(shape.total_size(), 0));
}
