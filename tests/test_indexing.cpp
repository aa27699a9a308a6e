// tests/test_indexing.cpp
#include "test_framework.hpp"
#include "dense_array.hpp"
#include <vector>

#include "pv/all.hpp"

using pv::Index;
using pv::NestedArray;
using pv::Value;
using testing_support::DenseArray;

static NestedArray cube() {
    // 2 x 3 x 2, leaf = 100*i + 10*j + k
    return pv::construct_from_generator({2, 3, 2}, [](const Index& at) {
        return Value(double(100 * at[0] + 10 * at[1] + at[2]));
    }).nested();
}

TEST("indexing/get_1d_2d_nd") {
    auto v = pv::array({5, 6, 7});
    ASSERT_EQ(pv::get_1d(v, 2), Value(7));
    auto m = pv::array({pv::array({1, 2}), pv::array({3, 4})});
    ASSERT_EQ(pv::get_2d(m, 1, 0), Value(3));
    auto c = cube();
    ASSERT_EQ(pv::get_nd(c, Index{1, 2, 1}), Value(121));
    ASSERT_EQ(pv::get_nd(c, Index{1, 2}), Value(pv::array({120, 121})));
    ASSERT_TRUE(pv::get_nd(c, Index{}).nested().identical(c));
}

TEST("indexing/out_of_range_reads_throw") {
    auto m = pv::array({pv::array({1, 2}), pv::array({3, 4})});
    ASSERT_THROWS_AS(pv::get_1d(m, 2), pv::IndexError);
    ASSERT_THROWS_AS(pv::get_2d(m, 0, 5), pv::IndexError);
    ASSERT_THROWS_AS(pv::get_nd(m, Index{0, 0, 0}), pv::IndexError);
}

TEST("indexing/set_then_get_round_trip") {
    auto c = cube();
    const std::vector<Index> coords = {{0, 0, 0}, {1, 2, 1}, {0, 1, 1}, {1, 0, 0}};
    for (const auto& idx : coords) {
        auto updated = pv::set_nd(c, idx, Value(-1));
        ASSERT_EQ(pv::get_nd(updated, idx), Value(-1));
        // every other coordinate is unchanged
        for (std::size_t i = 0; i < 2; ++i)
            for (std::size_t j = 0; j < 3; ++j)
                for (std::size_t k = 0; k < 2; ++k) {
                    const Index other{i, j, k};
                    if (other == idx) continue;
                    ASSERT_EQ(pv::get_nd(updated, other), pv::get_nd(c, other));
                }
    }
}

TEST("indexing/set_leaves_original_untouched_and_shares_rest") {
    auto m = pv::array({pv::array({1, 2}), pv::array({3, 4}), pv::array({5, 6})});
    auto m2 = pv::set_2d(m, 0, 1, Value(20));
    ASSERT_EQ(pv::get_2d(m, 0, 1), Value(2));
    ASSERT_EQ(pv::get_2d(m2, 0, 1), Value(20));
    ASSERT_TRUE(m2[1].nested().identical(m[1].nested()));
    ASSERT_TRUE(m2[2].nested().identical(m[2].nested()));
    ASSERT_FALSE(m2[0].nested().identical(m[0].nested()));

    auto v = pv::set_1d(pv::array({1, 2, 3}), 1, Value(9));
    ASSERT_EQ(v, pv::array({1, 9, 3}));
    ASSERT_THROWS_AS(pv::set_1d(v, 3, Value(0)), pv::IndexError);
}

TEST("indexing/set_nd_requires_indices") {
    auto m = pv::array({pv::array({1, 2})});
    ASSERT_THROWS_AS(pv::set_nd(m, Index{}, Value(0)), pv::UpdateError);
    ASSERT_THROWS_AS(pv::set_nd(m, Index{0, 0, 0}, Value(0)), pv::IndexError);
}

TEST("indexing/set_into_mutable_foreign_leaf_mutates_it") {
    auto d = DenseArray::make({3}, {1, 2, 3});
    auto a = pv::array({Value(d), pv::array({4, 5, 6})});
    auto b = pv::set_nd(a, Index{0, 1}, Value(42));
    ASSERT_NEAR(d->data()[1], 42.0, 0.0);
    // the leaf is kept, so the old version sees the change too
    ASSERT_TRUE(b[0].identical(a[0]));
    ASSERT_EQ(pv::get_nd(a, Index{0, 1}), Value(42));
}

TEST("indexing/set_into_immutable_foreign_leaf_converts_it") {
    auto d = DenseArray::make({3}, {1, 2, 3}, /*writable=*/false);
    auto a = pv::array({Value(d)});
    auto b = pv::set_nd(a, Index{0, 2}, Value(30));
    ASSERT_TRUE(b[0].is_nested());
    ASSERT_EQ(b, pv::array({pv::array({1, 2, 30})}));
    ASSERT_NEAR(d->data()[2], 3.0, 0.0);
}

TEST("indexing/reads_delegate_to_foreign_leaves") {
    auto a = pv::array({Value(DenseArray::make({2, 2}, {1, 2, 3, 4}))});
    ASSERT_EQ(pv::get_nd(a, Index{0, 1, 0}), Value(3));
    auto zero_d = pv::array({Value(DenseArray::make({}, {8}))});
    ASSERT_EQ(pv::get_1d(zero_d, 0), Value(8));
    ASSERT_FALSE(pv::is_mutable(a));
}
