// tests/test_broadcast.cpp
#include "test_framework.hpp"
#include <vector>

#include "pv/all.hpp"

using pv::NestedArray;
using pv::Shape;
using pv::Value;

TEST("broadcast/to_own_shape_is_identity") {
    auto a = pv::array({pv::array({1, 2}), pv::array({3, 4})});
    auto b = pv::broadcast(a, pv::shape(a));
    ASSERT_EQ(b, a);
    ASSERT_TRUE(b.identical(a));
}

TEST("broadcast/adds_leading_dimensions") {
    auto v = pv::array({1, 2});
    auto b = pv::broadcast(v, Shape{3, 2});
    ASSERT_TRUE(pv::shape(b) == (Shape{3, 2}));
    for (std::size_t i = 0; i < 3; ++i) {
        ASSERT_EQ(b[i], Value(v));
        // rows are replicated by reference
        ASSERT_TRUE(b[i].nested().identical(v));
    }
    auto c = pv::broadcast(v, Shape{2, 3, 2});
    ASSERT_TRUE(pv::shape(c) == (Shape{2, 3, 2}));
    ASSERT_NEAR(pv::element_sum(c), 18.0, 1e-12);
}

TEST("broadcast/scalars_broadcast_to_anything") {
    Value s = pv::broadcast(Value(7), Shape{2, 2});
    ASSERT_EQ(s, Value(pv::array({pv::array({7, 7}), pv::array({7, 7})})));
    ASSERT_EQ(pv::broadcast(Value(7), Shape{}), Value(7));
}

TEST("broadcast/incompatible_shapes_throw") {
    auto v = pv::array({1, 2, 3});
    ASSERT_THROWS_AS(pv::broadcast(v, Shape{3, 2}), pv::ShapeError);
    auto m = pv::array({pv::array({1, 2}), pv::array({3, 4})});
    ASSERT_THROWS_AS(pv::broadcast(m, Shape{2}), pv::ShapeError);
    ASSERT_EQ(v, pv::array({1, 2, 3}));
}

TEST("broadcast/like_and_coerce") {
    auto m = pv::array({pv::array({0, 0, 0}), pv::array({0, 0, 0})});
    Value like = pv::broadcast_like(Value(pv::array({1, 2, 3})), Value(m));
    ASSERT_TRUE(pv::shape(like) == (Shape{2, 3}));

    std::vector<double> row = {4, 5, 6};
    Value c = pv::broadcast_coerce(m, pv::coerce(row));
    ASSERT_EQ(c, Value(pv::array({pv::array({4, 5, 6}), pv::array({4, 5, 6})})));
}

TEST("broadcast/common_shape") {
    auto s = pv::common_shape({Shape{3}, Shape{2, 3}, Shape{}});
    ASSERT_TRUE(s.has_value());
    ASSERT_TRUE(*s == (Shape{2, 3}));
    ASSERT_FALSE(pv::common_shape({Shape{2}, Shape{2, 3}}).has_value());
    ASSERT_FALSE(pv::common_shape({}).has_value());
}

TEST("broadcast/compatible_pairs") {
    auto v = pv::array({1, 2});
    auto m = pv::array({pv::array({1, 2}), pv::array({3, 4})});
    auto p = pv::broadcast_compatible(Value(v), Value(m));
    ASSERT_TRUE(pv::shape(p.first) == (Shape{2, 2}));
    ASSERT_TRUE(p.second.identical(Value(m)));

    auto q = pv::broadcast_compatible(Value(m), Value(5));
    ASSERT_TRUE(pv::shape(q.second) == (Shape{2, 2}));

    ASSERT_THROWS_AS(pv::broadcast_compatible(Value(v), Value(pv::array({1, 2, 3}))), pv::ShapeError);
}

TEST("broadcast/same_shape_for_many") {
    auto out = pv::broadcast_same_shape({Value(1), Value(pv::array({1, 2})),
                                         Value(pv::array({pv::array({1, 2})}))});
    ASSERT_EQ(out.size(), 3u);
    for (const auto& x : out) ASSERT_TRUE(pv::shape(x) == (Shape{1, 2}));
    ASSERT_THROWS_AS(pv::broadcast_same_shape({Value(pv::array({1, 2})), Value(pv::array({1, 2, 3}))}),
                     pv::ShapeError);
}
