// tests/test_validate.cpp
#include "test_framework.hpp"
#include "dense_array.hpp"

#include "pv/all.hpp"

using pv::Shape;
using pv::Value;
using testing_support::DenseArray;

TEST("validate/canonical_arrays") {
    ASSERT_TRUE(pv::is_canonical(Value(1.0)));
    ASSERT_TRUE(pv::is_canonical(Value(pv::array({1, 2, 3}))));
    ASSERT_TRUE(pv::is_canonical(Value(pv::array({pv::array({1, 2}), pv::array({3, 4})}))));
    ASSERT_TRUE(pv::is_canonical(Value(pv::NestedArray())));
}

TEST("validate/ragged_and_foreign_are_not_canonical") {
    auto ragged = pv::array({pv::array({1, 2}), pv::array({3})});
    ASSERT_FALSE(pv::is_canonical(Value(ragged)));
    auto mixed = pv::array({pv::array({1, 2}), 3});
    ASSERT_FALSE(pv::is_canonical(Value(mixed)));
    auto deep = pv::array({1, pv::array({2})});
    ASSERT_FALSE(pv::is_canonical(Value(deep)));
    auto with_foreign = pv::array({Value(DenseArray::make({2}, {1, 2}))});
    ASSERT_FALSE(pv::is_canonical(Value(with_foreign)));
}

TEST("validate/validate_shape_returns_shape") {
    auto a = pv::array({pv::array({1, 2, 3}), pv::array({4, 5, 6})});
    ASSERT_TRUE(pv::validate_shape(a) == (Shape{2, 3}));
    ASSERT_TRUE(pv::same_shapes(a));
    ASSERT_TRUE(pv::validate_shape(pv::NestedArray()) == (Shape{0}));
    ASSERT_TRUE(pv::validate_shape(Value(4.0)).empty());
}

TEST("validate/validate_shape_rejects_inconsistent_levels") {
    auto ragged = pv::array({pv::array({1, 2}), pv::array({3})});
    ASSERT_FALSE(pv::same_shapes(ragged));
    ASSERT_THROWS_AS(pv::validate_shape(ragged), pv::ValidationError);

    // raggedness two levels down
    auto deep = pv::array({
        pv::array({pv::array({1, 2}), pv::array({3, 4})}),
        pv::array({pv::array({5, 6}), pv::array({7})}),
    });
    ASSERT_THROWS_AS(pv::validate_shape(Value(deep)), pv::ValidationError);
}

TEST("validate/foreign_leaves_use_their_own_shape") {
    auto ok = pv::array({Value(DenseArray::make({2}, {1, 2})), pv::array({3, 4})});
    ASSERT_TRUE(pv::validate_shape(ok) == (Shape{2, 2}));
    auto bad = pv::array({Value(DenseArray::make({3}, {1, 2, 3})), pv::array({3, 4})});
    ASSERT_THROWS_AS(pv::validate_shape(bad), pv::ValidationError);
}
