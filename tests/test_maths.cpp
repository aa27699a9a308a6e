// tests/test_maths.cpp
#include "test_framework.hpp"
#include "dense_array.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

#include "pv/all.hpp"

using pv::NestedArray;
using pv::Value;
using testing_support::DenseArray;

static const double kPi = std::acos(-1.0);

TEST("maths/table_lists_every_function_once") {
    const auto& ops = pv::maths_ops();
    ASSERT_EQ(ops.size(), 21u);
    for (const auto& op : ops) {
        SCOPED_TRACE("op=" << op.name);
        ASSERT_TRUE(pv::find_maths_op(op.name) == &op);
    }
    ASSERT_TRUE(pv::find_maths_op("gamma") == nullptr);
}

TEST("maths/every_entry_maps_its_scalar_function") {
    auto a = pv::array({pv::array({0.25, 0.5})});
    for (const auto& op : pv::maths_ops()) {
        SCOPED_TRACE("op=" << op.name);
        auto r = pv::maths_function(op.name, a);
        ASSERT_TRUE(pv::shape(r) == pv::shape(a));
        ASSERT_NEAR(pv::get_2d(r, 0, 0).number(), op.fn(0.25), 1e-15);
        ASSERT_NEAR(pv::get_2d(r, 0, 1).number(), op.fn(0.5), 1e-15);
    }
}

TEST("maths/named_wrappers") {
    auto v = pv::array({-2.5, 0, 4});
    ASSERT_EQ(pv::absv(v), pv::array({2.5, 0, 4}));
    ASSERT_EQ(pv::signumv(v), pv::array({-1, 0, 1}));
    ASSERT_EQ(pv::floorv(v), pv::array({-3, 0, 4}));
    ASSERT_EQ(pv::ceilv(v), pv::array({-2, 0, 4}));
    ASSERT_EQ(pv::sqrtv(pv::array({4, 9})), pv::array({2, 3}));
    ASSERT_NEAR(pv::to_double(pv::expv(pv::array({1}))[0]), std::exp(1.0), 1e-15);
    ASSERT_NEAR(pv::to_double(pv::to_degreesv(pv::array({kPi}))[0]), 180.0, 1e-12);
    ASSERT_NEAR(pv::to_double(pv::to_radiansv(pv::array({90}))[0]), kPi / 2, 1e-12);
    ASSERT_NEAR(pv::to_double(pv::log10v(pv::array({1000}))[0]), 3.0, 1e-12);
}

TEST("maths/unknown_name_throws") {
    ASSERT_THROWS_AS(pv::maths_function("gamma", pv::array({1})), std::invalid_argument);
    ASSERT_THROWS_AS(pv::maths_function_inplace("gamma", pv::array({1})), std::invalid_argument);
}

TEST("maths/inplace_variant_writes_through_mutable_leaves") {
    auto d = DenseArray::make({2}, {1, 4});
    auto a = pv::array({Value(d), pv::array({9, 16})});
    auto r = pv::maths_function_inplace("sqrt", a);
    ASSERT_NEAR(d->data()[0], 1.0, 0.0);
    ASSERT_NEAR(d->data()[1], 2.0, 0.0);
    ASSERT_EQ(r, pv::array({pv::array({1, 2}), pv::array({3, 4})}));
    ASSERT_EQ(d->plain_maps(), 1);
    // nested rows are immutable: the input keeps its old values
    ASSERT_EQ(a[1], Value(pv::array({9, 16})));

    auto pure = pv::map_scalar_fn(+[](double x) { return x + 1; }, a);
    ASSERT_EQ(pure, pv::array({pv::array({2, 3}), pv::array({10, 17})}));
    ASSERT_NEAR(d->data()[1], 2.0, 0.0);
}
