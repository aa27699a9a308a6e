// tests/test_construct.cpp
#include "test_framework.hpp"
#include "dense_array.hpp"
#include <array>
#include <deque>
#include <list>
#include <set>
#include <string>
#include <vector>

#include "pv/all.hpp"

using pv::Index;
using pv::NestedArray;
using pv::Shape;
using pv::Value;
using testing_support::DenseArray;

TEST("construct/coerce_nested_std_vectors") {
    std::vector<std::vector<double>> rows = {{1,2},{3,4}};
    Value c = pv::coerce(rows);
    ASSERT_TRUE(c.is_nested());
    ASSERT_TRUE(pv::shape(c) == (Shape{2,2}));
    ASSERT_EQ(pv::get_2d(c.nested(), 1, 0), Value(3));
}

TEST("construct/coerce_is_idempotent") {
    std::vector<std::vector<int>> rows = {{1,2,3},{4,5,6}};
    Value once = pv::coerce(rows);
    Value twice = pv::coerce(once);
    ASSERT_EQ(once, twice);
    // canonical input comes back as the same storage
    ASSERT_TRUE(once.identical(twice));

    auto d = DenseArray::make({2,2}, {1,2,3,4});
    Value fa = pv::coerce(Value(d));
    ASSERT_EQ(pv::coerce(fa), fa);
    ASSERT_TRUE(pv::coerce(fa).identical(fa));
}

TEST("construct/coerce_standard_containers") {
    std::list<int> l = {1, 2, 3};
    std::deque<double> dq = {1.5, 2.5};
    std::set<int> s = {3, 1, 2};
    std::array<float, 3> fa = {{1.f, 2.f, 3.f}};
    double raw[2] = {7.0, 8.0};

    ASSERT_EQ(pv::coerce(l), Value(pv::array({1, 2, 3})));
    ASSERT_EQ(pv::coerce(dq), Value(pv::array({1.5, 2.5})));
    ASSERT_EQ(pv::coerce(s), Value(pv::array({1, 2, 3})));
    ASSERT_EQ(pv::coerce(fa), Value(pv::array({1, 2, 3})));
    ASSERT_EQ(pv::coerce(raw), Value(pv::array({7, 8})));
    ASSERT_EQ(pv::coerce({4, 5}), Value(pv::array({4, 5})));
}

TEST("construct/strings_are_opaque_scalars") {
    Value s = pv::coerce(std::string("abc"));
    ASSERT_TRUE(s.is_object());
    ASSERT_EQ(pv::dimensionality(s), 0u);

    std::vector<std::string> words = {"ab", "cd"};
    Value w = pv::coerce(words);
    ASSERT_TRUE(pv::shape(w) == (Shape{2}));
    ASSERT_EQ(*w.nested()[1].object_as<std::string>(), std::string("cd"));
}

namespace {
struct Point { int x, y; };
}

TEST("construct/unknown_types_become_objects") {
    Value p = pv::coerce(Point{1, 2});
    ASSERT_TRUE(p.is_object());
    ASSERT_TRUE(p.object_as<Point>() != nullptr);
    ASSERT_EQ(p.object_as<Point>()->y, 2);
    ASSERT_TRUE(p.object_as<std::string>() == nullptr);
    ASSERT_THROWS_AS(p.number(), pv::TypeError);
}

TEST("construct/coerce_null_and_numbers_unchanged") {
    ASSERT_TRUE(pv::coerce(Value()).is_null());
    ASSERT_EQ(pv::coerce(3), Value(3.0));
}

TEST("construct/coerce_foreign_array_to_nested") {
    auto d = DenseArray::make({2,2}, {1,2,3,4});
    Value c = pv::coerce(Value(d));
    ASSERT_TRUE(c.is_nested());
    ASSERT_TRUE(pv::is_canonical(c));
    ASSERT_EQ(c, Value(pv::array({pv::array({1,2}), pv::array({3,4})})));
}

TEST("construct/coerce_0d_foreign_yields_scalar") {
    auto d = DenseArray::make({}, {9});
    Value c = pv::coerce(Value(d));
    ASSERT_TRUE(c.is_number());
    ASSERT_EQ(c, Value(9));
}

TEST("construct/new_vector_matrix_nd_are_zero_filled") {
    auto v = pv::new_vector(3);
    ASSERT_EQ(v, pv::array({0, 0, 0}));
    auto m = pv::new_matrix(2, 3);
    ASSERT_TRUE(pv::shape(m) == (Shape{2,3}));
    ASSERT_NEAR(pv::element_sum(m), 0.0, 0.0);
    Value nd = pv::new_nd({2, 1, 2});
    ASSERT_TRUE(pv::shape(nd) == (Shape{2,1,2}));
    Value s = pv::new_nd({});
    ASSERT_TRUE(s.is_number());
    ASSERT_EQ(s, Value(0.0));
}

TEST("construct/generator_visits_leaves_row_major") {
    std::vector<Index> visited;
    Value g = pv::construct_from_generator({2, 3}, [&](const Index& at) {
        visited.push_back(at);
        return Value(double(at[0] * 10 + at[1]));
    });
    ASSERT_EQ(visited.size(), 6u);
    ASSERT_TRUE(visited[0] == (Index{0,0}));
    ASSERT_TRUE(visited[1] == (Index{0,1}));
    ASSERT_TRUE(visited[3] == (Index{1,0}));
    ASSERT_EQ(g, Value(pv::array({pv::array({0, 1, 2}), pv::array({10, 11, 12})})));

    int calls = 0;
    Value scalar = pv::construct_from_generator({}, [&](const Index& at) {
        ++calls;
        return Value(double(at.size()) + 42.0);
    });
    ASSERT_EQ(calls, 1);
    ASSERT_EQ(scalar, Value(42));
}

TEST("construct/construct_matrix_rejects_ragged_input") {
    auto ragged = pv::array({pv::array({1, 2}), pv::array({3})});
    ASSERT_THROWS_AS(pv::construct_matrix(Value(ragged)), pv::ValidationError);
    std::vector<std::vector<double>> rows = {{1,2},{3}};
    ASSERT_THROWS_AS(pv::construct_matrix(rows), pv::ValidationError);

    std::vector<std::vector<double>> ok = {{1,2},{3,4}};
    ASSERT_TRUE(pv::shape(pv::construct_matrix(ok)) == (Shape{2,2}));
    ASSERT_EQ(pv::construct_matrix(Value(5)), Value(5));
}

TEST("construct/convert_to_nested_vectors_keeps_canonical_handle") {
    auto a = pv::array({pv::array({1, 2}), pv::array({3, 4})});
    auto c = pv::convert_to_nested_vectors(a);
    ASSERT_TRUE(c.identical(a));
}

TEST("construct/convert_to_nested_vectors_converts_foreign_elements") {
    auto row = pv::array({1, 2});
    auto a = pv::array({Value(row), Value(DenseArray::make({2}, {3, 4}))});
    auto c = pv::convert_to_nested_vectors(a);
    ASSERT_TRUE(c[1].is_nested());
    // untouched elements are not re-stored
    ASSERT_TRUE(c[0].nested().identical(row));
    ASSERT_EQ(c, pv::array({pv::array({1, 2}), pv::array({3, 4})}));
}

TEST("construct/convert_to_nested_vectors_inconsistent_shape") {
    auto a = pv::array({Value(DenseArray::make({2}, {1, 2})), Value(DenseArray::make({3}, {3, 4, 5}))});
    ASSERT_THROWS_AS(pv::convert_to_nested_vectors(a), pv::ValidationError);
}

TEST("construct/immutable_matrix_and_coerce_param") {
    auto a = pv::array({1, 2});
    ASSERT_TRUE(pv::immutable_matrix(a).identical(a));
    std::vector<int> p = {5, 6};
    ASSERT_EQ(pv::coerce_param(a, pv::coerce(p)), Value(pv::array({5, 6})));
}
