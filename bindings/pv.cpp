// pv.cpp — single TU pybind11 bindings for pv::NestedArray and the free
// array functions. NumPy arrays handed in from Python become foreign leaves.
#include <memory>
#include <string>
#include <vector>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "pv/all.hpp"

namespace py = pybind11;

#ifndef PV_BINDINGS_VERSION
#define PV_BINDINGS_VERSION "0.1.0"
#endif

namespace {

using DArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

// NumPy-backed foreign array. Holds a C-contiguous float64 array; when the
// caller's array already is one, writes go straight into the caller's memory.
class NumpyArray : public pv::ForeignArray {
public:
  explicit NumpyArray(DArray arr) : arr_(std::move(arr)) {}

  std::string implementation_key() const override { return "numpy"; }
  std::size_t dimensionality() const override { return static_cast<std::size_t>(arr_.ndim()); }
  pv::Shape shape() const override {
    pv::Shape s;
    for (py::ssize_t k = 0; k < arr_.ndim(); ++k) s.push_back(static_cast<std::size_t>(arr_.shape(k)));
    return s;
  }

  std::vector<pv::Value> element_seq() const override {
    const double* p = arr_.data();
    return std::vector<pv::Value>(p, p + arr_.size());
  }

  std::vector<pv::Value> major_slices() const override {
    std::vector<pv::Value> out;
    if (arr_.ndim() == 0) return out;
    if (arr_.ndim() == 1) return element_seq();
    for (py::ssize_t i = 0; i < arr_.shape(0); ++i) {
      DArray sub = py::reinterpret_borrow<py::object>(arr_)[py::int_(i)].cast<DArray>();
      out.emplace_back(std::make_shared<NumpyArray>(std::move(sub)));
    }
    return out;
  }

  pv::Value get_0d() const override {
    if (arr_.ndim() != 0) throw pv::ShapeError("numpy: get_0d on a non-scalar array");
    return pv::Value(*arr_.data());
  }

  pv::Value convert_to_nested_vectors() const override {
    return pv::construct_from_generator(shape(), [this](const pv::Index& idx) {
      return pv::Value(arr_.data()[flat(idx)]);
    });
  }

  bool is_mutable() const override { return arr_.writeable(); }

  void set_nd_inplace(const pv::Index& idx, const pv::Value& v) override {
    if (!is_mutable()) { ForeignArray::set_nd_inplace(idx, v); return; }
    if (idx.size() != dimensionality()) throw pv::IndexError("numpy: wrong number of indices");
    arr_.mutable_data()[flat(idx)] = pv::to_double(v);
  }

  void element_map_indexed_inplace(const IndexedUpdate& f) override {
    if (!is_mutable()) { ForeignArray::element_map_indexed_inplace(f); return; }
    const pv::Shape s = shape();
    double* p = arr_.mutable_data();
    pv::Index idx(s.size(), 0);
    for (py::ssize_t lin = 0; lin < arr_.size(); ++lin) {
      std::size_t rem = static_cast<std::size_t>(lin);
      for (std::size_t k = s.size(); k-- > 0;) {
        idx[k] = rem % s[k];
        rem /= s[k];
      }
      p[lin] = pv::to_double(f(idx, pv::Value(p[lin])));
    }
  }

  const DArray& array() const { return arr_; }

private:
  std::size_t flat(const pv::Index& idx) const {
    std::size_t off = 0;
    for (std::size_t k = 0; k < idx.size(); ++k) {
      const auto n = static_cast<std::size_t>(arr_.shape(static_cast<py::ssize_t>(k)));
      if (idx[k] >= n) throw pv::IndexError("numpy: index out of range");
      off = off * n + idx[k];
    }
    return off;
  }

  DArray arr_;
};

// ---- Python <-> Value ----
pv::Value to_value(py::handle h) {
  if (h.is_none()) return pv::Value();
  if (py::isinstance<pv::NestedArray>(h)) return pv::Value(h.cast<pv::NestedArray>());
  if (py::isinstance<py::array>(h))
    return pv::Value(std::make_shared<NumpyArray>(h.cast<DArray>()));
  if (py::isinstance<py::bool_>(h) || py::isinstance<py::int_>(h) || py::isinstance<py::float_>(h))
    return pv::Value(h.cast<double>());
  if (py::isinstance<py::str>(h)) return pv::Value(h.cast<std::string>());
  if (py::isinstance<py::list>(h) || py::isinstance<py::tuple>(h)) {
    std::vector<pv::Value> out;
    for (auto item : h.cast<py::sequence>()) out.push_back(to_value(item));
    return pv::Value(pv::NestedArray(std::move(out)));
  }
  return pv::Value::object(std::any(py::reinterpret_borrow<py::object>(h)));
}

py::object from_value(const pv::Value& v) {
  switch (v.kind()) {
    case pv::Value::Kind::Null:   return py::none();
    case pv::Value::Kind::Number: return py::float_(v.number());
    case pv::Value::Kind::Nested: return py::cast(v.nested());
    case pv::Value::Kind::Foreign: {
      if (auto np = std::dynamic_pointer_cast<NumpyArray>(v.foreign())) return np->array();
      return from_value(v.foreign()->convert_to_nested_vectors());
    }
    case pv::Value::Kind::Object: {
      if (const auto* s = v.object_as<std::string>()) return py::str(*s);
      if (const auto* o = v.object_as<py::object>()) return *o;
      return py::str(pv::to_string(v));
    }
  }
  return py::none();
}

py::object to_list(const pv::Value& v) {
  if (!v.is_array()) return from_value(v);
  py::list out;
  for (const auto& s : pv::get_major_slice_seq(v)) out.append(to_list(s));
  return std::move(out);
}

pv::NestedArray to_nested(py::handle h) {
  pv::Value v = pv::coerce(to_value(h));
  if (!v.is_array()) throw pv::TypeError("NestedArray: expected a sequence or array");
  return pv::as_nested(v);
}

pv::Index to_index(py::handle idx) {
  pv::Index out;
  auto one = [](py::handle x) {
    const long i = x.cast<long>();
    if (i < 0) throw std::invalid_argument("negative indices not supported");
    return static_cast<std::size_t>(i);
  };
  if (py::isinstance<py::tuple>(idx) || py::isinstance<py::list>(idx)) {
    for (auto x : idx.cast<py::sequence>()) out.push_back(one(x));
  } else {
    out.push_back(one(idx));
  }
  return out;
}

} // anon

PYBIND11_MODULE(pv, m) {
  m.attr("__version__") = PV_BINDINGS_VERSION;

  py::register_exception<pv::ShapeError>(m, "ShapeError", PyExc_ValueError);
  py::register_exception<pv::UpdateError>(m, "UpdateError", PyExc_ValueError);
  py::register_exception<pv::TypeError>(m, "TypeError", PyExc_TypeError);
  py::register_exception<pv::IndexError>(m, "IndexError", PyExc_IndexError);
  py::register_exception<pv::ValidationError>(m, "ValidationError", PyExc_ValueError);
  py::register_exception<pv::UnsupportedError>(m, "UnsupportedError", PyExc_NotImplementedError);

  // --- Config ---
  m.def("set_checked", &pv::config::set_checked, py::arg("enabled"));
  m.def("checked_enabled", &pv::config::checked_enabled);
  m.def("set_trace", &pv::config::set_trace, py::arg("enabled"));
  m.def("implementation_keys", &pv::implementation_keys);

  // --- NestedArray ---
  py::class_<pv::NestedArray>(m, "NestedArray")
    .def(py::init([](py::object data) { return to_nested(data); }), py::arg("data"))
    .def_property_readonly("shape", [](const pv::NestedArray& a) { return pv::shape(a); })
    .def_property_readonly("ndim", [](const pv::NestedArray& a) { return pv::dimensionality(a); })
    .def_property_readonly("size", [](const pv::NestedArray& a) { return pv::element_count(a); })
    .def("__len__", &pv::NestedArray::size)
    .def("__getitem__", [](const pv::NestedArray& a, py::object idx) {
      return from_value(pv::get_nd(a, to_index(idx)));
    })
    // Returns the updated array; `a` itself is unchanged.
    .def("set", [](const pv::NestedArray& a, py::object idx, py::object v) {
      return pv::set_nd(a, to_index(idx), to_value(v));
    }, py::arg("index"), py::arg("value"))
    .def("row", [](const pv::NestedArray& a, std::size_t i) { return from_value(pv::get_row(a, i)); })
    .def("column", [](const pv::NestedArray& a, std::size_t j) { return from_value(pv::get_column(a, j)); })
    .def("tolist", [](const pv::NestedArray& a) { return to_list(pv::Value(a)); })
    .def("to_numpy", [](const pv::NestedArray& a) {
      const pv::Shape s = pv::shape(a);
      auto flat = pv::to_double_array(a);
      py::array_t<double> out(std::vector<py::ssize_t>(s.begin(), s.end()));
      std::copy(flat.begin(), flat.end(), out.mutable_data());
      return out;
    })
    .def("map", [](const pv::NestedArray& a, py::function f) {
      return pv::element_map(a, [f](const pv::Value& x) { return to_value(f(from_value(x))); });
    }, py::arg("fn"))
    .def("map_inplace", [](const pv::NestedArray& a, py::function f) {
      return pv::element_map_inplace(a, [f](const pv::Value& x) { return to_value(f(from_value(x))); });
    }, py::arg("fn"))
    .def("sum", [](const pv::NestedArray& a) { return pv::element_sum(a); })
    .def("__add__", [](const pv::NestedArray& a, py::object b) { return pv::matrix_add(a, to_value(b)); })
    .def("__radd__", [](const pv::NestedArray& a, py::object b) { return pv::matrix_add(a, to_value(b)); })
    .def("__sub__", [](const pv::NestedArray& a, py::object b) { return pv::matrix_sub(a, to_value(b)); })
    .def("__mul__", [](const pv::NestedArray& a, py::object b) { return pv::scale(a, to_value(b)); })
    .def("__rmul__", [](const pv::NestedArray& a, py::object b) { return pv::pre_scale(to_value(b), a); })
    .def("__neg__", [](const pv::NestedArray& a) { return pv::scale(a, pv::Value(-1.0)); })
    // matmul operator support: a @ b
    .def("__matmul__", [](const pv::NestedArray& a, py::object b) {
      return from_value(pv::matrix_multiply(a, to_value(b)));
    })
    .def("__eq__", [](const pv::NestedArray& a, py::object b) {
      return pv::value_equals(pv::Value(a), to_value(b));
    })
    .def("__repr__", [](const pv::NestedArray& a) { return "NestedArray(" + pv::to_string(pv::Value(a)) + ")"; });

  // --- Construction ---
  m.def("array", [](py::object data) { return to_nested(data); }, py::arg("data"));
  m.def("construct_matrix", [](py::object data) {
    return from_value(pv::construct_matrix(to_value(data)));
  }, py::arg("data"));
  m.def("zeros", [](const pv::Shape& s) { return from_value(pv::new_nd(s)); }, py::arg("shape"));
  m.def("validate_shape", [](py::object a) { return pv::validate_shape(to_value(a)); });

  // --- Shape / slicing ---
  m.def("shape", [](py::object a) { return pv::shape(to_value(a)); });
  m.def("broadcast", [](py::object a, const pv::Shape& s) { return from_value(pv::broadcast(to_value(a), s)); },
        py::arg("a"), py::arg("shape"));
  m.def("join", [](const pv::NestedArray& a, py::object b) { return pv::join(a, to_value(b)); });
  m.def("join_along", [](const pv::NestedArray& a, py::object b, std::size_t axis) {
    return pv::join_along(a, to_value(b), axis);
  }, py::arg("a"), py::arg("b"), py::arg("axis"));
  m.def("rotate", py::overload_cast<const pv::NestedArray&, std::size_t, long long>(&pv::rotate),
        py::arg("a"), py::arg("axis"), py::arg("places"));
  m.def("order", py::overload_cast<const pv::NestedArray&, std::size_t, const std::vector<std::size_t>&>(&pv::order),
        py::arg("a"), py::arg("axis"), py::arg("indices"));
  m.def("subvector", &pv::subvector, py::arg("a"), py::arg("start"), py::arg("length"));
  m.def("select", &pv::select, py::arg("a"), py::arg("indices"));
  m.def("slice", [](const pv::NestedArray& a, std::size_t axis, std::size_t i) {
    return from_value(pv::get_slice(a, axis, i));
  }, py::arg("a"), py::arg("axis"), py::arg("index"));

  // --- Linear algebra ---
  m.def("dot", [](const pv::NestedArray& a, py::object b) { return from_value(pv::vector_dot(a, to_value(b))); });
  m.def("matmul", [](const pv::NestedArray& a, py::object b) { return from_value(pv::matrix_multiply(a, to_value(b))); });
  m.def("element_multiply", [](const pv::NestedArray& a, py::object b) { return pv::element_multiply(a, to_value(b)); });
  m.def("length", &pv::length);
  m.def("length_squared", &pv::length_squared);
  m.def("normalise", &pv::normalise);
  m.def("distance", [](const pv::NestedArray& a, py::object b) { return pv::distance(a, to_value(b)); });
  m.def("square", &pv::square);
  m.def("swap_rows", &pv::swap_rows, py::arg("a"), py::arg("i"), py::arg("j"));
  m.def("multiply_row", [](const pv::NestedArray& a, std::size_t i, double k) {
    return pv::multiply_row(a, i, pv::Value(k));
  }, py::arg("a"), py::arg("i"), py::arg("factor"));
  m.def("add_row", [](const pv::NestedArray& a, std::size_t i, std::size_t j, double k) {
    return pv::add_row(a, i, j, pv::Value(k));
  }, py::arg("a"), py::arg("i"), py::arg("j"), py::arg("factor"));

  // --- Maths table ---
  m.def("maths", &pv::maths_function, py::arg("name"), py::arg("a"));
  m.def("maths_inplace", &pv::maths_function_inplace, py::arg("name"), py::arg("a"));
  m.def("maths_names", []() {
    std::vector<std::string> names;
    for (const auto& op : pv::maths_ops()) names.emplace_back(op.name);
    return names;
  });

  // --- Export ---
  m.def("to_double_array", &pv::to_double_array);
  m.def("to_object_array", [](const pv::NestedArray& a) {
    py::list out;
    for (const auto& v : pv::to_object_array(a)) out.append(from_value(v));
    return out;
  });

  // --- Sampling ---
  m.def("seed", &pv::set_global_seed, py::arg("seed"));
  m.def("sample_uniform", [](const pv::Shape& s) { return from_value(pv::sample_uniform(s)); }, py::arg("shape"));
  m.def("sample_normal", [](const pv::Shape& s) { return from_value(pv::sample_normal(s)); }, py::arg("shape"));
}
