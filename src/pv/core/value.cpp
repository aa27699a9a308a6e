#include "pv/core/value.hpp"
#include "pv/core/errors.hpp"
#include "pv/core/foreign.hpp"
#include <ostream>
#include <sstream>

namespace pv {

// ---- NestedArray ----

NestedArray::NestedArray() = default;

NestedArray::NestedArray(std::vector<Value> elems) {
  count_ = elems.size();
  data_ = std::make_shared<const std::vector<Value>>(std::move(elems));
}

NestedArray::NestedArray(std::shared_ptr<const std::vector<Value>> data,
                         std::size_t offset, std::size_t count)
  : data_(std::move(data)), offset_(offset), count_(count) {}

const Value& NestedArray::operator[](std::size_t i) const {
  return (*data_)[offset_ + i];
}

const Value& NestedArray::at(std::size_t i) const {
  if (i >= count_) {
    std::ostringstream oss;
    oss << "index " << i << " out of range for length " << count_;
    throw IndexError(oss.str());
  }
  return (*data_)[offset_ + i];
}

const Value* NestedArray::begin() const {
  return data_ ? data_->data() + offset_ : nullptr;
}

const Value* NestedArray::end() const {
  return data_ ? data_->data() + offset_ + count_ : nullptr;
}

NestedArray NestedArray::assoc(std::size_t i, Value v) const {
  if (i > count_) {
    std::ostringstream oss;
    oss << "assoc: index " << i << " out of range for length " << count_;
    throw IndexError(oss.str());
  }
  std::vector<Value> out = to_vector();
  if (i == count_) out.push_back(std::move(v));
  else out[i] = std::move(v);
  return NestedArray(std::move(out));
}

NestedArray NestedArray::conj(Value v) const {
  return assoc(count_, std::move(v));
}

NestedArray NestedArray::subvec(std::size_t start, std::size_t end) const {
  if (start > end || end > count_) {
    std::ostringstream oss;
    oss << "subvec: range [" << start << ", " << end << ") out of range for length " << count_;
    throw IndexError(oss.str());
  }
  if (start == 0 && end == count_) return *this;
  return NestedArray(data_, offset_ + start, end - start);
}

std::vector<Value> NestedArray::to_vector() const {
  return std::vector<Value>(begin(), end());
}

// ---- Value ----

Value::Value(ForeignPtr f) {
  if (f) v_ = std::move(f);
}

Value::Value(std::string s) : v_(std::make_shared<const std::any>(std::move(s))) {}

Value Value::object(std::any x) {
  Value v;
  v.v_ = std::make_shared<const std::any>(std::move(x));
  return v;
}

static TypeError kind_mismatch(const char* wanted, Value::Kind got) {
  std::ostringstream oss;
  oss << "expected " << wanted << ", got " << kind_name(got);
  return TypeError(oss.str());
}

double Value::number() const {
  if (!is_number()) throw kind_mismatch("number", kind());
  return std::get<1>(v_);
}

const NestedArray& Value::nested() const {
  if (!is_nested()) throw kind_mismatch("nested array", kind());
  return std::get<3>(v_);
}

const ForeignPtr& Value::foreign() const {
  if (!is_foreign()) throw kind_mismatch("foreign array", kind());
  return std::get<4>(v_);
}

const std::any& Value::object() const {
  if (!is_object()) throw kind_mismatch("object", kind());
  return *std::get<2>(v_);
}

bool Value::identical(const Value& other) const noexcept {
  if (kind() != other.kind()) return false;
  switch (kind()) {
    case Kind::Null:    return true;
    case Kind::Number:  return std::get<1>(v_) == std::get<1>(other.v_);
    case Kind::Object:  return std::get<2>(v_) == std::get<2>(other.v_);
    case Kind::Nested:  return std::get<3>(v_).identical(std::get<3>(other.v_));
    case Kind::Foreign: return std::get<4>(v_) == std::get<4>(other.v_);
  }
  return false;
}

const char* kind_name(Value::Kind k) noexcept {
  switch (k) {
    case Value::Kind::Null:    return "null";
    case Value::Kind::Number:  return "number";
    case Value::Kind::Object:  return "object";
    case Value::Kind::Nested:  return "nested array";
    case Value::Kind::Foreign: return "foreign array";
  }
  return "?";
}

// ---- printing ----

std::string shape_str(const Shape& s) {
  std::ostringstream oss;
  oss << "[";
  for (std::size_t i = 0; i < s.size(); ++i) oss << (i ? " " : "") << s[i];
  oss << "]";
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const NestedArray& a) {
  os << "[";
  bool first = true;
  for (const auto& x : a) {
    if (!first) os << " ";
    os << x;
    first = false;
  }
  return os << "]";
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Null:   return os << "nil";
    case Value::Kind::Number: return os << v.number();
    case Value::Kind::Object: {
      if (const auto* s = v.object_as<std::string>()) return os << '"' << *s << '"';
      return os << "#<object " << v.object().type().name() << ">";
    }
    case Value::Kind::Nested: return os << v.nested();
    case Value::Kind::Foreign: {
      const auto& f = v.foreign();
      return os << "#<" << f->implementation_key() << " " << shape_str(f->shape()) << ">";
    }
  }
  return os;
}

std::string to_string(const Value& v) {
  std::ostringstream oss;
  oss << v;
  return oss.str();
}

} // namespace pv
