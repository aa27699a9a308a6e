#pragma once
#include <any>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace pv {

using Shape = std::vector<std::size_t>;
using Index = std::vector<std::size_t>;

class Value;
class ForeignArray;
using ForeignPtr = std::shared_ptr<ForeignArray>;

// Immutable handle onto a shared element vector.
// Copying a handle is O(1). assoc/conj copy the top-level element vector only,
// so every untouched child keeps pointing at the same storage (path copying).
// subvec is a view: it shares storage with the source.
class NestedArray {
public:
  NestedArray();
  explicit NestedArray(std::vector<Value> elems);

  std::size_t size() const noexcept { return count_; }
  bool empty() const noexcept { return count_ == 0; }

  const Value& operator[](std::size_t i) const;   // unchecked
  const Value& at(std::size_t i) const;           // throws IndexError
  const Value& front() const { return at(0); }

  const Value* begin() const;
  const Value* end() const;

  NestedArray assoc(std::size_t i, Value v) const;
  NestedArray conj(Value v) const;
  NestedArray subvec(std::size_t start, std::size_t end) const;
  std::vector<Value> to_vector() const;

  bool shares_storage_with(const NestedArray& other) const noexcept {
    return data_ && data_ == other.data_;
  }
  bool identical(const NestedArray& other) const noexcept {
    return data_ == other.data_ && offset_ == other.offset_ && count_ == other.count_;
  }

private:
  NestedArray(std::shared_ptr<const std::vector<Value>> data,
              std::size_t offset, std::size_t count);

  std::shared_ptr<const std::vector<Value>> data_;
  std::size_t offset_ = 0;
  std::size_t count_ = 0;
};

// Closed sum over everything that can sit in a NestedArray slot.
class Value {
public:
  enum class Kind { Null = 0, Number = 1, Object = 2, Nested = 3, Foreign = 4 };

  Value() noexcept = default;
  Value(std::nullptr_t) noexcept {}
  Value(double x) : v_(x) {}
  template <class T, std::enable_if_t<std::is_arithmetic<T>::value, int> = 0>
  Value(T x) : v_(static_cast<double>(x)) {}
  Value(NestedArray a) : v_(std::move(a)) {}
  Value(ForeignPtr f);
  template <class F, std::enable_if_t<std::is_convertible<F*, ForeignArray*>::value, int> = 0>
  Value(std::shared_ptr<F> f) : Value(ForeignPtr(std::move(f))) {}
  Value(std::string s);
  Value(const char* s) : Value(std::string(s)) {}

  // Opaque scalar of any other type.
  static Value object(std::any x);

  Kind kind() const noexcept { return static_cast<Kind>(v_.index()); }
  bool is_null() const noexcept    { return kind() == Kind::Null; }
  bool is_number() const noexcept  { return kind() == Kind::Number; }
  bool is_object() const noexcept  { return kind() == Kind::Object; }
  bool is_nested() const noexcept  { return kind() == Kind::Nested; }
  bool is_foreign() const noexcept { return kind() == Kind::Foreign; }
  bool is_array() const noexcept   { return is_nested() || is_foreign(); }

  double number() const;                 // TypeError unless a Number
  const NestedArray& nested() const;     // TypeError unless Nested
  const ForeignPtr& foreign() const;     // TypeError unless Foreign
  const std::any& object() const;        // TypeError unless Object

  template <class T>
  const T* object_as() const {
    if (!is_object()) return nullptr;
    return std::any_cast<T>(std::get<2>(v_).get());
  }

  // Same number, same storage handle or same foreign/object instance.
  bool identical(const Value& other) const noexcept;

private:
  std::variant<std::monostate,
               double,
               std::shared_ptr<const std::any>,
               NestedArray,
               ForeignPtr> v_;
};

const char* kind_name(Value::Kind k) noexcept;

std::string to_string(const Value& v);
std::ostream& operator<<(std::ostream& os, const Value& v);
std::ostream& operator<<(std::ostream& os, const NestedArray& a);
std::string shape_str(const Shape& s);

} // namespace pv
