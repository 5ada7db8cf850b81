#include "dumpscope/json/json_bridge.h"

#include <memory>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace dumpscope {
namespace json {

using Node = nlohmann::ordered_json;

// Implementation class that wraps nlohmann::ordered_json
class JsonValueImpl {
 public:
  Node json_;
  // If non-null, this JsonValue views a node owned by a parent document;
  // otherwise it owns json_
  Node* json_ref_ = nullptr;

  // Child views handed out by operator[]
  mutable std::unordered_map<std::string, std::unique_ptr<JsonValue>>
      child_objects_;
  mutable std::vector<std::unique_ptr<JsonValue>> child_arrays_;
  mutable std::unique_ptr<JsonValue> missing_child_;

  JsonValueImpl() : json_(nullptr) {}
  explicit JsonValueImpl(const Node& j) : json_(j) {}

  void clearChildren() const {
    child_objects_.clear();
    child_arrays_.clear();
  }
};

namespace {

inline const Node& node(const std::unique_ptr<JsonValueImpl>& impl) {
  return impl->json_ref_ ? *impl->json_ref_ : impl->json_;
}

inline Node& node(std::unique_ptr<JsonValueImpl>& impl) {
  return impl->json_ref_ ? *impl->json_ref_ : impl->json_;
}

// Child views of a const value still need a mutable pointer to the node
inline Node& mutableNode(const std::unique_ptr<JsonValueImpl>& impl) {
  return impl->json_ref_ ? *impl->json_ref_ : const_cast<Node&>(impl->json_);
}

}  // namespace

JsonValue::JsonValue() : impl_(std::make_unique<JsonValueImpl>()) {}

JsonValue::JsonValue(std::nullptr_t)
    : impl_(std::make_unique<JsonValueImpl>()) {}

JsonValue::JsonValue(bool value) : impl_(std::make_unique<JsonValueImpl>()) {
  impl_->json_ = value;
}

JsonValue::JsonValue(int value) : impl_(std::make_unique<JsonValueImpl>()) {
  impl_->json_ = value;
}

JsonValue::JsonValue(int64_t value) : impl_(std::make_unique<JsonValueImpl>()) {
  impl_->json_ = value;
}

JsonValue::JsonValue(double value) : impl_(std::make_unique<JsonValueImpl>()) {
  impl_->json_ = value;
}

JsonValue::JsonValue(const std::string& value)
    : impl_(std::make_unique<JsonValueImpl>()) {
  impl_->json_ = value;
}

JsonValue::JsonValue(const char* value)
    : impl_(std::make_unique<JsonValueImpl>()) {
  impl_->json_ = std::string(value);
}

JsonValue::JsonValue(const JsonValue& other)
    : impl_(std::make_unique<JsonValueImpl>(node(other.impl_))) {}

// Moving out of a view moves the viewed node, never the view itself, so the
// parent's child cache stays intact.
JsonValue::JsonValue(JsonValue&& other) noexcept
    : impl_(std::make_unique<JsonValueImpl>()) {
  impl_->json_ = std::move(node(other.impl_));
  other.impl_->clearChildren();
}

JsonValue& JsonValue::operator=(const JsonValue& other) {
  if (this != &other) {
    node(impl_) = node(other.impl_);
    impl_->clearChildren();
  }
  return *this;
}

JsonValue& JsonValue::operator=(JsonValue&& other) noexcept {
  if (this != &other) {
    node(impl_) = std::move(node(other.impl_));
    // other may be one of our own cached children
    other.impl_->clearChildren();
    impl_->clearChildren();
  }
  return *this;
}

JsonValue::~JsonValue() = default;

bool JsonValue::isNull() const { return node(impl_).is_null(); }
bool JsonValue::isBoolean() const { return node(impl_).is_boolean(); }
bool JsonValue::isInteger() const { return node(impl_).is_number_integer(); }
bool JsonValue::isFloat() const { return node(impl_).is_number_float(); }
bool JsonValue::isNumber() const { return node(impl_).is_number(); }
bool JsonValue::isString() const { return node(impl_).is_string(); }
bool JsonValue::isArray() const { return node(impl_).is_array(); }
bool JsonValue::isObject() const { return node(impl_).is_object(); }

bool JsonValue::empty() const {
  const auto& j = node(impl_);
  if (j.is_null())
    return true;
  if (j.is_string())
    return j.get_ref<const std::string&>().empty();
  if (j.is_array() || j.is_object())
    return j.empty();
  return false;
}

bool JsonValue::getBool() const {
  if (!isBoolean()) {
    throw JsonException("Value is not a boolean");
  }
  return node(impl_).get<bool>();
}

int JsonValue::getInt() const {
  if (!isNumber()) {
    throw JsonException("Value is not a number");
  }
  return node(impl_).get<int>();
}

int64_t JsonValue::getInt64() const {
  if (!isNumber()) {
    throw JsonException("Value is not a number");
  }
  return node(impl_).get<int64_t>();
}

std::string JsonValue::getString() const {
  if (!isString()) {
    throw JsonException("Value is not a string");
  }
  return node(impl_).get<std::string>();
}

bool JsonValue::getBool(bool defaultValue) const {
  return isBoolean() ? node(impl_).get<bool>() : defaultValue;
}

int JsonValue::getInt(int defaultValue) const {
  return isNumber() ? node(impl_).get<int>() : defaultValue;
}

int64_t JsonValue::getInt64(int64_t defaultValue) const {
  return isNumber() ? node(impl_).get<int64_t>() : defaultValue;
}

std::string JsonValue::getString(const std::string& defaultValue) const {
  return isString() ? node(impl_).get<std::string>() : defaultValue;
}

size_t JsonValue::size() const {
  if (!isArray() && !isObject()) {
    throw JsonException("Value is not an array or object");
  }
  return node(impl_).size();
}

JsonValue& JsonValue::operator[](size_t index) {
  return const_cast<JsonValue&>(
      static_cast<const JsonValue&>(*this).operator[](index));
}

const JsonValue& JsonValue::operator[](size_t index) const {
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  auto& self_json = mutableNode(impl_);
  if (index >= self_json.size()) {
    throw JsonException("Array index out of range: " + std::to_string(index));
  }
  if (impl_->child_arrays_.size() <= index) {
    impl_->child_arrays_.resize(index + 1);
  }
  auto& child_ptr = impl_->child_arrays_[index];
  if (!child_ptr) {
    child_ptr = std::make_unique<JsonValue>();
  }
  // Point child directly to underlying json node
  child_ptr->impl_->json_ref_ = &self_json[index];
  child_ptr->impl_->clearChildren();
  return *child_ptr;
}

void JsonValue::push_back(const JsonValue& value) {
  if (isNull()) {
    node(impl_) = Node::array();
  }
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  node(impl_).push_back(node(value.impl_));
  impl_->clearChildren();
}

void JsonValue::push_back(JsonValue&& value) {
  if (isNull()) {
    node(impl_) = Node::array();
  }
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  node(impl_).push_back(std::move(node(value.impl_)));
  impl_->clearChildren();
}

bool JsonValue::contains(const std::string& key) const {
  if (!isObject()) {
    return false;
  }
  return node(impl_).contains(key);
}

JsonValue& JsonValue::operator[](const std::string& key) {
  if (isNull()) {
    node(impl_) = Node::object();
  }
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  auto& self_json = node(impl_);
  const bool inserting = !self_json.contains(key);
  auto* target = &self_json[key];
  if (inserting) {
    // Insertion may relocate sibling nodes
    impl_->clearChildren();
  }
  auto& child_ptr = impl_->child_objects_[key];
  if (!child_ptr) {
    child_ptr = std::make_unique<JsonValue>();
  }
  child_ptr->impl_->json_ref_ = target;
  child_ptr->impl_->clearChildren();
  return *child_ptr;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  auto& self_json = mutableNode(impl_);
  auto it = self_json.find(key);
  if (it == self_json.end()) {
    // Reading a missing key yields null without inserting it
    if (!impl_->missing_child_) {
      impl_->missing_child_ = std::make_unique<JsonValue>();
    }
    impl_->missing_child_->impl_->json_ = nullptr;
    impl_->missing_child_->impl_->clearChildren();
    return *impl_->missing_child_;
  }
  auto& child_ptr = impl_->child_objects_[key];
  if (!child_ptr) {
    child_ptr = std::make_unique<JsonValue>();
  }
  child_ptr->impl_->json_ref_ = &(*it);
  child_ptr->impl_->clearChildren();
  return *child_ptr;
}

const JsonValue& JsonValue::at(const std::string& key) const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  if (!contains(key)) {
    throw JsonException("Key not found: " + key);
  }
  return (*this)[key];
}

void JsonValue::erase(const std::string& key) {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  node(impl_).erase(key);
  impl_->clearChildren();
}

void JsonValue::set(const std::string& key, const JsonValue& value) {
  if (isNull()) {
    node(impl_) = Node::object();
  }
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  // Copy first: value may be a view into this document
  Node copy = node(value.impl_);
  node(impl_)[key] = std::move(copy);
  impl_->clearChildren();
}

std::string JsonValue::dump(int indent, bool strict) const {
  try {
    return node(impl_).dump(indent, ' ', false,
                            strict ? Node::error_handler_t::strict
                                   : Node::error_handler_t::replace);
  } catch (const Node::type_error& e) {
    throw JsonException("Serialization error: " + std::string(e.what()));
  }
}

bool JsonValue::operator==(const JsonValue& other) const {
  return node(impl_) == node(other.impl_);
}

JsonValue JsonValue::null() { return JsonValue(nullptr); }

JsonValue JsonValue::array() {
  JsonValue val;
  val.impl_->json_ = Node::array();
  return val;
}

JsonValue JsonValue::object() {
  JsonValue val;
  val.impl_->json_ = Node::object();
  return val;
}

JsonValue JsonValue::parse(const std::string& json_str) {
  try {
    JsonValue val;
    val.impl_->json_ = Node::parse(json_str);
    return val;
  } catch (const Node::parse_error& e) {
    throw JsonException("Parse error: " + std::string(e.what()));
  }
}

}  // namespace json
}  // namespace dumpscope
