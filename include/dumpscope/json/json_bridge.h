#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace dumpscope {
namespace json {

// Forward declaration of implementation
class JsonValueImpl;

// JSON exception
class JsonException : public std::runtime_error {
 public:
  explicit JsonException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Owning or viewing handle over a JSON document.
 *
 * Object keys keep their insertion order, so a document parsed from a proxy
 * dump serializes back with its fields in the order the proxy wrote them.
 * Values returned by operator[] are views into the parent document. A view
 * stays valid until the parent is destroyed or modified.
 */
class JsonValue {
 public:
  // Constructors
  JsonValue();  // Creates null
  JsonValue(std::nullptr_t);
  JsonValue(bool value);
  JsonValue(int value);
  JsonValue(int64_t value);
  JsonValue(double value);
  JsonValue(const std::string& value);
  JsonValue(const char* value);

  JsonValue(const JsonValue& other);
  JsonValue(JsonValue&& other) noexcept;

  JsonValue& operator=(const JsonValue& other);
  JsonValue& operator=(JsonValue&& other) noexcept;

  ~JsonValue();

  // Type checking
  bool isNull() const;
  bool isBoolean() const;
  bool isInteger() const;
  bool isFloat() const;
  bool isNumber() const;  // Integer or Float
  bool isString() const;
  bool isArray() const;
  bool isObject() const;
  bool empty() const;

  // Value getters (throw if wrong type)
  bool getBool() const;
  int getInt() const;
  int64_t getInt64() const;
  std::string getString() const;

  // Safe value getters with defaults
  bool getBool(bool defaultValue) const;
  int getInt(int defaultValue) const;
  int64_t getInt64(int64_t defaultValue) const;
  std::string getString(const std::string& defaultValue) const;

  // Array operations
  size_t size() const;  // Array or object size
  JsonValue& operator[](size_t index);
  const JsonValue& operator[](size_t index) const;
  void push_back(const JsonValue& value);
  void push_back(JsonValue&& value);

  // Object operations
  bool contains(const std::string& key) const;
  JsonValue& operator[](const std::string& key);  // Object access/insert
  const JsonValue& operator[](const std::string& key) const;
  const JsonValue& at(const std::string& key) const;  // Throws if not found
  void erase(const std::string& key);
  void set(const std::string& key, const JsonValue& value);

  // Serialization. indent < 0 produces the compact form. A strict dump
  // throws JsonException on invalid UTF-8; a lenient one substitutes U+FFFD.
  std::string dump(int indent = -1, bool strict = true) const;

  bool operator==(const JsonValue& other) const;
  bool operator!=(const JsonValue& other) const { return !(*this == other); }

  // Static factory methods
  static JsonValue null();
  static JsonValue array();
  static JsonValue object();
  static JsonValue parse(const std::string& json_str);

  friend class JsonValueImpl;

 private:
  std::unique_ptr<JsonValueImpl> impl_;
};

// Convenience builders
class JsonObjectBuilder {
 public:
  JsonObjectBuilder() : value_(JsonValue::object()) {}

  JsonObjectBuilder& add(const std::string& key, const JsonValue& val) {
    value_.set(key, val);
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, bool val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, int val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, int64_t val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, const std::string& val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonObjectBuilder& add(const std::string& key, const char* val) {
    value_.set(key, JsonValue(val));
    return *this;
  }

  JsonValue build() const { return value_; }

 private:
  JsonValue value_;
};

}  // namespace json
}  // namespace dumpscope
