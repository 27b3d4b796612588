#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "toolwire/core/compat.h"

namespace toolwire {
namespace json {

// Forward declaration of implementation
class JsonValueImpl;

// JSON types enum
enum class JsonType { Null, Boolean, Integer, Float, String, Array, Object };

// JSON exception
class JsonException : public std::runtime_error {
 public:
  explicit JsonException(const std::string& msg) : std::runtime_error(msg) {}
};

// Value-semantic JSON document. Hides the underlying JSON library so that
// public headers never pull it in.
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

  // Assigning to a child obtained through operator[] writes through to the
  // parent document.
  JsonValue& operator=(const JsonValue& other);
  JsonValue& operator=(JsonValue&& other) noexcept;

  ~JsonValue();

  // Type checking
  JsonType type() const;
  bool isNull() const;
  bool isBoolean() const;
  bool isInteger() const;
  bool isFloat() const;
  bool isNumber() const;  // Integer or Float
  bool isString() const;
  bool isArray() const;
  bool isObject() const;
  bool empty() const;

  // Value getters (throw JsonException if wrong type)
  bool getBool() const;
  int getInt() const;
  int64_t getInt64() const;
  double getFloat() const;
  std::string getString() const;

  // Safe value getters with defaults
  bool getBool(bool defaultValue) const;
  int getInt(int defaultValue) const;
  int64_t getInt64(int64_t defaultValue) const;
  double getFloat(double defaultValue) const;
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
  // Missing keys yield a null value.
  const JsonValue& operator[](const std::string& key) const;
  JsonValue& at(const std::string& key);  // Throws if not found
  const JsonValue& at(const std::string& key) const;
  void erase(const std::string& key);
  std::vector<std::string> keys() const;

  // Direct key-value setting for objects (converts null to object)
  void set(const std::string& key, const JsonValue& value);

  // Conversion
  std::string toString(bool pretty = false) const;

  bool operator==(const JsonValue& other) const;
  bool operator!=(const JsonValue& other) const { return !(*this == other); }

  // Static factory methods
  static JsonValue null();
  static JsonValue array();
  static JsonValue object();
  static JsonValue parse(const std::string& json_str);

  friend class JsonValueImpl;

 private:
  void resetChildren();

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

  JsonObjectBuilder& add(const std::string& key, double val) {
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

  JsonObjectBuilder& addNull(const std::string& key) {
    value_.set(key, JsonValue::null());
    return *this;
  }

  JsonValue build() const { return value_; }

 private:
  JsonValue value_;
};

class JsonArrayBuilder {
 public:
  JsonArrayBuilder() : value_(JsonValue::array()) {}

  JsonArrayBuilder& add(const JsonValue& val) {
    value_.push_back(val);
    return *this;
  }

  JsonArrayBuilder& add(bool val) {
    value_.push_back(JsonValue(val));
    return *this;
  }

  JsonArrayBuilder& add(int val) {
    value_.push_back(JsonValue(val));
    return *this;
  }

  JsonArrayBuilder& add(double val) {
    value_.push_back(JsonValue(val));
    return *this;
  }

  JsonArrayBuilder& add(const std::string& val) {
    value_.push_back(JsonValue(val));
    return *this;
  }

  JsonArrayBuilder& add(const char* val) {
    value_.push_back(JsonValue(val));
    return *this;
  }

  JsonArrayBuilder& addNull() {
    value_.push_back(JsonValue::null());
    return *this;
  }

  JsonValue build() const { return value_; }

 private:
  JsonValue value_;
};

}  // namespace json
}  // namespace toolwire
