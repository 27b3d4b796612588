#include "toolwire/json/json_bridge.h"

#include <nlohmann/json.hpp>

namespace toolwire {
namespace json {

// Implementation class that wraps nlohmann::json
class JsonValueImpl {
 public:
  nlohmann::json json_;
  // If non-null, this JsonValue views a node owned by a parent document;
  // otherwise it owns json_.
  nlohmann::json* ref_ = nullptr;

  // Child views handed out by operator[]; they live as long as this value
  // or until the node is mutated through this value.
  mutable std::map<std::string, std::unique_ptr<JsonValue>> members_;
  mutable std::map<size_t, std::unique_ptr<JsonValue>> elements_;

  JsonValueImpl() : json_(nullptr) {}
  explicit JsonValueImpl(const nlohmann::json& j) : json_(j) {}
  explicit JsonValueImpl(nlohmann::json&& j) : json_(std::move(j)) {}

  nlohmann::json& node() { return ref_ ? *ref_ : json_; }
  const nlohmann::json& node() const { return ref_ ? *ref_ : json_; }

  static const nlohmann::json& of(const JsonValue& value) {
    return value.impl_->node();
  }

  static JsonValue& view(std::unique_ptr<JsonValue>& slot,
                         nlohmann::json* target) {
    if (!slot) {
      slot = std::make_unique<JsonValue>();
    }
    slot->impl_->ref_ = target;
    if (!target) {
      slot->impl_->json_ = nullptr;
    }
    return *slot;
  }
};

JsonValue::JsonValue() : impl_(std::make_unique<JsonValueImpl>()) {}

JsonValue::JsonValue(std::nullptr_t)
    : impl_(std::make_unique<JsonValueImpl>()) {}

JsonValue::JsonValue(bool value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(int value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(int64_t value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(double value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(const std::string& value)
    : impl_(std::make_unique<JsonValueImpl>(nlohmann::json(value))) {}

JsonValue::JsonValue(const char* value)
    : impl_(std::make_unique<JsonValueImpl>(
          nlohmann::json(std::string(value ? value : "")))) {}

JsonValue::JsonValue(const JsonValue& other)
    : impl_(std::make_unique<JsonValueImpl>(other.impl_->node())) {}

JsonValue::JsonValue(JsonValue&& other) noexcept {
  if (other.impl_ && other.impl_->ref_) {
    // Never adopt a view; take a copy of the viewed node instead
    impl_ = std::make_unique<JsonValueImpl>(*other.impl_->ref_);
  } else {
    impl_ = std::move(other.impl_);
    other.impl_ = std::make_unique<JsonValueImpl>();
  }
}

JsonValue& JsonValue::operator=(const JsonValue& other) {
  if (this == &other) {
    return *this;
  }
  nlohmann::json copy = other.impl_->node();
  impl_->node() = std::move(copy);
  resetChildren();
  return *this;
}

JsonValue& JsonValue::operator=(JsonValue&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  if (impl_->ref_ || other.impl_->ref_) {
    nlohmann::json copy = other.impl_->node();
    impl_->node() = std::move(copy);
    resetChildren();
  } else {
    impl_ = std::move(other.impl_);
    other.impl_ = std::make_unique<JsonValueImpl>();
  }
  return *this;
}

JsonValue::~JsonValue() = default;

void JsonValue::resetChildren() {
  impl_->members_.clear();
  impl_->elements_.clear();
}

JsonType JsonValue::type() const {
  const auto& j = impl_->node();
  if (j.is_boolean())
    return JsonType::Boolean;
  if (j.is_number_integer())
    return JsonType::Integer;
  if (j.is_number_float())
    return JsonType::Float;
  if (j.is_string())
    return JsonType::String;
  if (j.is_array())
    return JsonType::Array;
  if (j.is_object())
    return JsonType::Object;
  return JsonType::Null;
}

bool JsonValue::isNull() const { return impl_->node().is_null(); }
bool JsonValue::isBoolean() const { return impl_->node().is_boolean(); }
bool JsonValue::isInteger() const {
  return impl_->node().is_number_integer();
}
bool JsonValue::isFloat() const { return impl_->node().is_number_float(); }
bool JsonValue::isNumber() const { return impl_->node().is_number(); }
bool JsonValue::isString() const { return impl_->node().is_string(); }
bool JsonValue::isArray() const { return impl_->node().is_array(); }
bool JsonValue::isObject() const { return impl_->node().is_object(); }

bool JsonValue::empty() const {
  const auto& j = impl_->node();
  if (j.is_null())
    return true;
  if (j.is_string())
    return j.get_ref<const std::string&>().empty();
  if (j.is_array() || j.is_object())
    return j.empty();
  // Numbers and booleans are not considered empty
  return false;
}

bool JsonValue::getBool() const {
  if (!isBoolean()) {
    throw JsonException("Value is not a boolean");
  }
  return impl_->node().get<bool>();
}

int JsonValue::getInt() const {
  if (!isNumber()) {
    throw JsonException("Value is not a number");
  }
  return impl_->node().get<int>();
}

int64_t JsonValue::getInt64() const {
  if (!isNumber()) {
    throw JsonException("Value is not a number");
  }
  return impl_->node().get<int64_t>();
}

double JsonValue::getFloat() const {
  if (!isNumber()) {
    throw JsonException("Value is not a number");
  }
  return impl_->node().get<double>();
}

std::string JsonValue::getString() const {
  if (!isString()) {
    throw JsonException("Value is not a string");
  }
  return impl_->node().get<std::string>();
}

bool JsonValue::getBool(bool defaultValue) const {
  return isBoolean() ? impl_->node().get<bool>() : defaultValue;
}

int JsonValue::getInt(int defaultValue) const {
  return isNumber() ? impl_->node().get<int>() : defaultValue;
}

int64_t JsonValue::getInt64(int64_t defaultValue) const {
  return isNumber() ? impl_->node().get<int64_t>() : defaultValue;
}

double JsonValue::getFloat(double defaultValue) const {
  return isNumber() ? impl_->node().get<double>() : defaultValue;
}

std::string JsonValue::getString(const std::string& defaultValue) const {
  return isString() ? impl_->node().get<std::string>() : defaultValue;
}

size_t JsonValue::size() const {
  if (!isArray() && !isObject()) {
    throw JsonException("Value is not an array or object");
  }
  return impl_->node().size();
}

JsonValue& JsonValue::operator[](size_t index) {
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  auto& self = impl_->node();
  if (index >= self.size()) {
    throw JsonException("Array index out of range: " + std::to_string(index));
  }
  return JsonValueImpl::view(impl_->elements_[index], &self[index]);
}

const JsonValue& JsonValue::operator[](size_t index) const {
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  // Child views need a mutable node pointer; writes only happen through the
  // non-const overloads.
  auto& self = const_cast<nlohmann::json&>(impl_->node());
  if (index >= self.size()) {
    throw JsonException("Array index out of range: " + std::to_string(index));
  }
  return JsonValueImpl::view(impl_->elements_[index], &self[index]);
}

void JsonValue::push_back(const JsonValue& value) {
  if (isNull()) {
    impl_->node() = nlohmann::json::array();
  }
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  nlohmann::json copy = value.impl_->node();
  impl_->node().push_back(std::move(copy));
  resetChildren();
}

void JsonValue::push_back(JsonValue&& value) {
  if (isNull()) {
    impl_->node() = nlohmann::json::array();
  }
  if (!isArray()) {
    throw JsonException("Value is not an array");
  }
  if (value.impl_->ref_) {
    impl_->node().push_back(*value.impl_->ref_);
  } else {
    impl_->node().push_back(std::move(value.impl_->json_));
  }
  resetChildren();
}

bool JsonValue::contains(const std::string& key) const {
  if (!isObject()) {
    return false;
  }
  return impl_->node().contains(key);
}

JsonValue& JsonValue::operator[](const std::string& key) {
  if (isNull()) {
    impl_->node() = nlohmann::json::object();
  }
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  auto& self = impl_->node();
  // Inserts null when missing, like nlohmann::json
  return JsonValueImpl::view(impl_->members_[key], &self[key]);
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  auto& self = const_cast<nlohmann::json&>(impl_->node());
  auto it = self.find(key);
  nlohmann::json* target = it == self.end() ? nullptr : &(*it);
  return JsonValueImpl::view(impl_->members_[key], target);
}

JsonValue& JsonValue::at(const std::string& key) {
  if (!contains(key)) {
    throw JsonException("Key not found: " + key);
  }
  return (*this)[key];
}

const JsonValue& JsonValue::at(const std::string& key) const {
  if (!contains(key)) {
    throw JsonException("Key not found: " + key);
  }
  return (*this)[key];
}

void JsonValue::erase(const std::string& key) {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  impl_->node().erase(key);
  resetChildren();
}

void JsonValue::set(const std::string& key, const JsonValue& value) {
  if (isNull()) {
    impl_->node() = nlohmann::json::object();
  }
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  nlohmann::json copy = value.impl_->node();
  impl_->node()[key] = std::move(copy);
  resetChildren();
}

std::vector<std::string> JsonValue::keys() const {
  if (!isObject()) {
    throw JsonException("Value is not an object");
  }
  std::vector<std::string> result;
  result.reserve(impl_->node().size());
  for (const auto& kv : impl_->node().items()) {
    result.push_back(kv.key());
  }
  return result;
}

std::string JsonValue::toString(bool pretty) const {
  // Invalid UTF-8 is replaced rather than thrown so that diagnostics built
  // from arbitrary bytes can always be serialized.
  return impl_->node().dump(pretty ? 2 : -1, ' ', false,
                            nlohmann::json::error_handler_t::replace);
}

bool JsonValue::operator==(const JsonValue& other) const {
  return impl_->node() == other.impl_->node();
}

JsonValue JsonValue::null() { return JsonValue(nullptr); }

JsonValue JsonValue::array() {
  JsonValue val;
  val.impl_->json_ = nlohmann::json::array();
  return val;
}

JsonValue JsonValue::object() {
  JsonValue val;
  val.impl_->json_ = nlohmann::json::object();
  return val;
}

JsonValue JsonValue::parse(const std::string& json_str) {
  try {
    JsonValue val;
    val.impl_->json_ = nlohmann::json::parse(json_str);
    return val;
  } catch (const nlohmann::json::parse_error& e) {
    throw JsonException("Parse error: " + std::string(e.what()));
  }
}

}  // namespace json
}  // namespace toolwire
