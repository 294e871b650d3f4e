#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace metro {

// JSON document tree used for save blobs and config overrides.
//
// Parsing is strict RFC 8259 (no comments, no trailing commas, depth-limited).
// Numbers are doubles, so integer fields are exact only up to 2^53; 64-bit seeds
// and RNG state are therefore written as strings. Object members keep insertion
// order, which keeps save output stable without sorting.
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  static JsonValue MakeNull();
  static JsonValue MakeBool(bool b);
  static JsonValue MakeNumber(double n);
  static JsonValue MakeString(std::string s);
  static JsonValue MakeArray();
  static JsonValue MakeObject();

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }

  // Replaces an existing member with the same key. Ignored unless this is an object.
  void set(const std::string& key, JsonValue v);
  // Ignored unless this is an array.
  void push(JsonValue v);
};

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);
JsonValue* FindJsonMember(JsonValue& obj, const std::string& key);

// Field readers for SaveLoad/ConfigIO. On a missing key or a type mismatch they
// return false and leave `out` as it was, so defaults survive.
bool GetJsonNumber(const JsonValue& obj, const std::string& key, double& out);
bool GetJsonInt64(const JsonValue& obj, const std::string& key, std::int64_t& out);
bool GetJsonBool(const JsonValue& obj, const std::string& key, bool& out);
bool GetJsonString(const JsonValue& obj, const std::string& key, std::string& out);

constexpr int kJsonMaxDepth = 128;

// outError is "JSON parse error @<offset>: <reason>" on failure.
bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

struct JsonWriteOptions {
  bool pretty = true;
  int indent = 2;

  bool sortKeys = false;
};

// NaN and infinities have no JSON spelling and are written as null.
std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt = {});

} // namespace metro
