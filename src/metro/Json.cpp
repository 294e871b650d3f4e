#include "metro/Json.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <locale>
#include <sstream>

namespace metro {

JsonValue JsonValue::MakeNull() { return JsonValue{}; }

JsonValue JsonValue::MakeBool(bool b)
{
  JsonValue v;
  v.type = Type::Bool;
  v.boolValue = b;
  return v;
}

JsonValue JsonValue::MakeNumber(double n)
{
  JsonValue v;
  v.type = Type::Number;
  v.numberValue = n;
  return v;
}

JsonValue JsonValue::MakeString(std::string s)
{
  JsonValue v;
  v.type = Type::String;
  v.stringValue = std::move(s);
  return v;
}

JsonValue JsonValue::MakeArray()
{
  JsonValue v;
  v.type = Type::Array;
  return v;
}

JsonValue JsonValue::MakeObject()
{
  JsonValue v;
  v.type = Type::Object;
  return v;
}

void JsonValue::set(const std::string& key, JsonValue v)
{
  if (!isObject()) return;
  for (auto& kv : objectValue) {
    if (kv.first == key) {
      kv.second = std::move(v);
      return;
    }
  }
  objectValue.emplace_back(key, std::move(v));
}

void JsonValue::push(JsonValue v)
{
  if (!isArray()) return;
  arrayValue.push_back(std::move(v));
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

JsonValue* FindJsonMember(JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

bool GetJsonNumber(const JsonValue& obj, const std::string& key, double& out)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v || !v->isNumber() || !std::isfinite(v->numberValue)) return false;
  out = v->numberValue;
  return true;
}

bool GetJsonInt64(const JsonValue& obj, const std::string& key, std::int64_t& out)
{
  double d = 0.0;
  if (!GetJsonNumber(obj, key, d)) return false;
  if (d < -9007199254740992.0 || d > 9007199254740992.0) return false;
  out = static_cast<std::int64_t>(std::llround(d));
  return true;
}

bool GetJsonBool(const JsonValue& obj, const std::string& key, bool& out)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v || !v->isBool()) return false;
  out = v->boolValue;
  return true;
}

bool GetJsonString(const JsonValue& obj, const std::string& key, std::string& out)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v || !v->isString()) return false;
  out = v->stringValue;
  return true;
}

namespace {

std::string JsonEscape(const std::string& s)
{
  static const char* kHex = "0123456789abcdef";

  std::string out;
  out.reserve(s.size() + 2);
  for (unsigned char ch : s) {
    switch (ch) {
    case '\\': out += "\\\\"; break;
    case '"': out += "\\\""; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (ch < 0x20) {
        out += "\\u00";
        out.push_back(kHex[(ch >> 4) & 0xF]);
        out.push_back(kHex[ch & 0xF]);
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

void AppendUtf8(std::string& out, std::uint32_t cp)
{
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

class Parser {
public:
  explicit Parser(const std::string& text) : m_s(text) {}

  bool parseDocument(JsonValue& out)
  {
    if (!parseValue(out, 0)) return false;
    skipWs();
    if (m_i != m_s.size()) return fail("trailing characters");
    return true;
  }

  const std::string& error() const { return m_err; }

private:
  void skipWs()
  {
    while (m_i < m_s.size()) {
      const char c = m_s[m_i];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      ++m_i;
    }
  }

  char peek() const { return m_i < m_s.size() ? m_s[m_i] : '\0'; }

  bool consume(char c)
  {
    if (m_i >= m_s.size() || m_s[m_i] != c) return false;
    ++m_i;
    return true;
  }

  bool fail(const std::string& msg)
  {
    if (m_err.empty()) m_err = "JSON parse error @" + std::to_string(m_i) + ": " + msg;
    return false;
  }

  bool matchLiteral(const char* lit)
  {
    const std::size_t n = std::char_traits<char>::length(lit);
    if (m_s.compare(m_i, n, lit) != 0) return false;
    m_i += n;
    return true;
  }

  bool parseValue(JsonValue& out, int depth)
  {
    skipWs();
    if (m_i >= m_s.size()) return fail("unexpected end of input");

    const char c = peek();
    switch (c) {
    case 'n':
      if (!matchLiteral("null")) return fail("expected 'null'");
      out = JsonValue::MakeNull();
      return true;
    case 't':
      if (!matchLiteral("true")) return fail("expected 'true'");
      out = JsonValue::MakeBool(true);
      return true;
    case 'f':
      if (!matchLiteral("false")) return fail("expected 'false'");
      out = JsonValue::MakeBool(false);
      return true;
    case '"': {
      std::string str;
      if (!parseString(str)) return false;
      out = JsonValue::MakeString(std::move(str));
      return true;
    }
    case '[': return parseArray(out, depth + 1);
    case '{': return parseObject(out, depth + 1);
    default: break;
    }

    if (c == '-' || (c >= '0' && c <= '9')) return parseNumber(out);
    return fail(std::string("unexpected character '") + c + "'");
  }

  bool parseDigits()
  {
    if (!std::isdigit(static_cast<unsigned char>(peek()))) return false;
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++m_i;
    return true;
  }

  bool parseNumber(JsonValue& out)
  {
    const std::size_t start = m_i;
    consume('-');

    if (!consume('0')) {
      if (!parseDigits()) return fail("expected digit");
    }
    if (consume('.')) {
      if (!parseDigits()) return fail("expected digit after '.'");
    }
    if (peek() == 'e' || peek() == 'E') {
      ++m_i;
      if (peek() == '+' || peek() == '-') ++m_i;
      if (!parseDigits()) return fail("expected exponent digits");
    }

    const std::string num = m_s.substr(start, m_i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(num.c_str(), &end);
    if (errno == ERANGE || end != num.c_str() + num.size()) return fail("invalid number");

    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool parseHex4(std::uint32_t& out)
  {
    if (m_i + 4 > m_s.size()) return fail("truncated \\u escape");
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = m_s[m_i++];
      out <<= 4;
      if (h >= '0' && h <= '9') out |= static_cast<std::uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f') out |= static_cast<std::uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') out |= static_cast<std::uint32_t>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    return true;
  }

  bool parseString(std::string& out)
  {
    if (!consume('"')) return fail("expected '\"'");

    std::string result;
    while (m_i < m_s.size()) {
      const char c = m_s[m_i++];
      if (c == '"') {
        out = std::move(result);
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        result.push_back(c);
        continue;
      }

      if (m_i >= m_s.size()) break;
      const char e = m_s[m_i++];
      switch (e) {
      case '"': result.push_back('"'); break;
      case '\\': result.push_back('\\'); break;
      case '/': result.push_back('/'); break;
      case 'b': result.push_back('\b'); break;
      case 'f': result.push_back('\f'); break;
      case 'n': result.push_back('\n'); break;
      case 'r': result.push_back('\r'); break;
      case 't': result.push_back('\t'); break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!parseHex4(cp)) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          std::uint32_t lo = 0;
          if (!consume('\\') || !consume('u') || !parseHex4(lo) || lo < 0xDC00 || lo > 0xDFFF) {
            return fail("invalid surrogate pair");
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        }
        AppendUtf8(result, cp);
        break;
      }
      default: return fail("unknown escape sequence");
      }
    }

    return fail("unterminated string");
  }

  bool parseArray(JsonValue& out, int depth)
  {
    if (depth > kJsonMaxDepth) return fail("nesting too deep");
    consume('[');

    JsonValue arr = JsonValue::MakeArray();
    skipWs();
    if (!consume(']')) {
      while (true) {
        JsonValue v;
        if (!parseValue(v, depth)) return false;
        arr.arrayValue.push_back(std::move(v));

        skipWs();
        if (consume(']')) break;
        if (!consume(',')) return fail("expected ',' or ']'");
      }
    }

    out = std::move(arr);
    return true;
  }

  bool parseObject(JsonValue& out, int depth)
  {
    if (depth > kJsonMaxDepth) return fail("nesting too deep");
    consume('{');

    JsonValue obj = JsonValue::MakeObject();
    skipWs();
    if (!consume('}')) {
      while (true) {
        skipWs();
        std::string key;
        if (!parseString(key)) return false;

        skipWs();
        if (!consume(':')) return fail("expected ':'");

        JsonValue val;
        if (!parseValue(val, depth)) return false;
        obj.objectValue.emplace_back(std::move(key), std::move(val));

        skipWs();
        if (consume('}')) break;
        if (!consume(',')) return fail("expected ',' or '}'");
      }
    }

    out = std::move(obj);
    return true;
  }

  const std::string& m_s;
  std::size_t m_i = 0;
  std::string m_err;
};

void WriteNumber(std::ostringstream& oss, double v)
{
  if (!std::isfinite(v)) {
    oss << "null";
    return;
  }

  // Integral values (ids, counters, money in whole units) are written without a fraction.
  if (std::fabs(v) < 9007199254740992.0 && std::floor(v) == v) {
    oss << static_cast<long long>(v);
    return;
  }

  std::ostringstream tmp;
  tmp.imbue(std::locale::classic());
  tmp.precision(17);
  tmp << v;
  oss << tmp.str();
}

void Newline(std::ostringstream& oss, const JsonWriteOptions& opt, int depth)
{
  if (!opt.pretty) return;
  oss << '\n';
  for (int i = 0; i < depth * std::max(0, opt.indent); ++i) oss << ' ';
}

void WriteValue(std::ostringstream& oss, const JsonValue& v, const JsonWriteOptions& opt, int depth)
{
  switch (v.type) {
  case JsonValue::Type::Null: oss << "null"; return;
  case JsonValue::Type::Bool: oss << (v.boolValue ? "true" : "false"); return;
  case JsonValue::Type::Number: WriteNumber(oss, v.numberValue); return;
  case JsonValue::Type::String: oss << '"' << JsonEscape(v.stringValue) << '"'; return;
  case JsonValue::Type::Array: {
    if (v.arrayValue.empty()) {
      oss << "[]";
      return;
    }
    oss << '[';
    for (std::size_t i = 0; i < v.arrayValue.size(); ++i) {
      if (i) oss << ',';
      Newline(oss, opt, depth + 1);
      WriteValue(oss, v.arrayValue[i], opt, depth + 1);
    }
    Newline(oss, opt, depth);
    oss << ']';
    return;
  }
  case JsonValue::Type::Object: {
    if (v.objectValue.empty()) {
      oss << "{}";
      return;
    }

    std::vector<const std::pair<std::string, JsonValue>*> members;
    members.reserve(v.objectValue.size());
    for (const auto& kv : v.objectValue) members.push_back(&kv);
    if (opt.sortKeys) {
      std::stable_sort(members.begin(), members.end(),
                       [](const auto* a, const auto* b) { return a->first < b->first; });
    }

    oss << '{';
    for (std::size_t i = 0; i < members.size(); ++i) {
      if (i) oss << ',';
      Newline(oss, opt, depth + 1);
      oss << '"' << JsonEscape(members[i]->first) << "\":";
      if (opt.pretty) oss << ' ';
      WriteValue(oss, members[i]->second, opt, depth + 1);
    }
    Newline(oss, opt, depth);
    oss << '}';
    return;
  }
  }
}

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Parser p(text);
  JsonValue v;
  if (!p.parseDocument(v)) {
    outError = p.error();
    return false;
  }

  outValue = std::move(v);
  outError.clear();
  return true;
}

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt)
{
  std::ostringstream oss;
  WriteValue(oss, value, opt, 0);
  return oss.str();
}

} // namespace metro
