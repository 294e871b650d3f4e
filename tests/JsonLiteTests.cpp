#include "metro/Json.hpp"

#include <cmath>
#include <iostream>
#include <string>

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                    \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                    \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static bool Parses(const std::string& text, metro::JsonValue& out)
{
  std::string err;
  return metro::ParseJson(text, out, err);
}

static bool Rejects(const std::string& text)
{
  metro::JsonValue v;
  std::string err;
  if (metro::ParseJson(text, v, err)) return false;
  return err.rfind("JSON parse error @", 0) == 0;
}

static void TestParseBasics()
{
  using namespace metro;

  JsonValue v;
  ASSERT_TRUE(Parses(" {\"a\": [1, -2.5, 3e2], \"b\": true, \"c\": null, \"d\": \"x\"} ", v));
  ASSERT_TRUE(v.isObject());
  ASSERT_TRUE(v.objectValue.size() == 4);
  // Insertion order is kept.
  EXPECT_EQ(v.objectValue[0].first, std::string("a"));
  EXPECT_EQ(v.objectValue[3].first, std::string("d"));

  const JsonValue* a = FindJsonMember(v, "a");
  ASSERT_TRUE(a && a->isArray() && a->arrayValue.size() == 3);
  EXPECT_EQ(a->arrayValue[1].numberValue, -2.5);
  EXPECT_EQ(a->arrayValue[2].numberValue, 300.0);

  bool b = false;
  EXPECT_TRUE(GetJsonBool(v, "b", b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(FindJsonMember(v, "c")->isNull());

  std::string d;
  EXPECT_TRUE(GetJsonString(v, "d", d));
  EXPECT_EQ(d, std::string("x"));

  // Wrong type leaves the output untouched.
  double n = 7.0;
  EXPECT_FALSE(GetJsonNumber(v, "d", n));
  EXPECT_EQ(n, 7.0);
  EXPECT_FALSE(GetJsonNumber(v, "missing", n));

  std::int64_t i = 0;
  JsonValue big;
  ASSERT_TRUE(Parses("{\"n\": 9007199254740993e3}", big));
  EXPECT_FALSE(GetJsonInt64(big, "n", i));
}

static void TestStrictErrors()
{
  EXPECT_TRUE(Rejects(""));
  EXPECT_TRUE(Rejects("[1, 2,]"));
  EXPECT_TRUE(Rejects("{\"a\": 1,}"));
  EXPECT_TRUE(Rejects("{\"a\" 1}"));
  EXPECT_TRUE(Rejects("// comment\n{}"));
  EXPECT_TRUE(Rejects("{} {}"));
  EXPECT_TRUE(Rejects("tru"));
  EXPECT_TRUE(Rejects("\"unterminated"));
  EXPECT_TRUE(Rejects("\"tab\there\""));
  EXPECT_TRUE(Rejects("\"\\q\""));
  EXPECT_TRUE(Rejects("-"));
  EXPECT_TRUE(Rejects("1."));
  EXPECT_TRUE(Rejects("1e"));
  EXPECT_TRUE(Rejects("1e999"));
  EXPECT_TRUE(Rejects("{'a': 1}"));
}

static void TestUnicodeEscapes()
{
  using namespace metro;

  JsonValue v;
  ASSERT_TRUE(Parses("\"\\u0041\\u00e9\\u20ac\"", v));
  EXPECT_EQ(v.stringValue, std::string("A\xC3\xA9\xE2\x82\xAC"));

  // U+1F687 (metro) as a surrogate pair.
  ASSERT_TRUE(Parses("\"\\ud83d\\ude87\"", v));
  EXPECT_EQ(v.stringValue, std::string("\xF0\x9F\x9A\x87"));

  EXPECT_TRUE(Rejects("\"\\ud83d\""));
  EXPECT_TRUE(Rejects("\"\\ud83d\\u0041\""));
  EXPECT_TRUE(Rejects("\"\\u12\""));
  EXPECT_TRUE(Rejects("\"\\u12G4\""));
}

static void TestDepthLimit()
{
  using namespace metro;

  const auto nested = [](int depth) {
    return std::string(static_cast<std::size_t>(depth), '[') + std::string(static_cast<std::size_t>(depth), ']');
  };

  JsonValue v;
  EXPECT_TRUE(Parses(nested(kJsonMaxDepth), v));
  EXPECT_TRUE(Rejects(nested(kJsonMaxDepth + 1)));

  std::string err;
  EXPECT_FALSE(ParseJson(nested(kJsonMaxDepth + 1), v, err));
  EXPECT_TRUE(err.find("nesting too deep") != std::string::npos);
}

static void TestWriter()
{
  using namespace metro;

  JsonValue o = JsonValue::MakeObject();
  o.set("zeta", JsonValue::MakeNumber(3.0));
  o.set("alpha", JsonValue::MakeNumber(0.1));
  o.set("id", JsonValue::MakeNumber(123456789012.0));
  o.set("nan", JsonValue::MakeNumber(std::nan("")));
  o.set("text", JsonValue::MakeString("a\"b\n\x01"));
  o.set("zeta", JsonValue::MakeNumber(-4.0));

  JsonWriteOptions compact;
  compact.pretty = false;
  const std::string s = JsonStringify(o, compact);
  EXPECT_EQ(s, std::string("{\"zeta\":-4,\"alpha\":0.10000000000000001,\"id\":123456789012,\"nan\":null,"
                           "\"text\":\"a\\\"b\\n\\u0001\"}"));

  compact.sortKeys = true;
  const std::string sorted = JsonStringify(o, compact);
  EXPECT_EQ(sorted.rfind("{\"alpha\":", 0), 0u);

  // Writer output parses back to the same values.
  JsonValue back;
  ASSERT_TRUE(Parses(JsonStringify(o), back));
  double alpha = 0.0;
  EXPECT_TRUE(GetJsonNumber(back, "alpha", alpha));
  EXPECT_EQ(alpha, 0.1);
  std::string text;
  EXPECT_TRUE(GetJsonString(back, "text", text));
  EXPECT_EQ(text, std::string("a\"b\n\x01"));

  EXPECT_EQ(JsonStringify(JsonValue::MakeArray(), compact), std::string("[]"));
  EXPECT_EQ(JsonStringify(JsonValue::MakeObject()), std::string("{}"));
}

int main()
{
  TestParseBasics();
  TestStrictErrors();
  TestUnicodeEscapes();
  TestDepthLimit();
  TestWriter();

  if (g_failures == 0) {
    std::cout << "metro_json_tests: OK\n";
    return 0;
  }

  std::cerr << "metro_json_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
