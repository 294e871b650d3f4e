#include "metro/TextParse.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
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

namespace {

using namespace metro;

void TestParseInt()
{
  int v = 0;
  EXPECT_TRUE(ParseInt("0", v));
  EXPECT_EQ(v, 0);
  EXPECT_TRUE(ParseInt("-12", v));
  EXPECT_EQ(v, -12);
  EXPECT_TRUE(ParseInt("+7", v));
  EXPECT_EQ(v, 7);

  EXPECT_FALSE(ParseInt("2.5", v));
  EXPECT_FALSE(ParseInt(" 3", v));
  EXPECT_FALSE(ParseInt("3 ", v));
  EXPECT_FALSE(ParseInt("", v));
  EXPECT_FALSE(ParseInt("+", v));
  EXPECT_FALSE(ParseInt("+-4", v));
  EXPECT_FALSE(ParseInt("2147483648", v));
  EXPECT_EQ(v, 7);
}

void TestParseSeed()
{
  std::uint64_t v = 0;
  EXPECT_TRUE(ParseSeed("42", v));
  EXPECT_EQ(v, 42u);
  EXPECT_TRUE(ParseSeed("0x2A", v));
  EXPECT_EQ(v, 42u);
  EXPECT_TRUE(ParseSeed("0XfF", v));
  EXPECT_EQ(v, 255u);
  EXPECT_TRUE(ParseSeed("18446744073709551615", v));
  EXPECT_EQ(v, std::numeric_limits<std::uint64_t>::max());

  EXPECT_FALSE(ParseSeed("", v));
  EXPECT_FALSE(ParseSeed("-1", v));
  EXPECT_FALSE(ParseSeed("+1", v));
  EXPECT_FALSE(ParseSeed("0x", v));
  EXPECT_FALSE(ParseSeed("0xz1", v));
  EXPECT_FALSE(ParseSeed("18446744073709551616", v));
  EXPECT_FALSE(ParseSeed("7 ", v));
}

void TestParseFiniteDouble()
{
  double d = 0.0;
  EXPECT_TRUE(ParseFiniteDouble("16", d));
  EXPECT_EQ(d, 16.0);
  EXPECT_TRUE(ParseFiniteDouble("-0.25", d));
  EXPECT_EQ(d, -0.25);
  EXPECT_TRUE(ParseFiniteDouble("2e3", d));
  EXPECT_EQ(d, 2000.0);

  EXPECT_FALSE(ParseFiniteDouble("", d));
  EXPECT_FALSE(ParseFiniteDouble(" 1", d));
  EXPECT_FALSE(ParseFiniteDouble("nan", d));
  EXPECT_FALSE(ParseFiniteDouble("inf", d));
  EXPECT_FALSE(ParseFiniteDouble("1e400", d));
  EXPECT_FALSE(ParseFiniteDouble("5ms", d));
  EXPECT_EQ(d, 2000.0);
}

void TestParseMapSize()
{
  int w = 0;
  int h = 0;
  EXPECT_TRUE(ParseMapSize("48x32", w, h));
  EXPECT_EQ(w, 48);
  EXPECT_EQ(h, 32);
  EXPECT_TRUE(ParseMapSize("4096x4096", w, h));
  EXPECT_EQ(w, 4096);
  EXPECT_TRUE(ParseMapSize("20X10", w, h));
  EXPECT_EQ(w, 20);
  EXPECT_EQ(h, 10);

  EXPECT_FALSE(ParseMapSize("48", w, h));
  EXPECT_FALSE(ParseMapSize("x32", w, h));
  EXPECT_FALSE(ParseMapSize("48x", w, h));
  EXPECT_FALSE(ParseMapSize("0x32", w, h));
  EXPECT_FALSE(ParseMapSize("48x-1", w, h));
  EXPECT_FALSE(ParseMapSize("4097x10", w, h));
  EXPECT_FALSE(ParseMapSize("10x70000", w, h));
  EXPECT_EQ(w, 20);
  EXPECT_EQ(h, 10);
}

void TestParseVertexToken()
{
  int x = 0;
  int y = 0;
  EXPECT_TRUE(ParseVertexToken("3,9", x, y));
  EXPECT_EQ(x, 3);
  EXPECT_EQ(y, 9);
  EXPECT_TRUE(ParseVertexToken("-1,0", x, y));
  EXPECT_EQ(x, -1);
  EXPECT_EQ(y, 0);

  EXPECT_FALSE(ParseVertexToken("3", x, y));
  EXPECT_FALSE(ParseVertexToken("3;9", x, y));
  EXPECT_FALSE(ParseVertexToken("3, 9", x, y));
  EXPECT_FALSE(ParseVertexToken("a,9", x, y));
  EXPECT_EQ(x, -1);
  EXPECT_EQ(y, 0);
}

void TestFormatHex64()
{
  EXPECT_EQ(FormatHex64(0u), std::string("0x0000000000000000"));
  EXPECT_EQ(FormatHex64(0xdeadbeefu), std::string("0x00000000deadbeef"));
  EXPECT_EQ(FormatHex64(std::numeric_limits<std::uint64_t>::max()), std::string("0xffffffffffffffff"));

  std::uint64_t back = 0;
  EXPECT_TRUE(ParseSeed(FormatHex64(0x0123456789abcdefULL), back));
  EXPECT_EQ(back, 0x0123456789abcdefULL);
}

} // namespace

int main()
{
  TestParseInt();
  TestParseSeed();
  TestParseFiniteDouble();
  TestParseMapSize();
  TestParseVertexToken();
  TestFormatHex64();

  if (g_failures == 0) {
    std::cout << "metro_text_parse_tests: OK\n";
    return 0;
  }

  std::cerr << "metro_text_parse_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
