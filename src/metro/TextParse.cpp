#include "metro/TextParse.hpp"

#include "metro/MapGrid.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <system_error>

namespace metro {

namespace {

template <typename T>
bool FromCharsWhole(std::string_view s, int base, T& out)
{
  if (s.empty()) return false;
  T v{};
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, base);
  if (res.ec != std::errc() || res.ptr != end) return false;
  out = v;
  return true;
}

bool SplitPair(std::string_view s, std::string_view seps, int& outA, int& outB)
{
  const std::size_t pos = s.find_first_of(seps);
  if (pos == std::string_view::npos) return false;
  int a = 0;
  int b = 0;
  if (!ParseInt(s.substr(0, pos), a) || !ParseInt(s.substr(pos + 1), b)) return false;
  outA = a;
  outB = b;
  return true;
}

} // namespace

bool ParseInt(std::string_view s, int& out)
{
  // from_chars takes '-' but not '+'.
  if (!s.empty() && s.front() == '+') {
    s.remove_prefix(1);
    if (!s.empty() && s.front() == '-') return false;
  }
  return FromCharsWhole(s, 10, out);
}

bool ParseSeed(std::string_view s, std::uint64_t& out)
{
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    return FromCharsWhole(s.substr(2), 16, out);
  }
  return FromCharsWhole(s, 10, out);
}

bool ParseFiniteDouble(std::string_view s, double& out)
{
  if (s.empty() || std::isspace(static_cast<unsigned char>(s.front()))) return false;

  const std::string buf(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(buf.c_str(), &end);
  if (errno == ERANGE || end != buf.c_str() + buf.size() || !std::isfinite(v)) return false;
  out = v;
  return true;
}

bool ParseMapSize(std::string_view s, int& outW, int& outH)
{
  int w = 0;
  int h = 0;
  if (!SplitPair(s, "xX", w, h) || w <= 0 || h <= 0 || w > kMaxMapDimension || h > kMaxMapDimension) return false;
  outW = w;
  outH = h;
  return true;
}

bool ParseVertexToken(std::string_view s, int& outX, int& outY)
{
  return SplitPair(s, ",", outX, outY);
}

std::string FormatHex64(std::uint64_t v)
{
  static const char* kDigits = "0123456789abcdef";
  std::string out = "0x0000000000000000";
  for (int i = 17; i >= 2; --i) {
    out[static_cast<std::size_t>(i)] = kDigits[v & 0xFu];
    v >>= 4;
  }
  return out;
}

} // namespace metro
