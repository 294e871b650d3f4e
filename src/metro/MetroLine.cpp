#include "metro/MetroLine.hpp"

#include <algorithm>
#include <cctype>

namespace metro {

namespace {

struct ColorInfo {
  LineColor color;
  const char* name;
  std::uint32_t hex;
};

const ColorInfo kColors[kLineColorCount] = {
    {LineColor::Red, "red", 0xE74C3Cu},     {LineColor::Green, "green", 0x2ECC71u},
    {LineColor::Yellow, "yellow", 0xF1C40Fu}, {LineColor::Blue, "blue", 0x3498DBu},
    {LineColor::Cyan, "cyan", 0x1ABC9Cu},   {LineColor::Magenta, "magenta", 0x9B59B6u},
    {LineColor::Pink, "pink", 0xFF69B4u},   {LineColor::Teal, "teal", 0x16A085u},
    {LineColor::Lime, "lime", 0x7BED9Fu},   {LineColor::Orange, "orange", 0xE67E22u},
    {LineColor::Brown, "brown", 0x8B4513u}, {LineColor::Grey, "grey", 0x95A5A6u},
};

const ColorInfo& Info(LineColor c)
{
  const int i = static_cast<int>(c);
  return kColors[(i >= 0 && i < kLineColorCount) ? i : 0];
}

} // namespace

const std::array<LineColor, kLineColorCount>& AllLineColors()
{
  static const std::array<LineColor, kLineColorCount> kAll = {
      LineColor::Red,     LineColor::Green, LineColor::Yellow, LineColor::Blue,
      LineColor::Cyan,    LineColor::Magenta, LineColor::Pink, LineColor::Teal,
      LineColor::Lime,    LineColor::Orange, LineColor::Brown, LineColor::Grey,
  };
  return kAll;
}

const char* ToString(LineColor c) { return Info(c).name; }

std::uint32_t LineColorHex(LineColor c) { return Info(c).hex; }

bool ParseLineColor(const std::string& s, LineColor& out)
{
  std::string k = s;
  std::transform(k.begin(), k.end(), k.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (k == "gray") k = "grey";

  for (const ColorInfo& ci : kColors) {
    if (k == ci.name) {
      out = ci.color;
      return true;
    }
  }
  return false;
}

bool IsLineLoop(const std::vector<StationId>& stationIds)
{
  return stationIds.size() > 2 && stationIds.front() == stationIds.back();
}

bool CanAddStationToLine(const std::vector<StationId>& stationIds, StationId id)
{
  if (stationIds.empty()) return true;
  if (IsLineLoop(stationIds)) return false;
  if (id == stationIds.front() && stationIds.size() >= 2) return true;
  return std::find(stationIds.begin(), stationIds.end(), id) == stationIds.end();
}

} // namespace metro
