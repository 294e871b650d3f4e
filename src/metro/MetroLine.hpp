#pragma once

#include "metro/Train.hpp"
#include "metro/Types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace metro {

enum class LineColor : std::uint8_t {
  Red = 0,
  Green,
  Yellow,
  Blue,
  Cyan,
  Magenta,
  Pink,
  Teal,
  Lime,
  Orange,
  Brown,
  Grey,
};

constexpr int kLineColorCount = 12;

const std::array<LineColor, kLineColorCount>& AllLineColors();

const char* ToString(LineColor c);
bool ParseLineColor(const std::string& s, LineColor& out);

// 0xRRGGBB for renderers.
std::uint32_t LineColorHex(LineColor c);

struct MetroLine {
  LineId id = 0;
  LineColor color = LineColor::Red;

  // Ordered; a loop repeats its first station at the end.
  std::vector<StationId> stationIds;
  bool isLoop = false;

  std::vector<Train> trains;
};

// More than two entries and the sequence closes on itself.
bool IsLineLoop(const std::vector<StationId>& stationIds);

// Whether `id` may be appended to an in-progress line:
//  - an empty line accepts anything
//  - the first station may be revisited once the line has >= 2 stations (closes a loop)
//  - a closed loop accepts nothing further
//  - any other duplicate is rejected
bool CanAddStationToLine(const std::vector<StationId>& stationIds, StationId id);

} // namespace metro
