#include "metro/Station.hpp"

#include <cstdio>

namespace metro {

std::string FormatStationId(StationId id)
{
  const Point v = StationIdVertex(id);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02d%02d", v.x, v.y);
  return std::string(buf);
}

std::string GenerateStationLabel(int index)
{
  std::string label;
  int num = index < 0 ? 0 : index;
  do {
    label.insert(label.begin(), static_cast<char>('A' + num % 26));
    num = num / 26 - 1;
  } while (num >= 0);
  return label;
}

Station MakeStation(int vertexX, int vertexY, const std::string& label)
{
  Station s;
  s.id = MakeStationId(vertexX, vertexY);
  s.vertexX = vertexX;
  s.vertexY = vertexY;
  s.label = label;
  return s;
}

} // namespace metro
