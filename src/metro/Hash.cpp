#include "metro/Hash.hpp"

#include "metro/GameState.hpp"
#include "metro/MapGrid.hpp"

#include <cstring>
#include <vector>

namespace metro {

namespace {

// 64-bit FNV-1a
constexpr std::uint64_t kFNVOffset = 1469598103934665603ull;
constexpr std::uint64_t kFNVPrime = 1099511628211ull;

inline void HashByte(std::uint64_t& h, std::uint8_t b)
{
  h ^= static_cast<std::uint64_t>(b);
  h *= kFNVPrime;
}

inline void HashU32(std::uint64_t& h, std::uint32_t v)
{
  for (int i = 0; i < 4; ++i) HashByte(h, static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
}

inline void HashU64(std::uint64_t& h, std::uint64_t v)
{
  for (int i = 0; i < 8; ++i) HashByte(h, static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFull));
}

inline void HashI32(std::uint64_t& h, int v)
{
  const std::int32_t sv = static_cast<std::int32_t>(v);
  std::uint32_t uv = 0;
  std::memcpy(&uv, &sv, sizeof(uv));
  HashU32(h, uv);
}

inline void HashF64(std::uint64_t& h, double v)
{
  static_assert(sizeof(double) == 8, "double must be 64-bit");
  // Fold -0.0 into 0.0 so equal values hash equally.
  if (v == 0.0) v = 0.0;
  std::uint64_t bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  HashU64(h, bits);
}

inline void HashBool(std::uint64_t& h, bool b) { HashByte(h, static_cast<std::uint8_t>(b ? 1 : 0)); }

template <typename T>
void HashIds(std::uint64_t& h, const std::vector<T>& ids)
{
  HashU32(h, static_cast<std::uint32_t>(ids.size()));
  for (T id : ids) HashU64(h, static_cast<std::uint64_t>(id));
}

void HashMapInto(std::uint64_t& h, const MapGrid& map)
{
  HashI32(h, map.width());
  HashI32(h, map.height());
  HashU64(h, map.seed());
  HashByte(h, static_cast<std::uint8_t>(map.mapType()));

  for (const Tile& t : map.tiles()) {
    HashByte(h, static_cast<std::uint8_t>(t.type));
    HashByte(h, t.residentialDensity);
    HashByte(h, t.officeDensity);
  }
}

} // namespace

std::uint64_t HashMap(const MapGrid& map)
{
  std::uint64_t h = kFNVOffset;
  HashMapInto(h, map);
  return h;
}

std::uint64_t HashGameState(const GameState& s)
{
  std::uint64_t h = kFNVOffset;
  HashU64(h, s.seed);
  HashMapInto(h, s.map);

  HashU32(h, static_cast<std::uint32_t>(s.stations.size()));
  for (const Station& st : s.stations) {
    HashU32(h, st.id);
    HashIds(h, st.passengers);
  }

  HashU32(h, static_cast<std::uint32_t>(s.lines.size()));
  for (const MetroLine& l : s.lines) {
    HashU32(h, l.id);
    HashByte(h, static_cast<std::uint8_t>(l.color));
    HashIds(h, l.stationIds);
    HashBool(h, l.isLoop);

    HashU32(h, static_cast<std::uint32_t>(l.trains.size()));
    for (const Train& t : l.trains) {
      HashU32(h, t.id);
      HashByte(h, static_cast<std::uint8_t>(t.state));
      HashF64(h, t.dwellRemaining);
      HashI32(h, t.currentStationIdx);
      HashI32(h, t.targetStationIdx);
      HashF64(h, t.progress);
      HashI32(h, t.direction);
      HashI32(h, t.capacity);
      HashIds(h, t.passengers);
    }
  }

  HashU32(h, static_cast<std::uint32_t>(s.passengers.size()));
  for (const auto& kv : s.passengers) {
    const Passenger& p = kv.second;
    HashU64(h, p.id);
    HashU32(h, p.sourceStationId);
    HashU32(h, p.destinationStationId);
    HashU64(h, static_cast<std::uint64_t>(p.spawnTime));
    HashIds(h, p.path);
    HashI32(h, p.nextWaypointIndex);
  }

  HashU64(h, static_cast<std::uint64_t>(s.simulationTime));
  HashF64(h, s.money);
  HashBool(h, s.isPaused);
  HashI32(h, s.speed);
  HashU64(h, s.rngState);
  HashU32(h, s.nextLineId);
  HashU32(h, s.nextTrainId);
  HashU64(h, s.nextPassengerId);
  return h;
}

} // namespace metro
