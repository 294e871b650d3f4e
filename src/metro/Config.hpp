#pragma once

#include <cstdint>

namespace metro {

struct GameConfig {
  int mapWidth = 48;
  int mapHeight = 32;

  // --- Trains ---
  int trainCapacity = 30;

  // Distance units per real second at 1x speed.
  double trainSpeed = 5.0;

  // Dwell is measured in distance units so it scales with speed.
  double dwellDistance = 2.0;

  // Distance over which a train ramps up after leaving / down before reaching a station.
  double accelerationDistance = 1.0;

  int maxTrainsPerLine = 5;
  int minTrainsPerLine = 1;

  // --- Passengers ---
  // Expected passengers per station per in-game hour at unit catchment.
  double baseSpawnRate = 0.2;

  // Catchment score that counts as "unit" potential for the spawn rate.
  double spawnDensityNormalizer = 1600.0;

  double rushHourMultiplier = 3.0;
  double nightMultiplier = 0.1;

  // Tiles around a station's vertex included in its catchment.
  int catchmentRadius = 2;

  // --- Clock ---
  // Game milliseconds per real millisecond at 1x (one in-game week per 60 real seconds).
  double gameTimeScale = 10080.0;

  // 2025-01-01T08:00:00Z
  std::int64_t startTimeMs = 1735718400000;

  // --- Economy ---
  double startingMoney = 50000.0;
  double stationCost = 500.0;
  double lineCostPerUnit = 100.0;
  double runningCostPerUnit = 0.5;
  double fare = 5.0;

  // --- Density fields ---
  int densityCeiling = 50000;
  double hotspotFalloff = 12.0;
};

} // namespace metro
