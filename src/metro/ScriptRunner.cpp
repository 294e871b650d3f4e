#include "metro/ScriptRunner.hpp"

#include "metro/ConfigIO.hpp"
#include "metro/Economics.hpp"
#include "metro/Hash.hpp"
#include "metro/PassengerSpawner.hpp"
#include "metro/Persistence.hpp"
#include "metro/TextParse.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace metro {

namespace {

std::string Trim(std::string s)
{
  auto isWs = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!s.empty() && isWs(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
  while (!s.empty() && isWs(static_cast<unsigned char>(s.back()))) s.pop_back();
  return s;
}

std::vector<std::string> SplitWS(const std::string& s)
{
  std::vector<std::string> out;
  std::istringstream iss(s);
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

std::string ToLower(std::string s)
{
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::string FormatStats(const GameState& s)
{
  int waiting = 0;
  for (const Station& st : s.stations) waiting += static_cast<int>(st.passengers.size());

  int trains = 0;
  int riding = 0;
  for (const MetroLine& l : s.lines) {
    trains += static_cast<int>(l.trains.size());
    for (const Train& t : l.trains) riding += static_cast<int>(t.passengers.size());
  }

  const int hour = HourOfDay(s.simulationTime);
  std::ostringstream oss;
  oss << "time=" << s.simulationTime << " hour=" << hour << " (" << ToString(RegimeForHour(hour)) << ")"
      << " money=" << FormatMoney(s.money) << " stations=" << s.stations.size() << " lines=" << s.lines.size()
      << " trains=" << trains << " passengers=" << s.passengers.size() << " waiting=" << waiting
      << " riding=" << riding << " speed=" << s.speed << "x" << (s.isPaused ? " paused" : "");
  return oss.str();
}

} // namespace

ScriptRunner::ScriptRunner() = default;

void ScriptRunner::clearError()
{
  m_lastError.clear();
  m_lastErrorLine = 0;
}

bool ScriptRunner::fail(const std::string& path, int line, const std::string& msg)
{
  m_lastErrorLine = line;
  m_lastError = path + ':' + std::to_string(line) + ": " + msg;
  emitError(m_lastError);
  return false;
}

void ScriptRunner::emitPrint(const std::string& line) const
{
  if (m_cb.print) m_cb.print(line);
}

void ScriptRunner::emitInfo(const std::string& line) const
{
  if (m_opt.quiet) return;
  if (m_cb.info) m_cb.info(line);
}

void ScriptRunner::emitError(const std::string& line) const
{
  if (m_cb.error) m_cb.error(line);
}

bool ScriptRunner::runFile(const std::string& path)
{
  clearError();
  return runFileInternal(path, 0);
}

bool ScriptRunner::runText(const std::string& text, const std::string& virtualPath)
{
  clearError();
  return runTextInternal(text, virtualPath, 0);
}

bool ScriptRunner::runFileInternal(const std::string& path, int depth)
{
  if (depth > m_opt.includeDepthLimit) {
    return fail(path, 1, "include depth limit exceeded");
  }

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return fail(path, 1, "failed to open script");
  }

  std::ostringstream oss;
  oss << f.rdbuf();
  return runTextInternal(oss.str(), path, depth);
}

bool ScriptRunner::runTextInternal(const std::string& text, const std::string& virtualPath, int depth)
{
  if (depth > m_opt.includeDepthLimit) {
    return fail(virtualPath, 1, "include depth limit exceeded");
  }

  std::istringstream iss(text);
  std::string raw;
  int lineNo = 0;
  while (std::getline(iss, raw)) {
    lineNo++;

    const std::size_t hashPos = raw.find('#');
    if (hashPos != std::string::npos) raw = raw.substr(0, hashPos);
    raw = Trim(raw);
    if (raw.empty()) continue;

    const std::vector<std::string> t = SplitWS(raw);
    const std::string cmd = ToLower(t[0]);

    auto requireGame = [&]() {
      if (m_ctx.game) return true;
      return fail(virtualPath, lineNo, "no game yet (use generate or load)");
    };

    auto dispatch = [&](const GameAction& action) {
      const ActionResult r = m_ctx.game->dispatch(action);
      if (!r.success) return fail(virtualPath, lineNo, std::string(ToString(ActionKindOf(action))) + ": " + r.error);
      return true;
    };

    auto stationAt = [&](const std::string& tok, StationId* out) {
      int x = 0;
      int y = 0;
      if (!ParseVertexToken(tok, x, y)) return fail(virtualPath, lineNo, "expected x,y but got '" + tok + "'");
      const Station* st = m_ctx.game->stationManager().getStationAt(x, y);
      if (!st) return fail(virtualPath, lineNo, "no station at " + tok);
      *out = st->id;
      return true;
    };

    if (cmd == "include") {
      if (t.size() != 2) {
        return fail(virtualPath, lineNo, "include expects: include <script.txt>");
      }
      std::filesystem::path inc = std::filesystem::path(t[1]);
      if (inc.is_relative()) {
        const std::filesystem::path base = std::filesystem::path(virtualPath).parent_path();
        if (!base.empty()) inc = base / inc;
      }
      if (!runFileInternal(inc.string(), depth + 1)) return false;
      continue;
    }

    if (cmd == "seed") {
      if (t.size() != 2 || !ParseSeed(t[1], m_ctx.seed)) {
        return fail(virtualPath, lineNo, "seed expects u64 (decimal or 0x...)");
      }
      continue;
    }

    if (cmd == "size") {
      int w = 0;
      int h = 0;
      if (t.size() != 2 || !ParseMapSize(t[1], w, h)) {
        return fail(virtualPath, lineNo, "size expects WxH");
      }
      m_ctx.mapCfg.width = m_ctx.gameCfg.mapWidth = w;
      m_ctx.mapCfg.height = m_ctx.gameCfg.mapHeight = h;
      continue;
    }

    if (cmd == "type") {
      if (t.size() != 2) {
        return fail(virtualPath, lineNo, "type expects: type river|archipelago|auto");
      }
      if (ToLower(t[1]) == "auto") {
        m_ctx.mapCfg.forceType.reset();
        continue;
      }
      MapType mt = MapType::River;
      if (!ParseMapType(t[1], mt)) {
        return fail(virtualPath, lineNo, "unknown map type: " + t[1]);
      }
      m_ctx.mapCfg.forceType = mt;
      continue;
    }

    if (cmd == "config") {
      if (t.size() != 2) {
        return fail(virtualPath, lineNo, "config expects: config <file.json>");
      }
      std::string err;
      if (!LoadConfigJsonFile(t[1], &m_ctx.gameCfg, &m_ctx.mapCfg, err)) {
        return fail(virtualPath, lineNo, "config: " + err);
      }
      emitInfo("config: " + t[1]);
      continue;
    }

    if (cmd == "generate") {
      MapGrid map = GenerateMap(m_ctx.seed, m_ctx.mapCfg);
      emitInfo("generated: " + std::to_string(map.width()) + "x" + std::to_string(map.height()) + " " +
               ToString(map.mapType()) + " seed=" + std::to_string(m_ctx.seed));
      m_ctx.game = GameController::createNew(m_ctx.seed, std::move(map), m_ctx.gameCfg);
      continue;
    }

    if (cmd == "station" || cmd == "remove_station") {
      if (!requireGame()) return false;
      int x = 0;
      int y = 0;
      if (t.size() != 3 || !ParseInt(t[1], x) || !ParseInt(t[2], y)) {
        return fail(virtualPath, lineNo, cmd + " expects: " + cmd + " <x> <y>");
      }
      if (cmd == "station") {
        if (!dispatch(PlaceStationAction{x, y})) return false;
        continue;
      }
      if (!dispatch(RemoveStationAction{MakeStationId(x, y)})) return false;
      continue;
    }

    if (cmd == "line" || cmd == "loop") {
      if (!requireGame()) return false;
      if (t.size() < 4) {
        return fail(virtualPath, lineNo, cmd + " expects: " + cmd + " <color> x,y x,y ...");
      }
      LineColor color = LineColor::Red;
      if (!ParseLineColor(t[1], color)) {
        return fail(virtualPath, lineNo, "unknown line color: " + t[1]);
      }

      std::vector<StationId> ids;
      for (std::size_t i = 2; i < t.size(); ++i) {
        StationId id = 0;
        if (!stationAt(t[i], &id)) return false;
        ids.push_back(id);
      }
      if (cmd == "loop") ids.push_back(ids.front());

      bool ok = dispatch(StartLineAction{color});
      for (std::size_t i = 0; ok && i < ids.size(); ++i) ok = dispatch(AddStationToLineAction{ids[i]});
      if (ok) ok = dispatch(CompleteLineAction{});
      if (!ok) {
        m_ctx.game->lineManager().cancelLine();
        return false;
      }
      emitInfo(cmd + ": " + ToString(color) + " with " + std::to_string(ids.size()) + " stops");
      continue;
    }

    if (cmd == "train") {
      if (!requireGame()) return false;
      int lineId = 0;
      if (t.size() != 2 || !ParseInt(t[1], lineId) || lineId <= 0) {
        return fail(virtualPath, lineNo, "train expects: train <lineId>");
      }
      if (!dispatch(AddTrainAction{static_cast<LineId>(lineId)})) return false;
      continue;
    }

    if (cmd == "remove_train") {
      if (!requireGame()) return false;
      int lineId = 0;
      int trainId = 0;
      if (t.size() < 2 || t.size() > 3 || !ParseInt(t[1], lineId) || lineId <= 0 ||
          (t.size() == 3 && (!ParseInt(t[2], trainId) || trainId <= 0))) {
        return fail(virtualPath, lineNo, "remove_train expects: remove_train <lineId> [trainId]");
      }
      RemoveTrainAction a;
      a.lineId = static_cast<LineId>(lineId);
      if (t.size() == 3) a.trainId = static_cast<TrainId>(trainId);
      if (!dispatch(a)) return false;
      continue;
    }

    if (cmd == "speed") {
      if (!requireGame()) return false;
      int v = 0;
      if (t.size() != 2 || !ParseInt(t[1], v)) {
        return fail(virtualPath, lineNo, "speed expects: speed <1|2|4>");
      }
      if (!dispatch(SetSpeedAction{v})) return false;
      continue;
    }

    if (cmd == "pause" || cmd == "resume") {
      if (!requireGame()) return false;
      if (cmd == "pause") {
        if (!dispatch(PauseAction{})) return false;
      } else {
        if (!dispatch(ResumeAction{})) return false;
      }
      continue;
    }

    if (cmd == "tick") {
      if (!requireGame()) return false;
      double ms = 0.0;
      int count = 1;
      if (t.size() < 2 || t.size() > 3 || !ParseFiniteDouble(t[1], ms) || ms < 0.0 ||
          (t.size() == 3 && (!ParseInt(t[2], count) || count < 0))) {
        return fail(virtualPath, lineNo, "tick expects: tick <ms> [count]");
      }
      for (int i = 0; i < count; ++i) m_ctx.game->update(ms);
      continue;
    }

    if (cmd == "run_seconds") {
      if (!requireGame()) return false;
      double seconds = 0.0;
      if (t.size() != 2 || !ParseFiniteDouble(t[1], seconds) || seconds < 0.0) {
        return fail(virtualPath, lineNo, "run_seconds expects: run_seconds <s>");
      }
      // Fixed 100 ms frames plus one remainder frame.
      constexpr double kFrameMs = 100.0;
      double remaining = seconds * 1000.0;
      while (remaining >= kFrameMs) {
        m_ctx.game->update(kFrameMs);
        remaining -= kFrameMs;
      }
      if (remaining > 0.0) m_ctx.game->update(remaining);
      continue;
    }

    if (cmd == "expect_money_ge") {
      if (!requireGame()) return false;
      double want = 0.0;
      if (t.size() != 2 || !ParseFiniteDouble(t[1], want)) {
        return fail(virtualPath, lineNo, "expect_money_ge expects: expect_money_ge <n>");
      }
      const double got = m_ctx.game->state().money;
      if (got < want) {
        return fail(virtualPath, lineNo, "expect_money_ge FAILED: money " + FormatMoney(got) + " < " + FormatMoney(want));
      }
      continue;
    }

    if (cmd == "check") {
      if (!requireGame()) return false;
      std::string err;
      if (!CheckPassengerInvariants(m_ctx.game->state(), err)) {
        return fail(virtualPath, lineNo, "check FAILED: " + err);
      }
      continue;
    }

    if (cmd == "hash") {
      if (!requireGame()) return false;
      emitPrint(FormatHex64(HashGameState(m_ctx.game->state())));
      continue;
    }

    if (cmd == "expect_hash") {
      if (!requireGame()) return false;
      std::uint64_t want = 0;
      if (t.size() != 2 || !ParseSeed(t[1], want)) {
        return fail(virtualPath, lineNo, "expect_hash expects: expect_hash <u64|0x...>");
      }
      const std::uint64_t got = HashGameState(m_ctx.game->state());
      if (got != want) {
        return fail(virtualPath, lineNo, "expect_hash FAILED: want " + FormatHex64(want) + " got " + FormatHex64(got));
      }
      continue;
    }

    if (cmd == "print") {
      if (!requireGame()) return false;
      if (t.size() != 2 || ToLower(t[1]) != "stats") {
        return fail(virtualPath, lineNo, "print expects: print stats");
      }
      emitPrint(FormatStats(m_ctx.game->state()));
      continue;
    }

    if (cmd == "save") {
      if (!requireGame()) return false;
      if (t.size() != 2) {
        return fail(virtualPath, lineNo, "save expects: save <dir>");
      }
      if (!SaveGame(MakeFilePersistence(t[1]), m_ctx.game->state())) {
        return fail(virtualPath, lineNo, "save failed: " + t[1]);
      }
      emitInfo("saved: " + t[1]);
      continue;
    }

    if (cmd == "load") {
      if (t.size() != 2) {
        return fail(virtualPath, lineNo, "load expects: load <dir>");
      }
      std::unique_ptr<GameController> loaded = GameController::loadSaved(MakeFilePersistence(t[1]), m_ctx.gameCfg);
      if (!loaded) {
        return fail(virtualPath, lineNo, "no saved game in " + t[1]);
      }
      m_ctx.seed = loaded->state().seed;
      m_ctx.game = std::move(loaded);
      emitInfo("loaded: " + t[1]);
      continue;
    }

    return fail(virtualPath, lineNo, "unknown command: " + t[0]);
  }

  return true;
}

} // namespace metro
