#pragma once

#include "metro/Config.hpp"
#include "metro/GameController.hpp"
#include "metro/MapGen.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace metro {

// Output sinks. `print` carries results (`hash`, `print stats`), `info` carries
// progress chatter and is muted by ScriptRunOptions::quiet, `error` receives the
// single failure line that stops a run. Unset sinks drop their output.
struct ScriptCallbacks {
  std::function<void(const std::string& line)> print;
  std::function<void(const std::string& line)> info;
  std::function<void(const std::string& line)> error;
};

// Mutable script execution state. `gameCfg` and `mapCfg` apply to the next
// `generate` or `load`; a running game keeps the config it was created with.
struct ScriptRunnerState {
  std::uint64_t seed = 1;
  GameConfig gameCfg{};
  MapGenConfig mapCfg{};

  std::unique_ptr<GameController> game;
};

struct ScriptRunOptions {
  bool quiet = false;
  int includeDepthLimit = 16;
};

// Deterministic, headless scenario script runner.
//
// One command per line, tokens separated by whitespace, `#` starts a comment.
// Stations are named by vertex ("x,y" in line commands). Commands:
//
//   seed <u64>                  size <W>x<H>            type river|archipelago|auto
//   config <file.json>          generate
//   station <x> <y>             remove_station <x> <y>
//   line <color> x,y x,y ...    loop <color> x,y x,y ...  (closes back to the first)
//   train <lineId>              remove_train <lineId> [trainId]
//   speed <1|2|4>  pause  resume
//   tick <ms> [count]           run_seconds <s>
//   expect_money_ge <n>         expect_hash <u64|0x...>  check
//   hash   print stats   save <dir>   load <dir>   include <file>
//
// Every failed action stops the run with "<path>:<line>: <message>".
class ScriptRunner {
public:
  ScriptRunner();

  void setCallbacks(ScriptCallbacks cb) { m_cb = std::move(cb); }
  void setOptions(ScriptRunOptions opt) { m_opt = opt; }

  ScriptRunnerState& state() { return m_ctx; }
  const ScriptRunnerState& state() const { return m_ctx; }

  bool runFile(const std::string& path);
  bool runText(const std::string& text, const std::string& virtualPath = "<script>");

  const std::string& lastError() const { return m_lastError; }
  int lastErrorLine() const { return m_lastErrorLine; }

private:
  // Records "<path>:<line>: <msg>" and reports it. Always returns false.
  bool fail(const std::string& path, int line, const std::string& msg);

  bool runFileInternal(const std::string& path, int depth);
  bool runTextInternal(const std::string& text, const std::string& virtualPath, int depth);

  void clearError();

  void emitPrint(const std::string& line) const;
  void emitInfo(const std::string& line) const;
  void emitError(const std::string& line) const;

  ScriptRunnerState m_ctx;
  ScriptCallbacks m_cb{};
  ScriptRunOptions m_opt{};

  std::string m_lastError;
  int m_lastErrorLine = 0;
};

} // namespace metro
